#pragma once

#include "grade/grader.hpp"

namespace codebench {

/**
 * @brief 测试代码的覆盖率评分
 * 候选代码是针对第一个提问方式的 input_code 编写的测试，
 * 通过 pytest --cov 测量测试对 input_code 的行覆盖率，评分为覆盖率 / 100。
 * 需要 PATH 中存在 pytest 以及 pytest-cov 插件。
 */
struct code_coverage_grader : public grader {
    std::string identifier() const override;

    bool can_grade(const std::vector<problem_definition> &problems) const override;

    /**
     * @throw external_tool_missing 若 PATH 中没有 pytest
     */
    grading_output grade(const std::vector<problem_definition> &problems,
                         const std::vector<llm_solution> &solutions) override;

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
