#pragma once

#include "grade/grader.hpp"

namespace codebench {

/**
 * @brief 正确性评分
 * 每个测试数据执行一次，返回值与期望输出完全相同才算通过。
 * 评分为通过的测试数据比例，没有测试数据时为 0。
 */
struct correctness_grader : public grader {
    std::string identifier() const override;

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
