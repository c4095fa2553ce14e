#pragma once

#include "grade/grader.hpp"
#include <optional>

namespace codebench {

/**
 * @brief 代码复用评分
 * 要求每道题目的 additional_fields 中有 parent_function_prototype.function_name。
 * 在沙箱中检查被测函数引用的全局名称，引用了父函数时评分为 1，否则为 0。
 */
struct code_reuse_grader : public grader {
    std::string identifier() const override;

    bool can_grade(const std::vector<problem_definition> &problems) const override;

    /**
     * @brief 题目中声明的父函数名，没有声明时返回空
     */
    static std::optional<std::string> parent_function_name(const problem_definition &problem);

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
