#pragma once

#include "grade/grader.hpp"

namespace codebench {

/**
 * @brief 相对内存评分，需要参考程序
 * 每个测试数据固定迭代 MEMORY_ITERATIONS 次，任意一方没有给出内存峰值的测试数据被跳过。
 * 评分为 min(1, 参考程序内存峰值之和 / 候选代码内存峰值之和)，候选代码之和为 0 时评分为 0
 */
struct memory_grader : public grader {
    std::string identifier() const override;

    bool can_grade(const std::vector<problem_definition> &problems) const override;

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
