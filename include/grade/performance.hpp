#pragma once

#include "grade/grader.hpp"
#include <optional>

namespace codebench {

/**
 * @brief 性能评分中自适应增加迭代次数的状态机
 * 
 * 每一轮以相同的迭代次数分别执行候选代码和参考代码，累计两者的 CPU 时间：
 * 1. 任意一方的累计时间超过阈值，或者迭代次数再放大会超过上限时，进入 STABLE
 * 2. 任意一方没有给出 CPU 时间（执行失败、超时）时，进入 ABORTED
 * 3. 否则迭代次数乘以放大倍数，进入下一轮
 * 进入 STABLE 或 ABORTED 后不再接受新的测量结果。
 */
class iteration_scaler {
public:
    enum class state { SCALING, STABLE, ABORTED };

    iteration_scaler(double threshold, long factor, long max_iterations);

    /**
     * @brief 下一轮应使用的迭代次数
     */
    long iterations() const;

    state current() const;

    /**
     * @brief 记录一轮的测量结果
     * @param candidate_time 候选代码本轮的 CPU 时间，未能测量时为空
     * @param reference_time 参考代码本轮的 CPU 时间，未能测量时为空
     * @return 记录后的状态
     */
    state record(std::optional<double> candidate_time, std::optional<double> reference_time);

    double candidate_total() const;
    double reference_total() const;

private:
    double threshold;
    long factor;
    long max_iterations;
    long iteration_count = 1;
    state st = state::SCALING;
    double candidate_sum = 0;
    double reference_sum = 0;
};

/**
 * @brief 相对性能评分，需要参考程序
 * 评分为 min(1, 参考程序总时间 / 候选代码总时间)，候选代码总时间为 0 时评分为 0
 */
struct performance_grader : public grader {
    std::string identifier() const override;

    bool can_grade(const std::vector<problem_definition> &problems) const override;

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
