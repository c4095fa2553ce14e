#pragma once

#include "model/problem.hpp"
#include "model/solution.hpp"
#include "sandbox/execution.hpp"
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 表示一种评分标准
 * 
 * 评分器之间相互独立，调用顺序不影响结果。
 * 对于每道题目，评分器只考虑 problem_identifier 与之相同的代码。
 */
struct grader {
    grader();
    virtual ~grader() = default;

    /**
     * @brief 评分器的名称，比如 correctness, performance
     */
    virtual std::string identifier() const = 0;

    /**
     * @brief 检查题目集合是否满足评分器的前提条件
     * 默认要求每道题目都有名称、至少一个提问方式以及函数原型
     * @return false 若评分器无法评测该题目集合，调用方应跳过该评分器
     */
    virtual bool can_grade(const std::vector<problem_definition> &problems) const;

    /**
     * @brief 按题目顺序评测所有代码
     * 某道题目的测试数据无法转换时，记录日志并跳过这道题目，不影响其他题目
     */
    virtual grading_output grade(const std::vector<problem_definition> &problems,
                                 const std::vector<llm_solution> &solutions);

    void set_function_runner(function_runner runner);

protected:
    /**
     * @brief 评测一道题目的一份代码
     * @throw marshaling_error 若测试数据无法转换
     */
    virtual solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) = 0;

    /**
     * @brief 用测试数据作为参数执行代码
     * @throw marshaling_error 若测试数据无法转换为调用参数
     */
    execution_result run_function(const std::string &code, const function_prototype &prototype, const test_case &tc,
                                  long iterations = 1, bool collect_cpu_time = false, bool collect_memory_usage = false) const;

    execution_result run(const execution_request &request) const;

    /**
     * @brief 生成一个填好题目、提问方式和模型名称的空评分
     */
    static solution_grade make_grade(const problem_definition &problem, const llm_solution &solution);

private:
    function_runner runner;
};

}  // namespace codebench
