#pragma once

#include "grade/grader.hpp"
#include "model/problem.hpp"
#include "model/solution.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 提供模型已经生成好的代码
 */
struct solution_source {
    virtual ~solution_source() = default;

    /**
     * @brief 读取某个模型对一个题目集合生成的全部代码
     * @param problem_set 题目集合的根目录
     * @param model 模型名称
     */
    virtual std::vector<llm_solution> load_solutions(const std::filesystem::path &problem_set, const std::string &model) = 0;
};

/**
 * @brief 保存评分结果
 */
struct grade_sink {
    virtual ~grade_sink() = default;

    /**
     * @brief 保存一个评分器对一个模型的评分结果，并更新报告
     * @param problem_set 题目集合的根目录
     * @param output 评分结果
     * @param report_path 该模型本次运行的报告文件
     */
    virtual void save_grades(const std::filesystem::path &problem_set, const grading_output &output,
                             const std::filesystem::path &report_path) = 0;
};

/**
 * @brief 一次运行中所有评分结果的汇总
 */
struct run_summary {
    /**
     * @brief 题目集合 -> 该集合所有评分的平均值
     */
    std::map<std::string, double> problem_set_scores;

    /**
     * @brief 评分器 -> 该评分器所有评分的平均值
     */
    std::map<std::string, double> grader_scores;

    std::vector<grading_output> outputs;
};

/**
 * @brief 评测流程
 * 对每个评分器，依次评测每个模型的代码，并将结果交给 grade_sink 保存。
 * 评分器的前提条件不满足时跳过该评分器；评分器抛出的异常只会终止该评分器，不会向外传播。
 */
class benchmark {
public:
    benchmark(solution_source &source, grade_sink &sink);

    /**
     * @brief 评测一个题目集合
     * @param problem_set 题目集合的根目录
     * @param problems 题目集合中的题目
     * @param models 要评测的模型
     * @param graders 使用的评分器，按顺序执行
     * @param report_paths 模型 -> 报告文件，没有对应项的模型使用空路径
     * @return 本次产生的评分结果
     */
    std::vector<grading_output> grade_problem_set(const std::filesystem::path &problem_set,
                                                  const std::vector<problem_definition> &problems,
                                                  const std::vector<std::string> &models,
                                                  const std::vector<grader *> &graders,
                                                  const std::map<std::string, std::filesystem::path> &report_paths);

    run_summary summary() const;

private:
    void accumulate(const std::string &problem_set, const grading_output &output);

    solution_source &source;
    grade_sink &sink;

    struct score_sum {
        double total = 0;
        size_t count = 0;
    };

    std::map<std::string, score_sum> problem_set_sums;
    std::map<std::string, score_sum> grader_sums;
    std::vector<grading_output> outputs;
};

}  // namespace codebench
