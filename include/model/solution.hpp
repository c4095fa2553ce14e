#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 模型对某道题目某个提问方式生成的代码
 * 每个 (problem, prompt, model) 三元组只有一份
 */
struct llm_solution {
    std::string problem_identifier;
    std::string model_identifier;
    std::string prompt_identifier;
    std::string solution_code;

    /**
     * @brief 生成代码时模型附带的反馈信息，格式不限
     */
    std::optional<nlohmann::json> feedback;
};

/**
 * @brief 一份代码在一个评分器下的评分结果
 */
struct solution_grade {
    std::string problem_identifier;
    std::string prompt_identifier;
    std::string model_identifier;

    /**
     * @brief 评分，大部分评分器的评分范围为 [0, 1]
     * halstead 评分器给出的是原始的难度值，没有归一化
     */
    double score = 0;

    std::optional<nlohmann::json> sub_criteria_scores;

    /**
     * @brief 评分过程中发现的问题，按发现顺序排列
     */
    std::vector<std::string> issues;
};

/**
 * @brief 一个评分器对一个模型全部代码的评分结果
 */
struct grading_output {
    std::string grader_identifier;
    std::vector<solution_grade> solution_grades;

    /**
     * @brief 所有评分的平均值，没有评分时为 0
     */
    double overall_score() const;
};

void from_json(const nlohmann::json &j, llm_solution &solution);
void to_json(nlohmann::json &j, const llm_solution &solution);
void from_json(const nlohmann::json &j, solution_grade &grade);
void to_json(nlohmann::json &j, const solution_grade &grade);
void from_json(const nlohmann::json &j, grading_output &output);
void to_json(nlohmann::json &j, const grading_output &output);

}  // namespace codebench
