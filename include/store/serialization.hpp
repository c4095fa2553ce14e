#pragma once

#include "benchmark.hpp"
#include "model/problem.hpp"
#include "model/solution.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目集合在磁盘上的读写
 * 
 * [problem set]
 * ├── problems
 * │   └── [problem].json
 * ├── solutions
 * │   └── [model]
 * │       └── [problem]
 * │           └── [prompt].json
 * └── grades
 *     └── [model]
 *         └── [grader]
 *             └── [problem]
 *                 └── [prompt].json
 * 
 * 所有读取操作都会跳过以 . 开头的文件，并按文件名排序。
 */
namespace codebench {

/**
 * @brief 读取所有题目的 JSON
 * @return 文件名 -> 题目 JSON
 * @throw std::system_error 若文件无法读取
 * @throw nlohmann::json::exception 若文件不是合法的 JSON
 */
nlohmann::json get_problems_json(const std::filesystem::path &base);

/**
 * @brief 读取所有题目，按文件名排序
 */
std::vector<problem_definition> get_problems(const std::filesystem::path &base);

void save_solution(const std::filesystem::path &base, const llm_solution &solution);

/**
 * @brief 读取某个模型生成的全部代码，模型目录不存在时返回空列表
 */
std::vector<llm_solution> get_solutions(const std::filesystem::path &base, const std::string &model);

/**
 * @brief 保存评分结果，并更新报告文件
 * 报告中包含 Problem Sets, Average Scores Per Problem Set, Average Scores Per Criterion 三部分，
 * 报告文件已存在时在原有内容上追加。report_path 为空时不生成报告。
 */
void save_grades(const std::filesystem::path &base, const grading_output &output, const std::filesystem::path &report_path);

grading_output get_grades(const std::filesystem::path &base, const std::string &model, const std::string &grader);

/**
 * @brief 基于以上函数的 solution_source 与 grade_sink 实现
 */
struct file_store : public solution_source, public grade_sink {
    std::vector<llm_solution> load_solutions(const std::filesystem::path &problem_set, const std::string &model) override;

    void save_grades(const std::filesystem::path &problem_set, const grading_output &output,
                     const std::filesystem::path &report_path) override;
};

}  // namespace codebench
