#pragma once

#include "grade/grader.hpp"
#include <string>
#include <vector>

/**
 * 这个头文件包含不需要执行代码的评分器
 */
namespace codebench {

/**
 * @brief 代码风格评分
 * 每发现一个问题扣除 STYLE_PENALTY，最低为 0
 */
struct coding_convention_grader : public grader {
    std::string identifier() const override;

    /**
     * @brief 检查代码中的风格问题
     * @return 按检查项顺序排列的问题描述
     */
    static std::vector<std::string> check(const std::string &code);

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

/**
 * @brief 与参考程序的相似度评分，需要参考程序
 * 评分为 1 - 两份代码以空白分隔的单词集合的 Jaccard 距离
 */
struct human_likeness_grader : public grader {
    std::string identifier() const override;

    bool can_grade(const std::vector<problem_definition> &problems) const override;

    /**
     * @brief 两份代码单词集合的 Jaccard 距离，两个集合都为空时为 0
     */
    static double jaccard_distance(const std::string &a, const std::string &b);

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

/**
 * @brief 简化的 Halstead 难度
 * 难度为 (不同运算符数 / 2) * (操作数总数 / 不同操作数数)，没有操作数时为 0。
 * 评分是原始的难度值，没有归一化到 [0, 1]。
 */
struct halstead_grader : public grader {
    std::string identifier() const override;

    static double difficulty(const std::string &code);

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override;
};

}  // namespace codebench
