#pragma once

#include "grade/grader.hpp"
#include <memory>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 注册一个评分器，同名的评分器会被替换
 * 必须在评测开始之前完成注册
 */
void register_grader(std::unique_ptr<grader> &&instance);

/**
 * @brief 注册所有内置的评分器
 */
void register_builtin_graders();

/**
 * @brief 按名称查找评分器
 * 未知的名称会记录警告并使用 correctness 评分器
 * @throw internal_error 若 correctness 评分器也没有注册
 */
std::vector<grader *> resolve_graders(const std::vector<std::string> &names);

/**
 * @brief 所有已注册评分器的名称
 */
std::vector<std::string> all_graders();

}  // namespace codebench
