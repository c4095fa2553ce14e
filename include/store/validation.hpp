#pragma once

#include "sandbox/execution.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace codebench {

struct validation_result {
    bool valid = false;

    /**
     * @brief 验证失败的原因，验证通过时为 Validation successful
     */
    std::string message;
};

std::ostream &operator<<(std::ostream &os, const validation_result &result);

/**
 * @brief 检查题目 JSON 的结构
 * 1. 检查题目、提问方式、函数原型、参数、返回值、测试数据的必需字段和字段类型
 * 2. 检查每个测试数据都能按函数原型转换
 * 3. 同时有参考程序和测试数据时，在沙箱中运行参考程序，检查它能通过所有测试数据
 * @param problem 题目 JSON
 * @param runner 运行参考程序的方式
 */
validation_result validate_problem_json(const nlohmann::json &problem, const function_runner &runner = execute_function);

}  // namespace codebench
