#pragma once

#include "model/problem.hpp"
#include <nlohmann/json.hpp>
#include <string>

/**
 * 这个头文件包含测试数据与函数调用参数之间的转换
 * 函数原型中声明的类型字符串决定了测试数据中的字面量如何转换。
 * 转换后的值仍然是 JSON 值，元组用 JSON 数组表示。
 */
namespace codebench {

/**
 * @brief 将字面量转换为声明的类型
 * 1. 去掉一层 Optional[...]；字面量为 null 时不论类型都返回 null
 * 2. 字符串字面量首尾有一对相同的引号时，去掉这对引号
 * 3. int, float, str, bool 按类型转换；类型中含有 [ 的复合类型按 Python 字面量解析
 * 4. 其他类型原样返回
 * @param type 声明的类型，比如 int, List[int], Optional[str]
 * @param literal 测试数据中的字面量
 * @throw marshaling_error 若字面量无法转换为声明的类型
 */
nlohmann::json coerce(const std::string &type, const nlohmann::json &literal);

/**
 * @brief 按函数原型中参数的顺序转换测试数据的输入
 * @return 转换后的参数数组，可以直接作为位置参数调用函数
 * @throw missing_parameter_error 若测试数据缺少某个声明的参数
 * @throw marshaling_error 若某个参数无法转换
 */
nlohmann::json ordered_arguments(const function_prototype &prototype, const test_case &tc);

/**
 * @brief 转换测试数据的输入，返回参数名到参数值的映射
 */
nlohmann::json parameter_values(const function_prototype &prototype, const test_case &tc);

/**
 * @brief 转换测试数据的期望输出
 * 返回值声明与期望输出按顺序配对，多余的一方被忽略。
 * @return 只有一个返回值时返回标量，否则返回保持顺序的数组（元组）
 */
nlohmann::json expected_return(const function_prototype &prototype, const test_case &tc);

}  // namespace codebench
