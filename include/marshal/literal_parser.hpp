#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace codebench {

/**
 * @brief 安全地解析一个 Python 字面量表达式
 * 只接受数字（包括 0x/0o/0b 整数）、字符串、True/False/None，
 * 以及由它们构成的 list、tuple、dict、set。
 * tuple 和 set 解析为 JSON 数组，dict 的非字符串键按 json.dumps 的规则转为字符串。
 * 其他任何表达式（函数调用、变量名、运算）都会被拒绝，容器嵌套超过 200 层也会被拒绝。
 * @param text 字面量的文本
 * @throw marshaling_error 若 text 不是合法的字面量
 */
nlohmann::json parse_python_literal(const std::string &text);

/**
 * @brief 将 text 视为双引号字符串字面量的内容，解码其中的转义序列
 * 相当于 Python 中的 ast.literal_eval('"' + text + '"')
 * @throw marshaling_error 若 text 中包含未转义的双引号或换行，或转义序列不合法
 */
std::string decode_string_escapes(const std::string &text);

/**
 * @brief 将 JSON 值渲染为 Python 字面量（repr）
 * 比如 ["a", 1, null] 渲染为 ['a', 1, None]
 */
std::string to_literal(const nlohmann::json &value);

/**
 * @brief 将 JSON 值渲染为 Python 的 str() 形式
 * 与 to_literal 的区别是顶层字符串不加引号
 */
std::string to_display(const nlohmann::json &value);

/**
 * @brief JSON 值在 Python 中对应的类型名
 * 比如 int, float, str, bool, NoneType, list, dict
 */
std::string python_type_name(const nlohmann::json &value);

/**
 * @brief 按 Python 的 == 比较两个 JSON 值
 * 与 nlohmann::json 的 operator== 不同，布尔值与数字比较时视为 0 或 1，
 * 因此 True == 1、[False] == [0.0]
 */
bool python_equal(const nlohmann::json &lhs, const nlohmann::json &rhs);

/**
 * @brief 按 Python repr(float) 的格式输出浮点数
 * 比如 1.0 输出为 1.0 而不是 1
 */
std::string python_float_repr(double value);

}  // namespace codebench
