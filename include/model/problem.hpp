#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目定义
 * 包含：
 * 1. function_prototype 类（表示被测函数的签名）
 * 2. test_case 类（表示一个测试数据）
 * 3. prompt 类（表示题目的一种提问方式）
 * 4. problem_definition 类（表示一道题目）
 */
namespace codebench {

/**
 * @brief 函数参数的声明
 */
struct parameter {
    std::string name;

    /**
     * @brief 参数类型的字符串表示
     * 比如 int, float, str, bool, List[int], Optional[Dict[str, int]]
     */
    std::string type;
};

/**
 * @brief 函数返回值的声明
 */
struct return_value {
    std::string type;
};

/**
 * @brief 被测函数的签名
 * 参数的顺序决定了调用时的位置参数顺序；
 * 返回值只有一个时测试数据的期望输出是一个标量，否则是一个有序元组。
 */
struct function_prototype {
    std::string function_name;
    std::vector<parameter> parameters;
    std::vector<return_value> return_values;

    /**
     * @brief 生成通用化的函数签名
     * 函数名改为 function，参数依次改名为 a, b, c...，类型保持不变。
     * 不修改当前对象。
     */
    function_prototype genericize() const;
};

/**
 * @brief 一个测试数据
 * 必须和 function_prototype 搭配使用才有意义
 */
struct test_case {
    /**
     * @brief 参数名到参数字面量的映射，对应 JSON 中的 input 字段
     * 字面量可能是字符串形式（如 "[1, 2]"），也可能已经是 JSON 值
     */
    nlohmann::json parameters = nlohmann::json::object();

    /**
     * @brief 期望输出，与 function_prototype::return_values 按顺序一一对应
     */
    nlohmann::json expected_output = nlohmann::json::array();
};

struct prompt {
    std::string prompt_id;
    std::string prompt;

    /**
     * @brief 是否向模型隐藏函数名和参数名
     */
    std::optional<bool> genericize;

    std::vector<test_case> sample_inputs_outputs;

    /**
     * @brief 提供给模型的输入代码，代码覆盖率评分会测量候选测试代码对它的覆盖率
     */
    std::optional<std::string> input_code;
};

/**
 * @brief 一道题目
 */
struct problem_definition {
    std::string identifier;
    std::vector<prompt> prompts;
    std::optional<function_prototype> prototype;
    std::vector<test_case> correctness_test_suite;

    /**
     * @brief 参考程序（最优解）的代码
     * 性能、内存、相似度评分需要参考程序
     */
    std::optional<std::string> optimal_solution;

    std::optional<std::vector<std::string>> tags;

    /**
     * @brief 题目 JSON 中其他未知的字段
     * 比如代码复用评分需要的 parent_function_prototype
     */
    nlohmann::json additional_fields = nlohmann::json::object();
};

void from_json(const nlohmann::json &j, parameter &param);
void to_json(nlohmann::json &j, const parameter &param);
void from_json(const nlohmann::json &j, return_value &retval);
void to_json(nlohmann::json &j, const return_value &retval);
void from_json(const nlohmann::json &j, function_prototype &proto);
void to_json(nlohmann::json &j, const function_prototype &proto);
void from_json(const nlohmann::json &j, test_case &tc);
void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, prompt &p);
void to_json(nlohmann::json &j, const prompt &p);
void from_json(const nlohmann::json &j, problem_definition &problem);
void to_json(nlohmann::json &j, const problem_definition &problem);

std::ostream &operator<<(std::ostream &os, const function_prototype &proto);
std::ostream &operator<<(std::ostream &os, const test_case &tc);

}  // namespace codebench
