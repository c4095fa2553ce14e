#pragma once

#include "model/problem.hpp"
#include "model/solution.hpp"
#include "sandbox/execution.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * 单元测试共用的题目与假沙箱
 */
namespace codebench::test {

/**
 * @brief add(a: int, b: int) -> int，包含两组测试数据
 */
inline problem_definition make_add_problem() {
    problem_definition problem;
    problem.identifier = "add";
    problem.prompts.push_back({"p1", "Add two numbers.", std::nullopt, {}, std::nullopt});
    problem.prototype = function_prototype{"add", {{"a", "int"}, {"b", "int"}}, {{"int"}}};

    test_case first;
    first.parameters = {{"a", "2"}, {"b", "3"}};
    first.expected_output = {"5"};
    test_case second;
    second.parameters = {{"a", "10"}, {"b", "-4"}};
    second.expected_output = {"6"};
    problem.correctness_test_suite = {first, second};
    problem.optimal_solution = "def add(a, b):\n    return a + b\n";
    return problem;
}

inline llm_solution make_solution(const std::string &problem, const std::string &code,
                                  const std::string &model = "mock-model", const std::string &prompt = "p1") {
    return {problem, model, prompt, code, std::nullopt};
}

/**
 * @brief 不创建进程的假沙箱，记录所有请求
 */
struct fake_runner {
    std::function<execution_result(const execution_request &)> handler;
    std::vector<execution_request> requests;

    function_runner runner() {
        return [this](const execution_request &request) {
            requests.push_back(request);
            return handler(request);
        };
    }
};

inline execution_result success_result(nlohmann::json value) {
    execution_result result;
    result.status = execution_status::SUCCESS;
    result.result = std::move(value);
    return result;
}

inline execution_result failure_result(execution_status status, const std::string &error) {
    execution_result result;
    result.status = status;
    result.error = error;
    return result;
}

}  // namespace codebench::test
