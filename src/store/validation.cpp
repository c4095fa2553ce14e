#include "store/validation.hpp"
#include "marshal/literal_parser.hpp"
#include "marshal/marshaler.hpp"
#include "model/problem.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <optional>
#include <vector>

namespace codebench {
using namespace std;
using namespace nlohmann;

ostream &operator<<(ostream &os, const validation_result &result) {
    return os << "(" << (result.valid ? "True" : "False") << ", '" << result.message << "')";
}

static validation_result failure(const string &message) {
    return {false, message};
}

static const validation_result success = {true, ""};

/**
 * @brief 检查 object 是否包含所有必需的字段
 * @return 缺少字段时返回错误信息
 */
static optional<string> check_required(const json &object, const vector<string> &fields) {
    if (!object.is_object())
        return fmt::format("Expected an object. Found: {}.", python_type_name(object));
    vector<string> missing;
    for (auto &field : fields)
        if (!object.contains(field)) missing.push_back(field);
    if (missing.empty()) return nullopt;
    return "Missing required fields: " + boost::algorithm::join(missing, ", ");
}

static validation_result validate_parameter(const json &param) {
    if (auto error = check_required(param, {"name", "type"})) return failure(*error);
    if (!param.at("name").is_string() || !param.at("type").is_string())
        return failure("Both 'name' and 'type' fields must be of type string.");
    return success;
}

static validation_result validate_return_value(const json &retval) {
    if (auto error = check_required(retval, {"type"})) return failure(*error);
    if (!retval.at("type").is_string())
        return failure("'type' field must be of type string.");
    return success;
}

static validation_result validate_function_prototype(const json &proto) {
    if (auto error = check_required(proto, {"function_name", "parameters", "return_values"})) return failure(*error);
    if (!proto.at("function_name").is_string())
        return failure(fmt::format("'function_name' field must be of type string. Found: {}.", python_type_name(proto.at("function_name"))));
    if (!proto.at("parameters").is_array())
        return failure(fmt::format("'parameters' field must be of type array. Found: {}.", python_type_name(proto.at("parameters"))));
    if (!proto.at("return_values").is_array())
        return failure(fmt::format("'return_values' field must be of type array. Found: {}.", python_type_name(proto.at("return_values"))));

    for (auto &param : proto.at("parameters")) {
        auto result = validate_parameter(param);
        if (!result.valid) return failure("Invalid Parameter JSON object: " + result.message);
    }
    for (auto &retval : proto.at("return_values")) {
        auto result = validate_return_value(retval);
        if (!result.valid) return failure("Invalid ReturnValue JSON object: " + result.message);
    }
    return success;
}

static validation_result validate_test_case(const json &tc, const function_prototype &proto) {
    if (auto error = check_required(tc, {"input", "expected_output"})) return failure(*error);
    if (!tc.at("input").is_object())
        return failure(fmt::format("'input' field must be of type object. Found: {}.", python_type_name(tc.at("input"))));
    if (!tc.at("expected_output").is_array())
        return failure(fmt::format("'expected_output' field must be of type array. Found: {}.", python_type_name(tc.at("expected_output"))));

    try {
        test_case parsed = tc.get<test_case>();
        ordered_arguments(proto, parsed);
        expected_return(proto, parsed);
    } catch (exception &e) {
        return failure(fmt::format("Got exception while parsing test case: {}", e.what()));
    }
    return success;
}

static validation_result validate_prompt(const json &prompt, const optional<function_prototype> &proto) {
    if (auto error = check_required(prompt, {"prompt_id", "prompt"})) return failure(*error);
    if (!prompt.at("prompt_id").is_string())
        return failure(fmt::format("'prompt_id' field must be of type string. Found: {}.", python_type_name(prompt.at("prompt_id"))));
    if (!prompt.at("prompt").is_string())
        return failure(fmt::format("'prompt' field must be of type string. Found: {}.", python_type_name(prompt.at("prompt"))));
    if (prompt.contains("genericize") && !prompt.at("genericize").is_boolean())
        return failure(fmt::format("'genericize' field must be of type boolean. Found: {}.", python_type_name(prompt.at("genericize"))));

    if (prompt.contains("sample_inputs_outputs")) {
        if (!proto)
            return failure("Function prototype must be present if a correctness test suite is provided.");
        if (!prompt.at("sample_inputs_outputs").is_array())
            return failure("'sample_inputs_outputs' field must be of type array.");
        for (auto &tc : prompt.at("sample_inputs_outputs")) {
            auto result = validate_test_case(tc, *proto);
            if (!result.valid)
                return failure("Invalid TestCase JSON object in 'sample_inputs_outputs': " + result.message);
        }
    }

    if (prompt.contains("input_code") && !prompt.at("input_code").is_string())
        return failure(fmt::format("'input_code' field must be of type string. Found: {}.", python_type_name(prompt.at("input_code"))));
    return success;
}

static string describe_arguments(const json &arguments) {
    vector<string> parts;
    for (auto &argument : arguments)
        parts.push_back(fmt::format("{} <class '{}'>", to_display(argument), python_type_name(argument)));
    return boost::algorithm::join(parts, ", ");
}

/**
 * @brief 在沙箱中运行参考程序，检查它能通过所有测试数据
 */
static validation_result validate_optimal_solution(const string &source, const function_prototype &proto,
                                                   const vector<test_case> &suite, const function_runner &runner) {
    for (auto &tc : suite) {
        execution_request request;
        request.source = source;
        request.arguments = ordered_arguments(proto, tc);
        json expected = expected_return(proto, tc);
        execution_result result = runner(request);

        string test = boost::lexical_cast<string>(tc);
        string arguments = describe_arguments(request.arguments);
        if (!result.ok())
            return failure(fmt::format("Optimal solution encountered error for test case {}. Parameters: {}; Error: {}",
                                       test, arguments, result.error));
        if (!python_equal(expected, result.result))
            return failure(fmt::format("Optimal solution did not pass test case {}. Parameters: {}; Expected result: {} <class '{}'>; Actual result: {} <class '{}'>",
                                       test, arguments, to_display(expected), python_type_name(expected),
                                       to_display(result.result), python_type_name(result.result)));
    }
    return success;
}

validation_result validate_problem_json(const json &problem, const function_runner &runner) {
    if (auto error = check_required(problem, {"identifier", "prompts"})) return failure(*error);
    if (!problem.at("identifier").is_string())
        return failure("Field 'identifier' should be a string");
    if (!problem.at("prompts").is_array())
        return failure("Field 'prompts' should be an array");
    if (problem.contains("correctness_test_suite") && !problem.at("correctness_test_suite").is_array())
        return failure("Field 'correctness_test_suite' should be an array");
    if (problem.contains("tags") && !problem.at("tags").is_array())
        return failure("Field 'tags' should be an array");

    optional<function_prototype> proto;
    if (problem.contains("function_prototype")) {
        auto result = validate_function_prototype(problem.at("function_prototype"));
        if (!result.valid) return failure("Invalid function prototype: " + result.message);
        proto = problem.at("function_prototype").get<function_prototype>();
    }

    size_t index = 0;
    for (auto &prompt : problem.at("prompts")) {
        auto result = validate_prompt(prompt, proto);
        if (!result.valid) return failure(fmt::format("Invalid prompt at index {}: {}", index, result.message));
        ++index;
    }

    if (problem.contains("correctness_test_suite")) {
        if (!proto)
            return failure("Function prototype must be present if a correctness test suite is provided.");
        index = 0;
        for (auto &tc : problem.at("correctness_test_suite")) {
            auto result = validate_test_case(tc, *proto);
            if (!result.valid)
                return failure(fmt::format("Invalid test case in 'correctness_test_suite' at index {}: {}", index, result.message));
            ++index;
        }
    }

    if (problem.contains("optimal_solution") && !problem.at("optimal_solution").is_string())
        return failure("Field 'optimal_solution' should be a string");
    if (problem.contains("tags"))
        for (auto &tag : problem.at("tags"))
            if (!tag.is_string())
                return failure("All elements in field 'tags' should be strings");

    if (problem.contains("optimal_solution") && problem.contains("correctness_test_suite")) {
        auto suite = problem.at("correctness_test_suite").get<vector<test_case>>();
        auto result = validate_optimal_solution(problem.at("optimal_solution").get<string>(), *proto, suite, runner);
        if (!result.valid) return result;
    }

    return {true, "Validation successful"};
}

}  // namespace codebench
