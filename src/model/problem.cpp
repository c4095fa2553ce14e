#include "model/problem.hpp"
#include <set>

namespace codebench {
using namespace std;
using namespace nlohmann;

function_prototype function_prototype::genericize() const {
    function_prototype generic;
    generic.function_name = "function";
    for (size_t i = 0; i < parameters.size(); ++i)
        generic.parameters.push_back({string(1, (char)('a' + i)), parameters[i].type});
    generic.return_values = return_values;
    return generic;
}

void from_json(const json &j, parameter &param) {
    j.at("name").get_to(param.name);
    j.at("type").get_to(param.type);
}

void to_json(json &j, const parameter &param) {
    j = {{"name", param.name}, {"type", param.type}};
}

void from_json(const json &j, return_value &retval) {
    j.at("type").get_to(retval.type);
}

void to_json(json &j, const return_value &retval) {
    j = {{"type", retval.type}};
}

void from_json(const json &j, function_prototype &proto) {
    j.at("function_name").get_to(proto.function_name);
    j.at("parameters").get_to(proto.parameters);
    j.at("return_values").get_to(proto.return_values);
}

void to_json(json &j, const function_prototype &proto) {
    j = {{"function_name", proto.function_name},
         {"parameters", proto.parameters},
         {"return_values", proto.return_values}};
}

void from_json(const json &j, test_case &tc) {
    tc.parameters = j.value("input", json::object());
    tc.expected_output = j.value("expected_output", json::array());
}

void to_json(json &j, const test_case &tc) {
    j = {{"input", tc.parameters}, {"expected_output", tc.expected_output}};
}

void from_json(const json &j, prompt &p) {
    j.at("prompt_id").get_to(p.prompt_id);
    j.at("prompt").get_to(p.prompt);
    if (j.count("genericize") && !j.at("genericize").is_null())
        p.genericize = j.at("genericize").get<bool>();
    if (j.count("sample_inputs_outputs"))
        j.at("sample_inputs_outputs").get_to(p.sample_inputs_outputs);
    if (j.count("input_code") && !j.at("input_code").is_null())
        p.input_code = j.at("input_code").get<string>();
}

void to_json(json &j, const prompt &p) {
    j = {{"prompt_id", p.prompt_id},
         {"prompt", p.prompt},
         {"sample_inputs_outputs", p.sample_inputs_outputs}};
    // 缺省的可选字段不输出，保证输出能通过验证
    if (p.genericize) j["genericize"] = *p.genericize;
    if (p.input_code) j["input_code"] = *p.input_code;
}

static const set<string> known_fields = {
    "identifier", "prompts", "function_prototype",
    "correctness_test_suite", "optimal_solution", "tags"};

void from_json(const json &j, problem_definition &problem) {
    problem.identifier = j.value("identifier", "");
    problem.prompts = j.value("prompts", vector<prompt>());
    if (j.count("function_prototype") && j.at("function_prototype").is_object())
        problem.prototype = j.at("function_prototype").get<function_prototype>();
    problem.correctness_test_suite = j.value("correctness_test_suite", vector<test_case>());
    if (j.count("optimal_solution") && j.at("optimal_solution").is_string())
        problem.optimal_solution = j.at("optimal_solution").get<string>();
    if (j.count("tags") && j.at("tags").is_array())
        problem.tags = j.at("tags").get<vector<string>>();

    problem.additional_fields = json::object();
    for (auto &[key, value] : j.items())
        if (!known_fields.count(key))
            problem.additional_fields[key] = value;
}

void to_json(json &j, const problem_definition &problem) {
    j = {{"identifier", problem.identifier},
         {"prompts", problem.prompts},
         {"correctness_test_suite", problem.correctness_test_suite}};
    if (problem.prototype) j["function_prototype"] = *problem.prototype;
    if (problem.optimal_solution) j["optimal_solution"] = *problem.optimal_solution;
    if (problem.tags) j["tags"] = *problem.tags;
    for (auto &[key, value] : problem.additional_fields.items())
        j[key] = value;
}

ostream &operator<<(ostream &os, const function_prototype &proto) {
    os << proto.function_name << "(";
    for (size_t i = 0; i < proto.parameters.size(); ++i) {
        if (i) os << ", ";
        os << proto.parameters[i].name << ": " << proto.parameters[i].type;
    }
    os << ") -> ";
    for (size_t i = 0; i < proto.return_values.size(); ++i) {
        if (i) os << ", ";
        os << proto.return_values[i].type;
    }
    return os;
}

static void print_literal(ostream &os, const json &value) {
    if (value.is_string())
        os << value.get_ref<const string &>();
    else
        os << value.dump();
}

ostream &operator<<(ostream &os, const test_case &tc) {
    os << "Input: ";
    bool first = true;
    for (auto &[name, value] : tc.parameters.items()) {
        if (!first) os << ", ";
        first = false;
        os << name << " = ";
        print_literal(os, value);
    }
    os << "; Expected Output: ";
    first = true;
    for (auto &value : tc.expected_output) {
        if (!first) os << ", ";
        first = false;
        print_literal(os, value);
    }
    return os;
}

}  // namespace codebench
