#include "grade/code_reuse.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace codebench {
using namespace std;
using namespace nlohmann;

string code_reuse_grader::identifier() const {
    return "code_reuse";
}

optional<string> code_reuse_grader::parent_function_name(const problem_definition &problem) {
    auto &fields = problem.additional_fields;
    if (!fields.is_object() || !fields.contains("parent_function_prototype")) return nullopt;
    auto &parent = fields.at("parent_function_prototype");
    if (!parent.is_object() || !parent.contains("function_name") || !parent.at("function_name").is_string())
        return nullopt;
    return parent.at("function_name").get<string>();
}

bool code_reuse_grader::can_grade(const vector<problem_definition> &problems) const {
    if (!grader::can_grade(problems)) return false;
    return all_of(problems.begin(), problems.end(), [](auto &problem) { return parent_function_name(problem).has_value(); });
}

solution_grade code_reuse_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade = make_grade(problem, solution);
    string function_name = problem.prototype->function_name;
    string parent_name = *parent_function_name(problem);

    execution_request request;
    request.source = solution.solution_code;
    request.mode = execution_mode::INSPECT;
    request.entry_point = function_name;
    execution_result result = run(request);

    if (!result.ok()) {
        grade.issues.push_back(fmt::format("Unable to inspect function '{}': {}", function_name, result.error));
    } else if (result.result.is_array() &&
               find(result.result.begin(), result.result.end(), json(parent_name)) != result.result.end()) {
        grade.score = 1;
    } else {
        grade.issues.push_back(fmt::format("Function '{}' does not reference '{}'.", function_name, parent_name));
    }
    return grade;
}

}  // namespace codebench
