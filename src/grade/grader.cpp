#include "grade/grader.hpp"
#include "common/exceptions.hpp"
#include "marshal/marshaler.hpp"
#include <glog/logging.h>

namespace codebench {
using namespace std;

grader::grader() : runner(execute_function) {}

bool grader::can_grade(const vector<problem_definition> &problems) const {
    for (auto &problem : problems) {
        if (problem.identifier.empty() || problem.prompts.empty() || !problem.prototype)
            return false;
    }
    return true;
}

grading_output grader::grade(const vector<problem_definition> &problems, const vector<llm_solution> &solutions) {
    grading_output output;
    output.grader_identifier = identifier();
    for (auto &problem : problems) {
        vector<solution_grade> grades;
        try {
            for (auto &solution : solutions) {
                if (solution.problem_identifier != problem.identifier) continue;
                LOG(INFO) << "Grading problem " << problem.identifier << " (" << identifier() << ", "
                          << solution.model_identifier << ", " << solution.prompt_identifier << ")";
                grades.push_back(grade_solution(problem, solution));
            }
        } catch (marshaling_error &e) {
            LOG(WARNING) << "Skipping problem " << problem.identifier << " in " << identifier()
                         << ": unable to convert test case: " << e.what();
            continue;
        }
        output.solution_grades.insert(output.solution_grades.end(), grades.begin(), grades.end());
    }
    return output;
}

void grader::set_function_runner(function_runner runner) {
    this->runner = move(runner);
}

execution_result grader::run_function(const string &code, const function_prototype &prototype, const test_case &tc,
                                      long iterations, bool collect_cpu_time, bool collect_memory_usage) const {
    execution_request request;
    request.source = code;
    request.arguments = ordered_arguments(prototype, tc);
    request.iterations = iterations;
    request.collect_cpu_time = collect_cpu_time;
    request.collect_memory_usage = collect_memory_usage;
    return run(request);
}

execution_result grader::run(const execution_request &request) const {
    return runner(request);
}

solution_grade grader::make_grade(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade;
    grade.problem_identifier = problem.identifier;
    grade.prompt_identifier = solution.prompt_identifier;
    grade.model_identifier = solution.model_identifier;
    return grade;
}

}  // namespace codebench
