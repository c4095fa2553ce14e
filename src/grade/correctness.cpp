#include "grade/correctness.hpp"
#include "common/status.hpp"
#include "marshal/literal_parser.hpp"
#include "marshal/marshaler.hpp"
#include <fmt/format.h>
#include <boost/lexical_cast.hpp>

namespace codebench {
using namespace std;
using namespace nlohmann;

string correctness_grader::identifier() const {
    return "correctness";
}

solution_grade correctness_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    auto &prototype = *problem.prototype;
    solution_grade grade = make_grade(problem, solution);

    size_t passed = 0;
    for (auto &tc : problem.correctness_test_suite) {
        json expected = expected_return(prototype, tc);
        execution_result result = run_function(solution.solution_code, prototype, tc);
        string test = boost::lexical_cast<string>(tc);

        if (!result.ok()) {
            grade.issues.push_back(fmt::format("Error encountered during execution for test case {} ({}): {}\n{}",
                                               test, get_display_message(result.status), result.error,
                                               result.stack_trace));
        } else if (python_equal(expected, result.result)) {
            ++passed;
        } else {
            grade.issues.push_back(fmt::format(
                "Test failed:\n\t{}\n\tFunction prototype: {}\n\tExpected result: {} <class '{}'>\n\tActual result: {} <class '{}'>",
                test, boost::lexical_cast<string>(prototype),
                to_display(expected), python_type_name(expected),
                to_display(result.result), python_type_name(result.result)));
        }
    }

    size_t total = problem.correctness_test_suite.size();
    grade.score = total ? (double)passed / total : 0;
    return grade;
}

}  // namespace codebench
