#include "grade/memory.hpp"
#include "config.hpp"
#include <fmt/format.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace codebench {
using namespace std;

string memory_grader::identifier() const {
    return "memory";
}

bool memory_grader::can_grade(const vector<problem_definition> &problems) const {
    if (!grader::can_grade(problems)) return false;
    return all_of(problems.begin(), problems.end(), [](auto &problem) { return problem.optimal_solution.has_value(); });
}

solution_grade memory_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    auto &prototype = *problem.prototype;
    solution_grade grade = make_grade(problem, solution);

    int64_t candidate_memory = 0, reference_memory = 0;
    for (auto &tc : problem.correctness_test_suite) {
        execution_result candidate = run_function(solution.solution_code, prototype, tc, MEMORY_ITERATIONS, false, true);
        execution_result reference = run_function(*problem.optimal_solution, prototype, tc, MEMORY_ITERATIONS, false, true);
        if (!candidate.peak_memory || !reference.peak_memory) {
            grade.issues.push_back(fmt::format("Skipped test case {}: {} solution did not report memory usage: {}",
                                               boost::lexical_cast<string>(tc),
                                               candidate.peak_memory ? "reference" : "candidate",
                                               candidate.peak_memory ? reference.error : candidate.error));
            continue;
        }
        candidate_memory += *candidate.peak_memory;
        reference_memory += *reference.peak_memory;
    }

    grade.score = candidate_memory > 0 ? min(1.0, (double)reference_memory / candidate_memory) : 0;
    return grade;
}

}  // namespace codebench
