#include "grade/performance.hpp"
#include "config.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace codebench {
using namespace std;

iteration_scaler::iteration_scaler(double threshold, long factor, long max_iterations)
    : threshold(threshold), factor(factor), max_iterations(max_iterations) {}

long iteration_scaler::iterations() const {
    return iteration_count;
}

iteration_scaler::state iteration_scaler::current() const {
    return st;
}

iteration_scaler::state iteration_scaler::record(optional<double> candidate_time, optional<double> reference_time) {
    if (st != state::SCALING) return st;
    if (!candidate_time || !reference_time) {
        st = state::ABORTED;
        return st;
    }

    candidate_sum += *candidate_time;
    reference_sum += *reference_time;
    if (candidate_sum > threshold || reference_sum > threshold)
        st = state::STABLE;
    else if (factor <= 1 || iteration_count > max_iterations / factor)
        st = state::STABLE;
    else
        iteration_count *= factor;
    return st;
}

double iteration_scaler::candidate_total() const {
    return candidate_sum;
}

double iteration_scaler::reference_total() const {
    return reference_sum;
}

string performance_grader::identifier() const {
    return "performance";
}

bool performance_grader::can_grade(const vector<problem_definition> &problems) const {
    if (!grader::can_grade(problems)) return false;
    return all_of(problems.begin(), problems.end(), [](auto &problem) { return problem.optimal_solution.has_value(); });
}

solution_grade performance_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    auto &prototype = *problem.prototype;
    solution_grade grade = make_grade(problem, solution);

    double candidate_time = 0, reference_time = 0;
    for (auto &tc : problem.correctness_test_suite) {
        iteration_scaler scaler(PERFORMANCE_STABILITY_THRESHOLD, PERFORMANCE_SCALE_FACTOR, PERFORMANCE_MAX_ITERATIONS);
        while (scaler.current() == iteration_scaler::state::SCALING) {
            long iterations = scaler.iterations();
            execution_result candidate = run_function(solution.solution_code, prototype, tc, iterations, true);
            execution_result reference = run_function(*problem.optimal_solution, prototype, tc, iterations, true);

            if (scaler.record(candidate.cpu_time, reference.cpu_time) == iteration_scaler::state::ABORTED) {
                const execution_result &failed = candidate.cpu_time ? reference : candidate;
                grade.issues.push_back(fmt::format("Unable to measure {} solution at {} iterations for test case {}: {}",
                                                   candidate.cpu_time ? "reference" : "candidate", iterations,
                                                   boost::lexical_cast<string>(tc), failed.error));
            }
        }
        candidate_time += scaler.candidate_total();
        reference_time += scaler.reference_total();
    }

    DLOG(INFO) << "Performance of " << solution.model_identifier << " on " << problem.identifier
               << ": candidate " << candidate_time << "s, reference " << reference_time << "s";
    grade.score = candidate_time > 0 ? min(1.0, reference_time / candidate_time) : 0;
    return grade;
}

}  // namespace codebench
