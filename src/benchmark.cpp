#include "benchmark.hpp"
#include "common/exceptions.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace codebench {
using namespace std;
namespace fs = std::filesystem;

benchmark::benchmark(solution_source &source, grade_sink &sink)
    : source(source), sink(sink) {}

vector<grading_output> benchmark::grade_problem_set(const fs::path &problem_set,
                                                    const vector<problem_definition> &problems,
                                                    const vector<string> &models,
                                                    const vector<grader *> &graders,
                                                    const map<string, fs::path> &report_paths) {
    vector<grading_output> results;
    for (grader *g : graders) {
        string name = g->identifier();
        try {
            if (!g->can_grade(problems)) {
                LOG(WARNING) << "Skipping grader " << name << " for " << problem_set
                             << ": prerequisites of the problem set are not met";
                continue;
            }

            for (auto &model : models) {
                LOG(INFO) << "Grading solutions for " << problem_set << " from model " << model << " with grader " << name;
                vector<llm_solution> solutions = source.load_solutions(problem_set, model);
                grading_output output = g->grade(problems, solutions);

                auto it = report_paths.find(model);
                sink.save_grades(problem_set, output, it == report_paths.end() ? fs::path() : it->second);

                LOG(INFO) << "Grader " << name << " scored " << model << " " << output.overall_score()
                          << " on " << problem_set;
                accumulate(problem_set.string(), output);
                results.push_back(move(output));
            }
        } catch (external_tool_missing &ex) {
            LOG(ERROR) << "Skipping grader " << name << ": " << ex.what();
        } catch (benchmark_exception &ex) {
            LOG(ERROR) << "Grader " << name << " failed on " << problem_set << ": " << ex.what() << endl
                       << ex;
        } catch (exception &ex) {
            LOG(ERROR) << "Grader " << name << " failed on " << problem_set << ": " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    return results;
}

void benchmark::accumulate(const string &problem_set, const grading_output &output) {
    auto &set_sum = problem_set_sums[problem_set];
    auto &grader_sum = grader_sums[output.grader_identifier];
    for (auto &grade : output.solution_grades) {
        set_sum.total += grade.score;
        ++set_sum.count;
        grader_sum.total += grade.score;
        ++grader_sum.count;
    }
    outputs.push_back(output);
}

run_summary benchmark::summary() const {
    run_summary result;
    for (auto &[name, sum] : problem_set_sums)
        result.problem_set_scores[name] = sum.count ? sum.total / sum.count : 0;
    for (auto &[name, sum] : grader_sums)
        result.grader_scores[name] = sum.count ? sum.total / sum.count : 0;
    result.outputs = outputs;
    return result;
}

}  // namespace codebench
