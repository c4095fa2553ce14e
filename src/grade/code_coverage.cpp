#include "grade/code_coverage.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>

namespace codebench {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

string code_coverage_grader::identifier() const {
    return "codecov";
}

bool code_coverage_grader::can_grade(const vector<problem_definition> &problems) const {
    if (!grader::can_grade(problems)) return false;
    return all_of(problems.begin(), problems.end(), [](auto &problem) { return problem.prompts.front().input_code.has_value(); });
}

grading_output code_coverage_grader::grade(const vector<problem_definition> &problems, const vector<llm_solution> &solutions) {
    if (!find_executable("pytest"))
        throw external_tool_missing("pytest");
    return grader::grade(problems, solutions);
}

solution_grade code_coverage_grader::grade_solution(const problem_definition &problem, const llm_solution &solution) {
    solution_grade grade = make_grade(problem, solution);

    scoped_temp_directory work_dir(TEMP_DIR, "codecov-");
    if (DEBUG) work_dir.keep();
    fs::path package = work_dir.path() / "candidate";
    fs::create_directories(package);
    write_file_content(package / "__init__.py", "");
    write_file_content(package / "code.py", problem.prompts.front().input_code.value_or(""));
    write_file_content(package / "test_code.py",
                       fmt::format("from .code import {}\n{}", problem.prototype->function_name, solution.solution_code));

    process_options options;
    options.work_dir = package;
    options.discard_output = true;
    int exitcode = call_process_opt(options, "pytest", "--cov=.", "--cov-report", "json");
    if (exitcode != 0)
        grade.issues.push_back(fmt::format("pytest exited with code {}", exitcode));

    fs::path report = package / "coverage.json";
    try {
        json data = json::parse(read_file_content(report));
        grade.score = data.at("files").at("code.py").at("summary").at("percent_covered").get<double>() / 100;
    } catch (exception &e) {
        LOG(WARNING) << "Unable to read coverage report of " << problem.identifier << ": " << e.what();
        grade.issues.push_back(fmt::format("Unable to read coverage report: {}", e.what()));
        grade.score = 0;
    }
    return grade;
}

}  // namespace codebench
