#include "store/serialization.hpp"
#include "common/io_utils.hpp"
#include <glog/logging.h>

namespace codebench {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static json read_json(const fs::path &path) {
    return json::parse(read_file_content(path));
}

static void write_json(const fs::path &path, const json &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    write_file_content(path, content.dump(4));
}

json get_problems_json(const fs::path &base) {
    json problems = json::object();
    for (auto &path : list_visible_entries(base / "problems")) {
        LOG(INFO) << "Loading " << path;
        problems[path.filename().string()] = read_json(path);
    }
    return problems;
}

vector<problem_definition> get_problems(const fs::path &base) {
    vector<problem_definition> problems;
    for (auto &[name, problem] : get_problems_json(base).items())
        problems.push_back(problem.get<problem_definition>());
    return problems;
}

void save_solution(const fs::path &base, const llm_solution &solution) {
    fs::path path = base / "solutions" / solution.model_identifier / solution.problem_identifier /
                    (solution.prompt_identifier + ".json");
    write_json(path, solution);
}

vector<llm_solution> get_solutions(const fs::path &base, const string &model) {
    vector<llm_solution> solutions;
    for (auto &problem_dir : list_visible_entries(base / "solutions" / model))
        for (auto &path : list_visible_entries(problem_dir))
            solutions.push_back(read_json(path).get<llm_solution>());
    return solutions;
}

static double average(const vector<double> &scores) {
    if (scores.empty()) return 0;
    double sum = 0;
    for (double score : scores) sum += score;
    return sum / scores.size();
}

static void update_report(const fs::path &base, const grading_output &output, const fs::path &report_path) {
    json report;
    if (fs::exists(report_path)) {
        report = read_json(report_path);
    } else {
        report = {{"Problem Sets", json::object()},
                  {"Average Scores Per Problem Set", json::object()},
                  {"Average Scores Per Criterion", json::object()}};
    }

    string problem_set = base.string();
    json &grades = report["Problem Sets"][problem_set][output.grader_identifier];
    if (!grades.is_array()) grades = json::array();
    for (auto &grade : output.solution_grades)
        grades.push_back(grade);

    vector<double> set_scores;
    for (auto &[grader, entries] : report["Problem Sets"][problem_set].items())
        for (auto &entry : entries)
            set_scores.push_back(entry.at("score").get<double>());
    report["Average Scores Per Problem Set"][problem_set] = average(set_scores);

    vector<double> grader_scores;
    for (auto &[name, graders] : report["Problem Sets"].items())
        if (graders.contains(output.grader_identifier))
            for (auto &entry : graders.at(output.grader_identifier))
                grader_scores.push_back(entry.at("score").get<double>());
    report["Average Scores Per Criterion"][output.grader_identifier] = average(grader_scores);

    write_json(report_path, report);
}

void save_grades(const fs::path &base, const grading_output &output, const fs::path &report_path) {
    for (auto &grade : output.solution_grades) {
        fs::path path = base / "grades" / grade.model_identifier / output.grader_identifier /
                        grade.problem_identifier / (grade.prompt_identifier + ".json");
        write_json(path, grade);
    }
    if (!report_path.empty())
        update_report(base, output, report_path);
}

grading_output get_grades(const fs::path &base, const string &model, const string &grader) {
    grading_output output;
    output.grader_identifier = grader;
    for (auto &problem_dir : list_visible_entries(base / "grades" / model / grader))
        for (auto &path : list_visible_entries(problem_dir))
            output.solution_grades.push_back(read_json(path).get<solution_grade>());
    return output;
}

vector<llm_solution> file_store::load_solutions(const fs::path &problem_set, const string &model) {
    return get_solutions(problem_set, model);
}

void file_store::save_grades(const fs::path &problem_set, const grading_output &output, const fs::path &report_path) {
    codebench::save_grades(problem_set, output, report_path);
}

}  // namespace codebench
