#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include "benchmark.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grade/registry.hpp"
#include "store/serialization.hpp"
#include "store/validation.hpp"
using namespace std;
using namespace codebench;

static void print_header(string text) {
    for (auto &c : text) c = (char)toupper((unsigned char)c);
    string decoration(text.size() + 4, '#');
    cout << endl
         << decoration << endl
         << "# " << text << " #" << endl
         << decoration << endl
         << endl;
}

static string timestamp() {
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    stringstream ss;
    ss << put_time(&local, "%m-%d-%Y--%H-%M-%S");
    return ss.str();
}

/**
 * @brief 未指定题目集合时，使用 ./problem_sets 下的所有文件夹
 */
static vector<filesystem::path> default_problem_sets() {
    vector<filesystem::path> result;
    for (auto &entry : list_visible_entries("problem_sets"))
        if (filesystem::is_directory(entry))
            result.push_back(entry);
    return result;
}

static void validate_problem_sets(const vector<filesystem::path> &base_paths) {
    print_header("Validation");
    for (auto &base_path : base_paths) {
        cout << base_path.string() << ":" << endl;
        nlohmann::json problems = get_problems_json(base_path);
        for (auto &[file_name, problem] : problems.items()) {
            validation_result result = validate_problem_json(problem);
            LOG_IF(WARNING, !result.valid) << "Problem " << file_name << " in " << base_path << " is invalid: " << result.message;
            cout << "\t" << file_name << ": " << result << endl;
        }
    }
}

static void grade_problem_sets(const vector<filesystem::path> &base_paths, const vector<string> &models,
                               const vector<grader *> &graders, const filesystem::path &report_path) {
    string now = timestamp();
    map<string, filesystem::path> report_paths;
    for (auto &model : models)
        report_paths[model] = report_path / ("report-" + model + "-" + now + ".json");

    file_store store;
    benchmark bench(store, store);

    print_header("Grading");
    for (auto &base_path : base_paths) {
        cout << endl
             << "***" << endl
             << "*** Problem set " << base_path.string() << endl
             << "***" << endl;

        vector<problem_definition> problems;
        try {
            problems = get_problems(base_path);
        } catch (exception &ex) {
            LOG(ERROR) << "Unable to load problems from " << base_path << ": " << ex.what();
            continue;
        }
        for (auto &problem : problems)
            cout << problem.identifier << endl;

        for (auto &output : bench.grade_problem_set(base_path, problems, models, graders, report_paths)) {
            cout << output.grader_identifier << ": " << output.overall_score() << endl;
            for (auto &grade : output.solution_grades) {
                cout << "\t" << grade.problem_identifier << " [" << grade.model_identifier << ", "
                     << grade.prompt_identifier << "]: " << grade.score << endl;
                for (auto &issue : grade.issues)
                    cout << "\t\t" << issue << endl;
            }
        }
    }

    run_summary summary = bench.summary();
    print_header("Summary");
    cout << "Average Scores Per Problem Set:" << endl;
    for (auto &[name, score] : summary.problem_set_scores)
        cout << "\t" << name << ": " << score << endl;
    cout << "Average Scores Per Criterion:" << endl;
    for (auto &[name, score] : summary.grader_scores)
        cout << "\t" << name << ": " << score << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    register_builtin_graders();

    namespace po = boost::program_options;
    po::options_description desc("codebench options");
    po::variables_map vm;

    string grader_help = "the grader(s) to use for grading solutions. Valid graders:";
    for (auto &name : all_graders()) grader_help += " " + name;

    // clang-format off
    desc.add_options()
        ("base-path", po::value<vector<string>>()->multitoken(), "the base path(s) of problem sets. If not set, run all problem sets in ./problem_sets")
        ("validate", "validate the problem definition JSON")
        ("grade", "grade the solutions stored in the problem sets")
        ("model", po::value<vector<string>>()->multitoken(), "the model(s) whose solutions are graded")
        ("grader", po::value<vector<string>>()->multitoken(), grader_help.c_str())
        ("report-path", po::value<string>()->default_value("reports"), "location in which to store reports generated during each run")
        ("time-limit", po::value<double>(), "set the wall clock time limit in seconds of a single function execution, default to 5. You can either pass it from environ TIMELIMIT")
        ("debug", "turn on the debug mode to keep sandbox directories for checking the input and output of executions")
        ("list-graders", "list the names of all graders")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebench: grade AI generated solutions against reference solutions" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebench 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("list-graders")) {
        for (auto &name : all_graders())
            cout << name << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || !get_env("DEBUG", "").empty())
        DEBUG = true;

    string time_limit = get_env("TIMELIMIT", "");
    if (vm.count("time-limit")) {
        EXECUTION_TIME_LIMIT = vm["time-limit"].as<double>();
    } else if (!time_limit.empty()) {
        try {
            EXECUTION_TIME_LIMIT = boost::lexical_cast<double>(time_limit);
        } catch (boost::bad_lexical_cast &) {
            LOG(FATAL) << "TIMELIMIT environment variable " << time_limit << " is not a number";
        }
    }
    CHECK(EXECUTION_TIME_LIMIT > 0) << "Time limit should be positive";

    string temp_dir = get_env("TMPDIR", "");
    if (!temp_dir.empty())
        TEMP_DIR = filesystem::path(temp_dir);
    CHECK(filesystem::is_directory(TEMP_DIR))
        << "Temporary directory " << TEMP_DIR << " does not exist";

    bool grade = vm.count("grade");
    if (grade && !vm.count("model")) {
        cerr << "--model is required when --grade is specified" << endl;
        return EXIT_FAILURE;
    }
    if (grade && !vm.count("grader")) {
        cerr << "--grader is required when --grade is specified" << endl;
        return EXIT_FAILURE;
    }

    vector<filesystem::path> base_paths;
    if (vm.count("base-path")) {
        for (auto &path : vm["base-path"].as<vector<string>>())
            base_paths.emplace_back(path);
    } else {
        base_paths = default_problem_sets();
    }
    for (auto &base_path : base_paths)
        CHECK(filesystem::is_directory(base_path / "problems"))
            << "Problem set " << base_path << " does not contain a problems directory";

    try {
        if (vm.count("validate"))
            validate_problem_sets(base_paths);

        if (grade) {
            vector<grader *> graders = resolve_graders(vm["grader"].as<vector<string>>());
            grade_problem_sets(base_paths, vm["model"].as<vector<string>>(), graders,
                               filesystem::path(vm["report-path"].as<string>()));
        }
    } catch (exception &ex) {
        LOG(ERROR) << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
