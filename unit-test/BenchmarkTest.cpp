#include "benchmark.hpp"
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/problems.hpp"
#include <stdexcept>

using namespace std;
using namespace codebench;
using namespace codebench::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
namespace fs = std::filesystem;

struct mock_solution_source : public solution_source {
    MOCK_METHOD(vector<llm_solution>, load_solutions, (const fs::path &, const string &), (override));
};

struct mock_grade_sink : public grade_sink {
    MOCK_METHOD(void, save_grades, (const fs::path &, const grading_output &, const fs::path &), (override));
};

/**
 * @brief 给每份代码固定评分的评分器
 */
struct constant_grader : public grader {
    string name;
    double score;
    bool gradable = true;

    constant_grader(string name, double score) : name(move(name)), score(score) {}

    string identifier() const override { return name; }

    bool can_grade(const vector<problem_definition> &) const override { return gradable; }

protected:
    solution_grade grade_solution(const problem_definition &problem, const llm_solution &solution) override {
        solution_grade grade = make_grade(problem, solution);
        grade.score = score;
        return grade;
    }
};

struct missing_tool_grader : public constant_grader {
    missing_tool_grader() : constant_grader("tool", 1) {}

    grading_output grade(const vector<problem_definition> &, const vector<llm_solution> &) override {
        throw external_tool_missing("pytest");
    }
};

class BenchmarkTest : public ::testing::Test {
protected:
    mock_solution_source source;
    mock_grade_sink sink;
    vector<problem_definition> problems = {make_add_problem()};
    fs::path problem_set = "sets/basic";
};

TEST_F(BenchmarkTest, GradeTest) {
    constant_grader half("half", 0.5), full("full", 1);
    EXPECT_CALL(source, load_solutions(problem_set, "m1"))
        .WillRepeatedly(Return(vector<llm_solution>{make_solution("add", "x", "m1")}));
    EXPECT_CALL(source, load_solutions(problem_set, "m2"))
        .WillRepeatedly(Return(vector<llm_solution>{make_solution("add", "y", "m2"), make_solution("add", "z", "m2", "p2")}));
    EXPECT_CALL(sink, save_grades(problem_set, _, fs::path("reports/m1.json"))).Times(2);
    EXPECT_CALL(sink, save_grades(problem_set, _, fs::path())).Times(2);

    benchmark bench(source, sink);
    auto outputs = bench.grade_problem_set(problem_set, problems, {"m1", "m2"}, {&half, &full},
                                           {{"m1", "reports/m1.json"}});
    ASSERT_EQ(4u, outputs.size());
    EXPECT_EQ("half", outputs[0].grader_identifier);
    EXPECT_EQ(1u, outputs[0].solution_grades.size());
    EXPECT_EQ(2u, outputs[1].solution_grades.size());
    EXPECT_EQ("full", outputs[2].grader_identifier);

    run_summary summary = bench.summary();
    EXPECT_DOUBLE_EQ(0.5, summary.grader_scores["half"]);
    EXPECT_DOUBLE_EQ(1.0, summary.grader_scores["full"]);
    EXPECT_DOUBLE_EQ(0.75, summary.problem_set_scores[problem_set.string()]);
    EXPECT_EQ(4u, summary.outputs.size());
}

TEST_F(BenchmarkTest, SkipUngradableTest) {
    constant_grader skipped("skipped", 1), kept("kept", 0.25);
    skipped.gradable = false;
    EXPECT_CALL(source, load_solutions(_, _))
        .Times(1)
        .WillOnce(Return(vector<llm_solution>{make_solution("add", "x")}));
    EXPECT_CALL(sink, save_grades(_, _, _))
        .WillOnce(Invoke([](const fs::path &, const grading_output &output, const fs::path &) {
            EXPECT_EQ("kept", output.grader_identifier);
        }));

    benchmark bench(source, sink);
    auto outputs = bench.grade_problem_set(problem_set, problems, {"mock-model"}, {&skipped, &kept}, {});
    ASSERT_EQ(1u, outputs.size());
    EXPECT_EQ(0u, bench.summary().grader_scores.count("skipped"));
}

TEST_F(BenchmarkTest, MissingToolTest) {
    missing_tool_grader tool;
    constant_grader after("after", 1);
    EXPECT_CALL(source, load_solutions(_, _))
        .WillRepeatedly(Return(vector<llm_solution>{make_solution("add", "x")}));
    EXPECT_CALL(sink, save_grades(_, _, _)).Times(1);

    benchmark bench(source, sink);
    vector<grading_output> outputs;
    ASSERT_NO_THROW(outputs = bench.grade_problem_set(problem_set, problems, {"mock-model"}, {&tool, &after}, {}));
    ASSERT_EQ(1u, outputs.size());
    EXPECT_EQ("after", outputs[0].grader_identifier);
}

TEST_F(BenchmarkTest, SourceFailureTest) {
    constant_grader only("only", 1);
    EXPECT_CALL(source, load_solutions(_, _))
        .WillOnce(Invoke([](const fs::path &, const string &) -> vector<llm_solution> {
            throw std::runtime_error("unreadable");
        }));
    EXPECT_CALL(sink, save_grades(_, _, _)).Times(0);

    benchmark bench(source, sink);
    EXPECT_TRUE(bench.grade_problem_set(problem_set, problems, {"mock-model"}, {&only}, {}).empty());
    EXPECT_TRUE(bench.summary().grader_scores.empty());
}

TEST_F(BenchmarkTest, EmptySummaryTest) {
    benchmark bench(source, sink);
    run_summary summary = bench.summary();
    EXPECT_TRUE(summary.problem_set_scores.empty());
    EXPECT_TRUE(summary.grader_scores.empty());
    EXPECT_TRUE(summary.outputs.empty());
}
