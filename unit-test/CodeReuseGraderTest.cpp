#include "grade/code_reuse.hpp"
#include "gtest/gtest.h"
#include "test/problems.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;
using namespace codebench::test;

class CodeReuseGraderTest : public ::testing::Test {
protected:
    code_reuse_grader grader;
    problem_definition problem = make_add_problem();

    void SetUp() override {
        problem.prototype->function_name = "add_twice";
        problem.additional_fields["parent_function_prototype"] = {{"function_name", "add"}};
    }
};

TEST_F(CodeReuseGraderTest, ParentFunctionNameTest) {
    EXPECT_EQ("add", code_reuse_grader::parent_function_name(problem));
    EXPECT_TRUE(grader.can_grade({problem}));

    problem_definition missing = make_add_problem();
    EXPECT_FALSE(code_reuse_grader::parent_function_name(missing));
    EXPECT_FALSE(grader.can_grade({problem, missing}));

    missing.additional_fields["parent_function_prototype"] = {{"function_name", 5}};
    EXPECT_FALSE(code_reuse_grader::parent_function_name(missing));
}

TEST_F(CodeReuseGraderTest, ReuseTest) {
    auto output = grader.grade({problem}, {make_solution("add", "def add(a, b):\n    return a + b\n\n"
                                                               "def add_twice(a, b):\n    return add(add(a, b), b)\n")});
    EXPECT_EQ("code_reuse", output.grader_identifier);
    ASSERT_EQ(1u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(1.0, output.solution_grades[0].score);
    EXPECT_TRUE(output.solution_grades[0].issues.empty());
}

TEST_F(CodeReuseGraderTest, NoReuseTest) {
    auto output = grader.grade({problem}, {make_solution("add", "def add(a, b):\n    return a + b\n\n"
                                                               "def add_twice(a, b):\n    return a + b + b\n")});
    ASSERT_EQ(1u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(0.0, output.solution_grades[0].score);
    ASSERT_EQ(1u, output.solution_grades[0].issues.size());
}

TEST_F(CodeReuseGraderTest, MissingFunctionTest) {
    auto output = grader.grade({problem}, {make_solution("add", "def something_else():\n    return add(1, 2)\n")});
    ASSERT_EQ(1u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(0.0, output.solution_grades[0].score);
    ASSERT_EQ(1u, output.solution_grades[0].issues.size());
    EXPECT_NE(string::npos, output.solution_grades[0].issues[0].find("Unable to inspect"));
}

TEST_F(CodeReuseGraderTest, InspectRequestTest) {
    fake_runner fake;
    fake.handler = [](const execution_request &) { return success_result(json::array({"add", "len"})); };
    grader.set_function_runner(fake.runner());

    auto output = grader.grade({problem}, {make_solution("add", "code")});
    ASSERT_EQ(1u, fake.requests.size());
    EXPECT_EQ(execution_mode::INSPECT, fake.requests[0].mode);
    EXPECT_EQ("add_twice", fake.requests[0].entry_point);
    EXPECT_EQ("code", fake.requests[0].source);
    EXPECT_DOUBLE_EQ(1.0, output.solution_grades[0].score);
}
