#include "grade/static_analysis.hpp"
#include "gtest/gtest.h"
#include "test/problems.hpp"

using namespace std;
using namespace codebench;
using namespace codebench::test;

TEST(CodingConventionTest, CleanCodeTest) {
    EXPECT_TRUE(coding_convention_grader::check("x = 1\ny = x\n").empty());
}

TEST(CodingConventionTest, IssuesTest) {
    auto issues = coding_convention_grader::check("def BadName(a,b):\n    return a+b \n");
    vector<string> expected = {
        "Invalid function or variable name 'BadName'.",
        "Inconsistent indentation found.",
        "Trailing whitespace found on line 2.",
        "Missing space around operator on line 2.",
    };
    EXPECT_EQ(expected, issues);
}

TEST(CodingConventionTest, ImportTest) {
    auto issues = coding_convention_grader::check("import os\nimport abc\nfrom typing import *\n");
    vector<string> expected = {
        "Imports are not in alphabetical order.",
        "Wildcard import found.",
    };
    EXPECT_EQ(expected, issues);
}

TEST(CodingConventionTest, LayoutTest) {
    auto issues = coding_convention_grader::check("class my_class:\n\tpass\n\n\nvalue = [1 , 2]\n" + string(80, 'x') + "\n");
    vector<string> expected = {
        "Line 6 exceeds 79 characters.",
        "Multiple blank lines found.",
        "Space found before punctuation on line 5.",
        "Invalid class name 'my_class'.",
        "Inconsistent indentation found.",
    };
    EXPECT_EQ(expected, issues);
}

TEST(CodingConventionTest, GradeTest) {
    coding_convention_grader grader;
    problem_definition problem = make_add_problem();
    auto output = grader.grade({problem}, {make_solution("add", "def BadName(a,b):\n    return a+b \n"),
                                           make_solution("add", "x = 1\n", "mock-model", "p2")});
    EXPECT_EQ("coding_convention", output.grader_identifier);
    ASSERT_EQ(2u, output.solution_grades.size());
    EXPECT_NEAR(0.6, output.solution_grades[0].score, 1e-9);
    EXPECT_EQ(4u, output.solution_grades[0].issues.size());
    EXPECT_DOUBLE_EQ(1.0, output.solution_grades[1].score);
}

TEST(CodingConventionTest, FloorTest) {
    string code;
    for (int i = 0; i < 12; ++i) code += string(80, 'x') + "\n";
    coding_convention_grader grader;
    auto output = grader.grade({make_add_problem()}, {make_solution("add", code)});
    ASSERT_EQ(1u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(0.0, output.solution_grades[0].score);
    EXPECT_EQ(12u, output.solution_grades[0].issues.size());
}

TEST(HumanLikenessTest, JaccardTest) {
    EXPECT_DOUBLE_EQ(0.5, human_likeness_grader::jaccard_distance("a b c", "b c d"));
    EXPECT_DOUBLE_EQ(0.0, human_likeness_grader::jaccard_distance("a  b\nc", "c b a"));
    EXPECT_DOUBLE_EQ(1.0, human_likeness_grader::jaccard_distance("a", "b"));
    EXPECT_DOUBLE_EQ(0.0, human_likeness_grader::jaccard_distance("", " \n"));
}

TEST(HumanLikenessTest, GradeTest) {
    human_likeness_grader grader;
    problem_definition problem = make_add_problem();
    EXPECT_TRUE(grader.can_grade({problem}));

    auto output = grader.grade({problem}, {make_solution("add", *problem.optimal_solution),
                                           make_solution("add", "lambda: None", "mock-model", "p2")});
    EXPECT_EQ("humanlikeness", output.grader_identifier);
    ASSERT_EQ(2u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(1.0, output.solution_grades[0].score);
    EXPECT_DOUBLE_EQ(0.0, output.solution_grades[1].score);

    problem.optimal_solution.reset();
    EXPECT_FALSE(grader.can_grade({problem}));
}

TEST(HalsteadTest, DifficultyTest) {
    EXPECT_DOUBLE_EQ(1.0, halstead_grader::difficulty("x = a + b"));
    EXPECT_DOUBLE_EQ(1.5, halstead_grader::difficulty("y = x + x"));
    EXPECT_DOUBLE_EQ(0.0, halstead_grader::difficulty("+ -"));
    EXPECT_DOUBLE_EQ(0.0, halstead_grader::difficulty(""));
}

TEST(HalsteadTest, GradeTest) {
    halstead_grader grader;
    auto output = grader.grade({make_add_problem()}, {make_solution("add", "y = x + x")});
    EXPECT_EQ("halstead", output.grader_identifier);
    ASSERT_EQ(1u, output.solution_grades.size());
    EXPECT_DOUBLE_EQ(1.5, output.solution_grades[0].score);
}
