#include "gtest/gtest.h"
#include "store/validation.hpp"
#include "test/problems.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;
using namespace nlohmann;
using namespace codebench;
using namespace codebench::test;

class ValidationTest : public ::testing::Test {
protected:
    json problem = make_add_problem();
    fake_runner fake;

    void SetUp() override {
        fake.handler = [](const execution_request &request) {
            return success_result(request.arguments[0].get<int>() + request.arguments[1].get<int>());
        };
    }

    validation_result validate() {
        return validate_problem_json(problem, fake.runner());
    }
};

TEST_F(ValidationTest, ValidTest) {
    auto result = validate();
    EXPECT_TRUE(result.valid) << result.message;
    EXPECT_EQ("Validation successful", result.message);
    EXPECT_EQ(2u, fake.requests.size());
    EXPECT_EQ("(True, 'Validation successful')", boost::lexical_cast<string>(result));
}

TEST_F(ValidationTest, MinimalTest) {
    problem = {{"identifier", "minimal"}, {"prompts", json::array()}};
    auto result = validate();
    EXPECT_TRUE(result.valid) << result.message;
    EXPECT_TRUE(fake.requests.empty());
}

TEST_F(ValidationTest, MissingFieldTest) {
    problem.erase("identifier");
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ("Missing required fields: identifier", result.message);

    problem = json::array();
    EXPECT_FALSE(validate().valid);
}

TEST_F(ValidationTest, FieldTypeTest) {
    problem["identifier"] = 5;
    EXPECT_EQ("Field 'identifier' should be a string", validate().message);

    problem = make_add_problem();
    problem["tags"] = {"easy", 3};
    EXPECT_EQ("All elements in field 'tags' should be strings", validate().message);

    problem = make_add_problem();
    problem["optimal_solution"] = 1;
    EXPECT_EQ("Field 'optimal_solution' should be a string", validate().message);
}

TEST_F(ValidationTest, PromptTest) {
    problem["prompts"][0].erase("prompt");
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(boost::starts_with(result.message, "Invalid prompt at index 0: ")) << result.message;

    problem = make_add_problem();
    problem["prompts"][0]["genericize"] = "yes";
    EXPECT_FALSE(validate().valid);
}

TEST_F(ValidationTest, PrototypeTest) {
    problem["function_prototype"]["parameters"][0].erase("type");
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ("Invalid function prototype: Invalid Parameter JSON object: Missing required fields: type", result.message);

    problem = make_add_problem();
    problem.erase("function_prototype");
    result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_NE(string::npos, result.message.find("Function prototype must be present")) << result.message;
}

TEST_F(ValidationTest, TestCaseTest) {
    problem["correctness_test_suite"][1]["input"].erase("b");
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(boost::starts_with(result.message, "Invalid test case in 'correctness_test_suite' at index 1: "))
        << result.message;
    EXPECT_TRUE(fake.requests.empty());

    problem = make_add_problem();
    problem["correctness_test_suite"][0]["input"]["a"] = "two";
    EXPECT_FALSE(validate().valid);
}

TEST_F(ValidationTest, WrongOptimalSolutionTest) {
    fake.handler = [](const execution_request &) { return success_result(5); };
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(boost::starts_with(result.message, "Optimal solution did not pass test case")) << result.message;
}

TEST_F(ValidationTest, BoolResultTest) {
    // 参考程序返回 True，与期望的 1 相等
    for (auto &tc : problem["correctness_test_suite"])
        tc["expected_output"] = json::array({"1"});
    fake.handler = [](const execution_request &) { return success_result(true); };
    auto result = validate();
    EXPECT_TRUE(result.valid) << result.message;

    fake.handler = [](const execution_request &) { return success_result(false); };
    EXPECT_FALSE(validate().valid);
}

TEST_F(ValidationTest, FailingOptimalSolutionTest) {
    fake.handler = [](const execution_request &) { return failure_result(execution_status::RUNTIME_ERROR, "boom"); };
    auto result = validate();
    EXPECT_FALSE(result.valid);
    EXPECT_NE(string::npos, result.message.find("Error: boom")) << result.message;
}

TEST_F(ValidationTest, RealSandboxTest) {
    auto result = validate_problem_json(problem);
    EXPECT_TRUE(result.valid) << result.message;
}
