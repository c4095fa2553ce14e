#include "common/io_utils.hpp"
#include "config.hpp"
#include "marshal/literal_parser.hpp"
#include "gtest/gtest.h"
#include "sandbox/execution.hpp"
#include "test/assertions.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <algorithm>
#include <unistd.h>

using namespace std;
using namespace nlohmann;
using namespace codebench;

/**
 * @brief 进程不存在或者已经是僵尸进程
 */
static bool process_gone(pid_t pid) {
    if (kill(pid, 0) == -1 && errno == ESRCH) return true;
    string stat = read_file_content(fmt::format("/proc/{}/stat", pid), "");
    size_t paren = stat.rfind(')');
    return paren != string::npos && paren + 2 < stat.size() && stat[paren + 2] == 'Z';
}

/**
 * @brief 等待进程结束，最多等待 2 秒
 */
static bool wait_until_gone(pid_t pid) {
    for (int i = 0; i < 100; ++i) {
        if (process_gone(pid)) return true;
        usleep(20000);
    }
    return false;
}

static execution_request make_request(const string &source, json arguments) {
    execution_request request;
    request.source = source;
    request.arguments = move(arguments);
    return request;
}

TEST(ExecutionTest, SuccessTest) {
    auto result = execute_function(make_request("def add(a, b):\n    return a + b\n", {2, 3}));
    ASSERT_EQ(execution_status::SUCCESS, result.status) << result.error << result.stack_trace;
    EXPECT_JSON_EQ(json(5), result.result);
    EXPECT_FALSE(result.cpu_time);
    EXPECT_FALSE(result.peak_memory);
    EXPECT_TRUE(result.error.empty());
}

TEST(ExecutionTest, TypingNamesTest) {
    auto result = execute_function(make_request(
        "def head(values: List[int]) -> Optional[int]:\n    return values[0] if values else None\n",
        json::array({json::array({7, 8})})));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(json(7), result.result);
}

TEST(ExecutionTest, CompoundResultTest) {
    auto result = execute_function(make_request(
        "def split(s):\n    return (s[:1], {'rest': s[1:], 'n': len(s)})\n", {"abc"}));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(R"(["a", {"rest": "bc", "n": 3}])"_json, result.result);
}

TEST(ExecutionTest, NonFiniteResultTest) {
    // JSON 无法表示 NaN 和无穷大，写回时变为 null
    auto result = execute_function(make_request(
        "def f():\n    return [float('nan'), float('inf'), 1.5]\n", json::array()));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(R"([null, null, 1.5])"_json, result.result);
}

TEST(ExecutionTest, RuntimeErrorTest) {
    auto result = execute_function(make_request("def f(x):\n    return 1 // x\n", {0}));
    EXPECT_EQ(execution_status::RUNTIME_ERROR, result.status);
    EXPECT_NE(string::npos, result.error.find("division by zero")) << result.error;
    EXPECT_NE(string::npos, result.stack_trace.find("ZeroDivisionError")) << result.stack_trace;
    EXPECT_EQ("def f(x):\n    return 1 // x\n", result.function_code);
    EXPECT_JSON_EQ(json::array({0}), result.parameters);
}

TEST(ExecutionTest, SyntaxErrorTest) {
    auto result = execute_function(make_request("def f(:\n", json::array()));
    EXPECT_EQ(execution_status::RUNTIME_ERROR, result.status);
    EXPECT_FALSE(result.error.empty());
}

TEST(ExecutionTest, NoCallableTest) {
    auto result = execute_function(make_request("x = 1\n", json::array()));
    EXPECT_EQ(execution_status::RUNTIME_ERROR, result.status);
}

TEST(ExecutionTest, TimeLimitTest) {
    scoped_temp_directory dir{TEMP_DIR, "execution-"};
    auto pid_file = dir.path() / "pid";
    auto source = fmt::format(
        "import os\n"
        "def f():\n"
        "    with open({}, 'w') as out:\n"
        "        out.write(str(os.getpid()))\n"
        "    while True:\n"
        "        pass\n",
        to_literal(json(pid_file.string())));

    auto start = chrono::steady_clock::now();
    auto result = execute_function(make_request(source, json::array()));
    double elapsed = chrono::duration<double>(chrono::steady_clock::now() - start).count();

    EXPECT_EQ(execution_status::TIME_LIMIT_EXCEEDED, result.status);
    EXPECT_TRUE(boost::starts_with(result.error, "Function execution timed out after")) << result.error;
    EXPECT_LT(elapsed, EXECUTION_TIME_LIMIT + 1);
    EXPECT_FALSE(result.result.is_number());

    // 超时的进程已被结束
    string content = read_file_content(pid_file, "");
    ASSERT_FALSE(content.empty());
    EXPECT_TRUE(wait_until_gone(boost::lexical_cast<pid_t>(content)));
}

TEST(ExecutionTest, ChildProcessCleanedTest) {
    // 被测代码创建的子进程会随进程组一起被结束
    auto result = execute_function(make_request(
        "import os, time\n"
        "def spawn():\n"
        "    pid = os.fork()\n"
        "    if pid == 0:\n"
        "        time.sleep(60)\n"
        "        os._exit(0)\n"
        "    return pid\n",
        json::array()));
    ASSERT_TRUE(result.ok()) << result.error;
    ASSERT_TRUE(result.result.is_number_integer());
    EXPECT_TRUE(wait_until_gone(result.result.get<pid_t>()));
}

TEST(ExecutionTest, MetricsTest) {
    auto request = make_request("def build(n):\n    return len([i for i in range(n)])\n", {10000});
    request.iterations = 3;
    request.collect_cpu_time = true;
    request.collect_memory_usage = true;
    auto result = execute_function(request);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(json(10000), result.result);
    ASSERT_TRUE(result.cpu_time);
    EXPECT_GE(*result.cpu_time, 0);
    ASSERT_TRUE(result.peak_memory);
    EXPECT_GT(*result.peak_memory, 0);

    request.collect_memory_usage = false;
    result = execute_function(request);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_TRUE(result.cpu_time);
    EXPECT_FALSE(result.peak_memory);
}

TEST(ExecutionTest, LastCallableTest) {
    auto result = execute_function(make_request(
        "def helper(x):\n    return x * 2\n\ndef solve(x):\n    return helper(x) + 1\n", {4}));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(json(9), result.result);
}

TEST(ExecutionTest, EntryPointTest) {
    auto request = make_request("def first(x):\n    return x\n\ndef second(x):\n    return -x\n", {4});
    request.entry_point = "first";
    auto result = execute_function(request);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(json(4), result.result);

    request.entry_point = "missing";
    EXPECT_EQ(execution_status::RUNTIME_ERROR, execute_function(request).status);
}

TEST(ExecutionTest, InspectTest) {
    execution_request request;
    request.source = "def parent(x):\n    return x\n\ndef child(x):\n    return parent(x) + len([x])\n";
    request.mode = execution_mode::INSPECT;
    request.entry_point = "child";
    auto result = execute_function(request);
    ASSERT_TRUE(result.ok()) << result.error;
    ASSERT_TRUE(result.result.is_array());
    EXPECT_NE(result.result.end(), find(result.result.begin(), result.result.end(), json("parent")));
    EXPECT_NE(result.result.end(), find(result.result.begin(), result.result.end(), json("len")));
}

TEST(ExecutionTest, NotSerializableTest) {
    auto result = execute_function(make_request("def f():\n    return {1, 2}\n", json::array()));
    EXPECT_EQ(execution_status::RUNTIME_ERROR, result.status);
    EXPECT_NE(string::npos, result.error.find("not JSON serializable")) << result.error;
}

TEST(ExecutionTest, OutputCapturedTest) {
    // 被测代码的输出不会混入测试程序的输出
    auto result = execute_function(make_request("def f():\n    print('noise')\n    return 'ok'\n", json::array()));
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_JSON_EQ(json("ok"), result.result);
}

TEST(ExecutionTest, IsolationTest) {
    // 两次执行之间不共享解释器状态
    string source = "counter = []\ndef f():\n    counter.append(1)\n    return len(counter)\n";
    EXPECT_JSON_EQ(json(1), execute_function(make_request(source, json::array())).result);
    EXPECT_JSON_EQ(json(1), execute_function(make_request(source, json::array())).result);
}
