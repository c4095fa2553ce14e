#include "sandbox/execution.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/message.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <system_error>

namespace codebench {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// 轮询子进程状态的间隔
static const struct timespec poll_interval = {0, 10 * 1000 * 1000};

static execution_result system_failure(execution_result result, const string &error) {
    result.status = execution_status::SYSTEM_ERROR;
    result.error = error;
    LOG(ERROR) << "Sandbox failure: " << error;
    return result;
}

/**
 * @brief 杀死子进程所在的进程组，子进程创建的孙进程也会被杀死
 */
static void kill_process_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill process group " << pid << ": " << strerror(errno);
    kill(pid, SIGKILL);
}

static void reap(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
}

/**
 * @brief 等待子进程结束
 * @return 子进程在 EXECUTION_TIME_LIMIT 内结束时返回 true
 */
static bool wait_with_deadline(pid_t pid, int &status) {
    elapsed_time timer;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return true;
        if (ret < 0 && errno != EINTR)
            throw system_error(errno, system_category(), "unable to wait for sandbox process");
        if (timer.duration<chrono::duration<double>>().count() >= EXECUTION_TIME_LIMIT)
            return false;
        nanosleep(&poll_interval, nullptr);
    }
}

execution_result execute_function(const execution_request &request) {
    execution_result result;
    result.function_code = request.source;
    result.parameters = request.arguments;

    scoped_temp_directory work_dir;
    try {
        work_dir = scoped_temp_directory(TEMP_DIR, "codebench-");
        write_file_content(work_dir.path() / SOURCE_FILE, request.source);
        write_file_content(work_dir.path() / ARGUMENTS_FILE, request.arguments.dump());
        write_file_content(work_dir.path() / CONFIG_FILE, encode_config(request).dump());
    } catch (exception &e) {
        return system_failure(result, fmt::format("unable to prepare sandbox directory: {}", e.what()));
    }
    if (DEBUG) work_dir.keep();

    // 避免子进程继承尚未输出的缓冲区
    fflush(stdout);
    fflush(stderr);

    pid_t pid = fork();
    if (pid < 0)
        return system_failure(result, fmt::format("unable to fork: {}", strerror(errno)));
    if (pid == 0) {
        setpgid(0, 0);
        _exit(run_executor(work_dir.path()));
    }
    setpgid(pid, pid);

    int status = 0;
    try {
        if (!wait_with_deadline(pid, status)) {
            kill_process_group(pid);
            reap(pid, status);
            LOG(WARNING) << "Function execution timed out after " << EXECUTION_TIME_LIMIT << " seconds, killed process " << pid;
            result.status = execution_status::TIME_LIMIT_EXCEEDED;
            result.error = fmt::format("Function execution timed out after {} seconds.", EXECUTION_TIME_LIMIT);
            return result;
        }
    } catch (system_error &e) {
        kill_process_group(pid);
        return system_failure(result, e.what());
    }

    // 子进程可能留下后台的孙进程
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill process group " << pid << ": " << strerror(errno);

    if (WIFSIGNALED(status)) {
        result.status = execution_status::RUNTIME_ERROR;
        result.error = fmt::format("Function execution was terminated by signal {} ({})", WTERMSIG(status), strsignal(WTERMSIG(status)));
        return result;
    }

    fs::path result_file = work_dir.path() / RESULT_FILE;
    if (!fs::exists(result_file)) {
        result.status = execution_status::RUNTIME_ERROR;
        result.error = fmt::format("Function execution exited with code {} without reporting a result", WEXITSTATUS(status));
        return result;
    }

    try {
        decode_result_message(json::parse(read_file_content(result_file)), result);
    } catch (json::exception &e) {
        return system_failure(result, fmt::format("malformed result message: {}", e.what()));
    } catch (internal_error &e) {
        return system_failure(result, fmt::format("malformed result message: {}", e.what()));
    } catch (system_error &e) {
        return system_failure(result, e.what());
    }
    return result;
}

}  // namespace codebench
