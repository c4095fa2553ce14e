#pragma once

#include "common/status.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * 这个头文件包含沙箱的对外接口
 * 每次 execute_function 都会 fork 一个独立的子进程，在子进程中初始化 Python 解释器并执行被测代码，
 * 父进程只通过临时文件夹中的文件与子进程交换数据，并在超时后强制终止子进程。
 */
namespace codebench {

enum class execution_mode {
    /**
     * @brief 调用被测函数，返回函数的返回值
     */
    INVOKE,

    /**
     * @brief 不调用函数，返回 entry_point 指定的函数引用的全局名称列表（__code__.co_names）
     */
    INSPECT
};

/**
 * @brief 一次函数执行请求
 */
struct execution_request {
    /**
     * @brief 被测代码，执行前会先导入 typing 模块中的全部名称
     */
    std::string source;

    /**
     * @brief 按顺序排列的位置参数，必须是 JSON 数组
     */
    nlohmann::json arguments = nlohmann::json::array();

    /**
     * @brief 在子进程内连续调用函数的次数，执行结果取最后一次调用的返回值
     */
    long iterations = 1;

    /**
     * @brief 是否统计所有迭代累计的 CPU 时间（用户态 + 内核态）
     */
    bool collect_cpu_time = false;

    /**
     * @brief 是否统计所有迭代中 tracemalloc 观察到的内存峰值
     */
    bool collect_memory_usage = false;

    execution_mode mode = execution_mode::INVOKE;

    /**
     * @brief 被测函数名
     * 为空时，被测代码定义的最后一个可调用对象即被测函数。
     * INSPECT 模式下必须指定。
     */
    std::optional<std::string> entry_point;
};

/**
 * @brief 一次函数执行的结果
 * status 为 SUCCESS 时 result 与统计数据有效，否则 error 和 stack_trace 有效
 */
struct execution_result {
    execution_status status = execution_status::SYSTEM_ERROR;

    nlohmann::json result;

    /**
     * @brief 累计 CPU 时间，单位为秒，只有请求统计时才有值
     */
    std::optional<double> cpu_time;

    /**
     * @brief 内存峰值，单位为字节，只有请求统计时才有值
     */
    std::optional<int64_t> peak_memory;

    std::string error;
    std::string stack_trace;

    /**
     * @brief 执行的代码和参数，用于诊断
     */
    std::string function_code;
    nlohmann::json parameters;

    bool ok() const { return status == execution_status::SUCCESS; }
};

/**
 * @brief 在独立的子进程中执行函数
 * 该函数会阻塞直到子进程结束或者超过 EXECUTION_TIME_LIMIT。
 * 沙箱自身的错误不会以异常的形式抛出，而是返回 SYSTEM_ERROR。
 */
execution_result execute_function(const execution_request &request);

/**
 * @brief 执行函数的方式，默认为 execute_function
 * 单元测试可以替换为不创建进程的实现
 */
using function_runner = std::function<execution_result(const execution_request &)>;

}  // namespace codebench
