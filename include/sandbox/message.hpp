#pragma once

#include "sandbox/execution.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 这个头文件包含沙箱父子进程之间交换的消息格式
 * 
 * [temp directory]
 * ├── source.py // 被测代码
 * ├── arguments.json // 位置参数数组
 * ├── config.json // {"iterations", "collect_cpu_time", "collect_memory_usage", "mode", "entry_point"}
 * ├── result.json // {"result", "metrics": {"cpu_time"?, "peak_memory"?}} 或 {"result": null, "error", "stack_trace"}
 * ├── program.out
 * └── program.err
 */
namespace codebench {

extern const char *SOURCE_FILE;
extern const char *ARGUMENTS_FILE;
extern const char *CONFIG_FILE;
extern const char *RESULT_FILE;
extern const char *STDOUT_FILE;
extern const char *STDERR_FILE;

/**
 * @brief 生成 config.json 的内容，不包含代码和参数
 */
nlohmann::json encode_config(const execution_request &request);

/**
 * @brief 从 config.json 的内容还原执行请求的配置部分
 * @throw nlohmann::json::exception 若字段类型错误
 */
void decode_config(const nlohmann::json &config, execution_request &request);

nlohmann::json make_success_message(const nlohmann::json &result,
                                    const std::optional<double> &cpu_time,
                                    const std::optional<int64_t> &peak_memory);

nlohmann::json make_error_message(const std::string &error, const std::string &stack_trace);

/**
 * @brief 解析子进程写回的 result.json，填入 result
 * @throw internal_error 若消息格式错误
 */
void decode_result_message(const nlohmann::json &message, execution_result &result);

}  // namespace codebench
