#include "sandbox/message.hpp"
#include "common/exceptions.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

const char *SOURCE_FILE = "source.py";
const char *ARGUMENTS_FILE = "arguments.json";
const char *CONFIG_FILE = "config.json";
const char *RESULT_FILE = "result.json";
const char *STDOUT_FILE = "program.out";
const char *STDERR_FILE = "program.err";

json encode_config(const execution_request &request) {
    return {{"iterations", request.iterations},
            {"collect_cpu_time", request.collect_cpu_time},
            {"collect_memory_usage", request.collect_memory_usage},
            {"mode", request.mode == execution_mode::INSPECT ? "inspect" : "invoke"},
            {"entry_point", request.entry_point ? json(*request.entry_point) : json()}};
}

void decode_config(const json &config, execution_request &request) {
    request.iterations = config.value("iterations", 1L);
    request.collect_cpu_time = config.value("collect_cpu_time", false);
    request.collect_memory_usage = config.value("collect_memory_usage", false);
    request.mode = config.value("mode", "invoke") == "inspect" ? execution_mode::INSPECT : execution_mode::INVOKE;
    if (config.count("entry_point") && config.at("entry_point").is_string())
        request.entry_point = config.at("entry_point").get<string>();
}

json make_success_message(const json &result, const optional<double> &cpu_time, const optional<int64_t> &peak_memory) {
    json metrics = json::object();
    if (cpu_time) metrics["cpu_time"] = *cpu_time;
    if (peak_memory) metrics["peak_memory"] = *peak_memory;
    return {{"result", result}, {"metrics", metrics}};
}

json make_error_message(const string &error, const string &stack_trace) {
    return {{"result", nullptr}, {"error", error}, {"stack_trace", stack_trace}};
}

void decode_result_message(const json &message, execution_result &result) {
    if (!message.is_object() || !message.count("result"))
        throw internal_error("result message is not an object with a result field");

    if (message.count("error") && !message.at("error").is_null()) {
        if (!message.at("error").is_string())
            throw internal_error("error field of result message must be a string");
        result.status = execution_status::RUNTIME_ERROR;
        result.error = message.at("error").get<string>();
        if (message.count("stack_trace") && message.at("stack_trace").is_string())
            result.stack_trace = message.at("stack_trace").get<string>();
        return;
    }

    result.status = execution_status::SUCCESS;
    result.result = message.at("result");
    if (!message.count("metrics")) return;
    auto &metrics = message.at("metrics");
    if (!metrics.is_object())
        throw internal_error("metrics field of result message must be an object");
    if (metrics.count("cpu_time")) {
        if (!metrics.at("cpu_time").is_number())
            throw internal_error("cpu_time must be a number");
        result.cpu_time = metrics.at("cpu_time").get<double>();
    }
    if (metrics.count("peak_memory")) {
        if (!metrics.at("peak_memory").is_number_integer())
            throw internal_error("peak_memory must be an integer");
        result.peak_memory = metrics.at("peak_memory").get<int64_t>();
    }
}

}  // namespace codebench
