#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace codebench {

struct benchmark_exception : std::exception {
    explicit benchmark_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const benchmark_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如无法创建沙箱进程、无法写入临时文件
 */
struct internal_error : public benchmark_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示测试数据中的字面量无法转换为函数原型声明的类型
 * 这种错误只会终止当前题目的评测，不会终止整个评测流程
 */
struct marshaling_error : public benchmark_exception {
    explicit marshaling_error(const std::string &message);
};

/**
 * @brief 表示测试数据缺少函数原型中声明的参数
 */
struct missing_parameter_error : public marshaling_error {
    explicit missing_parameter_error(const std::string &parameter);

    const std::string &parameter() const;

private:
    std::string name;
};

/**
 * @brief 表示评分器依赖的外部工具（比如 pytest）不存在
 * 这种错误只会终止当前评分器
 */
struct external_tool_missing : public benchmark_exception {
    explicit external_tool_missing(const std::string &tool);
};

}  // namespace codebench
