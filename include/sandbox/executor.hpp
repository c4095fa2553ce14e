#pragma once

#include <filesystem>

namespace codebench {

/**
 * @brief 沙箱子进程的入口
 * 从 dir 中读取 source.py, arguments.json, config.json，执行被测函数，
 * 将结果写入 result.json。被测代码的 stdout 和 stderr 被重定向到 program.out 和 program.err。
 * 
 * 只能在 fork 出的子进程中调用：该函数会初始化 Python 解释器，
 * 调用者应该在返回后立即以返回值调用 _exit。
 * @return 子进程的退出码，结果已写入 result.json 时为 0
 */
int run_executor(const std::filesystem::path &dir) noexcept;

}  // namespace codebench
