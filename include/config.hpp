#pragma once

#include <filesystem>

namespace codebench {

/**
 * @brief 沙箱中单次函数执行（包括所有迭代）的时钟时间上限
 * 单位为秒，超时后子进程将被 SIGKILL 强制终止
 */
extern double EXECUTION_TIME_LIMIT;

/**
 * @brief 性能评分的稳定阈值
 * 候选程序或参考程序的累计 CPU 时间超过该值后停止增加迭代次数
 * 单位为秒
 */
extern double PERFORMANCE_STABILITY_THRESHOLD;

/**
 * @brief 性能评分每轮迭代次数的放大倍数
 */
extern int PERFORMANCE_SCALE_FACTOR;

/**
 * @brief 性能评分单轮最多的迭代次数
 * 超过该值后不再放大迭代次数，直接使用已有的累计时间
 */
extern long PERFORMANCE_MAX_ITERATIONS;

/**
 * @brief 内存评分时每个测试数据的迭代次数
 * 内存信号在较少的迭代次数下已经足够稳定，因此不需要自适应放大
 */
extern int MEMORY_ITERATIONS;

/**
 * @brief 代码风格评分中每个问题扣除的分数
 */
extern double STYLE_PENALTY;

/**
 * @brief 代码风格评分允许的最大行宽
 */
extern int MAX_LINE_LENGTH;

/**
 * @brief 沙箱临时文件夹的根目录
 * 
 * TEMP_DIR
 * ├── codebench-[uuid] // 每次函数执行独占的临时文件夹
 * │   ├── source.py // 要执行的代码
 * │   ├── arguments.json // 按顺序排列的函数参数
 * │   ├── config.json // 迭代次数、是否统计 CPU 时间和内存
 * │   ├── result.json // 子进程写回的执行结果
 * │   ├── program.out // 被测代码的 stdout 输出
 * │   └── program.err // 被测代码的 stderr 输出
 * └── codecov-[uuid] // 代码覆盖率评分使用的临时 Python 包
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，沙箱将不会删除临时文件夹，以便手动检查子进程的输入输出。
 */
extern bool DEBUG;

}  // namespace codebench
