#pragma once

namespace codebench {

/**
 * @brief 表示沙箱中一次函数执行的结果
 */
enum class execution_status {
    /**
     * @brief 函数正常返回，执行结果和统计数据有效
     */
    SUCCESS = 0,

    /**
     * @brief 被测代码在编译或调用时抛出异常
     * 或者子进程在写回执行结果之前就退出了（比如被测代码调用了 os._exit，或者因为信号崩溃）
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 子进程在 EXECUTION_TIME_LIMIT 内没有结束，已被强制终止
     * 与 RUNTIME_ERROR 区分开，调用方可以区分“运行后崩溃”和“一直没有返回”
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 沙箱自身出错
     * 比如无法 fork 子进程、无法写入临时文件、子进程写回的消息格式错误
     */
    SYSTEM_ERROR = 3
};

const char *get_display_message(execution_status);

}  // namespace codebench
