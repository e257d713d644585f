#pragma once

namespace grader {

/**
 * @brief 表示整个提交的评测结果
 */
enum class status {
    /**
     * @brief 提交正在等待队列中，或者还在评测中
     */
    PENDING = 0,

    /**
     * @brief 没有任何测试数据
     * 编译通过但测试数据文件夹中没有完整的测试点
     */
    NO_TESTS = 1,

    /**
     * @brief 所有测试点均通过
     */
    SUCCESS = 2,

    /**
     * @brief 部分测试点没有通过
     */
    PARTIAL = 3,

    /**
     * @brief 选手程序编译错误
     * 编译器返回非零值，或者编译超时
     */
    COMPILE_ERROR = 4,

    /**
     * @brief 内部错误，评测系统出错
     * 评测过程中出现了未预期的异常，提交仍然会被标记为评测完成
     */
    INTERNAL_ERROR = 5
};

/**
 * @brief 提交当前所处的评测阶段
 * PENDING -> COMPILING -> RUNNING -> COMPLETED
 * 编译失败或者出现内部错误时从 COMPILING/RUNNING 直接进入 COMPLETED
 */
enum class stage {
    PENDING = 0,
    COMPILING = 1,
    RUNNING = 2,
    COMPLETED = 3
};

enum class compile_status {
    PENDING = 0,
    SUCCESS = 1,
    ERROR = 2
};

/**
 * @brief 单个测试点的评测结果
 */
enum class verdict {
    PASS = 0,
    FAIL = 1
};

/**
 * @brief 测试点失败的原因分类
 */
enum class failure {
    /**
     * @brief 测试点通过
     */
    NONE = 0,

    /**
     * @brief 用户程序运行时间超出限制，进程组被杀死
     */
    TIME_LIMIT_EXCEEDED = 1,

    /**
     * @brief 用户程序运行内存超限
     * 内存统计是程序结束后读取的峰值常驻内存，只是近似值，
     * 程序运行期间并不会因为内存超限被终止。
     */
    MEMORY_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序返回非零值或者被信号杀死
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 程序正常运行但输出和标准输出不一致
     */
    WRONG_ANSWER = 4,

    /**
     * @brief 运行测试点时评测系统自身出错
     */
    INTERNAL_ERROR = 5,

    /**
     * @brief 用户程序的输出超过限制
     * 超出部分已被丢弃，剩余的输出不能用于比较
     */
    OUTPUT_LIMIT_EXCEEDED = 6
};

const char *get_display_message(status);

/**
 * @brief 返回状态对外的字符串形式，如 compile_error、no_tests
 */
const char *get_status_string(status);

const char *get_stage_string(stage);

const char *get_compile_status_string(compile_status);

const char *get_verdict_string(verdict);

const char *get_display_message(failure);

}  // namespace grader
