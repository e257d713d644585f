#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace grader {

struct process_options {
    /**
     * @brief 要执行的命令，command[0] 为程序路径，通过 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承父进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 写入子进程 stdin 的数据，写完后关闭 stdin
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒，小于等于 0 表示不限制
     * 超时后整个进程组将被 SIGKILL 杀死
     */
    double wall_limit = -1;

    /**
     * @brief stdout 最多保留多少字节，超出部分读出后丢弃
     */
    std::size_t stream_size = std::numeric_limits<std::size_t>::max();

    /**
     * @brief stderr 最多保留多少字节，超出部分读出后丢弃
     */
    std::size_t error_size = std::numeric_limits<std::size_t>::max();

    bool no_core_dumps = true;
};

struct process_result {
    /**
     * @brief 子进程的返回值，被信号杀死时为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 杀死子进程的信号，-1 表示子进程正常退出
     */
    int signal = -1;

    /**
     * @brief 子进程是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 子进程（以及被它回收的子孙进程）的峰值常驻内存，单位为字节
     * 由回收子进程时内核提供的 rusage 得到，无法获得时为 0。
     * 这只是事后的近似统计，并不是内存限制。
     */
    std::int64_t memory = 0;

    std::string output;
    std::string error;

    bool output_truncated = false;
    bool error_truncated = false;
};

/**
 * @brief 在独立进程组中运行外部命令，通过管道喂入 stdin 并收集 stdout/stderr
 * 函数返回时保证子进程已被回收，进程组内残留的进程已被杀死。
 * @param opt 运行参数
 * @return 运行结果
 * @throw process_error 创建管道、fork、exec 或者等待子进程失败
 */
process_result run_process(const process_options &opt);

}  // namespace grader
