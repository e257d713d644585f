#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"

namespace grader {

struct compile_result {
    bool ok = false;

    /**
     * @brief 编译器的错误输出（已截断），或者编译超时、编译器无法启动的说明
     */
    std::string diagnostic;

    /**
     * @brief 编译用时，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 表示将选手代码编译为可执行文件的方式
 */
struct compiler {
    virtual ~compiler();

    /**
     * @brief 编译选手代码
     * 编译产物写入 artifact，会覆盖已有的文件。调用方需要保证同一个 artifact
     * 路径不会被同时编译或者运行。
     * @param source 选手代码路径
     * @param artifact 可执行文件的输出路径
     * @return 编译是否成功以及编译信息
     */
    virtual compile_result compile(const std::filesystem::path &source, const std::filesystem::path &artifact) const = 0;
};

/**
 * @brief 调用外部编译器（默认为 g++）进行编译
 * 命令行为 <compiler> <source> -o <artifact> <flags...>，在 artifact 所在文件夹中执行，
 * 超过编译时间限制后编译器的整个进程组将被杀死。
 */
struct gcc_compiler : public compiler {
    explicit gcc_compiler(const limits_policy &limits);

    compile_result compile(const std::filesystem::path &source, const std::filesystem::path &artifact) const override;

private:
    const limits_policy &limits;
};

}  // namespace grader
