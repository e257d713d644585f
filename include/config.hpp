#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 评测限制，进程启动时确定，之后不再修改
 * 所有评测过程都以 const 引用的方式使用同一份 limits_policy
 */
struct limits_policy {
    /**
     * @brief 编译时间限制
     * @note 单位为秒
     */
    double compile_timeout = 30;

    /**
     * @brief 每个测试点的时钟时间限制
     * @note 单位为秒
     */
    double time_limit = 5;

    /**
     * @brief 内存限制，超过则判为 memory limit exceeded
     * @note 单位为字节
     */
    std::int64_t memory_limit = 256 * 1024 * 1024;

    /**
     * @brief 提交的代码文件最大大小
     * @note 单位为字节
     */
    std::int64_t max_source_size = 1024 * 1024;

    /**
     * @brief 每次运行最多保留多少字节的 stdout
     */
    std::size_t output_limit = 64 * 1024 * 1024;

    /**
     * @brief 编译错误、运行时错误信息最多保留多少字节
     */
    std::size_t diagnostic_limit = 4096;

    /**
     * @brief 编译器，通过 PATH 查找
     */
    std::string compiler = "g++";

    /**
     * @brief 编译选项，加在 <compiler> <source> -o <artifact> 之后
     */
    std::vector<std::string> compiler_flags = {"-std=c++11"};
};

/**
 * @brief 从 JSON 读取评测限制，所有键都是可选的
 * @throw std::invalid_argument 读取后的限制不合法，见 validate
 * @code{json}
 * {
 *   "compile_timeout": 30,
 *   "time_limit": 5,
 *   "memory_limit": 268435456,
 *   "max_source_size": 1048576,
 *   "output_limit": 67108864,
 *   "diagnostic_limit": 4096,
 *   "compiler": "g++",
 *   "compiler_flags": ["-std=c++11"]
 * }
 * @endcode
 */
void from_json(const nlohmann::json &j, limits_policy &limits);

void to_json(nlohmann::json &j, const limits_policy &limits);

/**
 * @brief 检查评测限制是否合法，时间限制、内存限制和代码大小限制都必须为正数
 * @throw std::invalid_argument 若存在不合法的限制
 */
void validate(const limits_policy &limits);

/**
 * @brief 读取 JSON 配置文件
 * @throw std::exception 文件不存在或者格式错误
 */
limits_policy load_limits_policy(const std::filesystem::path &config_file);

/**
 * @brief 存放测试数据的文件夹
 * 测试数据的命名规则为 {public|hidden}-{input|output}-N[.txt]
 *
 * TESTCASE_DIR
 * ├── public-input-1   // 公开测试点 1 的输入数据
 * ├── public-output-1  // 公开测试点 1 的标准输出
 * ├── hidden-input-1   // 隐藏测试点 1 的输入数据
 * └── hidden-output-1  // 隐藏测试点 1 的标准输出
 */
extern std::filesystem::path TESTCASE_DIR;

/**
 * @brief 选手程序编译及运行的根目录，每个提交独占一个子文件夹
 *
 * RUN_DIR
 * └── 1700000000000-1 // submission id
 *     └── compile     // 编译目录，也是选手程序运行时的工作路径
 *         └── program // 编译产物
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除提交的运行目录，以便手动检查。
 */
extern bool DEBUG;

}  // namespace grader
