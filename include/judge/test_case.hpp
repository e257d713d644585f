#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 表示一个测试点
 * 测试点在发现后不可修改，同一个测试数据文件夹总是得到相同顺序的测试点
 */
struct test_case {
    enum class kind_type {
        PUBLIC,  // 公开测试点，评测报告中包含期望输出和实际输出
        HIDDEN   // 隐藏测试点，评测报告中只包含通过与否
    };

    /**
     * @brief 测试点编号，来自文件名中的 N
     */
    int ordinal = 0;

    kind_type kind = kind_type::PUBLIC;

    /**
     * @brief 输入数据文件，将喂给选手程序的 stdin
     */
    std::filesystem::path input;

    /**
     * @brief 标准输出文件
     */
    std::filesystem::path output;
};

/**
 * @brief 返回 "Public" 或者 "Hidden"
 */
const char *get_kind_string(test_case::kind_type kind);

/**
 * @brief 测试数据目录，按照 {public|hidden}-{input|output}-N[.txt] 的命名规则查找测试点
 * 只读取文件夹，可以被多个 worker 并发调用
 */
struct test_case_catalog {
    explicit test_case_catalog(const std::filesystem::path &dir);

    /**
     * @brief 列出所有完整的公开测试点，按编号升序排列
     * 缺少输入或者输出文件的测试点、编号无法解析的文件将被跳过
     */
    std::vector<test_case> list_public() const;

    /**
     * @brief 列出所有完整的隐藏测试点，按编号升序排列
     */
    std::vector<test_case> list_hidden() const;

    const std::filesystem::path &directory() const;

private:
    std::vector<test_case> list(test_case::kind_type kind) const;

    std::filesystem::path dir;
};

}  // namespace grader
