#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/test_case.hpp"

/**
 * 这个头文件包含评测报告的结构体和 JSON 序列化函数
 * 包含：
 * 1. test_outcome 类（表示一个测试点的评测结果）
 * 2. score 类（表示一类测试点的通过数和总数）
 * 3. report 类（表示一个提交的完整评测报告）
 */
namespace grader {

/**
 * @brief 一个测试点的评测结果
 */
struct test_outcome {
    test_case testcase;

    grader::verdict result = grader::verdict::FAIL;

    /**
     * @brief 失败原因分类，通过时为 NONE
     */
    grader::failure failure_kind = grader::failure::NONE;

    /**
     * @brief 选手程序的输出（已去除末尾空白）
     * 隐藏测试点不会在报告中输出该项
     */
    std::string output;

    /**
     * @brief 标准输出（已去除首尾空白），只在公开测试点的报告中输出
     */
    std::string expected;

    /**
     * @brief 本测试点程序运行使用的内存
     * 单位为字节，无法统计时为 0
     */
    std::int64_t memory_used = 0;

    /**
     * @brief 本测试点程序运行用时
     * 单位为秒
     */
    double run_time = 0;

    /**
     * @brief 失败原因，通过时为空
     */
    std::string reason;
};

/**
 * @brief 一类测试点的得分
 */
struct score {
    std::size_t passed = 0;
    std::size_t total = 0;

    /**
     * @brief 格式化为 "passed/total"
     */
    std::string str() const;

    /**
     * @brief 格式化为 "passed/total"，total 为 0 时返回 "N/A"
     */
    std::string str_or_na() const;
};

/**
 * @brief 一个提交的评测报告
 * 提交入队时创建，只允许评测该提交的 worker 修改，评测完成后不再修改
 */
struct report {
    std::string submission_id;

    /**
     * @brief 选手上传的文件名
     */
    std::string filename;

    grader::stage current_stage = grader::stage::PENDING;

    grader::compile_status compile = grader::compile_status::PENDING;

    /**
     * @brief 编译错误信息，编译失败或出现内部错误时有效
     */
    std::string compile_error;

    grader::status overall_status = grader::status::PENDING;

    /**
     * @brief 按评测顺序排列的测试点结果，公开测试点在前
     */
    std::vector<test_outcome> outcomes;

    score public_score;
    score hidden_score;

    /**
     * @brief 面向用户的附加信息，例如排队中的提示
     */
    std::string message;

    /**
     * @brief 评测是否已经完成
     */
    bool completed() const;

    /**
     * @brief 所有测试点的得分，total = public.total + hidden.total
     */
    score overall_score() const;

    /**
     * @brief 追加一个测试点结果并同步更新得分
     */
    void add_outcome(test_outcome outcome);

    /**
     * @brief 根据得分计算最终结果，并标记为评测完成
     */
    void finish();

    /**
     * @brief 标记为内部错误并标记为评测完成
     */
    void fail(const std::string &error);
};

/**
 * @brief 还没有开始评测的提交的占位报告
 */
report make_queued_report(const std::string &submission_id);

void to_json(nlohmann::json &j, const test_outcome &outcome);

/**
 * @brief 评测报告的 JSON 格式
 * @code{json}
 * {
 *   "submission_id": "1700000000000-1",
 *   "filename": "main.cpp",
 *   "status": "completed",        // processing, completed
 *   "stage": "completed",         // pending, compiling, running, completed
 *   "compile_status": "success",  // pending, success, error
 *   "compile_error": "",          // 仅当编译失败时存在
 *   "overall_status": "partial",  // pending, no_tests, success, partial, compile_error, internal_error
 *   "test_results": [
 *     {"type": "Public", "case": 1, "status": "PASS", "memory_used": 1024, "time_used": 0.01, "expected": "1", "got": "1"},
 *     {"type": "Hidden", "case": 1, "status": "FAIL", "memory_used": 0, "time_used": 5.0, "reason": "time limit exceeded"}
 *   ],
 *   "test_count": 2,
 *   "score": "1/2",
 *   "public_score": "1/1",
 *   "hidden_score": "0/1"
 * }
 * @endcode
 */
void to_json(nlohmann::json &j, const report &r);

}  // namespace grader
