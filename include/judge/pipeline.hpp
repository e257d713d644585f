#pragma once

#include <filesystem>
#include <functional>
#include "config.hpp"
#include "judge/compiler.hpp"
#include "judge/report.hpp"
#include "judge/test_case.hpp"

namespace grader {

/**
 * @brief 评测一个提交的完整流程
 *
 * 状态转移：PENDING -> COMPILING -> COMPILE_ERROR
 *                               -> RUNNING -> NO_TESTS | SUCCESS | PARTIAL
 * 任何阶段出现未预期的异常都会直接转为 INTERNAL_ERROR。
 * 无论结果如何，grade 返回时报告一定处于评测完成状态。
 */
struct grading_pipeline {
    grading_pipeline(const limits_policy &limits, const compiler &comp, const test_case_catalog &catalog);

    /**
     * @brief 评测一个提交
     * 先编译，然后依次运行所有公开测试点和隐藏测试点（均按编号升序）。
     * 每次状态变化或者完成一个测试点后调用 publish 发布报告的快照。
     * 评测结束后删除 workdir（DEBUG 模式下保留）。
     *
     * @param r 提交的报告，只有当前 worker 会修改它
     * @param source 选手代码
     * @param workdir 该提交独占的工作文件夹，编译产物保存在 workdir/compile/program
     * @param publish 发布报告快照的回调
     */
    void grade(report &r, const std::filesystem::path &source, const std::filesystem::path &workdir,
               const std::function<void(const report &)> &publish) const;

private:
    void grade_impl(report &r, const std::filesystem::path &source, const std::filesystem::path &workdir,
                    const std::function<void(const report &)> &publish) const;

    const limits_policy &limits;
    const compiler &comp;
    const test_case_catalog &catalog;
};

}  // namespace grader
