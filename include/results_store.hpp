#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "judge/report.hpp"

namespace grader {

/**
 * @brief 进程内的评测结果存储，键为 submission id
 *
 * 并发约定：
 * 1. 每个键只有一个写者，即评测该提交的 worker（入队时由提交入口创建初始记录）；
 * 2. 读者可以有任意多个，随时调用 snapshot；
 * 3. 写者每次发布一份完整的报告副本，存储内部只保存不可变的快照，
 *    因此读者只会看到发布前或发布后的完整报告，不会看到和测试点列表不一致的得分。
 *
 * 数据只保存在内存中，进程重启后丢失。
 */
struct results_store {
    /**
     * @brief 创建提交的初始记录
     * @return false 若该 submission id 已经存在
     */
    bool create(const report &r);

    /**
     * @brief 发布提交报告的新快照，替换旧快照
     * 已经评测完成的报告不再允许被替换
     * @throw internal_error 若该提交已经评测完成
     */
    void publish(const report &r);

    /**
     * @brief 获取提交报告的当前快照
     * @return 快照的副本，提交不存在时为空
     */
    std::optional<report> snapshot(const std::string &submission_id) const;

    std::size_t size() const;

private:
    mutable std::mutex mut;
    std::map<std::string, std::shared_ptr<const report>> reports;
};

}  // namespace grader
