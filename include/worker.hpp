#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "judge/pipeline.hpp"
#include "judge/report.hpp"
#include "results_store.hpp"

/**
 * 评测服务相关函数
 *
 * 提交入口调用 submit 生成 submission id，在 results_store 中创建初始报告，
 * 然后将评测任务放入 job_queue。
 *
 * 每个 worker 线程阻塞在 job_queue 上，取到评测任务后独占该提交，
 * 完整地执行 grading_pipeline 直到评测完成，再取下一个提交。
 * 一个提交只会被一个 worker 评测，不同提交之间没有先后顺序保证。
 */
namespace grader {

/**
 * @brief 评测队列中的任务
 */
struct grading_job {
    std::string submission_id;

    /**
     * @brief 选手代码路径，由提交入口保存到稳定的位置
     */
    std::filesystem::path source;
};

struct worker_pool {
    /**
     * @brief 启动评测 worker 线程
     * @param workers worker 数量，为 0 时视为 1
     * @param limits 评测限制，用于检查提交的代码大小
     * @param pipeline 评测流程，所有 worker 共享（只读）
     * @param store 评测结果存储
     */
    worker_pool(std::size_t workers, const limits_policy &limits, const grading_pipeline &pipeline, results_store &store);

    /**
     * @brief 停止并等待所有 worker 结束
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 提交一份代码进行评测
     * 检查代码文件的扩展名（.cpp、.cc、.cxx）和大小，创建初始报告并加入评测队列。
     * @param source 选手代码路径
     * @return 新的 submission id
     * @throw invalid_submission 代码文件不合法，或者 worker 已经停止
     */
    std::string submit(const std::filesystem::path &source);

    /**
     * @brief 查询提交的评测报告
     * 尚未被 worker 处理（或者未知）的提交返回"排队中"的占位报告，而不是错误
     */
    report poll_status(const std::string &submission_id) const;

    /**
     * @brief 停止 worker
     * 调用后不再接受新提交，worker 在评测完队列中剩余的提交后退出。
     * 可以重复调用。
     */
    void stop();

    /**
     * @brief 等待所有 worker 线程退出，需要先调用 stop
     */
    void join();

private:
    void worker_loop(std::size_t worker_id);

    void process(std::size_t worker_id, const grading_job &job);

    const limits_policy &limits;
    const grading_pipeline &pipeline;
    results_store &store;
    concurrent_queue<grading_job> job_queue;
    std::vector<std::thread> threads;
};

/**
 * @brief 生成唯一的 submission id
 * 格式为 "<毫秒时间戳>-<进程内自增序号>"，多个线程同时调用也不会重复
 */
std::string generate_submission_id();

}  // namespace grader
