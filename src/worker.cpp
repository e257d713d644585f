#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include <set>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const set<string> allowed_extensions = {".cpp", ".cc", ".cxx"};

string generate_submission_id() {
    static atomic<unsigned> sequence{0};
    auto now = chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch());
    return fmt::format("{}-{}", now.count(), ++sequence);
}

worker_pool::worker_pool(size_t workers, const limits_policy &limits, const grading_pipeline &pipeline, results_store &store)
    : limits(limits), pipeline(pipeline), store(store) {
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
}

worker_pool::~worker_pool() {
    stop();
    join();
}

string worker_pool::submit(const fs::path &source) {
    string extension = boost::algorithm::to_lower_copy(source.extension().string());
    if (!allowed_extensions.count(extension))
        throw invalid_submission("Invalid file type. Only .cpp, .cc, and .cxx files are allowed.");

    error_code ec;
    auto size = fs::file_size(source, ec);
    if (ec)
        throw invalid_submission("Unable to read " + source.string() + ": " + ec.message());
    if ((int64_t)size > limits.max_source_size)
        throw invalid_submission(fmt::format("File too large: {} bytes, at most {} bytes allowed", size, limits.max_source_size));

    report r;
    r.submission_id = generate_submission_id();
    r.filename = source.filename().string();
    if (!store.create(r))
        throw internal_error("duplicated submission id " + r.submission_id);

    if (!job_queue.push({r.submission_id, source})) {
        r.fail("grading service has stopped");
        store.publish(r);
        throw invalid_submission("grading service has stopped");
    }

    LOG(INFO) << "Submission " << r.submission_id << " (" << r.filename << ") queued for grading";
    return r.submission_id;
}

report worker_pool::poll_status(const string &submission_id) const {
    if (auto snapshot = store.snapshot(submission_id))
        return *snapshot;
    return make_queued_report(submission_id);
}

void worker_pool::stop() {
    job_queue.close();
}

void worker_pool::join() {
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

void worker_pool::process(size_t worker_id, const grading_job &job) {
    report r;
    r.submission_id = job.submission_id;
    r.filename = job.source.filename().string();

    try {
        pipeline.grade(r, job.source, RUN_DIR / job.submission_id, [this](const report &snapshot) {
            store.publish(snapshot);
        });
        return;
    } catch (exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when grading submission " << job.submission_id << ", " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        if (!r.completed()) r.fail(ex.what());
    } catch (...) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when grading submission " << job.submission_id << " with unknown exception";
        if (!r.completed()) r.fail("unknown error");
    }

    // 评测失败也必须让报告进入评测完成状态，避免客户端无限轮询
    try {
        if (auto snapshot = store.snapshot(job.submission_id); snapshot && snapshot->completed()) return;
        store.publish(r);
    } catch (exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " is unable to publish report of submission " << job.submission_id << ": " << ex.what();
    }
}

void worker_pool::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    grading_job job;
    while (job_queue.pop(job)) {
        LOG(INFO) << "Worker " << worker_id << " grading submission " << job.submission_id;
        process(worker_id, job);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace grader
