#include "results_store.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

bool results_store::create(const report &r) {
    auto snapshot = make_shared<const report>(r);
    scoped_lock guard(mut);
    return reports.emplace(r.submission_id, move(snapshot)).second;
}

void results_store::publish(const report &r) {
    // 在锁外完成复制，锁内只替换指针
    auto snapshot = make_shared<const report>(r);
    scoped_lock guard(mut);
    auto &slot = reports[r.submission_id];
    if (slot && slot->completed())
        throw internal_error("report of submission " + r.submission_id + " is already completed");
    slot = move(snapshot);
}

optional<report> results_store::snapshot(const string &submission_id) const {
    shared_ptr<const report> snapshot;
    {
        scoped_lock guard(mut);
        auto it = reports.find(submission_id);
        if (it == reports.end()) return nullopt;
        snapshot = it->second;
    }
    return *snapshot;
}

size_t results_store::size() const {
    scoped_lock guard(mut);
    return reports.size();
}

}  // namespace grader
