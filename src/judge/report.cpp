#include "judge/report.hpp"
#include <fmt/core.h>

namespace grader {
using namespace std;
using namespace nlohmann;

string score::str() const {
    return fmt::format("{}/{}", passed, total);
}

string score::str_or_na() const {
    return total == 0 ? "N/A" : str();
}

bool report::completed() const {
    return current_stage == stage::COMPLETED;
}

score report::overall_score() const {
    return {public_score.passed + hidden_score.passed, public_score.total + hidden_score.total};
}

void report::add_outcome(test_outcome outcome) {
    score &s = outcome.testcase.kind == test_case::kind_type::PUBLIC ? public_score : hidden_score;
    ++s.total;
    if (outcome.result == verdict::PASS) ++s.passed;
    outcomes.push_back(move(outcome));
}

void report::finish() {
    score total = overall_score();
    if (total.total == 0)
        overall_status = status::NO_TESTS;
    else if (total.passed == total.total)
        overall_status = status::SUCCESS;
    else
        overall_status = status::PARTIAL;
    current_stage = stage::COMPLETED;
}

void report::fail(const string &error) {
    if (compile == compile_status::PENDING) compile = compile_status::ERROR;
    compile_error = "Grading failed: " + error;
    overall_status = status::INTERNAL_ERROR;
    current_stage = stage::COMPLETED;
}

report make_queued_report(const string &submission_id) {
    report r;
    r.submission_id = submission_id;
    r.message = "Submission queued for processing";
    return r;
}

void to_json(json &j, const test_outcome &outcome) {
    j = {{"type", get_kind_string(outcome.testcase.kind)},
         {"case", outcome.testcase.ordinal},
         {"status", get_verdict_string(outcome.result)},
         {"memory_used", outcome.memory_used},
         {"time_used", outcome.run_time}};
    if (outcome.result != verdict::PASS)
        j["reason"] = outcome.reason;
    if (outcome.testcase.kind == test_case::kind_type::PUBLIC) {
        j["expected"] = outcome.expected;
        j["got"] = outcome.output;
    }
}

void to_json(json &j, const report &r) {
    j = {{"submission_id", r.submission_id},
         {"filename", r.filename},
         {"status", r.completed() ? "completed" : "processing"},
         {"stage", get_stage_string(r.current_stage)},
         {"compile_status", get_compile_status_string(r.compile)},
         {"overall_status", get_status_string(r.overall_status)},
         {"test_results", r.outcomes},
         {"test_count", r.outcomes.size()}};
    if (!r.compile_error.empty())
        j["compile_error"] = r.compile_error;
    if (!r.message.empty())
        j["message"] = r.message;
    if (r.completed()) {
        j["score"] = r.overall_score().str();
        j["public_score"] = r.public_score.str_or_na();
        j["hidden_score"] = r.hidden_score.str_or_na();
    }
}

}  // namespace grader
