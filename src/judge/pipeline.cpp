#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/comparator.hpp"
#include "judge/runner.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

grading_pipeline::grading_pipeline(const limits_policy &limits, const compiler &comp, const test_case_catalog &catalog)
    : limits(limits), comp(comp), catalog(catalog) {}

/**
 * @brief 执行测试点并与标准输出比较
 */
static test_outcome judge_test_case(const test_case &testcase, const fs::path &executable, const limits_policy &limits) {
    test_outcome outcome = run_test_case(testcase, executable, limits);

    string expected;
    try {
        expected = read_file_content(testcase.output);
    } catch (process_error &ex) {
        LOG(ERROR) << "Unable to read expected output " << testcase.output << ": " << ex.what();
        outcome.result = verdict::FAIL;
        outcome.failure_kind = failure::INTERNAL_ERROR;
        outcome.reason = "Test case files not found";
        return outcome;
    }
    if (testcase.kind == test_case::kind_type::PUBLIC)
        outcome.expected = boost::algorithm::trim_copy(expected);

    if (outcome.result == verdict::PASS && !compare(outcome.output, expected)) {
        outcome.result = verdict::FAIL;
        outcome.failure_kind = failure::WRONG_ANSWER;
        outcome.reason = "wrong answer";
    }
    return outcome;
}

void grading_pipeline::grade_impl(report &r, const fs::path &source, const fs::path &workdir,
                                  const function<void(const report &)> &publish) const {
    fs::path executable = workdir / "compile" / "program";

    r.current_stage = stage::COMPILING;
    publish(r);

    compile_result compiled = comp.compile(source, executable);
    if (!compiled.ok) {
        LOG(WARNING) << "Submission " << r.submission_id << " failed to compile";
        r.compile = compile_status::ERROR;
        r.compile_error = compiled.diagnostic;
        r.overall_status = status::COMPILE_ERROR;
        r.current_stage = stage::COMPLETED;
        return;
    }

    r.compile = compile_status::SUCCESS;
    r.current_stage = stage::RUNNING;
    publish(r);

    vector<test_case> public_cases = catalog.list_public();
    vector<test_case> hidden_cases = catalog.list_hidden();
    if (public_cases.empty() && hidden_cases.empty())
        LOG(WARNING) << "No test cases found in " << catalog.directory() << " for submission " << r.submission_id;

    // 公开测试点全部完成后再评测隐藏测试点
    for (auto *cases : {&public_cases, &hidden_cases}) {
        for (auto &testcase : *cases) {
            test_outcome outcome = judge_test_case(testcase, executable, limits);
            LOG(INFO) << "Submission " << r.submission_id << " " << get_kind_string(testcase.kind) << " test case " << testcase.ordinal
                      << ": " << get_verdict_string(outcome.result)
                      << (outcome.reason.empty() ? "" : " (" + string(get_display_message(outcome.failure_kind)) + ")");
            r.add_outcome(move(outcome));
            publish(r);
        }
    }

    r.finish();
}

void grading_pipeline::grade(report &r, const fs::path &source, const fs::path &workdir,
                             const function<void(const report &)> &publish) const {
    try {
        grade_impl(r, source, workdir, publish);
    } catch (grader_exception &ex) {
        LOG(ERROR) << "Error grading submission " << r.submission_id << ": " << ex.what() << endl
                   << ex;
        r.fail(ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "Error grading submission " << r.submission_id << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        r.fail(ex.what());
    }

    if (!DEBUG) {
        error_code ec;
        fs::remove_all(workdir, ec);
        if (ec) LOG(WARNING) << "Unable to remove " << workdir << ": " << ec.message();
    }

    LOG(INFO) << "Submission " << r.submission_id << " finished: " << get_display_message(r.overall_status)
              << " " << r.overall_score().str();
    publish(r);
}

}  // namespace grader
