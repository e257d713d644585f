#include "judge/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/io_utils.hpp"
#include "common/process.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static void fail(test_outcome &outcome, failure kind, const string &reason) {
    outcome.result = verdict::FAIL;
    outcome.failure_kind = kind;
    outcome.reason = reason;
}

static void run_impl(test_outcome &outcome, const fs::path &executable, const limits_policy &limits) {
    process_options opt;
    opt.command = {fs::absolute(executable).string()};
    opt.work_dir = executable.parent_path();
    opt.stdin_data = read_file_content(outcome.testcase.input);
    opt.wall_limit = limits.time_limit;
    opt.stream_size = limits.output_limit;
    opt.error_size = limits.diagnostic_limit;

    process_result ret = run_process(opt);
    outcome.run_time = ret.wall_time;
    outcome.memory_used = ret.memory;

    if (ret.timed_out) {
        // 超时的程序不计入内存，也不采用超时前的输出
        outcome.memory_used = 0;
        fail(outcome, failure::TIME_LIMIT_EXCEEDED, "time limit exceeded");
        return;
    }

    if (ret.memory > limits.memory_limit) {
        fail(outcome, failure::MEMORY_LIMIT_EXCEEDED, "memory limit exceeded");
        return;
    }

    if (ret.output_truncated) {
        fail(outcome, failure::OUTPUT_LIMIT_EXCEEDED, "output limit exceeded");
        return;
    }

    if (ret.exitcode != 0) {
        string reason = fmt::format("runtime error (exit code {})", ret.exitcode);
        if (ret.signal > 0)
            reason += fmt::format(", killed by signal {} ({})", ret.signal, strsignal(ret.signal));
        string error = truncate_text(ret.error, limits.diagnostic_limit);
        if (ret.error_truncated) error += "\n... (truncated)";
        if (!error.empty()) reason += ": " + error;
        fail(outcome, failure::RUNTIME_ERROR, reason);
        return;
    }

    outcome.result = verdict::PASS;
    outcome.failure_kind = failure::NONE;
    outcome.output = trim_right(ret.output);
}

test_outcome run_test_case(const test_case &testcase, const fs::path &executable, const limits_policy &limits) {
    test_outcome outcome;
    outcome.testcase = testcase;

    try {
        run_impl(outcome, executable, limits);
    } catch (exception &ex) {
        LOG(ERROR) << "Unexpected error when running " << get_kind_string(testcase.kind) << " test case " << testcase.ordinal
                   << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        outcome.memory_used = 0;
        fail(outcome, failure::INTERNAL_ERROR, string("Unexpected error: ") + ex.what());
    }
    return outcome;
}

}  // namespace grader
