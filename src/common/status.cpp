#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_display = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::NO_TESTS, "No Tests")
    (status::SUCCESS, "Success")
    (status::PARTIAL, "Partial")
    (status::COMPILE_ERROR, "Compile Error")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "pending")
    (status::NO_TESTS, "no_tests")
    (status::SUCCESS, "success")
    (status::PARTIAL, "partial")
    (status::COMPILE_ERROR, "compile_error")
    (status::INTERNAL_ERROR, "internal_error");

static const unordered_map<stage, const char *> stage_string = boost::assign::map_list_of
    (stage::PENDING, "pending")
    (stage::COMPILING, "compiling")
    (stage::RUNNING, "running")
    (stage::COMPLETED, "completed");

static const unordered_map<compile_status, const char *> compile_status_string = boost::assign::map_list_of
    (compile_status::PENDING, "pending")
    (compile_status::SUCCESS, "success")
    (compile_status::ERROR, "error");

static const unordered_map<failure, const char *> failure_display = boost::assign::map_list_of
    (failure::NONE, "")
    (failure::TIME_LIMIT_EXCEEDED, "time limit exceeded")
    (failure::MEMORY_LIMIT_EXCEEDED, "memory limit exceeded")
    (failure::RUNTIME_ERROR, "runtime error")
    (failure::WRONG_ANSWER, "wrong answer")
    (failure::INTERNAL_ERROR, "internal error")
    (failure::OUTPUT_LIMIT_EXCEEDED, "output limit exceeded");
// clang-format on

const char *get_display_message(status stat) {
    return status_display.at(stat);
}

const char *get_status_string(status stat) {
    return status_string.at(stat);
}

const char *get_stage_string(stage s) {
    return stage_string.at(s);
}

const char *get_compile_status_string(compile_status stat) {
    return compile_status_string.at(stat);
}

const char *get_verdict_string(verdict v) {
    return v == verdict::PASS ? "PASS" : "FAIL";
}

const char *get_display_message(failure f) {
    return failure_display.at(f);
}

}  // namespace grader
