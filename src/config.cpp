#include "config.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

filesystem::path TESTCASE_DIR = "testcases";
filesystem::path RUN_DIR = "submissions";
bool DEBUG = false;

void from_json(const json &j, limits_policy &limits) {
    limits.compile_timeout = j.value("compile_timeout", limits.compile_timeout);
    limits.time_limit = j.value("time_limit", limits.time_limit);
    limits.memory_limit = j.value("memory_limit", limits.memory_limit);
    limits.max_source_size = j.value("max_source_size", limits.max_source_size);
    limits.output_limit = j.value("output_limit", limits.output_limit);
    limits.diagnostic_limit = j.value("diagnostic_limit", limits.diagnostic_limit);
    limits.compiler = j.value("compiler", limits.compiler);
    if (j.count("compiler_flags"))
        j.at("compiler_flags").get_to(limits.compiler_flags);
    validate(limits);
}

void validate(const limits_policy &limits) {
    // 非正数的时间限制会让 run_process 不限制运行时间
    if (!(limits.compile_timeout > 0))
        throw invalid_argument(fmt::format("compile_timeout must be positive, got {}", limits.compile_timeout));
    if (!(limits.time_limit > 0))
        throw invalid_argument(fmt::format("time_limit must be positive, got {}", limits.time_limit));
    if (limits.memory_limit <= 0)
        throw invalid_argument(fmt::format("memory_limit must be positive, got {}", limits.memory_limit));
    if (limits.max_source_size <= 0)
        throw invalid_argument(fmt::format("max_source_size must be positive, got {}", limits.max_source_size));
}

void to_json(json &j, const limits_policy &limits) {
    j = {{"compile_timeout", limits.compile_timeout},
         {"time_limit", limits.time_limit},
         {"memory_limit", limits.memory_limit},
         {"max_source_size", limits.max_source_size},
         {"output_limit", limits.output_limit},
         {"diagnostic_limit", limits.diagnostic_limit},
         {"compiler", limits.compiler},
         {"compiler_flags", limits.compiler_flags}};
}

limits_policy load_limits_policy(const filesystem::path &config_file) {
    limits_policy limits;
    json::parse(read_file_content(config_file)).get_to(limits);
    return limits;
}

}  // namespace grader
