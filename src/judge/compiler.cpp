#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/process.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

compiler::~compiler() {}

gcc_compiler::gcc_compiler(const limits_policy &limits) : limits(limits) {}

compile_result gcc_compiler::compile(const fs::path &source, const fs::path &artifact) const {
    compile_result result;

    fs::create_directories(artifact.parent_path());
    fs::remove(artifact);

    process_options opt;
    opt.command = {limits.compiler, fs::absolute(source).string(), "-o", fs::absolute(artifact).string()};
    opt.command.insert(opt.command.end(), limits.compiler_flags.begin(), limits.compiler_flags.end());
    opt.work_dir = artifact.parent_path();
    opt.wall_limit = limits.compile_timeout;
    opt.stream_size = limits.diagnostic_limit;
    opt.error_size = limits.diagnostic_limit;

    process_result ret;
    try {
        ret = run_process(opt);
    } catch (process_error &ex) {
        LOG(ERROR) << "Unable to run compiler " << limits.compiler << ": " << ex.what();
        result.diagnostic = fmt::format("unable to run compiler {}: {}", limits.compiler, ex.what());
        return result;
    }
    result.wall_time = ret.wall_time;

    if (ret.timed_out) {
        result.diagnostic = fmt::format("compilation timed out ({}s)", limits.compile_timeout);
    } else if (ret.exitcode != 0) {
        // 部分编译器把错误信息写到 stdout
        string log = ret.error.empty() ? ret.output : ret.error;
        result.diagnostic = truncate_text(log, limits.diagnostic_limit);
        if (ret.error_truncated) result.diagnostic += "\n... (truncated)";
        if (result.diagnostic.empty())
            result.diagnostic = fmt::format("compiler exited with code {}", ret.exitcode);
    } else if (!fs::exists(artifact)) {
        result.diagnostic = "compiler produced no executable";
    } else {
        result.ok = true;
        result.diagnostic = ret.error;  // warnings
    }
    return result;
}

}  // namespace grader
