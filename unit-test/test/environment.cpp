#include "test/environment.hpp"
#include <unistd.h>
#include <fstream>
#include <stdexcept>

using namespace std;
namespace fs = std::filesystem;

static fs::path test_root() {
    return fs::temp_directory_path() / ("grader-test-" + to_string(getpid()));
}

void setup_test_environment() {
    fs::remove_all(test_root());
    fs::create_directories(test_root() / "run");
    grader::RUN_DIR = test_root() / "run";
    grader::DEBUG = false;
}

void teardown_test_environment() {
    error_code ec;
    fs::remove_all(test_root(), ec);
}

fs::path make_scratch_dir(const string &name) {
    fs::path dir = test_root() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw runtime_error("unable to write " + path.string());
    fout << content;
}

void write_test_case(const fs::path &dir, const string &kind, int ordinal, const string &input, const string &output) {
    write_file(dir / (kind + "-input-" + to_string(ordinal)), input);
    write_file(dir / (kind + "-output-" + to_string(ordinal)), output);
}

grader::limits_policy test_limits() {
    grader::limits_policy limits;
    limits.compile_timeout = 60;
    limits.time_limit = 1;
    limits.memory_limit = 256 * 1024 * 1024;
    return limits;
}
