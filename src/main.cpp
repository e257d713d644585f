#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/compiler.hpp"
#include "judge/pipeline.hpp"
#include "judge/test_case.hpp"
#include "results_store.hpp"
#include "worker.hpp"
using namespace std;

static volatile sig_atomic_t interrupted = 0;

void sigintHandler(int /* signum */) {
    interrupted = 1;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("source", po::value<vector<string>>(), "source files to be graded, can also be given as positional arguments")
        ("testcase-dir", po::value<string>(), "set the directory containing {public|hidden}-{input|output}-N test data. You can either pass it from environ TESTCASEDIR")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs in. You can either pass it from environ RUNDIR")
        ("config", po::value<string>(), "load limits policy from the given JSON file")
        ("workers", po::value<size_t>(), "set the number of workers grading submissions concurrently, default to the number of cores")
        ("compile-timeout", po::value<double>(), "set compilation time limit in seconds, default to 30")
        ("time-limit", po::value<double>(), "set wall time limit of each test case in seconds, default to 5")
        ("memory-limit", po::value<int64_t>(), "set memory limit in KB, default to 262144(256MB)")
        ("max-source-size", po::value<int64_t>(), "set the maximum size of source files in KB, default to 1024(1MB)")
        ("poll-interval", po::value<unsigned>()->default_value(100), "set the interval in milliseconds to poll grading status")
        ("debug", "turn on the debug mode not to delete submission directories to check the validity of result files. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("source", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: compile submissions, run them against test cases and report results" << endl
             << "Usage: " << argv[0] << " [options] <source>..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    if (vm.count("testcase-dir")) {
        grader::TESTCASE_DIR = filesystem::path(vm.at("testcase-dir").as<string>());
    } else if (getenv("TESTCASEDIR")) {
        grader::TESTCASE_DIR = filesystem::path(getenv("TESTCASEDIR"));
    }
    if (!filesystem::is_directory(grader::TESTCASE_DIR))
        LOG(WARNING) << "Test case directory " << grader::TESTCASE_DIR << " does not exist, every submission will have no tests";

    grader::RUN_DIR = filesystem::path(get_env("RUNDIR", grader::RUN_DIR.string()));
    if (vm.count("run-dir")) {
        grader::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    }
    filesystem::create_directories(grader::RUN_DIR);
    CHECK(filesystem::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";

    grader::limits_policy limits;
    if (vm.count("config")) {
        string config = vm.at("config").as<string>();
        CHECK(filesystem::is_regular_file(config))
            << "Configuration file " << config << " does not exist";
        try {
            limits = grader::load_limits_policy(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config << " is malformed: " << e.what();
        }
    }

    if (vm.count("compile-timeout")) limits.compile_timeout = vm["compile-timeout"].as<double>();
    if (vm.count("time-limit")) limits.time_limit = vm["time-limit"].as<double>();
    if (vm.count("memory-limit")) limits.memory_limit = vm["memory-limit"].as<int64_t>() * 1024;
    if (vm.count("max-source-size")) limits.max_source_size = vm["max-source-size"].as<int64_t>() * 1024;
    try {
        grader::validate(limits);
    } catch (std::invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    size_t workers = thread::hardware_concurrency();
    if (vm.count("workers")) workers = vm["workers"].as<size_t>();

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    // limits 在 worker 启动后不再修改
    const grader::limits_policy& policy = limits;
    grader::gcc_compiler compiler(policy);
    grader::test_case_catalog catalog(grader::TESTCASE_DIR);
    grader::grading_pipeline pipeline(policy, compiler, catalog);
    grader::results_store store;
    grader::worker_pool workers_pool(workers, policy, pipeline, store);
    signal(SIGINT, sigintHandler);

    vector<string> submission_ids;
    if (vm.count("source")) {
        for (auto& source : vm["source"].as<vector<string>>()) {
            try {
                submission_ids.push_back(workers_pool.submit(source));
            } catch (grader::invalid_submission& e) {
                cerr << source << ": " << e.what() << endl;
            }
        }
    }

    auto poll_interval = chrono::milliseconds(vm["poll-interval"].as<unsigned>());
    bool all_success = !submission_ids.empty();
    for (auto& id : submission_ids) {
        grader::report r = workers_pool.poll_status(id);
        while (!r.completed()) {
            // 收到 SIGINT 后只关闭队列，worker 评测完已入队的提交后退出
            if (interrupted) workers_pool.stop();
            this_thread::sleep_for(poll_interval);
            r = workers_pool.poll_status(id);
        }
        nlohmann::json j = r;
        cout << j.dump(2) << endl;
        if (r.overall_status != grader::status::SUCCESS) all_success = false;
    }

    workers_pool.stop();
    workers_pool.join();

    return all_success ? EXIT_SUCCESS : EXIT_FAILURE;
}
