#include <chrono>
#include <set>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"
#include "worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

static const char *a_plus_b = R"(#include <iostream>
int main() {
    long long a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
    return 0;
})";

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits = test_limits();
        string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        dir = make_scratch_dir("worker-" + name);
        create_directories(dir / "testcases");
        write_test_case(dir / "testcases", "public", 1, "1 2", "3");
        write_test_case(dir / "testcases", "hidden", 1, "20 22", "42");
    }

    report wait_for(const worker_pool &pool, const string &id) {
        auto deadline = chrono::steady_clock::now() + chrono::seconds(120);
        report r = pool.poll_status(id);
        while (!r.completed() && chrono::steady_clock::now() < deadline) {
            this_thread::sleep_for(chrono::milliseconds(20));
            r = pool.poll_status(id);
        }
        return r;
    }

    limits_policy limits;
    path dir;
};

TEST_F(WorkerPoolTest, IndependentSubmissionsTest) {
    write_file(dir / "bad.cpp", "int main() { return }");
    write_file(dir / "good.cpp", a_plus_b);

    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(2, limits, pipeline, store);

    string bad = pool.submit(dir / "bad.cpp");
    string good = pool.submit(dir / "good.cpp");
    EXPECT_NE(bad, good);

    report bad_report = wait_for(pool, bad);
    report good_report = wait_for(pool, good);

    ASSERT_TRUE(bad_report.completed());
    EXPECT_EQ(bad_report.filename, "bad.cpp");
    EXPECT_EQ(bad_report.overall_status, status::COMPILE_ERROR);
    EXPECT_TRUE(bad_report.outcomes.empty());

    ASSERT_TRUE(good_report.completed());
    EXPECT_EQ(good_report.filename, "good.cpp");
    EXPECT_EQ(good_report.overall_status, status::SUCCESS);
    EXPECT_EQ(good_report.overall_score().str(), "2/2");

    // 每个提交的工作目录在评测结束后被删除
    EXPECT_FALSE(exists(RUN_DIR / bad));
    EXPECT_FALSE(exists(RUN_DIR / good));
}

TEST_F(WorkerPoolTest, ManySubmissionsTest) {
    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(3, limits, pipeline, store);

    vector<string> ids;
    for (int i = 0; i < 6; ++i) {
        path source = dir / ("main" + to_string(i) + ".cpp");
        write_file(source, a_plus_b);
        ids.push_back(pool.submit(source));
    }
    for (auto &id : ids) {
        report r = wait_for(pool, id);
        ASSERT_TRUE(r.completed()) << id;
        EXPECT_EQ(r.overall_status, status::SUCCESS) << id << ": " << r.compile_error;
    }
    EXPECT_EQ(store.size(), ids.size());
}

TEST_F(WorkerPoolTest, UnknownSubmissionTest) {
    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(1, limits, pipeline, store);

    report r = pool.poll_status("nonexistent");
    EXPECT_FALSE(r.completed());
    EXPECT_EQ(r.submission_id, "nonexistent");
    EXPECT_EQ(r.current_stage, stage::PENDING);
    EXPECT_EQ(r.message, "Submission queued for processing");
}

TEST_F(WorkerPoolTest, InvalidSubmissionTest) {
    write_file(dir / "main.py", "print(1)");
    write_file(dir / "huge.cpp", string(2048, ' '));

    limits.max_source_size = 1024;
    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(1, limits, pipeline, store);

    EXPECT_THROW(pool.submit(dir / "main.py"), invalid_submission);
    EXPECT_THROW(pool.submit(dir / "huge.cpp"), invalid_submission);
    EXPECT_THROW(pool.submit(dir / "nonexistent.cpp"), invalid_submission);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(WorkerPoolTest, UppercaseExtensionTest) {
    write_file(dir / "MAIN.CPP", a_plus_b);

    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(1, limits, pipeline, store);

    string id = pool.submit(dir / "MAIN.CPP");
    EXPECT_EQ(pool.poll_status(id).filename, "MAIN.CPP");
    EXPECT_TRUE(wait_for(pool, id).completed());
}

TEST_F(WorkerPoolTest, StoppedPoolTest) {
    write_file(dir / "main.cpp", a_plus_b);

    gcc_compiler compiler(limits);
    test_case_catalog catalog(dir / "testcases");
    grading_pipeline pipeline(limits, compiler, catalog);
    results_store store;
    worker_pool pool(1, limits, pipeline, store);
    pool.stop();
    pool.join();

    EXPECT_THROW(pool.submit(dir / "main.cpp"), invalid_submission);
}

TEST(SubmissionIdTest, UniqueTest) {
    set<string> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(generate_submission_id());
    EXPECT_EQ(ids.size(), 1000u);
}
