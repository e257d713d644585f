#include "gtest/gtest.h"
#include "judge/test_case.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

TEST(TestCaseCatalogTest, OrderingTest) {
    auto dir = make_scratch_dir("catalog-ordering");
    write_test_case(dir, "public", 10, "", "");
    write_test_case(dir, "public", 2, "", "");
    write_test_case(dir, "public", 1, "", "");
    write_test_case(dir, "hidden", 3, "", "");

    test_case_catalog catalog(dir);
    auto cases = catalog.list_public();
    ASSERT_EQ(cases.size(), 3u);
    // 按数值升序，而不是字典序
    EXPECT_EQ(cases[0].ordinal, 1);
    EXPECT_EQ(cases[1].ordinal, 2);
    EXPECT_EQ(cases[2].ordinal, 10);
    for (auto &testcase : cases) EXPECT_EQ(testcase.kind, test_case::kind_type::PUBLIC);
    EXPECT_EQ(cases[2].input, dir / "public-input-10");
    EXPECT_EQ(cases[2].output, dir / "public-output-10");

    auto hidden = catalog.list_hidden();
    ASSERT_EQ(hidden.size(), 1u);
    EXPECT_EQ(hidden[0].ordinal, 3);
    EXPECT_EQ(hidden[0].kind, test_case::kind_type::HIDDEN);
}

TEST(TestCaseCatalogTest, IncompletePairTest) {
    auto dir = make_scratch_dir("catalog-incomplete");
    write_test_case(dir, "public", 1, "", "");
    write_file(dir / "public-input-2", "");
    write_file(dir / "hidden-output-1", "");

    test_case_catalog catalog(dir);
    auto cases = catalog.list_public();
    ASSERT_EQ(cases.size(), 1u);
    EXPECT_EQ(cases[0].ordinal, 1);
    EXPECT_TRUE(catalog.list_hidden().empty());
}

TEST(TestCaseCatalogTest, TxtExtensionTest) {
    auto dir = make_scratch_dir("catalog-txt");
    write_file(dir / "public-input-1.txt", "");
    write_file(dir / "public-output-1.txt", "");

    test_case_catalog catalog(dir);
    auto cases = catalog.list_public();
    ASSERT_EQ(cases.size(), 1u);
    EXPECT_EQ(cases[0].input, dir / "public-input-1.txt");
}

TEST(TestCaseCatalogTest, IgnoreUnrelatedFilesTest) {
    auto dir = make_scratch_dir("catalog-unrelated");
    write_test_case(dir, "public", 1, "", "");
    write_file(dir / "README.md", "");
    write_file(dir / "public-input-x", "");
    write_file(dir / "public-output-x", "");
    write_file(dir / "Public-input-2", "");
    write_file(dir / "Public-output-2", "");
    write_file(dir / "public-input-3.in", "");
    write_file(dir / "public-output-3.in", "");
    create_directories(dir / "public-input-4");
    write_file(dir / "public-output-4", "");

    test_case_catalog catalog(dir);
    auto cases = catalog.list_public();
    ASSERT_EQ(cases.size(), 1u);
    EXPECT_EQ(cases[0].ordinal, 1);
}

TEST(TestCaseCatalogTest, MissingDirectoryTest) {
    auto dir = make_scratch_dir("catalog-missing");
    test_case_catalog catalog(dir / "nonexistent");
    EXPECT_EQ(catalog.directory(), dir / "nonexistent");
    EXPECT_TRUE(catalog.list_public().empty());
    EXPECT_TRUE(catalog.list_hidden().empty());
}

TEST(TestCaseCatalogTest, StableOrderTest) {
    auto dir = make_scratch_dir("catalog-stable");
    for (int i = 1; i <= 20; ++i) write_test_case(dir, "hidden", i, "", "");

    test_case_catalog catalog(dir);
    auto first = catalog.list_hidden();
    auto second = catalog.list_hidden();
    ASSERT_EQ(first.size(), 20u);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].ordinal, (int)i + 1);
        EXPECT_EQ(first[i].input, second[i].input);
    }
}
