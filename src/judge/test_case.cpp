#include "judge/test_case.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <map>
#include <regex>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const char *get_kind_string(test_case::kind_type kind) {
    return kind == test_case::kind_type::PUBLIC ? "Public" : "Hidden";
}

test_case_catalog::test_case_catalog(const fs::path &dir) : dir(dir) {}

vector<test_case> test_case_catalog::list_public() const {
    return list(test_case::kind_type::PUBLIC);
}

vector<test_case> test_case_catalog::list_hidden() const {
    return list(test_case::kind_type::HIDDEN);
}

const fs::path &test_case_catalog::directory() const {
    return dir;
}

vector<test_case> test_case_catalog::list(test_case::kind_type kind) const {
    static const regex matcher("^(public|hidden)-(input|output)-([0-9]+)(\\.txt)?$");
    const string prefix = kind == test_case::kind_type::PUBLIC ? "public" : "hidden";

    error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG(WARNING) << "Test case directory " << dir << " does not exist";
        return {};
    }

    // 以编号为键，map 保证了按编号升序
    map<int, test_case> cases;
    for (auto &entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;

        string filename = entry.path().filename().string();
        smatch matches;
        if (!regex_match(filename, matches, matcher) || matches[1].str() != prefix) continue;

        int ordinal;
        try {
            ordinal = boost::lexical_cast<int>(matches[3].str());
        } catch (boost::bad_lexical_cast &) {
            continue;  // 编号超出 int 范围
        }

        test_case &testcase = cases[ordinal];
        testcase.ordinal = ordinal;
        testcase.kind = kind;
        // 同一编号同时存在带 .txt 和不带扩展名的文件时，取字典序较小的文件名，保证结果确定
        fs::path &slot = matches[2].str() == "input" ? testcase.input : testcase.output;
        if (slot.empty() || entry.path() < slot) slot = entry.path();
    }

    vector<test_case> result;
    for (auto &[ordinal, testcase] : cases)
        if (!testcase.input.empty() && !testcase.output.empty())
            result.push_back(testcase);
    return result;
}

}  // namespace grader
