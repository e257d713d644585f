#include "common/io_utils.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include <cerrno>
#include <fstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw process_error(errno, "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string truncate_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + fmt::format("\n... ({} bytes truncated)", text.size() - limit);
}

string trim_right(const string &text) {
    return boost::algorithm::trim_right_copy(text);
}

}  // namespace grader
