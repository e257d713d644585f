#include "judge/comparator.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace grader {
using namespace std;

bool compare(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

}  // namespace grader
