#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <system_error>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

process_error::process_error(int err, const string &message)
    : grader_exception(message + ": " + system_category().message(err)), err(err) {}

int process_error::error_code() const noexcept {
    return err;
}

invalid_submission::invalid_submission(const string &message)
    : grader_exception(message) {}

}  // namespace grader
