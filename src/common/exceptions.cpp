#include "common/exceptions.hpp"

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
    os << ex.message << endl
       << *ex.stacktrace;
    return os;
}

launch_error::launch_error()
    : grader_exception() {}

launch_error::launch_error(const string &message)
    : grader_exception(message) {}

config_error::config_error()
    : grader_exception() {}

config_error::config_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
