#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::PARTIAL_CORRECT, "Partial Correct")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::OUTPUT_PARSE_ERROR, "Output Parse Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::SYSTEM_ERROR, "System Error")
    (status::ENVIRONMENT_ERROR, "Environment Error")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::RESTRICT_FUNCTION, "Restrict Function");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::ACCEPTED, "ACCEPTED")
    (status::PARTIAL_CORRECT, "PARTIAL_CORRECT")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (status::OUTPUT_PARSE_ERROR, "OUTPUT_PARSE_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::SYSTEM_ERROR, "SYSTEM_ERROR")
    (status::ENVIRONMENT_ERROR, "ENVIRONMENT_ERROR")
    (status::UNSUPPORTED_LANGUAGE, "UNSUPPORTED_LANGUAGE")
    (status::RESTRICT_FUNCTION, "RESTRICT_FUNCTION");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

}  // namespace grader
