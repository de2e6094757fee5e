#include "judge/harness.hpp"
#include <fmt/core.h>

namespace grader {
using namespace std;

string build_harness(const string &candidate_source, const value &test_input, const sandbox_config &config) {
    string harness;

    // clang-format off
    harness += fmt::format(R"(
import json
import sys

def _grader_limit_resources():
    memory_limit = {} * 1024 * 1024
    try:
        import resource
        resource.setrlimit(resource.RLIMIT_AS, (memory_limit, memory_limit))
    except Exception:
        pass

_grader_limit_resources()

)", config.memory_limit_mb);

    harness += candidate_source;

    harness += fmt::format(R"(

if not callable(globals().get("{0}")):
    print(json.dumps({{"error": "NameError: entry point '{0}' is not defined"}}))
    sys.exit({1})

try:
    test_input = {2}
    result = {0}(test_input)
    print(json.dumps({{"result": result}}))
except MemoryError:
    print(json.dumps({{"error": "Memory limit exceeded"}}))
    sys.exit({3})
except Exception as e:
    print(json.dumps({{"error": f"{{type(e).__name__}}: {{str(e)}}"}}))
    sys.exit({1})
)", ENTRY_POINT, static_cast<int>(E_CANDIDATE_EXCEPTION), python_literal(test_input), static_cast<int>(E_MEMORY_EXHAUSTED));
    // clang-format on

    return harness;
}

}  // namespace grader
