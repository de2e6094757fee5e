#include "judge/security.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/utils.hpp"

namespace grader {
using namespace std;

optional<string> screen(const string &source, const sandbox_config &config) {
    string code = to_lower(source);

    for (auto &banned : config.banned_modules) {
        string module = to_lower(banned);
        const string patterns[] = {
            "import " + module,
            "from " + module,
            "__import__('" + module + "'",
            "__import__(\"" + module + "\""};
        for (auto &pattern : patterns) {
            if (code.find(pattern) != string::npos)
                return fmt::format("Restricted module detected: {}", banned);
        }
    }

    for (auto &call : config.dangerous_calls) {
        if (code.find(to_lower(call)) != string::npos)
            return fmt::format("Restricted function detected: {}", boost::algorithm::trim_right_copy_if(call, [](char c) { return c == '('; }));
    }

    return nullopt;
}

}  // namespace grader
