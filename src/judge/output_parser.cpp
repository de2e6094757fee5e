#include "judge/output_parser.hpp"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cstring>
#include <limits>
#include <vector>
#include "common/utils.hpp"
#include "judge/harness.hpp"

namespace grader {
using namespace std;

const char *const OUTPUT_PARSING_ERROR = "Output parsing error";
const char *const UNKNOWN_ERROR = "Unknown error";

// json.dumps 会输出 NaN、Infinity、-Infinity，它们不是合法的 JSON，
// 解析前先替换为带前缀的字符串，解析后再还原为浮点数
static const string NON_FINITE_MARKER = string(1, '\0') + "grader:";

static const pair<const char *, double> NON_FINITE_TOKENS[] = {
    {"-Infinity", -numeric_limits<double>::infinity()},
    {"Infinity", numeric_limits<double>::infinity()},
    {"NaN", numeric_limits<double>::quiet_NaN()}};

static string quote_non_finite(const string &line) {
    string result;
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (in_string) {
            result += ch;
            if (ch == '\\' && i + 1 < line.size()) result += line[++i];
            else if (ch == '"') in_string = false;
            continue;
        }
        if (ch == '"') {
            in_string = true;
            result += ch;
            continue;
        }

        bool replaced = false;
        for (auto &token : NON_FINITE_TOKENS) {
            size_t len = strlen(token.first);
            if (line.compare(i, len, token.first) == 0) {
                result += "\"\\u0000grader:" + string(token.first) + "\"";
                i += len - 1;
                replaced = true;
                break;
            }
        }
        if (!replaced) result += ch;
    }
    return result;
}

static void restore_non_finite(value &v) {
    if (v.is_string()) {
        const string &s = v.get_ref<const string &>();
        if (s.compare(0, NON_FINITE_MARKER.size(), NON_FINITE_MARKER) != 0) return;
        string token = s.substr(NON_FINITE_MARKER.size());
        for (auto &[name, number] : NON_FINITE_TOKENS) {
            if (token == name) {
                v = number;
                return;
            }
        }
    } else if (v.is_array() || v.is_object()) {
        for (auto &item : v) restore_non_finite(item);
    }
}

/**
 * @brief 找到评测程序输出的结果行并解析
 * @return 解析得到的 JSON 对象，若最后一个非空行不是 JSON 对象则返回空
 */
static optional<value> parse_result_line(const string &stdout_text) {
    vector<string> lines;
    boost::split(lines, stdout_text, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = trim(*it);
        if (line.empty()) continue;

        value j = value::parse(quote_non_finite(line), nullptr, false);
        if (j.is_discarded() || !j.is_object()) return nullopt;
        restore_non_finite(j);
        return j;
    }
    return nullopt;
}

parsed_output parse_output(const process_output &output, const sandbox_config &config) {
    parsed_output result;
    auto line = parse_result_line(output.stdout_text);

    if (output.exit_code == E_SUCCESS) {
        if (line && line->contains("result")) {
            result.type = parsed_output::kind::RESULT;
            result.actual = line->at("result");
        } else if (line && line->contains("error") && line->at("error").is_string()) {
            result.type = parsed_output::kind::EXCEPTION;
            result.actual = "ERROR";
            result.error = truncate_chars(line->at("error").get<string>(), config.max_error_length);
        } else {
            result.type = parsed_output::kind::MALFORMED;
            result.actual = truncate_chars(trim(output.stdout_text), config.max_output_length);
            result.error = OUTPUT_PARSING_ERROR;
        }
        return result;
    }

    result.type = output.exit_code == E_MEMORY_EXHAUSTED ? parsed_output::kind::MEMORY_EXHAUSTED : parsed_output::kind::EXCEPTION;
    result.actual = "ERROR";

    string stderr_text = trim(output.stderr_text);
    if (!stderr_text.empty()) {
        result.error = truncate_chars(stderr_text, config.max_error_length);
    } else if (line && line->contains("error") && line->at("error").is_string()) {
        result.error = truncate_chars(line->at("error").get<string>(), config.max_error_length);
    } else {
        result.error = UNKNOWN_ERROR;
    }
    return result;
}

}  // namespace grader
