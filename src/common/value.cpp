#include "common/value.hpp"
#include <fmt/core.h>
#include <cmath>
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

static bool is_numeric(const value &v) {
    return v.is_number_integer() || v.is_number_float();
}

// 布尔值按整数参与比较，True == 1，False == 0.0
static bool is_number_like(const value &v) {
    return is_numeric(v) || v.is_boolean();
}

static value promote_bool(const value &v) {
    if (v.is_boolean()) return value(v.get<bool>() ? 1 : 0);
    return v;
}

static bool numbers_equal(const value &a, const value &b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        if (a.is_number_unsigned() && b.is_number_unsigned())
            return a.get<uint64_t>() == b.get<uint64_t>();
        if (a.is_number_unsigned() || b.is_number_unsigned()) {
            const value &u = a.is_number_unsigned() ? a : b;
            const value &s = a.is_number_unsigned() ? b : a;
            int64_t signed_value = s.get<int64_t>();
            return signed_value >= 0 && static_cast<uint64_t>(signed_value) == u.get<uint64_t>();
        }
        return a.get<int64_t>() == b.get<int64_t>();
    }
    return a.get<double>() == b.get<double>();
}

bool values_equal(const value &a, const value &b) {
    if (is_number_like(a) && is_number_like(b) && !(a.is_boolean() && b.is_boolean()))
        return numbers_equal(promote_bool(a), promote_bool(b));
    if (a.type() != b.type())
        return false;

    switch (a.type()) {
        case value::value_t::null:
            return true;
        case value::value_t::boolean:
            return a.get<bool>() == b.get<bool>();
        case value::value_t::string:
            return a.get_ref<const string &>() == b.get_ref<const string &>();
        case value::value_t::array:
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i)
                if (!values_equal(a[i], b[i])) return false;
            return true;
        case value::value_t::object:
            if (a.size() != b.size()) return false;
            for (auto &[key, item] : a.items()) {
                auto it = b.find(key);
                if (it == b.end() || !values_equal(item, *it)) return false;
            }
            return true;
        default:
            return a == b;
    }
}

string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    string s = fmt::format("{}", d);
    if (s.find_first_of(".eE") == string::npos)
        s += ".0";
    return s;
}

string python_string_literal(const string &s) {
    // Python 优先使用单引号，仅当字符串中只有单引号时才用双引号
    char quote = '\'';
    if (s.find('\'') != string::npos && s.find('"') == string::npos)
        quote = '"';

    string result(1, quote);
    for (char ch : s) {
        unsigned char c = ch;
        switch (ch) {
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (ch == quote) {
                    result += '\\';
                    result += ch;
                } else if (c < 0x20 || c == 0x7f) {
                    result += fmt::format("\\x{:02x}", c);
                } else {
                    result += ch;
                }
        }
    }
    result += quote;
    return result;
}

/**
 * @brief 按 Python 的 repr() 规则输出值
 * @param literal 为真时输出可以被 Python 解释器直接求值的字面量
 */
static string repr(const value &v, bool literal) {
    switch (v.type()) {
        case value::value_t::null:
            return "None";
        case value::value_t::boolean:
            return v.get<bool>() ? "True" : "False";
        case value::value_t::number_integer:
            return to_string(v.get<int64_t>());
        case value::value_t::number_unsigned:
            return to_string(v.get<uint64_t>());
        case value::value_t::number_float: {
            double d = v.get<double>();
            if (literal && !std::isfinite(d))
                return fmt::format("float('{}')", format_float(d));
            return format_float(d);
        }
        case value::value_t::string:
            return python_string_literal(v.get_ref<const string &>());
        case value::value_t::array: {
            string result = "[";
            bool first = true;
            for (auto &item : v) {
                if (!first) result += ", ";
                first = false;
                result += repr(item, literal);
            }
            return result + "]";
        }
        case value::value_t::object: {
            string result = "{";
            bool first = true;
            for (auto &[key, item] : v.items()) {
                if (!first) result += ", ";
                first = false;
                result += python_string_literal(key) + ": " + repr(item, literal);
            }
            return result + "}";
        }
        default:
            return "None";
    }
}

string display_string(const value &v) {
    if (v.is_string()) return v.get<string>();
    return repr(v, false);
}

string python_literal(const value &v) {
    return repr(v, true);
}

optional<double> numeric_value(const value &v) {
    if (is_numeric(v)) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_string()) return parse_number(v.get_ref<const string &>());
    return nullopt;
}

}  // namespace grader
