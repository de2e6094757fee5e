#include "judge/comparator.hpp"
#include <boost/locale/encoding_utf.hpp>
#include <algorithm>
#include <cmath>
#include <vector>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

static string normalize(const value &v) {
    return trim(display_string(v));
}

bool outputs_match(const value &actual, const value &expected) {
    if (values_equal(actual, expected))
        return true;

    if (normalize(actual) == normalize(expected))
        return true;

    auto a = numeric_value(actual), e = numeric_value(expected);
    if (a && e && *a == *e)
        return true;

    // 以上规则都不成立时，布尔值和列表不再做宽松的比较
    if (expected.is_boolean() || (expected.is_array() && actual.is_array()))
        return values_equal(actual, expected);

    return false;
}

size_t edit_distance(const u32string &s1, const u32string &s2) {
    size_t len1 = s1.size(), len2 = s2.size();
    // 滚动数组，只保留上一行
    vector<size_t> prev(len2 + 1), cur(len2 + 1);
    for (size_t j = 0; j <= len2; ++j) prev[j] = j;

    for (size_t i = 1; i <= len1; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= len2; ++j)
            cur[j] = min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + (s1[i - 1] == s2[j - 1] ? 0 : 1)});
        swap(prev, cur);
    }
    return prev[len2];
}

/**
 * @brief 根据两个数的相对误差给出相似度的下限
 */
static double numeric_floor(double actual, double expected) {
    if (expected == 0 || !std::isfinite(actual) || !std::isfinite(expected))
        return 0;

    double rel = std::fabs(actual - expected) / std::fabs(expected);
    if (rel < 0.01) return 95;
    if (rel < 0.05) return 75;
    if (rel < 0.10) return 50;
    return 0;
}

double similarity_score(const value &actual, const value &expected, size_t length_limit) {
    string a = normalize(actual), e = normalize(expected);
    if (a == e) return 100;
    if (a.empty() || e.empty()) return 0;

    u32string ua = boost::locale::conv::utf_to_utf<char32_t>(a);
    u32string ue = boost::locale::conv::utf_to_utf<char32_t>(e);

    double similarity = 0;
    if (ua.size() <= length_limit && ue.size() <= length_limit) {
        size_t max_len = max(ua.size(), ue.size());
        similarity = (max_len - edit_distance(ua, ue)) * 100.0 / max_len;
    }

    auto na = parse_number(a), ne = parse_number(e);
    if (na && ne)
        similarity = max(similarity, numeric_floor(*na, *ne));

    return similarity;
}

grade_result grade(const value &actual, const value &expected, size_t length_limit) {
    grade_result result;
    if (outputs_match(actual, expected)) {
        result.passed = true;
        result.similarity = 100;
        return result;
    }

    result.similarity = similarity_score(actual, expected, length_limit);
    result.partial_credit = result.similarity >= PARTIAL_CREDIT_THRESHOLD;
    return result;
}

}  // namespace grader
