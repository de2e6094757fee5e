#include "judge/evidence.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

void from_json(const value &j, test_case &tc) {
    if (!j.is_object() || !j.contains("input") || !j.contains("expected"))
        throw invalid_argument("Test case requires both \"input\" and \"expected\": " + j.dump());
    tc.input = j.at("input");
    tc.expected = j.at("expected");
}

void to_json(value &j, const test_case &tc) {
    j = {{"input", tc.input}, {"expected", tc.expected}};
}

void to_json(nlohmann::json &j, const test_case_result &result) {
    j = {{"input", result.input},
         {"expected", result.expected},
         {"actual", result.actual},
         {"passed", result.passed},
         {"time_ms", result.time_ms},
         {"status", get_status_name(result.outcome)}};
    if (result.error) j["error"] = *result.error;
    if (result.similarity_score) j["similarity_score"] = *result.similarity_score;
    j["partial_credit"] = result.partial_credit;
}

void to_json(nlohmann::json &j, const execution_evidence &evidence) {
    j = {{"question_id", evidence.question_id},
         {"question_title", evidence.question_title},
         {"language", evidence.language},
         {"submitted_code", evidence.submitted_code},
         {"test_cases", evidence.test_cases},
         {"pass_rate", evidence.pass_rate},
         {"avg_time_ms", evidence.avg_time_ms},
         {"total_tests", evidence.total_tests}};
    if (evidence.time_started) j["time_started"] = *evidence.time_started;
    if (evidence.time_submitted) j["time_submitted"] = *evidence.time_submitted;
    if (evidence.duration_seconds) j["duration_seconds"] = *evidence.duration_seconds;
}

execution_evidence summarize(const submission &submit, vector<test_case_result> results) {
    execution_evidence evidence;
    evidence.question_id = submit.question_id;
    evidence.question_title = submit.question_title;
    evidence.language = submit.language;
    evidence.submitted_code = submit.code;
    evidence.total_tests = results.size();

    if (!results.empty()) {
        double score = 0, total_time = 0;
        for (auto &result : results) {
            if (result.passed)
                score += 1;
            else if (result.partial_credit && result.similarity_score)
                score += *result.similarity_score / 100;
            total_time += result.time_ms;
        }
        evidence.pass_rate = round2(score / results.size() * 100);
        evidence.avg_time_ms = round2(total_time / results.size());
    }

    evidence.test_cases = move(results);
    return evidence;
}

execution_evidence make_uniform_failure(const submission &submit, const string &actual, status outcome, const string &error) {
    vector<test_case_result> results;
    for (auto &tc : submit.test_cases) {
        test_case_result result;
        result.input = display_string(tc.input);
        result.expected = display_string(tc.expected);
        result.actual = actual;
        result.passed = false;
        result.time_ms = 0;
        result.error = error;
        result.outcome = outcome;
        results.push_back(move(result));
    }
    return summarize(submit, move(results));
}

execution_evidence stamp_timing(execution_evidence evidence,
                                optional<string> time_started,
                                optional<string> time_submitted,
                                optional<long> duration_seconds) {
    evidence.time_started = move(time_started);
    evidence.time_submitted = move(time_submitted);
    evidence.duration_seconds = duration_seconds;
    return evidence;
}

}  // namespace grader
