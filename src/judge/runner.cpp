#include "judge/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "judge/comparator.hpp"
#include "judge/harness.hpp"
#include "judge/output_parser.hpp"
#include "judge/security.hpp"

namespace grader {
using namespace std;

runner::~runner() = default;

python_runner::python_runner(const sandbox_config &config)
    : config(config) {}

string python_runner::language() const {
    return "python";
}

execution_evidence python_runner::run(const submission &submit) const {
    if (auto violation = screen(submit.code, config)) {
        LOG(WARNING) << "Submission for question " << submit.question_id << " blocked: " << *violation;
        return make_uniform_failure(submit, sentinel::BLOCKED, status::RESTRICT_FUNCTION, *violation);
    }

    auto interpreter = find_executable(config.python);
    if (!interpreter) {
        LOG(ERROR) << "Python interpreter " << config.python << " not found";
        return make_uniform_failure(submit, sentinel::ENV_ERROR, status::ENVIRONMENT_ERROR,
                                    fmt::format("Environment Error: {} interpreter not found in sandbox.", config.python));
    }

    launch_spec spec;
    spec.interpreter = interpreter->string();
    spec.suffix = ".py";
    spec.env = {{"PYTHONDONTWRITEBYTECODE", "1"},
                {"PYTHONIOENCODING", "utf-8"}};
    process_executor executor(config, move(spec));

    vector<test_case_result> results;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        auto result = judge_test_case(executor, submit.code, submit.test_cases[i]);
        LOG(INFO) << "Question " << submit.question_id << " test case #" << i << ": "
                  << get_display_message(result.outcome) << " in " << result.time_ms << "ms";
        results.push_back(move(result));
    }
    return summarize(submit, move(results));
}

test_case_result python_runner::judge_test_case(const process_executor &executor, const string &code, const test_case &tc) const {
    test_case_result result;
    result.input = display_string(tc.input);
    result.expected = display_string(tc.expected);

    try {
        string harness = build_harness(code, tc.input, config);
        run_result outcome = executor.run(harness, chrono::duration<double>(config.timeout_seconds));

        visit(overloaded{
                  [&](const process_output &output) {
                      result.time_ms = round2(output.elapsed_ms);
                      parsed_output parsed = parse_output(output, config);
                      result.error = parsed.error;

                      switch (parsed.type) {
                          case parsed_output::kind::RESULT:
                          case parsed_output::kind::MALFORMED: {
                              result.actual = display_string(parsed.actual);
                              grade_result g = grade(parsed.actual, tc.expected, config.similarity_length_limit);
                              // 无法解析时用原始输出评分，error 仍然保留为 "Output parsing error"
                              if (g.passed) {
                                  result.passed = true;
                                  result.outcome = status::ACCEPTED;
                                  break;
                              }
                              result.similarity_score = round2(g.similarity);
                              result.partial_credit = g.similarity >= PARTIAL_CREDIT_THRESHOLD;
                              if (parsed.type == parsed_output::kind::MALFORMED)
                                  result.outcome = status::OUTPUT_PARSE_ERROR;
                              else
                                  result.outcome = result.partial_credit ? status::PARTIAL_CORRECT : status::WRONG_ANSWER;
                              break;
                          }
                          case parsed_output::kind::EXCEPTION:
                              result.actual = sentinel::ERROR;
                              result.outcome = status::RUNTIME_ERROR;
                              break;
                          case parsed_output::kind::MEMORY_EXHAUSTED:
                              result.actual = sentinel::ERROR;
                              result.outcome = status::MEMORY_LIMIT_EXCEEDED;
                              break;
                      }
                  },
                  [&](const process_timeout &) {
                      LOG(WARNING) << "Test case timed out after " << config.timeout_seconds << "s";
                      result.actual = sentinel::TIMEOUT;
                      result.time_ms = round2(config.timeout_seconds * 1000);
                      result.error = fmt::format("Execution exceeded {}s time limit", config.timeout_seconds);
                      result.outcome = status::TIME_LIMIT_EXCEEDED;
                  },
                  [&](const launch_failure &failure) {
                      result.actual = sentinel::EXECUTION_ERROR;
                      result.time_ms = 0;
                      result.error = truncate_chars(failure.message, config.max_host_error_length);
                      result.outcome = status::SYSTEM_ERROR;
                  }},
              outcome);
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to judge test case: " << e.what();
        result = test_case_result();
        result.input = display_string(tc.input);
        result.expected = display_string(tc.expected);
        result.actual = sentinel::EXECUTION_ERROR;
        result.error = truncate_chars(e.what(), config.max_host_error_length);
        result.outcome = status::SYSTEM_ERROR;
    }
    return result;
}

toolchain_unavailable_runner::toolchain_unavailable_runner(string language, string compiler)
    : lang(move(language)), compiler(move(compiler)) {}

string toolchain_unavailable_runner::language() const {
    return lang;
}

execution_evidence toolchain_unavailable_runner::run(const submission &submit) const {
    LOG(WARNING) << "Compiler " << compiler << " for " << lang << " is not available";
    return make_uniform_failure(submit, sentinel::ENV_ERROR, status::ENVIRONMENT_ERROR,
                                fmt::format("Environment Error: {} compiler not found in sandbox.", compiler));
}

}  // namespace grader
