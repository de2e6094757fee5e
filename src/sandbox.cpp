#include "sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/utils.hpp"

namespace grader {
using namespace std;

code_sandbox::code_sandbox(sandbox_config config)
    : cfg(move(config)) {
    register_runner(make_unique<python_runner>(cfg));
    register_runner(make_unique<toolchain_unavailable_runner>("java", "javac"));
    register_runner(make_unique<toolchain_unavailable_runner>("cpp", "g++"));
}

void code_sandbox::register_runner(unique_ptr<runner> &&r) {
    string language = r->language();
    runners[language] = move(r);
}

execution_evidence code_sandbox::execute(const string &code,
                                         const string &language,
                                         const vector<test_case> &test_cases,
                                         const string &question_id,
                                         const string &question_title) const {
    submission submit;
    submit.question_id = question_id;
    submit.question_title = question_title;
    submit.language = to_lower(language);
    submit.code = code;
    submit.test_cases = test_cases;

    LOG(INFO) << "Executing " << submit.language << " submission for question " << question_id
              << " with " << test_cases.size() << " test cases";

    auto it = runners.find(submit.language);
    if (it == runners.end()) {
        LOG(WARNING) << "Unsupported language " << submit.language;
        return make_uniform_failure(submit, sentinel::UNSUPPORTED, status::UNSUPPORTED_LANGUAGE,
                                    fmt::format("Error: Language '{}' is not supported by the sandbox.", submit.language));
    }

    try {
        execution_evidence evidence = it->second->run(submit);
        LOG(INFO) << "Question " << question_id << " finished with pass rate " << evidence.pass_rate << "%";
        return evidence;
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to execute submission for question " << question_id << ": " << e.what();
        return make_uniform_failure(submit, sentinel::EXECUTION_ERROR, status::SYSTEM_ERROR,
                                    truncate_chars(e.what(), cfg.max_host_error_length));
    }
}

vector<string> code_sandbox::languages() const {
    vector<string> result;
    for (auto &[language, r] : runners)
        result.push_back(language);
    return result;
}

const sandbox_config &code_sandbox::config() const {
    return cfg;
}

}  // namespace grader
