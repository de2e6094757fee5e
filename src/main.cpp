#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "question_bank.hpp"
#include "sandbox.hpp"
using namespace std;

static const char* DEMO_SOLUTION = R"(
def solution(n):
    if n <= 1:
        return n
    a, b = 0, 1
    for _ in range(2, n + 1):
        a, b = b, a + b
    return b
)";

static string read_code(const string& source) {
    if (source == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    CHECK(filesystem::is_regular_file(source))
        << "Source file " << source << " does not exist";
    return grader::read_file_content(filesystem::path(source));
}

static vector<grader::test_case> read_test_cases(const filesystem::path& path) {
    CHECK(filesystem::is_regular_file(path))
        << "Test case file " << path << " does not exist";
    try {
        return grader::value::parse(grader::read_file_content(path)).get<vector<grader::test_case>>();
    } catch (std::exception& e) {
        LOG(FATAL) << "Test case file " << path << " is malformed: " << e.what();
    }
    return {};
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load sandbox configuration from the given json file")
        ("code", po::value<string>(), "path of the source file to be graded, or - to read from stdin")
        ("language", po::value<string>()->default_value("python"), "language of the submission: python, java, cpp")
        ("tests", po::value<string>(), "json file with an array of test cases, each of which is {\"input\": ..., \"expected\": ...}")
        ("question", po::value<string>(), "grade against the hidden test cases of the given question in the question bank")
        ("questions", po::value<vector<string>>(), "load additional questions from the given json file")
        ("question-id", po::value<string>(), "question id recorded in the evidence, default to the question name")
        ("question-title", po::value<string>(), "question title recorded in the evidence, default to the title in question bank")
        ("timeout", po::value<double>(), "wall clock time limit in seconds for each test case, default to 10. You can either pass it from environ GRADER_TIMEOUT")
        ("memory-limit", po::value<int>(), "address space limit in MB of the harness, default to 128. You can either pass it from environ GRADER_MEMORY_LIMIT")
        ("python", po::value<string>(), "python interpreter, default to python3. You can either pass it from environ GRADER_PYTHON")
        ("tmp-dir", po::value<string>(), "directory to store temporary harness files. You can either pass it from environ GRADER_TMPDIR")
        ("time-started", po::value<string>(), "time the candidate started this question, attached to the evidence")
        ("time-submitted", po::value<string>(), "time the candidate submitted this question, attached to the evidence")
        ("duration-seconds", po::value<long>(), "seconds the candidate spent on this question, attached to the evidence")
        ("demo", "grade the reference solution of the fibonacci question")
        ("list-questions", "list the questions in the question bank")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Run candidate code against test cases and print the execution evidence" << endl
             << "Usage: " << argv[0] << " --code solution.py --tests tests.json [options]" << endl
             << "       " << argv[0] << " --code solution.py --question fibonacci [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    grader::sandbox_config config;
    if (vm.count("config")) {
        try {
            config = grader::load_config(vm.at("config").as<string>());
        } catch (grader::config_error& e) {
            LOG(FATAL) << e.what();
        }
    }

    // 命令行参数优先于环境变量
    try {
        grader::apply_environment(config);
    } catch (grader::config_error& e) {
        LOG(FATAL) << e.what();
    }

    if (vm.count("timeout"))
        config.timeout_seconds = vm.at("timeout").as<double>();
    CHECK(config.timeout_seconds > 0) << "Time limit should be positive";

    if (vm.count("memory-limit"))
        config.memory_limit_mb = vm.at("memory-limit").as<int>();
    CHECK(config.memory_limit_mb > 0) << "Memory limit should be positive";

    if (vm.count("python"))
        config.python = vm.at("python").as<string>();

    if (vm.count("tmp-dir"))
        config.temp_dir = filesystem::path(vm.at("tmp-dir").as<string>());
    if (!config.temp_dir.empty()) {
        CHECK(filesystem::is_directory(config.temp_dir))
            << "Temporary directory " << config.temp_dir << " does not exist";
    }

    grader::question_bank bank = grader::question_bank::builtin();
    if (vm.count("questions")) {
        for (auto& path : vm.at("questions").as<vector<string>>()) {
            try {
                bank.load(path);
            } catch (grader::config_error& e) {
                LOG(FATAL) << e.what();
            }
        }
    }

    if (vm.count("list-questions")) {
        for (auto& key : bank.keys()) {
            const grader::question* q = bank.find(key);
            cout << key << "\t" << q->title << "\t" << q->test_cases.size() << " test cases" << endl;
        }
        return EXIT_SUCCESS;
    }

    string code, language = grader::to_lower(vm.at("language").as<string>());
    string question_id, question_title;
    vector<grader::test_case> test_cases;

    if (vm.count("demo")) {
        const grader::question* q = bank.find("fibonacci");
        CHECK(q) << "Question fibonacci is missing from question bank";
        code = DEMO_SOLUTION;
        language = "python";
        question_id = "q1_fibonacci";
        question_title = q->title;
        test_cases = q->test_cases;
    } else {
        if (!vm.count("code")) {
            cerr << "--code is required" << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
        code = read_code(vm.at("code").as<string>());

        if (vm.count("question")) {
            string name = vm.at("question").as<string>();
            const grader::question* q = bank.find(name);
            CHECK(q) << "Question " << name << " does not exist in question bank";
            question_id = q->id;
            question_title = q->title;
            test_cases = q->test_cases;
        } else if (vm.count("tests")) {
            test_cases = read_test_cases(vm.at("tests").as<string>());
        } else {
            cerr << "Either --tests or --question should be specified" << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
    }

    if (vm.count("question-id")) question_id = vm.at("question-id").as<string>();
    if (vm.count("question-title")) question_title = vm.at("question-title").as<string>();

    grader::code_sandbox sandbox(config);
    grader::execution_evidence evidence = sandbox.execute(code, language, test_cases, question_id, question_title);

    optional<string> time_started, time_submitted;
    optional<long> duration_seconds;
    if (vm.count("time-started")) time_started = vm.at("time-started").as<string>();
    if (vm.count("time-submitted")) time_submitted = vm.at("time-submitted").as<string>();
    if (vm.count("duration-seconds")) duration_seconds = vm.at("duration-seconds").as<long>();
    if (time_started || time_submitted || duration_seconds)
        evidence = grader::stamp_timing(move(evidence), time_started, time_submitted, duration_seconds);

    nlohmann::json j = evidence;
    cout << j.dump(2) << endl;

    return EXIT_SUCCESS;
}
