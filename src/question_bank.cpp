#include "question_bank.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;

static const char *BUILTIN_QUESTIONS = R"([
    {
        "id": "fibonacci",
        "title": "Fibonacci Number",
        "description": "Return the nth Fibonacci number (0-indexed). F(0)=0, F(1)=1, F(n)=F(n-1)+F(n-2)",
        "template": "def solution(n):\n    # Return nth Fibonacci number\n    pass",
        "test_cases": [
            {"input": 0, "expected": 0},
            {"input": 1, "expected": 1},
            {"input": 5, "expected": 5},
            {"input": 10, "expected": 55},
            {"input": 15, "expected": 610}
        ]
    },
    {
        "id": "palindrome",
        "title": "Palindrome Check",
        "description": "Check if the given string is a palindrome (reads same forwards and backwards)",
        "template": "def solution(s):\n    # Return True if palindrome, False otherwise\n    pass",
        "test_cases": [
            {"input": "racecar", "expected": true},
            {"input": "hello", "expected": false},
            {"input": "a", "expected": true},
            {"input": "ab", "expected": false},
            {"input": "abba", "expected": true}
        ]
    },
    {
        "id": "two_sum",
        "title": "Two Sum (Simplified)",
        "description": "Given a sorted list of numbers and a target, return True if any two numbers sum to target",
        "template": "def solution(data):\n    # data = {'nums': [...], 'target': X}\n    # Return True if two nums sum to target\n    pass",
        "test_cases": [
            {"input": {"nums": [1, 2, 3, 4], "target": 5}, "expected": true},
            {"input": {"nums": [1, 2, 3, 4], "target": 10}, "expected": false},
            {"input": {"nums": [2, 7, 11, 15], "target": 9}, "expected": true},
            {"input": {"nums": [1, 1, 1, 1], "target": 2}, "expected": true}
        ]
    },
    {
        "id": "reverse_words",
        "title": "Reverse Words",
        "description": "Reverse the order of words in a sentence",
        "template": "def solution(s):\n    # Return string with words in reverse order\n    pass",
        "test_cases": [
            {"input": "hello world", "expected": "world hello"},
            {"input": "the quick brown fox", "expected": "fox brown quick the"},
            {"input": "a", "expected": "a"}
        ]
    }
])";

void from_json(const value &j, question &q) {
    q.id = j.at("id").get<string>();
    q.title = get_value_def(j, string(), "title");
    q.description = get_value_def(j, string(), "description");
    q.template_code = get_value_def(j, string(), "template");
    q.test_cases = j.at("test_cases").get<vector<test_case>>();
}

string question_key(const string &question_id) {
    auto pos = question_id.find('_');
    if (pos == string::npos) return question_id;
    return question_id.substr(pos + 1);
}

question_bank question_bank::builtin() {
    question_bank bank;
    for (auto &q : value::parse(BUILTIN_QUESTIONS).get<vector<question>>())
        bank.add(move(q));
    return bank;
}

void question_bank::load(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw config_error("Question file " + path.string() + " does not exist");

    vector<question> loaded;
    try {
        loaded = value::parse(read_file_content(path)).get<vector<question>>();
    } catch (std::exception &e) {
        throw config_error("Question file " + path.string() + " is malformed: " + e.what());
    }

    for (auto &q : loaded)
        add(move(q));
    LOG(INFO) << "Loaded " << loaded.size() << " questions from " << path;
}

void question_bank::add(question q) {
    string id = q.id;
    questions[id] = move(q);
}

const question *question_bank::find(const string &id) const {
    auto it = questions.find(id);
    if (it == questions.end()) it = questions.find(question_key(id));
    if (it == questions.end()) return nullptr;
    return &it->second;
}

vector<string> question_bank::keys() const {
    vector<string> result;
    for (auto &[id, q] : questions)
        result.push_back(id);
    return result;
}

}  // namespace grader
