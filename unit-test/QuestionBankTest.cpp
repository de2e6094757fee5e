#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "question_bank.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

TEST(QuestionBankTest, QuestionKey) {
    EXPECT_EQ("fibonacci", question_key("q1_fibonacci"));
    EXPECT_EQ("fibonacci", question_key("fibonacci"));
    EXPECT_EQ("two_sum", question_key("q3_two_sum"));
}

TEST(QuestionBankTest, BuiltinQuestions) {
    question_bank bank = question_bank::builtin();
    EXPECT_EQ((vector<string>{"fibonacci", "palindrome", "reverse_words", "two_sum"}), bank.keys());

    const question *fib = bank.find("fibonacci");
    ASSERT_NE(nullptr, fib);
    EXPECT_EQ("Fibonacci Number", fib->title);
    ASSERT_EQ(5u, fib->test_cases.size());
    EXPECT_JSON_EQ(value(10), fib->test_cases[3].input);
    EXPECT_JSON_EQ(value(55), fib->test_cases[3].expected);

    const question *two_sum = bank.find("two_sum");
    ASSERT_NE(nullptr, two_sum);
    EXPECT_JSON_EQ(value::parse(R"({"nums": [1, 2, 3, 4], "target": 5})"), two_sum->test_cases[0].input);
    EXPECT_JSON_EQ(value(true), two_sum->test_cases[0].expected);
}

TEST(QuestionBankTest, FindByPrefixedId) {
    question_bank bank = question_bank::builtin();
    const question *q = bank.find("q1_fibonacci");
    ASSERT_NE(nullptr, q);
    EXPECT_EQ("fibonacci", q->id);
    EXPECT_EQ(nullptr, bank.find("q9_unknown"));
}

TEST(QuestionBankTest, LoadFromFile) {
    path file = temp_directory_path() / ("grader-questions-test-" + to_string(getpid()) + ".json");
    {
        ofstream fout(file);
        fout << R"([{"id": "square", "title": "Square", "test_cases": [{"input": 3, "expected": 9}]}])";
    }
    question_bank bank = question_bank::builtin();
    bank.load(file);
    remove(file);

    const question *q = bank.find("square");
    ASSERT_NE(nullptr, q);
    EXPECT_EQ("Square", q->title);
    EXPECT_EQ("", q->template_code);
    ASSERT_EQ(1u, q->test_cases.size());
    EXPECT_JSON_EQ(value(9), q->test_cases[0].expected);
    EXPECT_EQ(5u, bank.keys().size());
}

TEST(QuestionBankTest, LoadErrors) {
    path file = temp_directory_path() / ("grader-questions-test-" + to_string(getpid()) + ".json");
    question_bank bank;
    EXPECT_THROW(bank.load(file), config_error);
    {
        ofstream fout(file);
        fout << R"([{"id": "broken"}])";
    }
    EXPECT_THROW(bank.load(file), config_error);
    remove(file);
}
