#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "judge/evidence.hpp"

namespace grader {

/**
 * @brief 一道编程题
 */
struct question {
    std::string id;
    std::string title;
    std::string description;

    /**
     * @brief 提供给选手的代码模板
     */
    std::string template_code;

    /**
     * @brief 隐藏的测试点
     */
    std::vector<test_case> test_cases;
};

/**
 * @code{.json}
 * {
 *     "id": "fibonacci",
 *     "title": "Fibonacci Number",
 *     "description": "Return the nth Fibonacci number",
 *     "template": "def solution(n):\n    pass",
 *     "test_cases": [{"input": 0, "expected": 0}]
 * }
 * @endcode
 */
void from_json(const value &j, question &q);

/**
 * @brief 将题目 id 转换为题库中的键
 * 去掉第一个 '_' 及之前的前缀，如 q1_fibonacci 转换为 fibonacci；
 * 不包含 '_' 的 id 原样返回
 */
std::string question_key(const std::string &question_id);

struct question_bank {
    /**
     * @brief 内置的示例题库：fibonacci, palindrome, two_sum, reverse_words
     */
    static question_bank builtin();

    /**
     * @brief 从 JSON 文件中读取题目，文件内容为题目的数组
     * 同 id 的题目会被替换
     * @throw config_error 若文件不存在或格式不正确
     */
    void load(const std::filesystem::path &path);

    void add(question q);

    /**
     * @brief 查找题目
     * 先按 id 查找，找不到时按 question_key(id) 查找
     * @return 题目，不存在时返回 nullptr
     */
    const question *find(const std::string &id) const;

    std::vector<std::string> keys() const;

private:
    std::map<std::string, question> questions;
};

}  // namespace grader
