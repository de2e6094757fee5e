#pragma once

#include <string>
#include "common/value.hpp"
#include "config.hpp"

namespace grader {

/**
 * @brief 选手代码必须定义的入口函数名
 */
constexpr const char *ENTRY_POINT = "solution";

/**
 * @brief 评测程序的返回值约定
 */
enum harness_exit_code {
    E_SUCCESS = 0,
    E_CANDIDATE_EXCEPTION = 1,
    E_MEMORY_EXHAUSTED = 2
};

/**
 * @brief 生成可以独立运行的 Python 评测程序
 * 评测程序按顺序：
 * 1. 尝试通过 RLIMIT_AS 限制地址空间（失败时忽略）
 * 2. 原样插入选手代码
 * 3. 检查选手代码定义了 solution 函数
 * 4. 以 Python 字面量的形式写入测试输入，调用 solution(test_input)
 * 5. 成功时在 stdout 输出一行 {"result": <value>}，返回 0
 * 6. 内存耗尽时输出 {"error": "Memory limit exceeded"}，返回 2
 * 7. 其他异常输出 {"error": "<异常类型>: <异常信息>"}，返回 1
 * 
 * @param candidate_source 选手代码
 * @param test_input 测试点输入
 * @param config 提供内存限制
 * @return 评测程序的源代码
 */
std::string build_harness(const std::string &candidate_source, const value &test_input, const sandbox_config &config);

}  // namespace grader
