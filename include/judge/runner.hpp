#pragma once

#include <string>
#include "config.hpp"
#include "judge/evidence.hpp"
#include "judge/executor.hpp"

namespace grader {

/**
 * @brief 表示一种语言的评测逻辑
 * 添加新的语言只需要实现新的 runner 并注册到 code_sandbox 中
 */
struct runner {
    virtual ~runner();

    /**
     * @brief runner 负责评测哪种语言的提交
     * 必须是小写的，如：python, java, cpp
     */
    virtual std::string language() const = 0;

    /**
     * @brief 评测一个提交的所有测试点
     * 返回的评测记录中测试点的个数和顺序必须与提交中的一致
     * @param submit 要被评测的提交，language 已经转为小写
     * @throw std::exception 若发生无法恢复的内部错误，由 code_sandbox 转换为 EXECUTION_ERROR
     */
    virtual execution_evidence run(const submission &submit) const = 0;
};

/**
 * @brief 评测 Python 提交
 * 
 * 先对代码做安全检查，发现被禁止的模块或函数时不运行任何测试点；
 * 再检查解释器是否存在；然后依次评测每个测试点，
 * 每个测试点都在独立的进程中运行评测程序。
 */
struct python_runner : public runner {
    explicit python_runner(const sandbox_config &config);

    std::string language() const override;

    execution_evidence run(const submission &submit) const override;

    /**
     * @brief 评测一个测试点
     * 任何错误都会转换为测试点的失败结果，不会抛出异常
     */
    test_case_result judge_test_case(const process_executor &executor, const std::string &code, const test_case &tc) const;

private:
    sandbox_config config;
};

/**
 * @brief 编译器不存在的语言
 * 所有测试点都直接返回 ENV_ERROR，不会创建任何进程
 */
struct toolchain_unavailable_runner : public runner {
    /**
     * @param language 语言名，如 java
     * @param compiler 缺失的编译器名，如 javac
     */
    toolchain_unavailable_runner(std::string language, std::string compiler);

    std::string language() const override;

    execution_evidence run(const submission &submit) const override;

private:
    std::string lang, compiler;
};

}  // namespace grader
