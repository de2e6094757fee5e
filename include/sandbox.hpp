#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/evidence.hpp"
#include "judge/runner.hpp"

namespace grader {

/**
 * @brief 代码评测沙箱，评测引擎的入口
 * 
 * 构造时注册默认的 runner：
 * python 使用完整的评测流程；java、cpp 由于评测环境中没有编译器，直接返回 ENV_ERROR；
 * 其他语言返回 UNSUPPORTED。
 * 
 * 配置在构造后不再修改，同一份代码和测试点的评测结果（除耗时外）总是相同的。
 */
struct code_sandbox {
    explicit code_sandbox(sandbox_config config = sandbox_config());

    code_sandbox(const code_sandbox &) = delete;
    code_sandbox &operator=(const code_sandbox &) = delete;

    /**
     * @brief 注册一种语言的 runner，同名的 runner 会被替换
     */
    void register_runner(std::unique_ptr<runner> &&r);

    /**
     * @brief 评测一个提交
     * 
     * 不会抛出异常：任何错误都会转换为测试点的失败结果，
     * 返回的评测记录中测试点的个数总是与 test_cases 相同。
     * 
     * @param code 选手代码
     * @param language 语言名，不区分大小写
     * @param test_cases 测试点，评测结果按相同的顺序给出
     */
    execution_evidence execute(const std::string &code,
                               const std::string &language,
                               const std::vector<test_case> &test_cases,
                               const std::string &question_id,
                               const std::string &question_title = "") const;

    /**
     * @brief 已注册的语言
     */
    std::vector<std::string> languages() const;

    const sandbox_config &config() const;

private:
    sandbox_config cfg;
    std::map<std::string, std::unique_ptr<runner>> runners;
};

}  // namespace grader
