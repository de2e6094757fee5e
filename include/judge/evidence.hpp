#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "common/value.hpp"

namespace grader {

/**
 * @brief 选手程序没有产生输出时，actual 字段使用的标记
 */
namespace sentinel {
constexpr const char *TIMEOUT = "TIMEOUT";
constexpr const char *ENV_ERROR = "ENV_ERROR";
constexpr const char *UNSUPPORTED = "UNSUPPORTED";
constexpr const char *BLOCKED = "BLOCKED";
constexpr const char *EXECUTION_ERROR = "EXECUTION_ERROR";
constexpr const char *ERROR = "ERROR";
}  // namespace sentinel

/**
 * @brief 一个测试点
 * 由题库提供，评测过程中不会被修改
 */
struct test_case {
    value input;
    value expected;
};

/**
 * @code{.json}
 * {"input": 10, "expected": 55}
 * @endcode
 * @throw std::invalid_argument 若缺少 input 或 expected 字段
 */
void from_json(const value &j, test_case &tc);

void to_json(value &j, const test_case &tc);

/**
 * @brief 一个测试点的评测结果
 * 一经创建就不再修改
 */
struct test_case_result {
    /**
     * @brief 测试点输入的展示字符串
     */
    std::string input;

    /**
     * @brief 期望输出的展示字符串
     */
    std::string expected;

    /**
     * @brief 实际输出的展示字符串，或者 sentinel 中的标记
     */
    std::string actual;

    bool passed = false;

    double time_ms = 0;

    std::optional<std::string> error;

    /**
     * @brief 相似度 (0~100)，仅在比较了输出且未通过时存在
     */
    std::optional<double> similarity_score;

    bool partial_credit = false;

    status outcome = status::SYSTEM_ERROR;
};

void to_json(nlohmann::json &j, const test_case_result &result);

/**
 * @brief 一个选手提交
 */
struct submission {
    std::string question_id;
    std::string question_title;

    /**
     * @brief 小写的语言名，如 python, java, cpp
     */
    std::string language;

    std::string code;

    std::vector<test_case> test_cases;
};

/**
 * @brief 一次提交的完整评测记录
 * 是评测引擎唯一的输出，由调用者保存并交给后续的决策流程
 */
struct execution_evidence {
    std::string question_id;
    std::string question_title;
    std::string language;

    /**
     * @brief 原样保存的选手代码
     */
    std::string submitted_code;

    /**
     * @brief 各测试点的评测结果，与输入的测试点一一对应
     */
    std::vector<test_case_result> test_cases;

    /**
     * @brief 得分率 (0~100)，保留两位小数
     */
    double pass_rate = 0;

    double avg_time_ms = 0;

    size_t total_tests = 0;

    // 以下字段由调用者在评测完成后填写
    std::optional<std::string> time_started;
    std::optional<std::string> time_submitted;
    std::optional<long> duration_seconds;
};

void to_json(nlohmann::json &j, const execution_evidence &evidence);

/**
 * @brief 汇总各测试点的评测结果
 * 
 * 通过的测试点记 1 分，获得部分分的测试点记 相似度/100 分，其余记 0 分，
 * 得分率为平均分 * 100；平均耗时为各测试点耗时的平均值。
 * 二者都保留两位小数，没有测试点时都为 0。
 */
execution_evidence summarize(const submission &submit, std::vector<test_case_result> results);

/**
 * @brief 为每个测试点生成相同的失败结果，用于整个提交无法运行的情况
 * @param actual sentinel 中的标记
 */
execution_evidence make_uniform_failure(const submission &submit, const std::string &actual, status outcome, const std::string &error);

/**
 * @brief 附加调用者记录的时间信息
 */
execution_evidence stamp_timing(execution_evidence evidence,
                                std::optional<std::string> time_started,
                                std::optional<std::string> time_submitted,
                                std::optional<long> duration_seconds);

}  // namespace grader
