#pragma once

#include <optional>
#include <string>
#include "common/value.hpp"
#include "config.hpp"
#include "judge/executor.hpp"

namespace grader {

/**
 * @brief 解析评测程序输出的结果
 */
struct parsed_output {
    enum class kind {
        RESULT,             // 得到了 solution 的返回值
        MALFORMED,          // 正常退出但输出不符合约定，actual 为原始输出
        EXCEPTION,          // 选手代码抛出异常
        MEMORY_EXHAUSTED    // 选手程序内存耗尽
    };

    kind type;

    /**
     * @brief 选手程序的实际输出
     * 出错时为字符串 "ERROR"
     */
    value actual;

    std::optional<std::string> error;
};

/**
 * @brief 解析评测程序的 stdout 和返回值
 * 
 * 返回值为 0 时，stdout 最后一个非空行应为 {"result": <value>}，
 * 选手代码在此之前的 print 输出会被忽略。若解析失败，actual 为
 * 去掉首尾空白并截断到 max_output_length 的原始输出，
 * error 为 "Output parsing error"。
 * 
 * 返回值非 0 时，actual 为 "ERROR"，error 依次选用截断到
 * max_error_length 的 stderr、评测程序输出的 {"error": ...}，
 * 都不存在时为 "Unknown error"。
 */
parsed_output parse_output(const process_output &output, const sandbox_config &config);

}  // namespace grader
