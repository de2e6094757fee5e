#pragma once

namespace grader {

/**
 * @brief 表示一个测试点的最终评测结果
 * 每个测试点只会得到以下结果中的一个，之后不会再改变
 */
enum class status {
    /**
     * @brief 选手程序输出与期望结果一致
     */
    ACCEPTED = 0,

    /**
     * @brief 选手程序输出与期望结果不一致，但相似度不低于 50，获得部分分
     */
    PARTIAL_CORRECT = 1,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 2,

    /**
     * @brief 选手代码抛出了异常，或者进程以非零返回值退出
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 选手程序内存耗尽
     * 内存限制通过 RLIMIT_AS 设置，只是尽力而为，
     * 在不支持的平台上选手程序可能不会因为内存超限而失败
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 选手程序正常退出，但评测程序无法解析它的输出
     */
    OUTPUT_PARSE_ERROR = 5,

    /**
     * @brief 选手程序运行时间超出限制，已被强制终止
     */
    TIME_LIMIT_EXCEEDED = 6,

    /**
     * @brief 评测系统内部错误，比如无法创建进程
     */
    SYSTEM_ERROR = 7,

    /**
     * @brief 该语言的编译器或解释器不存在
     */
    ENVIRONMENT_ERROR = 8,

    /**
     * @brief 不支持的语言
     */
    UNSUPPORTED_LANGUAGE = 9,

    /**
     * @brief 代码中包含被禁止的模块或函数，未运行
     */
    RESTRICT_FUNCTION = 10
};

const char *get_display_message(status);

/**
 * @brief 评测结果的标识名，用于序列化
 */
const char *get_status_name(status);

}  // namespace grader
