#pragma once

#include <chrono>
#include <map>
#include <string>
#include <variant>
#include "config.hpp"

namespace grader {

/**
 * @brief 进程在时间限制内退出
 */
struct process_output {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 进程的返回值，若进程因为信号终止，则为信号编号的相反数
     */
    int exit_code = 0;

    double elapsed_ms = 0;
};

/**
 * @brief 进程超出时间限制，已被强制终止
 */
struct process_timeout {
    double elapsed_ms = 0;
};

/**
 * @brief 评测系统无法启动或监控进程
 */
struct launch_failure {
    std::string message;
};

using run_result = std::variant<process_output, process_timeout, launch_failure>;

/**
 * @brief 描述如何运行一段源代码
 */
struct launch_spec {
    /**
     * @brief 解释器的路径，源代码文件路径将作为它的第一个参数
     */
    std::string interpreter;

    /**
     * @brief 临时源代码文件的后缀，比如 ".py"
     */
    std::string suffix;

    /**
     * @brief 额外设置的环境变量
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 进程执行器，每次调用 run 运行一个独立的进程
 * 
 * 1. 将源代码写入一个唯一命名的临时文件
 * 2. 创建管道并 fork，子进程加入独立的进程组，stdin 重定向到 /dev/null，
 *    只继承 sandbox_config::inherited_env 中的环境变量，然后 exec 解释器
 * 3. 父进程通过 poll 读取 stdout、stderr，直到进程退出或者超出时间限制
 * 4. 超时时先向进程组发送 SIGTERM，等待 0.1s 后发送 SIGKILL
 * 5. 无论正常退出、超时还是出错，临时文件都会被删除
 * 
 * run 不会抛出异常，所有的错误都以 launch_failure 返回。
 */
struct process_executor {
    process_executor(const sandbox_config &config, launch_spec spec);

    /**
     * @brief 运行源代码
     * @param source 源代码
     * @param timeout 时钟时间限制
     */
    run_result run(const std::string &source, std::chrono::duration<double> timeout) const;

private:
    run_result run_impl(const std::string &source, std::chrono::duration<double> timeout) const;

    const sandbox_config &config;
    launch_spec spec;
};

}  // namespace grader
