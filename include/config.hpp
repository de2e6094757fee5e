#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 评测沙箱的配置
 * 在构造 code_sandbox 时传入，之后不再修改。
 * 安全检查、评测程序生成、进程执行都只依赖输入和这份配置。
 */
struct sandbox_config {
    /**
     * @brief 每个测试点的时钟时间限制（秒）
     * 超时的进程将被强制终止，测试点结果为 TIMEOUT
     */
    double timeout_seconds = 10;

    /**
     * @brief 评测程序尝试设置的地址空间上限（MB）
     * 通过 RLIMIT_AS 设置，设置失败时会被忽略
     */
    int memory_limit_mb = 128;

    /**
     * @brief 无法解析选手程序输出时，保留的原始输出的最大字符数
     */
    size_t max_output_length = 10000;

    /**
     * @brief 选手程序出错时，保留的 stderr 的最大字符数
     */
    size_t max_error_length = 500;

    /**
     * @brief 评测系统内部错误信息的最大字符数
     */
    size_t max_host_error_length = 200;

    /**
     * @brief stdout、stderr 分别最多保留多少字节，只保留最后输出的部分
     */
    size_t max_capture_bytes = 1 << 20;

    /**
     * @brief 计算编辑距离时允许的最大字符串长度（字符数）
     * 避免过长的输出导致评测被卡死（无论是时间上还是空间上）
     */
    size_t similarity_length_limit = 5000;

    /**
     * @brief Python 解释器，可以是 PATH 中的命令名，也可以是路径
     */
    std::string python = "python3";

    /**
     * @brief 存放评测程序临时文件的文件夹，为空时使用系统临时文件夹
     */
    std::filesystem::path temp_dir;

    /**
     * @brief 禁止导入的模块，按顺序检查
     */
    std::vector<std::string> banned_modules = {
        "os", "subprocess", "sys", "socket", "requests",
        "urllib", "http", "ftplib", "smtplib", "telnetlib",
        "pickle", "marshal", "shelve", "dbm",
        "ctypes", "multiprocessing", "threading",
        "__builtins__", "eval", "exec", "compile",
        "importlib", "__import__"};

    /**
     * @brief 禁止调用的函数
     */
    std::vector<std::string> dangerous_calls = {"eval(", "exec(", "compile(", "open(", "__import__"};

    /**
     * @brief 选手程序可以继承的环境变量，其他环境变量都不会传给选手程序
     */
    std::vector<std::string> inherited_env = {"PATH", "HOME", "LANG", "LC_ALL", "PYENV_ROOT", "PYENV_VERSION"};
};

/**
 * @brief 从 JSON 读取配置，不存在的字段使用默认值
 * @code{.json}
 * {
 *     "timeoutSeconds": 10,
 *     "memoryLimitMB": 128,
 *     "python": "python3",
 *     "bannedModules": ["os", "subprocess"]
 * }
 * @endcode
 */
void from_json(const nlohmann::json &j, sandbox_config &config);

void to_json(nlohmann::json &j, const sandbox_config &config);

/**
 * @brief 从配置文件读取配置
 * @throw config_error 若文件不存在或格式不正确
 */
sandbox_config load_config(const std::filesystem::path &path);

/**
 * @brief 用环境变量覆盖配置
 * 读取 GRADER_TIMEOUT、GRADER_MEMORY_LIMIT、GRADER_PYTHON、GRADER_TMPDIR，
 * 未设置的环境变量不影响配置
 * @throw config_error 若环境变量不是合法的正数
 */
void apply_environment(sandbox_config &config);

}  // namespace grader
