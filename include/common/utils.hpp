#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 可执行文件名，若包含 '/' 则直接检查该路径
 * @return 可执行文件的绝对路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief 去掉字符串首尾的空白字符
 */
std::string trim(const std::string &s);

/**
 * @brief 截取字符串的前 max_chars 个字符
 * 按 UTF-8 码点计数，不会把一个多字节字符截断
 */
std::string truncate_chars(const std::string &s, size_t max_chars);

std::string to_lower(const std::string &s);

/**
 * @brief 四舍五入到小数点后两位
 */
double round2(double x);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
