#pragma once

#include <optional>
#include <string>
#include "config.hpp"

namespace grader {

/**
 * @brief 在运行选手代码之前，检查代码中是否包含被禁止的模块或函数
 * 
 * 检查不区分大小写，对 sandbox_config::banned_modules 中的每个模块依次检查
 * "import X"、"from X"、"__import__('X'"、"__import__("X"" 这几种写法，
 * 之后检查 sandbox_config::dangerous_calls 中的函数调用。
 * 
 * @note 这里只是简单的文本匹配，用来在启动进程之前过滤掉明显恶意的提交，
 * 而不是安全边界：通过字符串拼接、getattr 等方式可以绕过检查。
 * 真正的隔离只有"独立进程 + 时钟时间限制"。
 * 
 * @param source 选手代码
 * @param config 禁止的模块和函数列表
 * @return 第一个匹配到的违规原因，若代码通过检查则返回空
 */
std::optional<std::string> screen(const std::string &source, const sandbox_config &config);

}  // namespace grader
