#pragma once

#include <optional>
#include <string>

/**
 * @brief 尝试将字符串解析为浮点数
 * 允许首尾空白字符，不允许其他多余的字符
 * @return 解析得到的数，若字符串不是数则返回空
 */
std::optional<double> parse_number(const std::string &s);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
