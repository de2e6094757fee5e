#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 测试数据的值模型
 * 测试点的输入、期望输出和选手程序的实际输出都是以下类型之一：
 * null、布尔、整数、浮点数、字符串、有序列表、以字符串为键的映射。
 * 映射保持插入顺序，以便展示时和出题人给定的顺序一致。
 * 
 * 比较、展示、序列化为 Python 字面量的规则都由值的类型决定，
 * 不依赖运行时的隐式类型转换。
 */
namespace grader {

using value = nlohmann::ordered_json;

/**
 * @brief 判断两个值是否相等
 * 整数和浮点数之间按数值比较（1 == 1.0），布尔值与数比较时视为 0 或 1（True == 1），
 * 列表按顺序逐个比较，映射按键比较（不考虑键的顺序）
 */
bool values_equal(const value &a, const value &b);

/**
 * @brief 将值转换为展示用的字符串，与 Python 的 str() 一致
 * 顶层字符串原样输出，列表和映射中的字符串带引号
 * @code{.cpp}
 *     display_string("abc") == "abc"
 *     display_string(true) == "True"
 *     display_string(value::parse(R"({"nums": [1, 2], "target": 5})")) == "{'nums': [1, 2], 'target': 5}"
 * @endcode
 */
std::string display_string(const value &v);

/**
 * @brief 将值转换为 Python 字面量，用于生成评测程序
 * 非有限浮点数转换为 float('inf')、float('nan')
 */
std::string python_literal(const value &v);

/**
 * @brief 按 Python 的 repr() 规则为字符串加引号和转义
 */
std::string python_string_literal(const std::string &s);

/**
 * @brief 浮点数的最短表示，整数值带 ".0" 后缀
 */
std::string format_float(double d);

/**
 * @brief 将值转换为浮点数
 * 接受整数、浮点数、布尔值（转换为 0 或 1）和内容为数字的字符串，其他类型不转换
 */
std::optional<double> numeric_value(const value &v);

}  // namespace grader
