#pragma once

#include <optional>
#include <string>
#include "common/value.hpp"

namespace grader {

/**
 * @brief 单个测试点的评分结果
 */
struct grade_result {
    bool passed = false;

    /**
     * @brief 实际输出与期望输出的相似度 (0~100)
     * 通过时为 100
     */
    double similarity = 0;

    /**
     * @brief 未通过但相似度不低于 PARTIAL_CREDIT_THRESHOLD 时为真
     */
    bool partial_credit = false;
};

/**
 * @brief 获得部分分所需的最小相似度
 */
constexpr double PARTIAL_CREDIT_THRESHOLD = 50;

/**
 * @brief 判断实际输出是否与期望输出一致
 * 
 * 依次尝试以下规则，任意一条成立即视为一致：
 * 1. 两个值相等（见 values_equal）；
 * 2. 两个值的展示字符串去掉首尾空白后相同，因此 "55" 与 55 一致；
 * 3. 两个值都能转换为浮点数且相等，布尔值视为 0 或 1，因此 1 与 true 一致；
 * 4. 期望输出为布尔值时，只接受与之相等的值；
 * 5. 期望输出为列表时，按顺序逐个比较。
 */
bool outputs_match(const value &actual, const value &expected);

/**
 * @brief 计算两个字符串的编辑距离，按 Unicode 码点计算
 */
size_t edit_distance(const std::u32string &s1, const std::u32string &s2);

/**
 * @brief 计算实际输出与期望输出的相似度 (0~100)
 * 
 * 先将两个值转换为去掉首尾空白的展示字符串：
 * 完全相同时为 100，任意一方为空时为 0，
 * 否则为 (最大长度 - 编辑距离) / 最大长度 * 100。
 * 
 * 若两个字符串都是数，则根据相对误差给出相似度的下限：
 * 相对误差小于 1% 时不低于 95，小于 5% 时不低于 75，小于 10% 时不低于 50。
 * 期望值为 0 时不计算相对误差。
 * 
 * @param length_limit 任意一方超过该长度（码点数）时不计算编辑距离，
 * 编辑距离部分的相似度记为 0
 */
double similarity_score(const value &actual, const value &expected, size_t length_limit);

/**
 * @brief 评分：判断是否通过，未通过时计算相似度和部分分
 */
grade_result grade(const value &actual, const value &expected, size_t length_limit);

}  // namespace grader
