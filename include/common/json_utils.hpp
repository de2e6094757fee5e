#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

template <typename JsonT, typename Key>
const JsonT *step(const JsonT *ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}

}  // namespace detail_access

template <typename JsonT, typename... Keys>
JsonT access_optional(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = j.is_null() ? nullptr : &j;
    ((ref = detail_access::step(ref, keys)), ...);
    return !ref ? JsonT{} : *ref;
}

template <typename JsonT, typename... Keys>
std::invalid_argument build_invalid_argument(const JsonT &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 JSON 中的可选字段
 * @param def_value 字段不存在或为 null 时返回的值
 * @throw std::invalid_argument 字段存在但类型不正确
 */
template <typename T, typename JsonT, typename... Keys>
T get_value_def(const JsonT &j, const T &def_value, Keys &&... keys) {
    JsonT res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.template get<T>();
    } catch (detail::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
