#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace executor {

/**
 * @brief 沿着 keys 逐层查找 json 对象，任意一层不存在时返回 nullptr
 */
template <typename JsonT, typename... Keys>
const JsonT *find_path(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename JsonT, typename... Keys>
bool exists(const JsonT &j, Keys &&... keys) {
    const JsonT *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename JsonT, typename... Keys>
std::invalid_argument build_invalid_argument(const JsonT &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump();
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 keys 指向的值，值不存在或为 null 时返回 def_value
 * @throw std::invalid_argument 若值存在但类型不匹配
 */
template <typename T, typename JsonT, typename... Keys>
T get_value_def(const JsonT &j, const T &def_value, Keys &&... keys) {
    const JsonT *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->template get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace executor
