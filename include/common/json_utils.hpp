#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_keys {

template <typename... Keys>
const json *find(const json &j, const Keys &... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

}  // namespace detail_keys

template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    const json *ref = detail_keys::find(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, const Keys &... keys) {
    const json *ref = detail_keys::find(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg.pop_back();
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, const Keys &... keys) {
    const json *ref = detail_keys::find(j, keys...);
    if (!ref)
        throw build_invalid_argument(keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, const Keys &... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

/**
 * @brief 读取可选的字段，字段不存在或为 null 时返回 def_value，类型不对时抛出异常
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, const Keys &... keys) {
    const json *ref = detail_keys::find(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

}  // namespace nlohmann
