#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

inline std::invalid_argument build_invalid_argument(const json &j, const std::string &key) {
    return std::invalid_argument("Unexpected value type of: " + key + " in " + j.dump(2));
}

/**
 * @brief 读取 JSON 对象中的字段
 * @throw std::invalid_argument 字段不存在或者类型不正确
 */
template <typename T>
T get_value(const json &j, const std::string &key) {
    if (!j.is_object() || !j.count(key) || j.at(key).is_null())
        throw std::invalid_argument("Missing field: " + key);
    try {
        return j.at(key).get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, key);
    }
}

}  // namespace nlohmann
