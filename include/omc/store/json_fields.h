#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace omc::store {

// Lenient field readers: absent, null or mistyped fields yield the fallback.

inline std::string jsonString(const nlohmann::json& j, const char* key,
                              const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_integer())
        return std::to_string(it->get<long long>());
    return fallback;
}

inline std::optional<std::string> jsonOptString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty())
        return std::nullopt;
    return s;
}

inline double jsonNumber(const nlohmann::json& j, const char* key, double fallback = 0.0) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return fallback;
    return it->get<double>();
}

inline int jsonInt(const nlohmann::json& j, const char* key, int fallback = 0) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return fallback;
    if (it->is_number_float())
        return static_cast<int>(it->get<double>());
    return it->get<int>();
}

inline bool jsonBool(const nlohmann::json& j, const char* key, bool fallback = false) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean())
        return fallback;
    return it->get<bool>();
}

inline std::optional<std::vector<float>> jsonVector(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array() || it->empty())
        return std::nullopt;
    std::vector<float> out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_number())
            return std::nullopt;
        out.push_back(v.get<float>());
    }
    return out;
}

// Responses are either the payload itself or wrapped in a single named field.
inline const nlohmann::json& unwrap(const nlohmann::json& j, const char* key) {
    if (j.is_object()) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
            return *it;
    }
    return j;
}

} // namespace omc::store
