#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace BjornManager {

// Helpers for records that must reject fields they do not recognize. They throw
// std::runtime_error; ConfigLoader and the other callers turn that into a Config error.
namespace JsonStrict {

inline void requireObject(
    const nlohmann::json& j, const char* typeName, std::initializer_list<const char*> knownFields)
{
    if (!j.is_object()) {
        throw std::runtime_error(std::string(typeName) + " must be a JSON object");
    }
    for (const auto& [key, value] : j.items()) {
        bool known = false;
        for (const char* field : knownFields) {
            if (key == field) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::runtime_error(
                std::string(typeName) + " has unknown field '" + key + "'");
        }
    }
}

// Reads j[name] into out when present; leaves the default otherwise.
template <typename T>
void readOptional(const nlohmann::json& j, const char* name, T& out)
{
    auto it = j.find(name);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

template <typename T>
void readRequired(const nlohmann::json& j, const char* typeName, const char* name, T& out)
{
    auto it = j.find(name);
    if (it == j.end()) {
        throw std::runtime_error(
            std::string(typeName) + " missing required field '" + name + "'");
    }
    out = it->template get<T>();
}

} // namespace JsonStrict
} // namespace BjornManager
