#pragma once
// Structured console logging: one JSON object per line

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "seatbook/TimeUtils.h"

namespace seatbook::log {

inline std::string format(const char* level, const std::string& component,
                          const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"component", component},
        {"message", message},
        {"timestamp", TimeUtils::getCurrentTimestamp()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            entry[key] = value;
        }
    }
    return entry.dump();
}

inline void info(const std::string& component, const std::string& message,
                 const nlohmann::json& fields = nlohmann::json::object()) {
    std::cout << format("info", component, message, fields) + "\n" << std::flush;
}

inline void warn(const std::string& component, const std::string& message,
                 const nlohmann::json& fields = nlohmann::json::object()) {
    std::cerr << format("warn", component, message, fields) + "\n" << std::flush;
}

inline void error(const std::string& component, const std::string& message,
                  const nlohmann::json& fields = nlohmann::json::object()) {
    std::cerr << format("error", component, message, fields) + "\n" << std::flush;
}

} // namespace seatbook::log
