#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>

#include "logging.hpp"
#include "maybe.hpp"
#include "repr.hpp"
#include "result.hpp"

namespace allusions {

constexpr static auto ENV_LOG_LEVEL = "ALLUSIONS_LOG_LEVEL";

// Function to retrieve an environment variable, Empty if it isn't set
inline Maybe<std::string> get_env_var_opt(const std::string& varName) {
    if (const char* value = std::getenv(varName.c_str())) {
        return Some(std::string(value));
    }
    return Empty();
}

inline std::string get_env_var_exn(const std::string& key) {
    return get_env_var_opt(key).match(
        [](std::string value) { return value; },
        [&key]() -> std::string { throw std::runtime_error("Missing environment variable: " + key); });
}

struct ConfigError {
    std::string key;
    std::string message;

    bool operator==(const ConfigError&) const = default;

    friend std::ostream& operator<<(std::ostream& out, const ConfigError& error) {
        return out << "ConfigError(" << error.key << ": " << error.message << ")";
    }
};

/// "debug" -> LogLevel::Debug, case-insensitive
inline auto parse_log_level(const std::string& name) -> Result<LogLevel, ConfigError> {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") { return Ok(LogLevel::Debug); }
    if (lowered == "info") { return Ok(LogLevel::Info); }
    if (lowered == "warn") { return Ok(LogLevel::Warn); }
    if (lowered == "error") { return Ok(LogLevel::Error); }
    return Err(ConfigError{ENV_LOG_LEVEL, "unknown log level " + repr(name)});
}

} // namespace allusions
