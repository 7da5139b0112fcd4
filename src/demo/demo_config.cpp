#include "demo_config.hpp"

#include <utility>

#include "maybe.hpp"

using allusions::ConfigError;
using allusions::Err;
using allusions::LogLevel;
using allusions::Ok;
using allusions::Result;

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::string::size_type start = 0;
    while (start <= text.size()) {
        auto end = text.find(separator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        auto item = text.substr(start, end - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

auto DemoConfig::LoadFromEnv() -> Result<DemoConfig, ConfigError> {
    const auto log_level = allusions::get_env_var_opt(allusions::ENV_LOG_LEVEL).match(
        [](const std::string& name) { return allusions::parse_log_level(name); },
        []() -> Result<LogLevel, ConfigError> { return Ok(LogLevel::Info); });

    return log_level.flat_map([](LogLevel level) {
        return load_inputs().map_ok([level](std::vector<std::string> inputs) {
            return DemoConfig{level, std::move(inputs)};
        });
    });
}

auto DemoConfig::load_inputs() -> Result<std::vector<std::string>, ConfigError> {
    return allusions::get_env_var_opt(ENV_DEMO_INPUTS).match(
        [](const std::string& raw) -> Result<std::vector<std::string>, ConfigError> {
            auto inputs = split_list(raw);
            if (inputs.empty()) {
                return Err(ConfigError{ENV_DEMO_INPUTS, "expected a comma-separated list of inputs"});
            }
            return Ok(std::move(inputs));
        },
        []() -> Result<std::vector<std::string>, ConfigError> {
            return Ok(std::vector<std::string>{"1", "5", "0", "x"});
        });
}
