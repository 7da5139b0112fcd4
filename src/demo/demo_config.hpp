#pragma once
#include <string>
#include <vector>

#include "environment.hpp"
#include "logging.hpp"
#include "result.hpp"

constexpr static auto ENV_DEMO_INPUTS = "ALLUSIONS_DEMO_INPUTS";

/// "1, 5,,x" -> {"1", "5", "x"}
std::vector<std::string> split_list(const std::string& text, char separator = ',');

struct DemoConfig
{
    allusions::LogLevel log_level;
    /// strings fed through the parse-and-invert pipeline
    std::vector<std::string> inputs;

    static auto LoadFromEnv() -> allusions::Result<DemoConfig, allusions::ConfigError>;

private:
    static auto load_inputs() -> allusions::Result<std::vector<std::string>, allusions::ConfigError>;
};
