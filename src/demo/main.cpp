#include <algorithm>
#include <cstdlib>
#include <string>

#include "demo_config.hpp"
#include "environment.hpp"
#include "logging.hpp"
#include "pet_lookup.hpp"
#include "reciprocal.hpp"
#include "allusions.hpp"

using namespace allusions;

void run_pet_lookup()
{
    const auto table = default_pet_table();
    Logger::info("Pet table: ", repr(table));

    const auto cats = lookup("cat", table).map([](int n) { return std::to_string(n); });
    Logger::info("lookup(\"cat\").map(to_string) = ", cats);

    for (const std::string animal : {"cat", "dog", "fish"}) {
        Logger::info("Greeting the ", animal, ": ", greet(animal, table));
    }
}

void run_reciprocals(const DemoConfig& config)
{
    Logger::info("Inverting ", repr(config.inputs));
    const auto results = reciprocals(config.inputs);
    for (const auto& result : results) {
        result.match(
            [](double value) { Logger::info("ok: ", value); },
            [](const CalcError& error) { Logger::warn("failed: ", repr(error)); });
    }

    const auto inverted = std::count_if(results.begin(), results.end(),
                                        [](const auto& result) { return result.is_ok(); });
    Logger::info(inverted, " of ", results.size(), " inputs inverted");
}

int main()
{
    const auto config = DemoConfig::LoadFromEnv();
    return config.match(
        [](const DemoConfig& demo_config) {
            Logger::set_level(demo_config.log_level);
            Logger::debug("Log level: ", demo_config.log_level);
            run_pet_lookup();
            run_reciprocals(demo_config);
            return EXIT_SUCCESS;
        },
        [](const ConfigError& error) {
            Logger::error("Invalid configuration: ", error);
            return EXIT_FAILURE;
        });
}
