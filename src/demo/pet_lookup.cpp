#include "pet_lookup.hpp"

#include "logging.hpp"
#include "repr.hpp"

using allusions::Logger;

PetTable default_pet_table() {
    return {{"cat", 6}, {"dog", 3}};
}

auto lookup(const std::string& key, const PetTable& table) -> allusions::Maybe<int> {
    const auto it = table.find(key);
    if (it == table.end()) {
        return allusions::Empty();
    }
    return allusions::Some(it->second);
}

auto greet(const std::string& key, const PetTable& table) -> std::string {
    const auto count = lookup(key, table);
    Logger::debug("lookup(", allusions::repr(key), ") = ", count);
    return count.match(
        [](int n) {
            std::string greeting;
            for (int i = 0; i < n; ++i) {
                greeting += "Morning!";
            }
            return greeting;
        },
        [] { return std::string("gone"); });
}
