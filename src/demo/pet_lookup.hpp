#pragma once
#include <map>
#include <string>

#include "maybe.hpp"

using PetTable = std::map<std::string, int>;

/// {"cat": 6, "dog": 3}
PetTable default_pet_table();

/// Some(count) when the animal is in the table, Empty otherwise
auto lookup(const std::string& key, const PetTable& table) -> allusions::Maybe<int>;

/// "Morning!" once per animal, or "gone" when there is no such animal
auto greet(const std::string& key, const PetTable& table) -> std::string;
