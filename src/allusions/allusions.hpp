#pragma once

// Maybe, Result and their diagnostic rendering in one include.
#include "types.hpp"
#include "maybe.hpp"
#include "result.hpp"
#include "repr.hpp"
