#pragma once

// error handling
#include "engine/result.hpp"

// patterns and the search strategies built from them
#include "engine/pattern.hpp"
#include "engine/matcher.hpp"
#include "engine/shift_table.hpp"
#include "engine/skip_counters.hpp"
#include "engine/two_byte_hash_matcher.hpp"
#include "engine/naive_matcher.hpp"
#include "engine/matcher_config.hpp"

// utilities
#include "utils/hex_utils.hpp"
#include "utils/env_config.hpp"
