#pragma once

// result carrier and decoder core
#include "core/result.hpp"
#include "core/decoder.hpp"

// input models
#include "core/value.hpp"
#include "core/input_traits.hpp"
#include "formats/json_input.hpp"

// leaf decoders and combinators
#include "core/primitives.hpp"
#include "core/combinators.hpp"

// process-level settings
#include "config/logging_config.hpp"
