//! # JSON Parsing Stage
//!
//! Umbrella header for the schema-agnostic half of the pipeline: errors,
//! the parse tree, the limit guard, the tokenizer and the structural parser.
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace strictjson::json;
//!
//! auto result = parse_json(bytes, LimitConfig{});
//! ```

#pragma once

#include "json/json_error.hpp"
#include "json/json_lexer.hpp"
#include "json/json_limits.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
