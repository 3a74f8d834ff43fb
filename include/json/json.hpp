//! # jcodec JSON Library
//!
//! Main public header of the codec: tokenizer, parser, value model and
//! generator over in-memory text.
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace jcodec;
//! using namespace jcodec::json;
//!
//! auto result = parse_json(R"({"code":200,"success":true})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.dump_pretty(2) << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | Error kinds with location information |
//! | `json_value.hpp` | `JsonValue`, `JsonType`, `JsonArray`, `JsonObject` |
//! | `json_tokenizer.hpp` | Lexical scanner |
//! | `json_parser.hpp` | Recursive descent parser, `parse_json` |
//! | `json_generator.hpp` | Serializer, `stringify`, `stringify_pretty` |
//! | `json_access.hpp` | Checked projections (`field`, `as_*_checked`) |

#pragma once

#include "json/json_access.hpp"
#include "json/json_error.hpp"
#include "json/json_generator.hpp"
#include "json/json_parser.hpp"
#include "json/json_tokenizer.hpp"
#include "json/json_value.hpp"
