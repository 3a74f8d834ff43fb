//! # Log Configuration from the Environment
//!
//! The codec has no command line, so a host program configures its
//! diagnostics through three variables:
//!
//! | Variable | Value |
//! |----------|-------|
//! | `JCODEC_LOG` | `debug`, or module rules such as `json.parser=trace,*=warn` |
//! | `JCODEC_LOG_FILE` | Path of a file to append records to |
//! | `JCODEC_LOG_FORMAT` | `json` for one JSON object per line, otherwise text |

#include "log/log.hpp"

#include <cstdlib>
#include <string>
#include <utility>

namespace jcodec::log {

namespace {

/// Returns the value of `name`, or an empty string when it is unset.
auto read_env(const char* name) -> std::string {
    std::string value;
#ifdef _WIN32
    char* env_buf = nullptr;
    size_t env_len = 0;
    if (_dupenv_s(&env_buf, &env_len, name) == 0 && env_buf != nullptr) {
        value = env_buf;
        free(env_buf);
    }
#else
    if (const char* env = std::getenv(name)) {
        value = env;
    }
#endif
    return value;
}

} // namespace

auto log_config_from_env() -> LogConfig {
    LogConfig config;

    std::string filter = read_env("JCODEC_LOG");
    if (filter.find_first_of("=,") != std::string::npos) {
        config.filter_spec = std::move(filter);
    } else if (!filter.empty()) {
        config.level = parse_level(filter);
    }

    config.log_file = read_env("JCODEC_LOG_FILE");

    config.format = parse_format(read_env("JCODEC_LOG_FORMAT"));

    return config;
}

} // namespace jcodec::log
