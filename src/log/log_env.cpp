//! # Log Configuration from the Environment
//!
//! The library takes no command line, so `WEFT_LOG` is the only outside
//! switch for its diagnostics.

#include "weft/log/log.hpp"

#include <cstdlib>

namespace weft::log {

auto config_from_env() -> LogConfig {
    LogConfig config;
    const char* value = std::getenv("WEFT_LOG");
    if (value == nullptr || *value == '\0') {
        return config;
    }

    // A lone level applies to every module; anything else is a filter spec.
    std::string_view text(value);
    if (parse_level(text)) {
        config.filter_spec = "*=" + std::string(text);
    } else {
        config.filter_spec = std::string(text);
    }
    return config;
}

void init_from_env() {
    Logger::instance().configure(config_from_env());
}

} // namespace weft::log
