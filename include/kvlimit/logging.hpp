#pragma once

#include "types.hpp"
#include <memory>
#include <string_view>

namespace spdlog
{
    class logger;
}

namespace kvlimit::logging
{

    /** Shared "kvlimit" spdlog logger; created on first use with a stdout sink. */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * Set the logger threshold by name: trace, debug, info, warn, error,
     * critical or off. Unknown names are a ConfigError.
     */
    Result<void> set_level(std::string_view level);

} // namespace kvlimit::logging
