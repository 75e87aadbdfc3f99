#include "kvlimit/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace kvlimit::logging
{

    std::shared_ptr<spdlog::logger> logger()
    {
        static const std::shared_ptr<spdlog::logger> instance = []
        {
            if (auto existing = spdlog::get("kvlimit"))
                return existing;
            return spdlog::stdout_color_mt("kvlimit");
        }();
        return instance;
    }

    Result<void> set_level(std::string_view level)
    {
        std::string name(level);
        auto parsed = spdlog::level::from_str(name);
        // from_str maps unknown names to off, so only accept "off" when asked for it
        if (parsed == spdlog::level::off && name != "off")
        {
            return std::unexpected(KvLimitError::config("Unknown log level: " + name));
        }
        logger()->set_level(parsed);
        return {};
    }

} // namespace kvlimit::logging
