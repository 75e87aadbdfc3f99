#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace spdlog
{
    class logger;
}

namespace kvlimit
{
    /** One limiter decision or commit, as written to the audit log. */
    struct DecisionEvent
    {
        std::string ts;     // ISO 8601, the decision time passed by the caller
        std::string action; // "check" or "redeem"
        std::string key;    // full storage key
        std::string result; // "allow", "deny", "committed" or "error"
        nlohmann::json details;

        nlohmann::json to_json() const;

        static DecisionEvent create(Timestamp at, std::string action, std::string key,
                                    std::string result, nlohmann::json details = nlohmann::json::object());
    };

    /** Writes decision events through spdlog, one JSON object per line. */
    class AuditLogger
    {
    public:
        /** Logs through the shared kvlimit logger. */
        AuditLogger();
        explicit AuditLogger(std::shared_ptr<spdlog::logger> sink);

        void log(const DecisionEvent &event);

    private:
        std::shared_ptr<spdlog::logger> sink_;
    };

} // namespace kvlimit
