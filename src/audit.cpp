#include "kvlimit/audit.hpp"
#include "kvlimit/logging.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace kvlimit
{

    nlohmann::json DecisionEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"action", action},
                              {"key", key},
                              {"result", result},
                              {"details", details}};
    }

    DecisionEvent DecisionEvent::create(Timestamp at, std::string action, std::string key,
                                        std::string result, nlohmann::json details)
    {
        return DecisionEvent{std::format("{:%FT%TZ}", at),
                             std::move(action),
                             std::move(key),
                             std::move(result),
                             std::move(details)};
    }

    AuditLogger::AuditLogger() : sink_(logging::logger()) {}

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> sink) : sink_(std::move(sink)) {}

    void AuditLogger::log(const DecisionEvent &event)
    {
        sink_->info(event.to_json().dump());
    }

} // namespace kvlimit
