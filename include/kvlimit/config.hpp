#pragma once

#include "audit.hpp"
#include "rule_set.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kvlimit
{

    struct LimitConfig
    {
        Duration window{};
        std::uint64_t max_count{0};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        bool audit{false};
    };

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/kvlimit"};
    };

    struct LimiterConfig
    {
        std::string name_space{"ratelimit"};
        std::vector<LimitConfig> limits;
        LoggingConfig logging{};
        StorageConfig storage{};
    };

    /**
     * ConfigLoader reads limiter settings from TOML with environment
     * overrides. Its only product for the core is a RuleSet; logging and
     * storage settings are for the embedding process.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<LimiterConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<LimiterConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const LimiterConfig &cfg);

        /** Validate and build the rule set; invalid rules become ConfigError. */
        static Result<RuleSet> build_rule_set(const LimiterConfig &cfg);

        /**
         * Set the kvlimit logger level from [logging]. Returns an AuditLogger
         * on the shared logger when audit is enabled, otherwise nullptr.
         */
        static Result<std::shared_ptr<AuditLogger>> apply_logging(const LimiterConfig &cfg);

        /** "90", "90s", "15m", "1h", "2d" -> seconds. */
        static Result<Duration> parse_duration(std::string_view text);

    private:
        static void apply_env_overrides(LimiterConfig &cfg);
    };

} // namespace kvlimit
