#include "kvlimit/config.hpp"
#include "kvlimit/logging.hpp"
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace kvlimit
{
    namespace
    {
        Result<LimitConfig> parse_limit(const toml::table &tbl, std::size_t index)
        {
            LimitConfig limit;
            const auto where = "limits[" + std::to_string(index) + "]";

            if (auto secs = tbl["window"].value<int64_t>())
            {
                limit.window = Duration{*secs};
            }
            else if (auto text = tbl["window"].value<std::string>())
            {
                auto parsed = ConfigLoader::parse_duration(*text);
                if (!parsed)
                    return std::unexpected(KvLimitError::config(where + ": " + parsed.error().what()));
                limit.window = *parsed;
            }
            else
            {
                return std::unexpected(KvLimitError::config(where + ": missing or invalid 'window'"));
            }

            auto count = tbl["max_count"].value<int64_t>();
            if (!count || *count < 0)
            {
                return std::unexpected(KvLimitError::config(where + ": 'max_count' must be a non-negative integer"));
            }
            limit.max_count = static_cast<std::uint64_t>(*count);
            return limit;
        }

        Result<LimiterConfig> parse_toml(const toml::table &tbl, LimiterConfig cfg)
        {
            if (auto ns = tbl["namespace"].value<std::string>())
                cfg.name_space = *ns;

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto audit = (*logging)["audit"].value<bool>())
                    cfg.logging.audit = *audit;
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto limits = tbl["limits"].as_array())
            {
                cfg.limits.clear();
                for (std::size_t i = 0; i < limits->size(); ++i)
                {
                    auto entry = limits->get(i)->as_table();
                    if (!entry)
                    {
                        return std::unexpected(KvLimitError::config("limits[" + std::to_string(i) + "] must be a table"));
                    }
                    auto limit = parse_limit(*entry, i);
                    if (!limit)
                        return std::unexpected(limit.error());
                    cfg.limits.push_back(*limit);
                }
            }

            return cfg;
        }

    } // namespace

    Result<LimiterConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(KvLimitError::io("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<LimiterConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        LimiterConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(KvLimitError::parsing(std::string("Failed to parse TOML: ") + std::string(e.description())));
        }

        apply_env_overrides(cfg);
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(LimiterConfig &cfg)
    {
        if (const char *ns = std::getenv("KVLIMIT_NAMESPACE"))
            cfg.name_space = ns;
        if (const char *level = std::getenv("KVLIMIT_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit = std::getenv("KVLIMIT_AUDIT_ENABLED"))
            cfg.logging.audit = std::string(audit) != "0";
        if (const char *path = std::getenv("KVLIMIT_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
    }

    Result<RuleSet> ConfigLoader::build_rule_set(const LimiterConfig &cfg)
    {
        try
        {
            RuleSet rules(cfg.name_space);
            for (const auto &limit : cfg.limits)
                rules.add_limit(limit.window, limit.max_count);
            return rules;
        }
        catch (const KvLimitError &e)
        {
            return std::unexpected(e);
        }
    }

    Result<std::shared_ptr<AuditLogger>> ConfigLoader::apply_logging(const LimiterConfig &cfg)
    {
        if (auto res = logging::set_level(cfg.logging.level); !res)
            return std::unexpected(res.error());
        if (!cfg.logging.audit)
            return std::shared_ptr<AuditLogger>{};
        return std::make_shared<AuditLogger>();
    }

    Result<Duration> ConfigLoader::parse_duration(std::string_view text)
    {
        std::int64_t value{};
        const char *first = text.data();
        const char *last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr == first)
        {
            return std::unexpected(KvLimitError::config("Invalid duration: '" + std::string(text) + "'"));
        }

        std::string_view unit(ptr, static_cast<std::size_t>(last - ptr));
        std::int64_t scale = 0;
        if (unit.empty() || unit == "s")
            scale = 1;
        else if (unit == "m")
            scale = 60;
        else if (unit == "h")
            scale = 3600;
        else if (unit == "d")
            scale = 86400;
        else
            return std::unexpected(KvLimitError::config("Unknown duration unit in '" + std::string(text) + "'"));

        if (value > std::numeric_limits<std::int64_t>::max() / scale ||
            value < std::numeric_limits<std::int64_t>::min() / scale)
        {
            return std::unexpected(KvLimitError::config("Duration out of range: '" + std::string(text) + "'"));
        }
        return Duration{value * scale};
    }

    nlohmann::json ConfigLoader::to_json(const LimiterConfig &cfg)
    {
        nlohmann::json limits = nlohmann::json::array();
        for (const auto &limit : cfg.limits)
        {
            limits.push_back({{"window_seconds", limit.window.count()},
                              {"max_count", limit.max_count}});
        }

        nlohmann::json j;
        j["namespace"] = cfg.name_space;
        j["limits"] = limits;
        j["logging"] = {{"level", cfg.logging.level}, {"audit", cfg.logging.audit}};
        j["storage"] = {{"rocksdb_path", cfg.storage.rocksdb_path}};
        return j;
    }

} // namespace kvlimit
