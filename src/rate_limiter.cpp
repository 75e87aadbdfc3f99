#include "kvlimit/rate_limiter.hpp"
#include "kvlimit/logging.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace kvlimit
{

    namespace
    {
        nlohmann::json denial_details(const Denial &denial)
        {
            return nlohmann::json{{"rule_index", denial.rule_index},
                                  {"window_seconds", denial.rule.window.count()},
                                  {"max_count", denial.rule.max_count},
                                  {"count", denial.count},
                                  {"retry_after_seconds", denial.retry_after.count()}};
        }
    } // namespace

    // ========== Ticket ==========

    Ticket::Ticket(std::string key, Timestamp timestamp, Duration horizon, WindowRecord record,
                   std::shared_ptr<AuditLogger> audit)
        : key_(std::move(key)),
          timestamp_(timestamp),
          horizon_(horizon),
          record_(std::move(record)),
          audit_(std::move(audit))
    {
    }

    Ticket::Ticket(Ticket &&other) noexcept
        : key_(std::move(other.key_)),
          timestamp_(other.timestamp_),
          horizon_(other.horizon_),
          record_(std::move(other.record_)),
          audit_(std::move(other.audit_)),
          spent_(std::exchange(other.spent_, true))
    {
    }

    Ticket &Ticket::operator=(Ticket &&other) noexcept
    {
        if (this != &other)
        {
            key_ = std::move(other.key_);
            timestamp_ = other.timestamp_;
            horizon_ = other.horizon_;
            record_ = std::move(other.record_);
            audit_ = std::move(other.audit_);
            spent_ = std::exchange(other.spent_, true);
        }
        return *this;
    }

    Result<void> Ticket::redeem(KvStore &store)
    {
        if (spent_)
        {
            return std::unexpected(KvLimitError::ticket_redeemed("Ticket for '" + key_ + "' was already redeemed"));
        }

        WindowRecord next = record_;
        next.add(timestamp_);

        PutOptions options;
        options.expiration_ttl = horizon_ + Duration{1};

        if (auto res = store.put(key_, encode(next), options); !res)
        {
            logging::logger()->error("Store write failed for '{}' ({}): {}", key_,
                                     error_code_name(res.error().code), res.error().what());
            if (audit_)
                audit_->log(DecisionEvent::create(timestamp_, "redeem", key_, "error",
                                                  {{"error", res.error().what()}}));
            return res;
        }

        spent_ = true;
        record_ = std::move(next);
        logging::logger()->debug("Recorded action for '{}' ({} in history)", key_, record_.total());
        if (audit_)
            audit_->log(DecisionEvent::create(timestamp_, "redeem", key_, "committed",
                                              {{"history", record_.total()}}));
        return {};
    }

    // ========== Verdict ==========

    Verdict::Verdict(bool allowed, std::optional<Denial> denial, std::optional<std::uint64_t> remaining,
                     std::optional<Ticket> ticket)
        : allowed_(allowed),
          denial_(std::move(denial)),
          remaining_(remaining),
          ticket_(std::move(ticket))
    {
    }

    std::optional<Ticket> Verdict::take_ticket()
    {
        std::optional<Ticket> out = std::move(ticket_);
        ticket_.reset();
        return out;
    }

    // ========== RateLimiter ==========

    RateLimiter::RateLimiter(RuleSet rules) : rules_(std::move(rules)) {}

    void RateLimiter::set_audit_logger(std::shared_ptr<AuditLogger> audit)
    {
        audit_ = std::move(audit);
    }

    void RateLimiter::audit(const DecisionEvent &event) const
    {
        if (audit_)
            audit_->log(event);
    }

    Evaluation RateLimiter::evaluate(const WindowRecord &record, Timestamp now) const
    {
        return kvlimit::evaluate(rules_, record, now);
    }

    Result<Verdict> RateLimiter::check(KvStore &store, std::string_view key, Timestamp now) const
    {
        auto storage_key = rules_.storage_key(key);

        auto raw = store.get(storage_key);
        if (!raw)
        {
            logging::logger()->error("Store read failed for '{}' ({}): {}", storage_key,
                                     error_code_name(raw.error().code), raw.error().what());
            audit(DecisionEvent::create(now, "check", storage_key, "error",
                                        {{"error", raw.error().what()}}));
            return std::unexpected(raw.error());
        }

        std::optional<std::string_view> bytes;
        if (raw->has_value())
            bytes = **raw;

        auto eval = evaluate(decode(bytes), now);
        auto remaining = eval.remaining();

        if (!eval.allowed)
        {
            const auto &denial = *eval.denial;
            logging::logger()->debug("Denied '{}': rule {} ({} per {}s) has {}, retry in {}s",
                                     storage_key, denial.rule_index, denial.rule.max_count,
                                     denial.rule.window.count(), denial.count, denial.retry_after.count());
            audit(DecisionEvent::create(now, "check", storage_key, "deny", denial_details(denial)));
            return Verdict(false, std::move(eval.denial), remaining, std::nullopt);
        }

        std::optional<Ticket> ticket;
        if (auto horizon = rules_.horizon())
        {
            ticket = Ticket(storage_key, eval.candidate, *horizon, std::move(eval.pruned), audit_);
        }

        logging::logger()->debug("Allowed '{}'", storage_key);
        nlohmann::json details = nlohmann::json::object();
        if (remaining)
            details["remaining"] = *remaining;
        audit(DecisionEvent::create(now, "check", storage_key, "allow", std::move(details)));
        return Verdict(true, std::nullopt, remaining, std::move(ticket));
    }

    Result<std::vector<std::string>> RateLimiter::tracked_keys(KvStore &store) const
    {
        auto prefix = rules_.storage_key("");
        auto listed = store.list(prefix);
        if (!listed)
        {
            logging::logger()->error("Store list failed for '{}' ({}): {}", prefix,
                                     error_code_name(listed.error().code), listed.error().what());
            return std::unexpected(listed.error());
        }

        std::vector<std::string> keys;
        keys.reserve(listed->size());
        for (const auto &full : *listed)
            keys.push_back(full.substr(prefix.size()));
        return keys;
    }

} // namespace kvlimit
