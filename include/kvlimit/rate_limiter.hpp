#pragma once

#include "audit.hpp"
#include "evaluator.hpp"
#include "kv_store.hpp"
#include "rule_set.hpp"
#include "types.hpp"
#include "window_record.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvlimit
{

    /**
     * One-shot permission to record an allowed action.
     *
     * Carries the pruned history the decision was made against, so redeeming
     * writes history + timestamp without a second read. Dropping a ticket
     * leaves the store untouched. Tickets are move-only; a moved-from ticket
     * is spent.
     */
    class Ticket
    {
    public:
        Ticket(const Ticket &) = delete;
        Ticket &operator=(const Ticket &) = delete;
        Ticket(Ticket &&other) noexcept;
        Ticket &operator=(Ticket &&other) noexcept;
        ~Ticket() = default;

        /** Full storage key ("<namespace>/<key>"). */
        const std::string &key() const { return key_; }
        Timestamp timestamp() const { return timestamp_; }
        Duration horizon() const { return horizon_; }
        const WindowRecord &record() const { return record_; }
        bool redeemed() const { return spent_; }

        /**
         * Append the ticket's timestamp to its history and overwrite the stored
         * value (last write wins). The value expires from the store one second
         * after the longest window. A failed write leaves the ticket usable;
         * redeeming a spent ticket is a TicketRedeemed error.
         */
        Result<void> redeem(KvStore &store);

    private:
        friend class RateLimiter;

        Ticket(std::string key, Timestamp timestamp, Duration horizon, WindowRecord record,
               std::shared_ptr<AuditLogger> audit);

        std::string key_;
        Timestamp timestamp_{};
        Duration horizon_{};
        WindowRecord record_;
        std::shared_ptr<AuditLogger> audit_;
        bool spent_{false};
    };

    /** Outcome of RateLimiter::check. */
    class Verdict
    {
    public:
        bool allowed() const { return allowed_; }

        /** Set for denied checks: blocking rule and retry hint. */
        const std::optional<Denial> &denial() const { return denial_; }

        /** Headroom left under the tightest rule, not counting this action. */
        std::optional<std::uint64_t> remaining() const { return remaining_; }

        bool has_ticket() const { return ticket_.has_value(); }

        /** Move the ticket out; later calls return nullopt. */
        std::optional<Ticket> take_ticket();

    private:
        friend class RateLimiter;

        Verdict(bool allowed, std::optional<Denial> denial, std::optional<std::uint64_t> remaining,
                std::optional<Ticket> ticket);

        bool allowed_{false};
        std::optional<Denial> denial_;
        std::optional<std::uint64_t> remaining_;
        std::optional<Ticket> ticket_;
    };

    /**
     * Sliding-window limiter over an external key-value store.
     *
     * check() reads the caller's history and decides; it never writes. An
     * allowed check hands out a Ticket, and only redeeming that ticket records
     * the action, so work that fails after admission is not charged.
     *
     * There is no locking between check and redeem. Concurrent callers for the
     * same key may all pass and then overwrite each other's history, so some
     * actions can go uncounted and a client can briefly exceed its limits.
     */
    class RateLimiter
    {
    public:
        explicit RateLimiter(RuleSet rules);

        const RuleSet &rules() const { return rules_; }

        /** Emit a DecisionEvent for every check and redeem. */
        void set_audit_logger(std::shared_ptr<AuditLogger> audit);

        /** Pure decision over an already loaded history. */
        Evaluation evaluate(const WindowRecord &record, Timestamp now) const;

        /**
         * Load the history for key and decide at now. Store failures are
         * returned as-is; no verdict is assumed on error.
         */
        Result<Verdict> check(KvStore &store, std::string_view key, Timestamp now) const;

        /** Caller keys that currently have a stored history under this namespace. */
        Result<std::vector<std::string>> tracked_keys(KvStore &store) const;

    private:
        void audit(const DecisionEvent &event) const;

        RuleSet rules_;
        std::shared_ptr<AuditLogger> audit_;
    };

} // namespace kvlimit
