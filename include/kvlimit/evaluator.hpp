#pragma once

#include "rule_set.hpp"
#include "types.hpp"
#include "window_record.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace kvlimit
{

    /** Why an action was refused, for building a rejection response. */
    struct Denial
    {
        std::size_t rule_index{0}; // position in RuleSet::rules()
        Rule rule{};
        std::uint64_t count{0};    // actions counted inside the rule's window
        Duration retry_after{};    // until the oldest counted action leaves the window
    };

    struct RuleUsage
    {
        Rule rule{};
        std::uint64_t count{0};
    };

    struct Evaluation
    {
        bool allowed{true};
        WindowRecord pruned;          // effective history; persisted on redeem
        Timestamp candidate{};        // timestamp a redeemed ticket would add
        std::optional<Denial> denial; // set iff !allowed
        std::vector<RuleUsage> usage; // one entry per rule, in rule order

        /** Smallest headroom left across all rules; nullopt without rules. */
        std::optional<std::uint64_t> remaining() const;
    };

    /**
     * Decide whether an action at now fits every rule of rule_set, given the
     * history loaded from the store.
     *
     * History older than the longest window is pruned first. A rule with
     * window d counts timestamps t where now - t <= d (timestamps later than
     * now, left behind by a clock that ran ahead, are kept and counted). A rule
     * is violated once its count reaches max_count. When several rules are
     * violated the one that frees up soonest is reported.
     *
     * This is a pure function over a snapshot. Two callers evaluating the same
     * key concurrently can both be allowed, and their later writes race with
     * last-write-wins semantics; limits are therefore approximate under
     * contention.
     */
    Evaluation evaluate(const RuleSet &rule_set, const WindowRecord &record, Timestamp now);

} // namespace kvlimit
