#include "kvlimit/evaluator.hpp"
#include <algorithm>
#include <limits>

namespace kvlimit
{

    namespace
    {
        // a - b, clamped to the int64 range
        std::int64_t saturating_sub(std::int64_t a, std::int64_t b)
        {
            constexpr auto max = std::numeric_limits<std::int64_t>::max();
            constexpr auto min = std::numeric_limits<std::int64_t>::min();
            if (b < 0 && a > max + b)
                return max;
            if (b > 0 && a < min + b)
                return min;
            return a - b;
        }
    } // namespace

    std::optional<std::uint64_t> Evaluation::remaining() const
    {
        std::optional<std::uint64_t> least;
        for (const auto &u : usage)
        {
            std::uint64_t left = u.count >= u.rule.max_count ? 0 : u.rule.max_count - u.count;
            least = least ? std::min(*least, left) : left;
        }
        return least;
    }

    Evaluation evaluate(const RuleSet &rule_set, const WindowRecord &record, Timestamp now)
    {
        Evaluation out;
        out.pruned = record;
        out.candidate = now;

        auto horizon = rule_set.horizon();
        if (!horizon)
            return out;

        out.pruned.prune(now, *horizon);

        const auto &rules = rule_set.rules();
        out.usage.reserve(rules.size());
        for (std::size_t i = 0; i < rules.size(); ++i)
        {
            const Rule &rule = rules[i];
            auto window_start = now - rule.window;
            auto count = out.pruned.count_since(window_start);
            out.usage.push_back(RuleUsage{rule, count});

            if (count < rule.max_count)
                continue;

            // count >= max_count >= 1, so there is an oldest counted entry
            auto oldest = out.pruned.oldest_since(window_start).value_or(now);
            // Stored keys may lie arbitrarily far in the future
            auto age = saturating_sub(to_unix_seconds(now), to_unix_seconds(oldest));
            Duration retry_after{saturating_sub(rule.window.count(), age)};
            if (!out.denial || retry_after < out.denial->retry_after)
            {
                out.denial = Denial{i, rule, count, retry_after};
            }
        }

        out.allowed = !out.denial.has_value();
        return out;
    }

} // namespace kvlimit
