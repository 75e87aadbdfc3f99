#pragma once

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvlimit
{

    /** "At most max_count actions in any trailing window" */
    struct Rule
    {
        Duration window{};
        std::uint64_t max_count{0};

        bool operator==(const Rule &) const = default;
    };

    /**
     * Ordered set of limit rules scoped under a storage namespace.
     *
     * Built once at setup and treated as immutable afterwards: the pruning
     * horizon of every stored record is derived from the longest window, so
     * rules can be added but never removed. Invalid input throws
     * KvLimitError (ConfigError) instead of producing a rule that never fires.
     */
    class RuleSet
    {
    public:
        /** @throws KvLimitError when name_space is empty */
        explicit RuleSet(std::string name_space);

        /**
         * Append a rule. Rules are evaluated in insertion order; duplicates
         * are kept and each one is checked.
         * @throws KvLimitError for a non-positive window or a zero count
         */
        RuleSet &add_limit(Duration window, std::uint64_t max_count);

        const std::string &name_space() const { return name_space_; }
        const std::vector<Rule> &rules() const { return rules_; }
        bool empty() const { return rules_.empty(); }
        std::size_t size() const { return rules_.size(); }

        /** Longest configured window, or nullopt when no rule is configured. */
        std::optional<Duration> horizon() const;

        /** "<namespace>/<key>"; the key is not escaped. */
        std::string storage_key(std::string_view key) const;

    private:
        std::string name_space_;
        std::vector<Rule> rules_;
    };

} // namespace kvlimit
