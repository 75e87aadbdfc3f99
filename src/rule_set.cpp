#include "kvlimit/rule_set.hpp"
#include <algorithm>
#include <format>

namespace kvlimit
{

    RuleSet::RuleSet(std::string name_space)
        : name_space_(std::move(name_space))
    {
        if (name_space_.empty())
        {
            throw KvLimitError::config("Rule set namespace must not be empty");
        }
    }

    RuleSet &RuleSet::add_limit(Duration window, std::uint64_t max_count)
    {
        if (window <= Duration::zero())
        {
            throw KvLimitError::config(std::format(
                "Rule window must be positive (got {}s) in namespace '{}'",
                window.count(),
                name_space_));
        }
        if (max_count == 0)
        {
            throw KvLimitError::config(std::format(
                "Rule max_count must be at least 1 (window {}s) in namespace '{}'",
                window.count(),
                name_space_));
        }
        rules_.push_back(Rule{window, max_count});
        return *this;
    }

    std::optional<Duration> RuleSet::horizon() const
    {
        if (rules_.empty())
            return std::nullopt;
        auto longest = std::max_element(rules_.begin(), rules_.end(),
                                        [](const Rule &a, const Rule &b)
                                        { return a.window < b.window; });
        return longest->window;
    }

    std::string RuleSet::storage_key(std::string_view key) const
    {
        std::string out;
        out.reserve(name_space_.size() + 1 + key.size());
        out.append(name_space_);
        out.push_back('/');
        out.append(key);
        return out;
    }

} // namespace kvlimit
