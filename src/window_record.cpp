#include "kvlimit/window_record.hpp"
#include "kvlimit/logging.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <limits>

namespace kvlimit
{

    namespace
    {
        std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b)
        {
            if (a > std::numeric_limits<std::uint64_t>::max() - b)
                return std::numeric_limits<std::uint64_t>::max();
            return a + b;
        }

        std::optional<std::int64_t> parse_seconds(const std::string &text)
        {
            std::int64_t value{};
            const char *first = text.data();
            const char *last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (text.empty() || ec != std::errc{} || ptr != last)
                return std::nullopt;
            return value;
        }
    } // namespace

    void WindowRecord::add(Timestamp ts, std::uint64_t n)
    {
        if (n == 0)
            return;
        auto &count = buckets_[ts];
        count = saturating_add(count, n);
    }

    std::uint64_t WindowRecord::total() const
    {
        std::uint64_t sum = 0;
        for (const auto &[_, n] : buckets_)
            sum = saturating_add(sum, n);
        return sum;
    }

    std::uint64_t WindowRecord::count_since(Timestamp from) const
    {
        std::uint64_t sum = 0;
        for (auto it = buckets_.lower_bound(from); it != buckets_.end(); ++it)
            sum = saturating_add(sum, it->second);
        return sum;
    }

    std::optional<Timestamp> WindowRecord::oldest_since(Timestamp from) const
    {
        auto it = buckets_.lower_bound(from);
        if (it == buckets_.end())
            return std::nullopt;
        return it->first;
    }

    std::uint64_t WindowRecord::prune(Timestamp now, Duration horizon)
    {
        // now - t > horizon  <=>  t < now - horizon
        auto cutoff = buckets_.lower_bound(now - horizon);
        std::uint64_t dropped = 0;
        for (auto it = buckets_.begin(); it != cutoff; ++it)
            dropped = saturating_add(dropped, it->second);
        buckets_.erase(buckets_.begin(), cutoff);
        return dropped;
    }

    std::vector<Timestamp> WindowRecord::timestamps(std::size_t limit) const
    {
        std::vector<Timestamp> out;
        for (const auto &[ts, n] : buckets_)
        {
            std::size_t room = limit - out.size();
            if (room == 0)
                break;
            auto take = n < room ? static_cast<std::size_t>(n) : room;
            out.insert(out.end(), take, ts);
        }
        return out;
    }

    std::string encode(const WindowRecord &record)
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[ts, n] : record.buckets())
        {
            j[std::to_string(to_unix_seconds(ts))] = n;
        }
        return j.dump();
    }

    Result<WindowRecord> try_decode(std::string_view raw)
    {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded())
        {
            return std::unexpected(KvLimitError::decode("Window record is not valid JSON"));
        }
        if (!j.is_object())
        {
            return std::unexpected(KvLimitError::decode("Window record must be a JSON object"));
        }

        WindowRecord record;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            auto seconds = parse_seconds(it.key());
            if (!seconds)
            {
                return std::unexpected(KvLimitError::decode("Window record key is not a Unix timestamp: " + it.key()));
            }
            if (!it.value().is_number_unsigned())
            {
                return std::unexpected(KvLimitError::decode("Window record count is not an unsigned integer at " + it.key()));
            }
            record.add(from_unix_seconds(*seconds), it.value().get<std::uint64_t>());
        }
        return record;
    }

    WindowRecord decode(std::optional<std::string_view> raw)
    {
        if (!raw)
            return WindowRecord{};

        auto parsed = try_decode(*raw);
        if (!parsed)
        {
            logging::logger()->warn("Discarding unreadable window record ({} bytes): {}",
                                    raw->size(), parsed.error().what());
            return WindowRecord{};
        }
        return std::move(*parsed);
    }

} // namespace kvlimit
