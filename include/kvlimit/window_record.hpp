#pragma once

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvlimit
{

    /**
     * History of past actions for one (namespace, key) pair.
     *
     * Logically an ascending sequence of timestamps with repeats allowed.
     * Stored run-length (timestamp -> count) since actions landing in the
     * same second are common and the store bills by value size.
     */
    class WindowRecord
    {
    public:
        using Buckets = std::map<Timestamp, std::uint64_t>;

        WindowRecord() = default;

        /** Record n actions at ts. Counts saturate instead of wrapping. */
        void add(Timestamp ts, std::uint64_t n = 1);

        std::uint64_t total() const;
        bool empty() const { return buckets_.empty(); }

        /** Actions at or after from (later-than-now entries included). */
        std::uint64_t count_since(Timestamp from) const;

        /** Earliest timestamp at or after from. */
        std::optional<Timestamp> oldest_since(Timestamp from) const;

        /**
         * Drop every timestamp t with now - t > horizon.
         * @return number of actions dropped
         */
        std::uint64_t prune(Timestamp now, Duration horizon);

        /**
         * Expanded ascending sequence; meant for inspection and tests.
         * Stops after at most limit entries, since decoded counts are unbounded.
         */
        std::vector<Timestamp> timestamps(std::size_t limit = kMaxExpanded) const;

        static constexpr std::size_t kMaxExpanded = 65536;

        const Buckets &buckets() const { return buckets_; }

        bool operator==(const WindowRecord &) const = default;

    private:
        Buckets buckets_;
    };

    /**
     * Serialize as a JSON object of Unix seconds to counts, e.g.
     * {"1710528362":1,"1710528363":2}.
     */
    std::string encode(const WindowRecord &record);

    /** Strict parse of the encode() format. */
    Result<WindowRecord> try_decode(std::string_view raw);

    /**
     * Fail-open parse used on the request path. A missing value is an empty
     * record; an unreadable one is logged and also treated as empty so a
     * poisoned entry in the shared store cannot lock a client out.
     */
    WindowRecord decode(std::optional<std::string_view> raw);

} // namespace kvlimit
