#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kvlimit
{

    /**
     * Absolute instant with whole-second resolution. Stored histories keep
     * Unix seconds, so every timestamp entering the core is truncated to this.
     */
    using Timestamp = std::chrono::sys_seconds;

    /** Span of time used for rule windows, retry hints and store TTLs. */
    using Duration = std::chrono::seconds;

    /** Source of "now" for components that need wall time (store TTLs). */
    using Clock = std::function<Timestamp()>;

    inline Timestamp from_unix_seconds(std::int64_t seconds)
    {
        return Timestamp{Duration{seconds}};
    }

    /** Host clocks usually report milliseconds; the sub-second part is dropped. */
    inline Timestamp from_unix_millis(std::uint64_t millis)
    {
        return from_unix_seconds(static_cast<std::int64_t>(millis / 1000));
    }

    inline std::int64_t to_unix_seconds(Timestamp ts)
    {
        return ts.time_since_epoch().count();
    }

    /** Current system time truncated to seconds. */
    Timestamp system_now();

    /**
     * Error categories for kvlimit operations
     */
    enum class ErrorCode
    {
        ConfigError,
        StorageError,
        DecodeError,
        TicketRedeemed,
        InvalidInput,
        IOError,
        ParsingError
    };

    /** Stable name of an error code, used in log lines. */
    std::string_view error_code_name(ErrorCode code);

    /**
     * kvlimit error with code and message
     */
    class KvLimitError : public std::runtime_error
    {
    public:
        ErrorCode code;

        KvLimitError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static KvLimitError config(const std::string &msg)
        {
            return KvLimitError(ErrorCode::ConfigError, msg);
        }

        static KvLimitError storage(const std::string &msg)
        {
            return KvLimitError(ErrorCode::StorageError, msg);
        }

        static KvLimitError decode(const std::string &msg)
        {
            return KvLimitError(ErrorCode::DecodeError, msg);
        }

        static KvLimitError ticket_redeemed(const std::string &msg)
        {
            return KvLimitError(ErrorCode::TicketRedeemed, msg);
        }

        static KvLimitError invalid_input(const std::string &msg)
        {
            return KvLimitError(ErrorCode::InvalidInput, msg);
        }

        static KvLimitError io(const std::string &msg)
        {
            return KvLimitError(ErrorCode::IOError, msg);
        }

        static KvLimitError parsing(const std::string &msg)
        {
            return KvLimitError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, KvLimitError>;

} // namespace kvlimit
