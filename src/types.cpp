#include "kvlimit/types.hpp"

namespace kvlimit
{

    Timestamp system_now()
    {
        return std::chrono::floor<Duration>(std::chrono::system_clock::now());
    }

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::DecodeError:
            return "DecodeError";
        case ErrorCode::TicketRedeemed:
            return "TicketRedeemed";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        }
        return "Unknown";
    }

} // namespace kvlimit
