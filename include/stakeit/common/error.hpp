#pragma once

#include <datapod/datapod.hpp>

namespace stakeit {

    // ===========================================
    // Stakeit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_PARAMETER = 100;
    constexpr dp::u32 ERR_INVALID_CLOSE_BLOCK = 101;
    constexpr dp::u32 ERR_NOT_FOUND = 102;
    constexpr dp::u32 ERR_BET_NOT_FOUND = 103;
    constexpr dp::u32 ERR_UNAUTHORIZED = 104;
    constexpr dp::u32 ERR_MARKET_CLOSED = 105;
    constexpr dp::u32 ERR_MARKET_ALREADY_RESOLVED = 106;
    constexpr dp::u32 ERR_MARKET_NOT_CLOSED = 107;
    constexpr dp::u32 ERR_MARKET_EXPIRED = 108;
    constexpr dp::u32 ERR_MARKET_NOT_EXPIRED = 109;
    constexpr dp::u32 ERR_MARKET_NOT_RESOLVED = 110;
    constexpr dp::u32 ERR_INVALID_BET = 111;
    constexpr dp::u32 ERR_BET_TOO_LOW = 112;
    constexpr dp::u32 ERR_BET_TOO_HIGH = 113;
    constexpr dp::u32 ERR_BET_LOST = 114;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 115;
    constexpr dp::u32 ERR_TRANSFER_FAILED = 116;
    constexpr dp::u32 ERR_HASH_FAILED = 117;

    /// Broad failure category of an error code
    enum class ErrorKind : dp::u8 {
        Validation = 0,    // bad description, block window or amount
        Lifecycle = 1,     // market is in the wrong phase
        Authorization = 2, // not owner, not creator
        Resource = 3,      // market or bet not found
        Funds = 4,         // balance or transfer problems
        Internal = 5,      // hashing or other engine faults
        Unknown = 6,
    };

    inline ErrorKind errorKind(dp::u32 code) {
        switch (code) {
        case ERR_INVALID_PARAMETER:
        case ERR_INVALID_CLOSE_BLOCK:
        case ERR_INVALID_BET:
        case ERR_BET_TOO_LOW:
        case ERR_BET_TOO_HIGH:
            return ErrorKind::Validation;
        case ERR_MARKET_CLOSED:
        case ERR_MARKET_ALREADY_RESOLVED:
        case ERR_MARKET_NOT_CLOSED:
        case ERR_MARKET_EXPIRED:
        case ERR_MARKET_NOT_EXPIRED:
        case ERR_MARKET_NOT_RESOLVED:
        case ERR_BET_LOST:
            return ErrorKind::Lifecycle;
        case ERR_UNAUTHORIZED:
            return ErrorKind::Authorization;
        case ERR_NOT_FOUND:
        case ERR_BET_NOT_FOUND:
            return ErrorKind::Resource;
        case ERR_INSUFFICIENT_FUNDS:
        case ERR_TRANSFER_FAILED:
            return ErrorKind::Funds;
        case ERR_HASH_FAILED:
            return ErrorKind::Internal;
        default:
            return ErrorKind::Unknown;
        }
    }

    inline ErrorKind errorKind(const dp::Error &err) { return errorKind(err.code); }

    inline const char *errorKindToString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Lifecycle:
            return "lifecycle";
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::Resource:
            return "resource";
        case ErrorKind::Funds:
            return "funds";
        case ErrorKind::Internal:
            return "internal";
        default:
            return "unknown";
        }
    }

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_parameter(const dp::String &msg = "Invalid parameter") {
        return dp::Error{ERR_INVALID_PARAMETER, msg};
    }

    inline dp::Error invalid_close_block(const dp::String &msg = "Invalid close block") {
        return dp::Error{ERR_INVALID_CLOSE_BLOCK, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "Market not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error bet_not_found(const dp::String &msg = "Bet not found") {
        return dp::Error{ERR_BET_NOT_FOUND, msg};
    }

    inline dp::Error unauthorized(const dp::String &msg = "Unauthorized") { return dp::Error{ERR_UNAUTHORIZED, msg}; }

    inline dp::Error market_closed(const dp::String &msg = "Market closed") {
        return dp::Error{ERR_MARKET_CLOSED, msg};
    }

    inline dp::Error market_already_resolved(const dp::String &msg = "Market already resolved") {
        return dp::Error{ERR_MARKET_ALREADY_RESOLVED, msg};
    }

    inline dp::Error market_not_closed(const dp::String &msg = "Market not closed") {
        return dp::Error{ERR_MARKET_NOT_CLOSED, msg};
    }

    inline dp::Error market_expired(const dp::String &msg = "Market expired") {
        return dp::Error{ERR_MARKET_EXPIRED, msg};
    }

    inline dp::Error market_not_expired(const dp::String &msg = "Market not expired") {
        return dp::Error{ERR_MARKET_NOT_EXPIRED, msg};
    }

    inline dp::Error market_not_resolved(const dp::String &msg = "Market not resolved") {
        return dp::Error{ERR_MARKET_NOT_RESOLVED, msg};
    }

    inline dp::Error invalid_bet(const dp::String &msg = "Invalid bet") { return dp::Error{ERR_INVALID_BET, msg}; }

    inline dp::Error bet_too_low(const dp::String &msg = "Bet too low") { return dp::Error{ERR_BET_TOO_LOW, msg}; }

    inline dp::Error bet_too_high(const dp::String &msg = "Bet too high") { return dp::Error{ERR_BET_TOO_HIGH, msg}; }

    inline dp::Error bet_lost(const dp::String &msg = "Bet lost") { return dp::Error{ERR_BET_LOST, msg}; }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error transfer_failed(const dp::String &msg = "Value transfer failed") {
        return dp::Error{ERR_TRANSFER_FAILED, msg};
    }

    inline dp::Error hash_failed(const dp::String &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, msg};
    }

} // namespace stakeit
