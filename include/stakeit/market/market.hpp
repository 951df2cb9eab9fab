#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <stakeit/common/types.hpp>
#include <string>

namespace stakeit::market {

    /// Lifecycle phase of a market at a given block height
    enum class MarketState : dp::u8 {
        Open = 0,     // accepting bets
        Closed = 1,   // awaiting resolution
        Resolved = 2, // outcome known, winners may claim until expiry
        Expired = 3,  // expiry reached unresolved, bettors may refund
    };

    inline std::string marketStateToString(MarketState state) {
        switch (state) {
        case MarketState::Open:
            return "open";
        case MarketState::Closed:
            return "closed";
        case MarketState::Resolved:
            return "resolved";
        case MarketState::Expired:
            return "expired";
        default:
            return "unknown";
        }
    }

    /// Binary-outcome market record.
    /// Invariant: expiry_block > close_block > created_block.
    struct Market {
        MarketId id{0};
        std::string description;
        std::optional<bool> outcome;
        BlockHeight created_block{0};
        BlockHeight close_block{0};
        BlockHeight expiry_block{0};
        Principal creator;

        inline bool isResolved() const { return outcome.has_value(); }

        inline bool isClosedAt(BlockHeight height) const { return height >= close_block; }

        inline bool isExpiredAt(BlockHeight height) const { return height >= expiry_block; }

        inline MarketState stateAt(BlockHeight height) const {
            if (outcome)
                return MarketState::Resolved;
            if (isExpiredAt(height))
                return MarketState::Expired;
            if (isClosedAt(height))
                return MarketState::Closed;
            return MarketState::Open;
        }
    };

} // namespace stakeit::market
