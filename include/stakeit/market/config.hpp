#pragma once

#include <datapod/datapod.hpp>
#include <stakeit/common/types.hpp>
#include <string>

namespace stakeit::market {

    /// Who may resolve a closed market
    enum class ResolutionPolicy : dp::u8 {
        Permissionless = 0, // any caller
        CreatorOnly = 1,    // only the market creator
    };

    /// Protocol bounds and defaults, fixed for the lifetime of an engine
    struct MarketConfig {
        // Close block window, relative to the creation block
        BlockHeight min_close_delay = 10;
        BlockHeight max_close_delay = 52560;

        // Description length in bytes
        size_t min_description_length = 1;
        size_t max_description_length = 256;

        // Blocks between close and expiry
        BlockHeight default_expiry_period = 10000;
        BlockHeight min_expiry_period = 144;
        BlockHeight max_expiry_period = 52560;

        // Longest distance from the creation block to the expiry block
        BlockHeight max_expiry_window = 62560;

        // Per-(market, user) cumulative stake
        Amount default_min_bet = 10;
        Amount default_max_bet = 1000000;
        Amount bet_ceiling = 1000000000000ULL; // upper bound accepted by setMaxBet

        ResolutionPolicy resolution_policy = ResolutionPolicy::Permissionless;

        /// Check that the bounds and defaults are mutually consistent
        dp::Result<void, dp::Error> validate() const;
    };

    /// Owner-gated mutable settings: bet bounds, expiry period and ownership
    class ConfigStore {
      private:
        MarketConfig bounds_;
        Principal owner_;
        Amount min_bet_;
        Amount max_bet_;
        BlockHeight expiry_period_;

      public:
        /// Throws std::invalid_argument if `owner` is empty or `bounds` fail validation
        explicit ConfigStore(const Principal &owner, const MarketConfig &bounds = MarketConfig{});

        const Principal &getOwner() const;
        bool isOwner(const Principal &caller) const;

        Amount getMinBet() const;
        Amount getMaxBet() const;
        BlockHeight getExpiryPeriod() const;
        const MarketConfig &bounds() const;

        dp::Result<void, dp::Error> setExpiryPeriod(BlockHeight period, const Principal &caller);

        dp::Result<void, dp::Error> setMinBet(Amount amount, const Principal &caller);

        dp::Result<void, dp::Error> setMaxBet(Amount amount, const Principal &caller);

        /// Single-step handoff; there is no acceptance by the new owner
        dp::Result<void, dp::Error> transferOwnership(const Principal &new_owner, const Principal &caller);

        void printSummary() const;
    };

} // namespace stakeit::market
