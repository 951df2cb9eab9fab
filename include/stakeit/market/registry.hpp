#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <stakeit/ledger/clock.hpp>
#include <stakeit/market/config.hpp>
#include <stakeit/market/market.hpp>
#include <string>
#include <vector>

namespace stakeit::market {

    /// Owns market records and allocates their ids.
    /// Ids start at 1 and are never reused, even after cleanup.
    class MarketRegistry {
      private:
        const ConfigStore &config_;
        const ledger::IBlockClock &clock_;
        std::map<MarketId, Market> markets_;
        MarketId last_id_{0};

      public:
        MarketRegistry(const ConfigStore &config, const ledger::IBlockClock &clock);

        dp::Result<MarketId, dp::Error> create(const std::string &description, BlockHeight close_block,
                                               const Principal &caller);

        /// Delete an expired market; only its creator may do so.
        /// Bets still recorded against the market are left in place.
        dp::Result<void, dp::Error> cleanup(MarketId market_id, const Principal &caller);

        /// Record the outcome; validation is the settlement engine's job
        dp::Result<void, dp::Error> setOutcome(MarketId market_id, bool outcome);

        dp::Result<Market, dp::Error> get(MarketId market_id) const;

        const Market *find(MarketId market_id) const;

        bool contains(MarketId market_id) const;

        dp::Result<MarketState, dp::Error> stateOf(MarketId market_id) const;

        MarketId lastId() const;

        size_t size() const;

        std::vector<MarketId> ids() const;

        void printSummary() const;
    };

} // namespace stakeit::market
