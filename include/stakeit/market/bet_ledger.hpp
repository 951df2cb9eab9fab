#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <stakeit/ledger/clock.hpp>
#include <stakeit/ledger/vault.hpp>
#include <stakeit/market/config.hpp>
#include <stakeit/market/registry.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stakeit::market {

    /// Composite key of a stake: one entry per (market, user)
    struct BetKey {
        MarketId market_id{0};
        Principal user;

        inline bool operator==(const BetKey &other) const {
            return market_id == other.market_id && user == other.user;
        }

        inline bool operator!=(const BetKey &other) const { return !(*this == other); }
    };

    struct BetKeyHash {
        inline size_t operator()(const BetKey &key) const {
            size_t h1 = std::hash<MarketId>{}(key.market_id);
            size_t h2 = std::hash<std::string>{}(key.user);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    /// Accumulated stake of one user on one market.
    /// `prediction` is whatever the latest placeBet said, regardless of how the stake was built up.
    struct Bet {
        Amount amount{0};
        bool prediction{false};
    };

    /// Records stakes and moves them into escrow
    class BetLedger {
      private:
        const MarketRegistry &registry_;
        const ConfigStore &config_;
        const ledger::IBlockClock &clock_;
        ledger::IValueTransfer &funds_;
        Principal escrow_;
        std::unordered_map<BetKey, Bet, BetKeyHash> bets_;
        std::unordered_map<MarketId, Amount> escrowed_;

      public:
        BetLedger(const MarketRegistry &registry, const ConfigStore &config, const ledger::IBlockClock &clock,
                  ledger::IValueTransfer &funds, Principal escrow);

        /// Stake `amount` on `prediction`. The transfer into escrow and the ledger
        /// update happen together or not at all.
        dp::Result<void, dp::Error> placeBet(MarketId market_id, bool prediction, Amount amount,
                                             const Principal &caller);

        dp::Result<Bet, dp::Error> getBet(MarketId market_id, const Principal &user) const;

        bool hasBet(MarketId market_id, const Principal &user) const;

        /// Delete a bet after its stake has left escrow; returns the removed bet
        dp::Result<Bet, dp::Error> removeBet(MarketId market_id, const Principal &user);

        /// Sum of outstanding stakes recorded against a market
        Amount totalStaked(MarketId market_id) const;

        size_t betCount(MarketId market_id) const;

        size_t size() const;

        std::vector<std::pair<Principal, Bet>> betsFor(MarketId market_id) const;

        const Principal &escrowAccount() const;
    };

} // namespace stakeit::market
