#pragma once

#include <datapod/datapod.hpp>
#include <stakeit/ledger/clock.hpp>
#include <stakeit/ledger/vault.hpp>
#include <stakeit/market/bet_ledger.hpp>
#include <stakeit/market/config.hpp>
#include <stakeit/market/registry.hpp>

namespace stakeit::market {

    /// Resolves markets and returns escrowed principal.
    ///
    /// Payouts are 1:1 returns of the bettor's own stake: a winner gets back
    /// exactly what they put in, losers forfeit their stake to escrow, and
    /// nothing from the losing side is redistributed.
    ///
    /// Every operation checks all of its preconditions before touching state,
    /// then performs the transfer, then mutates the ledger. A failed transfer
    /// leaves the bet in place.
    class SettlementEngine {
      private:
        MarketRegistry &registry_;
        BetLedger &bets_;
        const ConfigStore &config_;
        const ledger::IBlockClock &clock_;
        ledger::IValueTransfer &funds_;

        dp::Result<Bet, dp::Error> payout(MarketId market_id, const Principal &caller, Amount amount);

      public:
        SettlementEngine(MarketRegistry &registry, BetLedger &bets, const ConfigStore &config,
                         const ledger::IBlockClock &clock, ledger::IValueTransfer &funds);

        /// Set the outcome of a closed, unexpired, unresolved market.
        /// Any caller may resolve unless the config asks for CreatorOnly.
        dp::Result<void, dp::Error> resolve(MarketId market_id, bool outcome, const Principal &caller);

        /// Return a winning stake before expiry; yields the amount paid
        dp::Result<Amount, dp::Error> claim(MarketId market_id, const Principal &caller);

        /// Return a stake on a market that expired unresolved; yields the amount paid
        dp::Result<Amount, dp::Error> refund(MarketId market_id, const Principal &caller);
    };

} // namespace stakeit::market
