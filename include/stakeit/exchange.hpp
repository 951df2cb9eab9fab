#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <stakeit/ledger/clock.hpp>
#include <stakeit/ledger/journal.hpp>
#include <stakeit/ledger/vault.hpp>
#include <stakeit/market/bet_ledger.hpp>
#include <stakeit/market/config.hpp>
#include <stakeit/market/registry.hpp>
#include <stakeit/market/settlement.hpp>
#include <string>

namespace stakeit {

    // ===========================================
    // Exchange - prediction market escrow facade
    // ===========================================

    /// Single entry point for market, bet, settlement and admin operations.
    ///
    /// Operations are strictly serial: each call holds the exchange mutex from
    /// validation through transfer, mutation and journaling. A failed call
    /// changes nothing, including the journal.
    ///
    /// The clock and value-transfer collaborators are owned by the host and
    /// must outlive the exchange.
    class Exchange {
      public:
        static constexpr const char *DEFAULT_ESCROW_ACCOUNT = "stakeit.escrow";

        /// Throws std::invalid_argument on an empty owner/escrow or invalid config
        Exchange(const Principal &owner, ledger::IBlockClock &clock, ledger::IValueTransfer &funds,
                 const market::MarketConfig &config = market::MarketConfig{},
                 const Principal &escrow_account = DEFAULT_ESCROW_ACCOUNT);

        Exchange(const Exchange &) = delete;
        Exchange &operator=(const Exchange &) = delete;

        // ===========================================
        // Market lifecycle
        // ===========================================

        dp::Result<MarketId, dp::Error> createMarket(const std::string &description, BlockHeight close_block,
                                                     const Principal &caller);

        dp::Result<void, dp::Error> placeBet(MarketId market_id, bool prediction, Amount amount,
                                             const Principal &caller);

        dp::Result<void, dp::Error> resolveMarket(MarketId market_id, bool outcome, const Principal &caller);

        /// @return amount transferred back to the caller
        dp::Result<Amount, dp::Error> claimWinnings(MarketId market_id, const Principal &caller);

        /// @return amount transferred back to the caller
        dp::Result<Amount, dp::Error> refundExpiredBet(MarketId market_id, const Principal &caller);

        /// Deletes the market even if bets are still outstanding; those bets can
        /// no longer be claimed or refunded afterwards. Check outstandingBets() first.
        dp::Result<void, dp::Error> cleanupExpiredMarket(MarketId market_id, const Principal &caller);

        // ===========================================
        // Administration (owner only)
        // ===========================================

        dp::Result<void, dp::Error> setExpiryPeriod(BlockHeight period, const Principal &caller);

        dp::Result<void, dp::Error> setMinBetAmount(Amount amount, const Principal &caller);

        dp::Result<void, dp::Error> setMaxBetAmount(Amount amount, const Principal &caller);

        /// Takes effect immediately; a mistyped owner cannot be undone
        dp::Result<void, dp::Error> transferOwnership(const Principal &new_owner, const Principal &caller);

        // ===========================================
        // Queries
        // ===========================================

        dp::Result<market::Market, dp::Error> getMarket(MarketId market_id) const;

        dp::Result<market::MarketState, dp::Error> getMarketState(MarketId market_id) const;

        dp::Result<market::Bet, dp::Error> getBet(MarketId market_id, const Principal &user) const;

        Principal getOwner() const;

        Amount getMinBetAmount() const;

        Amount getMaxBetAmount() const;

        BlockHeight getExpiryPeriod() const;

        MarketId lastMarketId() const;

        size_t marketCount() const;

        Amount totalStaked(MarketId market_id) const;

        size_t outstandingBets(MarketId market_id) const;

        Amount escrowBalance() const;

        BlockHeight currentBlock() const;

        const Principal &escrowAccount() const;

        /// Copy of the journal taken under the exchange lock
        ledger::Journal journal() const;

        /// Successful operations whose journal entry could not be sealed
        size_t journalFaults() const;

        void printSummary() const;

      private:
        /// Append to the journal; a failure is logged and counted, never rolled into the caller's result
        void record(ledger::EntryKind kind, const Principal &actor, MarketId market_id = 0, Amount amount = 0,
                    bool flag = false, const std::string &detail = "");

        ledger::IBlockClock &clock_;
        ledger::IValueTransfer &funds_;
        market::ConfigStore config_;
        market::MarketRegistry registry_;
        market::BetLedger bets_;
        market::SettlementEngine settlement_;
        ledger::Journal journal_;
        size_t journal_faults_{0};
        mutable std::mutex mutex_;
    };

} // namespace stakeit
