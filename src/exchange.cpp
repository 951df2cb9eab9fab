#include <iostream>
#include <stakeit/common/error.hpp>
#include <stakeit/exchange.hpp>
#include <stdexcept>

namespace stakeit {

    namespace {

        const Principal &checkedEscrow(const Principal &escrow_account, const Principal &owner) {
            if (escrow_account.empty()) {
                throw std::invalid_argument("Escrow account must not be empty");
            }
            if (escrow_account == owner) {
                throw std::invalid_argument("Escrow account must differ from the owner");
            }
            return escrow_account;
        }

    } // namespace

    Exchange::Exchange(const Principal &owner, ledger::IBlockClock &clock, ledger::IValueTransfer &funds,
                       const market::MarketConfig &config, const Principal &escrow_account)
        : clock_(clock), funds_(funds), config_(owner, config), registry_(config_, clock_),
          bets_(registry_, config_, clock_, funds_, checkedEscrow(escrow_account, owner)),
          settlement_(registry_, bets_, config_, clock_, funds_) {}

    void Exchange::record(ledger::EntryKind kind, const Principal &actor, MarketId market_id, Amount amount, bool flag,
                          const std::string &detail) {
        auto entry = journal_.append(kind, clock_.blockHeight(), actor, market_id, amount, flag, detail);
        if (!entry.is_ok()) {
            journal_faults_++;
            std::cout << "Error: " << ledger::entryKindToString(kind) << " by " << actor
                      << " applied but not journaled: " << entry.error().message.c_str() << std::endl;
        }
    }

    // ===========================================
    // Market lifecycle
    // ===========================================

    dp::Result<MarketId, dp::Error> Exchange::createMarket(const std::string &description, BlockHeight close_block,
                                                           const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = registry_.create(description, close_block, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::MarketCreated, caller, result.value(), 0, false, description);
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::placeBet(MarketId market_id, bool prediction, Amount amount,
                                                   const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = bets_.placeBet(market_id, prediction, amount, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::BetPlaced, caller, market_id, amount, prediction);
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::resolveMarket(MarketId market_id, bool outcome, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = settlement_.resolve(market_id, outcome, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::MarketResolved, caller, market_id, bets_.totalStaked(market_id), outcome);
        }
        return result;
    }

    dp::Result<Amount, dp::Error> Exchange::claimWinnings(MarketId market_id, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = settlement_.claim(market_id, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::WinningsClaimed, caller, market_id, result.value(), true);
        }
        return result;
    }

    dp::Result<Amount, dp::Error> Exchange::refundExpiredBet(MarketId market_id, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = settlement_.refund(market_id, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::BetRefunded, caller, market_id, result.value());
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::cleanupExpiredMarket(MarketId market_id, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t outstanding = bets_.betCount(market_id);
        Amount locked = bets_.totalStaked(market_id);

        auto result = registry_.cleanup(market_id, caller);
        if (!result.is_ok()) {
            return result;
        }

        std::string detail;
        if (outstanding > 0) {
            std::cout << "Warning: market " << market_id << " cleaned up with " << outstanding
                      << " outstanding bet(s) holding " << locked << " in escrow" << std::endl;
            detail = std::to_string(outstanding) + " outstanding bet(s) orphaned";
        }
        record(ledger::EntryKind::MarketCleaned, caller, market_id, locked, false, detail);
        return result;
    }

    // ===========================================
    // Administration
    // ===========================================

    dp::Result<void, dp::Error> Exchange::setExpiryPeriod(BlockHeight period, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = config_.setExpiryPeriod(period, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::ConfigUpdated, caller, 0, period, false, "expiry-period");
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::setMinBetAmount(Amount amount, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = config_.setMinBet(amount, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::ConfigUpdated, caller, 0, amount, false, "min-bet");
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::setMaxBetAmount(Amount amount, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = config_.setMaxBet(amount, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::ConfigUpdated, caller, 0, amount, false, "max-bet");
        }
        return result;
    }

    dp::Result<void, dp::Error> Exchange::transferOwnership(const Principal &new_owner, const Principal &caller) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto result = config_.transferOwnership(new_owner, caller);
        if (result.is_ok()) {
            record(ledger::EntryKind::OwnershipTransferred, caller, 0, 0, false, new_owner);
        }
        return result;
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<market::Market, dp::Error> Exchange::getMarket(MarketId market_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.get(market_id);
    }

    dp::Result<market::MarketState, dp::Error> Exchange::getMarketState(MarketId market_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.stateOf(market_id);
    }

    dp::Result<market::Bet, dp::Error> Exchange::getBet(MarketId market_id, const Principal &user) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bets_.getBet(market_id, user);
    }

    Principal Exchange::getOwner() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.getOwner();
    }

    Amount Exchange::getMinBetAmount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.getMinBet();
    }

    Amount Exchange::getMaxBetAmount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.getMaxBet();
    }

    BlockHeight Exchange::getExpiryPeriod() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.getExpiryPeriod();
    }

    MarketId Exchange::lastMarketId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.lastId();
    }

    size_t Exchange::marketCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.size();
    }

    Amount Exchange::totalStaked(MarketId market_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bets_.totalStaked(market_id);
    }

    size_t Exchange::outstandingBets(MarketId market_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bets_.betCount(market_id);
    }

    Amount Exchange::escrowBalance() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return funds_.balanceOf(bets_.escrowAccount());
    }

    BlockHeight Exchange::currentBlock() const { return clock_.blockHeight(); }

    const Principal &Exchange::escrowAccount() const { return bets_.escrowAccount(); }

    ledger::Journal Exchange::journal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_;
    }

    size_t Exchange::journalFaults() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_faults_;
    }

    void Exchange::printSummary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "=== Exchange Summary ===" << std::endl;
        std::cout << "Escrow Account: " << bets_.escrowAccount() << " (balance "
                  << funds_.balanceOf(bets_.escrowAccount()) << ")" << std::endl;
        std::cout << "Outstanding Bets: " << bets_.size() << std::endl;
        if (journal_faults_ > 0)
            std::cout << "Journal Faults: " << journal_faults_ << std::endl;
        std::cout << std::endl;
        config_.printSummary();
        std::cout << std::endl;
        registry_.printSummary();
        std::cout << std::endl;
        journal_.printSummary();
    }

} // namespace stakeit
