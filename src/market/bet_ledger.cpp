#include <algorithm>
#include <stakeit/common/error.hpp>
#include <stakeit/market/bet_ledger.hpp>

namespace stakeit::market {

    BetLedger::BetLedger(const MarketRegistry &registry, const ConfigStore &config, const ledger::IBlockClock &clock,
                         ledger::IValueTransfer &funds, Principal escrow)
        : registry_(registry), config_(config), clock_(clock), funds_(funds), escrow_(std::move(escrow)) {}

    dp::Result<void, dp::Error> BetLedger::placeBet(MarketId market_id, bool prediction, Amount amount,
                                                    const Principal &caller) {
        const Market *market = registry_.find(market_id);
        if (market == nullptr) {
            return dp::Result<void, dp::Error>::err(not_found());
        }

        Amount min_bet = config_.getMinBet();
        Amount max_bet = config_.getMaxBet();
        if (amount < min_bet) {
            return dp::Result<void, dp::Error>::err(bet_too_low());
        }
        if (amount > max_bet) {
            return dp::Result<void, dp::Error>::err(bet_too_high());
        }

        BetKey key{market_id, caller};
        auto it = bets_.find(key);
        Amount existing = (it != bets_.end()) ? it->second.amount : 0;
        if (existing + amount < existing) {
            return dp::Result<void, dp::Error>::err(invalid_bet("Stake overflow"));
        }
        if (existing + amount > max_bet) {
            return dp::Result<void, dp::Error>::err(bet_too_high("Cumulative stake exceeds maximum bet"));
        }

        if (market->isClosedAt(clock_.blockHeight())) {
            return dp::Result<void, dp::Error>::err(market_closed());
        }
        if (market->isResolved()) {
            return dp::Result<void, dp::Error>::err(market_already_resolved());
        }
        if (funds_.balanceOf(caller) < amount) {
            return dp::Result<void, dp::Error>::err(insufficient_funds());
        }

        auto transfer = funds_.transfer(caller, escrow_, amount);
        if (!transfer.is_ok()) {
            return dp::Result<void, dp::Error>::err(transfer.error());
        }

        Bet &bet = bets_[key];
        bet.amount = existing + amount;
        bet.prediction = prediction;
        escrowed_[market_id] += amount;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Bet, dp::Error> BetLedger::getBet(MarketId market_id, const Principal &user) const {
        auto it = bets_.find(BetKey{market_id, user});
        if (it == bets_.end()) {
            return dp::Result<Bet, dp::Error>::err(bet_not_found());
        }
        return dp::Result<Bet, dp::Error>::ok(it->second);
    }

    bool BetLedger::hasBet(MarketId market_id, const Principal &user) const {
        return bets_.find(BetKey{market_id, user}) != bets_.end();
    }

    dp::Result<Bet, dp::Error> BetLedger::removeBet(MarketId market_id, const Principal &user) {
        auto it = bets_.find(BetKey{market_id, user});
        if (it == bets_.end()) {
            return dp::Result<Bet, dp::Error>::err(bet_not_found());
        }
        Bet removed = it->second;
        bets_.erase(it);

        auto escrow_it = escrowed_.find(market_id);
        if (escrow_it != escrowed_.end()) {
            escrow_it->second -= std::min(escrow_it->second, removed.amount);
            if (escrow_it->second == 0)
                escrowed_.erase(escrow_it);
        }
        return dp::Result<Bet, dp::Error>::ok(removed);
    }

    Amount BetLedger::totalStaked(MarketId market_id) const {
        auto it = escrowed_.find(market_id);
        return (it != escrowed_.end()) ? it->second : 0;
    }

    size_t BetLedger::betCount(MarketId market_id) const {
        size_t count = 0;
        for (const auto &[key, bet] : bets_) {
            if (key.market_id == market_id)
                count++;
        }
        return count;
    }

    size_t BetLedger::size() const { return bets_.size(); }

    std::vector<std::pair<Principal, Bet>> BetLedger::betsFor(MarketId market_id) const {
        std::vector<std::pair<Principal, Bet>> result;
        for (const auto &[key, bet] : bets_) {
            if (key.market_id == market_id)
                result.emplace_back(key.user, bet);
        }
        std::sort(result.begin(), result.end(),
                  [](const auto &a, const auto &b) { return a.first < b.first; });
        return result;
    }

    const Principal &BetLedger::escrowAccount() const { return escrow_; }

} // namespace stakeit::market
