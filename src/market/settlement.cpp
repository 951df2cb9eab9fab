#include <stakeit/common/error.hpp>
#include <stakeit/market/settlement.hpp>

namespace stakeit::market {

    SettlementEngine::SettlementEngine(MarketRegistry &registry, BetLedger &bets, const ConfigStore &config,
                                       const ledger::IBlockClock &clock, ledger::IValueTransfer &funds)
        : registry_(registry), bets_(bets), config_(config), clock_(clock), funds_(funds) {}

    dp::Result<void, dp::Error> SettlementEngine::resolve(MarketId market_id, bool outcome, const Principal &caller) {
        const Market *market = registry_.find(market_id);
        if (market == nullptr) {
            return dp::Result<void, dp::Error>::err(not_found());
        }
        if (config_.bounds().resolution_policy == ResolutionPolicy::CreatorOnly && market->creator != caller) {
            return dp::Result<void, dp::Error>::err(unauthorized("Only the market creator can resolve"));
        }
        if (market->isResolved()) {
            return dp::Result<void, dp::Error>::err(market_already_resolved());
        }

        BlockHeight now = clock_.blockHeight();
        if (!market->isClosedAt(now)) {
            return dp::Result<void, dp::Error>::err(market_not_closed());
        }
        if (market->isExpiredAt(now)) {
            return dp::Result<void, dp::Error>::err(market_expired());
        }

        return registry_.setOutcome(market_id, outcome);
    }

    dp::Result<Amount, dp::Error> SettlementEngine::claim(MarketId market_id, const Principal &caller) {
        const Market *market = registry_.find(market_id);
        if (market == nullptr) {
            return dp::Result<Amount, dp::Error>::err(not_found());
        }
        auto bet = bets_.getBet(market_id, caller);
        if (!bet.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(bet.error());
        }
        if (!market->isResolved()) {
            return dp::Result<Amount, dp::Error>::err(market_not_resolved());
        }
        if (market->isExpiredAt(clock_.blockHeight())) {
            return dp::Result<Amount, dp::Error>::err(market_expired("Claim window closed at expiry"));
        }
        if (bet.value().prediction != *market->outcome) {
            return dp::Result<Amount, dp::Error>::err(bet_lost());
        }

        auto paid = payout(market_id, caller, bet.value().amount);
        if (!paid.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(paid.error());
        }
        return dp::Result<Amount, dp::Error>::ok(paid.value().amount);
    }

    dp::Result<Amount, dp::Error> SettlementEngine::refund(MarketId market_id, const Principal &caller) {
        const Market *market = registry_.find(market_id);
        if (market == nullptr) {
            return dp::Result<Amount, dp::Error>::err(not_found());
        }
        auto bet = bets_.getBet(market_id, caller);
        if (!bet.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(bet.error());
        }
        if (!market->isExpiredAt(clock_.blockHeight())) {
            return dp::Result<Amount, dp::Error>::err(market_not_expired());
        }
        if (market->isResolved()) {
            return dp::Result<Amount, dp::Error>::err(market_already_resolved("Resolved markets are not refundable"));
        }

        auto paid = payout(market_id, caller, bet.value().amount);
        if (!paid.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(paid.error());
        }
        return dp::Result<Amount, dp::Error>::ok(paid.value().amount);
    }

    dp::Result<Bet, dp::Error> SettlementEngine::payout(MarketId market_id, const Principal &caller, Amount amount) {
        auto transfer = funds_.transfer(bets_.escrowAccount(), caller, amount);
        if (!transfer.is_ok()) {
            return dp::Result<Bet, dp::Error>::err(transfer.error());
        }
        return bets_.removeBet(market_id, caller);
    }

} // namespace stakeit::market
