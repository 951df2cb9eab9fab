#include <iostream>
#include <stakeit/common/error.hpp>
#include <stakeit/market/registry.hpp>

namespace stakeit::market {

    MarketRegistry::MarketRegistry(const ConfigStore &config, const ledger::IBlockClock &clock)
        : config_(config), clock_(clock) {}

    dp::Result<MarketId, dp::Error> MarketRegistry::create(const std::string &description, BlockHeight close_block,
                                                           const Principal &caller) {
        const auto &bounds = config_.bounds();
        if (description.size() < bounds.min_description_length ||
            description.size() > bounds.max_description_length) {
            return dp::Result<MarketId, dp::Error>::err(invalid_parameter("Description length out of range"));
        }

        BlockHeight now = clock_.blockHeight();
        if (close_block < now) {
            return dp::Result<MarketId, dp::Error>::err(invalid_close_block("Close block is in the past"));
        }
        BlockHeight delay = close_block - now;
        if (delay < bounds.min_close_delay || delay > bounds.max_close_delay) {
            return dp::Result<MarketId, dp::Error>::err(invalid_close_block("Close block outside allowed window"));
        }

        BlockHeight expiry_block = close_block + config_.getExpiryPeriod();
        if (expiry_block <= close_block) {
            return dp::Result<MarketId, dp::Error>::err(invalid_parameter("Expiry block must follow close block"));
        }
        if (expiry_block - now > bounds.max_expiry_window) {
            return dp::Result<MarketId, dp::Error>::err(invalid_parameter("Expiry block too far in the future"));
        }

        Market market;
        market.id = last_id_ + 1;
        market.description = description;
        market.created_block = now;
        market.close_block = close_block;
        market.expiry_block = expiry_block;
        market.creator = caller;

        last_id_ = market.id;
        markets_.emplace(market.id, std::move(market));
        return dp::Result<MarketId, dp::Error>::ok(last_id_);
    }

    dp::Result<void, dp::Error> MarketRegistry::cleanup(MarketId market_id, const Principal &caller) {
        auto it = markets_.find(market_id);
        if (it == markets_.end()) {
            return dp::Result<void, dp::Error>::err(not_found());
        }
        if (!it->second.isExpiredAt(clock_.blockHeight())) {
            return dp::Result<void, dp::Error>::err(market_not_expired());
        }
        if (it->second.creator != caller) {
            return dp::Result<void, dp::Error>::err(unauthorized("Only the market creator can clean up"));
        }
        markets_.erase(it);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> MarketRegistry::setOutcome(MarketId market_id, bool outcome) {
        auto it = markets_.find(market_id);
        if (it == markets_.end()) {
            return dp::Result<void, dp::Error>::err(not_found());
        }
        if (it->second.outcome) {
            return dp::Result<void, dp::Error>::err(market_already_resolved());
        }
        it->second.outcome = outcome;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Market, dp::Error> MarketRegistry::get(MarketId market_id) const {
        auto it = markets_.find(market_id);
        if (it == markets_.end()) {
            return dp::Result<Market, dp::Error>::err(not_found());
        }
        return dp::Result<Market, dp::Error>::ok(it->second);
    }

    const Market *MarketRegistry::find(MarketId market_id) const {
        auto it = markets_.find(market_id);
        return (it != markets_.end()) ? &it->second : nullptr;
    }

    bool MarketRegistry::contains(MarketId market_id) const { return markets_.find(market_id) != markets_.end(); }

    dp::Result<MarketState, dp::Error> MarketRegistry::stateOf(MarketId market_id) const {
        const Market *market = find(market_id);
        if (market == nullptr) {
            return dp::Result<MarketState, dp::Error>::err(not_found());
        }
        return dp::Result<MarketState, dp::Error>::ok(market->stateAt(clock_.blockHeight()));
    }

    MarketId MarketRegistry::lastId() const { return last_id_; }

    size_t MarketRegistry::size() const { return markets_.size(); }

    std::vector<MarketId> MarketRegistry::ids() const {
        std::vector<MarketId> result;
        result.reserve(markets_.size());
        for (const auto &[id, market] : markets_)
            result.push_back(id);
        return result;
    }

    void MarketRegistry::printSummary() const {
        BlockHeight now = clock_.blockHeight();
        std::cout << "=== Market Registry Summary ===" << std::endl;
        std::cout << "Current Block: " << now << std::endl;
        std::cout << "Markets (" << markets_.size() << ", last id " << last_id_ << "):" << std::endl;
        for (const auto &[id, market] : markets_) {
            std::cout << "  #" << id << " [" << marketStateToString(market.stateAt(now)) << "] "
                      << market.description << std::endl;
            std::cout << "    creator=" << market.creator << " close=" << market.close_block
                      << " expiry=" << market.expiry_block;
            if (market.outcome)
                std::cout << " outcome=" << (*market.outcome ? "yes" : "no");
            std::cout << std::endl;
        }
    }

} // namespace stakeit::market
