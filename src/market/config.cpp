#include <iostream>
#include <stakeit/common/error.hpp>
#include <stakeit/market/config.hpp>
#include <stdexcept>

namespace stakeit::market {

    dp::Result<void, dp::Error> MarketConfig::validate() const {
        if (min_close_delay == 0 || min_close_delay > max_close_delay) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Close delay bounds are inconsistent"));
        }
        if (min_description_length == 0 || min_description_length > max_description_length) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Description length bounds are inconsistent"));
        }
        if (min_expiry_period == 0 || min_expiry_period > max_expiry_period) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Expiry period bounds are inconsistent"));
        }
        if (default_expiry_period < min_expiry_period || default_expiry_period > max_expiry_period) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Default expiry period out of range"));
        }
        if (max_expiry_window < min_close_delay + default_expiry_period) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Expiry window too small for any market"));
        }
        if (default_min_bet == 0 || default_min_bet >= default_max_bet || default_max_bet > bet_ceiling) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Default bet bounds are inconsistent"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    ConfigStore::ConfigStore(const Principal &owner, const MarketConfig &bounds)
        : bounds_(bounds), owner_(owner), min_bet_(bounds.default_min_bet), max_bet_(bounds.default_max_bet),
          expiry_period_(bounds.default_expiry_period) {
        if (owner_.empty()) {
            throw std::invalid_argument("ConfigStore owner must not be empty");
        }
        auto check = bounds_.validate();
        if (!check.is_ok()) {
            throw std::invalid_argument(std::string("Invalid market config: ") + check.error().message.c_str());
        }
    }

    const Principal &ConfigStore::getOwner() const { return owner_; }

    bool ConfigStore::isOwner(const Principal &caller) const { return caller == owner_; }

    Amount ConfigStore::getMinBet() const { return min_bet_; }

    Amount ConfigStore::getMaxBet() const { return max_bet_; }

    BlockHeight ConfigStore::getExpiryPeriod() const { return expiry_period_; }

    const MarketConfig &ConfigStore::bounds() const { return bounds_; }

    dp::Result<void, dp::Error> ConfigStore::setExpiryPeriod(BlockHeight period, const Principal &caller) {
        if (!isOwner(caller)) {
            std::cout << "Unauthorized participant: " << caller << " cannot set expiry period" << std::endl;
            return dp::Result<void, dp::Error>::err(unauthorized("Only the owner can set the expiry period"));
        }
        if (period < bounds_.min_expiry_period || period > bounds_.max_expiry_period) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Expiry period out of range"));
        }
        expiry_period_ = period;
        std::cout << "Expiry period set to " << period << " blocks" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ConfigStore::setMinBet(Amount amount, const Principal &caller) {
        if (!isOwner(caller)) {
            std::cout << "Unauthorized participant: " << caller << " cannot set minimum bet" << std::endl;
            return dp::Result<void, dp::Error>::err(unauthorized("Only the owner can set the minimum bet"));
        }
        if (amount == 0) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Minimum bet must be positive"));
        }
        if (amount >= max_bet_) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Minimum bet must be below maximum bet"));
        }
        min_bet_ = amount;
        std::cout << "Minimum bet set to " << amount << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ConfigStore::setMaxBet(Amount amount, const Principal &caller) {
        if (!isOwner(caller)) {
            std::cout << "Unauthorized participant: " << caller << " cannot set maximum bet" << std::endl;
            return dp::Result<void, dp::Error>::err(unauthorized("Only the owner can set the maximum bet"));
        }
        if (amount <= min_bet_) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Maximum bet must exceed minimum bet"));
        }
        if (amount > bounds_.bet_ceiling) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("Maximum bet exceeds ceiling"));
        }
        max_bet_ = amount;
        std::cout << "Maximum bet set to " << amount << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ConfigStore::transferOwnership(const Principal &new_owner, const Principal &caller) {
        if (!isOwner(caller)) {
            std::cout << "Unauthorized participant: " << caller << " cannot transfer ownership" << std::endl;
            return dp::Result<void, dp::Error>::err(unauthorized("Only the owner can transfer ownership"));
        }
        if (new_owner.empty()) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("New owner must not be empty"));
        }
        if (new_owner == owner_) {
            return dp::Result<void, dp::Error>::err(invalid_parameter("New owner is already the owner"));
        }
        std::cout << "Ownership transferred from " << owner_ << " to " << new_owner << std::endl;
        owner_ = new_owner;
        return dp::Result<void, dp::Error>::ok();
    }

    void ConfigStore::printSummary() const {
        std::cout << "=== Config Summary ===" << std::endl;
        std::cout << "Owner: " << owner_ << std::endl;
        std::cout << "Bet Range: [" << min_bet_ << ", " << max_bet_ << "]" << std::endl;
        std::cout << "Expiry Period: " << expiry_period_ << " blocks" << std::endl;
        std::cout << "Close Delay: [" << bounds_.min_close_delay << ", " << bounds_.max_close_delay << "] blocks"
                  << std::endl;
        std::cout << "Resolution: "
                  << (bounds_.resolution_policy == ResolutionPolicy::CreatorOnly ? "creator-only" : "permissionless")
                  << std::endl;
    }

} // namespace stakeit::market
