#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <map>
#include <stakeit/common/error.hpp>
#include <stakeit/common/types.hpp>

namespace stakeit::ledger {

    /// Atomic value-transfer primitive of the host ledger.
    /// A failed transfer must leave every balance untouched.
    class IValueTransfer {
      public:
        virtual ~IValueTransfer() = default;

        virtual Amount balanceOf(const Principal &principal) const = 0;

        virtual dp::Result<void, dp::Error> transfer(const Principal &from, const Principal &to, Amount amount) = 0;
    };

    /// In-memory balance book implementing IValueTransfer
    class Vault : public IValueTransfer {
      public:
        Vault() = default;

        /// Mint `amount` into an account
        inline dp::Result<void, dp::Error> deposit(const Principal &principal, Amount amount) {
            if (principal.empty()) {
                return dp::Result<void, dp::Error>::err(invalid_parameter("Empty principal"));
            }
            Amount current = balanceOf(principal);
            if (current + amount < current || total_supply_ + amount < total_supply_) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Balance overflow"));
            }
            balances_[principal] = current + amount;
            total_supply_ += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline Amount balanceOf(const Principal &principal) const override {
            auto it = balances_.find(principal);
            return (it != balances_.end()) ? it->second : 0;
        }

        inline dp::Result<void, dp::Error> transfer(const Principal &from, const Principal &to,
                                                    Amount amount) override {
            if (from.empty() || to.empty()) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Empty principal"));
            }
            if (amount == 0) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Zero-value transfer"));
            }
            if (from == to) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Sender and recipient are the same"));
            }

            Amount from_balance = balanceOf(from);
            if (from_balance < amount) {
                return dp::Result<void, dp::Error>::err(insufficient_funds());
            }
            Amount to_balance = balanceOf(to);
            if (to_balance + amount < to_balance) {
                return dp::Result<void, dp::Error>::err(transfer_failed("Recipient balance overflow"));
            }

            balances_[from] = from_balance - amount;
            balances_[to] = to_balance + amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline Amount totalSupply() const { return total_supply_; }

        inline size_t accountCount() const { return balances_.size(); }

        inline void printSummary() const {
            std::cout << "=== Vault Summary ===" << std::endl;
            std::cout << "Accounts (" << balances_.size() << "), total supply " << total_supply_ << ":" << std::endl;
            for (const auto &[principal, balance] : balances_) {
                std::cout << "  " << principal << ": " << balance << std::endl;
            }
        }

      private:
        std::map<Principal, Amount> balances_;
        Amount total_supply_{0};
    };

} // namespace stakeit::ledger
