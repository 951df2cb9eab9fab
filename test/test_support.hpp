#pragma once

#include "stakeit/stakeit.hpp"
#include <string>

// Vault wrapper whose transfers can be switched off to simulate a host ledger failure
class SwitchableTransfer : public stakeit::ledger::IValueTransfer {
  public:
    stakeit::ledger::Vault vault;
    bool fail_transfers = false;
    int attempted = 0;

    stakeit::Amount balanceOf(const stakeit::Principal &principal) const override {
        return vault.balanceOf(principal);
    }

    dp::Result<void, dp::Error> transfer(const stakeit::Principal &from, const stakeit::Principal &to,
                                         stakeit::Amount amount) override {
        attempted++;
        if (fail_transfers) {
            return dp::Result<void, dp::Error>::err(stakeit::transfer_failed("Host ledger unavailable"));
        }
        return vault.transfer(from, to, amount);
    }
};

inline std::string messageOf(const dp::Error &err) { return std::string(err.message.c_str()); }
