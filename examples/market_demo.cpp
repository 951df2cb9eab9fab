#include <stakeit/stakeit.hpp>
#include <iostream>
#include <string>

using namespace stakeit;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void report(const std::string &what, const dp::Result<void, dp::Error> &result) {
    if (result.is_ok()) {
        std::cout << "   " << what << ": ok" << std::endl;
    } else {
        std::cout << "   " << what << ": rejected (" << result.error().message.c_str() << ", "
                  << errorKindToString(errorKind(result.error())) << ")" << std::endl;
    }
}

int main() {
    std::cout << "=== Stakeit Prediction Market Demo ===" << std::endl;

    ledger::ManualClock clock(1000);
    ledger::Vault vault;
    for (const auto &user : {"alice", "bob", "carol"}) {
        if (!vault.deposit(user, 500).is_ok()) {
            std::cerr << "Failed to fund " << user << std::endl;
            return 1;
        }
    }

    Exchange exchange("admin", clock, vault);

    printSeparator("1. CREATE MARKET");
    auto market_result = exchange.createMarket("Will the policy pass?", clock.blockHeight() + 200, "alice");
    if (!market_result.is_ok()) {
        std::cerr << "Failed to create market: " << market_result.error().message.c_str() << std::endl;
        return 1;
    }
    MarketId market_id = market_result.value();
    auto market = exchange.getMarket(market_id).value();
    std::cout << "   Market #" << market_id << " closes at " << market.close_block << ", expires at "
              << market.expiry_block << std::endl;

    printSeparator("2. PLACE BETS");
    report("alice bets 50 on yes", exchange.placeBet(market_id, true, 50, "alice"));
    report("alice adds 30 on yes", exchange.placeBet(market_id, true, 30, "alice"));
    report("bob bets 120 on no", exchange.placeBet(market_id, false, 120, "bob"));
    report("carol bets 5 on yes", exchange.placeBet(market_id, true, 5, "carol"));
    report("carol bets 40 on yes", exchange.placeBet(market_id, true, 40, "carol"));
    std::cout << "   Escrow holds " << exchange.escrowBalance() << std::endl;

    printSeparator("3. RESOLVE");
    report("resolve before close", exchange.resolveMarket(market_id, true, "alice"));
    report("mine 200 blocks", clock.advance(200));
    report("bet after close", exchange.placeBet(market_id, true, 20, "bob"));
    report("resolve yes", exchange.resolveMarket(market_id, true, "alice"));

    printSeparator("4. CLAIM");
    for (const auto &user : {"alice", "bob", "carol"}) {
        auto claim = exchange.claimWinnings(market_id, user);
        if (claim.is_ok()) {
            std::cout << "   " << user << " recovered " << claim.value() << std::endl;
        } else {
            std::cout << "   " << user << " claim rejected: " << claim.error().message.c_str() << std::endl;
        }
    }

    printSeparator("5. EXPIRE AND CLEAN UP");
    report("jump to expiry", clock.setHeight(market.expiry_block));
    std::cout << "   Outstanding bets: " << exchange.outstandingBets(market_id) << std::endl;
    report("cleanup by bob", exchange.cleanupExpiredMarket(market_id, "bob"));
    report("cleanup by alice", exchange.cleanupExpiredMarket(market_id, "alice"));

    printSeparator("6. ADMINISTRATION");
    report("min bet by bob", exchange.setMinBetAmount(20, "bob"));
    report("min bet by admin", exchange.setMinBetAmount(20, "admin"));
    report("hand over to treasury", exchange.transferOwnership("treasury", "admin"));

    printSeparator("SUMMARY");
    exchange.printSummary();
    std::cout << std::endl;
    vault.printSummary();

    return 0;
}
