#include "test_support.hpp"
#include <doctest/doctest.h>

using namespace stakeit;
using namespace stakeit::market;

namespace {

    // Market created at block 1000, closing at 1200, expiring at 11200
    struct SettlementHarness {
        ConfigStore config;
        ledger::ManualClock clock{1000};
        SwitchableTransfer funds;
        MarketRegistry registry{config, clock};
        BetLedger bets{registry, config, clock, funds, "escrow"};
        SettlementEngine engine{registry, bets, config, clock, funds};
        MarketId market_id{0};

        explicit SettlementHarness(const MarketConfig &bounds = MarketConfig{}) : config("admin", bounds) {
            for (const auto &user : {"alice", "bob", "carol"}) {
                REQUIRE(funds.vault.deposit(user, 1000).is_ok());
            }
            auto id = registry.create("Will X pass?", 1200, "creator");
            REQUIRE(id.is_ok());
            market_id = id.value();
        }

        BlockHeight expiry() const { return registry.get(market_id).value().expiry_block; }
    };

} // namespace

TEST_SUITE("Settlement Engine Tests") {
    TEST_CASE("Resolve is gated by close and expiry blocks") {
        SettlementHarness h;

        CHECK(h.engine.resolve(99, true, "anyone").error().code == ERR_NOT_FOUND);

        auto early = h.engine.resolve(h.market_id, true, "creator");
        REQUIRE_FALSE(early.is_ok());
        CHECK(early.error().code == ERR_MARKET_NOT_CLOSED);

        REQUIRE(h.clock.setHeight(1199).is_ok());
        CHECK(h.engine.resolve(h.market_id, true, "creator").error().code == ERR_MARKET_NOT_CLOSED);

        SUBCASE("at the close block") {
            REQUIRE(h.clock.setHeight(1200).is_ok());
            CHECK(h.engine.resolve(h.market_id, true, "creator").is_ok());
            CHECK(h.registry.get(h.market_id).value().outcome == true);
        }

        SUBCASE("one block before expiry") {
            REQUIRE(h.clock.setHeight(h.expiry() - 1).is_ok());
            CHECK(h.engine.resolve(h.market_id, false, "creator").is_ok());
            CHECK(h.registry.get(h.market_id).value().outcome == false);
        }

        SUBCASE("at expiry") {
            REQUIRE(h.clock.setHeight(h.expiry()).is_ok());
            auto result = h.engine.resolve(h.market_id, true, "creator");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_MARKET_EXPIRED);
            CHECK_FALSE(h.registry.get(h.market_id).value().isResolved());
        }
    }

    TEST_CASE("A market resolves only once") {
        SettlementHarness h;
        REQUIRE(h.clock.setHeight(1200).is_ok());

        REQUIRE(h.engine.resolve(h.market_id, true, "creator").is_ok());
        auto again = h.engine.resolve(h.market_id, false, "creator");
        REQUIRE_FALSE(again.is_ok());
        CHECK(again.error().code == ERR_MARKET_ALREADY_RESOLVED);
        CHECK(h.registry.get(h.market_id).value().outcome == true);
    }

    TEST_CASE("Resolution is permissionless by default") {
        SettlementHarness h;
        REQUIRE(h.clock.setHeight(1200).is_ok());

        CHECK(h.engine.resolve(h.market_id, false, "random-stranger").is_ok());
        CHECK(h.registry.get(h.market_id).value().outcome == false);
    }

    TEST_CASE("Creator-only resolution policy") {
        MarketConfig bounds;
        bounds.resolution_policy = ResolutionPolicy::CreatorOnly;
        SettlementHarness h(bounds);
        REQUIRE(h.clock.setHeight(1200).is_ok());

        auto stranger = h.engine.resolve(h.market_id, true, "random-stranger");
        REQUIRE_FALSE(stranger.is_ok());
        CHECK(stranger.error().code == ERR_UNAUTHORIZED);
        CHECK_FALSE(h.registry.get(h.market_id).value().isResolved());

        CHECK(h.engine.resolve(h.market_id, true, "creator").is_ok());
    }

    TEST_CASE("Winners recover exactly their principal") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, true, 50, "alice").is_ok());
        REQUIRE(h.bets.placeBet(h.market_id, true, 30, "alice").is_ok());
        REQUIRE(h.bets.placeBet(h.market_id, false, 400, "bob").is_ok());
        REQUIRE(h.bets.placeBet(h.market_id, true, 20, "carol").is_ok());

        REQUIRE(h.clock.setHeight(1200).is_ok());
        REQUIRE(h.engine.resolve(h.market_id, true, "creator").is_ok());

        auto alice = h.engine.claim(h.market_id, "alice");
        REQUIRE(alice.is_ok());
        CHECK(alice.value() == 80);
        CHECK(h.funds.balanceOf("alice") == 1000);

        auto carol = h.engine.claim(h.market_id, "carol");
        REQUIRE(carol.is_ok());
        CHECK(carol.value() == 20);
        CHECK(h.funds.balanceOf("carol") == 1000);

        auto bob = h.engine.claim(h.market_id, "bob");
        REQUIRE_FALSE(bob.is_ok());
        CHECK(bob.error().code == ERR_BET_LOST);
        CHECK(h.funds.balanceOf("bob") == 600);

        // The losing stake stays in escrow; nothing was redistributed
        CHECK(h.funds.balanceOf("escrow") == 400);
        CHECK(h.bets.totalStaked(h.market_id) == 400);
        CHECK(h.bets.hasBet(h.market_id, "bob"));
    }

    TEST_CASE("Claim preconditions") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, true, 100, "alice").is_ok());

        CHECK(h.engine.claim(99, "alice").error().code == ERR_NOT_FOUND);
        CHECK(h.engine.claim(h.market_id, "nobody").error().code == ERR_BET_NOT_FOUND);

        REQUIRE(h.clock.setHeight(1200).is_ok());
        auto unresolved = h.engine.claim(h.market_id, "alice");
        REQUIRE_FALSE(unresolved.is_ok());
        CHECK(unresolved.error().code == ERR_MARKET_NOT_RESOLVED);

        REQUIRE(h.engine.resolve(h.market_id, true, "creator").is_ok());

        SUBCASE("claim once, then the bet is gone") {
            REQUIRE(h.engine.claim(h.market_id, "alice").is_ok());
            CHECK_FALSE(h.bets.hasBet(h.market_id, "alice"));
            auto repeat = h.engine.claim(h.market_id, "alice");
            REQUIRE_FALSE(repeat.is_ok());
            CHECK(repeat.error().code == ERR_BET_NOT_FOUND);
            CHECK(h.funds.balanceOf("alice") == 1000);
        }

        SUBCASE("last block of the claim window") {
            REQUIRE(h.clock.setHeight(h.expiry() - 1).is_ok());
            CHECK(h.engine.claim(h.market_id, "alice").is_ok());
        }

        SUBCASE("claims close at expiry even after resolution") {
            REQUIRE(h.clock.setHeight(h.expiry()).is_ok());
            auto late = h.engine.claim(h.market_id, "alice");
            REQUIRE_FALSE(late.is_ok());
            CHECK(late.error().code == ERR_MARKET_EXPIRED);
            CHECK(h.bets.hasBet(h.market_id, "alice"));

            // Resolved markets are never refundable either
            auto refund = h.engine.refund(h.market_id, "alice");
            REQUIRE_FALSE(refund.is_ok());
            CHECK(refund.error().code == ERR_MARKET_ALREADY_RESOLVED);
            CHECK(h.funds.balanceOf("alice") == 900);
        }
    }

    TEST_CASE("Refunds for markets that expired unresolved") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, true, 70, "alice").is_ok());
        REQUIRE(h.bets.placeBet(h.market_id, false, 90, "bob").is_ok());

        CHECK(h.engine.refund(99, "alice").error().code == ERR_NOT_FOUND);
        CHECK(h.engine.refund(h.market_id, "nobody").error().code == ERR_BET_NOT_FOUND);

        REQUIRE(h.clock.setHeight(h.expiry() - 1).is_ok());
        auto early = h.engine.refund(h.market_id, "alice");
        REQUIRE_FALSE(early.is_ok());
        CHECK(early.error().code == ERR_MARKET_NOT_EXPIRED);

        REQUIRE(h.clock.setHeight(h.expiry()).is_ok());
        auto alice = h.engine.refund(h.market_id, "alice");
        REQUIRE(alice.is_ok());
        CHECK(alice.value() == 70);
        auto bob = h.engine.refund(h.market_id, "bob");
        REQUIRE(bob.is_ok());
        CHECK(bob.value() == 90);

        CHECK(h.funds.balanceOf("alice") == 1000);
        CHECK(h.funds.balanceOf("bob") == 1000);
        CHECK(h.funds.balanceOf("escrow") == 0);
        CHECK(h.bets.betCount(h.market_id) == 0);

        CHECK(h.engine.refund(h.market_id, "alice").error().code == ERR_BET_NOT_FOUND);
        CHECK(h.engine.claim(h.market_id, "bob").error().code == ERR_BET_NOT_FOUND);
    }

    TEST_CASE("Unresolved expired market cannot be claimed") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, true, 70, "alice").is_ok());
        REQUIRE(h.clock.setHeight(h.expiry()).is_ok());

        auto result = h.engine.claim(h.market_id, "alice");
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.error().code == ERR_MARKET_NOT_RESOLVED);
    }

    TEST_CASE("A failed payout keeps the bet for a later retry") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, true, 100, "alice").is_ok());
        REQUIRE(h.bets.placeBet(h.market_id, false, 100, "bob").is_ok());

        SUBCASE("claim") {
            REQUIRE(h.clock.setHeight(1200).is_ok());
            REQUIRE(h.engine.resolve(h.market_id, true, "creator").is_ok());

            h.funds.fail_transfers = true;
            auto failed = h.engine.claim(h.market_id, "alice");
            REQUIRE_FALSE(failed.is_ok());
            CHECK(failed.error().code == ERR_TRANSFER_FAILED);
            CHECK(h.bets.hasBet(h.market_id, "alice"));
            CHECK(h.funds.balanceOf("escrow") == 200);

            h.funds.fail_transfers = false;
            auto retried = h.engine.claim(h.market_id, "alice");
            REQUIRE(retried.is_ok());
            CHECK(retried.value() == 100);
        }

        SUBCASE("refund") {
            REQUIRE(h.clock.setHeight(h.expiry()).is_ok());

            h.funds.fail_transfers = true;
            auto failed = h.engine.refund(h.market_id, "bob");
            REQUIRE_FALSE(failed.is_ok());
            CHECK(failed.error().code == ERR_TRANSFER_FAILED);
            CHECK(h.bets.getBet(h.market_id, "bob").value().amount == 100);

            h.funds.fail_transfers = false;
            CHECK(h.engine.refund(h.market_id, "bob").is_ok());
            CHECK(h.funds.balanceOf("bob") == 1000);
        }
    }

    TEST_CASE("Rejected calls do not reach the value transfer") {
        SettlementHarness h;
        REQUIRE(h.bets.placeBet(h.market_id, false, 100, "bob").is_ok());
        int before = h.funds.attempted;

        REQUIRE(h.clock.setHeight(1200).is_ok());
        CHECK_FALSE(h.engine.claim(h.market_id, "bob").is_ok());
        REQUIRE(h.engine.resolve(h.market_id, true, "creator").is_ok());
        CHECK_FALSE(h.engine.claim(h.market_id, "bob").is_ok());
        CHECK_FALSE(h.engine.refund(h.market_id, "bob").is_ok());

        CHECK(h.funds.attempted == before);
    }
}
