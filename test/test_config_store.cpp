#include "stakeit/stakeit.hpp"
#include <doctest/doctest.h>
#include <stdexcept>

using namespace stakeit;
using namespace stakeit::market;

TEST_SUITE("Config Store Tests") {
    TEST_CASE("Defaults come from the market config") {
        ConfigStore config("admin");

        CHECK(config.getOwner() == "admin");
        CHECK(config.isOwner("admin"));
        CHECK_FALSE(config.isOwner("mallory"));
        CHECK(config.getMinBet() == 10);
        CHECK(config.getMaxBet() == 1000000);
        CHECK(config.getExpiryPeriod() == 10000);
        CHECK(config.bounds().resolution_policy == ResolutionPolicy::Permissionless);
        CHECK(config.bounds().max_expiry_window == 62560);
    }

    TEST_CASE("Custom bounds seed the mutable values") {
        MarketConfig bounds;
        bounds.default_min_bet = 100;
        bounds.default_max_bet = 5000;
        bounds.default_expiry_period = 200;

        ConfigStore config("admin", bounds);
        CHECK(config.getMinBet() == 100);
        CHECK(config.getMaxBet() == 5000);
        CHECK(config.getExpiryPeriod() == 200);
    }

    TEST_CASE("Constructor rejects unusable settings") {
        CHECK_THROWS_AS(ConfigStore(""), std::invalid_argument);

        MarketConfig inverted_bets;
        inverted_bets.default_min_bet = 500;
        inverted_bets.default_max_bet = 500;
        CHECK_THROWS_AS(ConfigStore("admin", inverted_bets), std::invalid_argument);

        MarketConfig bad_expiry;
        bad_expiry.default_expiry_period = bad_expiry.max_expiry_period + 1;
        CHECK_THROWS_AS(ConfigStore("admin", bad_expiry), std::invalid_argument);
    }

    TEST_CASE("MarketConfig validation") {
        MarketConfig config;
        CHECK(config.validate().is_ok());

        SUBCASE("zero minimum close delay") {
            config.min_close_delay = 0;
            CHECK_FALSE(config.validate().is_ok());
        }
        SUBCASE("close delay window inverted") {
            config.min_close_delay = config.max_close_delay + 1;
            CHECK_FALSE(config.validate().is_ok());
        }
        SUBCASE("zero minimum description length") {
            config.min_description_length = 0;
            CHECK_FALSE(config.validate().is_ok());
        }
        SUBCASE("expiry window too small for the default period") {
            config.max_expiry_window = config.min_close_delay + config.default_expiry_period - 1;
            auto result = config.validate();
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_INVALID_PARAMETER);
        }
        SUBCASE("max bet above ceiling") {
            config.default_max_bet = config.bet_ceiling + 1;
            auto result = config.validate();
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_INVALID_PARAMETER);
        }
    }

    TEST_CASE("Non-owner cannot change the minimum bet") {
        ConfigStore config("admin");

        auto result = config.setMinBet(25, "mallory");
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.error().code == ERR_UNAUTHORIZED);
        CHECK(config.getMinBet() == 10);
    }

    TEST_CASE("Owner-gated setters") {
        ConfigStore config("admin");

        SUBCASE("expiry period") {
            CHECK(config.setExpiryPeriod(144, "admin").is_ok());
            CHECK(config.getExpiryPeriod() == 144);
            CHECK(config.setExpiryPeriod(52560, "admin").is_ok());
            CHECK(config.getExpiryPeriod() == 52560);

            auto too_short = config.setExpiryPeriod(143, "admin");
            REQUIRE_FALSE(too_short.is_ok());
            CHECK(too_short.error().code == ERR_INVALID_PARAMETER);

            auto too_long = config.setExpiryPeriod(52561, "admin");
            REQUIRE_FALSE(too_long.is_ok());
            CHECK(too_long.error().code == ERR_INVALID_PARAMETER);
            CHECK(config.getExpiryPeriod() == 52560);

            CHECK(config.setExpiryPeriod(1000, "mallory").error().code == ERR_UNAUTHORIZED);
        }

        SUBCASE("minimum bet must stay below maximum") {
            CHECK(config.setMinBet(1, "admin").is_ok());
            CHECK(config.setMinBet(999999, "admin").is_ok());

            auto at_max = config.setMinBet(1000000, "admin");
            REQUIRE_FALSE(at_max.is_ok());
            CHECK(at_max.error().code == ERR_INVALID_PARAMETER);

            auto zero = config.setMinBet(0, "admin");
            REQUIRE_FALSE(zero.is_ok());
            CHECK(zero.error().code == ERR_INVALID_PARAMETER);
            CHECK(config.getMinBet() == 999999);
        }

        SUBCASE("maximum bet must stay above minimum and under the ceiling") {
            CHECK(config.setMaxBet(11, "admin").is_ok());
            CHECK(config.getMaxBet() == 11);

            auto at_min = config.setMaxBet(10, "admin");
            REQUIRE_FALSE(at_min.is_ok());
            CHECK(at_min.error().code == ERR_INVALID_PARAMETER);

            CHECK(config.setMaxBet(config.bounds().bet_ceiling, "admin").is_ok());
            auto over = config.setMaxBet(config.bounds().bet_ceiling + 1, "admin");
            REQUIRE_FALSE(over.is_ok());
            CHECK(over.error().code == ERR_INVALID_PARAMETER);
            CHECK(config.getMaxBet() == config.bounds().bet_ceiling);

            CHECK(config.setMaxBet(5000, "mallory").error().code == ERR_UNAUTHORIZED);
        }

        SUBCASE("authorization is checked before the range") {
            auto result = config.setMinBet(0, "mallory");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_UNAUTHORIZED);
        }
    }

    TEST_CASE("Ownership transfer is single step") {
        ConfigStore config("admin");

        auto by_stranger = config.transferOwnership("mallory", "mallory");
        REQUIRE_FALSE(by_stranger.is_ok());
        CHECK(by_stranger.error().code == ERR_UNAUTHORIZED);

        auto to_self = config.transferOwnership("admin", "admin");
        REQUIRE_FALSE(to_self.is_ok());
        CHECK(to_self.error().code == ERR_INVALID_PARAMETER);

        auto to_nobody = config.transferOwnership("", "admin");
        REQUIRE_FALSE(to_nobody.is_ok());
        CHECK(to_nobody.error().code == ERR_INVALID_PARAMETER);
        CHECK(config.getOwner() == "admin");

        REQUIRE(config.transferOwnership("treasury", "admin").is_ok());
        CHECK(config.getOwner() == "treasury");

        // The previous owner has no way back
        CHECK(config.setMinBet(20, "admin").error().code == ERR_UNAUTHORIZED);
        CHECK(config.transferOwnership("admin", "admin").error().code == ERR_UNAUTHORIZED);
        CHECK(config.setMinBet(20, "treasury").is_ok());
    }
}
