#pragma once

// High-level Stakeit facade
// Composes ledger collaborators, market modules and the exchange

#include "stakeit/common/error.hpp"
#include "stakeit/common/types.hpp"
#include "stakeit/exchange.hpp"
#include "stakeit/ledger/clock.hpp"
#include "stakeit/ledger/journal.hpp"
#include "stakeit/ledger/vault.hpp"
#include "stakeit/market/bet_ledger.hpp"
#include "stakeit/market/config.hpp"
#include "stakeit/market/market.hpp"
#include "stakeit/market/registry.hpp"
#include "stakeit/market/settlement.hpp"
