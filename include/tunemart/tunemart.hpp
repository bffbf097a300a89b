#pragma once

// Common
#include "tunemart/common/amount.hpp"
#include "tunemart/common/error.hpp"

// Identity
#include "tunemart/identity/address.hpp"
#include "tunemart/identity/key.hpp"

// Ledger
#include "tunemart/ledger/balance_book.hpp"
#include "tunemart/ledger/events.hpp"
#include "tunemart/ledger/receipt.hpp"
#include "tunemart/ledger/token_registry.hpp"

// Market
#include "tunemart/market/call.hpp"
#include "tunemart/market/config.hpp"
#include "tunemart/market/executor.hpp"
#include "tunemart/market/market_item.hpp"
#include "tunemart/market/marketplace.hpp"

// Storage
#include "tunemart/storage/journal_store.hpp"
