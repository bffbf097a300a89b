#pragma once

// High-level Tunemart facade
// Composes ledger, market and storage modules

#include "tunemart/tunemart.hpp"
