#pragma once

#include <datapod/datapod.hpp>
#include <limits>

#include "error.hpp"

namespace tunemart {

    /// Currency amount in the smallest unit
    using Amount = dp::u64;

    /// Token identifier, dense 0..N-1
    using TokenId = dp::u64;

    inline dp::Result<Amount, dp::Error> checkedAdd(Amount a, Amount b) {
        if (a > std::numeric_limits<Amount>::max() - b) {
            return dp::Result<Amount, dp::Error>::err(amount_overflow());
        }
        return dp::Result<Amount, dp::Error>::ok(a + b);
    }

    inline dp::Result<Amount, dp::Error> checkedMul(Amount a, Amount b) {
        if (a != 0 && b > std::numeric_limits<Amount>::max() / a) {
            return dp::Result<Amount, dp::Error>::err(amount_overflow());
        }
        return dp::Result<Amount, dp::Error>::ok(a * b);
    }

} // namespace tunemart
