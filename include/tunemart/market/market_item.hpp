#pragma once

#include <datapod/datapod.hpp>
#include <tuple>

#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"

namespace tunemart {

    /// Sale listing bound to one token
    struct MarketItem {
        TokenId token_id{0};
        Address seller{}; // zero address: not listed
        Amount price{0};

        inline bool isListed() const { return !seller.isZero(); }

        auto members() { return std::tie(token_id, seller, price); }
        auto members() const { return std::tie(token_id, seller, price); }
    };

} // namespace tunemart
