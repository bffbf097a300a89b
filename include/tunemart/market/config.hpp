#pragma once

#include <string>
#include <vector>

#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"

namespace tunemart {

    constexpr const char *DEFAULT_COLLECTION_NAME = "MusicNFTs";
    constexpr const char *DEFAULT_COLLECTION_SYMBOL = "MNS";
    constexpr const char *DEFAULT_BASE_URI =
        "https://bafybeidhjjbjonyqcahuzlpt7sznmh4xrlbspa3gstop5o47l6gsiaffee.ipfs.nftstorage.link/";

    /// Deployment parameters of a marketplace
    struct MarketConfig {
        std::string name = DEFAULT_COLLECTION_NAME;
        std::string symbol = DEFAULT_COLLECTION_SYMBOL;
        std::string base_uri = DEFAULT_BASE_URI; // opaque to the ledger
        Amount royalty_fee = 0;
        Address artist{};
        std::vector<Amount> prices; // one entry per token, token i gets prices[i]
    };

} // namespace tunemart
