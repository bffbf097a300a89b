#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <string>
#include <vector>

#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"

namespace tunemart::ledger {

    /// Non-fungible token ownership registry for one collection
    class TokenRegistry {
      public:
        struct Snapshot {
            std::map<TokenId, Address> owners;
            std::map<Address, dp::u64> balances;
        };

        TokenRegistry() = default;
        TokenRegistry(std::string name, std::string symbol, std::string base_uri);

        dp::Result<void, dp::Error> mint(const Address &to, TokenId token_id);

        dp::Result<Address, dp::Error> ownerOf(TokenId token_id) const;

        dp::u64 balanceOf(const Address &owner) const;

        bool exists(TokenId token_id) const;

        /// Fails unless `from` is the current owner
        dp::Result<void, dp::Error> transfer(TokenId token_id, const Address &from, const Address &to);

        /// Base URI followed by the decimal token id
        dp::Result<std::string, dp::Error> tokenURI(TokenId token_id) const;

        /// Token ids held by `owner`, ascending
        std::vector<TokenId> tokensOf(const Address &owner) const;

        dp::u64 totalSupply() const { return owners_.size(); }

        const std::string &name() const { return name_; }
        const std::string &symbol() const { return symbol_; }
        const std::string &baseURI() const { return base_uri_; }

        Snapshot snapshot() const { return Snapshot{owners_, balances_}; }

        void restore(const Snapshot &snapshot) {
            owners_ = snapshot.owners;
            balances_ = snapshot.balances;
        }

      private:
        std::string name_;
        std::string symbol_;
        std::string base_uri_;
        std::map<TokenId, Address> owners_;
        std::map<Address, dp::u64> balances_;
    };

} // namespace tunemart::ledger
