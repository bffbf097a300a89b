#include <tunemart/common/error.hpp>
#include <tunemart/ledger/token_registry.hpp>

namespace tunemart::ledger {

    TokenRegistry::TokenRegistry(std::string name, std::string symbol, std::string base_uri)
        : name_(std::move(name)), symbol_(std::move(symbol)), base_uri_(std::move(base_uri)) {}

    dp::Result<void, dp::Error> TokenRegistry::mint(const Address &to, TokenId token_id) {
        if (to.isZero())
            return dp::Result<void, dp::Error>::err(zero_address("Cannot mint to the zero address"));
        if (exists(token_id))
            return dp::Result<void, dp::Error>::err(duplicate_token());

        owners_[token_id] = to;
        balances_[to] += 1;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Address, dp::Error> TokenRegistry::ownerOf(TokenId token_id) const {
        auto it = owners_.find(token_id);
        if (it == owners_.end())
            return dp::Result<Address, dp::Error>::err(token_not_found());
        return dp::Result<Address, dp::Error>::ok(it->second);
    }

    dp::u64 TokenRegistry::balanceOf(const Address &owner) const {
        auto it = balances_.find(owner);
        return (it != balances_.end()) ? it->second : 0;
    }

    bool TokenRegistry::exists(TokenId token_id) const { return owners_.find(token_id) != owners_.end(); }

    dp::Result<void, dp::Error> TokenRegistry::transfer(TokenId token_id, const Address &from, const Address &to) {
        auto it = owners_.find(token_id);
        if (it == owners_.end())
            return dp::Result<void, dp::Error>::err(token_not_found());
        if (it->second != from)
            return dp::Result<void, dp::Error>::err(transfer_from_mismatch());
        if (to.isZero())
            return dp::Result<void, dp::Error>::err(zero_address("Cannot transfer to the zero address"));

        it->second = to;
        if (--balances_[from] == 0)
            balances_.erase(from);
        balances_[to] += 1;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::string, dp::Error> TokenRegistry::tokenURI(TokenId token_id) const {
        if (!exists(token_id))
            return dp::Result<std::string, dp::Error>::err(token_not_found("URI query for nonexistent token"));
        if (base_uri_.empty())
            return dp::Result<std::string, dp::Error>::ok(std::string());
        return dp::Result<std::string, dp::Error>::ok(base_uri_ + std::to_string(token_id));
    }

    std::vector<TokenId> TokenRegistry::tokensOf(const Address &owner) const {
        std::vector<TokenId> tokens;
        for (const auto &[token_id, holder] : owners_) {
            if (holder == owner)
                tokens.push_back(token_id);
        }
        return tokens;
    }

} // namespace tunemart::ledger
