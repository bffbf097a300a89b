#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "market_item.hpp"
#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"
#include "tunemart/ledger/balance_book.hpp"
#include "tunemart/ledger/events.hpp"
#include "tunemart/ledger/token_registry.hpp"

namespace tunemart {

    /// Caller identity and the payment attached to a call
    struct CallContext {
        Address sender{};
        Amount value{0};
    };

    /// Fixed-catalogue NFT marketplace.
    ///
    /// Every token is minted to the marketplace's own address at deployment and listed by the
    /// deployer. A listed token is held in escrow by the marketplace; buying it moves it to the
    /// buyer, relisting moves it back. Each mutating operation is all-or-nothing: on error the
    /// balance book, the registry and the item table are exactly as before the call and no
    /// event is published.
    class Marketplace {
        struct ConstructionTag {
            explicit ConstructionTag() = default;
        };

      public:
        /// Deploy a marketplace at `self`, paying `ctx.value` as the royalty deposit
        /// @param bank Balance book shared with the rest of the host; must outlive the marketplace
        /// @param self Address of the marketplace account
        /// @param ctx Deployer and deposit (at least prices.size() * royalty_fee)
        /// @param config Collection metadata, royalty fee, artist and prices
        static dp::Result<std::shared_ptr<Marketplace>, dp::Error>
        deploy(ledger::BalanceBook &bank, const Address &self, const CallContext &ctx, const MarketConfig &config);

        /// Use deploy(); the tag keeps construction private
        Marketplace(ConstructionTag, ledger::BalanceBook &bank, const Address &self, const Address &deployer,
                    const MarketConfig &config);

        Marketplace(const Marketplace &) = delete;
        Marketplace &operator=(const Marketplace &) = delete;

        // ===========================================
        // Mutating operations
        // ===========================================

        /// Owner only
        dp::Result<void, dp::Error> updateRoyaltyFee(const CallContext &ctx, Amount new_fee);

        /// Owner only; `new_owner` must not be the zero address
        dp::Result<void, dp::Error> transferOwnership(const CallContext &ctx, const Address &new_owner);

        /// Buy a listed token, paying exactly its price.
        /// The royalty goes to the artist out of the marketplace balance, the whole payment to the seller.
        dp::Result<void, dp::Error> buyToken(const CallContext &ctx, TokenId token_id);

        /// Relist an owned token at `new_price`, paying exactly the royalty fee.
        /// The fee stays in the marketplace balance.
        dp::Result<void, dp::Error> resellToken(const CallContext &ctx, TokenId token_id, Amount new_price);

        // ===========================================
        // Queries
        // ===========================================

        /// Items held by the marketplace, ascending token id
        std::vector<MarketItem> getAllUnsoldTokens() const;

        /// Items owned by `caller`, ascending token id
        std::vector<MarketItem> getMyTokens(const Address &caller) const;

        dp::Result<MarketItem, dp::Error> marketItem(TokenId token_id) const;

        size_t itemCount() const { return items_.size(); }

        Amount royaltyFee() const { return royalty_fee_; }
        const Address &artist() const { return artist_; }
        const Address &owner() const { return owner_; }
        const Address &address() const { return self_; }

        /// Marketplace account balance (deposit, relist royalties, less purchase royalties paid out)
        Amount balance() const { return bank_.balanceOf(self_); }

        const std::string &name() const { return registry_.name(); }
        const std::string &symbol() const { return registry_.symbol(); }
        const std::string &baseURI() const { return registry_.baseURI(); }

        dp::Result<std::string, dp::Error> tokenURI(TokenId token_id) const { return registry_.tokenURI(token_id); }
        dp::Result<Address, dp::Error> ownerOf(TokenId token_id) const { return registry_.ownerOf(token_id); }
        dp::u64 balanceOf(const Address &holder) const { return registry_.balanceOf(holder); }

        const ledger::TokenRegistry &registry() const { return registry_; }

        ledger::EventLog &events() { return events_; }
        const ledger::EventLog &events() const { return events_; }

        /// Verify item/registry consistency; returns the first violation found
        dp::Result<void, dp::Error> checkInvariants() const;

      private:
        class ReentrancyGuard;
        class StateGuard;

        ledger::BalanceBook &bank_;
        Address self_;
        Address artist_;
        Address owner_;
        Amount royalty_fee_{0};
        ledger::TokenRegistry registry_;
        std::vector<MarketItem> items_;
        ledger::EventLog events_;
        bool entered_{false};
    };

} // namespace tunemart
