#include <tunemart/common/error.hpp>
#include <tunemart/market/marketplace.hpp>

namespace tunemart {

    // ===========================================
    // Guards
    // ===========================================

    /// Marks a mutating call as in progress for its whole scope
    class Marketplace::ReentrancyGuard {
      public:
        inline explicit ReentrancyGuard(bool &entered) : entered_(entered) { entered_ = true; }
        inline ~ReentrancyGuard() { entered_ = false; }

        ReentrancyGuard(const ReentrancyGuard &) = delete;
        ReentrancyGuard &operator=(const ReentrancyGuard &) = delete;

      private:
        bool &entered_;
    };

    /// Restores balances, token owners and items unless committed
    class Marketplace::StateGuard {
      public:
        inline explicit StateGuard(Marketplace &market)
            : market_(market), balances_(market.bank_.snapshot()), tokens_(market.registry_.snapshot()),
              items_(market.items_), committed_(false) {}

        inline ~StateGuard() {
            if (!committed_) {
                market_.bank_.restore(balances_);
                market_.registry_.restore(tokens_);
                market_.items_ = items_;
            }
        }

        StateGuard(const StateGuard &) = delete;
        StateGuard &operator=(const StateGuard &) = delete;

        inline void commit() { committed_ = true; }

      private:
        Marketplace &market_;
        ledger::BalanceBook::Snapshot balances_;
        ledger::TokenRegistry::Snapshot tokens_;
        std::vector<MarketItem> items_;
        bool committed_;
    };

    // ===========================================
    // Deployment
    // ===========================================

    Marketplace::Marketplace(ConstructionTag, ledger::BalanceBook &bank, const Address &self,
                             const Address &deployer, const MarketConfig &config)
        : bank_(bank), self_(self), artist_(config.artist), owner_(deployer), royalty_fee_(config.royalty_fee),
          registry_(config.name, config.symbol, config.base_uri) {}

    dp::Result<std::shared_ptr<Marketplace>, dp::Error> Marketplace::deploy(ledger::BalanceBook &bank,
                                                                            const Address &self,
                                                                            const CallContext &ctx,
                                                                            const MarketConfig &config) {
        using R = dp::Result<std::shared_ptr<Marketplace>, dp::Error>;

        if (self.isZero() || ctx.sender.isZero())
            return R::err(zero_address());
        if (config.artist.isZero())
            return R::err(zero_address("Artist must not be the zero address"));

        for (Amount price : config.prices) {
            if (price == 0)
                return R::err(non_positive_price());
        }

        auto required = checkedMul(static_cast<Amount>(config.prices.size()), config.royalty_fee);
        if (!required.is_ok())
            return R::err(required.error());
        if (ctx.value < required.value())
            return R::err(insufficient_deposit());

        auto market = std::make_shared<Marketplace>(ConstructionTag{}, bank, self, ctx.sender, config);

        for (TokenId token_id = 0; token_id < config.prices.size(); ++token_id) {
            auto minted = market->registry_.mint(self, token_id);
            if (!minted.is_ok())
                return R::err(minted.error());
            market->items_.push_back(MarketItem{token_id, ctx.sender, config.prices[token_id]});
        }

        // Last step: nothing else can fail once the deposit has moved
        auto deposit = bank.transfer(ctx.sender, self, ctx.value);
        if (!deposit.is_ok())
            return R::err(deposit.error());

        return R::ok(market);
    }

    // ===========================================
    // Mutating operations
    // ===========================================

    dp::Result<void, dp::Error> Marketplace::updateRoyaltyFee(const CallContext &ctx, Amount new_fee) {
        if (entered_)
            return dp::Result<void, dp::Error>::err(reentrant_call());
        if (ctx.sender != owner_)
            return dp::Result<void, dp::Error>::err(unauthorized());
        if (ctx.value != 0)
            return dp::Result<void, dp::Error>::err(not_payable());

        royalty_fee_ = new_fee;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Marketplace::transferOwnership(const CallContext &ctx, const Address &new_owner) {
        if (entered_)
            return dp::Result<void, dp::Error>::err(reentrant_call());
        if (ctx.sender != owner_)
            return dp::Result<void, dp::Error>::err(unauthorized());
        if (ctx.value != 0)
            return dp::Result<void, dp::Error>::err(not_payable());
        if (new_owner.isZero())
            return dp::Result<void, dp::Error>::err(zero_address("Ownable: new owner is the zero address"));

        owner_ = new_owner;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Marketplace::buyToken(const CallContext &ctx, TokenId token_id) {
        if (entered_)
            return dp::Result<void, dp::Error>::err(reentrant_call());
        ReentrancyGuard reentrancy(entered_);

        auto item_result = marketItem(token_id);
        if (!item_result.is_ok())
            return dp::Result<void, dp::Error>::err(item_result.error());
        const MarketItem item = item_result.value();

        if (ctx.value != item.price)
            return dp::Result<void, dp::Error>::err(wrong_price());
        if (!item.isListed())
            return dp::Result<void, dp::Error>::err(not_listed("Item has already been sold"));

        StateGuard tx(*this);

        auto paid_in = bank_.transfer(ctx.sender, self_, ctx.value);
        if (!paid_in.is_ok())
            return paid_in;

        auto moved = registry_.transfer(token_id, self_, ctx.sender);
        if (!moved.is_ok())
            return moved;

        // Effects are final before any payee code runs
        items_[token_id].seller = Address::zero();

        auto royalty = bank_.pay(self_, artist_, royalty_fee_);
        if (!royalty.is_ok()) {
            if (royalty.error().code == ERR_INSUFFICIENT_FUNDS)
                return dp::Result<void, dp::Error>::err(insufficient_ledger_balance());
            return royalty;
        }

        auto proceeds = bank_.pay(self_, item.seller, ctx.value);
        if (!proceeds.is_ok())
            return proceeds;

        tx.commit();
        events_.publish(ledger::MarketEvent::bought(token_id, item.seller, ctx.sender, item.price));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Marketplace::resellToken(const CallContext &ctx, TokenId token_id, Amount new_price) {
        if (entered_)
            return dp::Result<void, dp::Error>::err(reentrant_call());
        ReentrancyGuard reentrancy(entered_);

        if (new_price == 0)
            return dp::Result<void, dp::Error>::err(non_positive_price());
        if (token_id >= items_.size())
            return dp::Result<void, dp::Error>::err(token_not_found());
        if (ctx.value != royalty_fee_)
            return dp::Result<void, dp::Error>::err(wrong_royalty());

        auto holder = registry_.ownerOf(token_id);
        if (!holder.is_ok())
            return dp::Result<void, dp::Error>::err(holder.error());
        if (holder.value() != ctx.sender)
            return dp::Result<void, dp::Error>::err(not_token_owner());

        StateGuard tx(*this);

        auto paid_in = bank_.transfer(ctx.sender, self_, ctx.value);
        if (!paid_in.is_ok())
            return paid_in;

        auto moved = registry_.transfer(token_id, ctx.sender, self_);
        if (!moved.is_ok())
            return moved;

        items_[token_id].price = new_price;
        items_[token_id].seller = ctx.sender;

        tx.commit();
        events_.publish(ledger::MarketEvent::relisted(token_id, ctx.sender, new_price));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Queries
    // ===========================================

    std::vector<MarketItem> Marketplace::getAllUnsoldTokens() const { return getMyTokens(self_); }

    std::vector<MarketItem> Marketplace::getMyTokens(const Address &caller) const {
        std::vector<MarketItem> result;
        for (const auto &item : items_) {
            auto holder = registry_.ownerOf(item.token_id);
            if (holder.is_ok() && holder.value() == caller)
                result.push_back(item);
        }
        return result;
    }

    dp::Result<MarketItem, dp::Error> Marketplace::marketItem(TokenId token_id) const {
        if (token_id >= items_.size())
            return dp::Result<MarketItem, dp::Error>::err(token_not_found());
        return dp::Result<MarketItem, dp::Error>::ok(items_[token_id]);
    }

    dp::Result<void, dp::Error> Marketplace::checkInvariants() const {
        if (registry_.totalSupply() != items_.size())
            return dp::Result<void, dp::Error>::err(invariant_violated("Token supply differs from item count"));

        for (TokenId token_id = 0; token_id < items_.size(); ++token_id) {
            const auto &item = items_[token_id];
            if (item.token_id != token_id)
                return dp::Result<void, dp::Error>::err(invariant_violated("Item table is not dense"));

            auto holder = registry_.ownerOf(token_id);
            if (!holder.is_ok())
                return dp::Result<void, dp::Error>::err(invariant_violated("Item has no token owner"));

            bool escrowed = holder.value() == self_;
            if (item.isListed() != escrowed)
                return dp::Result<void, dp::Error>::err(
                    invariant_violated("Listing state disagrees with token ownership"));
            if (item.isListed() && item.price == 0)
                return dp::Result<void, dp::Error>::err(invariant_violated("Listed item has no price"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace tunemart
