#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tunemart/common/error.hpp"
#include "tunemart/market/marketplace.hpp"
#include <limits>

using namespace tunemart;
using namespace tunemart::ledger;

namespace {

    // 1 currency unit = 1000, royalty 0.01 = 10
    constexpr Amount UNIT = 1000;
    constexpr Amount ROYALTY = 10;
    constexpr Amount FUNDING = 100 * UNIT;

    std::vector<Amount> eightPrices() {
        std::vector<Amount> prices;
        for (Amount i = 1; i <= 8; ++i)
            prices.push_back(i * UNIT);
        return prices;
    }

    struct MarketFixture {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        Address artist = Address::fromLabel("artist");
        Address self = Address::fromLabel("marketplace");
        Address user = Address::fromLabel("user");
        Address other = Address::fromLabel("other");
        std::shared_ptr<Marketplace> market;

        MarketFixture() {
            REQUIRE(bank.credit(deployer, FUNDING).is_ok());
            REQUIRE(bank.credit(user, FUNDING).is_ok());
            REQUIRE(bank.credit(other, FUNDING).is_ok());

            auto deployed = Marketplace::deploy(bank, self, CallContext{deployer, 8 * ROYALTY}, config());
            REQUIRE(deployed.is_ok());
            market = deployed.value();
        }

        MarketConfig config() const {
            MarketConfig cfg;
            cfg.royalty_fee = ROYALTY;
            cfg.artist = artist;
            cfg.prices = eightPrices();
            return cfg;
        }
    };

    /// Payee hook that refuses every payment
    class RefusingReceiver : public PaymentReceiver {
      public:
        dp::Result<void, dp::Error> onPayment(const Address &, Amount) override {
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("refused"));
        }
    };

    /// Payee hook that calls back into the marketplace while being paid
    class ReentrantReceiver : public PaymentReceiver {
      public:
        ReentrantReceiver(Marketplace *market, Address self) : market_(market), self_(self) {}

        dp::Result<void, dp::Error> onPayment(const Address &, Amount) override {
            ++calls;
            auto buy = market_->buyToken(CallContext{self_, 2 * UNIT}, 1);
            buy_error = buy.is_err() ? buy.error().code : 0;
            auto resell = market_->resellToken(CallContext{self_, ROYALTY}, 0, 5 * UNIT);
            resell_error = resell.is_err() ? resell.error().code : 0;
            auto fee = market_->updateRoyaltyFee(CallContext{self_, 0}, 0);
            fee_error = fee.is_err() ? fee.error().code : 0;

            auto item = market_->marketItem(0);
            seller_cleared = item.is_ok() && !item.value().isListed();
            unsold_seen = market_->getAllUnsoldTokens().size();
            return dp::Result<void, dp::Error>::ok();
        }

        int calls{0};
        dp::u32 buy_error{0};
        dp::u32 resell_error{0};
        dp::u32 fee_error{0};
        bool seller_cleared{false};
        size_t unsold_seen{0};

      private:
        Marketplace *market_;
        Address self_;
    };

} // namespace

TEST_SUITE("Marketplace Deployment Tests") {
    TEST_CASE("Deployment lists every token in escrow") {
        MarketFixture f;
        CHECK(f.market->itemCount() == 8);
        CHECK(f.market->royaltyFee() == ROYALTY);
        CHECK(f.market->artist() == f.artist);
        CHECK(f.market->owner() == f.deployer);
        CHECK(f.market->address() == f.self);

        auto unsold = f.market->getAllUnsoldTokens();
        REQUIRE(unsold.size() == 8);
        for (size_t i = 0; i < unsold.size(); ++i) {
            CHECK(unsold[i].token_id == i);
            CHECK(unsold[i].seller == f.deployer);
            CHECK(unsold[i].price == (i + 1) * UNIT);
            CHECK(f.market->ownerOf(i).value() == f.self);
        }
        CHECK(f.market->balanceOf(f.self) == 8);
        CHECK(f.market->getMyTokens(f.deployer).empty());
        CHECK(f.market->events().size() == 0);
        CHECK(f.market->checkInvariants().is_ok());
    }

    TEST_CASE("Deposit is held by the marketplace") {
        MarketFixture f;
        CHECK(f.market->balance() == 8 * ROYALTY);
        CHECK(f.bank.balanceOf(f.deployer) == FUNDING - 8 * ROYALTY);
    }

    TEST_CASE("Collection metadata") {
        MarketFixture f;
        CHECK(f.market->name() == "MusicNFTs");
        CHECK(f.market->symbol() == "MNS");
        CHECK(f.market->baseURI() == DEFAULT_BASE_URI);

        auto uri = f.market->tokenURI(3);
        REQUIRE(uri.is_ok());
        CHECK(uri.value() == std::string(DEFAULT_BASE_URI) + "3");
        CHECK(f.market->tokenURI(8).is_err());
    }

    TEST_CASE("Insufficient deposit aborts deployment") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        REQUIRE(bank.credit(deployer, FUNDING).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.artist = Address::fromLabel("artist");
        cfg.prices = eightPrices();

        auto result = Marketplace::deploy(bank, Address::fromLabel("marketplace"),
                                          CallContext{deployer, 8 * ROYALTY - 1}, cfg);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_DEPOSIT);
        CHECK(errorKind(result.error()) == ErrorKind::PaymentMismatch);
        CHECK(bank.balanceOf(deployer) == FUNDING);
    }

    TEST_CASE("Larger deposit is accepted") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        Address self = Address::fromLabel("marketplace");
        REQUIRE(bank.credit(deployer, FUNDING).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.artist = Address::fromLabel("artist");
        cfg.prices = {UNIT, UNIT};

        auto result = Marketplace::deploy(bank, self, CallContext{deployer, 500}, cfg);
        REQUIRE(result.is_ok());
        CHECK(result.value()->balance() == 500);
    }

    TEST_CASE("Non-positive price aborts deployment") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        REQUIRE(bank.credit(deployer, FUNDING).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.artist = Address::fromLabel("artist");
        cfg.prices = {UNIT, 0, UNIT};

        auto result =
            Marketplace::deploy(bank, Address::fromLabel("marketplace"), CallContext{deployer, 3 * ROYALTY}, cfg);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NON_POSITIVE_PRICE);
        CHECK(errorKind(result.error()) == ErrorKind::InvalidArgument);
        CHECK(bank.balanceOf(deployer) == FUNDING);
    }

    TEST_CASE("Deployer must be able to fund the deposit") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("poor-deployer");
        REQUIRE(bank.credit(deployer, 5).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.artist = Address::fromLabel("artist");
        cfg.prices = {UNIT};

        auto result = Marketplace::deploy(bank, Address::fromLabel("marketplace"), CallContext{deployer, ROYALTY}, cfg);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(bank.balanceOf(deployer) == 5);
    }

    TEST_CASE("Zero artist and deposit overflow are invalid") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        Address self = Address::fromLabel("marketplace");
        REQUIRE(bank.credit(deployer, FUNDING).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.prices = {UNIT};
        auto no_artist = Marketplace::deploy(bank, self, CallContext{deployer, ROYALTY}, cfg);
        REQUIRE(no_artist.is_err());
        CHECK(no_artist.error().code == ERR_ZERO_ADDRESS);

        cfg.artist = Address::fromLabel("artist");
        cfg.royalty_fee = std::numeric_limits<Amount>::max();
        cfg.prices = {UNIT, UNIT};
        auto overflow = Marketplace::deploy(bank, self, CallContext{deployer, FUNDING}, cfg);
        REQUIRE(overflow.is_err());
        CHECK(overflow.error().code == ERR_AMOUNT_OVERFLOW);
        CHECK(errorKind(overflow.error()) == ErrorKind::InvalidArgument);
    }

    TEST_CASE("Empty catalogue") {
        BalanceBook bank;
        Address deployer = Address::fromLabel("deployer");
        REQUIRE(bank.credit(deployer, FUNDING).is_ok());

        MarketConfig cfg;
        cfg.royalty_fee = ROYALTY;
        cfg.artist = Address::fromLabel("artist");

        auto result = Marketplace::deploy(bank, Address::fromLabel("marketplace"), CallContext{deployer, 0}, cfg);
        REQUIRE(result.is_ok());
        CHECK(result.value()->itemCount() == 0);
        CHECK(result.value()->getAllUnsoldTokens().empty());
        CHECK(result.value()->buyToken(CallContext{deployer, 0}, 0).error().code == ERR_TOKEN_NOT_FOUND);
        CHECK(result.value()->checkInvariants().is_ok());
    }
}

TEST_SUITE("Marketplace Royalty Tests") {
    TEST_CASE("Owner updates the royalty fee") {
        MarketFixture f;
        REQUIRE(f.market->updateRoyaltyFee(CallContext{f.deployer, 0}, 25).is_ok());
        CHECK(f.market->royaltyFee() == 25);

        REQUIRE(f.market->updateRoyaltyFee(CallContext{f.deployer, 0}, 0).is_ok());
        CHECK(f.market->royaltyFee() == 0);
    }

    TEST_CASE("Non-owner cannot update the royalty fee") {
        MarketFixture f;
        auto result = f.market->updateRoyaltyFee(CallContext{f.user, 0}, 25);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_UNAUTHORIZED);
        CHECK(errorKind(result.error()) == ErrorKind::Authorization);
        CHECK(std::string(result.error().message.c_str()) == "Ownable: caller is not the owner");
        CHECK(f.market->royaltyFee() == ROYALTY);

        // The artist has no administrative rights either
        CHECK(f.market->updateRoyaltyFee(CallContext{f.artist, 0}, 25).is_err());
    }

    TEST_CASE("Royalty update is not payable") {
        MarketFixture f;
        auto result = f.market->updateRoyaltyFee(CallContext{f.deployer, 5}, 25);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NOT_PAYABLE);
        CHECK(f.market->royaltyFee() == ROYALTY);
    }

    TEST_CASE("Ownership transfer moves administrative rights") {
        MarketFixture f;
        REQUIRE(f.market->transferOwnership(CallContext{f.deployer, 0}, f.user).is_ok());
        CHECK(f.market->owner() == f.user);

        CHECK(f.market->updateRoyaltyFee(CallContext{f.deployer, 0}, 30).error().code == ERR_UNAUTHORIZED);
        REQUIRE(f.market->updateRoyaltyFee(CallContext{f.user, 0}, 30).is_ok());
        CHECK(f.market->royaltyFee() == 30);
    }

    TEST_CASE("Ownership transfer guards") {
        MarketFixture f;
        CHECK(f.market->transferOwnership(CallContext{f.user, 0}, f.user).error().code == ERR_UNAUTHORIZED);
        CHECK(f.market->transferOwnership(CallContext{f.deployer, 0}, Address::zero()).error().code ==
              ERR_ZERO_ADDRESS);
        CHECK(f.market->transferOwnership(CallContext{f.deployer, 1}, f.user).error().code == ERR_NOT_PAYABLE);
        CHECK(f.market->owner() == f.deployer);
    }

    TEST_CASE("New royalty applies to later purchases and relists") {
        MarketFixture f;
        REQUIRE(f.market->updateRoyaltyFee(CallContext{f.deployer, 0}, 20).is_ok());

        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());
        CHECK(f.bank.balanceOf(f.artist) == 20);

        CHECK(f.market->resellToken(CallContext{f.user, ROYALTY}, 0, UNIT).error().code == ERR_WRONG_ROYALTY);
        REQUIRE(f.market->resellToken(CallContext{f.user, 20}, 0, UNIT).is_ok());
    }
}

TEST_SUITE("Marketplace Trading Tests") {
    TEST_CASE("Concrete purchase and relist scenario") {
        MarketFixture f;
        REQUIRE(f.market->getAllUnsoldTokens().size() == 8);

        Amount deployer_before = f.bank.balanceOf(f.deployer);
        Amount artist_before = f.bank.balanceOf(f.artist);
        Amount user_before = f.bank.balanceOf(f.user);

        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        CHECK(f.market->getAllUnsoldTokens().size() == 7);
        CHECK(f.market->ownerOf(0).value() == f.user);
        CHECK(f.market->marketItem(0).value().seller.isZero());
        CHECK(f.bank.balanceOf(f.artist) == artist_before + ROYALTY);
        CHECK(f.bank.balanceOf(f.deployer) == deployer_before + UNIT);
        CHECK(f.bank.balanceOf(f.user) == user_before - UNIT);

        auto mine = f.market->getMyTokens(f.user);
        REQUIRE(mine.size() == 1);
        CHECK(mine[0].token_id == 0);

        REQUIRE(f.market->resellToken(CallContext{f.user, ROYALTY}, 0, 2 * UNIT).is_ok());

        CHECK(f.market->ownerOf(0).value() == f.self);
        auto item = f.market->marketItem(0).value();
        CHECK(item.seller == f.user);
        CHECK(item.price == 2 * UNIT);
        CHECK(f.market->getAllUnsoldTokens().size() == 8);
        CHECK(f.market->getMyTokens(f.user).empty());
        CHECK(f.bank.balanceOf(f.user) == user_before - UNIT - ROYALTY);
        CHECK(f.market->checkInvariants().is_ok());
    }

    TEST_CASE("Purchase and relist emit events") {
        MarketFixture f;
        std::vector<MarketEvent> seen;
        f.market->events().subscribe([&seen](const MarketEvent &event) { seen.push_back(event); });

        REQUIRE(f.market->buyToken(CallContext{f.user, 3 * UNIT}, 2).is_ok());
        REQUIRE(f.market->resellToken(CallContext{f.user, ROYALTY}, 2, 4 * UNIT).is_ok());

        REQUIRE(seen.size() == 2);
        CHECK(seen[0].getType() == MarketEventType::ItemBought);
        CHECK(seen[0].token_id == 2);
        CHECK(seen[0].seller == f.deployer);
        CHECK(seen[0].buyer == f.user);
        CHECK(seen[0].price == 3 * UNIT);

        CHECK(seen[1].getType() == MarketEventType::ItemRelisted);
        CHECK(seen[1].token_id == 2);
        CHECK(seen[1].seller == f.user);
        CHECK(seen[1].price == 4 * UNIT);
        CHECK(seen[1].sequence == 1);
    }

    TEST_CASE("Relisted token pays the relister on the next sale") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());
        REQUIRE(f.market->resellToken(CallContext{f.user, ROYALTY}, 0, 2 * UNIT).is_ok());

        Amount user_before = f.bank.balanceOf(f.user);
        Amount artist_before = f.bank.balanceOf(f.artist);
        Amount deployer_before = f.bank.balanceOf(f.deployer);

        REQUIRE(f.market->buyToken(CallContext{f.other, 2 * UNIT}, 0).is_ok());
        CHECK(f.market->ownerOf(0).value() == f.other);
        CHECK(f.bank.balanceOf(f.user) == user_before + 2 * UNIT);
        CHECK(f.bank.balanceOf(f.artist) == artist_before + ROYALTY);
        CHECK(f.bank.balanceOf(f.deployer) == deployer_before);
    }

    TEST_CASE("Marketplace balance tracks deposit and royalties") {
        MarketFixture f;
        CHECK(f.market->balance() == 8 * ROYALTY);

        // Purchase royalty comes out of the marketplace balance
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());
        CHECK(f.market->balance() == 7 * ROYALTY);

        // Relist royalty stays in it
        REQUIRE(f.market->resellToken(CallContext{f.user, ROYALTY}, 0, 2 * UNIT).is_ok());
        CHECK(f.market->balance() == 8 * ROYALTY);

        REQUIRE(f.market->buyToken(CallContext{f.other, 2 * UNIT}, 0).is_ok());
        REQUIRE(f.market->resellToken(CallContext{f.other, ROYALTY}, 0, 3 * UNIT).is_ok());
        CHECK(f.market->balance() == 8 * ROYALTY);

        Amount total = f.bank.balanceOf(f.deployer) + f.bank.balanceOf(f.user) + f.bank.balanceOf(f.other) +
                       f.bank.balanceOf(f.artist) + f.market->balance();
        CHECK(total == 3 * FUNDING);
    }

    TEST_CASE("Second purchase of a sold token fails") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        Amount other_before = f.bank.balanceOf(f.other);
        auto result = f.market->buyToken(CallContext{f.other, UNIT}, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NOT_LISTED);
        CHECK(errorKind(result.error()) == ErrorKind::StateIntegrity);
        CHECK(f.market->ownerOf(0).value() == f.user);
        CHECK(f.bank.balanceOf(f.other) == other_before);
        CHECK(f.market->events().size() == 1);
    }

    TEST_CASE("Purchase requires the exact asking price") {
        MarketFixture f;
        for (Amount value : {Amount(0), 2 * UNIT - 1, 2 * UNIT + 1, 20 * UNIT}) {
            auto result = f.market->buyToken(CallContext{f.user, value}, 1);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_WRONG_PRICE);
            CHECK(errorKind(result.error()) == ErrorKind::PaymentMismatch);
        }
        CHECK(f.market->ownerOf(1).value() == f.self);
        CHECK(f.bank.balanceOf(f.user) == FUNDING);
        CHECK(f.market->events().size() == 0);
    }

    TEST_CASE("Purchase of an unknown token") {
        MarketFixture f;
        auto result = f.market->buyToken(CallContext{f.user, UNIT}, 8);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_TOKEN_NOT_FOUND);
        CHECK(errorKind(result.error()) == ErrorKind::InvalidArgument);
    }

    TEST_CASE("Buyer without funds") {
        MarketFixture f;
        Address broke = Address::fromLabel("broke");
        auto result = f.market->buyToken(CallContext{broke, UNIT}, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(f.market->ownerOf(0).value() == f.self);
        CHECK(f.market->marketItem(0).value().seller == f.deployer);
    }

    TEST_CASE("Relist with zero price always fails") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        for (Amount value : {Amount(0), ROYALTY, ROYALTY + 1}) {
            auto result = f.market->resellToken(CallContext{f.user, value}, 0, 0);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_NON_POSITIVE_PRICE);
            CHECK(errorKind(result.error()) == ErrorKind::InvalidArgument);
        }
        CHECK(f.market->ownerOf(0).value() == f.user);
    }

    TEST_CASE("Relist requires the exact royalty fee") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        for (Amount value : {Amount(0), ROYALTY - 1, ROYALTY + 1}) {
            auto result = f.market->resellToken(CallContext{f.user, value}, 0, 2 * UNIT);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_WRONG_ROYALTY);
            CHECK(errorKind(result.error()) == ErrorKind::PaymentMismatch);
        }
        CHECK(f.market->ownerOf(0).value() == f.user);
    }

    TEST_CASE("Only the token owner can relist") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        auto stranger = f.market->resellToken(CallContext{f.other, ROYALTY}, 0, 2 * UNIT);
        REQUIRE(stranger.is_err());
        CHECK(stranger.error().code == ERR_NOT_TOKEN_OWNER);
        CHECK(errorKind(stranger.error()) == ErrorKind::Authorization);

        // Listed tokens belong to the marketplace, not to their seller
        auto seller = f.market->resellToken(CallContext{f.deployer, ROYALTY}, 1, 2 * UNIT);
        REQUIRE(seller.is_err());
        CHECK(seller.error().code == ERR_NOT_TOKEN_OWNER);

        CHECK(f.market->resellToken(CallContext{f.user, ROYALTY}, 42, UNIT).error().code == ERR_TOKEN_NOT_FOUND);
        CHECK(f.bank.balanceOf(f.other) == FUNDING);
        CHECK(f.market->events().size() == 1);
    }
}

TEST_SUITE("Marketplace Atomicity Tests") {
    TEST_CASE("Refused royalty payment rolls back the purchase") {
        MarketFixture f;
        f.bank.registerReceiver(f.artist, std::make_shared<RefusingReceiver>());

        auto result = f.market->buyToken(CallContext{f.user, UNIT}, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_PAYMENT_REJECTED);

        CHECK(f.market->ownerOf(0).value() == f.self);
        CHECK(f.market->marketItem(0).value().seller == f.deployer);
        CHECK(f.bank.balanceOf(f.user) == FUNDING);
        CHECK(f.bank.balanceOf(f.artist) == 0);
        CHECK(f.bank.balanceOf(f.deployer) == FUNDING - 8 * ROYALTY);
        CHECK(f.market->balance() == 8 * ROYALTY);
        CHECK(f.market->events().size() == 0);
        CHECK(f.market->checkInvariants().is_ok());
    }

    TEST_CASE("Refused seller payment rolls back the purchase") {
        MarketFixture f;
        f.bank.registerReceiver(f.deployer, std::make_shared<RefusingReceiver>());

        auto result = f.market->buyToken(CallContext{f.user, UNIT}, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_PAYMENT_REJECTED);
        CHECK(f.bank.balanceOf(f.artist) == 0);
        CHECK(f.market->getAllUnsoldTokens().size() == 8);

        f.bank.unregisterReceiver(f.deployer);
        CHECK(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());
    }

    TEST_CASE("Marketplace balance must cover the royalty") {
        MarketFixture f;
        REQUIRE(f.market->updateRoyaltyFee(CallContext{f.deployer, 0}, 50 * UNIT).is_ok());

        auto result = f.market->buyToken(CallContext{f.user, UNIT}, 0);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_LEDGER_BALANCE);
        CHECK(errorKind(result.error()) == ErrorKind::StateIntegrity);
        CHECK(f.market->balance() == 8 * ROYALTY);
        CHECK(f.bank.balanceOf(f.user) == FUNDING);
        CHECK(f.market->ownerOf(0).value() == f.self);
    }

    TEST_CASE("Reentrant calls from a payee are rejected") {
        MarketFixture f;
        auto receiver = std::make_shared<ReentrantReceiver>(f.market.get(), f.deployer);
        f.bank.registerReceiver(f.deployer, receiver);

        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());

        CHECK(receiver->calls == 1);
        CHECK(receiver->buy_error == ERR_REENTRANT_CALL);
        CHECK(receiver->resell_error == ERR_REENTRANT_CALL);
        CHECK(receiver->fee_error == ERR_REENTRANT_CALL);

        // The payee already saw the finalized listing state
        CHECK(receiver->seller_cleared);
        CHECK(receiver->unsold_seen == 7);

        CHECK(f.market->ownerOf(0).value() == f.user);
        CHECK(f.market->ownerOf(1).value() == f.self);
        CHECK(f.market->royaltyFee() == ROYALTY);
        CHECK(f.market->events().size() == 1);
        CHECK(f.market->checkInvariants().is_ok());

        // Guard is released afterwards
        f.bank.unregisterReceiver(f.deployer);
        CHECK(f.market->buyToken(CallContext{f.other, 2 * UNIT}, 1).is_ok());
    }

    TEST_CASE("Listing state agrees with escrow after a trading sequence") {
        MarketFixture f;
        REQUIRE(f.market->buyToken(CallContext{f.user, UNIT}, 0).is_ok());
        REQUIRE(f.market->buyToken(CallContext{f.other, 5 * UNIT}, 4).is_ok());
        REQUIRE(f.market->resellToken(CallContext{f.other, ROYALTY}, 4, 7 * UNIT).is_ok());
        REQUIRE(f.market->buyToken(CallContext{f.user, 7 * UNIT}, 4).is_ok());
        CHECK(f.market->buyToken(CallContext{f.other, 7 * UNIT}, 4).is_err());

        for (TokenId id = 0; id < f.market->itemCount(); ++id) {
            auto item = f.market->marketItem(id).value();
            bool escrowed = f.market->ownerOf(id).value() == f.self;
            CHECK(item.isListed() == escrowed);
            if (item.isListed())
                CHECK(item.price > 0);
        }
        CHECK(f.market->getMyTokens(f.user).size() == 2);
        CHECK(f.market->getMyTokens(f.other).empty());
        CHECK(f.market->checkInvariants().is_ok());
    }
}
