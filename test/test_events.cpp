#include "tunemart/ledger/events.hpp"
#include <doctest/doctest.h>

using namespace tunemart;
using namespace tunemart::ledger;

TEST_SUITE("Event Log Tests") {
    TEST_CASE("Publish assigns sequence numbers") {
        EventLog log;
        Address seller = Address::fromLabel("seller");
        Address buyer = Address::fromLabel("buyer");

        auto first = log.publish(MarketEvent::bought(3, seller, buyer, 3000));
        CHECK(first.sequence == 0);
        auto second = log.publish(MarketEvent::relisted(3, buyer, 4000));
        CHECK(second.sequence == 1);

        REQUIRE(log.size() == 2);
        CHECK(log.events()[0].getType() == MarketEventType::ItemBought);
        CHECK(log.events()[1].getType() == MarketEventType::ItemRelisted);
        CHECK(log.events()[1].buyer.isZero());
    }

    TEST_CASE("Listeners see every published event") {
        EventLog log;
        std::vector<TokenId> seen;
        log.subscribe([&seen](const MarketEvent &event) { seen.push_back(event.token_id); });

        Address seller = Address::fromLabel("seller");
        log.publish(MarketEvent::relisted(1, seller, 10));
        log.publish(MarketEvent::relisted(4, seller, 10));
        CHECK(seen == std::vector<TokenId>{1, 4});
    }

    TEST_CASE("Listener subscribing during notification") {
        EventLog log;
        int outer_calls = 0;
        int inner_calls = 0;
        log.subscribe([&](const MarketEvent &) {
            ++outer_calls;
            log.subscribe([&inner_calls](const MarketEvent &) { ++inner_calls; });
        });

        Address seller = Address::fromLabel("seller");
        log.publish(MarketEvent::relisted(1, seller, 10));
        CHECK(outer_calls == 1);
        CHECK(inner_calls == 0);

        log.publish(MarketEvent::relisted(2, seller, 10));
        CHECK(outer_calls == 2);
        CHECK(inner_calls == 1);
    }

    TEST_CASE("Filter by token") {
        EventLog log;
        Address seller = Address::fromLabel("seller");
        Address buyer = Address::fromLabel("buyer");
        log.publish(MarketEvent::bought(1, seller, buyer, 10));
        log.publish(MarketEvent::bought(2, seller, buyer, 20));
        log.publish(MarketEvent::relisted(1, buyer, 15));

        auto history = log.eventsForToken(1);
        REQUIRE(history.size() == 2);
        CHECK(history[0].price == 10);
        CHECK(history[1].price == 15);
        CHECK(log.eventsForToken(9).empty());
    }

    TEST_CASE("Event description") {
        Address seller = Address::fromLabel("seller");
        auto event = MarketEvent::relisted(2, seller, 500);
        std::string text = event.toString();
        CHECK(text.find("MarketItemRelisted(2, ") == 0);
        CHECK(text.find(seller.toHex()) != std::string::npos);
        CHECK(text.find("500)") != std::string::npos);
    }
}
