#include "tunemart/common/error.hpp"
#include "tunemart/market/call.hpp"
#include <doctest/doctest.h>

using namespace tunemart;

TEST_SUITE("Market Call Tests") {
    TEST_CASE("Call builders fill the right fields") {
        auto buy = MarketCall::buyToken("call-1", 4, 5000);
        CHECK(buy.getKind() == CallKind::BuyToken);
        CHECK(buy.getCallId() == "call-1");
        CHECK(buy.token_id == 4);
        CHECK(buy.value == 5000);

        auto resell = MarketCall::resellToken("call-2", 4, 9000, 10);
        CHECK(resell.getKind() == CallKind::ResellToken);
        CHECK(resell.amount == 9000);
        CHECK(resell.value == 10);

        auto fee = MarketCall::updateRoyaltyFee("call-3", 25);
        CHECK(fee.getKind() == CallKind::UpdateRoyaltyFee);
        CHECK(fee.amount == 25);
        CHECK(fee.value == 0);

        Address next = Address::fromLabel("next-owner");
        auto ownership = MarketCall::transferOwnership("call-4", next);
        CHECK(ownership.getKind() == CallKind::TransferOwnership);
        CHECK(ownership.target == next);

        CHECK(callKindToString(CallKind::ResellToken) == "resellToken");
    }

    TEST_CASE("Serialized call decodes to the same call") {
        auto call = MarketCall::resellToken("call-7", 2, 1500, 10);
        auto bytes = call.toBytes();
        CHECK_FALSE(bytes.empty());

        auto decoded = MarketCall::fromBytes(bytes);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().getCallId() == "call-7");
        CHECK(decoded.value().getKind() == CallKind::ResellToken);
        CHECK(decoded.value().token_id == 2);
        CHECK(decoded.value().amount == 1500);
        CHECK(decoded.value().value == 10);
    }

    TEST_CASE("Garbage bytes are rejected") {
        std::vector<uint8_t> garbage = {0x01, 0x02};
        CHECK(MarketCall::fromBytes(garbage).is_err());
    }

    TEST_CASE("Signed call verifies to the signer address") {
        auto key = Key::generate();
        REQUIRE(key.is_ok());

        auto signed_call = SignedCall::sign(MarketCall::buyToken("call-1", 0, 1000), key.value());
        REQUIRE(signed_call.is_ok());

        auto sender = signed_call.value().verify();
        REQUIRE(sender.is_ok());
        CHECK(sender.value() == Address::fromKey(key.value()));
    }

    TEST_CASE("Tampered call fails verification") {
        auto key = Key::generate();
        REQUIRE(key.is_ok());

        auto signed_call = SignedCall::sign(MarketCall::buyToken("call-1", 0, 1000), key.value());
        REQUIRE(signed_call.is_ok());

        auto tampered = signed_call.value();
        tampered.call.value = 1;
        auto result = tampered.verify();
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_BAD_SIGNATURE);

        auto no_key = signed_call.value();
        no_key.public_key.clear();
        CHECK(no_key.verify().is_err());
    }
}
