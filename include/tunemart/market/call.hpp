#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "tunemart/common/amount.hpp"
#include "tunemart/common/error.hpp"
#include "tunemart/identity/address.hpp"
#include "tunemart/identity/key.hpp"

namespace tunemart {

    /// Mutating marketplace operations that can be submitted to the executor
    enum class CallKind : dp::u8 {
        UpdateRoyaltyFee = 0,
        BuyToken = 1,
        ResellToken = 2,
        TransferOwnership = 3,
    };

    inline std::string callKindToString(CallKind kind) {
        switch (kind) {
        case CallKind::UpdateRoyaltyFee:
            return "updateRoyaltyFee";
        case CallKind::BuyToken:
            return "buyToken";
        case CallKind::ResellToken:
            return "resellToken";
        case CallKind::TransferOwnership:
            return "transferOwnership";
        default:
            return "unknown";
        }
    }

    /// One marketplace call: operation, arguments and attached payment
    struct MarketCall {
        dp::String call_id;  // unique per call, replayed ids are rejected
        dp::u8 kind{0};      // CallKind
        TokenId token_id{0}; // BuyToken, ResellToken
        Amount amount{0};    // new fee (UpdateRoyaltyFee) or new price (ResellToken)
        Address target{};    // new owner (TransferOwnership)
        Amount value{0};     // attached payment

        inline static MarketCall updateRoyaltyFee(const std::string &call_id, Amount new_fee) {
            return make(call_id, CallKind::UpdateRoyaltyFee, 0, new_fee, Address::zero(), 0);
        }

        inline static MarketCall buyToken(const std::string &call_id, TokenId token_id, Amount value) {
            return make(call_id, CallKind::BuyToken, token_id, 0, Address::zero(), value);
        }

        inline static MarketCall resellToken(const std::string &call_id, TokenId token_id, Amount new_price,
                                             Amount value) {
            return make(call_id, CallKind::ResellToken, token_id, new_price, Address::zero(), value);
        }

        inline static MarketCall transferOwnership(const std::string &call_id, const Address &new_owner) {
            return make(call_id, CallKind::TransferOwnership, 0, 0, new_owner, 0);
        }

        inline CallKind getKind() const { return static_cast<CallKind>(kind); }

        inline std::string getCallId() const { return std::string(call_id.c_str()); }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<MarketCall &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<MarketCall, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, MarketCall>(buf);
                return dp::Result<MarketCall, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<MarketCall, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(call_id, kind, token_id, amount, target, value); }
        auto members() const { return std::tie(call_id, kind, token_id, amount, target, value); }

      private:
        inline static MarketCall make(const std::string &call_id, CallKind kind, TokenId token_id, Amount amount,
                                      const Address &target, Amount value) {
            MarketCall call;
            call.call_id = dp::String(call_id.c_str());
            call.kind = static_cast<dp::u8>(kind);
            call.token_id = token_id;
            call.amount = amount;
            call.target = target;
            call.value = value;
            return call;
        }
    };

    /// A call signed by its sender; the sender address is derived from the public key
    struct SignedCall {
        MarketCall call;
        dp::Vector<dp::u8> public_key;
        dp::Vector<dp::u8> signature;

        inline static dp::Result<SignedCall, dp::Error> sign(const MarketCall &call, const Key &key) {
            auto signature = key.sign(call.toBytes());
            if (!signature.is_ok()) {
                return dp::Result<SignedCall, dp::Error>::err(signature.error());
            }

            SignedCall signed_call;
            signed_call.call = call;
            const auto &pub = key.getPublicKey();
            signed_call.public_key = dp::Vector<dp::u8>(pub.begin(), pub.end());
            const auto &sig = signature.value();
            signed_call.signature = dp::Vector<dp::u8>(sig.begin(), sig.end());
            return dp::Result<SignedCall, dp::Error>::ok(signed_call);
        }

        /// Check the signature and return the sender address
        inline dp::Result<Address, dp::Error> verify() const {
            auto key = Key::fromPublicKey(std::vector<uint8_t>(public_key.begin(), public_key.end()));
            if (!key.is_ok()) {
                return dp::Result<Address, dp::Error>::err(bad_signature(key.error().message));
            }

            std::vector<uint8_t> sig(signature.begin(), signature.end());
            if (!key.value().verify(call.toBytes(), sig)) {
                return dp::Result<Address, dp::Error>::err(bad_signature());
            }
            return dp::Result<Address, dp::Error>::ok(Address::fromKey(key.value()));
        }

        auto members() { return std::tie(call, public_key, signature); }
        auto members() const { return std::tie(call, public_key, signature); }
    };

} // namespace tunemart
