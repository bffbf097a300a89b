#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace tunemart {

    // ===========================================
    // Tunemart-specific error codes (100+)
    // ===========================================

    // Authorization
    constexpr dp::u32 ERR_UNAUTHORIZED = 100;
    constexpr dp::u32 ERR_NOT_TOKEN_OWNER = 101;

    // Payment mismatch
    constexpr dp::u32 ERR_WRONG_PRICE = 110;
    constexpr dp::u32 ERR_WRONG_ROYALTY = 111;
    constexpr dp::u32 ERR_INSUFFICIENT_DEPOSIT = 112;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 113;
    constexpr dp::u32 ERR_NOT_PAYABLE = 114;

    // Invalid argument
    constexpr dp::u32 ERR_NON_POSITIVE_PRICE = 120;
    constexpr dp::u32 ERR_TOKEN_NOT_FOUND = 121;
    constexpr dp::u32 ERR_ZERO_ADDRESS = 122;
    constexpr dp::u32 ERR_AMOUNT_OVERFLOW = 123;
    constexpr dp::u32 ERR_DUPLICATE_TOKEN = 124;

    // State integrity
    constexpr dp::u32 ERR_NOT_LISTED = 130;
    constexpr dp::u32 ERR_TRANSFER_FROM_MISMATCH = 131;
    constexpr dp::u32 ERR_REENTRANT_CALL = 132;
    constexpr dp::u32 ERR_INSUFFICIENT_LEDGER_BALANCE = 133;
    constexpr dp::u32 ERR_INVARIANT_VIOLATED = 134;
    constexpr dp::u32 ERR_PAYMENT_REJECTED = 135;

    // Host / envelope
    constexpr dp::u32 ERR_DUPLICATE_CALL = 140;
    constexpr dp::u32 ERR_BAD_SIGNATURE = 141;
    constexpr dp::u32 ERR_NOT_DEPLOYED = 142;
    constexpr dp::u32 ERR_ALREADY_DEPLOYED = 143;
    constexpr dp::u32 ERR_UNKNOWN_CALL = 144;

    /// Error taxonomy of the marketplace; every code above belongs to one kind
    enum class ErrorKind : dp::u8 {
        Authorization = 0,
        PaymentMismatch = 1,
        InvalidArgument = 2,
        StateIntegrity = 3,
        Other = 4,
    };

    inline ErrorKind errorKind(dp::u32 code) {
        if (code >= 100 && code < 110)
            return ErrorKind::Authorization;
        if (code >= 110 && code < 120)
            return ErrorKind::PaymentMismatch;
        if (code >= 120 && code < 130)
            return ErrorKind::InvalidArgument;
        if (code >= 130 && code < 140)
            return ErrorKind::StateIntegrity;
        return ErrorKind::Other;
    }

    inline ErrorKind errorKind(const dp::Error &error) { return errorKind(error.code); }

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::PaymentMismatch:
            return "payment-mismatch";
        case ErrorKind::InvalidArgument:
            return "invalid-argument";
        case ErrorKind::StateIntegrity:
            return "state-integrity";
        default:
            return "other";
        }
    }

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error unauthorized(const dp::String &msg = "Ownable: caller is not the owner") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error not_token_owner(const dp::String &msg = "Caller does not own the token") {
        return dp::Error{ERR_NOT_TOKEN_OWNER, msg};
    }

    inline dp::Error wrong_price(
        const dp::String &msg = "Please send the asking price in order to complete the purchase") {
        return dp::Error{ERR_WRONG_PRICE, msg};
    }

    inline dp::Error wrong_royalty(
        const dp::String &msg = "Please send the required Royalty Fee in order to relist the item on Marketplace") {
        return dp::Error{ERR_WRONG_ROYALTY, msg};
    }

    inline dp::Error insufficient_deposit(
        const dp::String &msg = "Deployer has to pay the royalty fee for every listed item") {
        return dp::Error{ERR_INSUFFICIENT_DEPOSIT, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error not_payable(const dp::String &msg = "Operation does not accept payment") {
        return dp::Error{ERR_NOT_PAYABLE, msg};
    }

    inline dp::Error non_positive_price(
        const dp::String &msg = "Please set a Positive Number as the price of the item") {
        return dp::Error{ERR_NON_POSITIVE_PRICE, msg};
    }

    inline dp::Error token_not_found(const dp::String &msg = "Token does not exist") {
        return dp::Error{ERR_TOKEN_NOT_FOUND, msg};
    }

    inline dp::Error zero_address(const dp::String &msg = "Zero address is not a valid account") {
        return dp::Error{ERR_ZERO_ADDRESS, msg};
    }

    inline dp::Error amount_overflow(const dp::String &msg = "Amount overflow") {
        return dp::Error{ERR_AMOUNT_OVERFLOW, msg};
    }

    inline dp::Error duplicate_token(const dp::String &msg = "Token already minted") {
        return dp::Error{ERR_DUPLICATE_TOKEN, msg};
    }

    inline dp::Error not_listed(const dp::String &msg = "Item is not listed for sale") {
        return dp::Error{ERR_NOT_LISTED, msg};
    }

    inline dp::Error transfer_from_mismatch(const dp::String &msg = "Transfer from incorrect owner") {
        return dp::Error{ERR_TRANSFER_FROM_MISMATCH, msg};
    }

    inline dp::Error reentrant_call(const dp::String &msg = "Reentrant call rejected") {
        return dp::Error{ERR_REENTRANT_CALL, msg};
    }

    inline dp::Error insufficient_ledger_balance(const dp::String &msg = "Marketplace balance cannot cover payment") {
        return dp::Error{ERR_INSUFFICIENT_LEDGER_BALANCE, msg};
    }

    inline dp::Error invariant_violated(const dp::String &msg = "Ledger invariant violated") {
        return dp::Error{ERR_INVARIANT_VIOLATED, msg};
    }

    inline dp::Error payment_rejected(const dp::String &msg = "Payee rejected the payment") {
        return dp::Error{ERR_PAYMENT_REJECTED, msg};
    }

    inline dp::Error duplicate_call(const dp::String &msg = "Duplicate call id") {
        return dp::Error{ERR_DUPLICATE_CALL, msg};
    }

    inline dp::Error bad_signature(const dp::String &msg = "Call signature verification failed") {
        return dp::Error{ERR_BAD_SIGNATURE, msg};
    }

    inline dp::Error not_deployed(const dp::String &msg = "Marketplace not deployed") {
        return dp::Error{ERR_NOT_DEPLOYED, msg};
    }

    inline dp::Error already_deployed(const dp::String &msg = "Marketplace already deployed") {
        return dp::Error{ERR_ALREADY_DEPLOYED, msg};
    }

    inline dp::Error unknown_call(const dp::String &msg = "Unknown call kind") {
        return dp::Error{ERR_UNKNOWN_CALL, msg};
    }

} // namespace tunemart
