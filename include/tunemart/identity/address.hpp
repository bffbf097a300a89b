#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <ostream>
#include <tuple>
#include <string>
#include <vector>

#include "key.hpp"

namespace tunemart {

    /// 20-byte account address
    /// The all-zero address is the sentinel for "no account" (an unlisted item's seller)
    class Address {
      public:
        static constexpr dp::usize SIZE = 20;

        Address() = default;

        inline static Address zero() { return Address(); }

        /// Parse "0x" followed by 40 hex digits
        inline static dp::Result<Address, dp::Error> fromHex(const std::string &hex) {
            std::string digits = hex;
            if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
                digits = digits.substr(2);
            }
            if (digits.size() != SIZE * 2) {
                return dp::Result<Address, dp::Error>::err(
                    dp::Error::invalid_argument("Address must be 20 bytes (40 hex digits)"));
            }
            for (char c : digits) {
                bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
                if (!is_hex) {
                    return dp::Result<Address, dp::Error>::err(
                        dp::Error::invalid_argument("Address contains non-hex characters"));
                }
            }

            auto bytes = keylock::keylock::from_hex(digits);
            if (bytes.size() != SIZE) {
                return dp::Result<Address, dp::Error>::err(dp::Error::invalid_argument("Invalid address encoding"));
            }
            return dp::Result<Address, dp::Error>::ok(fromBytes(bytes));
        }

        /// Address of a key holder: last 20 bytes of SHA-256(public key)
        inline static Address fromKey(const Key &key) { return fromDigest(key.getPublicKey()); }

        /// Deterministic address for a named account (contracts, fixtures)
        inline static Address fromLabel(const std::string &label) {
            return fromDigest(std::vector<uint8_t>(label.begin(), label.end()));
        }

        inline bool isZero() const {
            for (dp::usize i = 0; i < SIZE; ++i) {
                if (bytes_[i] != 0)
                    return false;
            }
            return true;
        }

        inline std::vector<uint8_t> toBytes() const {
            std::vector<uint8_t> out(SIZE);
            for (dp::usize i = 0; i < SIZE; ++i)
                out[i] = bytes_[i];
            return out;
        }

        inline std::string toHex() const { return "0x" + keylock::keylock::to_hex(toBytes()); }

        /// First 6 bytes, for log lines
        inline std::string shortHex() const { return toHex().substr(0, 14); }

        inline bool operator==(const Address &other) const {
            for (dp::usize i = 0; i < SIZE; ++i) {
                if (bytes_[i] != other.bytes_[i])
                    return false;
            }
            return true;
        }

        inline bool operator!=(const Address &other) const { return !(*this == other); }

        inline bool operator<(const Address &other) const {
            for (dp::usize i = 0; i < SIZE; ++i) {
                if (bytes_[i] != other.bytes_[i])
                    return bytes_[i] < other.bytes_[i];
            }
            return false;
        }

        auto members() { return std::tie(bytes_); }
        auto members() const { return std::tie(bytes_); }

      private:
        inline static Address fromBytes(const std::vector<uint8_t> &bytes) {
            Address address;
            for (dp::usize i = 0; i < SIZE; ++i)
                address.bytes_[i] = bytes[i];
            return address;
        }

        inline static Address fromDigest(const std::vector<uint8_t> &input) {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(input);
            if (!hash_result.success || hash_result.data.size() < SIZE) {
                return Address();
            }
            std::vector<uint8_t> tail(hash_result.data.end() - SIZE, hash_result.data.end());
            return fromBytes(tail);
        }

        dp::Array<dp::u8, SIZE> bytes_ = {};
    };

    inline std::ostream &operator<<(std::ostream &os, const Address &address) { return os << address.toHex(); }

} // namespace tunemart
