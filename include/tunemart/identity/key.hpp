#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <vector>

namespace tunemart {

    /// Ed25519 keypair of a marketplace account
    /// Header-only implementation using keylock for crypto operations
    class Key {
      public:
        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty()) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only (for verification)
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != 32) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// True only for a valid signature; a malformed signature is reported as false
        inline bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty() || signature.empty()) {
                return false;
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, keypair_.public_key);
            return result.success;
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        keylock::KeyPair keypair_;
    };

} // namespace tunemart
