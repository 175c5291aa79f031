/**
 * CryptoManager - Ed25519 node identity on top of libsodium.
 *
 * - key generation (random or from seed)
 * - detached signing / verification
 */

#include "crypto/crypto_manager.h"

#include "common/discovery_error.h"

#include <sodium.h>

CryptoManager::CryptoManager() = default;

bool CryptoManager::init() {
    // 1 means "already initialised", which is fine.
    return sodium_init() >= 0;
}

void CryptoManager::generate_keypair() {
    PeerId::Bytes public_key;
    secret_key_.assign(crypto_sign_SECRETKEYBYTES, 0);
    crypto_sign_keypair(public_key.data(), secret_key_.data());
    node_id_ = PeerId(public_key);
}

void CryptoManager::keypair_from_seed(const std::array<uint8_t, kSeedSize>& seed) {
    PeerId::Bytes public_key;
    secret_key_.assign(crypto_sign_SECRETKEYBYTES, 0);
    crypto_sign_seed_keypair(public_key.data(), secret_key_.data(), seed.data());
    node_id_ = PeerId(public_key);
}

CryptoManager::Signature CryptoManager::sign(const std::vector<uint8_t>& message) const {
    if (!has_keypair()) {
        throw DiscoveryError(ErrorKind::Config, "no key pair loaded");
    }
    Signature signature{};
    crypto_sign_detached(signature.data(), nullptr,
                         message.data(), message.size(),
                         secret_key_.data());
    return signature;
}

bool CryptoManager::verify(const std::vector<uint8_t>& message,
                           const Signature& signature,
                           const PeerId& signer) {
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       signer.bytes().data()) == 0;
}
