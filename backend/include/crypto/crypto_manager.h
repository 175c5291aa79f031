#pragma once

#include "content/peer_id.h"

#include <array>
#include <cstdint>
#include <vector>

/**
 * Wraps libsodium for the node's Ed25519 identity.
 *
 * The public key is the node's PeerId; the secret key signs transport
 * handshakes so the connecting side can check who answered.
 */
class CryptoManager {
public:
    static constexpr size_t kSignatureSize = 64;
    static constexpr size_t kSeedSize = 32;
    using Signature = std::array<uint8_t, kSignatureSize>;

    CryptoManager();

    /// Must be called once before any other method. Safe to call again.
    static bool init();

    /// Generate a fresh Ed25519 key pair.
    void generate_keypair();

    /// Derive the key pair from a 32-byte seed.
    void keypair_from_seed(const std::array<uint8_t, kSeedSize>& seed);

    /// Sign a message with Ed25519.
    [[nodiscard]] Signature sign(const std::vector<uint8_t>& message) const;

    /// Verify an Ed25519 signature made by `signer`.
    static bool verify(const std::vector<uint8_t>& message,
                       const Signature& signature,
                       const PeerId& signer);

    [[nodiscard]] bool has_keypair() const { return !secret_key_.empty(); }
    [[nodiscard]] const PeerId& node_id() const { return node_id_; }

private:
    PeerId node_id_;                  // Ed25519 public key
    std::vector<uint8_t> secret_key_; // Ed25519 secret key (seed || public)
};
