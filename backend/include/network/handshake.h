#pragma once

#include "content/peer_id.h"
#include "crypto/crypto_manager.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Connection handshake for the TCP transport.
 *
 *   client -> server : u8 tag_len, tag, nonce[32]
 *   server -> client : node_id[32], signature[64]
 *
 * The signature covers kHandshakeContext || tag || nonce. A server that
 * does not serve the tag closes the connection instead of replying.
 */

inline constexpr char kHandshakeContext[] = "content-discovery/handshake";
inline constexpr size_t kNonceSize = 32;
inline constexpr size_t kMaxProtocolLength = 255;
inline constexpr size_t kHandshakeReplySize = PeerId::kSize + CryptoManager::kSignatureSize;

using Nonce = std::array<uint8_t, kNonceSize>;

/// Bytes the server signs and the client verifies.
std::vector<uint8_t> handshake_transcript(const std::string& protocol, const Nonce& nonce);

std::vector<uint8_t> encode_handshake_hello(const std::string& protocol, const Nonce& nonce);

std::vector<uint8_t> encode_handshake_reply(const CryptoManager& identity,
                                            const std::string& protocol,
                                            const Nonce& nonce);

/**
 * Check a server reply against the peer we meant to reach.
 * Throws DiscoveryError(Connection) on a wrong id or bad signature.
 */
void verify_handshake_reply(const std::vector<uint8_t>& reply,
                            const PeerId& expected,
                            const std::string& protocol,
                            const Nonce& nonce);
