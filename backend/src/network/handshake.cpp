#include "network/handshake.h"

#include "common/discovery_error.h"

#include <algorithm>
#include <cstring>

std::vector<uint8_t> handshake_transcript(const std::string& protocol, const Nonce& nonce) {
    std::vector<uint8_t> out(kHandshakeContext, kHandshakeContext + std::strlen(kHandshakeContext));
    out.insert(out.end(), protocol.begin(), protocol.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    return out;
}

std::vector<uint8_t> encode_handshake_hello(const std::string& protocol, const Nonce& nonce) {
    if (protocol.empty() || protocol.size() > kMaxProtocolLength) {
        throw DiscoveryError(ErrorKind::Connection,
                             "protocol tag must be 1.." + std::to_string(kMaxProtocolLength) + " bytes");
    }
    std::vector<uint8_t> out;
    out.reserve(1 + protocol.size() + nonce.size());
    out.push_back(static_cast<uint8_t>(protocol.size()));
    out.insert(out.end(), protocol.begin(), protocol.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    return out;
}

std::vector<uint8_t> encode_handshake_reply(const CryptoManager& identity,
                                            const std::string& protocol,
                                            const Nonce& nonce) {
    auto signature = identity.sign(handshake_transcript(protocol, nonce));
    const auto& id = identity.node_id().bytes();

    std::vector<uint8_t> out(id.begin(), id.end());
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

void verify_handshake_reply(const std::vector<uint8_t>& reply,
                            const PeerId& expected,
                            const std::string& protocol,
                            const Nonce& nonce) {
    if (reply.size() != kHandshakeReplySize) {
        throw DiscoveryError(ErrorKind::Connection, "handshake reply has wrong size");
    }

    PeerId::Bytes id;
    std::copy(reply.begin(), reply.begin() + PeerId::kSize, id.begin());
    PeerId remote(id);
    if (remote != expected) {
        throw DiscoveryError(ErrorKind::Connection,
                             "expected peer " + expected.to_string() +
                             " but reached " + remote.to_string());
    }

    CryptoManager::Signature signature;
    std::copy(reply.begin() + PeerId::kSize, reply.end(), signature.begin());
    if (!CryptoManager::verify(handshake_transcript(protocol, nonce), signature, remote)) {
        throw DiscoveryError(ErrorKind::Connection,
                             "peer " + remote.short_string() + " failed to prove its identity");
    }
}
