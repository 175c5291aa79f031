#include "common/discovery_error.h"
#include "protocol/messages.h"
#include "protocol/wire.h"
#include "support/test_values.h"

#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

namespace {

std::vector<uint8_t> repeat(uint8_t value, size_t count) {
    return std::vector<uint8_t>(count, value);
}

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

void expect_decoding_error(const std::vector<uint8_t>& bytes) {
    try {
        decode_request(bytes);
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decoding) << e.what();
    }
}

TEST(WireTest, VarintUsesLeb128) {
    WireWriter out;
    out.write_varint(0);
    out.write_varint(127);
    out.write_varint(300);
    EXPECT_EQ(out.bytes(), (std::vector<uint8_t>{0x00, 0x7f, 0xac, 0x02}));

    WireReader in(out.bytes());
    EXPECT_EQ(in.read_varint_u32(), 0u);
    EXPECT_EQ(in.read_varint_u32(), 127u);
    EXPECT_EQ(in.read_varint_u32(), 300u);
    in.expect_end();
}

TEST(WireTest, RejectsOverlongVarint) {
    std::vector<uint8_t> bytes = {0xff, 0xff, 0xff, 0xff, 0xff, 0x01};
    WireReader in(bytes);
    EXPECT_THROW(in.read_varint_u32(), DiscoveryError);
}

TEST(WireTest, RejectsVarintAboveU32) {
    // 2^32 encoded in five bytes
    std::vector<uint8_t> bytes = {0x80, 0x80, 0x80, 0x80, 0x10};
    WireReader in(bytes);
    EXPECT_THROW(in.read_varint_u32(), DiscoveryError);
}

TEST(WireTest, StringKeepsHighBytes) {
    std::string text = "relay\xff\x80\x01";
    WireWriter out;
    out.write_string(text);
    out.write_string("");
    EXPECT_EQ(out.bytes(),
              (std::vector<uint8_t>{8, 'r', 'e', 'l', 'a', 'y', 0xff, 0x80, 0x01, 0}));

    WireReader in(out.bytes());
    EXPECT_EQ(in.read_string(), text);
    EXPECT_EQ(in.read_string(), "");
    in.expect_end();
}

TEST(WireTest, LengthMustFitRemainingInput) {
    std::vector<uint8_t> bytes = {0x05, 'a', 'b'};
    WireReader in(bytes);
    EXPECT_THROW(in.read_string(), DiscoveryError);
}

TEST(MessagesTest, QueryEncodesFieldsInOrder) {
    Query query;
    query.content = ContentAddress::hash_seq(make_hash(0xab));
    query.flags.complete = true;
    query.flags.verified = false;

    auto expected = concat({{1}, repeat(0xab, 32), {1, 1, 0}});
    EXPECT_EQ(encode_request(query), expected);
}

TEST(MessagesTest, QueryDecodesEveryFlagCombination) {
    for (auto format : {BlobFormat::Raw, BlobFormat::HashSeq}) {
        for (bool complete : {false, true}) {
            for (bool verified : {false, true}) {
                Query query;
                query.content = ContentAddress{make_hash(0x3c), format};
                query.flags.complete = complete;
                query.flags.verified = verified;

                Request decoded = decode_request(encode_request(query));
                auto* out = std::get_if<Query>(&decoded);
                ASSERT_NE(out, nullptr);
                EXPECT_EQ(*out, query);
                EXPECT_EQ(out->flags.complete, complete);
                EXPECT_EQ(out->flags.verified, verified);
            }
        }
    }
}

TEST(MessagesTest, QueryFlagBytesAreCompleteThenVerified) {
    Request decoded = decode_request(concat({{1}, repeat(0xab, 32), {0, 0, 1}}));
    const auto& query = std::get<Query>(decoded);
    EXPECT_EQ(query.content, ContentAddress::raw(make_hash(0xab)));
    EXPECT_FALSE(query.flags.complete);
    EXPECT_TRUE(query.flags.verified);
}

TEST(MessagesTest, AnnounceEncodesFieldsInOrder) {
    Announce announce;
    announce.host = make_peer(0x11);
    announce.content.insert(ContentAddress::raw(make_hash(0x22)));
    announce.kind = AnnounceKind::Partial;

    auto expected = concat({{0}, repeat(0x11, 32), {1}, repeat(0x22, 32), {0, 0}});
    EXPECT_EQ(encode_request(announce), expected);
}

TEST(MessagesTest, QueryResponseEncodesHostsInOrder) {
    QueryResponse response;
    response.content = ContentAddress::raw(make_hash(0x01));
    response.hosts = {make_peer(0x02), make_peer(0x03)};

    auto expected =
        concat({{0}, repeat(0x01, 32), {0, 2}, repeat(0x02, 32), repeat(0x03, 32)});
    EXPECT_EQ(encode_response(response), expected);
}

TEST(MessagesTest, AnnounceDecodesWithKindAndContent) {
    Announce announce;
    announce.host = make_peer(0x11);
    announce.content = {ContentAddress::raw(make_hash(0x22)),
                        ContentAddress::hash_seq(make_hash(0x22)),
                        ContentAddress::raw(make_hash(0x33))};

    for (auto kind : {AnnounceKind::Partial, AnnounceKind::Complete}) {
        announce.kind = kind;
        Request decoded = decode_request(encode_request(announce));
        auto* out = std::get_if<Announce>(&decoded);
        ASSERT_NE(out, nullptr);
        EXPECT_EQ(*out, announce);
        EXPECT_EQ(out->kind, kind);
    }
}

TEST(MessagesTest, EmptyAnnounceIsValid) {
    Announce announce;
    announce.host = make_peer(0x44);

    auto bytes = encode_request(announce);
    EXPECT_EQ(bytes.size(), 1u + 32u + 1u + 1u);

    Request decoded = decode_request(bytes);
    ASSERT_TRUE(std::holds_alternative<Announce>(decoded));
    EXPECT_TRUE(std::get<Announce>(decoded).content.empty());
}

TEST(MessagesTest, DuplicateAnnounceEntriesCollapse) {
    auto entry = concat({repeat(0x22, 32), {0}});
    auto bytes = concat({{0}, repeat(0x11, 32), {2}, entry, entry, {1}});

    Request decoded = decode_request(bytes);
    ASSERT_TRUE(std::holds_alternative<Announce>(decoded));
    EXPECT_EQ(std::get<Announce>(decoded).content.size(), 1u);
}

TEST(MessagesTest, ResponseKeepsDuplicateHostsAndOrder) {
    QueryResponse response;
    response.content = ContentAddress::hash_seq(make_hash(0x05));
    response.hosts = {make_peer(0x09), make_peer(0x01), make_peer(0x09)};

    Response decoded = decode_response(encode_response(response));
    EXPECT_EQ(std::get<QueryResponse>(decoded).hosts, response.hosts);
}

TEST(MessagesTest, ResponseWithNoHosts) {
    QueryResponse response;
    response.content = ContentAddress::raw(make_hash(0x07));

    Response decoded = decode_response(encode_response(response));
    EXPECT_EQ(std::get<QueryResponse>(decoded), response);
}

TEST(MessagesTest, RejectsUnknownRequestTag) {
    expect_decoding_error(concat({{2}, repeat(0xab, 32), {0, 1, 0}}));
}

TEST(MessagesTest, RejectsUnknownResponseTag) {
    EXPECT_THROW(decode_response(concat({{1}, repeat(0x01, 32), {0, 0}})), DiscoveryError);
}

TEST(MessagesTest, RejectsBadBool) {
    expect_decoding_error(concat({{1}, repeat(0xab, 32), {0, 2, 0}}));
}

TEST(MessagesTest, RejectsUnknownFormatAndKind) {
    expect_decoding_error(concat({{1}, repeat(0xab, 32), {2, 1, 0}}));
    expect_decoding_error(concat({{0}, repeat(0x11, 32), {0, 2}}));
}

TEST(MessagesTest, RejectsTruncatedInput) {
    expect_decoding_error({});
    expect_decoding_error(concat({{1}, repeat(0xab, 20)}));
    expect_decoding_error(concat({{1}, repeat(0xab, 32), {1, 1}}));
}

TEST(MessagesTest, RejectsTrailingBytes) {
    expect_decoding_error(concat({{1}, repeat(0xab, 32), {1, 1, 0, 0}}));
}

TEST(MessagesTest, RejectsHostCountBeyondInput) {
    auto bytes = concat({{0}, repeat(0x01, 32), {0, 3}, repeat(0x02, 32)});
    EXPECT_THROW(decode_response(bytes), DiscoveryError);
}

} // namespace
