#include <gtest/gtest.h>

#include "tnsprobe/packet/codec.hpp"
#include "tnsprobe/packet/control.hpp"
#include "tnsprobe/packet/stream.hpp"
#include "../utils/fixtures.hpp"

using namespace tnsprobe;
using namespace tnsprobe::proto;
using tnsprobe::test::from_hex;

class StreamTest : public ::testing::Test {};

// 1バイトずつ届いても同じパケットになる
TEST_F(StreamTest, ChunkedInput) {
    auto bytes = from_hex(test::kConnect013AHex);
    auto whole = decode_packet(bytes);
    ASSERT_TRUE(whole.has_value());

    for (size_t chunk : {1u, 3u, 7u, 64u}) {
        MemoryStream stream(bytes, chunk);
        auto r = read_packet(stream);
        ASSERT_TRUE(r.has_value()) << "chunk=" << chunk;
        EXPECT_EQ(r.value(), whole.value());
        EXPECT_EQ(stream.remaining(), 0u);
    }
}

// 連続した複数パケット
TEST_F(StreamTest, BackToBackPackets) {
    MemoryStream stream;
    auto a = from_hex(test::kAccept0139Hex);
    auto d = from_hex(test::kDataTrivialHex);
    stream.feed(a);
    stream.feed(d);

    auto r1 = read_packet(stream);
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1.value().header.type, PacketType::Accept);
    auto r2 = read_packet(stream);
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2.value().header.type, PacketType::Data);

    // 終端
    auto r3 = read_packet(stream);
    ASSERT_FALSE(r3.has_value());
    EXPECT_EQ(r3.error(), TnsErrc::truncated_input);
}

// どの位置で途切れても truncated_input
TEST_F(StreamTest, TruncatedAtEveryPrefix) {
    auto bytes = from_hex(test::kNSNRequestHex);
    for (size_t n = 0; n < bytes.size(); ++n) {
        MemoryStream stream(std::vector<uint8_t>(bytes.begin(), bytes.begin() + n));
        auto r = read_packet(stream);
        ASSERT_FALSE(r.has_value()) << "prefix=" << n;
        EXPECT_EQ(r.error(), TnsErrc::truncated_input) << "prefix=" << n;
    }
}

TEST_F(StreamTest, InvalidHeaderLength) {
    MemoryStream stream(from_hex("00 04 00 00 06 00 00 00"));
    auto r = read_packet(stream);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TnsErrc::invalid_length);
}

TEST_F(StreamTest, UnknownTypeIsNotAnError) {
    MemoryStream stream(from_hex("00 0a 00 00 ff 00 00 00 de ad"));
    auto r = read_packet(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<UnknownBody>(r.value().body).bytes, from_hex("de ad"));
}

TEST_F(StreamTest, WritePacketRecordsBytes) {
    MemoryStream stream;
    auto bytes = from_hex(test::kAccept0139Hex);
    auto p = decode_packet(bytes);
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(write_packet(stream, p.value()));
    EXPECT_EQ(stream.written(), bytes);
}

// Refuse / Redirect の補助デコーダ
TEST_F(StreamTest, RefuseBody) {
    std::string text = "(DESCRIPTION=(ERR=12514))";
    std::vector<uint8_t> body = {0x22, 0x00, 0x00, static_cast<uint8_t>(text.size())};
    body.insert(body.end(), text.begin(), text.end());
    auto r = decode_refuse(UnknownBody{body});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().user_reason, 0x22);
    EXPECT_EQ(r.value().system_reason, 0x00);
    EXPECT_EQ(r.value().data, text);

    body.pop_back();
    auto r2 = decode_refuse(UnknownBody{body});
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error(), TnsErrc::truncated_input);
}

TEST_F(StreamTest, RedirectBody) {
    std::string text = "(ADDRESS=(PROTOCOL=TCP)(HOST=db2)(PORT=1522))";
    std::vector<uint8_t> body = {0x00, static_cast<uint8_t>(text.size())};
    body.insert(body.end(), text.begin(), text.end());
    auto r = decode_redirect(UnknownBody{body});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().data, text);

    auto r2 = decode_redirect(UnknownBody{{0x00}});
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error(), TnsErrc::truncated_input);
}
