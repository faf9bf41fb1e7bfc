#include <gtest/gtest.h>

#include "tnsprobe/client/tns_probe.hpp"
#include "tnsprobe/packet/codec.hpp"
#include "tnsprobe/packet/nsn.hpp"
#include "../utils/fixtures.hpp"

using namespace tnsprobe;
using namespace tnsprobe::proto;
using tnsprobe::client::ProbeOptions;
using tnsprobe::client::TnsProbe;
using tnsprobe::test::from_hex;

class TnsProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        // キャプチャ 01. 013A-0139 と同じ Connect になる設定
        options.host = "10.1.50.14";
        options.port = 1521;
        options.service_name = "ckdb";
        options.program = "gsql";
        options.client_host = "McAfee";
        options.user = "root";
    }

    static std::vector<uint8_t> encode(const Packet& p) {
        auto r = encode_packet(p);
        EXPECT_TRUE(r.has_value());
        return r.has_value() ? r.value() : std::vector<uint8_t>{};
    }

    // サーバ側の NSN 応答 (11.2.0.2.0)
    static std::vector<uint8_t> server_nsn_reply() {
        NSNData nsn{};
        nsn.version = 0x0B200200u;
        NSNService sup{};
        sup.type = static_cast<uint16_t>(NSNServiceType::Supervisor);
        sup.values = {NSNValue::from_version(0x0B200200u), NSNValue{static_cast<uint16_t>(NSNValueType::Status), {0x00, 0x00}}};
        NSNService auth{};
        auth.type = static_cast<uint16_t>(NSNServiceType::Authentication);
        auth.values = {NSNValue::from_version(0x0B200200u), NSNValue{static_cast<uint16_t>(NSNValueType::Status), {0xFB, 0xFF}}};
        nsn.services = {sup, auth};
        auto payload = encode_nsn(nsn);
        EXPECT_TRUE(payload.has_value());

        Packet p{};
        p.body = DataBody{0, payload.value()};
        return encode(p);
    }

    static std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
        std::vector<uint8_t> out;
        for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
        return out;
    }

    ProbeOptions options;
};

TEST_F(TnsProbeTest, ConnectDescriptor) {
    EXPECT_EQ(client::build_connect_descriptor(options), test::kConnect013AString);
}

// 既定値で組み立てた Connect はキャプチャと一致する
TEST_F(TnsProbeTest, ConnectPacketMatchesCapture) {
    EXPECT_EQ(encode(client::make_connect_packet(options)), from_hex(test::kConnect013AHex));
}

// Accept -> NSN 要求 -> NSN 応答
TEST_F(TnsProbeTest, AcceptAndNegotiate) {
    MemoryStream stream(concat({from_hex(test::kAccept0139Hex), server_nsn_reply()}), 5);
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value()) << r.error().message();

    const auto& res = r.value();
    EXPECT_EQ(res.response_type, PacketType::Accept);
    EXPECT_FALSE(res.resend_seen);
    EXPECT_EQ(res.accept_version, std::optional<uint16_t>(0x0139));
    EXPECT_EQ(res.sdu, 0x0800);
    EXPECT_EQ(res.tdu, 0x7fff);
    EXPECT_TRUE(res.global_service_options.empty());
    EXPECT_EQ(res.connect_flags0, (std::vector<std::string>{"UNKNOWN_40", "UNKNOWN_20", "SERVICES_WANTED"}));
    ASSERT_TRUE(res.release_version.has_value());
    EXPECT_EQ(*res.release_version, "11.2.0.2.0");
    EXPECT_EQ(res.nsn_services, (std::vector<std::string>{"Supervisor", "Authentication"}));

    // 送信: Connect と既定の NSN 要求（キャプチャと同一）
    EXPECT_EQ(stream.written(), concat({from_hex(test::kConnect013AHex), from_hex(test::kNSNRequestHex)}));
    EXPECT_EQ(stream.remaining(), 0u);

    std::string json = client::probe_result_to_json(res);
    EXPECT_NE(json.find("\"response_type\":\"Accept\""), std::string::npos);
    EXPECT_NE(json.find("\"release_version\":\"11.2.0.2.0\""), std::string::npos);
}

// Resend には Connect を再送して応じる
TEST_F(TnsProbeTest, ResendThenAccept) {
    options.negotiate = false;
    MemoryStream stream(concat({from_hex("00 08 00 00 0b 00 00 00"), from_hex(test::kAccept0139Hex)}));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().resend_seen);
    EXPECT_EQ(r.value().response_type, PacketType::Accept);
    EXPECT_FALSE(r.value().release_version.has_value());

    auto connect = from_hex(test::kConnect013AHex);
    EXPECT_EQ(stream.written(), concat({connect, connect}));
}

// NSN ではない Data 応答は結果に含めない
TEST_F(TnsProbeTest, NonNSNReplyIgnored) {
    MemoryStream stream(concat({from_hex(test::kAccept0139Hex), from_hex(test::kDataTrivialHex)}));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().response_type, PacketType::Accept);
    EXPECT_FALSE(r.value().release_version.has_value());
}

// NSN 応答の途中で切断
TEST_F(TnsProbeTest, NegotiationTruncated) {
    MemoryStream stream(from_hex(test::kAccept0139Hex));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TnsErrc::truncated_input);
}

TEST_F(TnsProbeTest, Refuse) {
    std::string text = "(DESCRIPTION=(TMP=)(VSNNUM=186647040)(ERR=12514)(ERROR_STACK=(ERROR=(CODE=12514)(EMFI=4))))";
    std::vector<uint8_t> body = {0x22, 0x00, 0x00, static_cast<uint8_t>(text.size())};
    body.insert(body.end(), text.begin(), text.end());
    Packet refuse{};
    refuse.header.type = PacketType::Refuse;
    refuse.body = UnknownBody{body};

    MemoryStream stream(encode(refuse));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().response_type, PacketType::Refuse);
    EXPECT_EQ(r.value().refuse_user_reason, std::optional<uint8_t>(0x22));
    EXPECT_EQ(r.value().refuse_system_reason, std::optional<uint8_t>(0x00));
    EXPECT_EQ(r.value().refuse_text, text);
    EXPECT_NE(client::probe_result_to_json(r.value()).find("ERR=12514"), std::string::npos);
}

TEST_F(TnsProbeTest, Redirect) {
    std::string text = "(ADDRESS=(PROTOCOL=TCP)(HOST=10.0.0.2)(PORT=1522))";
    std::vector<uint8_t> body = {0x00, static_cast<uint8_t>(text.size())};
    body.insert(body.end(), text.begin(), text.end());
    Packet redirect{};
    redirect.header.type = PacketType::Redirect;
    redirect.body = UnknownBody{body};

    MemoryStream stream(encode(redirect));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().response_type, PacketType::Redirect);
    EXPECT_EQ(r.value().redirect_text, text);
}

// その他の type は記録だけする
TEST_F(TnsProbeTest, OtherTypeRecorded) {
    MemoryStream stream(from_hex("00 0b 00 00 0c 00 00 00 01 00 02"));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().response_type, PacketType::Marker);
}

TEST_F(TnsProbeTest, ConnectReplyIsUnexpected) {
    MemoryStream stream(from_hex(test::kConnect138aHex));
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TnsErrc::unexpected_packet);
}

TEST_F(TnsProbeTest, NoReply) {
    MemoryStream stream;
    TnsProbe probe(options);
    auto r = probe.run(stream);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TnsErrc::truncated_input);
    EXPECT_EQ(stream.written(), from_hex(test::kConnect013AHex));
}

// ConfigLoader からの読み込み
TEST_F(TnsProbeTest, OptionsFromConfig) {
    utils::ConfigLoader config;
    config.set("host", std::string("db.example"));
    config.set("port", std::string("1522"));
    config.set("timeout_ms", std::string("250"));
    config.set("tns_version", std::string("0x139"));
    config.set("negotiate", std::string("no"));
    config.set("service_name", std::string("ORCL"));

    auto r = ProbeOptions::from_config(config);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().host, "db.example");
    EXPECT_EQ(r.value().port, 1522);
    EXPECT_EQ(r.value().timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(r.value().tns_version, 0x139);
    EXPECT_EQ(r.value().min_tns_version, 0x12c);
    EXPECT_FALSE(r.value().negotiate);
    EXPECT_EQ(r.value().service_name, "ORCL");
    EXPECT_EQ(r.value().release_version, "10.2.0.3.0");
}

TEST_F(TnsProbeTest, OptionsFromConfigErrors) {
    utils::ConfigLoader bad_version;
    bad_version.set("release_version", std::string("10.2"));
    auto r = ProbeOptions::from_config(bad_version);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TnsErrc::malformed_version);

    utils::ConfigLoader bad_port;
    bad_port.set("port", int64_t{70000});
    auto r2 = ProbeOptions::from_config(bad_port);
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error(), TnsErrc::invalid_length);
}
