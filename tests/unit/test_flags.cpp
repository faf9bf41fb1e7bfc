#include <gtest/gtest.h>
#include "tnsprobe/packet/types.hpp"

using namespace tnsprobe::proto;

class FlagSetTest : public ::testing::Test {};

// 0x0c41 = HEADER_CHECKSUM | FULL_DUPLEX | 0x0040 | 0x0001
TEST_F(FlagSetTest, ServiceOptionsNames) {
    ServiceOptions so(0x0c41);
    EXPECT_TRUE(so.has(ServiceOption::HeaderChecksum));
    EXPECT_TRUE(so.has(ServiceOption::FullDuplex));
    EXPECT_TRUE(so.has(ServiceOption::Unknown0040));
    EXPECT_TRUE(so.has(ServiceOption::Unknown0001));
    EXPECT_FALSE(so.has(ServiceOption::HalfDuplex));

    std::vector<std::string> expected = {"HEADER_CHECKSUM", "FULL_DUPLEX", "UNKNOWN_0040", "UNKNOWN_0001"};
    EXPECT_EQ(so.names(), expected);
}

TEST_F(FlagSetTest, BuildFromEnumerators) {
    ServiceOptions so = ServiceOptions{} | ServiceOption::HeaderChecksum | ServiceOption::FullDuplex
                      | ServiceOption::Unknown0040 | ServiceOption::Unknown0001;
    EXPECT_EQ(so.raw, 0x0c41);

    so.clear(ServiceOption::Unknown0040);
    EXPECT_EQ(so.raw, 0x0c01);
    so.set(ServiceOption::Unknown0040);
    EXPECT_EQ(so, ServiceOptions(0x0c41));
}

// 0x7F08 と 0x860e は既知ビットだけで構成される
TEST_F(FlagSetTest, ProtocolCharacteristicsNames) {
    ProtocolCharacteristics a(0x7F08);
    std::vector<std::string> expected_a = {
        "CONFIRMED_RELEASE", "TDU_BASED_IO", "SPAWNER_RUNNING", "DATA_TEST",
        "CALLBACK_IO", "ASYNC_IO", "PACKET_IO", "GENERATE_SIGURG"};
    EXPECT_EQ(a.names(), expected_a);

    ProtocolCharacteristics b = ProtocolCharacteristics{} | ProtocolCharacteristic::Hangon
        | ProtocolCharacteristic::CallbackIO | ProtocolCharacteristic::AsyncIO
        | ProtocolCharacteristic::GenerateSIGURG | ProtocolCharacteristic::UrgentIO
        | ProtocolCharacteristic::FullDuplex;
    EXPECT_EQ(b.raw, 0x860e);
}

TEST_F(FlagSetTest, ConnectFlagsNames) {
    ConnectFlags f(0x41);
    EXPECT_TRUE(f.has(ConnectFlag::ServicesWanted));
    EXPECT_TRUE(f.has(ConnectFlag::Unknown40));
    std::vector<std::string> expected = {"UNKNOWN_40", "SERVICES_WANTED"};
    EXPECT_EQ(f.names(), expected);

    ConnectFlags g(0x61);
    EXPECT_EQ(g.names().size(), 3u);
    EXPECT_EQ(static_cast<uint8_t>(ConnectFlag::ServicesWanted), 0x01);
}

// 名前のないビットも保持され、エンコード値は raw のまま
TEST_F(FlagSetTest, NSNOptionsKeepRawBits) {
    NSNOptions o(0x80);
    EXPECT_EQ(o.raw, 0x80);
    std::vector<std::string> expected = {"UNKNOWN_80"};
    EXPECT_EQ(o.names(), expected);
    EXPECT_TRUE(NSNOptions{}.names().empty());
}

TEST_F(FlagSetTest, PacketTypeNames) {
    EXPECT_EQ(packet_type_name(PacketType::Connect), "Connect");
    EXPECT_EQ(packet_type_name(PacketType::Resend), "Resend");
    EXPECT_EQ(packet_type_name(static_cast<PacketType>(0xFF)), "Unknown");
}
