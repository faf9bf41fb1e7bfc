#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tnsprobe/packet/types.hpp"

namespace tnsprobe::proto {

// 基本ヘッダー 8バイト（全フィールド big-endian）
struct Header {
  uint16_t length = 0;            // ヘッダー込みのパケット全長
  uint16_t packet_checksum = 0;   // 検証しない（そのまま保持）
  PacketType type = PacketType::Data;
  uint8_t flags = 0;
  uint16_t header_checksum = 0;   // 検証しない（そのまま保持）

  friend bool operator==(const Header&, const Header&) = default;
};

constexpr size_t kHeaderSize = 8u;
using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;

using ByteOrderMarker = std::array<std::uint8_t, 2>;
inline constexpr ByteOrderMarker kDefaultByteOrder{0x01, 0x00};

// Connect 固定フィールドの終端（パケット先頭からのオフセット）
constexpr size_t kConnectFixedEnd = 0x3Au;
// Accept 固定フィールドの終端（パケット先頭からのオフセット）
constexpr size_t kAcceptFixedEnd = 0x20u;

struct ConnectBody {
  uint16_t version = 0;
  uint16_t min_version = 0;
  ServiceOptions global_service_options{};
  uint16_t sdu = 0;
  uint16_t tdu = 0;
  ProtocolCharacteristics protocol_characteristics{};
  uint16_t max_before_ack = 0;
  ByteOrderMarker byte_order = kDefaultByteOrder;
  uint16_t data_length = 0;   // connection_string の長さ
  uint16_t data_offset = 0;   // connection_string の開始位置（パケット先頭から）
  uint32_t max_response_size = 0;
  ConnectFlags connect_flags0{};
  ConnectFlags connect_flags1{};
  uint32_t cross_facility0 = 0;
  uint32_t cross_facility1 = 0;
  std::array<std::uint8_t, 8> connection_id0{};
  std::array<std::uint8_t, 8> connection_id1{};
  std::vector<std::uint8_t> padding;   // 固定フィールド終端から data_offset まで
  std::string connection_string;

  friend bool operator==(const ConnectBody&, const ConnectBody&) = default;
};

struct AcceptBody {
  uint16_t version = 0;
  ServiceOptions global_service_options{};
  uint16_t sdu = 0;
  uint16_t tdu = 0;
  ByteOrderMarker byte_order = kDefaultByteOrder;
  uint16_t data_length = 0;
  uint16_t data_offset = 0;
  ConnectFlags connect_flags0{};
  ConnectFlags connect_flags1{};
  std::array<std::uint8_t, 8> reserved{};
  std::vector<std::uint8_t> padding;   // 0x20 から data_offset まで
  std::vector<std::uint8_t> accept_data;

  friend bool operator==(const AcceptBody&, const AcceptBody&) = default;
};

struct DataBody {
  uint16_t data_flags = 0;
  std::vector<std::uint8_t> payload;

  friend bool operator==(const DataBody&, const DataBody&) = default;
};

// 型付きボディを持たないパケット（Refuse, Resend, 未知の type など）
struct UnknownBody {
  std::vector<std::uint8_t> bytes;

  friend bool operator==(const UnknownBody&, const UnknownBody&) = default;
};

using Body = std::variant<ConnectBody, AcceptBody, DataBody, UnknownBody>;

struct Packet {
  Header header{};
  Body body{UnknownBody{}};

  friend bool operator==(const Packet&, const Packet&) = default;
};

/**
 * @brief data_length / data_offset を現在の padding と文字列から再計算する
 *
 * デコーダ・エンコーダはこれらのフィールドを再計算しない。
 * パケットを組み立てる側が明示的に呼び出す。
 */
void update_data_fields(ConnectBody& body) noexcept;
void update_data_fields(AcceptBody& body) noexcept;

} // namespace tnsprobe::proto
