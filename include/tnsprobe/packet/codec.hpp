#pragma once

#include <span>
#include <vector>
#include <cstdint>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"
#include "tnsprobe/packet/packet.hpp"

namespace tnsprobe::proto {

// 8バイト固定ヘッダのエンコード/デコード
// チェックサムは検証せずそのまま保持する。length < 8 は invalid_length。
tnsprobe::Result<HeaderBytes> encode_header(const Header& h) noexcept;
tnsprobe::Result<Header> decode_header(std::span<const std::uint8_t> bytes) noexcept;

// ボディ単位のコーデック（bytes はヘッダー直後から header.length まで）
tnsprobe::Result<ConnectBody> decode_connect(std::span<const std::uint8_t> body) noexcept;
std::vector<std::uint8_t> encode_connect(const ConnectBody& c);

tnsprobe::Result<AcceptBody> decode_accept(std::span<const std::uint8_t> body) noexcept;
std::vector<std::uint8_t> encode_accept(const AcceptBody& a);

tnsprobe::Result<DataBody> decode_data(std::span<const std::uint8_t> body) noexcept;
std::vector<std::uint8_t> encode_data(const DataBody& d);

// type に応じたボディの選択。未知の type は UnknownBody になる（エラーではない）
tnsprobe::Result<Body> decode_body(PacketType type, std::span<const std::uint8_t> body) noexcept;
std::vector<std::uint8_t> encode_body(const Body& body);

// パケット全体
// encode_packet は length を 8 + ボディ長で上書きし、型付きボディの場合は type もボディに合わせる。
// decode_packet は header.length を超える末尾バイトを無視する。
tnsprobe::Result<std::vector<std::uint8_t>> encode_packet(const Packet& p) noexcept;
tnsprobe::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept;

} // namespace tnsprobe::proto
