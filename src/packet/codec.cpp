#include "tnsprobe/packet/codec.hpp"

#include <limits>

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

using packet::read_be16;
using packet::write_be16;

namespace {

struct BodyTypeOf {
  PacketType fallback;
  PacketType operator()(const ConnectBody&) const noexcept { return PacketType::Connect; }
  PacketType operator()(const AcceptBody&) const noexcept { return PacketType::Accept; }
  PacketType operator()(const DataBody&) const noexcept { return PacketType::Data; }
  PacketType operator()(const UnknownBody&) const noexcept { return fallback; }
};

} // namespace

tnsprobe::Result<HeaderBytes> encode_header(const Header& h) noexcept {
  if (h.length < kHeaderSize) {
    return make_error_code(TnsErrc::invalid_length);
  }
  HeaderBytes out{};
  write_be16(out.data() + 0, h.length);
  write_be16(out.data() + 2, h.packet_checksum);
  out[4] = static_cast<uint8_t>(h.type);
  out[5] = h.flags;
  write_be16(out.data() + 6, h.header_checksum);
  return out;
}

tnsprobe::Result<Header> decode_header(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() < kHeaderSize) {
    return make_error_code(TnsErrc::truncated_input);
  }
  Header h{};
  h.length = read_be16(bytes.data() + 0);
  h.packet_checksum = read_be16(bytes.data() + 2);
  h.type = static_cast<PacketType>(bytes[4]);
  h.flags = bytes[5];
  h.header_checksum = read_be16(bytes.data() + 6);
  if (h.length < kHeaderSize) {
    return make_error_code(TnsErrc::invalid_length);
  }
  return h;
}

tnsprobe::Result<Body> decode_body(PacketType type, std::span<const std::uint8_t> body) noexcept {
  switch (type) {
    case PacketType::Connect: {
      auto r = decode_connect(body);
      if (!r) return r.error();
      return Body{std::move(r.value())};
    }
    case PacketType::Accept: {
      auto r = decode_accept(body);
      if (!r) return r.error();
      return Body{std::move(r.value())};
    }
    case PacketType::Data: {
      auto r = decode_data(body);
      if (!r) return r.error();
      return Body{std::move(r.value())};
    }
    default:
      return Body{UnknownBody{std::vector<std::uint8_t>(body.begin(), body.end())}};
  }
}

std::vector<std::uint8_t> encode_body(const Body& body) {
  struct Encoder {
    std::vector<std::uint8_t> operator()(const ConnectBody& c) const { return encode_connect(c); }
    std::vector<std::uint8_t> operator()(const AcceptBody& a) const { return encode_accept(a); }
    std::vector<std::uint8_t> operator()(const DataBody& d) const { return encode_data(d); }
    std::vector<std::uint8_t> operator()(const UnknownBody& u) const { return u.bytes; }
  };
  return std::visit(Encoder{}, body);
}

tnsprobe::Result<std::vector<std::uint8_t>> encode_packet(const Packet& p) noexcept {
  // ボディを先に組み立て、その長さでヘッダーを確定する
  std::vector<std::uint8_t> body = encode_body(p.body);
  if (body.size() > std::numeric_limits<uint16_t>::max() - kHeaderSize) {
    return make_error_code(TnsErrc::invalid_length);
  }
  Header h = p.header;
  h.length = static_cast<uint16_t>(kHeaderSize + body.size());
  h.type = std::visit(BodyTypeOf{p.header.type}, p.body);

  auto hbytes_res = encode_header(h);
  if (!hbytes_res) return hbytes_res.error();
  std::vector<std::uint8_t> out;
  out.reserve(h.length);
  const auto& hb = hbytes_res.value();
  out.insert(out.end(), hb.begin(), hb.end());
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

tnsprobe::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept {
  auto h_res = decode_header(bytes);
  if (!h_res) return h_res.error();
  Packet p{};
  p.header = h_res.value();
  if (bytes.size() < p.header.length) {
    return make_error_code(TnsErrc::truncated_input);
  }
  auto body_res = decode_body(p.header.type, bytes.subspan(kHeaderSize, p.header.length - kHeaderSize));
  if (!body_res) return body_res.error();
  p.body = std::move(body_res.value());
  return p;
}

} // namespace tnsprobe::proto
