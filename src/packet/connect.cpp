#include "tnsprobe/packet/codec.hpp"

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

using packet::ByteReader;
using packet::append_be16;
using packet::append_be32;
using packet::append_bytes;
using packet::append_u8;

tnsprobe::Result<ConnectBody> decode_connect(std::span<const std::uint8_t> body) noexcept {
  // data_offset はパケット先頭基準なので、カーソルもヘッダー長から数える
  ByteReader r(body, kHeaderSize);
  ConnectBody c{};
  bool ok = r.read_u16(c.version)
         && r.read_u16(c.min_version)
         && r.read_u16(c.global_service_options.raw)
         && r.read_u16(c.sdu)
         && r.read_u16(c.tdu)
         && r.read_u16(c.protocol_characteristics.raw)
         && r.read_u16(c.max_before_ack)
         && r.read_array(c.byte_order)
         && r.read_u16(c.data_length)
         && r.read_u16(c.data_offset)
         && r.read_u32(c.max_response_size)
         && r.read_u8(c.connect_flags0.raw)
         && r.read_u8(c.connect_flags1.raw)
         && r.read_u32(c.cross_facility0)
         && r.read_u32(c.cross_facility1)
         && r.read_array(c.connection_id0)
         && r.read_array(c.connection_id1);
  if (!ok) {
    return make_error_code(TnsErrc::truncated_input);
  }

  if (c.data_offset < r.position()) {
    return make_error_code(TnsErrc::offset_before_cursor);
  }
  if (!r.read_bytes(c.data_offset - r.position(), c.padding)) {
    return make_error_code(TnsErrc::truncated_input);
  }

  std::vector<std::uint8_t> str;
  if (!r.read_bytes(c.data_length, str)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  c.connection_string.assign(str.begin(), str.end());
  // data_length 以降の残りバイトは無視する
  return c;
}

std::vector<std::uint8_t> encode_connect(const ConnectBody& c) {
  std::vector<std::uint8_t> out;
  out.reserve(kConnectFixedEnd - kHeaderSize + c.padding.size() + c.connection_string.size());
  append_be16(out, c.version);
  append_be16(out, c.min_version);
  append_be16(out, c.global_service_options.raw);
  append_be16(out, c.sdu);
  append_be16(out, c.tdu);
  append_be16(out, c.protocol_characteristics.raw);
  append_be16(out, c.max_before_ack);
  append_bytes(out, c.byte_order);
  append_be16(out, c.data_length);
  append_be16(out, c.data_offset);
  append_be32(out, c.max_response_size);
  append_u8(out, c.connect_flags0.raw);
  append_u8(out, c.connect_flags1.raw);
  append_be32(out, c.cross_facility0);
  append_be32(out, c.cross_facility1);
  append_bytes(out, c.connection_id0);
  append_bytes(out, c.connection_id1);
  append_bytes(out, c.padding);
  out.insert(out.end(), c.connection_string.begin(), c.connection_string.end());
  return out;
}

void update_data_fields(ConnectBody& body) noexcept {
  body.data_offset = static_cast<uint16_t>(kConnectFixedEnd + body.padding.size());
  body.data_length = static_cast<uint16_t>(body.connection_string.size());
}

} // namespace tnsprobe::proto
