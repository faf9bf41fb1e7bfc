#include "tnsprobe/packet/codec.hpp"

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

using packet::ByteReader;
using packet::append_be16;
using packet::append_bytes;
using packet::append_u8;

tnsprobe::Result<AcceptBody> decode_accept(std::span<const std::uint8_t> body) noexcept {
  ByteReader r(body, kHeaderSize);
  AcceptBody a{};
  bool ok = r.read_u16(a.version)
         && r.read_u16(a.global_service_options.raw)
         && r.read_u16(a.sdu)
         && r.read_u16(a.tdu)
         && r.read_array(a.byte_order)
         && r.read_u16(a.data_length)
         && r.read_u16(a.data_offset)
         && r.read_u8(a.connect_flags0.raw)
         && r.read_u8(a.connect_flags1.raw)
         && r.read_array(a.reserved);
  if (!ok) {
    return make_error_code(TnsErrc::truncated_input);
  }

  if (a.data_offset < r.position()) {
    return make_error_code(TnsErrc::offset_before_cursor);
  }
  if (!r.read_bytes(a.data_offset - r.position(), a.padding)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  if (!r.read_bytes(a.data_length, a.accept_data)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  return a;
}

std::vector<std::uint8_t> encode_accept(const AcceptBody& a) {
  std::vector<std::uint8_t> out;
  out.reserve(kAcceptFixedEnd - kHeaderSize + a.padding.size() + a.accept_data.size());
  append_be16(out, a.version);
  append_be16(out, a.global_service_options.raw);
  append_be16(out, a.sdu);
  append_be16(out, a.tdu);
  append_bytes(out, a.byte_order);
  append_be16(out, a.data_length);
  append_be16(out, a.data_offset);
  append_u8(out, a.connect_flags0.raw);
  append_u8(out, a.connect_flags1.raw);
  append_bytes(out, a.reserved);
  append_bytes(out, a.padding);
  append_bytes(out, a.accept_data);
  return out;
}

void update_data_fields(AcceptBody& body) noexcept {
  body.data_offset = static_cast<uint16_t>(kAcceptFixedEnd + body.padding.size());
  body.data_length = static_cast<uint16_t>(body.accept_data.size());
}

} // namespace tnsprobe::proto
