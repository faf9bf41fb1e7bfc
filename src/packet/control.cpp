#include "tnsprobe/packet/control.hpp"

#include <vector>

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

tnsprobe::Result<RefuseInfo> decode_refuse(const UnknownBody& body) noexcept {
  packet::ByteReader r(body.bytes, kHeaderSize);
  RefuseInfo info{};
  uint16_t data_length = 0;
  std::vector<std::uint8_t> data;
  if (!r.read_u8(info.user_reason) || !r.read_u8(info.system_reason)
      || !r.read_u16(data_length) || !r.read_bytes(data_length, data)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  info.data.assign(data.begin(), data.end());
  return info;
}

tnsprobe::Result<RedirectInfo> decode_redirect(const UnknownBody& body) noexcept {
  packet::ByteReader r(body.bytes, kHeaderSize);
  RedirectInfo info{};
  uint16_t data_length = 0;
  std::vector<std::uint8_t> data;
  if (!r.read_u16(data_length) || !r.read_bytes(data_length, data)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  info.data.assign(data.begin(), data.end());
  return info;
}

} // namespace tnsprobe::proto
