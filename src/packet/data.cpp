#include "tnsprobe/packet/codec.hpp"

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

tnsprobe::Result<DataBody> decode_data(std::span<const std::uint8_t> body) noexcept {
  packet::ByteReader r(body, kHeaderSize);
  DataBody d{};
  if (!r.read_u16(d.data_flags)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  // ペイロードは解釈しない（NSN は decode_nsn を明示的に呼ぶ）
  auto rest = r.rest();
  d.payload.assign(rest.begin(), rest.end());
  return d;
}

std::vector<std::uint8_t> encode_data(const DataBody& d) {
  std::vector<std::uint8_t> out;
  out.reserve(2 + d.payload.size());
  packet::append_be16(out, d.data_flags);
  packet::append_bytes(out, d.payload);
  return out;
}

} // namespace tnsprobe::proto
