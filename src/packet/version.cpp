#include "tnsprobe/packet/version.hpp"

#include <array>
#include <charconv>

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

namespace {

struct VersionField {
  uint8_t offset;
  uint8_t width;
};

constexpr std::array<VersionField, kReleaseVersionComponents> kFields{{
  {24, 8}, // major
  {20, 4}, // maintenance
  {12, 8}, // application server
  {8, 4},  // component
  {0, 8},  // platform
}};

} // namespace

tnsprobe::Result<uint32_t> encode_release_version(std::string_view dotted) noexcept {
  uint64_t packed = 0;
  size_t index = 0;
  size_t start = 0;
  while (true) {
    size_t dot = dotted.find('.', start);
    std::string_view part = dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (index >= kFields.size() || part.empty()) {
      return make_error_code(TnsErrc::malformed_version);
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
      return make_error_code(TnsErrc::malformed_version);
    }
    const auto& f = kFields[index];
    if (value >= (1u << f.width)) {
      return make_error_code(TnsErrc::malformed_version);
    }
    packed = packet::set_bits(packed, f.offset, f.width, value);
    ++index;
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  if (index != kFields.size()) {
    return make_error_code(TnsErrc::malformed_version);
  }
  return static_cast<uint32_t>(packed);
}

std::string decode_release_version(uint32_t packed) {
  std::string out;
  for (size_t i = 0; i < kFields.size(); ++i) {
    if (i) out += '.';
    out += std::to_string(packet::extract_bits(packed, kFields[i].offset, kFields[i].width));
  }
  return out;
}

} // namespace tnsprobe::proto
