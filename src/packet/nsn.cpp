#include "tnsprobe/packet/nsn.hpp"

#include <limits>

#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::proto {

using packet::ByteReader;

std::string_view nsn_service_name(uint16_t type) noexcept {
  switch (static_cast<NSNServiceType>(type)) {
    case NSNServiceType::Authentication: return "Authentication";
    case NSNServiceType::Encryption: return "Encryption";
    case NSNServiceType::DataIntegrity: return "DataIntegrity";
    case NSNServiceType::Supervisor: return "Supervisor";
    default: return "Unknown";
  }
}

NSNValue NSNValue::from_version(uint32_t packed) {
  NSNValue v{};
  v.type = static_cast<uint16_t>(NSNValueType::Version);
  v.value.resize(4);
  packet::write_be32(v.value.data(), packed);
  return v;
}

NSNValue NSNValue::from_bytes(std::vector<std::uint8_t> bytes) {
  NSNValue v{};
  v.type = static_cast<uint16_t>(NSNValueType::Bytes);
  v.value = std::move(bytes);
  return v;
}

NSNValue NSNValue::from_string(std::string_view text) {
  NSNValue v{};
  v.type = static_cast<uint16_t>(NSNValueType::String);
  v.value.assign(text.begin(), text.end());
  return v;
}

std::optional<uint32_t> NSNValue::as_version() const noexcept {
  if (!is_version() || value.size() != 4) return std::nullopt;
  return packet::read_be32(value.data());
}

tnsprobe::Result<NSNData> decode_nsn(std::span<const std::uint8_t> payload) noexcept {
  ByteReader head(payload);
  uint32_t marker = 0;
  uint16_t length = 0;
  if (!head.read_u32(marker)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  if (marker != kNSNMarker) {
    return make_error_code(TnsErrc::bad_nsn_marker);
  }
  if (!head.read_u16(length)) {
    return make_error_code(TnsErrc::truncated_input);
  }
  if (length < kNSNHeaderSize) {
    return make_error_code(TnsErrc::invalid_length);
  }
  if (length > payload.size()) {
    return make_error_code(TnsErrc::truncated_input);
  }

  // 以降は宣言長の範囲内だけを読む
  ByteReader r(payload.subspan(head.position(), length - head.position()), head.position());

  NSNData nsn{};
  uint16_t service_count = 0;
  if (!r.read_u32(nsn.version) || !r.read_u16(service_count) || !r.read_u8(nsn.options.raw)) {
    return make_error_code(TnsErrc::truncated_input);
  }

  nsn.services.reserve(service_count);
  for (uint16_t i = 0; i < service_count; ++i) {
    NSNService svc{};
    uint16_t value_count = 0;
    if (!r.read_u16(svc.type) || !r.read_u16(value_count) || !r.read_u32(svc.marker)) {
      return make_error_code(TnsErrc::truncated_input);
    }
    svc.values.reserve(value_count);
    for (uint16_t j = 0; j < value_count; ++j) {
      NSNValue v{};
      uint16_t value_length = 0;
      if (!r.read_u16(value_length) || !r.read_u16(v.type)) {
        return make_error_code(TnsErrc::truncated_input);
      }
      if (v.is_version() && value_length != 4) {
        return make_error_code(TnsErrc::malformed_version);
      }
      if (!r.read_bytes(value_length, v.value)) {
        return make_error_code(TnsErrc::truncated_input);
      }
      svc.values.push_back(std::move(v));
    }
    nsn.services.push_back(std::move(svc));
  }
  return nsn;
}

tnsprobe::Result<std::vector<std::uint8_t>> encode_nsn(const NSNData& nsn) noexcept {
  constexpr size_t kMax = std::numeric_limits<uint16_t>::max();
  if (nsn.services.size() > kMax) {
    return make_error_code(TnsErrc::invalid_length);
  }

  std::vector<std::uint8_t> out;
  packet::append_be32(out, kNSNMarker);
  packet::append_be16(out, 0); // length は最後に埋める
  packet::append_be32(out, nsn.version);
  packet::append_be16(out, static_cast<uint16_t>(nsn.services.size()));
  packet::append_u8(out, nsn.options.raw);

  for (const auto& svc : nsn.services) {
    if (svc.values.size() > kMax) {
      return make_error_code(TnsErrc::invalid_length);
    }
    packet::append_be16(out, svc.type);
    packet::append_be16(out, static_cast<uint16_t>(svc.values.size()));
    packet::append_be32(out, svc.marker);
    for (const auto& v : svc.values) {
      if (v.value.size() > kMax) {
        return make_error_code(TnsErrc::invalid_length);
      }
      if (v.is_version() && v.value.size() != 4) {
        return make_error_code(TnsErrc::malformed_version);
      }
      packet::append_be16(out, static_cast<uint16_t>(v.value.size()));
      packet::append_be16(out, v.type);
      packet::append_bytes(out, v.value);
    }
  }

  if (out.size() > kMax) {
    return make_error_code(TnsErrc::invalid_length);
  }
  packet::write_be16(out.data() + 4, static_cast<uint16_t>(out.size()));
  return out;
}

NSNData make_default_nsn_request(uint32_t release_version) {
  NSNData nsn{};
  nsn.version = release_version;

  // Supervisor: CID と、要求するサービス番号の配列 {4, 1, 2, 3}
  NSNService supervisor{};
  supervisor.type = static_cast<uint16_t>(NSNServiceType::Supervisor);
  supervisor.values = {
    NSNValue::from_version(release_version),
    NSNValue::from_bytes({0x00, 0x00, 0x04, 0xEC, 0x19, 0x2C, 0x7B, 0x4C}),
    NSNValue::from_bytes({0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x03, 0x00, 0x00, 0x00, 0x04,
                          0x00, 0x04, 0x00, 0x01, 0x00, 0x01, 0x00, 0x02}),
  };

  NSNService auth{};
  auth.type = static_cast<uint16_t>(NSNServiceType::Authentication);
  auth.values = {
    NSNValue::from_version(release_version),
    NSNValue{static_cast<uint16_t>(NSNValueType::UB2), {0xE0, 0xE1}},
    NSNValue{static_cast<uint16_t>(NSNValueType::Status), {0xFC, 0xFF}},
    NSNValue{static_cast<uint16_t>(NSNValueType::UB1), {0x01}},
    NSNValue::from_string("NTS"),
  };

  // 暗号化アルゴリズム ID の一覧
  NSNService encryption{};
  encryption.type = static_cast<uint16_t>(NSNServiceType::Encryption);
  encryption.values = {
    NSNValue::from_version(release_version),
    NSNValue::from_bytes({0x00, 0x11, 0x06, 0x10, 0x0C, 0x0F, 0x0A, 0x0B, 0x08, 0x02, 0x01, 0x03}),
  };

  NSNService integrity{};
  integrity.type = static_cast<uint16_t>(NSNServiceType::DataIntegrity);
  integrity.values = {
    NSNValue::from_version(release_version),
    NSNValue::from_bytes({0x00, 0x03, 0x01}),
  };

  nsn.services = {std::move(supervisor), std::move(auth), std::move(encryption), std::move(integrity)};
  return nsn;
}

} // namespace tnsprobe::proto
