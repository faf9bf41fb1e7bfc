#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"
#include "tnsprobe/packet/types.hpp"

namespace tnsprobe::proto {

// Data ペイロード先頭のネゴシエーション開始マーカー
inline constexpr uint32_t kNSNMarker = 0xDEADBEEFu;
// marker(4) + length(2) + version(4) + service_count(2) + options(1)
inline constexpr size_t kNSNHeaderSize = 13u;
// type(2) + value_count(2) + marker(4)
inline constexpr size_t kNSNServiceHeaderSize = 8u;
// length(2) + type(2)
inline constexpr size_t kNSNValueHeaderSize = 4u;

enum class NSNServiceType : uint16_t {
  Authentication = 1,
  Encryption = 2,
  DataIntegrity = 3,
  Supervisor = 4,
};

enum class NSNValueType : uint16_t {
  String = 0,
  Bytes = 1,
  UB1 = 2,
  UB2 = 3,
  UB4 = 4,
  Version = 5,
  Status = 6,
};

std::string_view nsn_service_name(uint16_t type) noexcept;

struct NSNValue {
  uint16_t type = 0;
  std::vector<std::uint8_t> value;

  static NSNValue from_version(uint32_t packed);
  static NSNValue from_bytes(std::vector<std::uint8_t> bytes);
  static NSNValue from_string(std::string_view text);

  bool is_version() const noexcept { return type == static_cast<uint16_t>(NSNValueType::Version); }
  std::optional<uint32_t> as_version() const noexcept;

  friend bool operator==(const NSNValue&, const NSNValue&) = default;
};

struct NSNService {
  uint16_t type = 0;
  std::vector<NSNValue> values;   // 順序はネゴシエーションの優先度
  uint32_t marker = 0;

  friend bool operator==(const NSNService&, const NSNService&) = default;
};

struct NSNData {
  uint32_t version = 0;   // encode_release_version 形式
  NSNOptions options{};
  std::vector<NSNService> services;

  friend bool operator==(const NSNData&, const NSNData&) = default;
};

/**
 * @brief Data ペイロードを NSN 構造としてデコードする
 *
 * 宣言長を超えるペイロード末尾は無視する。
 * @return マーカー不一致は bad_nsn_marker、途中終端は truncated_input、
 *         宣言長が固定部より短い場合は invalid_length、
 *         4バイトでないバージョン値は malformed_version
 */
tnsprobe::Result<NSNData> decode_nsn(std::span<const std::uint8_t> payload) noexcept;

/**
 * @brief NSN 構造をエンコードする（length は計算して埋める）
 * @return 全長・要素数が 16 bit に収まらない場合は invalid_length
 */
tnsprobe::Result<std::vector<std::uint8_t>> encode_nsn(const NSNData& nsn) noexcept;

/**
 * @brief クライアント側の標準的なネゴシエーション要求
 *
 * Supervisor, Authentication, Encryption, DataIntegrity の4サービスを
 * この順で含む。
 */
NSNData make_default_nsn_request(uint32_t release_version);

} // namespace tnsprobe::proto
