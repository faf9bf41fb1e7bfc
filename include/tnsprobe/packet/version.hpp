#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"

namespace tnsprobe::proto {

// "10.2.0.3.0" <-> 0x0A200300
// ビット配置（MSB側から）: 8 / 4 / 8 / 4 / 8
inline constexpr int kReleaseVersionComponents = 5;

/**
 * @brief ドット区切り5要素のリリースバージョンを4バイト整数に詰める
 * @return 要素数不正・非数値・ビット幅超過時は TnsErrc::malformed_version
 */
tnsprobe::Result<uint32_t> encode_release_version(std::string_view dotted) noexcept;

/**
 * @brief 4バイト整数をドット区切りのリリースバージョンに展開する
 */
std::string decode_release_version(uint32_t packed);

} // namespace tnsprobe::proto
