#pragma once

#include <cstdint>
#include <string>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"
#include "tnsprobe/packet/packet.hpp"

namespace tnsprobe::proto {

// Refuse (type 4) ボディ
struct RefuseInfo {
  uint8_t user_reason = 0;
  uint8_t system_reason = 0;
  std::string data;   // 通常は (DESCRIPTION=(ERR=...)...) 形式

  friend bool operator==(const RefuseInfo&, const RefuseInfo&) = default;
};

// Redirect (type 5) ボディ
struct RedirectInfo {
  std::string data;

  friend bool operator==(const RedirectInfo&, const RedirectInfo&) = default;
};

tnsprobe::Result<RefuseInfo> decode_refuse(const UnknownBody& body) noexcept;
tnsprobe::Result<RedirectInfo> decode_redirect(const UnknownBody& body) noexcept;

} // namespace tnsprobe::proto
