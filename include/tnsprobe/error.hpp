#pragma once

#include <string>
#include <system_error>

namespace tnsprobe {

enum class TnsErrc {
  ok = 0,
  truncated_input = 1,
  invalid_length = 2,
  offset_before_cursor = 3,
  malformed_version = 4,
  bad_nsn_marker = 5,
  io_error = 6,
  timeout = 7,
  connection_closed = 8,
  unexpected_packet = 9,
};

class TnsErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "tnsprobe"; }
  std::string message(int ev) const override {
    switch (static_cast<TnsErrc>(ev)) {
      case TnsErrc::ok: return "ok";
      case TnsErrc::truncated_input: return "truncated input";
      case TnsErrc::invalid_length: return "invalid length";
      case TnsErrc::offset_before_cursor: return "data offset points before cursor";
      case TnsErrc::malformed_version: return "malformed release version";
      case TnsErrc::bad_nsn_marker: return "missing negotiation marker";
      case TnsErrc::io_error: return "I/O error";
      case TnsErrc::timeout: return "timeout";
      case TnsErrc::connection_closed: return "connection closed";
      case TnsErrc::unexpected_packet: return "unexpected packet";
      default: return "unknown error";
    }
  }
};

inline const std::error_category& tns_error_category() {
  static TnsErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(TnsErrc e) {
  return {static_cast<int>(e), tns_error_category()};
}

} // namespace tnsprobe

namespace std {
template<> struct is_error_code_enum<tnsprobe::TnsErrc> : true_type {};
}
