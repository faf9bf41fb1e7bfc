#pragma once

#include <system_error>
#include <utility>
#include <variant>

namespace tnsprobe {

/**
 * @brief 値またはエラーコードのどちらか一方を保持する戻り値型
 *
 * 失敗時に部分的な値は持たない。
 */
template<typename T>
class Result {
public:
  Result(const T& value) : state_(std::in_place_index<0>, value) {}
  Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
  Result(std::error_code ec) : state_(std::in_place_index<1>, ec) {}

  bool has_value() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  // has_value() が false のときに呼ぶと std::bad_variant_access
  const T& value() const { return std::get<0>(state_); }
  T& value() { return std::get<0>(state_); }

  T value_or(T fallback) const {
    return has_value() ? std::get<0>(state_) : std::move(fallback);
  }

  // 成功時は空の error_code
  std::error_code error() const noexcept {
    return has_value() ? std::error_code{} : *std::get_if<1>(&state_);
  }

private:
  std::variant<T, std::error_code> state_;
};

} // namespace tnsprobe
