#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tnsprobe::proto {

// ヘッダーの type フィールド。未知の値もそのまま保持できる。
enum class PacketType : uint8_t {
  Connect = 1,
  Accept = 2,
  Acknowledge = 3,
  Refuse = 4,
  Redirect = 5,
  Data = 6,
  Null = 7,
  Abort = 9,
  Resend = 11,
  Marker = 12,
  Attention = 13,
  Control = 14,
};

std::string_view packet_type_name(PacketType t) noexcept;

// グローバルサービスオプション（Connect/Accept, 16 bits）
enum class ServiceOption : uint16_t {
  Unknown8000 = 0x8000,
  Unknown4000 = 0x4000,
  BrokenConnectNotify = 0x2000,
  PacketChecksum = 0x1000,
  HeaderChecksum = 0x0800,
  FullDuplex = 0x0400,
  HalfDuplex = 0x0200,
  Unknown0100 = 0x0100,
  Unknown0080 = 0x0080,
  Unknown0040 = 0x0040,
  Unknown0020 = 0x0020,
  DirectIO = 0x0010,
  AttentionProcessing = 0x0008,
  CanReceiveAttention = 0x0004,
  CanSendAttention = 0x0002,
  Unknown0001 = 0x0001,
};

// NT プロトコル特性（Connect, 16 bits）
enum class ProtocolCharacteristic : uint16_t {
  Hangon = 0x8000,
  ConfirmedRelease = 0x4000,
  TDUBasedIO = 0x2000,
  SpawnerRunning = 0x1000,
  DataTest = 0x0800,
  CallbackIO = 0x0400,
  AsyncIO = 0x0200,
  PacketIO = 0x0100,
  CanGrant = 0x0080,
  CanHandoff = 0x0040,
  GenerateSIGIO = 0x0020,
  GenerateSIGPIPE = 0x0010,
  GenerateSIGURG = 0x0008,
  UrgentIO = 0x0004,
  FullDuplex = 0x0002,
  TestOperation = 0x0001,
};

// 接続フラグ（Connect/Accept, 8 bits）
enum class ConnectFlag : uint8_t {
  Unknown80 = 0x80,
  Unknown40 = 0x40,
  Unknown20 = 0x20,
  Unknown10 = 0x10,
  INAEnabled = 0x08,
  INAWanted = 0x04,
  ServicesEnabled = 0x02,
  ServicesWanted = 0x01,
};

// NSN オプション（8 bits）。意味の判明しているビットはない。
enum class NSNOption : uint8_t {};

std::string_view flag_name(ServiceOption f) noexcept;
std::string_view flag_name(ProtocolCharacteristic f) noexcept;
std::string_view flag_name(ConnectFlag f) noexcept;
std::string_view flag_name(NSNOption f) noexcept;

/**
 * @brief 生の整数値を正とするビットフラグ集合
 *
 * エンコードには raw のみを使う。names() は診断用の派生ビューで、
 * 名前のないビットは "UNKNOWN_xxxx" として列挙する。
 */
template<typename Bit>
struct FlagSet {
  using raw_type = std::underlying_type_t<Bit>;

  raw_type raw = 0;

  constexpr FlagSet() noexcept = default;
  constexpr FlagSet(raw_type value) noexcept : raw(value) {}

  constexpr bool has(Bit b) const noexcept {
    return (raw & static_cast<raw_type>(b)) == static_cast<raw_type>(b);
  }

  constexpr FlagSet& set(Bit b) noexcept {
    raw = static_cast<raw_type>(raw | static_cast<raw_type>(b));
    return *this;
  }

  constexpr FlagSet& clear(Bit b) noexcept {
    raw = static_cast<raw_type>(raw & ~static_cast<raw_type>(b));
    return *this;
  }

  // 上位ビットから順に列挙
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    constexpr int width = static_cast<int>(sizeof(raw_type) * 8);
    for (int i = width - 1; i >= 0; --i) {
      const auto mask = static_cast<raw_type>(raw_type{1} << i);
      if ((raw & mask) == 0) continue;
      std::string_view name = flag_name(static_cast<Bit>(mask));
      if (!name.empty()) {
        out.emplace_back(name);
      } else {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "UNKNOWN_%0*X", static_cast<int>(sizeof(raw_type) * 2),
                      static_cast<unsigned>(mask));
        out.emplace_back(buf);
      }
    }
    return out;
  }

  friend constexpr bool operator==(const FlagSet& a, const FlagSet& b) noexcept { return a.raw == b.raw; }
};

template<typename Bit>
constexpr FlagSet<Bit> operator|(FlagSet<Bit> a, Bit b) noexcept { return a.set(b); }

using ServiceOptions = FlagSet<ServiceOption>;
using ProtocolCharacteristics = FlagSet<ProtocolCharacteristic>;
using ConnectFlags = FlagSet<ConnectFlag>;
using NSNOptions = FlagSet<NSNOption>;

} // namespace tnsprobe::proto
