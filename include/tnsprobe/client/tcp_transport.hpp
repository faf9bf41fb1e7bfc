#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "tnsprobe/packet/stream.hpp"
#include "tnsprobe/utils/log_config.hpp"

namespace tnsprobe::client {

/**
 * @brief POSIX TCP クライアントソケット
 *
 * 受信・送信タイムアウトは SO_RCVTIMEO / SO_SNDTIMEO で設定する。
 * 受信タイムアウトは TnsErrc::timeout、その他のソケットエラーは io_error になる。
 * ソケットはデストラクタで閉じる。
 */
class TcpTransport final : public proto::ByteStream {
public:
  TcpTransport();
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;
  TcpTransport(TcpTransport&& other) noexcept;
  TcpTransport& operator=(TcpTransport&& other) noexcept;

  /**
   * @brief 接続する（名前解決した候補を順に試す）
   * @param timeout 接続・送受信タイムアウト
   */
  std::error_code connect(const std::string& host, uint16_t port,
                          std::chrono::milliseconds timeout) noexcept;

  void close() noexcept;
  bool is_open() const noexcept { return fd_ >= 0; }

  tnsprobe::Result<std::size_t> read_some(std::span<std::uint8_t> out) noexcept override;
  std::error_code write_all(std::span<const std::uint8_t> data) noexcept override;

private:
  int fd_ = -1;
  std::shared_ptr<utils::Logger> logger_;

  std::error_code connect_one(const void* addr, unsigned addrlen, int family,
                              std::chrono::milliseconds timeout) noexcept;
};

} // namespace tnsprobe::client
