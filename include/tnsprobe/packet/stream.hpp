#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"
#include "tnsprobe/packet/packet.hpp"

namespace tnsprobe::proto {

/**
 * @brief ブロッキングなバイトストリーム
 *
 * read_some は 1 バイト以上読めるまでブロックし、読めたバイト数を返す。
 * 0 はストリーム終端を表す。
 */
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual tnsprobe::Result<std::size_t> read_some(std::span<std::uint8_t> out) noexcept = 0;
  virtual std::error_code write_all(std::span<const std::uint8_t> data) noexcept = 0;
};

/**
 * @brief メモリ上のストリーム
 *
 * 入力を max_chunk バイトずつ小分けに返せる（0 で無制限）。
 * 書き込まれたバイト列は written() で参照できる。
 */
class MemoryStream final : public ByteStream {
public:
  MemoryStream() = default;
  explicit MemoryStream(std::vector<std::uint8_t> input, std::size_t max_chunk = 0)
    : input_(std::move(input)), max_chunk_(max_chunk) {}

  void feed(std::span<const std::uint8_t> bytes);
  std::size_t remaining() const noexcept { return input_.size() - read_pos_; }
  const std::vector<std::uint8_t>& written() const noexcept { return output_; }

  tnsprobe::Result<std::size_t> read_some(std::span<std::uint8_t> out) noexcept override;
  std::error_code write_all(std::span<const std::uint8_t> data) noexcept override;

private:
  std::vector<std::uint8_t> input_;
  std::size_t read_pos_ = 0;
  std::size_t max_chunk_ = 0;
  std::vector<std::uint8_t> output_;
};

/**
 * @brief out を埋めるまで読む
 * @return 途中でストリームが終わった場合は truncated_input
 */
std::error_code read_exact(ByteStream& stream, std::span<std::uint8_t> out) noexcept;

/**
 * @brief ヘッダーを読み、宣言長ぶんのボディを読み切ってからデコードする
 */
tnsprobe::Result<Packet> read_packet(ByteStream& stream) noexcept;

/**
 * @brief パケットをエンコードして送信する
 */
std::error_code write_packet(ByteStream& stream, const Packet& packet) noexcept;

} // namespace tnsprobe::proto
