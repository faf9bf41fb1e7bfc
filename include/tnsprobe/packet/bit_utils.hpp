#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tnsprobe::packet {

/**
 * @brief Extract specified bit range
 * @param data Data
 * @param bit_offset Bit offset (starting from 0 at the LSB)
 * @param bit_length Bit length
 * @return Extracted bit value
 */
uint64_t extract_bits(uint64_t data, uint8_t bit_offset, uint8_t bit_length);

/**
 * @brief Set value to specified bit range
 * @param data Target data
 * @param bit_offset Bit offset (starting from 0 at the LSB)
 * @param bit_length Bit length
 * @param value Value to set (truncated to bit_length)
 * @return Data after setting
 */
uint64_t set_bits(uint64_t data, uint8_t bit_offset, uint8_t bit_length, uint64_t value);

/**
 * @brief Read 16-bit value in big-endian (network) format
 */
uint16_t read_be16(const uint8_t* data);

/**
 * @brief Read 32-bit value in big-endian (network) format
 */
uint32_t read_be32(const uint8_t* data);

/**
 * @brief Write 16-bit value in big-endian (network) format
 */
void write_be16(uint8_t* data, uint16_t value);

/**
 * @brief Write 32-bit value in big-endian (network) format
 */
void write_be32(uint8_t* data, uint32_t value);

/**
 * @brief Append big-endian integers to a growing buffer
 */
void append_u8(std::vector<uint8_t>& out, uint8_t value);
void append_be16(std::vector<uint8_t>& out, uint16_t value);
void append_be32(std::vector<uint8_t>& out, uint32_t value);
void append_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes);

/**
 * @brief 境界チェック付きの読み取りカーソル
 *
 * 読み取り失敗（残りバイト不足）時は false を返し、カーソルは動かない。
 * base はスパン先頭のパケット内オフセットで、position() は base 込みの値を返す。
 */
class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data, std::size_t base = 0) noexcept
    : data_(data), base_(base) {}

  std::size_t position() const noexcept { return base_ + pos_; }
  std::size_t remaining() const noexcept { return data_.size() - pos_; }
  std::span<const uint8_t> rest() const noexcept { return data_.subspan(pos_); }

  bool read_u8(uint8_t& out) noexcept;
  bool read_u16(uint16_t& out) noexcept;
  bool read_u32(uint32_t& out) noexcept;
  bool read_bytes(std::size_t n, std::vector<uint8_t>& out);

  template<std::size_t N>
  bool read_array(std::array<uint8_t, N>& out) noexcept {
    if (remaining() < N) return false;
    for (std::size_t i = 0; i < N; ++i) out[i] = data_[pos_ + i];
    pos_ += N;
    return true;
  }

private:
  std::span<const uint8_t> data_;
  std::size_t base_ = 0;
  std::size_t pos_ = 0;
};

} // namespace tnsprobe::packet
