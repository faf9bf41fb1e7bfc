#include "tnsprobe/packet/bit_utils.hpp"

namespace tnsprobe::packet {

uint64_t extract_bits(uint64_t data, uint8_t bit_offset, uint8_t bit_length) {
    if (bit_length == 0 || bit_offset >= 64) {
        return 0;
    }
    if (bit_length >= 64) {
        return data >> bit_offset;
    }
    uint64_t mask = (1ULL << bit_length) - 1;
    return (data >> bit_offset) & mask;
}

uint64_t set_bits(uint64_t data, uint8_t bit_offset, uint8_t bit_length, uint64_t value) {
    if (bit_length == 0 || bit_offset >= 64) {
        return data;
    }
    uint64_t mask = (bit_length >= 64) ? ~0ULL : ((1ULL << bit_length) - 1);
    data &= ~(mask << bit_offset);
    data |= (value & mask) << bit_offset;
    return data;
}

uint16_t read_be16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

uint32_t read_be32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24)
         | (static_cast<uint32_t>(data[1]) << 16)
         | (static_cast<uint32_t>(data[2]) << 8)
         | static_cast<uint32_t>(data[3]);
}

void write_be16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[1] = static_cast<uint8_t>(value & 0xFF);
}

void write_be32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[3] = static_cast<uint8_t>(value & 0xFF);
}

void append_u8(std::vector<uint8_t>& out, uint8_t value) {
    out.push_back(value);
}

void append_be16(std::vector<uint8_t>& out, uint16_t value) {
    uint8_t buf[2];
    write_be16(buf, value);
    out.insert(out.end(), buf, buf + 2);
}

void append_be32(std::vector<uint8_t>& out, uint32_t value) {
    uint8_t buf[4];
    write_be32(buf, value);
    out.insert(out.end(), buf, buf + 4);
}

void append_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

// ByteReader
bool ByteReader::read_u8(uint8_t& out) noexcept {
    if (remaining() < 1) return false;
    out = data_[pos_];
    pos_ += 1;
    return true;
}

bool ByteReader::read_u16(uint16_t& out) noexcept {
    if (remaining() < 2) return false;
    out = read_be16(data_.data() + pos_);
    pos_ += 2;
    return true;
}

bool ByteReader::read_u32(uint32_t& out) noexcept {
    if (remaining() < 4) return false;
    out = read_be32(data_.data() + pos_);
    pos_ += 4;
    return true;
}

bool ByteReader::read_bytes(std::size_t n, std::vector<uint8_t>& out) {
    if (remaining() < n) return false;
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
               data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return true;
}

} // namespace tnsprobe::packet
