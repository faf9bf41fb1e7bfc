#include "tnsprobe/packet/stream.hpp"

#include <algorithm>
#include <cstring>

#include "tnsprobe/packet/codec.hpp"

namespace tnsprobe::proto {

// MemoryStream
void MemoryStream::feed(std::span<const std::uint8_t> bytes) {
  input_.insert(input_.end(), bytes.begin(), bytes.end());
}

tnsprobe::Result<std::size_t> MemoryStream::read_some(std::span<std::uint8_t> out) noexcept {
  std::size_t n = std::min(out.size(), remaining());
  if (max_chunk_ > 0) n = std::min(n, max_chunk_);
  if (n > 0) {
    std::memcpy(out.data(), input_.data() + read_pos_, n);
    read_pos_ += n;
  }
  return n;
}

std::error_code MemoryStream::write_all(std::span<const std::uint8_t> data) noexcept {
  output_.insert(output_.end(), data.begin(), data.end());
  return {};
}

std::error_code read_exact(ByteStream& stream, std::span<std::uint8_t> out) noexcept {
  std::size_t filled = 0;
  while (filled < out.size()) {
    auto res = stream.read_some(out.subspan(filled));
    if (!res) return res.error();
    if (res.value() == 0) {
      return make_error_code(TnsErrc::truncated_input);
    }
    filled += res.value();
  }
  return {};
}

tnsprobe::Result<Packet> read_packet(ByteStream& stream) noexcept {
  HeaderBytes hb{};
  if (auto ec = read_exact(stream, hb)) return ec;
  auto h_res = decode_header(hb);
  if (!h_res) return h_res.error();

  Packet p{};
  p.header = h_res.value();
  std::vector<std::uint8_t> body(p.header.length - kHeaderSize);
  if (auto ec = read_exact(stream, body)) return ec;

  auto body_res = decode_body(p.header.type, body);
  if (!body_res) return body_res.error();
  p.body = std::move(body_res.value());
  return p;
}

std::error_code write_packet(ByteStream& stream, const Packet& packet) noexcept {
  auto enc = encode_packet(packet);
  if (!enc) return enc.error();
  return stream.write_all(enc.value());
}

} // namespace tnsprobe::proto
