#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstdint>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <variant>

#include "tnsprobe/packet/codec.hpp"
#include "tnsprobe/packet/control.hpp"
#include "tnsprobe/packet/nsn.hpp"
#include "tnsprobe/packet/stream.hpp"
#include "tnsprobe/packet/version.hpp"

using namespace tnsprobe::proto;

static bool read_all(const std::filesystem::path& p, std::vector<std::uint8_t>& out) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  auto n = ifs.tellg();
  ifs.seekg(0, std::ios::beg);
  out.resize(static_cast<size_t>(n));
  if (n > 0) ifs.read(reinterpret_cast<char*>(out.data()), n);
  return true;
}

// "00 0a 00 00 ..." 形式のテキストをバイト列にする（16進以外の文字は区切りとして扱う）
static bool parse_hex_text(const std::vector<std::uint8_t>& text, std::vector<std::uint8_t>& out) {
  out.clear();
  int hi = -1;
  for (std::uint8_t c : text) {
    if (!std::isxdigit(c)) {
      if (hi >= 0) return false;
      continue;
    }
    int v = std::isdigit(c) ? c - '0' : (std::tolower(c) - 'a' + 10);
    if (hi < 0) {
      hi = v;
    } else {
      out.push_back(static_cast<std::uint8_t>((hi << 4) | v));
      hi = -1;
    }
  }
  return hi < 0;
}

static std::string hex(const std::vector<std::uint8_t>& bytes) {
  std::string s;
  char buf[4];
  for (size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : " %02x", bytes[i]);
    s += buf;
  }
  return s;
}

static std::string quoted(const std::string& s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    if (c == '"' || c == '\\') { out += '\\'; out += static_cast<char>(c); }
    else if (c < 0x20) { char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
    else out += static_cast<char>(c);
  }
  return out + "\"";
}

static std::string names(const std::vector<std::string>& v) {
  std::string s = "[";
  for (size_t i = 0; i < v.size(); ++i) s += (i ? ", " : "") + quoted(v[i]);
  return s + "]";
}

static void print_nsn(const NSNData& nsn) {
  std::cout << ",\n    \"nsn\": {\n"
            << "      \"version\": " << quoted(decode_release_version(nsn.version)) << ",\n"
            << "      \"options\": " << int(nsn.options.raw) << ",\n"
            << "      \"services\": [";
  for (size_t i = 0; i < nsn.services.size(); ++i) {
    const auto& s = nsn.services[i];
    std::cout << (i == 0 ? "\n" : ",\n") << "        { \"type\": " << s.type
              << ", \"name\": " << quoted(std::string(nsn_service_name(s.type)))
              << ", \"values\": " << s.values.size() << " }";
  }
  if (!nsn.services.empty()) std::cout << "\n      ";
  std::cout << "]\n    }";
}

static void print_packet(const Packet& p) {
  std::cout << "  {\n";
  std::cout << "    \"length\": " << p.header.length << ",\n";
  std::cout << "    \"type\": " << int(static_cast<std::uint8_t>(p.header.type)) << ",\n";
  std::cout << "    \"type_name\": " << quoted(std::string(packet_type_name(p.header.type))) << ",\n";
  std::cout << "    \"flags\": " << int(p.header.flags);

  if (const auto* c = std::get_if<ConnectBody>(&p.body)) {
    std::cout << ",\n    \"connect\": {\n"
              << "      \"version\": " << c->version << ",\n"
              << "      \"min_version\": " << c->min_version << ",\n"
              << "      \"global_service_options\": " << names(c->global_service_options.names()) << ",\n"
              << "      \"sdu\": " << c->sdu << ",\n"
              << "      \"tdu\": " << c->tdu << ",\n"
              << "      \"protocol_characteristics\": " << names(c->protocol_characteristics.names()) << ",\n"
              << "      \"connect_flags0\": " << names(c->connect_flags0.names()) << ",\n"
              << "      \"connect_flags1\": " << names(c->connect_flags1.names()) << ",\n"
              << "      \"padding\": " << quoted(hex(c->padding)) << ",\n"
              << "      \"connection_string\": " << quoted(c->connection_string) << "\n"
              << "    }";
  } else if (const auto* a = std::get_if<AcceptBody>(&p.body)) {
    std::cout << ",\n    \"accept\": {\n"
              << "      \"version\": " << a->version << ",\n"
              << "      \"global_service_options\": " << names(a->global_service_options.names()) << ",\n"
              << "      \"sdu\": " << a->sdu << ",\n"
              << "      \"tdu\": " << a->tdu << ",\n"
              << "      \"connect_flags0\": " << names(a->connect_flags0.names()) << ",\n"
              << "      \"connect_flags1\": " << names(a->connect_flags1.names()) << ",\n"
              << "      \"accept_data\": " << quoted(hex(a->accept_data)) << "\n"
              << "    }";
  } else if (const auto* d = std::get_if<DataBody>(&p.body)) {
    std::cout << ",\n    \"data_flags\": " << d->data_flags << ",\n"
              << "    \"payload\": " << quoted(hex(d->payload));
    auto nsn = decode_nsn(d->payload);
    if (nsn) print_nsn(nsn.value());
  } else if (const auto* u = std::get_if<UnknownBody>(&p.body)) {
    std::cout << ",\n    \"body\": " << quoted(hex(u->bytes));
    if (p.header.type == PacketType::Refuse) {
      auto r = decode_refuse(*u);
      if (r) {
        std::cout << ",\n    \"refuse\": { \"user_reason\": " << int(r.value().user_reason)
                  << ", \"system_reason\": " << int(r.value().system_reason)
                  << ", \"data\": " << quoted(r.value().data) << " }";
      }
    } else if (p.header.type == PacketType::Redirect) {
      auto r = decode_redirect(*u);
      if (r) std::cout << ",\n    \"redirect\": " << quoted(r.value().data);
    }
  }
  std::cout << "\n  }";
}

int main(int argc, char** argv) {
  if (argc < 2) { std::cerr << "Usage: tns_packet_decode [--hex] <file>\n"; return 2; }
  bool hex_input = false;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--hex") hex_input = true;
    else path = a;
  }
  if (path.empty()) { std::cerr << "Usage: tns_packet_decode [--hex] <file>\n"; return 2; }

  std::vector<std::uint8_t> bytes;
  if (!read_all(path, bytes)) { std::cerr << "failed to read file\n"; return 1; }
  if (hex_input) {
    std::vector<std::uint8_t> raw;
    if (!parse_hex_text(bytes, raw)) { std::cerr << "invalid hex input\n"; return 1; }
    bytes.swap(raw);
  }

  // ファイル内の連続したパケットを順にデコード
  MemoryStream stream(std::move(bytes));
  std::cout << "[\n";
  int count = 0;
  while (stream.remaining() > 0) {
    auto res = read_packet(stream);
    if (!res) {
      std::cout << "\n]\n";
      std::cerr << "decode error at packet " << count << ": " << res.error().message() << "\n";
      return 1;
    }
    if (count++ > 0) std::cout << ",\n";
    print_packet(res.value());
  }
  std::cout << "\n]\n";
  return 0;
}
