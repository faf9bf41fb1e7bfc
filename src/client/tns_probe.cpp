#include "tnsprobe/client/tns_probe.hpp"

#include <cstdio>
#include <sstream>
#include <variant>

#include "tnsprobe/client/tcp_transport.hpp"
#include "tnsprobe/packet/codec.hpp"
#include "tnsprobe/packet/control.hpp"
#include "tnsprobe/packet/nsn.hpp"
#include "tnsprobe/packet/version.hpp"

namespace tnsprobe::client {

using proto::PacketType;

namespace {

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

void append_string_array(std::ostringstream& os, const std::vector<std::string>& v) {
  os << '[';
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) os << ',';
    os << '"' << json_escape(v[i]) << '"';
  }
  os << ']';
}

std::string hex16(uint16_t v) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%04x", v);
  return buf;
}

} // namespace

tnsprobe::Result<ProbeOptions> ProbeOptions::from_config(const utils::ConfigLoader& config) {
  ProbeOptions o{};
  o.host = config.get_string("host", o.host);

  int64_t port = config.get_int("port", o.port);
  if (port <= 0 || port > 0xFFFF) {
    return make_error_code(TnsErrc::invalid_length);
  }
  o.port = static_cast<uint16_t>(port);

  int64_t timeout_ms = config.get_int("timeout_ms", o.timeout.count());
  if (timeout_ms <= 0) {
    return make_error_code(TnsErrc::invalid_length);
  }
  o.timeout = std::chrono::milliseconds(timeout_ms);

  o.service_name = config.get_string("service_name", o.service_name);
  o.program = config.get_string("program", o.program);
  o.client_host = config.get_string("client_host", o.client_host);
  o.user = config.get_string("user", o.user);

  int64_t version = config.get_int("tns_version", o.tns_version);
  int64_t min_version = config.get_int("min_tns_version", o.min_tns_version);
  if (version < 0 || version > 0xFFFF || min_version < 0 || min_version > 0xFFFF) {
    return make_error_code(TnsErrc::invalid_length);
  }
  o.tns_version = static_cast<uint16_t>(version);
  o.min_tns_version = static_cast<uint16_t>(min_version);

  o.negotiate = config.get_bool("negotiate", o.negotiate);
  o.release_version = config.get_string("release_version", o.release_version);
  auto packed = proto::encode_release_version(o.release_version);
  if (!packed) return packed.error();
  return o;
}

std::string build_connect_descriptor(const ProbeOptions& o) {
  std::ostringstream ss;
  ss << "(DESCRIPTION=(CONNECT_DATA=(SERVICE_NAME=" << o.service_name << ")"
     << "(CID=(PROGRAM=" << o.program << ")(HOST=" << o.client_host << ")(USER=" << o.user << ")))"
     << "(ADDRESS=(PROTOCOL=TCP)(HOST=" << o.host << ")(PORT=" << o.port << ")))";
  return ss.str();
}

proto::Packet make_connect_packet(const ProbeOptions& o) {
  proto::ConnectBody c{};
  c.version = o.tns_version;
  c.min_version = o.min_tns_version;
  c.global_service_options = proto::ServiceOptions(o.global_service_options);
  c.sdu = o.sdu;
  c.tdu = o.tdu;
  c.protocol_characteristics = proto::ProtocolCharacteristics(o.protocol_characteristics);
  c.max_before_ack = 0;
  c.byte_order = proto::kDefaultByteOrder;
  c.max_response_size = o.max_response_size;
  c.connect_flags0 = proto::ConnectFlags(o.connect_flags);
  c.connect_flags1 = proto::ConnectFlags(o.connect_flags);
  c.connection_string = build_connect_descriptor(o);
  proto::update_data_fields(c);

  proto::Packet p{};
  p.header.type = PacketType::Connect;
  p.body = std::move(c);
  return p;
}

TnsProbe::TnsProbe(ProbeOptions options)
  : options_(std::move(options)),
    logger_(utils::LogManager::instance().get_logger("tnsprobe.probe")) {}

tnsprobe::Result<ProbeResult> TnsProbe::run() {
  TcpTransport transport;
  if (auto ec = transport.connect(options_.host, options_.port, options_.timeout)) {
    return ec;
  }
  return run(transport);
}

tnsprobe::Result<ProbeResult> TnsProbe::run(proto::ByteStream& stream) {
  ProbeResult result{};
  const proto::Packet connect = make_connect_packet(options_);

  if (auto ec = proto::write_packet(stream, connect)) {
    TNSPROBE_LOG_WARNING(logger_, "send Connect failed: " + ec.message());
    return ec;
  }
  TNSPROBE_LOG_DEBUG(logger_, "sent Connect");

  auto reply = proto::read_packet(stream);
  if (!reply) {
    TNSPROBE_LOG_WARNING(logger_, "read reply failed: " + reply.error().message());
    return reply.error();
  }

  // Resend は一度だけ応じる
  if (reply.value().header.type == PacketType::Resend) {
    result.resend_seen = true;
    TNSPROBE_LOG_DEBUG(logger_, "received Resend, sending Connect again");
    if (auto ec = proto::write_packet(stream, connect)) {
      TNSPROBE_LOG_WARNING(logger_, "resend Connect failed: " + ec.message());
      return ec;
    }
    reply = proto::read_packet(stream);
    if (!reply) {
      TNSPROBE_LOG_WARNING(logger_, "read reply failed: " + reply.error().message());
      return reply.error();
    }
  }

  const proto::Packet& pkt = reply.value();
  result.response_type = pkt.header.type;
  TNSPROBE_LOG_DEBUG(logger_, "received " + std::string(proto::packet_type_name(pkt.header.type)));

  switch (pkt.header.type) {
    case PacketType::Accept: {
      const auto& a = std::get<proto::AcceptBody>(pkt.body);
      result.accept_version = a.version;
      result.global_service_options = a.global_service_options.names();
      result.connect_flags0 = a.connect_flags0.names();
      result.connect_flags1 = a.connect_flags1.names();
      result.sdu = a.sdu;
      result.tdu = a.tdu;
      if (options_.negotiate) {
        if (auto ec = negotiate(stream, result)) return ec;
      }
      break;
    }
    case PacketType::Refuse: {
      auto refuse = proto::decode_refuse(std::get<proto::UnknownBody>(pkt.body));
      if (!refuse) {
        TNSPROBE_LOG_WARNING(logger_, "malformed Refuse: " + refuse.error().message());
        return refuse.error();
      }
      result.refuse_user_reason = refuse.value().user_reason;
      result.refuse_system_reason = refuse.value().system_reason;
      result.refuse_text = refuse.value().data;
      break;
    }
    case PacketType::Redirect: {
      auto redirect = proto::decode_redirect(std::get<proto::UnknownBody>(pkt.body));
      if (!redirect) {
        TNSPROBE_LOG_WARNING(logger_, "malformed Redirect: " + redirect.error().message());
        return redirect.error();
      }
      result.redirect_text = redirect.value().data;
      break;
    }
    case PacketType::Connect:
      TNSPROBE_LOG_WARNING(logger_, "peer answered Connect with Connect");
      return make_error_code(TnsErrc::unexpected_packet);
    default:
      break;
  }
  return result;
}

std::error_code TnsProbe::negotiate(proto::ByteStream& stream, ProbeResult& result) {
  auto packed = proto::encode_release_version(options_.release_version);
  if (!packed) return packed.error();

  auto nsn = proto::encode_nsn(proto::make_default_nsn_request(packed.value()));
  if (!nsn) return nsn.error();

  proto::Packet data{};
  data.header.type = PacketType::Data;
  data.body = proto::DataBody{0, std::move(nsn.value())};
  if (auto ec = proto::write_packet(stream, data)) {
    TNSPROBE_LOG_WARNING(logger_, "send NSN request failed: " + ec.message());
    return ec;
  }
  TNSPROBE_LOG_DEBUG(logger_, "sent NSN request");

  auto reply = proto::read_packet(stream);
  if (!reply) {
    TNSPROBE_LOG_WARNING(logger_, "read NSN reply failed: " + reply.error().message());
    return reply.error();
  }
  if (reply.value().header.type != PacketType::Data) {
    TNSPROBE_LOG_DEBUG(logger_, "NSN reply is " + std::string(proto::packet_type_name(reply.value().header.type)));
    return {};
  }

  // 応答が NSN でない場合もあるので、デコード失敗は結果に含めないだけにする
  const auto& body = std::get<proto::DataBody>(reply.value().body);
  auto decoded = proto::decode_nsn(body.payload);
  if (!decoded) {
    TNSPROBE_LOG_WARNING(logger_, "NSN reply not decodable: " + decoded.error().message());
    return {};
  }
  result.release_version = proto::decode_release_version(decoded.value().version);
  for (const auto& svc : decoded.value().services) {
    result.nsn_services.emplace_back(proto::nsn_service_name(svc.type));
  }
  return {};
}

std::string probe_result_to_json(const ProbeResult& r) {
  std::ostringstream os;
  os << '{';
  os << "\"response_type\":\"" << proto::packet_type_name(r.response_type) << "\"";
  os << ",\"resend_seen\":" << (r.resend_seen ? "true" : "false");
  if (r.accept_version) {
    os << ",\"accept\":{";
    os << "\"version\":\"" << hex16(*r.accept_version) << "\"";
    os << ",\"sdu\":" << r.sdu << ",\"tdu\":" << r.tdu;
    os << ",\"global_service_options\":";
    append_string_array(os, r.global_service_options);
    os << ",\"connect_flags0\":";
    append_string_array(os, r.connect_flags0);
    os << ",\"connect_flags1\":";
    append_string_array(os, r.connect_flags1);
    os << '}';
  }
  if (r.release_version) {
    os << ",\"nsn\":{\"release_version\":\"" << json_escape(*r.release_version) << "\",\"services\":";
    append_string_array(os, r.nsn_services);
    os << '}';
  }
  if (r.refuse_user_reason) {
    os << ",\"refuse\":{\"user_reason\":" << static_cast<int>(*r.refuse_user_reason)
       << ",\"system_reason\":" << static_cast<int>(r.refuse_system_reason.value_or(0))
       << ",\"data\":\"" << json_escape(r.refuse_text) << "\"}";
  }
  if (r.response_type == PacketType::Redirect) {
    os << ",\"redirect\":{\"data\":\"" << json_escape(r.redirect_text) << "\"}";
  }
  os << '}';
  return os.str();
}

} // namespace tnsprobe::client
