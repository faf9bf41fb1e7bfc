#include "tnsprobe/packet/types.hpp"

namespace tnsprobe::proto {

std::string_view packet_type_name(PacketType t) noexcept {
  switch (t) {
    case PacketType::Connect: return "Connect";
    case PacketType::Accept: return "Accept";
    case PacketType::Acknowledge: return "Acknowledge";
    case PacketType::Refuse: return "Refuse";
    case PacketType::Redirect: return "Redirect";
    case PacketType::Data: return "Data";
    case PacketType::Null: return "Null";
    case PacketType::Abort: return "Abort";
    case PacketType::Resend: return "Resend";
    case PacketType::Marker: return "Marker";
    case PacketType::Attention: return "Attention";
    case PacketType::Control: return "Control";
    default: return "Unknown";
  }
}

std::string_view flag_name(ServiceOption f) noexcept {
  switch (f) {
    case ServiceOption::BrokenConnectNotify: return "BROKEN_CONNECT_NOTIFY";
    case ServiceOption::PacketChecksum: return "PACKET_CHECKSUM";
    case ServiceOption::HeaderChecksum: return "HEADER_CHECKSUM";
    case ServiceOption::FullDuplex: return "FULL_DUPLEX";
    case ServiceOption::HalfDuplex: return "HALF_DUPLEX";
    case ServiceOption::DirectIO: return "DIRECT_IO";
    case ServiceOption::AttentionProcessing: return "ATTENTION_PROCESSING";
    case ServiceOption::CanReceiveAttention: return "CAN_RECEIVE_ATTENTION";
    case ServiceOption::CanSendAttention: return "CAN_SEND_ATTENTION";
    default: return {};
  }
}

std::string_view flag_name(ProtocolCharacteristic f) noexcept {
  switch (f) {
    case ProtocolCharacteristic::Hangon: return "HANGON";
    case ProtocolCharacteristic::ConfirmedRelease: return "CONFIRMED_RELEASE";
    case ProtocolCharacteristic::TDUBasedIO: return "TDU_BASED_IO";
    case ProtocolCharacteristic::SpawnerRunning: return "SPAWNER_RUNNING";
    case ProtocolCharacteristic::DataTest: return "DATA_TEST";
    case ProtocolCharacteristic::CallbackIO: return "CALLBACK_IO";
    case ProtocolCharacteristic::AsyncIO: return "ASYNC_IO";
    case ProtocolCharacteristic::PacketIO: return "PACKET_IO";
    case ProtocolCharacteristic::CanGrant: return "CAN_GRANT";
    case ProtocolCharacteristic::CanHandoff: return "CAN_HANDOFF";
    case ProtocolCharacteristic::GenerateSIGIO: return "GENERATE_SIGIO";
    case ProtocolCharacteristic::GenerateSIGPIPE: return "GENERATE_SIGPIPE";
    case ProtocolCharacteristic::GenerateSIGURG: return "GENERATE_SIGURG";
    case ProtocolCharacteristic::UrgentIO: return "URGENT_IO";
    case ProtocolCharacteristic::FullDuplex: return "FULL_DUPLEX";
    case ProtocolCharacteristic::TestOperation: return "TEST_OPERATION";
    default: return {};
  }
}

std::string_view flag_name(ConnectFlag f) noexcept {
  switch (f) {
    case ConnectFlag::INAEnabled: return "INA_ENABLED";
    case ConnectFlag::INAWanted: return "INA_WANTED";
    case ConnectFlag::ServicesEnabled: return "SERVICES_ENABLED";
    case ConnectFlag::ServicesWanted: return "SERVICES_WANTED";
    default: return {};
  }
}

std::string_view flag_name(NSNOption) noexcept {
  return {};
}

} // namespace tnsprobe::proto
