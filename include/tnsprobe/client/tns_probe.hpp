#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tnsprobe/error.hpp"
#include "tnsprobe/expected.hpp"
#include "tnsprobe/packet/packet.hpp"
#include "tnsprobe/packet/stream.hpp"
#include "tnsprobe/utils/config_loader.hpp"
#include "tnsprobe/utils/log_config.hpp"

namespace tnsprobe::client {

/**
 * @brief プローブ設定
 *
 * 既定値は一般的なクライアント（10.2 系）が送る Connect に合わせている。
 */
struct ProbeOptions {
  std::string host;
  uint16_t port = 1521;
  std::chrono::milliseconds timeout{5000};

  // 接続記述子 (CONNECT_DATA / CID)
  std::string service_name = "XE";
  std::string program = "sqlplus";
  std::string client_host = "localhost";
  std::string user = "oracle";

  uint16_t tns_version = 0x013a;
  uint16_t min_tns_version = 0x012c;
  uint16_t global_service_options = 0x0c41;
  uint16_t sdu = 0x2000;
  uint16_t tdu = 0xffff;
  uint16_t protocol_characteristics = 0x7f08;
  uint32_t max_response_size = 0x0800;
  uint8_t connect_flags = 0x41;

  bool negotiate = true;
  std::string release_version = "10.2.0.3.0";

  /**
   * @brief ConfigLoader から読み込む（未設定のキーは既定値のまま）
   */
  static tnsprobe::Result<ProbeOptions> from_config(const utils::ConfigLoader& config);
};

/**
 * @brief プローブ結果
 */
struct ProbeResult {
  proto::PacketType response_type = proto::PacketType::Data;
  bool resend_seen = false;

  // Accept
  std::optional<uint16_t> accept_version;
  std::vector<std::string> global_service_options;
  std::vector<std::string> connect_flags0;
  std::vector<std::string> connect_flags1;
  uint16_t sdu = 0;
  uint16_t tdu = 0;

  // NSN 応答
  std::optional<std::string> release_version;
  std::vector<std::string> nsn_services;

  // Refuse
  std::optional<uint8_t> refuse_user_reason;
  std::optional<uint8_t> refuse_system_reason;
  std::string refuse_text;

  // Redirect
  std::string redirect_text;
};

/**
 * @brief 接続記述子を組み立てる
 *
 * (DESCRIPTION=(CONNECT_DATA=(SERVICE_NAME=..)(CID=(PROGRAM=..)(HOST=..)(USER=..)))
 *  (ADDRESS=(PROTOCOL=TCP)(HOST=..)(PORT=..)))
 */
std::string build_connect_descriptor(const ProbeOptions& options);

/**
 * @brief ProbeOptions から Connect パケットを組み立てる（length/offset は計算済み）
 */
proto::Packet make_connect_packet(const ProbeOptions& options);

/**
 * @brief Connect -> (Resend) -> Accept -> NSN のやり取りを1回行う
 */
class TnsProbe {
public:
  explicit TnsProbe(ProbeOptions options);

  /**
   * @brief 接続済みのストリーム上でプローブを実行
   * @return 最初の応答が Connect の場合は unexpected_packet
   */
  tnsprobe::Result<ProbeResult> run(proto::ByteStream& stream);

  /**
   * @brief TCP 接続を張ってプローブを実行
   */
  tnsprobe::Result<ProbeResult> run();

  const ProbeOptions& options() const { return options_; }

private:
  ProbeOptions options_;
  std::shared_ptr<utils::Logger> logger_;

  std::error_code negotiate(proto::ByteStream& stream, ProbeResult& result);
};

/**
 * @brief 結果を JSON 文字列に変換
 */
std::string probe_result_to_json(const ProbeResult& result);

} // namespace tnsprobe::client
