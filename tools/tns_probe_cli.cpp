#include <iostream>
#include <string>
#include <vector>

#include "tnsprobe/client/tns_probe.hpp"
#include "tnsprobe/utils/config_loader.hpp"
#include "tnsprobe/utils/log_config.hpp"

using tnsprobe::utils::ConfigLoader;
using tnsprobe::utils::ConfigValue;

static void print_usage() {
  std::cout << "Usage:\n"
               "  tns_probe_cli [--config=<FILE>] [--key=value ...] [HOST]\n\n"
               "Keys (also TNSPROBE_<KEY> environment variables, or key=value lines in --config):\n"
               "  --host=H             target host (or positional HOST)\n"
               "  --port=P             default 1521\n"
               "  --timeout_ms=N       default 5000\n"
               "  --service_name=S     default XE\n"
               "  --tns_version=V      default 314 (0x13a)\n"
               "  --min_tns_version=V  default 300 (0x12c)\n"
               "  --negotiate=BOOL     default true\n"
               "  --release_version=R  default 10.2.0.3.0\n"
               "  --log_level=L        trace|debug|info|warning|error|critical|off (default info)\n"
               "  --log_file=PATH      also write logs to PATH\n";
}

int main(int argc, char** argv) {
  ConfigLoader config;
  config.load_defaults({
    {"port", ConfigValue{int64_t{1521}}},
    {"timeout_ms", ConfigValue{int64_t{5000}}},
    {"service_name", ConfigValue{std::string("XE")}},
    {"tns_version", ConfigValue{int64_t{0x13a}}},
    {"min_tns_version", ConfigValue{int64_t{0x12c}}},
    {"negotiate", ConfigValue{true}},
    {"release_version", ConfigValue{std::string("10.2.0.3.0")}},
    {"log_level", ConfigValue{std::string("info")}},
  });

  // コマンドラインは最後に適用したいので、先に --config だけ拾う
  ConfigLoader cli;
  cli.load_from_command_line(argc, argv);
  if (cli.get_bool("help", false)) {
    print_usage();
    return 0;
  }
  if (cli.has("config")) {
    std::string path = cli.get_string("config");
    if (!config.load_from_file(path)) {
      std::cerr << "failed to load config: " << path << "\n";
      return 2;
    }
  }
  config.load_from_environment("TNSPROBE_");
  config.load_from_command_line(argc, argv);

  if (!config.positional_args().empty()) {
    config.set("host", config.positional_args().front());
  }
  if (config.get_string("host").empty()) {
    print_usage();
    return 2;
  }

  tnsprobe::utils::log_utils::setup_basic_logging(
      tnsprobe::utils::log_utils::parse_log_level(config.get_string("log_level", "info")),
      true,
      config.get_string("log_file", ""));
  auto logger = tnsprobe::utils::LogManager::instance().get_logger("tnsprobe.cli");
  TNSPROBE_LOG_DEBUG(logger, config.get_debug_info());

  auto options = tnsprobe::client::ProbeOptions::from_config(config);
  if (!options) {
    std::cerr << "invalid configuration: " << options.error().message() << "\n";
    return 2;
  }

  tnsprobe::client::TnsProbe probe(options.value());
  auto res = probe.run();
  if (!res) {
    TNSPROBE_LOG_ERROR(logger, "probe failed: " + res.error().message());
    tnsprobe::utils::LogManager::instance().flush_all();
    return 1;
  }
  std::cout << tnsprobe::client::probe_result_to_json(res.value()) << std::endl;
  tnsprobe::utils::LogManager::instance().flush_all();
  return 0;
}
