#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tnsprobe::utils {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Off = 6   // 出力しない（ロガー・シンクの閾値専用）
};

// 1行分のログ。file/line/function は TNSPROBE_LOG_* マクロが埋める
struct LogEntry {
  LogLevel level = LogLevel::Info;
  std::string logger_name;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
  std::string thread_id;
  std::string file;
  int line = 0;
  std::string function;
  std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief テキスト/JSON 共通のフォーマッター
 *
 * テキスト形式は "時刻 | レベル | ロガー名 | メッセージ [| file:line] [| [k=v,...]]"。
 * メタデータはキー順に並べる。
 */
class UnifiedLogFormatter {
public:
  struct FormatConfig {
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
    bool include_file_info = false;
    bool include_metadata = true;
    std::string field_separator = " | ";
    std::string metadata_prefix = "[";
    std::string metadata_suffix = "]";
  };

  UnifiedLogFormatter() = default;
  explicit UnifiedLogFormatter(FormatConfig config) : config_(std::move(config)) {}

  std::string format(const LogEntry& entry) const;
  std::string format_json(const LogEntry& entry) const;

private:
  FormatConfig config_;

  std::string format_timestamp(std::chrono::system_clock::time_point tp) const;
  std::string format_metadata(const std::unordered_map<std::string, std::string>& metadata) const;
};

// 出力先。min_level 未満のエントリは Logger 側で捨てる
class LogSink {
public:
  virtual ~LogSink() = default;

  virtual void write(const LogEntry& entry) = 0;
  virtual void flush() {}
  virtual void close() {}

  void set_min_level(LogLevel level) { min_level_ = level; }
  LogLevel min_level() const { return min_level_; }
  void set_formatter(std::shared_ptr<const UnifiedLogFormatter> formatter) { formatter_ = std::move(formatter); }

protected:
  LogLevel min_level_ = LogLevel::Trace;
  std::shared_ptr<const UnifiedLogFormatter> formatter_ = std::make_shared<UnifiedLogFormatter>();
};

// stderr へ出す（stdout はツールの JSON 出力用）
class ConsoleLogSink : public LogSink {
public:
  explicit ConsoleLogSink(bool use_colors = true) : use_colors_(use_colors) {}
  void write(const LogEntry& entry) override;

private:
  bool use_colors_;
  std::mutex mutex_;
};

/**
 * @brief 追記モードのファイルシンク
 *
 * max_file_size を超えたら file -> file.1 -> ... -> file.<max_files> と回し、
 * それより古いものは消す。max_file_size が 0 ならローテーションしない。
 */
class FileLogSink : public LogSink {
public:
  explicit FileLogSink(std::filesystem::path path,
                       std::size_t max_file_size = 10 * 1024 * 1024,
                       std::size_t max_files = 5);
  ~FileLogSink() override;

  void write(const LogEntry& entry) override;
  void flush() override;
  void close() override;

  bool is_open() const;

private:
  std::filesystem::path path_;
  std::size_t max_file_size_;
  std::size_t max_files_;
  std::ofstream out_;
  std::size_t written_ = 0;
  mutable std::mutex mutex_;

  void rotate();
  std::filesystem::path rotated_path(std::size_t n) const;
};

class Logger {
public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void add_sink(std::shared_ptr<LogSink> sink);
  void remove_sink(const std::shared_ptr<LogSink>& sink);

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel level) const { return level != LogLevel::Off && level >= level_; }
  const std::string& name() const { return name_; }

  void log(LogLevel level, const std::string& message,
           const char* file = "", int line = 0, const char* function = "");
  void log_with_metadata(LogLevel level, const std::string& message,
                         std::unordered_map<std::string, std::string> metadata,
                         const char* file = "", int line = 0, const char* function = "");
  void flush();

private:
  std::string name_;
  LogLevel level_ = LogLevel::Info;
  std::vector<std::shared_ptr<LogSink>> sinks_;
  std::mutex sinks_mutex_;
};

/**
 * @brief 名前付きロガーの置き場
 *
 * グローバルレベルとグローバルシンクは、作成済みのロガーにも
 * 後から get_logger で作られるロガーにも適用される。
 */
class LogManager {
public:
  static LogManager& instance();

  std::shared_ptr<Logger> get_logger(const std::string& name);
  void clear_loggers();

  void set_global_level(LogLevel level);
  LogLevel global_level() const;

  void add_global_sink(std::shared_ptr<LogSink> sink);
  void clear_global_sinks();

  void flush_all();
  void shutdown();

  LogManager(const LogManager&) = delete;
  LogManager& operator=(const LogManager&) = delete;

private:
  LogManager() = default;
  ~LogManager();

  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<std::shared_ptr<LogSink>> global_sinks_;
  LogLevel global_level_ = LogLevel::Info;
  mutable std::mutex mutex_;
};

// logger は Logger へのポインタ（shared_ptr 可）。無効なレベルではメッセージを組み立てない
#define TNSPROBE_LOG(logger, lvl, message)                                   \
  do {                                                                       \
    if ((logger)->enabled(lvl)) {                                            \
      (logger)->log((lvl), (message), __FILE__, __LINE__, __func__);         \
    }                                                                        \
  } while (0)

#define TNSPROBE_LOG_TRACE(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Trace, message)
#define TNSPROBE_LOG_DEBUG(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Debug, message)
#define TNSPROBE_LOG_INFO(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Info, message)
#define TNSPROBE_LOG_WARNING(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Warning, message)
#define TNSPROBE_LOG_ERROR(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Error, message)
#define TNSPROBE_LOG_CRITICAL(logger, message) TNSPROBE_LOG(logger, ::tnsprobe::utils::LogLevel::Critical, message)

namespace log_utils {

// 大文字小文字を区別しない。"warn"/"fatal"/"none" も受け付け、未知の文字列は Info
LogLevel parse_log_level(const std::string& text);
std::string log_level_to_string(LogLevel level);

std::shared_ptr<FileLogSink> create_rotating_file_sink(const std::filesystem::path& path,
                                                       std::size_t max_size = 10 * 1024 * 1024,
                                                       std::size_t max_files = 5);

/**
 * @brief グローバルシンクを張り直す
 * @param log_file 空ならファイル出力なし
 *
 * 環境変数 NO_COLOR が設定されていればコンソール出力を色付けしない。
 */
void setup_basic_logging(LogLevel level = LogLevel::Info,
                         bool log_to_console = true,
                         const std::filesystem::path& log_file = {});

} // namespace log_utils

} // namespace tnsprobe::utils
