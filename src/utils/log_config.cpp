#include "tnsprobe/utils/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>

#include "tnsprobe/utils/env.hpp"

namespace tnsprobe::utils {

namespace {

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out += c;
    }
  }
  return out;
}

const char* level_color(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "\033[37m";
    case LogLevel::Debug: return "\033[36m";
    case LogLevel::Info: return "\033[32m";
    case LogLevel::Warning: return "\033[33m";
    case LogLevel::Error: return "\033[31m";
    case LogLevel::Critical: return "\033[35m";
    default: return "";
  }
}

std::string current_thread_id() {
  std::ostringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

} // namespace

// --- UnifiedLogFormatter ---

std::string UnifiedLogFormatter::format_timestamp(std::chrono::system_clock::time_point tp) const {
  std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), config_.timestamp_format.c_str(), &tm);
  return std::string(buf, n);
}

std::string UnifiedLogFormatter::format_metadata(const std::unordered_map<std::string, std::string>& metadata) const {
  if (!config_.include_metadata || metadata.empty()) return {};
  std::map<std::string, std::string> ordered(metadata.begin(), metadata.end());
  std::string out = config_.metadata_prefix;
  for (auto it = ordered.begin(); it != ordered.end(); ++it) {
    if (it != ordered.begin()) out += ',';
    out += it->first + '=' + it->second;
  }
  return out + config_.metadata_suffix;
}

std::string UnifiedLogFormatter::format(const LogEntry& entry) const {
  const std::string& sep = config_.field_separator;
  std::string out = format_timestamp(entry.timestamp) + sep
                  + log_utils::log_level_to_string(entry.level) + sep
                  + entry.logger_name + sep + entry.message;
  if (config_.include_file_info && !entry.file.empty()) {
    out += sep + std::filesystem::path(entry.file).filename().string() + ':' + std::to_string(entry.line);
  }
  std::string md = format_metadata(entry.metadata);
  if (!md.empty()) out += sep + md;
  return out;
}

std::string UnifiedLogFormatter::format_json(const LogEntry& entry) const {
  std::ostringstream os;
  os << "{\"time\":\"" << format_timestamp(entry.timestamp) << '"'
     << ",\"level\":\"" << log_utils::log_level_to_string(entry.level) << '"'
     << ",\"logger\":\"" << escape_json(entry.logger_name) << '"'
     << ",\"msg\":\"" << escape_json(entry.message) << '"';
  if (!entry.metadata.empty()) {
    std::map<std::string, std::string> ordered(entry.metadata.begin(), entry.metadata.end());
    os << ",\"meta\":{";
    for (auto it = ordered.begin(); it != ordered.end(); ++it) {
      if (it != ordered.begin()) os << ',';
      os << '"' << escape_json(it->first) << "\":\"" << escape_json(it->second) << '"';
    }
    os << '}';
  }
  os << '}';
  return os.str();
}

// --- sinks ---

void ConsoleLogSink::write(const LogEntry& entry) {
  std::string line = formatter_->format(entry);
  std::lock_guard<std::mutex> lock(mutex_);
  if (use_colors_) {
    std::cerr << level_color(entry.level) << line << "\033[0m\n";
  } else {
    std::cerr << line << '\n';
  }
}

FileLogSink::FileLogSink(std::filesystem::path path, std::size_t max_file_size, std::size_t max_files)
  : path_(std::move(path)), max_file_size_(max_file_size), max_files_(max_files) {
  out_.open(path_, std::ios::app);
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (!ec) written_ = static_cast<std::size_t>(size);
}

FileLogSink::~FileLogSink() { close(); }

bool FileLogSink::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return out_.is_open();
}

void FileLogSink::write(const LogEntry& entry) {
  std::string line = formatter_->format(entry);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open()) return;
  out_ << line << '\n';
  written_ += line.size() + 1;
  if (max_file_size_ != 0 && written_ > max_file_size_) rotate();
}

void FileLogSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

void FileLogSink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) out_.close();
}

std::filesystem::path FileLogSink::rotated_path(std::size_t n) const {
  return std::filesystem::path(path_.string() + "." + std::to_string(n));
}

void FileLogSink::rotate() {
  out_.close();
  // ローテーションの失敗はログ出力を止める理由にしない
  std::error_code ec;
  if (max_files_ > 0) {
    std::filesystem::remove(rotated_path(max_files_), ec);
    for (std::size_t n = max_files_; n > 1; --n) {
      std::filesystem::rename(rotated_path(n - 1), rotated_path(n), ec);
    }
    std::filesystem::rename(path_, rotated_path(1), ec);
  }
  out_.open(path_, std::ios::trunc);
  written_ = 0;
}

// --- Logger ---

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
    sinks_.push_back(std::move(sink));
  }
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line, const char* function) {
  log_with_metadata(level, message, {}, file, line, function);
}

void Logger::log_with_metadata(LogLevel level, const std::string& message,
                               std::unordered_map<std::string, std::string> metadata,
                               const char* file, int line, const char* function) {
  if (!enabled(level)) return;
  LogEntry entry;
  entry.level = level;
  entry.logger_name = name_;
  entry.message = message;
  entry.timestamp = std::chrono::system_clock::now();
  entry.thread_id = current_thread_id();
  entry.file = file ? file : "";
  entry.line = line;
  entry.function = function ? function : "";
  entry.metadata = std::move(metadata);

  std::lock_guard<std::mutex> lock(sinks_mutex_);
  for (const auto& sink : sinks_) {
    if (level >= sink->min_level()) sink->write(entry);
  }
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  for (const auto& sink : sinks_) sink->flush();
}

// --- LogManager ---

LogManager& LogManager::instance() {
  static LogManager manager;
  return manager;
}

LogManager::~LogManager() { shutdown(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = loggers_[name];
  if (!slot) {
    slot = std::make_shared<Logger>(name);
    slot->set_level(global_level_);
    for (const auto& sink : global_sinks_) slot->add_sink(sink);
  }
  return slot;
}

void LogManager::clear_loggers() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
}

void LogManager::set_global_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  for (auto& entry : loggers_) entry.second->set_level(level);
}

LogLevel LogManager::global_level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : loggers_) entry.second->add_sink(sink);
  global_sinks_.push_back(std::move(sink));
}

void LogManager::clear_global_sinks() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : loggers_) {
    for (const auto& sink : global_sinks_) entry.second->remove_sink(sink);
  }
  for (const auto& sink : global_sinks_) sink->close();
  global_sinks_.clear();
}

void LogManager::flush_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : loggers_) entry.second->flush();
}

void LogManager::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : loggers_) entry.second->flush();
  for (const auto& sink : global_sinks_) sink->close();
}

// --- log_utils ---

namespace log_utils {

LogLevel parse_log_level(const std::string& text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "trace") return LogLevel::Trace;
  if (s == "debug") return LogLevel::Debug;
  if (s == "warn" || s == "warning") return LogLevel::Warning;
  if (s == "error") return LogLevel::Error;
  if (s == "critical" || s == "fatal") return LogLevel::Critical;
  if (s == "off" || s == "none") return LogLevel::Off;
  return LogLevel::Info;
}

std::string log_level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    case LogLevel::Critical: return "critical";
    case LogLevel::Off: return "off";
  }
  return "off";
}

std::shared_ptr<FileLogSink> create_rotating_file_sink(const std::filesystem::path& path,
                                                       std::size_t max_size, std::size_t max_files) {
  return std::make_shared<FileLogSink>(path, max_size, max_files);
}

void setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file) {
  auto& manager = LogManager::instance();
  manager.clear_global_sinks();
  manager.set_global_level(level);
  if (log_to_console) {
    manager.add_global_sink(std::make_shared<ConsoleLogSink>(!getenv_os("NO_COLOR").has_value()));
  }
  if (!log_file.empty()) {
    manager.add_global_sink(create_rotating_file_sink(log_file));
  }
}

} // namespace log_utils

} // namespace tnsprobe::utils
