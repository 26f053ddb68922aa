#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace recon {
namespace observability {

namespace {

std::string quoted(const std::string& value) {
  return nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::optional<LogLevel> parseLogLevel(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "info") return LogLevel::INFO;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  if (lower == "fatal") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::cout) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::DEBUG, message, component, correlation_id);
}

void Logger::info(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::INFO, message, component, correlation_id);
}

void Logger::warn(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::WARN, message, component, correlation_id);
}

void Logger::error(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::ERROR, message, component, correlation_id);
}

void Logger::fatal(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::FATAL, message, component, correlation_id);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component,
                               const std::string& correlation_id)
    : level_(level), message_(message), component_(component),
      correlation_id_(correlation_id) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, correlation_id_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = quoted(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  return field(key, std::string(value ? value : ""));
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = std::to_string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int64_t value) {
  fields_[key] = std::to_string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, uint64_t value) {
  fields_[key] = std::to_string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(6) << value;
  fields_[key] = ss.str();
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value ? "true" : "false";
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::correlation(const std::string& correlation_id) {
  correlation_id_ = correlation_id;
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const std::string& correlation_id,
                 const std::unordered_map<std::string, std::string>& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  std::stringstream ss;
  ss << "{";
  ss << "\"timestamp\":\"" << getCurrentTimestamp() << "\",";
  ss << "\"level\":\"" << levelToString(level) << "\",";
  ss << "\"thread\":\"" << getThreadId() << "\",";
  ss << "\"message\":" << quoted(message);

  if (!component.empty()) {
    ss << ",\"component\":" << quoted(component);
  }

  if (!correlation_id.empty()) {
    ss << ",\"correlation_id\":" << quoted(correlation_id);
  }

  for (const auto& [key, value] : fields) {
    ss << "," << quoted(key) << ":" << value;
  }

  ss << "}\n";

  *output_stream_ << ss.str();
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace recon
