#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace recon {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/** Parses "debug", "info", "warn", "error" or "fatal" (any case). */
std::optional<LogLevel> parseLogLevel(const std::string& value);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; correlation ids carry operation ids through the ledger.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted on destruction
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, int64_t value);
    LogBuilder& field(const std::string& key, uint64_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

    LogBuilder& correlation(const std::string& correlation_id);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const std::unordered_map<std::string, std::string>& fields = {});

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) recon::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) recon::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) recon::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) recon::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) recon::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  recon::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace recon

#endif  // LOGGER_HPP_
