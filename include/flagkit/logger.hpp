#pragma once

#include "flagkit/log_handler.hpp"
#include "flagkit/transparent_string_hash.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flagkit {

struct LogConfig {
  LogLevel level = LogLevel::WARN;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/flagkit.log";
  StringSet componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()), startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

/**
 * Process-wide logger. Entries that pass the level and component filters are
 * fanned out to every registered LogHandler. With LogLevel::NONE, or with no
 * handlers registered, logging is a no-op.
 *
 * The built-in sinks use the handler ids "console" and "file"; configure()
 * replaces only those two and leaves handlers added by the application alone.
 */
class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void setLogFormat(LogFormat format);
  void setComponentFilter(const StringSet &components);

  // Handler management
  void addHandler(std::shared_ptr<LogHandler> handler);
  bool removeHandler(const std::string &handlerId);
  void clearHandlers();
  size_t handlerCount() const;

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  // True when an entry at this level from this component would be dispatched.
  bool shouldLog(LogLevel level, std::string_view component) const;

  LogMetrics getMetrics() const;
  void resetMetrics();

  // Control methods
  void flush();
  void shutdown();

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void installBuiltinHandlers(const LogConfig &config);

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::vector<std::shared_ptr<LogHandler>> handlers_;
  mutable std::mutex handlersMutex_;

  LogMetrics metrics_;
};

} // namespace flagkit

#define FLAGKIT_LOG_DEBUG(component, message, ...)                             \
  flagkit::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define FLAGKIT_LOG_INFO(component, message, ...)                              \
  flagkit::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define FLAGKIT_LOG_WARN(component, message, ...)                              \
  flagkit::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define FLAGKIT_LOG_ERROR(component, message, ...)                             \
  flagkit::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define FLAGKIT_LOG_FATAL(component, message, ...)                             \
  flagkit::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)
