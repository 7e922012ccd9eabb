#pragma once

#include "flagkit/transparent_string_hash.hpp"
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace flagkit {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4, NONE = 5 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = StringMap<std::string>;

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> parseLogLevel(std::string_view levelStr);

/**
 * Structure representing a single log entry with all necessary information
 * for processing and formatting by log handlers.
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level = LogLevel::INFO;
  std::string component;
  std::string message;
  LogContext context;

  LogEntry() = default;

  LogEntry(LogLevel lvl, const std::string &comp, const std::string &msg,
           const LogContext &ctx = {})
      : timestamp(std::chrono::system_clock::now()), level(lvl),
        component(comp), message(msg), context(ctx) {}
};

/**
 * Abstract base class for all log handlers.
 * Defines the interface for polymorphic log output destinations.
 */
class LogHandler {
public:
  virtual ~LogHandler() = default;

  /**
   * Process and output a log entry.
   * @param entry The log entry to handle
   */
  virtual void handle(const LogEntry &entry) = 0;

  /**
   * Get a unique identifier for this handler.
   * @return Handler identifier string
   */
  virtual std::string getId() const = 0;

  /**
   * Determine if this handler should process the given log entry.
   * @param entry The log entry to evaluate
   * @return true if the handler should process this entry
   */
  virtual bool shouldHandle(const LogEntry &entry) const = 0;

  virtual void flush() { /* No buffering by default */ }

  virtual void shutdown() { /* No cleanup needed by default */ }

protected:
  std::string formatTimestamp(
      const std::chrono::system_clock::time_point &timestamp) const;

  // Renders an entry as a single line without the trailing newline.
  std::string formatEntry(const LogEntry &entry, LogFormat format) const;
};

/**
 * Log handler that writes to stderr. Console output is the default sink and
 * is what the CLI uses.
 */
class ConsoleLogHandler : public LogHandler {
public:
  explicit ConsoleLogHandler(std::string id = "console",
                             LogFormat format = LogFormat::TEXT,
                             LogLevel minLevel = LogLevel::DEBUG);

  void handle(const LogEntry &entry) override;
  std::string getId() const override { return id_; }
  bool shouldHandle(const LogEntry &entry) const override;
  void flush() override;

private:
  std::string id_;
  LogFormat format_;
  LogLevel minLevel_;
  std::mutex outputMutex_;
};

/**
 * Log handler that appends to a file. The parent directory is created on
 * construction; if the file cannot be opened the handler drops entries.
 */
class FileLogHandler : public LogHandler {
public:
  FileLogHandler(std::string id, const std::string &filename,
                 LogFormat format = LogFormat::TEXT,
                 LogLevel minLevel = LogLevel::DEBUG);
  ~FileLogHandler() override;

  void handle(const LogEntry &entry) override;
  std::string getId() const override { return id_; }
  bool shouldHandle(const LogEntry &entry) const override;
  void flush() override;
  void shutdown() override;

  bool isOpen() const;
  const std::string &getFilename() const { return filename_; }

private:
  std::string id_;
  std::string filename_;
  LogFormat format_;
  LogLevel minLevel_;
  std::ofstream fileStream_;
  mutable std::mutex fileMutex_;
};

} // namespace flagkit
