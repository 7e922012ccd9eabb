#include "flagkit/log_handler.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace flagkit {

std::string logLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  case LogLevel::NONE:
    return "NONE";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view levelStr) {
  std::string upper(levelStr);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  if (upper == "NONE" || upper == "OFF")
    return LogLevel::NONE;
  return std::nullopt;
}

std::string LogHandler::formatTimestamp(
    const std::chrono::system_clock::time_point &timestamp) const {
  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) %
            1000;

  std::tm tm_buf{};
  localtime_r(&time_t, &tm_buf);

  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string LogHandler::formatEntry(const LogEntry &entry,
                                    LogFormat format) const {
  if (format == LogFormat::JSON) {
    nlohmann::json line = {{"timestamp", formatTimestamp(entry.timestamp)},
                           {"level", logLevelToString(entry.level)},
                           {"component", entry.component},
                           {"message", entry.message}};
    if (!entry.context.empty()) {
      nlohmann::json context = nlohmann::json::object();
      for (const auto &[key, value] : entry.context) {
        context[key] = value;
      }
      line["context"] = std::move(context);
    }
    return line.dump();
  }

  std::stringstream ss;
  ss << "[" << formatTimestamp(entry.timestamp) << "] "
     << "[" << std::left << std::setw(5) << logLevelToString(entry.level)
     << "] "
     << "[" << entry.component << "] " << entry.message;

  if (!entry.context.empty()) {
    ss << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        ss << ", ";
      ss << key << "=" << value;
      first = false;
    }
    ss << "}";
  }
  return ss.str();
}

// ConsoleLogHandler implementation
ConsoleLogHandler::ConsoleLogHandler(std::string id, LogFormat format,
                                     LogLevel minLevel)
    : id_(std::move(id)), format_(format), minLevel_(minLevel) {}

void ConsoleLogHandler::handle(const LogEntry &entry) {
  if (!shouldHandle(entry)) {
    return;
  }

  std::string line = formatEntry(entry, format_);
  std::lock_guard<std::mutex> lock(outputMutex_);
  std::cerr << line << '\n';
}

bool ConsoleLogHandler::shouldHandle(const LogEntry &entry) const {
  return entry.level >= minLevel_;
}

void ConsoleLogHandler::flush() {
  std::lock_guard<std::mutex> lock(outputMutex_);
  std::cerr.flush();
}

// FileLogHandler implementation
FileLogHandler::FileLogHandler(std::string id, const std::string &filename,
                               LogFormat format, LogLevel minLevel)
    : id_(std::move(id)), filename_(filename), format_(format),
      minLevel_(minLevel) {
  std::filesystem::path filePath(filename);
  if (filePath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(filePath.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory for " << filename << ": "
                << ec.message() << '\n';
    }
  }

  fileStream_.open(filename_, std::ios::app);
  if (!fileStream_.is_open()) {
    std::cerr << "Failed to open log file: " << filename_ << '\n';
  }
}

FileLogHandler::~FileLogHandler() { shutdown(); }

void FileLogHandler::handle(const LogEntry &entry) {
  if (!shouldHandle(entry)) {
    return;
  }

  std::string line = formatEntry(entry, format_);
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_ << line << '\n';
  }
}

bool FileLogHandler::shouldHandle(const LogEntry &entry) const {
  return entry.level >= minLevel_;
}

void FileLogHandler::flush() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void FileLogHandler::shutdown() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

bool FileLogHandler::isOpen() const {
  std::lock_guard<std::mutex> lock(fileMutex_);
  return fileStream_.is_open();
}

} // namespace flagkit
