#include "flagkit/logger.hpp"
#include <algorithm>
#include <iostream>

namespace flagkit {

namespace {
constexpr const char *CONSOLE_HANDLER_ID = "console";
constexpr const char *FILE_HANDLER_ID = "file";
} // namespace

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() { installBuiltinHandlers(config_); }

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
  }
  installBuiltinHandlers(config);
}

void Logger::installBuiltinHandlers(const LogConfig &config) {
  std::vector<std::shared_ptr<LogHandler>> retired;
  {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto builtin = [](const std::shared_ptr<LogHandler> &handler) {
      auto id = handler->getId();
      return id == CONSOLE_HANDLER_ID || id == FILE_HANDLER_ID;
    };
    std::copy_if(handlers_.begin(), handlers_.end(),
                 std::back_inserter(retired), builtin);
    handlers_.erase(
        std::remove_if(handlers_.begin(), handlers_.end(), builtin),
        handlers_.end());

    if (config.consoleOutput) {
      handlers_.push_back(
          std::make_shared<ConsoleLogHandler>(CONSOLE_HANDLER_ID, config.format));
    }
    if (config.fileOutput) {
      auto fileHandler = std::make_shared<FileLogHandler>(
          FILE_HANDLER_ID, config.logFile, config.format);
      if (fileHandler->isOpen()) {
        handlers_.push_back(std::move(fileHandler));
      } else {
        std::cerr << "File logging disabled, cannot open: " << config.logFile
                  << '\n';
      }
    }
  }

  for (const auto &handler : retired) {
    handler->flush();
    handler->shutdown();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_.level;
}

void Logger::setLogFormat(LogFormat format) {
  LogConfig snapshot;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.format = format;
    snapshot = config_;
  }
  installBuiltinHandlers(snapshot);
}

void Logger::setComponentFilter(const StringSet &components) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.componentFilter = components;
}

void Logger::addHandler(std::shared_ptr<LogHandler> handler) {
  if (!handler) {
    return;
  }
  std::lock_guard<std::mutex> lock(handlersMutex_);
  handlers_.push_back(std::move(handler));
}

bool Logger::removeHandler(const std::string &handlerId) {
  std::lock_guard<std::mutex> lock(handlersMutex_);
  auto it = std::find_if(handlers_.begin(), handlers_.end(),
                         [&handlerId](const auto &handler) {
                           return handler->getId() == handlerId;
                         });
  if (it == handlers_.end()) {
    return false;
  }
  handlers_.erase(it);
  return true;
}

void Logger::clearHandlers() {
  std::lock_guard<std::mutex> lock(handlersMutex_);
  handlers_.clear();
}

size_t Logger::handlerCount() const {
  std::lock_guard<std::mutex> lock(handlersMutex_);
  return handlers_.size();
}

bool Logger::shouldLog(LogLevel level, std::string_view component) const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (config_.level == LogLevel::NONE || level < config_.level) {
    return false;
  }
  if (!config_.componentFilter.empty() &&
      config_.componentFilter.find(component) ==
          config_.componentFilter.end()) {
    return false;
  }
  return true;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  if (level == LogLevel::NONE || !shouldLog(level, component)) {
    return;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  std::vector<std::shared_ptr<LogHandler>> handlers;
  {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers = handlers_;
  }

  LogEntry entry(level, component, message, context);
  for (const auto &handler : handlers) {
    if (handler->shouldHandle(entry)) {
      handler->handle(entry);
    }
  }
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::resetMetrics() { metrics_ = LogMetrics(); }

void Logger::flush() {
  std::lock_guard<std::mutex> lock(handlersMutex_);
  for (const auto &handler : handlers_) {
    handler->flush();
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(handlersMutex_);
  for (const auto &handler : handlers_) {
    handler->flush();
    handler->shutdown();
  }
}

} // namespace flagkit
