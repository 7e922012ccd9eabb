#pragma once

#include "flagkit/logger.hpp"
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace flagkit {

// Forward declarations for component traits
template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class Bucketer> {
  static constexpr const char *name = "Bucketer";
};

template <> struct ComponentTrait<class RuleMatcher> {
  static constexpr const char *name = "RuleMatcher";
};

template <> struct ComponentTrait<class ConfigValidator> {
  static constexpr const char *name = "ConfigValidator";
};

template <> struct ComponentTrait<class Evaluator> {
  static constexpr const char *name = "Evaluator";
};

template <> struct ComponentTrait<class ConfigStore> {
  static constexpr const char *name = "ConfigStore";
};

template <> struct ComponentTrait<class FlagEngine> {
  static constexpr const char *name = "FlagEngine";
};

template <> struct ComponentTrait<class ConfigParser> {
  static constexpr const char *name = "ConfigParser";
};

template <> struct ComponentTrait<class ConfigEditor> {
  static constexpr const char *name = "ConfigEditor";
};

template <> struct ComponentTrait<class ConfigWatcher> {
  static constexpr const char *name = "ConfigWatcher";
};

template <> struct ComponentTrait<class FlagClient> {
  static constexpr const char *name = "FlagClient";
};

template <> struct ComponentTrait<class SettingsManager> {
  static constexpr const char *name = "SettingsManager";
};

/**
 * ComponentLogger - Template-based logging with compile-time component name
 * resolution via ComponentTrait.
 *
 * Messages accept "{}" placeholders that are filled from the trailing
 * arguments in order; structured fields go through the *WithContext calls.
 * Arguments are only formatted when the level and component pass the
 * logger's filters.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if (!getLogger().shouldLog(LogLevel::DEBUG, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().debug(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().debug(component_name, message);
    }
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    if (!getLogger().shouldLog(LogLevel::INFO, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().info(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().info(component_name, message);
    }
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    if (!getLogger().shouldLog(LogLevel::WARN, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().warn(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().warn(component_name, message);
    }
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    if (!getLogger().shouldLog(LogLevel::ERROR, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().error(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().error(component_name, message);
    }
  }

  static void debugWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().debug(component_name, message, context);
  }

  static void infoWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
      ss << (value ? "true" : "false");
    } else if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                         std::is_convertible_v<T, std::string_view>) {
      ss << std::forward<T>(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
      ss << static_cast<std::string>(std::forward<T>(value));
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using BucketerLogger = ComponentLogger<class Bucketer>;
using RuleMatcherLogger = ComponentLogger<class RuleMatcher>;
using ValidatorLogger = ComponentLogger<class ConfigValidator>;
using EvaluatorLogger = ComponentLogger<class Evaluator>;
using StoreLogger = ComponentLogger<class ConfigStore>;
using EngineLogger = ComponentLogger<class FlagEngine>;
using ParserLogger = ComponentLogger<class ConfigParser>;
using EditorLogger = ComponentLogger<class ConfigEditor>;
using WatcherLogger = ComponentLogger<class ConfigWatcher>;
using ClientLogger = ComponentLogger<class FlagClient>;
using SettingsLogger = ComponentLogger<class SettingsManager>;

} // namespace flagkit

#define COMPONENT_LOG_DEBUG(ComponentClass, message, ...)                      \
  flagkit::ComponentLogger<ComponentClass>::debug(message, ##__VA_ARGS__)
#define COMPONENT_LOG_INFO(ComponentClass, message, ...)                       \
  flagkit::ComponentLogger<ComponentClass>::info(message, ##__VA_ARGS__)
#define COMPONENT_LOG_WARN(ComponentClass, message, ...)                       \
  flagkit::ComponentLogger<ComponentClass>::warn(message, ##__VA_ARGS__)
#define COMPONENT_LOG_ERROR(ComponentClass, message, ...)                      \
  flagkit::ComponentLogger<ComponentClass>::error(message, ##__VA_ARGS__)

#define EVAL_LOG_DEBUG(message, ...)                                           \
  flagkit::EvaluatorLogger::debug(message, ##__VA_ARGS__)
#define EVAL_LOG_WARN(message, ...)                                            \
  flagkit::EvaluatorLogger::warn(message, ##__VA_ARGS__)

#define MATCH_LOG_DEBUG(message, ...)                                          \
  flagkit::RuleMatcherLogger::debug(message, ##__VA_ARGS__)
#define MATCH_LOG_WARN(message, ...)                                           \
  flagkit::RuleMatcherLogger::warn(message, ##__VA_ARGS__)
#define MATCH_LOG_ERROR(message, ...)                                          \
  flagkit::RuleMatcherLogger::error(message, ##__VA_ARGS__)

#define ENGINE_LOG_DEBUG(message, ...)                                         \
  flagkit::EngineLogger::debug(message, ##__VA_ARGS__)
#define ENGINE_LOG_INFO(message, ...)                                          \
  flagkit::EngineLogger::info(message, ##__VA_ARGS__)
#define ENGINE_LOG_WARN(message, ...)                                          \
  flagkit::EngineLogger::warn(message, ##__VA_ARGS__)

#define PARSER_LOG_DEBUG(message, ...)                                         \
  flagkit::ParserLogger::debug(message, ##__VA_ARGS__)
#define PARSER_LOG_INFO(message, ...)                                          \
  flagkit::ParserLogger::info(message, ##__VA_ARGS__)
#define PARSER_LOG_ERROR(message, ...)                                         \
  flagkit::ParserLogger::error(message, ##__VA_ARGS__)

#define EDITOR_LOG_INFO(message, ...)                                          \
  flagkit::EditorLogger::info(message, ##__VA_ARGS__)
#define EDITOR_LOG_ERROR(message, ...)                                         \
  flagkit::EditorLogger::error(message, ##__VA_ARGS__)

#define CLIENT_LOG_DEBUG(message, ...)                                         \
  flagkit::ClientLogger::debug(message, ##__VA_ARGS__)
#define CLIENT_LOG_INFO(message, ...)                                          \
  flagkit::ClientLogger::info(message, ##__VA_ARGS__)
#define CLIENT_LOG_WARN(message, ...)                                          \
  flagkit::ClientLogger::warn(message, ##__VA_ARGS__)
#define CLIENT_LOG_ERROR(message, ...)                                         \
  flagkit::ClientLogger::error(message, ##__VA_ARGS__)
