#include "flagkit/settings_manager.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/string_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace flagkit {

SettingsManager &SettingsManager::getInstance() {
  static SettingsManager instance;
  return instance;
}

bool SettingsManager::loadSettings(const std::string &settingsPath) {
  SettingsLogger::info("Loading settings from: {}", settingsPath);

  std::ifstream file(settingsPath);
  if (!file.is_open()) {
    SettingsLogger::error("Cannot open settings file: {}", settingsPath);
    return false;
  }

  try {
    nlohmann::json json;
    file >> json;
    if (!applyJson(json)) {
      return false;
    }
  } catch (const nlohmann::json::exception &e) {
    SettingsLogger::error("Failed to parse settings file {}: {}", settingsPath,
                          e.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  settingsPath_ = settingsPath;
  SettingsLogger::info("Settings loaded with {} parameters", settings_.size());
  return true;
}

bool SettingsManager::loadFromString(const std::string &content) {
  try {
    return applyJson(nlohmann::json::parse(content));
  } catch (const nlohmann::json::exception &e) {
    SettingsLogger::error("Failed to parse settings: {}", e.what());
    return false;
  }
}

bool SettingsManager::applyJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    SettingsLogger::error("Settings root must be a JSON object");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  settings_.clear();
  settingsPath_.clear();
  rawSettings_ = json;
  flattenJson(json, "", 0, 32);
  return true;
}

void SettingsManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  settings_.clear();
  rawSettings_ = nlohmann::json();
  settingsPath_.clear();
}

void SettingsManager::flattenJson(const nlohmann::json &json,
                                  const std::string &prefix, int currentDepth,
                                  int maxDepth) {
  if (currentDepth >= maxDepth) {
    settings_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      settings_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      settings_[key] = std::to_string(it->get<long long>());
    } else if (it->is_number_float()) {
      settings_[key] = string_utils::format_number(it->get<double>());
    } else if (it->is_boolean()) {
      settings_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays and null keep their JSON text.
      settings_[key] = it->dump();
    }
  }
}

bool SettingsManager::has(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_.find(key) != settings_.end();
}

std::string SettingsManager::getString(const std::string &key,
                                       const std::string &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = settings_.find(key); it != settings_.end()) {
    return it->second;
  }
  return defaultValue;
}

int SettingsManager::getInt(const std::string &key, int defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = settings_.find(key); it != settings_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool SettingsManager::getBool(const std::string &key, bool defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = settings_.find(key); it != settings_.end()) {
    std::string value = string_utils::to_lower(string_utils::trim(it->second));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
      return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
      return false;
    }
  }
  return defaultValue;
}

double SettingsManager::getDouble(const std::string &key,
                                  double defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = settings_.find(key); it != settings_.end()) {
    return string_utils::parse_double(it->second).value_or(defaultValue);
  }
  return defaultValue;
}

StringSet SettingsManager::getStringSet(const std::string &key) const {
  StringSet result;
  const std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    try {
      auto array = nlohmann::json::parse(raw);
      if (array.is_array()) {
        for (const auto &value : array) {
          if (value.is_string()) {
            result.insert(value.get<std::string>());
          }
        }
        return result;
      }
    } catch (const nlohmann::json::exception &) {
      SettingsLogger::warn("Setting {} is not a JSON array, reading as CSV",
                           key);
    }
  }

  for (const auto &item : string_utils::split(raw, ',')) {
    auto trimmed = string_utils::trim(item);
    if (!trimmed.empty()) {
      result.emplace(trimmed);
    }
  }
  return result;
}

std::vector<std::string>
SettingsManager::getKeysWithPrefix(std::string_view prefix) const {
  std::string scoped = std::string(prefix) + ".";
  std::vector<std::string> keys;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[key, value] : settings_) {
    if (key.size() > scoped.size() && key.compare(0, scoped.size(), scoped) == 0) {
      keys.push_back(key);
    }
  }
  return keys;
}

LogConfig SettingsManager::getLoggingConfig() const {
  LogConfig config;

  config.level =
      parseLogLevel(getString("logging.level", "WARN")).value_or(LogLevel::WARN);
  config.format = string_utils::iequals(getString("logging.format", "TEXT"),
                                        "JSON")
                      ? LogFormat::JSON
                      : LogFormat::TEXT;
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/flagkit.log");
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

ClientOptions SettingsManager::getClientOptions() const {
  ClientOptions options;

  if (const char *envPath = std::getenv(CONFIG_PATH_ENV);
      envPath != nullptr && *envPath != '\0') {
    options.configPath = envPath;
  } else if (has("client.config_path")) {
    options.configPath = getString("client.config_path");
  }

  options.strict = getBool("client.strict", false);
  options.throwOnError = getBool("client.throw_on_error", false);
  options.autoReload = getBool("client.auto_reload", true);
  options.pollInterval =
      std::chrono::milliseconds(getInt("client.poll_interval_ms", 500));
  options.debounce = std::chrono::milliseconds(getInt("client.debounce_ms", 100));

  if (has("engine.default_hash_seed")) {
    options.defaultHashSeed = getString("engine.default_hash_seed");
  }

  const std::string fallbackPrefix = "client.fallbacks.";
  for (const auto &key : getKeysWithPrefix("client.fallbacks")) {
    options.fallbacks[key.substr(fallbackPrefix.size())] = getBool(key, false);
  }

  auto &context = options.defaultContext;
  if (has("client.default_context.user_id")) {
    context.userId = getString("client.default_context.user_id");
  }
  if (has("client.default_context.email")) {
    context.email = getString("client.default_context.email");
  }
  if (has("client.default_context.environment")) {
    context.environment = getString("client.default_context.environment");
  }

  // Attributes are read from the raw tree so numbers and booleans keep
  // their type.
  nlohmann::json raw = getJsonConfig();
  const auto pointer =
      nlohmann::json::json_pointer("/client/default_context/attributes");
  if (raw.contains(pointer) && raw.at(pointer).is_object()) {
    for (const auto &[name, value] : raw.at(pointer).items()) {
      if (value.is_string()) {
        context.customAttributes[name] = value.get<std::string>();
      } else if (value.is_boolean()) {
        context.customAttributes[name] = value.get<bool>();
      } else if (value.is_number()) {
        context.customAttributes[name] = value.get<double>();
      } else {
        SettingsLogger::warn("Ignoring non-scalar default attribute '{}'",
                             name);
      }
    }
  }

  return options;
}

nlohmann::json SettingsManager::getJsonConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rawSettings_;
}

std::string SettingsManager::getSettingsPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settingsPath_;
}

} // namespace flagkit
