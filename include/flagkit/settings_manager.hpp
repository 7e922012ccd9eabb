#pragma once

#include "flagkit/flag_client.hpp"
#include "flagkit/logger.hpp"
#include "flagkit/transparent_string_hash.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace flagkit {

/**
 * Process-wide settings loaded from a JSON file.
 *
 * Nested objects are flattened into dot-separated keys
 * ("logging.level", "client.fallbacks.new_checkout"); arrays are kept as
 * their JSON text. Typed getters fall back to the supplied default when a
 * key is missing or does not convert.
 */
class SettingsManager {
public:
  static constexpr const char *CONFIG_PATH_ENV = "FLAGKIT_CONFIG_PATH";

  static SettingsManager &getInstance();

  bool loadSettings(const std::string &settingsPath);
  bool loadFromString(const std::string &content);
  void clear();

  bool has(std::string_view key) const;
  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  StringSet getStringSet(const std::string &key) const;

  // Keys directly or indirectly below `prefix.`, in no particular order.
  std::vector<std::string> getKeysWithPrefix(std::string_view prefix) const;

  LogConfig getLoggingConfig() const;
  ClientOptions getClientOptions() const;

  nlohmann::json getJsonConfig() const;
  std::string getSettingsPath() const;

private:
  SettingsManager() = default;

  bool applyJson(const nlohmann::json &json);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);

  mutable std::mutex mutex_;
  StringMap<std::string> settings_;
  nlohmann::json rawSettings_;
  std::string settingsPath_;
};

} // namespace flagkit
