#pragma once

#include "flagkit/config_store.hpp"
#include "flagkit/flag_types.hpp"
#include "flagkit/transparent_string_hash.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flagkit {

class ConfigWatcher;
class FlagEngine;

struct ClientOptions {
  // Explicit config file; the default locations are searched when unset.
  std::optional<std::string> configPath;
  // Directory the default locations are resolved against (cwd when empty).
  std::filesystem::path baseDir;
  bool autoReload = true;
  bool strict = false;
  bool throwOnError = false;

  // Values returned when a flag cannot be evaluated; missing entries are off.
  StringMap<bool> fallbacks;
  EvaluationContext defaultContext;
  std::optional<std::string> defaultHashSeed;

  std::chrono::milliseconds pollInterval{500};
  std::chrono::milliseconds debounce{100};

  std::function<void(const std::exception &)> onError;
  std::function<void(const FlagsConfig &)> onConfigUpdate;
  std::function<void(const EvaluationResult &, const EvaluationContext &)>
      onFlagEvaluated;
};

struct ClientState {
  bool initialized = false;
  std::string configPath;
  std::optional<std::chrono::system_clock::time_point> lastLoadTime;
  uint64_t errorCount = 0;
};

/**
 * Application-facing wrapper around FlagEngine.
 *
 * Loads the config file on construction, optionally reloads it when the
 * file changes, and never lets an evaluation failure escape unless
 * throwOnError is set: unknown flags and errors resolve to the configured
 * fallback value with an explanatory reason.
 */
class FlagClient {
public:
  explicit FlagClient(ClientOptions options = {});
  ~FlagClient();

  FlagClient(const FlagClient &) = delete;
  FlagClient &operator=(const FlagClient &) = delete;

  bool isInitialized() const;
  ClientState getState() const;

  EvaluationResult evaluate(const std::string &flagName,
                            const EvaluationContext &context = {});
  bool isEnabled(const std::string &flagName,
                 const EvaluationContext &context = {});

  std::vector<std::string> getAllFlagNames() const;
  std::optional<FlagConfig> getFlagConfig(std::string_view flagName) const;
  ConfigStore::Snapshot getWholeConfig() const;

  // Re-reads the config file. On failure the previous config stays active.
  // Does nothing once the client is shut down.
  void reload();

  // Stops watching and releases the engine; evaluations fall back afterwards.
  // Final: the client cannot be reloaded back to life.
  void shutdown();

private:
  void loadConfig();
  void reloadConfig();
  void startWatcher();
  void handleError(const std::exception &error);

  std::shared_ptr<FlagEngine> currentEngine() const;
  EvaluationContext mergeContext(const EvaluationContext &context) const;
  EvaluationResult fallbackResult(const std::string &flagName,
                                  std::string reason) const;
  bool fallbackFor(const std::string &flagName) const;

  ClientOptions options_;

  // Guards engine_, state_, watcher_ and shutDown_.
  mutable std::mutex mutex_;
  std::shared_ptr<FlagEngine> engine_;
  ClientState state_;
  std::unique_ptr<ConfigWatcher> watcher_;
  bool shutDown_ = false;
};

} // namespace flagkit
