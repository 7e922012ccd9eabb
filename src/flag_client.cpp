#include "flagkit/flag_client.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/config_parser.hpp"
#include "flagkit/config_watcher.hpp"
#include "flagkit/exceptions.hpp"
#include "flagkit/flag_engine.hpp"

#include <system_error>

namespace flagkit {

FlagClient::FlagClient(ClientOptions options) : options_(std::move(options)) {
  try {
    std::string configPath =
        ConfigParser::findConfigPath(options_.configPath, options_.baseDir);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_.configPath = configPath;
    }

    loadConfig();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_.initialized = true;
    }

    if (options_.autoReload) {
      startWatcher();
    }

    CLIENT_LOG_INFO("FlagClient initialized from {} (autoReload: {}, "
                    "strict: {})",
                    configPath, options_.autoReload, options_.strict);
  } catch (const std::exception &e) {
    handleError(e);
    if (options_.throwOnError) {
      throw;
    }
  }
}

FlagClient::~FlagClient() { shutdown(); }

void FlagClient::loadConfig() {
  std::string configPath;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configPath = state_.configPath;
  }

  CLIENT_LOG_DEBUG("Loading config from: {}", configPath);
  FlagsConfig config = ConfigParser::parseFile(configPath);

  // Unknown flags are resolved here, so the engine always runs strict.
  EngineOptions engineOptions;
  engineOptions.strict = true;
  engineOptions.defaultHashSeed = options_.defaultHashSeed;
  auto engine = std::make_shared<FlagEngine>(std::move(config), engineOptions);

  std::lock_guard<std::mutex> lock(mutex_);
  engine_ = std::move(engine);
  state_.lastLoadTime = std::chrono::system_clock::now();
  state_.errorCount = 0;
}

void FlagClient::reloadConfig() {
  try {
    std::string configPath;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutDown_) {
        CLIENT_LOG_DEBUG("Reload ignored, FlagClient is shut down");
        return;
      }
      configPath = state_.configPath;
    }
    if (configPath.empty()) {
      configPath =
          ConfigParser::findConfigPath(options_.configPath, options_.baseDir);
      std::lock_guard<std::mutex> lock(mutex_);
      state_.configPath = configPath;
    }

    FlagsConfig config = ConfigParser::parseFile(configPath);

    auto engine = currentEngine();
    const bool recovered = engine == nullptr;
    if (engine) {
      engine->replaceConfig(config);
    } else {
      EngineOptions engineOptions;
      engineOptions.strict = true;
      engineOptions.defaultHashSeed = options_.defaultHashSeed;
      engine = std::make_shared<FlagEngine>(config, engineOptions);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutDown_) {
        return;
      }
      engine_ = engine;
      state_.initialized = true;
      state_.lastLoadTime = std::chrono::system_clock::now();
      state_.errorCount = 0;
    }

    if (recovered && options_.autoReload) {
      startWatcher();
    }

    if (options_.onConfigUpdate) {
      options_.onConfigUpdate(config);
    }
    CLIENT_LOG_INFO("Config reloaded successfully ({} flags)", config.size());
  } catch (const std::exception &e) {
    handleError(e);
    if (options_.throwOnError) {
      throw;
    }
  }
}

void FlagClient::startWatcher() {
  std::string configPath;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configPath = state_.configPath;
  }

  WatcherOptions watcherOptions;
  watcherOptions.pollInterval = options_.pollInterval;
  watcherOptions.debounce = options_.debounce;

  std::lock_guard<std::mutex> lock(mutex_);
  if (shutDown_ || watcher_) {
    return;
  }
  try {
    auto watcher = std::make_unique<ConfigWatcher>(
        [this](const std::string &) { reloadConfig(); }, watcherOptions);
    watcher->start(configPath);
    watcher_ = std::move(watcher);
  } catch (const std::system_error &e) {
    CLIENT_LOG_WARN("Failed to set up file watcher, auto-reload disabled: {}",
                    e.what());
  }
}

void FlagClient::handleError(const std::exception &error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.errorCount;
  }

  if (const auto *flagError = asException<FlagKitException>(error)) {
    CLIENT_LOG_ERROR("FlagClient error: {}", flagError->toLogString());
  } else {
    CLIENT_LOG_ERROR("FlagClient error: {}", error.what());
  }

  if (options_.onError) {
    options_.onError(error);
  }
}

bool FlagClient::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.initialized && engine_ != nullptr;
}

ClientState FlagClient::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::shared_ptr<FlagEngine> FlagClient::currentEngine() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.initialized ? engine_ : nullptr;
}

bool FlagClient::fallbackFor(const std::string &flagName) const {
  auto it = options_.fallbacks.find(flagName);
  return it != options_.fallbacks.end() && it->second;
}

EvaluationResult FlagClient::fallbackResult(const std::string &flagName,
                                            std::string reason) const {
  EvaluationResult result;
  result.flagName = flagName;
  result.enabled = fallbackFor(flagName);
  result.reason = std::move(reason);
  result.metadata.timestamp = std::chrono::system_clock::now();
  return result;
}

EvaluationContext
FlagClient::mergeContext(const EvaluationContext &context) const {
  EvaluationContext merged = options_.defaultContext;
  if (context.userId) {
    merged.userId = context.userId;
  }
  if (context.email) {
    merged.email = context.email;
  }
  if (context.environment) {
    merged.environment = context.environment;
  }
  if (context.hashSeedOverride) {
    merged.hashSeedOverride = context.hashSeedOverride;
  }
  for (const auto &[name, value] : context.customAttributes) {
    merged.customAttributes.insert_or_assign(name, value);
  }
  return merged;
}

EvaluationResult FlagClient::evaluate(const std::string &flagName,
                                      const EvaluationContext &context) {
  auto engine = currentEngine();
  if (!engine) {
    return fallbackResult(flagName, "Client not initialized, using fallback");
  }

  const EvaluationContext merged = mergeContext(context);

  try {
    EvaluationResult result = engine->evaluate(flagName, merged);

    if (options_.onFlagEvaluated) {
      try {
        options_.onFlagEvaluated(result, merged);
      } catch (const std::exception &e) {
        CLIENT_LOG_ERROR("Error in onFlagEvaluated callback: {}", e.what());
      }
    }
    return result;
  } catch (const FlagNotFoundException &e) {
    if (!options_.strict) {
      CLIENT_LOG_WARN("Flag \"{}\" not found, using fallback: {}", flagName,
                      fallbackFor(flagName));
      return fallbackResult(flagName, "Flag not found, using fallback");
    }
    handleError(e);
    if (options_.throwOnError) {
      throw;
    }
    return fallbackResult(flagName,
                          std::string("Error evaluating flag: ") + e.what());
  } catch (const std::exception &e) {
    handleError(e);
    if (options_.throwOnError) {
      throw;
    }
    return fallbackResult(flagName,
                          std::string("Error evaluating flag: ") + e.what());
  }
}

bool FlagClient::isEnabled(const std::string &flagName,
                           const EvaluationContext &context) {
  return evaluate(flagName, context).enabled;
}

std::vector<std::string> FlagClient::getAllFlagNames() const {
  auto engine = currentEngine();
  return engine ? engine->getAllFlagNames() : std::vector<std::string>{};
}

std::optional<FlagConfig>
FlagClient::getFlagConfig(std::string_view flagName) const {
  auto engine = currentEngine();
  if (!engine) {
    return std::nullopt;
  }
  return engine->getFlagConfig(flagName);
}

ConfigStore::Snapshot FlagClient::getWholeConfig() const {
  auto engine = currentEngine();
  return engine ? engine->getWholeConfig()
                : std::make_shared<const FlagsConfig>();
}

void FlagClient::reload() {
  CLIENT_LOG_INFO("Manual config reload triggered");
  reloadConfig();
}

void FlagClient::shutdown() {
  std::unique_ptr<ConfigWatcher> watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutDown_) {
      return;
    }
    shutDown_ = true;
    watcher = std::move(watcher_);
    engine_.reset();
    state_.initialized = false;
  }

  // Joined outside the lock: a reload in flight on the watcher thread needs it.
  if (watcher) {
    watcher->stop();
  }
  CLIENT_LOG_INFO("FlagClient shut down");
}

} // namespace flagkit
