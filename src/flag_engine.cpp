#include "flagkit/flag_engine.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/config_parser.hpp"
#include "flagkit/config_validator.hpp"
#include "flagkit/exceptions.hpp"

#include <chrono>

namespace flagkit {

FlagEngine::FlagEngine(FlagsConfig config, EngineOptions options)
    : options_(std::move(options)), evaluator_(options_.defaultHashSeed),
      store_(std::move(config)) {
  ENGINE_LOG_INFO("FlagEngine initialized with {} flags (strict: {})",
                  store_.snapshot()->size(), options_.strict);
}

std::unique_ptr<FlagEngine> FlagEngine::fromYaml(const std::string &yaml,
                                                 EngineOptions options) {
  return std::make_unique<FlagEngine>(ConfigParser::parseYaml(yaml),
                                      std::move(options));
}

std::unique_ptr<FlagEngine> FlagEngine::fromFile(const std::string &path,
                                                 EngineOptions options) {
  return std::make_unique<FlagEngine>(ConfigParser::parseFile(path),
                                      std::move(options));
}

EvaluationResult FlagEngine::evaluate(const std::string &flagName,
                                      const EvaluationContext &context) const {
  auto snapshot = store_.snapshot();
  const FlagConfig *flag = snapshot->find(flagName);

  if (flag == nullptr) {
    if (options_.strict) {
      throw FlagNotFoundException(flagName);
    }

    ENGINE_LOG_WARN("Flag \"{}\" not found, returning disabled", flagName);
    EvaluationResult result;
    result.flagName = flagName;
    result.enabled = false;
    result.reason = "Flag not found";
    result.metadata.timestamp = std::chrono::system_clock::now();
    return result;
  }

  return evaluator_.evaluate(flagName, *flag, context);
}

bool FlagEngine::isEnabled(const std::string &flagName,
                           const EvaluationContext &context) const {
  return evaluate(flagName, context).enabled;
}

std::vector<std::string> FlagEngine::getAllFlagNames() const {
  return store_.snapshot()->names();
}

std::optional<FlagConfig>
FlagEngine::getFlagConfig(std::string_view flagName) const {
  auto snapshot = store_.snapshot();
  if (const FlagConfig *flag = snapshot->find(flagName)) {
    return *flag;
  }
  return std::nullopt;
}

ConfigStore::Snapshot FlagEngine::getWholeConfig() const {
  return store_.snapshot();
}

void FlagEngine::replaceConfig(FlagsConfig newConfig) {
  const size_t flagCount = newConfig.size();
  store_.replace(std::move(newConfig));
  ENGINE_LOG_INFO("Configuration updated ({} flags)", flagCount);
}

uint64_t FlagEngine::getConfigVersion() const { return store_.version(); }

void FlagEngine::validate(const nlohmann::ordered_json &rawConfig) {
  ConfigValidator::validate(rawConfig);
}

} // namespace flagkit
