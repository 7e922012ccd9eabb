#pragma once

#include "flagkit/config_store.hpp"
#include "flagkit/evaluator.hpp"
#include "flagkit/flag_types.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flagkit {

struct EngineOptions {
  // Unknown flags throw FlagNotFoundException instead of evaluating to off.
  bool strict = false;
  // Rollout seed used when neither the rule nor the context provides one.
  std::optional<std::string> defaultHashSeed;
};

/**
 * Entry point for flag evaluation. Owns the active config snapshot and
 * evaluates against exactly one snapshot per call, so evaluations running
 * concurrently with replaceConfig() stay consistent.
 */
class FlagEngine {
public:
  explicit FlagEngine(FlagsConfig config, EngineOptions options = {});

  FlagEngine(const FlagEngine &) = delete;
  FlagEngine &operator=(const FlagEngine &) = delete;

  static std::unique_ptr<FlagEngine> fromYaml(const std::string &yaml,
                                              EngineOptions options = {});
  static std::unique_ptr<FlagEngine> fromFile(const std::string &path,
                                              EngineOptions options = {});

  EvaluationResult evaluate(const std::string &flagName,
                            const EvaluationContext &context = {}) const;
  bool isEnabled(const std::string &flagName,
                 const EvaluationContext &context = {}) const;

  // Flag names in config order.
  std::vector<std::string> getAllFlagNames() const;
  std::optional<FlagConfig> getFlagConfig(std::string_view flagName) const;
  ConfigStore::Snapshot getWholeConfig() const;

  // Publishes a new config. The caller is expected to have validated it.
  void replaceConfig(FlagsConfig newConfig);
  uint64_t getConfigVersion() const;

  bool isStrict() const { return options_.strict; }

  // Throws ValidationException on the first structural problem.
  static void validate(const nlohmann::ordered_json &rawConfig);

private:
  EngineOptions options_;
  Evaluator evaluator_;
  ConfigStore store_;
};

} // namespace flagkit
