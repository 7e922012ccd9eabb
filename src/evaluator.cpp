#include "flagkit/evaluator.hpp"
#include "flagkit/bucketer.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/rule_matcher.hpp"
#include "flagkit/string_utils.hpp"

#include <chrono>

namespace flagkit {

namespace {

bool hasText(const std::optional<std::string> &value) {
  return value && !value->empty();
}

} // namespace

Evaluator::Evaluator(std::optional<std::string> defaultSeed)
    : defaultSeed_(std::move(defaultSeed)) {}

EvaluationResult Evaluator::evaluate(const std::string &flagName,
                                     const FlagConfig &config,
                                     const EvaluationContext &context) const {
  const auto startTime = std::chrono::system_clock::now();
  EVAL_LOG_DEBUG("Evaluating flag \"{}\"", flagName);

  auto decide = [&]() -> Decision {
    if (auto decision = evaluateEnvironment(flagName, config, context)) {
      return *decision;
    }
    if (!config.enabled) {
      return Decision{false, "Flag is disabled globally", std::nullopt,
                      std::nullopt};
    }
    if (auto decision = evaluateTargeting(flagName, config, context)) {
      return *decision;
    }
    if (auto decision = evaluateRollout(flagName, config, context)) {
      return *decision;
    }
    return Decision{true, "Flag is enabled for all users", std::nullopt,
                    std::nullopt};
  };

  Decision decision = decide();

  EvaluationResult result;
  result.flagName = flagName;
  result.enabled = decision.enabled;
  result.reason = std::move(decision.reason);
  result.metadata.timestamp = startTime;
  result.metadata.matchedRuleIndex = decision.matchedRuleIndex;
  result.metadata.rolloutBucket = decision.rolloutBucket;

  EVAL_LOG_DEBUG("Flag \"{}\" evaluated to {}: {}", flagName, result.enabled,
                 result.reason);
  return result;
}

std::optional<Evaluator::Decision>
Evaluator::evaluateEnvironment(const std::string &flagName,
                               const FlagConfig &config,
                               const EvaluationContext &context) const {
  if (config.environments.empty() || !context.environment) {
    return std::nullopt;
  }

  auto it = config.environments.find(*context.environment);
  if (it == config.environments.end()) {
    return std::nullopt;
  }

  EVAL_LOG_DEBUG("Flag \"{}\" environment override: {} = {}", flagName,
                 *context.environment, it->second);
  return Decision{it->second, "Environment override: " + *context.environment,
                  std::nullopt, std::nullopt};
}

std::optional<Evaluator::Decision>
Evaluator::evaluateTargeting(const std::string &flagName,
                             const FlagConfig &config,
                             const EvaluationContext &context) const {
  for (size_t i = 0; i < config.targeting.size(); ++i) {
    const auto &rule = config.targeting[i];
    if (!RuleMatcher::matches(rule, context)) {
      continue;
    }

    EVAL_LOG_DEBUG("Flag \"{}\" matched targeting rule #{}", flagName, i + 1);
    std::string reason = "Matched targeting rule #" + std::to_string(i + 1);
    if (hasText(rule.description)) {
      reason += ": " + *rule.description;
    }
    return Decision{rule.enabled, std::move(reason), i, std::nullopt};
  }
  return std::nullopt;
}

std::optional<Evaluator::Decision>
Evaluator::evaluateRollout(const std::string &flagName,
                           const FlagConfig &config,
                           const EvaluationContext &context) const {
  if (!config.rollout) {
    return std::nullopt;
  }

  const auto &rollout = *config.rollout;
  std::string identifier = hasText(context.userId)  ? *context.userId
                           : hasText(context.email) ? *context.email
                                                    : "anonymous";

  std::optional<std::string> seed;
  if (hasText(rollout.seed)) {
    seed = rollout.seed;
  } else if (hasText(context.hashSeedOverride)) {
    seed = context.hashSeedOverride;
  } else {
    seed = defaultSeed_;
  }

  const int bucket = Bucketer::bucket(flagName, identifier, seed);
  const bool inRollout = bucket < rollout.percentage;

  EVAL_LOG_DEBUG("Flag \"{}\" rollout {}%: bucket {} for '{}' -> {}", flagName,
                 rollout.percentage, bucket, identifier, inRollout);

  return Decision{inRollout,
                  "Rollout " + string_utils::format_number(rollout.percentage) +
                      "% (user bucket: " + std::to_string(bucket) + ")",
                  std::nullopt, bucket};
}

} // namespace flagkit
