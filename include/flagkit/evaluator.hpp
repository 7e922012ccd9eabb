#pragma once

#include "flagkit/flag_types.hpp"
#include <optional>
#include <string>

namespace flagkit {

/**
 * Applies the decision chain for a single flag:
 *   1. environment override
 *   2. global kill switch
 *   3. first matching targeting rule
 *   4. percentage rollout
 *   5. enabled for everyone
 * The first step that produces a decision wins.
 */
class Evaluator {
public:
  explicit Evaluator(std::optional<std::string> defaultSeed = std::nullopt);

  EvaluationResult evaluate(const std::string &flagName,
                            const FlagConfig &config,
                            const EvaluationContext &context) const;

  // Seed for rollouts where neither the rule nor the context sets one.
  const std::optional<std::string> &getDefaultSeed() const {
    return defaultSeed_;
  }

private:
  struct Decision {
    bool enabled = false;
    std::string reason;
    std::optional<size_t> matchedRuleIndex;
    std::optional<int> rolloutBucket;
  };

  std::optional<Decision>
  evaluateEnvironment(const std::string &flagName, const FlagConfig &config,
                      const EvaluationContext &context) const;
  std::optional<Decision>
  evaluateTargeting(const std::string &flagName, const FlagConfig &config,
                    const EvaluationContext &context) const;
  std::optional<Decision>
  evaluateRollout(const std::string &flagName, const FlagConfig &config,
                  const EvaluationContext &context) const;

  std::optional<std::string> defaultSeed_;
};

} // namespace flagkit
