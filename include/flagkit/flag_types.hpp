#pragma once

#include "flagkit/transparent_string_hash.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flagkit {

// ============================================================================
// Targeting operators
// ============================================================================

enum class TargetingOperator {
  EQUALS,
  NOT_EQUALS,
  IN,
  NOT_IN,
  CONTAINS,
  NOT_CONTAINS,
  STARTS_WITH,
  ENDS_WITH,
  GREATER_THAN,
  LESS_THAN,
  GREATER_THAN_OR_EQUAL,
  LESS_THAN_OR_EQUAL,
  MATCHES_REGEX
};

// Wire names, indexed by the enumerator's underlying value.
inline constexpr std::array<std::string_view, 13> TARGETING_OPERATOR_NAMES = {
    "equals",       "not_equals",   "in",
    "not_in",       "contains",     "not_contains",
    "starts_with",  "ends_with",    "greater_than",
    "less_than",    "greater_than_or_equal", "less_than_or_equal",
    "matches_regex"};

std::optional<TargetingOperator> operatorFromString(std::string_view name);
std::string_view toString(TargetingOperator op);

// in / not_in take a `values` list; every other operator takes `value`.
bool requiresValueList(TargetingOperator op) noexcept;

// ============================================================================
// Scalar values
// ============================================================================

/**
 * Rule operands and custom attributes are String | Number | Bool. Numbers are
 * always held as double, so 5 and 5.0 compare equal.
 */
using ScalarValue = std::variant<std::string, double, bool>;

std::string scalarToString(const ScalarValue &value);

// Booleans coerce to 1/0, strings must be a complete decimal number (an
// empty or blank string is 0). Returns nullopt when coercion fails.
std::optional<double> scalarToNumber(const ScalarValue &value);

// Strict equality: same alternative and same value.
bool scalarEquals(const ScalarValue &lhs, const ScalarValue &rhs) noexcept;

nlohmann::ordered_json scalarToJson(const ScalarValue &value);
std::optional<ScalarValue> scalarFromJson(const nlohmann::ordered_json &json);

// ============================================================================
// Flag configuration model
// ============================================================================

struct RolloutRule {
  double percentage = 0.0;
  std::optional<std::string> seed;

  nlohmann::ordered_json toJson() const;
};

struct TargetingRule {
  std::string attribute;
  TargetingOperator op = TargetingOperator::EQUALS;
  bool enabled = false;
  std::optional<ScalarValue> value;
  std::vector<ScalarValue> values;
  std::optional<std::string> description;

  nlohmann::ordered_json toJson() const;
};

struct FlagConfig {
  bool enabled = false;
  std::optional<std::string> description;
  std::optional<RolloutRule> rollout;
  std::vector<TargetingRule> targeting;
  std::map<std::string, bool> environments;
  nlohmann::ordered_json metadata; // null or an object; never read by the evaluator

  nlohmann::ordered_json toJson() const;

  // Decodes a flag body that has already passed ConfigValidator.
  static FlagConfig fromJson(const nlohmann::ordered_json &json);
};

/**
 * Flag name to configuration. Lookup is by name; iteration over names()
 * follows insertion order.
 */
class FlagsConfig {
public:
  FlagsConfig() = default;

  // Decodes a whole config tree that has already passed ConfigValidator.
  static FlagsConfig fromJson(const nlohmann::ordered_json &json);

  // Adds a flag, or replaces it in place when the name already exists.
  void insert(const std::string &name, FlagConfig config);
  // Returns false when no flag has this name.
  bool erase(std::string_view name);

  const FlagConfig *find(std::string_view name) const;
  bool contains(std::string_view name) const { return find(name) != nullptr; }

  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }
  const std::vector<std::string> &names() const { return order_; }

  nlohmann::ordered_json toJson() const;

private:
  std::vector<std::string> order_;
  StringMap<FlagConfig> flags_;
};

// ============================================================================
// Evaluation input and output
// ============================================================================

struct EvaluationContext {
  std::optional<std::string> userId;
  std::optional<std::string> email;
  std::optional<std::string> environment;
  StringMap<ScalarValue> customAttributes;
  // Seed used for rollouts whose rule has no seed of its own. Test hook.
  std::optional<std::string> hashSeedOverride;
};

struct EvaluationMetadata {
  std::chrono::system_clock::time_point timestamp;
  std::optional<size_t> matchedRuleIndex; // 0-based
  std::optional<int> rolloutBucket;       // 0-99
  std::optional<std::string> variant;     // reserved

  nlohmann::ordered_json toJson() const;
};

struct EvaluationResult {
  std::string flagName;
  bool enabled = false;
  std::string reason;
  EvaluationMetadata metadata;

  nlohmann::ordered_json toJson() const;
};

} // namespace flagkit
