#pragma once

#include "flagkit/flag_types.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace flagkit {

/**
 * Decides whether one targeting rule applies to an evaluation context.
 *
 * A bad regex, a failed numeric coercion or any other matching failure is
 * logged and reported as "no match". Only allocation failure propagates.
 */
class RuleMatcher {
public:
  // libstdc++ regex matching recurses per input character, so longer
  // attribute values are refused instead of being searched.
  static constexpr std::size_t MAX_REGEX_INPUT_LENGTH = 4096;

  static bool matches(const TargetingRule &rule,
                      const EvaluationContext &context);

  // userId, email and environment map to the fixed context fields; any other
  // name is looked up in customAttributes.
  static std::optional<ScalarValue>
  resolveAttribute(std::string_view attribute,
                   const EvaluationContext &context);

private:
  static bool applyOperator(const TargetingRule &rule,
                            const ScalarValue &attributeValue);
  static bool compareNumbers(TargetingOperator op,
                             const ScalarValue &attributeValue,
                             const ScalarValue &ruleValue);
  static bool matchesRegex(const ScalarValue &attributeValue,
                           const ScalarValue &pattern);
};

} // namespace flagkit
