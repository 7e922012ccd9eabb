#include "flagkit/rule_matcher.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/string_utils.hpp"

#include <algorithm>
#include <exception>
#include <regex>

namespace flagkit {

std::optional<ScalarValue>
RuleMatcher::resolveAttribute(std::string_view attribute,
                              const EvaluationContext &context) {
  if (attribute == "userId") {
    return context.userId ? std::optional<ScalarValue>(*context.userId)
                          : std::nullopt;
  }
  if (attribute == "email") {
    return context.email ? std::optional<ScalarValue>(*context.email)
                         : std::nullopt;
  }
  if (attribute == "environment") {
    return context.environment
               ? std::optional<ScalarValue>(*context.environment)
               : std::nullopt;
  }

  auto it = context.customAttributes.find(attribute);
  if (it == context.customAttributes.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool RuleMatcher::matches(const TargetingRule &rule,
                          const EvaluationContext &context) {
  try {
    auto attributeValue = resolveAttribute(rule.attribute, context);
    if (!attributeValue) {
      return false;
    }
    return applyOperator(rule, *attributeValue);
  } catch (const std::exception &e) {
    MATCH_LOG_ERROR("Error matching rule on attribute '{}' ({}): {}",
                    rule.attribute, std::string(toString(rule.op)), e.what());
    return false;
  }
}

bool RuleMatcher::applyOperator(const TargetingRule &rule,
                                const ScalarValue &attributeValue) {
  auto inValues = [&]() {
    return std::any_of(rule.values.begin(), rule.values.end(),
                       [&](const ScalarValue &candidate) {
                         return scalarEquals(attributeValue, candidate);
                       });
  };

  if (requiresValueList(rule.op)) {
    return rule.op == TargetingOperator::IN ? inValues() : !inValues();
  }

  if (!rule.value) {
    MATCH_LOG_WARN("Rule on attribute '{}' has no value for operator {}",
                   rule.attribute, std::string(toString(rule.op)));
    return false;
  }
  const ScalarValue &ruleValue = *rule.value;

  switch (rule.op) {
  case TargetingOperator::EQUALS:
    return scalarEquals(attributeValue, ruleValue);
  case TargetingOperator::NOT_EQUALS:
    return !scalarEquals(attributeValue, ruleValue);
  case TargetingOperator::CONTAINS:
    return string_utils::icontains(scalarToString(attributeValue),
                                   scalarToString(ruleValue));
  case TargetingOperator::NOT_CONTAINS:
    return !string_utils::icontains(scalarToString(attributeValue),
                                    scalarToString(ruleValue));
  case TargetingOperator::STARTS_WITH:
    return string_utils::istarts_with(scalarToString(attributeValue),
                                      scalarToString(ruleValue));
  case TargetingOperator::ENDS_WITH:
    return string_utils::iends_with(scalarToString(attributeValue),
                                    scalarToString(ruleValue));
  case TargetingOperator::GREATER_THAN:
  case TargetingOperator::LESS_THAN:
  case TargetingOperator::GREATER_THAN_OR_EQUAL:
  case TargetingOperator::LESS_THAN_OR_EQUAL:
    return compareNumbers(rule.op, attributeValue, ruleValue);
  case TargetingOperator::MATCHES_REGEX:
    return matchesRegex(attributeValue, ruleValue);
  case TargetingOperator::IN:
  case TargetingOperator::NOT_IN:
    break;
  }

  MATCH_LOG_WARN("Unknown targeting operator: {}",
                 static_cast<int>(rule.op));
  return false;
}

bool RuleMatcher::compareNumbers(TargetingOperator op,
                                 const ScalarValue &attributeValue,
                                 const ScalarValue &ruleValue) {
  auto lhs = scalarToNumber(attributeValue);
  auto rhs = scalarToNumber(ruleValue);
  if (!lhs || !rhs) {
    MATCH_LOG_DEBUG("Numeric comparison skipped: '{}' vs '{}'",
                    scalarToString(attributeValue), scalarToString(ruleValue));
    return false;
  }

  switch (op) {
  case TargetingOperator::GREATER_THAN:
    return *lhs > *rhs;
  case TargetingOperator::LESS_THAN:
    return *lhs < *rhs;
  case TargetingOperator::GREATER_THAN_OR_EQUAL:
    return *lhs >= *rhs;
  case TargetingOperator::LESS_THAN_OR_EQUAL:
    return *lhs <= *rhs;
  default:
    return false;
  }
}

bool RuleMatcher::matchesRegex(const ScalarValue &attributeValue,
                               const ScalarValue &pattern) {
  auto patternText = scalarToString(pattern);
  auto subject = scalarToString(attributeValue);
  if (subject.size() > MAX_REGEX_INPUT_LENGTH) {
    MATCH_LOG_WARN("Attribute value of {} bytes exceeds the regex input limit "
                   "of {} bytes, pattern '{}' not applied",
                   subject.size(), MAX_REGEX_INPUT_LENGTH, patternText);
    return false;
  }

  try {
    std::regex regex(patternText, std::regex::ECMAScript);
    return std::regex_search(subject, regex);
  } catch (const std::regex_error &e) {
    MATCH_LOG_WARN("Invalid regex pattern '{}': {}", patternText, e.what());
    return false;
  }
}

} // namespace flagkit
