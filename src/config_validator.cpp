#include "flagkit/config_validator.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/exceptions.hpp"
#include "flagkit/flag_types.hpp"

#include <cmath>
#include <regex>

namespace flagkit {

namespace {

using Json = nlohmann::ordered_json;

[[noreturn]] void fail(ErrorCode code, const std::string &message,
                       const std::string &field, const Json *value) {
  std::string rendered = value ? value->dump() : std::string();
  ValidatorLogger::debug("Validation failed at {}: {}", field, message);
  throw ValidationException(code, message, field, rendered);
}

std::string flagPrefix(const std::string &flagName) {
  return "Flag \"" + flagName + "\": ";
}

bool isScalar(const Json &value) {
  return value.is_string() || value.is_number() || value.is_boolean();
}

// Length in code points, so multi-byte UTF-8 text is not over-counted.
size_t utf8Length(const std::string &text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

bool isFlagNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
         c == '-';
}

} // namespace

void ConfigValidator::validate(const Json &config) {
  if (config.is_array()) {
    fail(ErrorCode::INVALID_TYPE, "Config must be an object, not an array", "",
         &config);
  }
  if (!config.is_object()) {
    fail(ErrorCode::INVALID_TYPE, "Config must be an object", "", &config);
  }

  for (const auto &entry : config.items()) {
    validateFlagName(entry.key());
    validateFlagConfig(entry.key(), entry.value());
  }

  ValidatorLogger::debug("Validated {} flags", config.size());
}

void ConfigValidator::validateFlagName(const std::string &name) {
  if (name.empty()) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "Flag name must be a non-empty string",
                              "flagName", name);
  }

  for (char c : name) {
    if (!isFlagNameChar(c)) {
      throw ValidationException(
          ErrorCode::INVALID_FORMAT,
          "Flag name \"" + name +
              "\" must contain only lowercase letters, numbers, underscores, "
              "and hyphens",
          "flagName", name);
    }
  }

  if (name.size() > MAX_FLAG_NAME_LENGTH) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Flag name \"" + name +
                                  "\" exceeds maximum length of " +
                                  std::to_string(MAX_FLAG_NAME_LENGTH),
                              "flagName", name);
  }
}

void ConfigValidator::validateFlagConfig(const std::string &flagName,
                                         const Json &flag) {
  const auto prefix = flagPrefix(flagName);

  if (!flag.is_object()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "config must be an object",
         flagName, &flag);
  }

  auto enabled = flag.find("enabled");
  if (enabled == flag.end()) {
    fail(ErrorCode::MISSING_FIELD, prefix + "'enabled' must be a boolean",
         flagName + ".enabled", nullptr);
  }
  if (!enabled->is_boolean()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "'enabled' must be a boolean",
         flagName + ".enabled", &*enabled);
  }

  if (auto it = flag.find("description"); it != flag.end()) {
    validateDescription(flagName, *it);
  }
  if (auto it = flag.find("rollout"); it != flag.end()) {
    validateRollout(flagName, *it);
  }
  if (auto it = flag.find("targeting"); it != flag.end()) {
    validateTargeting(flagName, *it);
  }
  if (auto it = flag.find("environments"); it != flag.end()) {
    validateEnvironments(flagName, *it);
  }
  if (auto it = flag.find("metadata"); it != flag.end()) {
    validateMetadata(flagName, *it);
  }
}

void ConfigValidator::validateDescription(const std::string &flagName,
                                          const Json &description) {
  const auto field = flagName + ".description";
  if (!description.is_string()) {
    fail(ErrorCode::INVALID_TYPE,
         flagPrefix(flagName) + "description must be a string", field,
         &description);
  }
  if (utf8Length(description.get_ref<const std::string &>()) >
      MAX_DESCRIPTION_LENGTH) {
    fail(ErrorCode::INVALID_RANGE,
         flagPrefix(flagName) + "description exceeds maximum length of " +
             std::to_string(MAX_DESCRIPTION_LENGTH),
         field, &description);
  }
}

void ConfigValidator::validateRollout(const std::string &flagName,
                                      const Json &rollout) {
  const auto prefix = flagPrefix(flagName);
  const auto field = flagName + ".rollout";

  if (!rollout.is_object()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "rollout must be an object", field,
         &rollout);
  }

  auto percentage = rollout.find("percentage");
  if (percentage == rollout.end()) {
    fail(ErrorCode::MISSING_FIELD,
         prefix + "rollout.percentage must be a number",
         field + ".percentage", nullptr);
  }
  if (!percentage->is_number()) {
    fail(ErrorCode::INVALID_TYPE,
         prefix + "rollout.percentage must be a number",
         field + ".percentage", &*percentage);
  }

  const double value = percentage->get<double>();
  if (!std::isfinite(value)) {
    fail(ErrorCode::INVALID_RANGE, prefix + "rollout.percentage must be finite",
         field + ".percentage", &*percentage);
  }
  if (value < 0.0 || value > 100.0) {
    fail(ErrorCode::INVALID_RANGE,
         prefix + "rollout.percentage must be between 0 and 100",
         field + ".percentage", &*percentage);
  }

  if (auto seed = rollout.find("seed");
      seed != rollout.end() && !seed->is_string()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "rollout.seed must be a string",
         field + ".seed", &*seed);
  }
}

void ConfigValidator::validateTargeting(const std::string &flagName,
                                        const Json &targeting) {
  if (!targeting.is_array()) {
    fail(ErrorCode::INVALID_TYPE,
         flagPrefix(flagName) + "targeting must be an array",
         flagName + ".targeting", &targeting);
  }

  for (size_t i = 0; i < targeting.size(); ++i) {
    validateTargetingRule(flagName, targeting[i], i);
  }
}

void ConfigValidator::validateTargetingRule(const std::string &flagName,
                                            const Json &rule, size_t index) {
  const auto prefix =
      flagPrefix(flagName) + "targeting rule " + std::to_string(index) + " ";
  const auto ruleKey = flagName + ".targeting[" + std::to_string(index) + "]";

  if (!rule.is_object()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "must be an object", ruleKey,
         &rule);
  }

  auto attribute = rule.find("attribute");
  if (attribute == rule.end() || !attribute->is_string() ||
      attribute->get_ref<const std::string &>().empty()) {
    fail(attribute == rule.end() ? ErrorCode::MISSING_FIELD
                                 : ErrorCode::INVALID_TYPE,
         prefix + "attribute must be a non-empty string",
         ruleKey + ".attribute",
         attribute == rule.end() ? nullptr : &*attribute);
  }

  auto operatorIt = rule.find("operator");
  std::optional<TargetingOperator> op;
  if (operatorIt != rule.end() && operatorIt->is_string()) {
    op = operatorFromString(operatorIt->get_ref<const std::string &>());
  }
  if (!op) {
    std::string shown = operatorIt == rule.end()
                            ? "undefined"
                            : (operatorIt->is_string()
                                   ? operatorIt->get<std::string>()
                                   : operatorIt->dump());
    fail(ErrorCode::INVALID_INPUT,
         prefix + "has invalid operator \"" + shown + "\"",
         ruleKey + ".operator",
         operatorIt == rule.end() ? nullptr : &*operatorIt);
  }
  const std::string operatorName(toString(*op));

  if (requiresValueList(*op)) {
    auto values = rule.find("values");
    if (values == rule.end() || !values->is_array() || values->empty()) {
      fail(ErrorCode::MISSING_FIELD,
           prefix + "with operator \"" + operatorName +
               "\" requires non-empty 'values' array",
           ruleKey + ".values", values == rule.end() ? nullptr : &*values);
    }
    for (const auto &value : *values) {
      if (!isScalar(value)) {
        fail(ErrorCode::INVALID_TYPE,
             prefix + "values must be string, number, or boolean",
             ruleKey + ".values", &value);
      }
    }
  } else {
    auto value = rule.find("value");
    if (value == rule.end()) {
      fail(ErrorCode::MISSING_FIELD,
           prefix + "with operator \"" + operatorName +
               "\" requires 'value' field",
           ruleKey + ".value", nullptr);
    }
    if (!isScalar(*value)) {
      fail(ErrorCode::INVALID_TYPE,
           prefix + "value must be string, number, or boolean",
           ruleKey + ".value", &*value);
    }
  }

  auto enabled = rule.find("enabled");
  if (enabled == rule.end() || !enabled->is_boolean()) {
    fail(enabled == rule.end() ? ErrorCode::MISSING_FIELD
                               : ErrorCode::INVALID_TYPE,
         prefix + "'enabled' must be a boolean", ruleKey + ".enabled",
         enabled == rule.end() ? nullptr : &*enabled);
  }

  if (*op == TargetingOperator::MATCHES_REGEX) {
    const auto &value = rule.at("value");
    auto pattern = scalarToString(*scalarFromJson(value));
    try {
      std::regex compiled(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &e) {
      ValidatorLogger::debug("Regex '{}' rejected: {}", pattern, e.what());
      fail(ErrorCode::INVALID_FORMAT, prefix + "has invalid regex pattern",
           ruleKey + ".value", &value);
    }
  }

  if (auto description = rule.find("description");
      description != rule.end() && !description->is_string()) {
    fail(ErrorCode::INVALID_TYPE, prefix + "description must be a string",
         ruleKey + ".description", &*description);
  }
}

void ConfigValidator::validateEnvironments(const std::string &flagName,
                                           const Json &environments) {
  if (!environments.is_object()) {
    fail(ErrorCode::INVALID_TYPE,
         flagPrefix(flagName) + "environments must be an object",
         flagName + ".environments", &environments);
  }

  for (const auto &entry : environments.items()) {
    if (!entry.value().is_boolean()) {
      fail(ErrorCode::INVALID_TYPE,
           flagPrefix(flagName) + "environment \"" + entry.key() +
               "\" value must be a boolean",
           flagName + ".environments." + entry.key(), &entry.value());
    }
  }
}

void ConfigValidator::validateMetadata(const std::string &flagName,
                                       const Json &metadata) {
  if (!metadata.is_object()) {
    fail(ErrorCode::INVALID_TYPE,
         flagPrefix(flagName) + "metadata must be an object",
         flagName + ".metadata", &metadata);
  }
}

} // namespace flagkit
