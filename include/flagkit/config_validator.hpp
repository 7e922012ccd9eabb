#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace flagkit {

/**
 * Structural gate between an untrusted config tree and FlagsConfig.
 *
 * validate() walks flags in document order and throws ValidationException
 * on the first violation. The exception's field is a path such as
 * "checkout.targeting[1].operator" ("flagName" for name errors) and its
 * value is the offending JSON rendered as text. A tree that passes can be
 * decoded with FlagsConfig::fromJson without further checks.
 */
class ConfigValidator {
public:
  static constexpr size_t MAX_FLAG_NAME_LENGTH = 100;
  static constexpr size_t MAX_DESCRIPTION_LENGTH = 500;

  static void validate(const nlohmann::ordered_json &config);

  // Lowercase letters, digits, '_' and '-'; 1 to 100 characters.
  static void validateFlagName(const std::string &name);

private:
  static void validateFlagConfig(const std::string &flagName,
                                 const nlohmann::ordered_json &flag);
  static void validateDescription(const std::string &flagName,
                                  const nlohmann::ordered_json &description);
  static void validateRollout(const std::string &flagName,
                              const nlohmann::ordered_json &rollout);
  static void validateTargeting(const std::string &flagName,
                                const nlohmann::ordered_json &targeting);
  static void validateTargetingRule(const std::string &flagName,
                                    const nlohmann::ordered_json &rule,
                                    size_t index);
  static void validateEnvironments(const std::string &flagName,
                                   const nlohmann::ordered_json &environments);
  static void validateMetadata(const std::string &flagName,
                               const nlohmann::ordered_json &metadata);
};

} // namespace flagkit
