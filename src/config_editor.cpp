#include "flagkit/config_editor.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/config_parser.hpp"
#include "flagkit/config_validator.hpp"
#include "flagkit/exceptions.hpp"
#include "flagkit/string_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace flagkit {

namespace {

namespace fs = std::filesystem;

bool isJsonPath(const std::string &path) {
  return string_utils::iequals(fs::path(path).extension().string(), ".json");
}

} // namespace

ConfigEditor::ConfigEditor(std::string configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigEditor::exists() const {
  std::error_code ec;
  return fs::exists(configPath_, ec);
}

FlagsConfig ConfigEditor::read() const {
  return ConfigParser::parseFile(configPath_);
}

void ConfigEditor::write(const FlagsConfig &config) const {
  const auto tree = config.toJson();
  ConfigValidator::validate(tree);

  const std::string content =
      isJsonPath(configPath_) ? tree.dump(2) + "\n"
                              : ConfigParser::jsonToYaml(tree);

  const fs::path target(configPath_);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw ConfigParseException(ErrorCode::CONFIG_WRITE_ERROR,
                                 "Failed to create directory " +
                                     target.parent_path().string() + ": " +
                                     ec.message(),
                                 configPath_);
    }
  }

  fs::path staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw ConfigParseException(ErrorCode::CONFIG_WRITE_ERROR,
                                 "Failed to open " + staging.string() +
                                     " for writing",
                                 configPath_);
    }
    out << content;
    out.flush();
    if (!out) {
      throw ConfigParseException(ErrorCode::CONFIG_WRITE_ERROR,
                                 "Failed to write " + staging.string(),
                                 configPath_);
    }
  }

  fs::rename(staging, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(staging, ignored);
    throw ConfigParseException(ErrorCode::CONFIG_WRITE_ERROR,
                               "Failed to replace " + configPath_ + ": " +
                                   ec.message(),
                               configPath_);
  }

  EDITOR_LOG_INFO("Wrote {} flags to {}", config.size(), configPath_);
}

void ConfigEditor::init(bool withExamples, bool overwrite) const {
  if (exists() && !overwrite) {
    throw ConfigParseException(ErrorCode::CONFIG_ALREADY_EXISTS,
                               "Config file already exists: " + configPath_,
                               configPath_);
  }
  write(withExamples ? exampleConfig() : FlagsConfig{});
}

void ConfigEditor::createFlag(const std::string &name,
                              const NewFlagOptions &options) const {
  ConfigValidator::validateFlagName(name);

  FlagsConfig config = read();
  if (config.contains(name)) {
    throw ValidationException(ErrorCode::FLAG_ALREADY_EXISTS,
                              "Flag \"" + name + "\" already exists",
                              "flagName", name);
  }

  FlagConfig flag;
  flag.enabled = options.enabled;
  if (options.description && !options.description->empty()) {
    flag.description = options.description;
  }
  if (options.rolloutPercentage) {
    flag.rollout = RolloutRule{*options.rolloutPercentage, std::nullopt};
  }

  config.insert(name, std::move(flag));
  write(config);
}

void ConfigEditor::removeFlag(const std::string &name) const {
  FlagsConfig config = read();
  if (!config.erase(name)) {
    throw FlagNotFoundException(name, {{"source", configPath_}});
  }
  write(config);
}

bool ConfigEditor::toggleFlag(
    const std::string &name, std::optional<bool> state,
    const std::optional<std::string> &environment) const {
  FlagsConfig config = read();
  FlagConfig flag = requireFlag(config, name);

  bool newState = false;
  if (environment) {
    auto current = flag.environments.find(*environment);
    const bool effective =
        current != flag.environments.end() ? current->second : flag.enabled;
    newState = state.value_or(!effective);
    flag.environments[*environment] = newState;
  } else {
    newState = state.value_or(!flag.enabled);
    flag.enabled = newState;
  }

  config.insert(name, std::move(flag));
  write(config);
  return newState;
}

void ConfigEditor::setRollout(const std::string &name,
                              double percentage) const {
  if (std::isnan(percentage) || percentage < 0.0 || percentage > 100.0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Rollout percentage must be between 0 and 100",
                              name + ".rollout.percentage",
                              string_utils::format_number(percentage));
  }

  FlagsConfig config = read();
  FlagConfig flag = requireFlag(config, name);
  if (flag.rollout) {
    flag.rollout->percentage = percentage;
  } else {
    flag.rollout = RolloutRule{percentage, std::nullopt};
  }

  config.insert(name, std::move(flag));
  write(config);
}

FlagsConfig ConfigEditor::exampleConfig() {
  FlagsConfig config;

  FlagConfig example;
  example.enabled = true;
  example.description = "An example feature flag";
  config.insert("example_feature", std::move(example));

  FlagConfig gradual;
  gradual.enabled = true;
  gradual.description = "Gradually rolled out to 50% of users";
  gradual.rollout = RolloutRule{50.0, std::nullopt};
  config.insert("gradual_rollout", std::move(gradual));

  FlagConfig perEnvironment;
  perEnvironment.enabled = true;
  perEnvironment.description = "Enabled everywhere except production";
  perEnvironment.environments = {
      {"production", false}, {"staging", true}, {"development", true}};
  config.insert("environment_specific", std::move(perEnvironment));

  FlagConfig targeted;
  targeted.enabled = false;
  targeted.description = "Enabled for company email addresses";
  TargetingRule rule;
  rule.attribute = "email";
  rule.op = TargetingOperator::ENDS_WITH;
  rule.value = ScalarValue{std::string("@company.com")};
  rule.enabled = true;
  targeted.targeting.push_back(std::move(rule));
  config.insert("targeted_feature", std::move(targeted));

  return config;
}

FlagConfig ConfigEditor::requireFlag(const FlagsConfig &config,
                                     const std::string &name) const {
  const FlagConfig *flag = config.find(name);
  if (flag == nullptr) {
    throw FlagNotFoundException(name, {{"source", configPath_}});
  }
  return *flag;
}

} // namespace flagkit
