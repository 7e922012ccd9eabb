#include "flagkit/flag_types.hpp"
#include "flagkit/string_utils.hpp"
#include <algorithm>
#include <type_traits>

namespace flagkit {

// ============================================================================
// Targeting operators
// ============================================================================

std::optional<TargetingOperator> operatorFromString(std::string_view name) {
  for (size_t i = 0; i < TARGETING_OPERATOR_NAMES.size(); ++i) {
    if (TARGETING_OPERATOR_NAMES[i] == name) {
      return static_cast<TargetingOperator>(i);
    }
  }
  return std::nullopt;
}

std::string_view toString(TargetingOperator op) {
  auto index = static_cast<size_t>(op);
  if (index < TARGETING_OPERATOR_NAMES.size()) {
    return TARGETING_OPERATOR_NAMES[index];
  }
  return "unknown";
}

bool requiresValueList(TargetingOperator op) noexcept {
  return op == TargetingOperator::IN || op == TargetingOperator::NOT_IN;
}

// ============================================================================
// Scalar values
// ============================================================================

std::string scalarToString(const ScalarValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else {
          return string_utils::format_number(v);
        }
      },
      value);
}

std::optional<double> scalarToNumber(const ScalarValue &value) {
  if (const auto *number = std::get_if<double>(&value)) {
    return *number;
  }
  if (const auto *flag = std::get_if<bool>(&value)) {
    return *flag ? 1.0 : 0.0;
  }

  const auto &text = std::get<std::string>(value);
  if (string_utils::trim(text).empty()) {
    return 0.0;
  }
  return string_utils::parse_double(text);
}

bool scalarEquals(const ScalarValue &lhs, const ScalarValue &rhs) noexcept {
  return lhs == rhs;
}

nlohmann::ordered_json scalarToJson(const ScalarValue &value) {
  return std::visit([](const auto &v) { return nlohmann::ordered_json(v); },
                    value);
}

std::optional<ScalarValue> scalarFromJson(const nlohmann::ordered_json &json) {
  if (json.is_string()) {
    return ScalarValue{json.get<std::string>()};
  }
  if (json.is_boolean()) {
    return ScalarValue{json.get<bool>()};
  }
  if (json.is_number()) {
    return ScalarValue{json.get<double>()};
  }
  return std::nullopt;
}

// ============================================================================
// Flag configuration model
// ============================================================================

nlohmann::ordered_json RolloutRule::toJson() const {
  nlohmann::ordered_json json = {{"percentage", percentage}};
  if (seed) {
    json["seed"] = *seed;
  }
  return json;
}

nlohmann::ordered_json TargetingRule::toJson() const {
  nlohmann::ordered_json json = {{"attribute", attribute},
                                 {"operator", std::string(toString(op))},
                                 {"enabled", enabled}};
  if (value) {
    json["value"] = scalarToJson(*value);
  }
  if (!values.empty()) {
    auto list = nlohmann::ordered_json::array();
    for (const auto &item : values) {
      list.push_back(scalarToJson(item));
    }
    json["values"] = std::move(list);
  }
  if (description) {
    json["description"] = *description;
  }
  return json;
}

nlohmann::ordered_json FlagConfig::toJson() const {
  nlohmann::ordered_json json = {{"enabled", enabled}};
  if (description) {
    json["description"] = *description;
  }
  if (rollout) {
    json["rollout"] = rollout->toJson();
  }
  if (!targeting.empty()) {
    auto rules = nlohmann::ordered_json::array();
    for (const auto &rule : targeting) {
      rules.push_back(rule.toJson());
    }
    json["targeting"] = std::move(rules);
  }
  if (!environments.empty()) {
    json["environments"] = environments;
  }
  if (metadata.is_object()) {
    json["metadata"] = metadata;
  }
  return json;
}

FlagConfig FlagConfig::fromJson(const nlohmann::ordered_json &json) {
  FlagConfig config;
  config.enabled = json.at("enabled").get<bool>();

  if (auto it = json.find("description"); it != json.end()) {
    config.description = it->get<std::string>();
  }

  if (auto it = json.find("rollout"); it != json.end()) {
    RolloutRule rollout;
    rollout.percentage = it->at("percentage").get<double>();
    if (auto seed = it->find("seed"); seed != it->end()) {
      rollout.seed = seed->get<std::string>();
    }
    config.rollout = std::move(rollout);
  }

  if (auto it = json.find("targeting"); it != json.end()) {
    config.targeting.reserve(it->size());
    for (const auto &ruleJson : *it) {
      TargetingRule rule;
      rule.attribute = ruleJson.at("attribute").get<std::string>();
      rule.op = operatorFromString(ruleJson.at("operator").get<std::string>())
                    .value_or(TargetingOperator::EQUALS);
      rule.enabled = ruleJson.at("enabled").get<bool>();
      if (auto value = ruleJson.find("value"); value != ruleJson.end()) {
        rule.value = scalarFromJson(*value);
      }
      if (auto values = ruleJson.find("values"); values != ruleJson.end()) {
        for (const auto &item : *values) {
          if (auto scalar = scalarFromJson(item)) {
            rule.values.push_back(std::move(*scalar));
          }
        }
      }
      if (auto desc = ruleJson.find("description"); desc != ruleJson.end()) {
        rule.description = desc->get<std::string>();
      }
      config.targeting.push_back(std::move(rule));
    }
  }

  if (auto it = json.find("environments"); it != json.end()) {
    for (const auto &entry : it->items()) {
      config.environments[entry.key()] = entry.value().get<bool>();
    }
  }

  if (auto it = json.find("metadata"); it != json.end()) {
    config.metadata = *it;
  }

  return config;
}

FlagsConfig FlagsConfig::fromJson(const nlohmann::ordered_json &json) {
  FlagsConfig flags;
  if (!json.is_object()) {
    return flags;
  }
  for (const auto &entry : json.items()) {
    flags.insert(entry.key(), FlagConfig::fromJson(entry.value()));
  }
  return flags;
}

void FlagsConfig::insert(const std::string &name, FlagConfig config) {
  auto [it, inserted] = flags_.insert_or_assign(name, std::move(config));
  if (inserted) {
    order_.push_back(name);
  }
}

bool FlagsConfig::erase(std::string_view name) {
  auto it = flags_.find(name);
  if (it == flags_.end()) {
    return false;
  }
  flags_.erase(it);
  order_.erase(std::find(order_.begin(), order_.end(), name));
  return true;
}

const FlagConfig *FlagsConfig::find(std::string_view name) const {
  auto it = flags_.find(name);
  return it == flags_.end() ? nullptr : &it->second;
}

nlohmann::ordered_json FlagsConfig::toJson() const {
  auto json = nlohmann::ordered_json::object();
  for (const auto &name : order_) {
    json[name] = flags_.at(name).toJson();
  }
  return json;
}

// ============================================================================
// Evaluation output
// ============================================================================

nlohmann::ordered_json EvaluationMetadata::toJson() const {
  nlohmann::ordered_json json = {
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp.time_since_epoch())
                        .count()}};
  if (matchedRuleIndex) {
    json["matchedRuleIndex"] = *matchedRuleIndex;
  }
  if (rolloutBucket) {
    json["rolloutBucket"] = *rolloutBucket;
  }
  if (variant) {
    json["variant"] = *variant;
  }
  return json;
}

nlohmann::ordered_json EvaluationResult::toJson() const {
  return {{"flagName", flagName},
          {"enabled", enabled},
          {"reason", reason},
          {"metadata", metadata.toJson()}};
}

} // namespace flagkit
