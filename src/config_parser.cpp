#include "flagkit/config_parser.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/config_validator.hpp"
#include "flagkit/exceptions.hpp"
#include "flagkit/string_utils.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace flagkit {

namespace {

namespace fs = std::filesystem;
using Json = nlohmann::ordered_json;

constexpr const char *STR_TAG = "tag:yaml.org,2002:str";

bool isNullScalar(const std::string &text) {
  return text.empty() || text == "~" || text == "null" || text == "Null" ||
         text == "NULL";
}

Json parseInteger(std::string_view digits, int base, bool negative,
                  const std::string &original) {
  uint64_t magnitude = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                   magnitude, base);
  if (ec == std::errc() && ptr == digits.data() + digits.size()) {
    if (!negative &&
        magnitude <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(magnitude);
    }
    if (negative && magnitude <= static_cast<uint64_t>(
                                     std::numeric_limits<int64_t>::max()) +
                                     1) {
      return static_cast<int64_t>(0 - magnitude);
    }
  }
  // Too large for a 64-bit integer; keep it as a double.
  if (auto value = string_utils::parse_double(original)) {
    return *value;
  }
  return original;
}

// Types a plain scalar following the YAML 1.2 core schema.
Json resolvePlainScalar(const std::string &text) {
  static const std::regex decimalInt(R"([-+]?[0-9]+)");
  static const std::regex octalInt(R"(0o[0-7]+)");
  static const std::regex hexInt(R"(0x[0-9a-fA-F]+)");
  static const std::regex floatNumber(
      R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
  static const std::regex infinity(R"([-+]?(\.inf|\.Inf|\.INF))");
  static const std::regex notANumber(R"(\.nan|\.NaN|\.NAN)");

  if (isNullScalar(text)) {
    return nullptr;
  }
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }

  if (std::regex_match(text, decimalInt)) {
    std::string_view digits(text);
    bool negative = false;
    if (digits.front() == '+' || digits.front() == '-') {
      negative = digits.front() == '-';
      digits.remove_prefix(1);
    }
    return parseInteger(digits, 10, negative, text);
  }
  if (std::regex_match(text, octalInt)) {
    return parseInteger(std::string_view(text).substr(2), 8, false, text);
  }
  if (std::regex_match(text, hexInt)) {
    return parseInteger(std::string_view(text).substr(2), 16, false, text);
  }
  if (std::regex_match(text, floatNumber)) {
    if (auto value = string_utils::parse_double(text)) {
      return *value;
    }
    return text;
  }
  if (std::regex_match(text, infinity)) {
    return text.front() == '-' ? -std::numeric_limits<double>::infinity()
                               : std::numeric_limits<double>::infinity();
  }
  if (std::regex_match(text, notANumber)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return text;
}

Json convertNode(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    return nullptr;

  case YAML::NodeType::Scalar: {
    const std::string &tag = node.Tag();
    // "!" marks a quoted scalar; explicit !!str also forces a string.
    if (tag == "!" || tag == STR_TAG) {
      return node.Scalar();
    }
    return resolvePlainScalar(node.Scalar());
  }

  case YAML::NodeType::Sequence: {
    auto array = Json::array();
    for (const auto &item : node) {
      array.push_back(convertNode(item));
    }
    return array;
  }

  case YAML::NodeType::Map: {
    auto object = Json::object();
    for (const auto &entry : node) {
      if (!entry.first.IsScalar()) {
        auto mark = entry.first.Mark();
        throw ConfigParseException(
            ErrorCode::CONFIG_PARSE_ERROR,
            "Failed to parse YAML: mapping keys must be scalars (line " +
                std::to_string(mark.line + 1) + ")");
      }
      object[entry.first.Scalar()] = convertNode(entry.second);
    }
    return object;
  }
  }
  return nullptr;
}

void emitString(YAML::Emitter &out, const std::string &text) {
  Json typed = resolvePlainScalar(text);
  if (typed.is_string() && typed.get_ref<const std::string &>() == text) {
    out << text;
  } else {
    out << YAML::DoubleQuoted << text;
  }
}

void emitNode(YAML::Emitter &out, const Json &value) {
  switch (value.type()) {
  case Json::value_t::object:
    out << YAML::BeginMap;
    for (const auto &entry : value.items()) {
      out << YAML::Key;
      emitString(out, entry.key());
      out << YAML::Value;
      emitNode(out, entry.value());
    }
    out << YAML::EndMap;
    break;
  case Json::value_t::array:
    out << YAML::BeginSeq;
    for (const auto &item : value) {
      emitNode(out, item);
    }
    out << YAML::EndSeq;
    break;
  case Json::value_t::string:
    emitString(out, value.get_ref<const std::string &>());
    break;
  case Json::value_t::boolean:
    out << value.get<bool>();
    break;
  case Json::value_t::number_integer:
  case Json::value_t::number_unsigned:
    out << value.dump();
    break;
  case Json::value_t::number_float:
    out << string_utils::format_number(value.get<double>());
    break;
  default:
    out << YAML::Null;
    break;
  }
}

} // namespace

std::string ConfigParser::jsonToYaml(const Json &tree) {
  YAML::Emitter out;
  out.SetIndent(2);
  emitNode(out, tree);
  if (!out.good()) {
    throw ConfigParseException(ErrorCode::CONFIG_WRITE_ERROR,
                               "Failed to emit YAML: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

Json ConfigParser::yamlToJson(const std::string &content) {
  try {
    YAML::Node root = YAML::Load(content);
    return convertNode(root);
  } catch (const YAML::Exception &e) {
    PARSER_LOG_ERROR("YAML parse error: {}", e.what());
    throw ConfigParseException(ErrorCode::CONFIG_PARSE_ERROR,
                               std::string("Failed to parse YAML: ") +
                                   e.what());
  }
}

FlagsConfig ConfigParser::parseYaml(const std::string &content) {
  Json tree = yamlToJson(content);
  if (tree.is_null()) {
    PARSER_LOG_DEBUG("Empty YAML document, using empty config");
    return FlagsConfig{};
  }
  if (!tree.is_object() && !tree.is_array()) {
    throw ValidationException(ErrorCode::INVALID_TYPE,
                              "Config must be a YAML object", "", tree.dump());
  }
  return fromTree(tree);
}

FlagsConfig ConfigParser::parseJson(const std::string &content) {
  Json tree;
  try {
    tree = Json::parse(content);
  } catch (const Json::parse_error &e) {
    PARSER_LOG_ERROR("JSON parse error: {}", e.what());
    throw ConfigParseException(ErrorCode::CONFIG_PARSE_ERROR,
                               std::string("Failed to parse JSON: ") +
                                   e.what());
  }

  if (tree.is_null()) {
    return FlagsConfig{};
  }
  return fromTree(tree);
}

FlagsConfig ConfigParser::parseFile(const std::string &filePath) {
  std::error_code ec;
  if (!fs::exists(filePath, ec)) {
    throw ConfigParseException(ErrorCode::CONFIG_NOT_FOUND,
                               "Config file not found: " + filePath, filePath);
  }

  const std::string content = readFile(filePath);
  const bool isJson =
      string_utils::iequals(fs::path(filePath).extension().string(), ".json");

  try {
    auto config = isJson ? parseJson(content) : parseYaml(content);
    PARSER_LOG_INFO("Loaded {} flags from {}", config.size(), filePath);
    return config;
  } catch (ConfigParseException &e) {
    e.addContext("source", filePath);
    throw;
  } catch (ValidationException &e) {
    e.addContext("source", filePath);
    throw;
  }
}

std::string ConfigParser::findConfigPath(
    const std::optional<std::string> &customPath,
    const fs::path &baseDir) {
  const fs::path base = baseDir.empty() ? fs::current_path() : baseDir;
  std::error_code ec;

  if (customPath && !customPath->empty()) {
    fs::path resolved(*customPath);
    if (resolved.is_relative()) {
      resolved = base / resolved;
    }
    resolved = resolved.lexically_normal();
    if (!fs::exists(resolved, ec)) {
      throw ConfigParseException(ErrorCode::CONFIG_NOT_FOUND,
                                 "Config file not found: " + resolved.string(),
                                 resolved.string());
    }
    return resolved.string();
  }

  for (const auto &location : DEFAULT_LOCATIONS) {
    fs::path candidate = (base / fs::path(location)).lexically_normal();
    if (fs::exists(candidate, ec)) {
      PARSER_LOG_DEBUG("Found config file at: {}", candidate.string());
      return candidate.string();
    }
  }

  std::ostringstream message;
  message << "FlagKit config file not found. Specify a config path.\n\n"
          << "Searched locations:";
  for (const auto &location : DEFAULT_LOCATIONS) {
    message << "\n  - " << location;
  }
  throw ConfigParseException(ErrorCode::CONFIG_NOT_FOUND, message.str(),
                             base.string());
}

FlagsConfig ConfigParser::fromTree(const Json &tree) {
  ConfigValidator::validate(tree);
  return FlagsConfig::fromJson(tree);
}

std::string ConfigParser::readFile(const std::string &filePath) {
  std::error_code ec;
  if (!fs::is_regular_file(filePath, ec)) {
    throw ConfigParseException(ErrorCode::CONFIG_READ_ERROR,
                               "Failed to read config file: " + filePath +
                                   " is not a regular file",
                               filePath);
  }

  std::ifstream file(filePath, std::ios::binary);
  if (!file.is_open()) {
    throw ConfigParseException(ErrorCode::CONFIG_READ_ERROR,
                               "Failed to read config file: " + filePath,
                               filePath);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

} // namespace flagkit
