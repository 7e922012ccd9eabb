#pragma once

#include "flagkit/flag_types.hpp"

#include <array>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace flagkit {

/**
 * Turns flag files into validated FlagsConfig objects.
 *
 * YAML is converted into a JSON tree first so YAML and JSON sources share
 * one validation path. Plain YAML scalars are typed by the YAML 1.2 core
 * schema (null, bool, int, float, otherwise string); quoted scalars always
 * stay strings.
 *
 * Errors:
 *   - ConfigParseException for missing/unreadable files and bad syntax
 *   - ValidationException for a well-formed document with a bad structure
 */
class ConfigParser {
public:
  // Searched in order, relative to the base directory.
  static constexpr std::array<std::string_view, 6> DEFAULT_LOCATIONS = {
      ".flagkit/flags.yml", ".flagkit/flags.yaml", "flagkit.yml",
      "flagkit.yaml",       ".flagkit.yml",        ".flagkit.yaml"};

  static FlagsConfig parseYaml(const std::string &content);
  static FlagsConfig parseJson(const std::string &content);

  // ".json" files are read as JSON, everything else as YAML.
  static FlagsConfig parseFile(const std::string &filePath);

  static nlohmann::ordered_json yamlToJson(const std::string &content);

  // Block-style YAML that yamlToJson reads back to an equal tree. Strings the
  // core schema would retype ("true", "42", "") are double-quoted.
  static std::string jsonToYaml(const nlohmann::ordered_json &tree);

  /**
   * Resolves the config file to load. A custom path must exist; without one
   * the default locations under @p baseDir (working directory when empty)
   * are tried in order.
   */
  static std::string
  findConfigPath(const std::optional<std::string> &customPath = std::nullopt,
                 const std::filesystem::path &baseDir = {});

private:
  static FlagsConfig fromTree(const nlohmann::ordered_json &tree);
  static std::string readFile(const std::string &filePath);
};

} // namespace flagkit
