#pragma once

#include "flagkit/flag_types.hpp"

#include <optional>
#include <string>

namespace flagkit {

struct NewFlagOptions {
  bool enabled = true;
  std::optional<std::string> description;
  std::optional<double> rolloutPercentage;
};

/**
 * Read-modify-write access to one flag file for the CLI editing commands.
 *
 * Every change is validated as a whole config before anything is written,
 * so a rejected edit leaves the file as it was. Files ending in ".json" are
 * written back as JSON, everything else as YAML.
 *
 * Errors:
 *   - ConfigParseException when the file is missing, unreadable or cannot
 *     be written
 *   - ValidationException for bad names, values or duplicate flags
 *   - FlagNotFoundException when editing a flag that does not exist
 */
class ConfigEditor {
public:
  explicit ConfigEditor(std::string configPath);

  const std::string &getConfigPath() const { return configPath_; }
  bool exists() const;

  FlagsConfig read() const;
  void write(const FlagsConfig &config) const;

  // Creates the file, with example flags unless withExamples is false.
  void init(bool withExamples, bool overwrite = false) const;

  void createFlag(const std::string &name, const NewFlagOptions &options) const;
  void removeFlag(const std::string &name) const;

  /**
   * Sets the flag globally, or for one environment when @p environment is
   * given. Without an explicit state the current value is inverted; an
   * environment with no override inherits the global value first.
   * Returns the new state.
   */
  bool toggleFlag(const std::string &name, std::optional<bool> state,
                  const std::optional<std::string> &environment) const;

  // Keeps an existing rollout seed.
  void setRollout(const std::string &name, double percentage) const;

  static FlagsConfig exampleConfig();

private:
  FlagConfig requireFlag(const FlagsConfig &config,
                         const std::string &name) const;

  std::string configPath_;
};

} // namespace flagkit
