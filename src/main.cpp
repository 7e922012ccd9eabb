#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "flagkit/config_editor.hpp"
#include "flagkit/config_parser.hpp"
#include "flagkit/exceptions.hpp"
#include "flagkit/flag_engine.hpp"
#include "flagkit/logger.hpp"
#include "flagkit/settings_manager.hpp"
#include "flagkit/string_utils.hpp"

using namespace flagkit;

namespace {

struct CliOptions {
  std::optional<std::string> configPath;
  std::optional<std::string> settingsPath;
  std::optional<std::string> logLevel;
  std::string command;
  std::vector<std::string> positional;

  // eval
  EvaluationContext context;
  bool strict = false;

  // list
  std::optional<std::string> environment;
  bool jsonOutput = false;

  // init, create
  bool withExamples = true;
  bool force = false;
  bool disabled = false;
  std::optional<std::string> description;
  std::optional<std::string> rollout;
};

void printUsage(std::ostream &out) {
  out << "Usage: flagkit [--config <path>] [--settings <file>] "
         "[--log-level <level>] <command> [args]\n\n"
      << "Commands:\n"
      << "  validate                 Validate the flag configuration\n"
      << "  list [--env <env>] [--json]\n"
      << "                           List flags\n"
      << "  show <flag>              Print one flag's configuration\n"
      << "  eval <flag> [--user <id>] [--email <email>] [--env <env>]\n"
      << "       [--attr key=value]... [--strict]\n"
      << "                           Evaluate a flag for a context\n"
      << "  status                   Summarize the configuration\n"
      << "  init [--no-examples] [--force]\n"
      << "                           Create a flag file\n"
      << "  create <flag> [--disabled] [--description <text>] "
         "[--rollout <pct>]\n"
      << "                           Add a flag\n"
      << "  remove <flag>            Delete a flag\n"
      << "  toggle <flag> [--env <env>]\n"
      << "                           Flip a flag globally or for one "
         "environment\n"
      << "  enable <flag> [--env <env>]\n"
      << "  disable <flag> [--env <env>]\n"
      << "                           Set a flag globally or for one "
         "environment\n"
      << "  rollout <flag> <pct>     Set the rollout percentage (0-100)\n";
}

// true/false become booleans, numeric text becomes a number.
ScalarValue parseAttributeValue(const std::string &text) {
  if (text == "true") {
    return true;
  }
  if (text == "false") {
    return false;
  }
  if (auto number = string_utils::parse_double(text)) {
    return *number;
  }
  return text;
}

std::optional<CliOptions> parseArguments(int argc, char *argv[]) {
  CliOptions options;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    auto nextValue = [&]() -> std::optional<std::string> {
      if (i + 1 >= args.size()) {
        std::cerr << "Missing value for " << arg << "\n";
        return std::nullopt;
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h") {
      printUsage(std::cout);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      if (!(options.configPath = nextValue()))
        return std::nullopt;
    } else if (arg == "--settings") {
      if (!(options.settingsPath = nextValue()))
        return std::nullopt;
    } else if (arg == "--log-level") {
      if (!(options.logLevel = nextValue()))
        return std::nullopt;
    } else if (arg == "--user") {
      if (!(options.context.userId = nextValue()))
        return std::nullopt;
    } else if (arg == "--email") {
      if (!(options.context.email = nextValue()))
        return std::nullopt;
    } else if (arg == "--env") {
      if (!(options.environment = nextValue()))
        return std::nullopt;
      options.context.environment = options.environment;
    } else if (arg == "--attr") {
      auto pair = nextValue();
      if (!pair)
        return std::nullopt;
      auto separator = pair->find('=');
      if (separator == std::string::npos || separator == 0) {
        std::cerr << "Invalid --attr value (expected key=value): " << *pair
                  << "\n";
        return std::nullopt;
      }
      options.context.customAttributes[pair->substr(0, separator)] =
          parseAttributeValue(pair->substr(separator + 1));
    } else if (arg == "--strict") {
      options.strict = true;
    } else if (arg == "--json") {
      options.jsonOutput = true;
    } else if (arg == "--no-examples") {
      options.withExamples = false;
    } else if (arg == "--force") {
      options.force = true;
    } else if (arg == "--disabled") {
      options.disabled = true;
    } else if (arg == "--description") {
      if (!(options.description = nextValue()))
        return std::nullopt;
    } else if (arg == "--rollout") {
      if (!(options.rollout = nextValue()))
        return std::nullopt;
    } else if (string_utils::istarts_with(arg, "--")) {
      std::cerr << "Unknown option: " << arg << "\n";
      return std::nullopt;
    } else if (options.command.empty()) {
      options.command = arg;
    } else {
      options.positional.push_back(arg);
    }
  }

  if (options.command.empty()) {
    printUsage(std::cerr);
    return std::nullopt;
  }
  return options;
}

void configureLogging(const CliOptions &options) {
  auto &settings = SettingsManager::getInstance();
  LogConfig logConfig;
  if (options.settingsPath) {
    if (!settings.loadSettings(*options.settingsPath)) {
      std::cerr << "Warning: could not load settings from "
                << *options.settingsPath << "\n";
    }
    logConfig = settings.getLoggingConfig();
  }

  if (options.logLevel) {
    if (auto level = parseLogLevel(*options.logLevel)) {
      logConfig.level = *level;
    } else {
      std::cerr << "Warning: unknown log level '" << *options.logLevel
                << "', keeping " << logLevelToString(logConfig.level) << "\n";
    }
  }
  Logger::getInstance().configure(logConfig);
}

std::optional<std::string> requestedConfigPath(const CliOptions &options) {
  std::optional<std::string> configPath = options.configPath;
  if (!configPath && options.settingsPath) {
    configPath = SettingsManager::getInstance().getClientOptions().configPath;
  }
  return configPath;
}

std::string resolveConfigPath(const CliOptions &options) {
  return ConfigParser::findConfigPath(requestedConfigPath(options));
}

bool isEditCommand(const std::string &command) {
  return command == "create" || command == "remove" || command == "toggle" ||
         command == "enable" || command == "disable" || command == "rollout";
}

std::optional<double> parsePercentage(const std::string &text) {
  auto value = string_utils::parse_double(text);
  if (!value) {
    std::cerr << "Invalid percentage: " << text << "\n";
  }
  return value;
}

int runInit(const CliOptions &options) {
  auto requested = requestedConfigPath(options);
  ConfigEditor editor(requested && !requested->empty()
                          ? *requested
                          : std::string(ConfigParser::DEFAULT_LOCATIONS[0]));
  editor.init(options.withExamples, options.force);
  std::cout << "Created " << editor.getConfigPath() << "\n";
  return 0;
}

std::string scopeText(const std::optional<std::string> &environment) {
  return environment ? "for environment \"" + *environment + "\""
                     : std::string("globally");
}

int runEdit(const CliOptions &options, const std::string &configPath) {
  const std::string &command = options.command;
  const size_t required = command == "rollout" ? 2 : 1;
  if (options.positional.size() < required) {
    std::cerr << "Usage: flagkit " << command
              << (command == "rollout" ? " <flag> <pct>" : " <flag>") << "\n";
    return 1;
  }

  ConfigEditor editor(configPath);
  const std::string &name = options.positional.front();

  try {
    if (command == "create") {
      NewFlagOptions flag;
      flag.enabled = !options.disabled;
      flag.description = options.description;
      if (options.rollout) {
        if (!(flag.rolloutPercentage = parsePercentage(*options.rollout)))
          return 1;
      }
      editor.createFlag(name, flag);
      std::cout << "Flag \"" << name << "\" created\n";
    } else if (command == "remove") {
      editor.removeFlag(name);
      std::cout << "Flag \"" << name << "\" removed\n";
    } else if (command == "rollout") {
      auto percentage = parsePercentage(options.positional[1]);
      if (!percentage)
        return 1;
      editor.setRollout(name, *percentage);
      std::cout << "Rollout for \"" << name << "\" set to "
                << string_utils::format_number(*percentage) << "%\n";
    } else {
      std::optional<bool> state;
      if (command == "enable") {
        state = true;
      } else if (command == "disable") {
        state = false;
      }
      const bool enabled =
          editor.toggleFlag(name, state, options.environment);
      std::cout << "Flag \"" << name << "\" "
                << (enabled ? "enabled " : "disabled ")
                << scopeText(options.environment) << "\n";
    }
    return 0;
  } catch (const FlagNotFoundException &e) {
    std::cerr << "Flag \"" << e.getFlagName() << "\" not found\n";
    return 1;
  } catch (const ValidationException &e) {
    std::cerr << "Rejected: " << e.getMessage() << "\n";
    if (!e.getField().empty()) {
      std::cerr << "  at " << e.getField() << "\n";
    }
    return 1;
  }
}

int runValidate(const std::string &configPath) {
  try {
    FlagsConfig config = ConfigParser::parseFile(configPath);
    size_t ruleCount = 0;
    for (const auto &name : config.names()) {
      ruleCount += config.find(name)->targeting.size();
    }
    std::cout << "Configuration is valid (" << config.size() << " flags)\n"
              << "  Targeting rules: " << ruleCount << "\n";
    return 0;
  } catch (const ValidationException &e) {
    std::cerr << "Configuration is invalid: " << e.getMessage() << "\n";
    if (!e.getField().empty()) {
      std::cerr << "  at " << e.getField() << "\n";
    }
    return 1;
  }
}

std::string describeRollout(const FlagConfig &flag) {
  return flag.rollout ? string_utils::format_number(flag.rollout->percentage) +
                            "%"
                      : "-";
}

int runList(const FlagsConfig &config, const CliOptions &options) {
  std::vector<std::string> names;
  for (const auto &name : config.names()) {
    const FlagConfig *flag = config.find(name);
    if (options.environment &&
        flag->environments.count(*options.environment) == 0) {
      continue;
    }
    names.push_back(name);
  }

  if (options.jsonOutput) {
    auto json = nlohmann::ordered_json::object();
    for (const auto &name : names) {
      json[name] = config.find(name)->toJson();
    }
    std::cout << json.dump(2) << "\n";
    return 0;
  }

  if (names.empty()) {
    std::cout << "No flags found\n";
    return 0;
  }

  std::cout << std::left << std::setw(32) << "NAME" << std::setw(8) << "STATE"
            << std::setw(10) << "ROLLOUT" << "RULES\n";
  for (const auto &name : names) {
    const FlagConfig *flag = config.find(name);
    std::cout << std::left << std::setw(32) << name << std::setw(8)
              << (flag->enabled ? "ON" : "OFF") << std::setw(10)
              << describeRollout(*flag) << flag->targeting.size() << "\n";
  }
  return 0;
}

int runShow(const FlagsConfig &config, const CliOptions &options) {
  if (options.positional.empty()) {
    std::cerr << "Usage: flagkit show <flag>\n";
    return 1;
  }
  const std::string &name = options.positional.front();
  const FlagConfig *flag = config.find(name);
  if (flag == nullptr) {
    std::cerr << "Flag \"" << name << "\" not found\n";
    return 1;
  }

  nlohmann::ordered_json json;
  json[name] = flag->toJson();
  std::cout << json.dump(2) << "\n";
  return 0;
}

int runEval(FlagsConfig config, const CliOptions &options) {
  if (options.positional.empty()) {
    std::cerr << "Usage: flagkit eval <flag> [--user <id>] ...\n";
    return 1;
  }

  EngineOptions engineOptions;
  engineOptions.strict = options.strict;
  if (options.settingsPath) {
    engineOptions.defaultHashSeed =
        SettingsManager::getInstance().getClientOptions().defaultHashSeed;
  }

  FlagEngine engine(std::move(config), engineOptions);
  EvaluationResult result =
      engine.evaluate(options.positional.front(), options.context);
  std::cout << result.toJson().dump(2) << "\n";
  return 0;
}

int runStatus(const FlagsConfig &config, const std::string &configPath) {
  size_t enabled = 0;
  size_t withRollout = 0;
  size_t withTargeting = 0;
  size_t withEnvironments = 0;
  for (const auto &name : config.names()) {
    const FlagConfig *flag = config.find(name);
    enabled += flag->enabled ? 1 : 0;
    withRollout += flag->rollout ? 1 : 0;
    withTargeting += flag->targeting.empty() ? 0 : 1;
    withEnvironments += flag->environments.empty() ? 0 : 1;
  }

  std::cout << "Config: " << configPath << "\n"
            << "Flags: " << config.size() << "\n"
            << "  Enabled: " << enabled << "\n"
            << "  Disabled: " << config.size() - enabled << "\n"
            << "  With rollout: " << withRollout << "\n"
            << "  With targeting: " << withTargeting << "\n"
            << "  With environment overrides: " << withEnvironments << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  auto options = parseArguments(argc, argv);
  if (!options) {
    return 2;
  }

  try {
    configureLogging(*options);
    if (options->command == "init") {
      return runInit(*options);
    }

    const std::string configPath = resolveConfigPath(*options);
    FLAGKIT_LOG_DEBUG("Main", "Using config file: " + configPath);

    if (options->command == "validate") {
      return runValidate(configPath);
    }
    if (isEditCommand(options->command)) {
      return runEdit(*options, configPath);
    }

    FlagsConfig config = ConfigParser::parseFile(configPath);

    if (options->command == "list") {
      return runList(config, *options);
    }
    if (options->command == "show") {
      return runShow(config, *options);
    }
    if (options->command == "eval") {
      return runEval(std::move(config), *options);
    }
    if (options->command == "status") {
      return runStatus(config, configPath);
    }

    std::cerr << "Unknown command: " << options->command << "\n";
    printUsage(std::cerr);
    return 2;
  } catch (const FlagKitException &e) {
    FLAGKIT_LOG_ERROR("Main", e.toLogString());
    std::cerr << "Error: " << e.getMessage() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
