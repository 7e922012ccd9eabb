#include <gtest/gtest.h>
#include "flagkit/config_parser.hpp"
#include "flagkit/exceptions.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace flagkit {

namespace fs = std::filesystem;

class ConfigParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        tempDir_ = fs::temp_directory_path() /
                   ("flagkit_parser_test_" + std::to_string(rd()));
        fs::create_directories(tempDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    fs::path writeFile(const fs::path& relative, const std::string& content) {
        fs::path path = tempDir_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path tempDir_;
};

TEST_F(ConfigParserTest, ParsesYamlFlags) {
    auto config = ConfigParser::parseYaml(R"(
checkout:
  enabled: true
  description: New checkout
  rollout:
    percentage: 25
    seed: v2
  targeting:
    - attribute: age
      operator: greater_than
      value: 18
      enabled: true
    - attribute: code
      operator: equals
      value: "123"
      enabled: false
  environments:
    staging: true
  metadata:
    owner: payments
)");

    ASSERT_EQ(config.size(), 1u);
    const FlagConfig* flag = config.find("checkout");
    ASSERT_NE(flag, nullptr);
    EXPECT_TRUE(flag->enabled);
    EXPECT_EQ(*flag->description, "New checkout");
    EXPECT_DOUBLE_EQ(flag->rollout->percentage, 25.0);
    EXPECT_EQ(*flag->rollout->seed, "v2");
    ASSERT_EQ(flag->targeting.size(), 2u);
    EXPECT_EQ(flag->targeting[0].op, TargetingOperator::GREATER_THAN);
    EXPECT_EQ(std::get<double>(*flag->targeting[0].value), 18.0);
    // Quoted scalars stay strings.
    EXPECT_EQ(std::get<std::string>(*flag->targeting[1].value), "123");
    EXPECT_TRUE(flag->environments.at("staging"));
    EXPECT_EQ(flag->metadata["owner"], "payments");
}

TEST_F(ConfigParserTest, KeepsDocumentOrder) {
    auto config = ConfigParser::parseYaml(
        "zeta:\n  enabled: true\nalpha:\n  enabled: false\nmid:\n  enabled: true\n");
    std::vector<std::string> expected = {"zeta", "alpha", "mid"};
    EXPECT_EQ(config.names(), expected);
}

TEST_F(ConfigParserTest, YamlScalarTyping) {
    auto tree = ConfigParser::yamlToJson(R"(
plain_int: 42
negative: -7
hex: 0x1F
octal: 0o17
float: 1.5e3
infinite: .inf
nothing: ~
empty:
yes_bool: true
word: yes
quoted_bool: "true"
tagged: !!str 10
)");
    EXPECT_EQ(tree["plain_int"], 42);
    EXPECT_EQ(tree["negative"], -7);
    EXPECT_EQ(tree["hex"], 31);
    EXPECT_EQ(tree["octal"], 15);
    EXPECT_DOUBLE_EQ(tree["float"].get<double>(), 1500.0);
    EXPECT_TRUE(std::isinf(tree["infinite"].get<double>()));
    EXPECT_TRUE(tree["nothing"].is_null());
    EXPECT_TRUE(tree["empty"].is_null());
    EXPECT_EQ(tree["yes_bool"], true);
    // YAML 1.2: "yes" is a plain string.
    EXPECT_EQ(tree["word"], "yes");
    EXPECT_EQ(tree["quoted_bool"], "true");
    EXPECT_EQ(tree["tagged"], "10");
}

TEST_F(ConfigParserTest, EmptyDocumentIsEmptyConfig) {
    EXPECT_TRUE(ConfigParser::parseYaml("").empty());
    EXPECT_TRUE(ConfigParser::parseYaml("# only a comment\n").empty());
    EXPECT_TRUE(ConfigParser::parseJson("null").empty());
}

TEST_F(ConfigParserTest, ScalarRootIsRejected) {
    try {
        ConfigParser::parseYaml("just a string");
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.getMessage(), "Config must be a YAML object");
    }
    EXPECT_THROW(ConfigParser::parseYaml("- a\n- b\n"), ValidationException);
}

TEST_F(ConfigParserTest, SyntaxErrorsAreParseErrors) {
    try {
        ConfigParser::parseYaml("flag: [unclosed\n");
        FAIL() << "expected ConfigParseException";
    } catch (const ConfigParseException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_PARSE_ERROR);
        EXPECT_EQ(e.getMessage().rfind("Failed to parse YAML: ", 0), 0u);
    }

    try {
        ConfigParser::parseJson("{\"flag\": ");
        FAIL() << "expected ConfigParseException";
    } catch (const ConfigParseException& e) {
        EXPECT_EQ(e.getMessage().rfind("Failed to parse JSON: ", 0), 0u);
    }

    EXPECT_THROW(ConfigParser::parseYaml("? [a, b]\n: 1\n"), ConfigParseException);
}

TEST_F(ConfigParserTest, ParseFileSelectsFormatByExtension) {
    auto jsonPath = writeFile("flags.json", R"({"json_flag": {"enabled": true}})");
    auto yamlPath = writeFile("flags.yml", "yaml_flag:\n  enabled: false\n");

    EXPECT_TRUE(ConfigParser::parseFile(jsonPath.string()).contains("json_flag"));
    EXPECT_TRUE(ConfigParser::parseFile(yamlPath.string()).contains("yaml_flag"));
}

TEST_F(ConfigParserTest, ParseFileMissing) {
    const std::string missing = (tempDir_ / "nope.yml").string();
    try {
        ConfigParser::parseFile(missing);
        FAIL() << "expected ConfigParseException";
    } catch (const ConfigParseException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_NOT_FOUND);
        EXPECT_EQ(e.getMessage(), "Config file not found: " + missing);
        EXPECT_EQ(e.getSource(), missing);
    }
}

TEST_F(ConfigParserTest, ParseFileAddsSourceToValidationErrors) {
    auto path = writeFile("bad.yml", "flag:\n  enabled: maybe\n");
    try {
        ConfigParser::parseFile(path.string());
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.getField(), "flag.enabled");
        EXPECT_EQ(e.getContext().at("source"), path.string());
    }
}

TEST_F(ConfigParserTest, FindConfigPathSearchesDefaultsInOrder) {
    writeFile("flagkit.yaml", "a:\n  enabled: true\n");
    EXPECT_EQ(fs::path(ConfigParser::findConfigPath(std::nullopt, tempDir_)),
              (tempDir_ / "flagkit.yaml").lexically_normal());

    writeFile(".flagkit/flags.yml", "a:\n  enabled: true\n");
    EXPECT_EQ(fs::path(ConfigParser::findConfigPath(std::nullopt, tempDir_)),
              (tempDir_ / ".flagkit/flags.yml").lexically_normal());
}

TEST_F(ConfigParserTest, FindConfigPathResolvesCustomPath) {
    writeFile("custom/flags.yml", "a:\n  enabled: true\n");

    auto resolved = ConfigParser::findConfigPath(std::string("custom/flags.yml"), tempDir_);
    EXPECT_EQ(fs::path(resolved), (tempDir_ / "custom/flags.yml").lexically_normal());

    EXPECT_THROW(ConfigParser::findConfigPath(std::string("custom/missing.yml"), tempDir_),
                 ConfigParseException);
}

TEST_F(ConfigParserTest, FindConfigPathListsSearchedLocations) {
    try {
        ConfigParser::findConfigPath(std::nullopt, tempDir_);
        FAIL() << "expected ConfigParseException";
    } catch (const ConfigParseException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_NOT_FOUND);
        const std::string& message = e.getMessage();
        EXPECT_EQ(message.rfind("FlagKit config file not found.", 0), 0u);
        for (const auto& location : ConfigParser::DEFAULT_LOCATIONS) {
            EXPECT_NE(message.find("  - " + std::string(location)), std::string::npos);
        }
    }
}

TEST_F(ConfigParserTest, EmittedYamlKeepsScalarTypes) {
    auto tree = nlohmann::ordered_json::parse(R"({
        "zeta": {"enabled": true, "rollout": {"percentage": 12.5}},
        "alpha": {
            "enabled": false,
            "description": "",
            "targeting": [
                {"attribute": "code", "operator": "in", "enabled": true,
                 "values": ["123", "true", "null", "~", "plain", 7, false]}
            ],
            "environments": {"null": true},
            "metadata": {"owner": "team: core", "nested": {"list": []}}
        }
    })");

    const std::string yaml = ConfigParser::jsonToYaml(tree);

    EXPECT_NE(yaml.find("\"123\""), std::string::npos);
    EXPECT_NE(yaml.find("\"true\""), std::string::npos);
    EXPECT_NE(yaml.find("plain"), std::string::npos);
    EXPECT_EQ(ConfigParser::yamlToJson(yaml), tree);
    EXPECT_EQ(ConfigParser::yamlToJson(yaml).begin().key(), "zeta");

    auto config = ConfigParser::parseYaml(yaml);
    EXPECT_EQ(config.names()[0], "zeta");
    EXPECT_TRUE(config.find("alpha")->environments.at("null"));
}

} // namespace flagkit
