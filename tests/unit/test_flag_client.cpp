#include <gtest/gtest.h>
#include "flagkit/exceptions.hpp"
#include "flagkit/flag_client.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace flagkit {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

const char* const BASE_CONFIG = R"(
simple_flag:
  enabled: true

pro_feature:
  enabled: true
  targeting:
    - attribute: plan
      operator: equals
      value: pro
      enabled: true
  rollout:
    percentage: 0

prod_only:
  enabled: false
  environments:
    production: true
)";

} // namespace

class FlagClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        tempDir_ = fs::temp_directory_path() /
                   ("flagkit_client_test_" + std::to_string(rd()));
        fs::create_directories(tempDir_);
        configPath_ = (tempDir_ / "flags.yml").string();
        writeConfig(BASE_CONFIG);

        options_.configPath = configPath_;
        options_.autoReload = false;
        options_.onError = [this](const std::exception& e) {
            ++errorCalls_;
            lastError_ = e.what();
        };
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(configPath_, std::ios::trunc);
        out << content;
    }

    fs::path tempDir_;
    std::string configPath_;
    ClientOptions options_;
    std::atomic<int> errorCalls_{0};
    std::string lastError_;
};

TEST_F(FlagClientTest, LoadsConfigOnConstruction) {
    FlagClient client(options_);

    EXPECT_TRUE(client.isInitialized());
    auto state = client.getState();
    EXPECT_TRUE(state.initialized);
    EXPECT_EQ(fs::path(state.configPath), fs::path(configPath_).lexically_normal());
    EXPECT_TRUE(state.lastLoadTime.has_value());
    EXPECT_EQ(state.errorCount, 0u);

    std::vector<std::string> expected = {"simple_flag", "pro_feature", "prod_only"};
    EXPECT_EQ(client.getAllFlagNames(), expected);
    EXPECT_TRUE(client.isEnabled("simple_flag"));
    EXPECT_TRUE(client.getFlagConfig("pro_feature").has_value());
    EXPECT_EQ(client.getWholeConfig()->size(), 3u);
}

TEST_F(FlagClientTest, FindsDefaultLocationUnderBaseDir) {
    fs::create_directories(tempDir_ / ".flagkit");
    fs::copy_file(configPath_, tempDir_ / ".flagkit" / "flags.yml");

    options_.configPath.reset();
    options_.baseDir = tempDir_;
    FlagClient client(options_);

    EXPECT_TRUE(client.isInitialized());
    EXPECT_EQ(fs::path(client.getState().configPath),
              (tempDir_ / ".flagkit/flags.yml").lexically_normal());
}

TEST_F(FlagClientTest, MissingConfigUsesFallbacks) {
    options_.configPath = (tempDir_ / "missing.yml").string();
    options_.fallbacks["simple_flag"] = true;
    FlagClient client(options_);

    EXPECT_FALSE(client.isInitialized());
    EXPECT_EQ(errorCalls_.load(), 1);
    EXPECT_EQ(client.getState().errorCount, 1u);

    auto result = client.evaluate("simple_flag");
    EXPECT_TRUE(result.enabled);
    EXPECT_EQ(result.reason, "Client not initialized, using fallback");
    EXPECT_FALSE(client.isEnabled("prod_only"));
    EXPECT_TRUE(client.getAllFlagNames().empty());
    EXPECT_TRUE(client.getWholeConfig()->empty());
}

TEST_F(FlagClientTest, MissingConfigThrowsWhenRequested) {
    options_.configPath = (tempDir_ / "missing.yml").string();
    options_.throwOnError = true;
    EXPECT_THROW(FlagClient client(options_), ConfigParseException);
    EXPECT_EQ(errorCalls_.load(), 1);
}

TEST_F(FlagClientTest, UnknownFlagFallsBackQuietly) {
    options_.fallbacks["new_flag"] = true;
    FlagClient client(options_);

    auto result = client.evaluate("new_flag");
    EXPECT_TRUE(result.enabled);
    EXPECT_EQ(result.reason, "Flag not found, using fallback");
    EXPECT_FALSE(client.isEnabled("other_unknown"));
    EXPECT_EQ(client.getState().errorCount, 0u);
    EXPECT_EQ(errorCalls_.load(), 0);
}

TEST_F(FlagClientTest, UnknownFlagInStrictModeIsAnError) {
    options_.strict = true;
    FlagClient client(options_);

    auto result = client.evaluate("new_flag");
    EXPECT_FALSE(result.enabled);
    EXPECT_EQ(result.reason, "Error evaluating flag: Flag \"new_flag\" not found");
    EXPECT_EQ(client.getState().errorCount, 1u);
    EXPECT_EQ(errorCalls_.load(), 1);
}

TEST_F(FlagClientTest, StrictWithThrowOnErrorPropagates) {
    options_.strict = true;
    options_.throwOnError = true;
    FlagClient client(options_);

    EXPECT_THROW(client.evaluate("new_flag"), FlagNotFoundException);
    EXPECT_TRUE(client.isEnabled("simple_flag"));
}

TEST_F(FlagClientTest, MergesDefaultContext) {
    options_.defaultContext.environment = "production";
    options_.defaultContext.customAttributes["plan"] = ScalarValue{std::string("pro")};
    FlagClient client(options_);

    EvaluationContext context;
    context.userId = "user-1";
    EXPECT_TRUE(client.isEnabled("prod_only", context));
    EXPECT_TRUE(client.isEnabled("pro_feature", context));

    // Call-site values win over defaults.
    context.environment = "staging";
    context.customAttributes["plan"] = ScalarValue{std::string("free")};
    EXPECT_FALSE(client.isEnabled("prod_only", context));
    EXPECT_FALSE(client.isEnabled("pro_feature", context));
}

TEST_F(FlagClientTest, ReportsEvaluationsToCallback) {
    std::vector<std::string> seen;
    std::optional<std::string> seenEnvironment;
    options_.defaultContext.environment = "production";
    options_.onFlagEvaluated = [&](const EvaluationResult& result,
                                   const EvaluationContext& context) {
        seen.push_back(result.flagName);
        seenEnvironment = context.environment;
    };
    FlagClient client(options_);

    client.isEnabled("simple_flag");
    client.isEnabled("prod_only");
    client.isEnabled("unknown_flag");

    std::vector<std::string> expected = {"simple_flag", "prod_only"};
    EXPECT_EQ(seen, expected);
    ASSERT_TRUE(seenEnvironment.has_value());
    EXPECT_EQ(*seenEnvironment, "production");
}

TEST_F(FlagClientTest, ThrowingEvaluationCallbackDoesNotAffectResult) {
    options_.onFlagEvaluated = [](const EvaluationResult&, const EvaluationContext&) {
        throw std::runtime_error("listener failed");
    };
    FlagClient client(options_);

    auto result = client.evaluate("simple_flag");
    EXPECT_TRUE(result.enabled);
    EXPECT_EQ(result.reason, "Flag is enabled for all users");
    EXPECT_EQ(client.getState().errorCount, 0u);
}

TEST_F(FlagClientTest, ManualReloadPicksUpChanges) {
    size_t updatedFlags = 0;
    options_.onConfigUpdate = [&](const FlagsConfig& config) {
        updatedFlags = config.size();
    };
    FlagClient client(options_);
    EXPECT_FALSE(client.isEnabled("fresh_flag"));

    writeConfig("fresh_flag:\n  enabled: true\n");
    client.reload();

    EXPECT_TRUE(client.isEnabled("fresh_flag"));
    EXPECT_EQ(updatedFlags, 1u);
    EXPECT_EQ(client.getAllFlagNames(), std::vector<std::string>{"fresh_flag"});
}

TEST_F(FlagClientTest, FailedReloadKeepsPreviousConfig) {
    FlagClient client(options_);

    writeConfig("BadFlag:\n  enabled: true\n");
    client.reload();

    EXPECT_EQ(errorCalls_.load(), 1);
    EXPECT_NE(lastError_.find("lowercase letters"), std::string::npos);
    EXPECT_EQ(client.getState().errorCount, 1u);
    EXPECT_TRUE(client.isEnabled("simple_flag"));

    writeConfig(BASE_CONFIG);
    client.reload();
    EXPECT_EQ(client.getState().errorCount, 0u);
}

TEST_F(FlagClientTest, FailedReloadThrowsWhenRequested) {
    options_.throwOnError = true;
    FlagClient client(options_);

    writeConfig("flag: [unclosed\n");
    EXPECT_THROW(client.reload(), ConfigParseException);
    EXPECT_TRUE(client.isEnabled("simple_flag"));
}

TEST_F(FlagClientTest, ReloadRecoversUninitializedClient) {
    options_.configPath.reset();
    options_.baseDir = tempDir_;
    FlagClient client(options_);
    EXPECT_FALSE(client.isInitialized());

    fs::copy_file(configPath_, tempDir_ / "flagkit.yml");
    client.reload();

    EXPECT_TRUE(client.isInitialized());
    EXPECT_TRUE(client.isEnabled("simple_flag"));
}

TEST_F(FlagClientTest, ShutdownReleasesEngine) {
    FlagClient client(options_);
    client.shutdown();

    EXPECT_FALSE(client.isInitialized());
    auto result = client.evaluate("simple_flag");
    EXPECT_FALSE(result.enabled);
    EXPECT_EQ(result.reason, "Client not initialized, using fallback");

    // Shutting down twice is harmless.
    client.shutdown();
}

TEST_F(FlagClientTest, ReloadAfterShutdownIsIgnored) {
    int updates = 0;
    options_.onConfigUpdate = [&](const FlagsConfig&) { ++updates; };
    FlagClient client(options_);
    client.shutdown();

    writeConfig("fresh_flag:\n  enabled: true\n");
    client.reload();

    EXPECT_FALSE(client.isInitialized());
    EXPECT_EQ(updates, 0);
    EXPECT_FALSE(client.isEnabled("fresh_flag"));
    EXPECT_EQ(client.evaluate("simple_flag").reason,
              "Client not initialized, using fallback");
    EXPECT_EQ(errorCalls_.load(), 0);
}

TEST_F(FlagClientTest, ConcurrentRecoveryStartsOneWatcher) {
    options_.configPath.reset();
    options_.baseDir = tempDir_;
    options_.autoReload = true;
    options_.pollInterval = 20ms;
    options_.debounce = 40ms;
    std::atomic<int> updates{0};
    options_.onConfigUpdate = [&](const FlagsConfig&) { ++updates; };
    FlagClient client(options_);
    ASSERT_FALSE(client.isInitialized());

    fs::copy_file(configPath_, tempDir_ / "flagkit.yml");
    std::vector<std::thread> reloaders;
    for (int i = 0; i < 4; ++i) {
        reloaders.emplace_back([&client] { client.reload(); });
    }
    for (auto& thread : reloaders) {
        thread.join();
    }
    EXPECT_TRUE(client.isInitialized());
    EXPECT_EQ(updates.load(), 4);
    std::this_thread::sleep_for(100ms);

    {
        std::ofstream out(tempDir_ / "flagkit.yml", std::ios::trunc);
        out << "watched_flag:\n  enabled: true\n";
    }
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!client.isEnabled("watched_flag") &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(client.isEnabled("watched_flag"));

    client.shutdown();
    EXPECT_FALSE(client.isInitialized());
}

TEST_F(FlagClientTest, AutoReloadFollowsFileChanges) {
    options_.autoReload = true;
    options_.pollInterval = 20ms;
    options_.debounce = 40ms;
    std::atomic<int> updates{0};
    options_.onConfigUpdate = [&](const FlagsConfig&) { ++updates; };
    FlagClient client(options_);
    std::this_thread::sleep_for(100ms);

    writeConfig("simple_flag:\n  enabled: false\nwatched_flag:\n  enabled: true\n");

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (updates.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    EXPECT_GE(updates.load(), 1);
    EXPECT_TRUE(client.isEnabled("watched_flag"));
    EXPECT_FALSE(client.isEnabled("simple_flag"));
    client.shutdown();
}

} // namespace flagkit
