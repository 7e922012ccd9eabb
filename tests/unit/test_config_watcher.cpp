#include <gtest/gtest.h>
#include "flagkit/config_watcher.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>

namespace flagkit {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ConfigWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        tempDir_ = fs::temp_directory_path() /
                   ("flagkit_watcher_test_" + std::to_string(rd()));
        fs::create_directories(tempDir_);
        filePath_ = (tempDir_ / "flags.yml").string();

        options_.pollInterval = 20ms;
        options_.debounce = 40ms;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(filePath_, std::ios::trunc);
        out << content;
    }

    static bool waitFor(const std::function<bool()>& condition,
                        std::chrono::milliseconds timeout = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return condition();
    }

    fs::path tempDir_;
    std::string filePath_;
    WatcherOptions options_;
};

TEST_F(ConfigWatcherTest, StartAndStop) {
    writeConfig("a:\n  enabled: true\n");
    ConfigWatcher watcher(nullptr, options_);
    EXPECT_FALSE(watcher.isRunning());

    watcher.start(filePath_);
    EXPECT_TRUE(watcher.isRunning());

    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
    // A second stop is a no-op.
    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
}

TEST_F(ConfigWatcherTest, UnchangedFileIsNotReported) {
    writeConfig("a:\n  enabled: true\n");
    std::atomic<int> calls{0};
    ConfigWatcher watcher([&](const std::string&) { ++calls; }, options_);

    watcher.start(filePath_);
    std::this_thread::sleep_for(200ms);
    watcher.stop();

    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(watcher.getChangeCount(), 0u);
}

TEST_F(ConfigWatcherTest, ReportsSettledChange) {
    writeConfig("a:\n  enabled: true\n");
    std::atomic<int> calls{0};
    std::string reportedPath;
    std::mutex pathMutex;
    ConfigWatcher watcher(
        [&](const std::string& path) {
            std::lock_guard<std::mutex> lock(pathMutex);
            reportedPath = path;
            ++calls;
        },
        options_);

    watcher.start(filePath_);
    std::this_thread::sleep_for(100ms);
    writeConfig("a:\n  enabled: false\nb:\n  enabled: true\n");

    EXPECT_TRUE(waitFor([&] { return calls.load() >= 1; }));
    std::this_thread::sleep_for(150ms);
    watcher.stop();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(watcher.getChangeCount(), 1u);
    std::lock_guard<std::mutex> lock(pathMutex);
    EXPECT_EQ(reportedPath, filePath_);
}

TEST_F(ConfigWatcherTest, FileCreatedAfterStartIsReported) {
    std::atomic<int> calls{0};
    ConfigWatcher watcher([&](const std::string&) { ++calls; }, options_);

    watcher.start(filePath_);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(calls.load(), 0);

    writeConfig("a:\n  enabled: true\n");
    EXPECT_TRUE(waitFor([&] { return calls.load() >= 1; }));
    watcher.stop();
}

TEST_F(ConfigWatcherTest, ThrowingCallbackKeepsWatching) {
    writeConfig("a:\n  enabled: true\n");
    std::atomic<int> calls{0};
    ConfigWatcher watcher(
        [&](const std::string&) {
            ++calls;
            throw std::runtime_error("reload failed");
        },
        options_);

    watcher.start(filePath_);
    std::this_thread::sleep_for(100ms);
    writeConfig("a:\n  enabled: false\n");
    ASSERT_TRUE(waitFor([&] { return calls.load() >= 1; }));

    writeConfig("a:\n  enabled: true\nb:\n  enabled: true\n");
    EXPECT_TRUE(waitFor([&] { return calls.load() >= 2; }));
    EXPECT_TRUE(watcher.isRunning());
    watcher.stop();
}

TEST_F(ConfigWatcherTest, DestructorStopsThread) {
    writeConfig("a:\n  enabled: true\n");
    {
        ConfigWatcher watcher(nullptr, options_);
        watcher.start(filePath_);
        std::this_thread::sleep_for(50ms);
    }
    SUCCEED();
}

} // namespace flagkit
