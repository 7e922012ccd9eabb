#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace flagkit {

struct WatcherOptions {
  std::chrono::milliseconds pollInterval{500};
  // A change is reported once the file has been stable for this long.
  std::chrono::milliseconds debounce{100};
};

/**
 * Watches a single file by polling its modification time and size on a
 * background thread. The callback runs on that thread, once per settled
 * change; it must not call stop() on the same watcher.
 */
class ConfigWatcher {
public:
  using ChangeCallback = std::function<void(const std::string &path)>;

  explicit ConfigWatcher(ChangeCallback onChange, WatcherOptions options = {});
  ~ConfigWatcher();

  ConfigWatcher(const ConfigWatcher &) = delete;
  ConfigWatcher &operator=(const ConfigWatcher &) = delete;

  void start(const std::string &filePath);
  void stop();

  bool isRunning() const { return running_.load(); }
  uint64_t getChangeCount() const { return changeCount_.load(); }

private:
  struct FileStamp {
    std::filesystem::file_time_type modified;
    std::uintmax_t size = 0;

    bool operator==(const FileStamp &other) const {
      return modified == other.modified && size == other.size;
    }
    bool operator!=(const FileStamp &other) const { return !(*this == other); }
  };

  void watchLoop();
  std::optional<FileStamp> readStamp() const;
  void notifyChange();

  ChangeCallback onChange_;
  WatcherOptions options_;
  std::string filePath_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> changeCount_{0};
  std::thread watchThread_;
  std::mutex waitMutex_;
  std::condition_variable waitCondition_;
};

} // namespace flagkit
