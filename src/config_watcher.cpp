#include "flagkit/config_watcher.hpp"
#include "flagkit/component_logger.hpp"

#include <algorithm>

namespace flagkit {

ConfigWatcher::ConfigWatcher(ChangeCallback onChange, WatcherOptions options)
    : onChange_(std::move(onChange)), options_(options) {}

ConfigWatcher::~ConfigWatcher() { stop(); }

void ConfigWatcher::start(const std::string &filePath) {
  if (running_.load()) {
    WatcherLogger::warn("File watcher already started for {}", filePath_);
    return;
  }

  filePath_ = filePath;
  running_.store(true);
  watchThread_ = std::thread(&ConfigWatcher::watchLoop, this);

  WatcherLogger::debug("File watcher started for {} (poll {}ms, debounce {}ms)",
                       filePath_, options_.pollInterval.count(),
                       options_.debounce.count());
}

void ConfigWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    if (!running_.load() && !watchThread_.joinable()) {
      return;
    }
    running_.store(false);
  }
  waitCondition_.notify_all();

  if (watchThread_.joinable()) {
    watchThread_.join();
  }

  WatcherLogger::debug("File watcher stopped for {}", filePath_);
}

std::optional<ConfigWatcher::FileStamp> ConfigWatcher::readStamp() const {
  std::error_code ec;
  FileStamp stamp;
  stamp.modified = std::filesystem::last_write_time(filePath_, ec);
  if (ec) {
    return std::nullopt;
  }
  stamp.size = std::filesystem::file_size(filePath_, ec);
  if (ec) {
    return std::nullopt;
  }
  return stamp;
}

void ConfigWatcher::watchLoop() {
  // Changes made before start() are not reported.
  std::optional<FileStamp> reported = readStamp();
  std::optional<FileStamp> pending;
  auto pendingSince = std::chrono::steady_clock::now();
  bool missingLogged = false;

  while (running_.load()) {
    auto interval = pending ? std::min(options_.pollInterval, options_.debounce)
                            : options_.pollInterval;
    {
      std::unique_lock<std::mutex> lock(waitMutex_);
      waitCondition_.wait_for(lock, interval,
                              [this] { return !running_.load(); });
    }
    if (!running_.load()) {
      break;
    }

    auto current = readStamp();
    if (!current) {
      if (!missingLogged) {
        WatcherLogger::warn("Watched file is not accessible: {}", filePath_);
        missingLogged = true;
      }
      pending.reset();
      continue;
    }
    if (missingLogged) {
      WatcherLogger::info("Watched file is accessible again: {}", filePath_);
      missingLogged = false;
    }

    if (reported && *current == *reported) {
      pending.reset();
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    if (!pending || *pending != *current) {
      pending = current;
      pendingSince = now;
      continue;
    }

    if (now - pendingSince >= options_.debounce) {
      reported = current;
      pending.reset();
      notifyChange();
    }
  }
}

void ConfigWatcher::notifyChange() {
  changeCount_.fetch_add(1);
  WatcherLogger::info("Config file changed: {}", filePath_);

  if (!onChange_) {
    return;
  }
  try {
    onChange_(filePath_);
  } catch (const std::exception &e) {
    WatcherLogger::error("File change callback failed: {}", e.what());
  }
}

} // namespace flagkit
