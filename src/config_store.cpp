#include "flagkit/config_store.hpp"
#include "flagkit/component_logger.hpp"

#include <mutex>

namespace flagkit {

ConfigStore::ConfigStore() : current_(std::make_shared<const FlagsConfig>()) {}

ConfigStore::ConfigStore(FlagsConfig initial)
    : current_(std::make_shared<const FlagsConfig>(std::move(initial))) {}

ConfigStore::Snapshot ConfigStore::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return current_;
}

void ConfigStore::replace(FlagsConfig newConfig) {
  replace(std::make_shared<const FlagsConfig>(std::move(newConfig)));
}

void ConfigStore::replace(Snapshot newConfig) {
  if (!newConfig) {
    newConfig = std::make_shared<const FlagsConfig>();
  }

  const size_t flagCount = newConfig->size();
  uint64_t version = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    // The previous snapshot is released outside the lock by `newConfig`.
    current_.swap(newConfig);
    version = ++version_;
  }

  StoreLogger::debug("Published config version {} with {} flags", version,
                     flagCount);
}

uint64_t ConfigStore::version() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return version_;
}

} // namespace flagkit
