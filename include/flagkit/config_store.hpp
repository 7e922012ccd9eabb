#pragma once

#include "flagkit/flag_types.hpp"
#include <cstdint>
#include <memory>
#include <shared_mutex>

namespace flagkit {

/**
 * Holds the active FlagsConfig as an immutable snapshot.
 *
 * Readers copy the snapshot pointer under a shared lock and keep using it
 * for as long as they like; replace() publishes a new snapshot under an
 * exclusive lock. A reader therefore sees either the whole old config or
 * the whole new one, never a mix.
 */
class ConfigStore {
public:
  using Snapshot = std::shared_ptr<const FlagsConfig>;

  ConfigStore();
  explicit ConfigStore(FlagsConfig initial);

  ConfigStore(const ConfigStore &) = delete;
  ConfigStore &operator=(const ConfigStore &) = delete;

  Snapshot snapshot() const;

  void replace(FlagsConfig newConfig);
  void replace(Snapshot newConfig);

  // Incremented on every replace(); starts at 1 for the initial config.
  uint64_t version() const;

private:
  mutable std::shared_mutex mutex_;
  Snapshot current_;
  uint64_t version_ = 1;
};

} // namespace flagkit
