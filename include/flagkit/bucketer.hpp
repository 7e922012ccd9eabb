#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flagkit {

/**
 * Maps (flag, subject, seed) to a stable bucket in [0, 99].
 *
 * The hash input is "<seed>:<flag>:<identifier>" where seed falls back to
 * DEFAULT_SEED when absent or empty. The first four bytes of its SHA-256
 * digest, read big-endian, are reduced modulo 100. The same inputs give the
 * same bucket on every platform and in every process, and the same bucket
 * as the other DevBolt SDKs for identical inputs.
 */
class Bucketer {
public:
  static constexpr std::string_view DEFAULT_SEED = "devbolt";
  static constexpr int BUCKET_COUNT = 100;

  static int bucket(std::string_view flagName, std::string_view identifier,
                    const std::optional<std::string> &seed = std::nullopt);

  // percentage 0 never hashes; percentage 100 is always in.
  static bool isInRollout(std::string_view flagName,
                          std::string_view identifier, double percentage,
                          const std::optional<std::string> &seed = std::nullopt);

  static std::string hashInput(std::string_view flagName,
                               std::string_view identifier,
                               const std::optional<std::string> &seed);

private:
  static uint32_t digestPrefix(const std::string &input);
};

} // namespace flagkit
