#include "flagkit/bucketer.hpp"
#include "flagkit/component_logger.hpp"
#include "flagkit/exceptions.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

namespace flagkit {

std::string Bucketer::hashInput(std::string_view flagName,
                                std::string_view identifier,
                                const std::optional<std::string> &seed) {
  std::string input;
  std::string_view prefix =
      seed && !seed->empty() ? std::string_view(*seed) : DEFAULT_SEED;
  input.reserve(prefix.size() + flagName.size() + identifier.size() + 2);
  input.append(prefix);
  input.push_back(':');
  input.append(flagName);
  input.push_back(':');
  input.append(identifier);
  return input;
}

uint32_t Bucketer::digestPrefix(const std::string &input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;

  if (EVP_Digest(input.data(), input.size(), digest, &digestLength,
                 EVP_sha256(), nullptr) != 1 ||
      digestLength < 4) {
    char errorBuffer[256];
    ERR_error_string_n(ERR_get_error(), errorBuffer, sizeof(errorBuffer));
    BucketerLogger::error("SHA-256 digest failed: {}", errorBuffer);
    throw SystemException(ErrorCode::DIGEST_FAILURE,
                          std::string("SHA-256 digest failed: ") + errorBuffer,
                          "Bucketer");
  }

  return (static_cast<uint32_t>(digest[0]) << 24) |
         (static_cast<uint32_t>(digest[1]) << 16) |
         (static_cast<uint32_t>(digest[2]) << 8) |
         static_cast<uint32_t>(digest[3]);
}

int Bucketer::bucket(std::string_view flagName, std::string_view identifier,
                     const std::optional<std::string> &seed) {
  auto prefix = digestPrefix(hashInput(flagName, identifier, seed));
  return static_cast<int>(prefix % BUCKET_COUNT);
}

bool Bucketer::isInRollout(std::string_view flagName,
                           std::string_view identifier, double percentage,
                           const std::optional<std::string> &seed) {
  if (percentage <= 0.0) {
    return false;
  }
  if (percentage >= 100.0) {
    return true;
  }
  return bucket(flagName, identifier, seed) < percentage;
}

} // namespace flagkit
