#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace flagkit {

class FlagKitException;
class ValidationException;
class FlagNotFoundException;
class ConfigParseException;
class SystemException;

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  MISSING_FIELD = 1001,
  INVALID_FORMAT = 1002,
  INVALID_RANGE = 1003,
  INVALID_TYPE = 1004,
  CONSTRAINT_VIOLATION = 1005,

  // Configuration errors (2000-2999)
  CONFIG_NOT_FOUND = 2000,
  CONFIG_PARSE_ERROR = 2001,
  CONFIG_READ_ERROR = 2002,
  CONFIG_WRITE_ERROR = 2003,
  CONFIG_ALREADY_EXISTS = 2004,

  // Lookup errors (3000-3999)
  FLAG_NOT_FOUND = 3000,
  FLAG_ALREADY_EXISTS = 3001,

  // System errors (4000-4999)
  DIGEST_FAILURE = 4000,
  INTERNAL_ERROR = 4001
};

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

const char *getErrorCodeDescription(ErrorCode code);

// Base exception class with error context and correlation ID support
class FlagKitException : public std::exception {
public:
  FlagKitException(ErrorCode code, std::string message,
                   ErrorContext context = {});

  FlagKitException(const FlagKitException &other) = default;
  FlagKitException &operator=(const FlagKitException &other) = default;
  FlagKitException(FlagKitException &&other) noexcept = default;
  FlagKitException &operator=(FlagKitException &&other) noexcept = default;

  ~FlagKitException() override = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

/**
 * Raised by ConfigValidator on the first structural violation. The field is
 * a dotted/bracketed path such as "my_flag.targeting[2].operator" and the
 * value is the offending JSON value rendered as text.
 */
class ValidationException : public FlagKitException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// Raised for an unknown flag name when the engine runs in strict mode.
class FlagNotFoundException : public FlagKitException {
public:
  explicit FlagNotFoundException(std::string flagName,
                                 ErrorContext context = {});

  const std::string &getFlagName() const { return flagName_; }

  std::string toLogString() const override;

private:
  std::string flagName_;
};

// Raised when a config source cannot be located, read, parsed or written.
class ConfigParseException : public FlagKitException {
public:
  ConfigParseException(ErrorCode code, std::string message,
                       std::string source = "", ErrorContext context = {});

  const std::string &getSource() const { return source_; }

  std::string toLogString() const override;

private:
  std::string source_;
};

// Raised for infrastructure failures such as a failing digest primitive.
class SystemException : public FlagKitException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason);

bool isValidationError(const std::exception &ex);
bool isFlagNotFoundError(const std::exception &ex);
bool isConfigParseError(const std::exception &ex);

template <typename ExceptionType>
const ExceptionType *asException(const std::exception &ex) {
  return dynamic_cast<const ExceptionType *>(&ex);
}

} // namespace flagkit
