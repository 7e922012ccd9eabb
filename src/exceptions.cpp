#include "flagkit/exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace flagkit {

const char *getErrorCodeDescription(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "Invalid input";
  case ErrorCode::MISSING_FIELD:
    return "Required field is missing";
  case ErrorCode::INVALID_FORMAT:
    return "Invalid format";
  case ErrorCode::INVALID_RANGE:
    return "Value out of range";
  case ErrorCode::INVALID_TYPE:
    return "Invalid type";
  case ErrorCode::CONSTRAINT_VIOLATION:
    return "Constraint violation";
  case ErrorCode::CONFIG_NOT_FOUND:
    return "Configuration file not found";
  case ErrorCode::CONFIG_PARSE_ERROR:
    return "Configuration could not be parsed";
  case ErrorCode::CONFIG_READ_ERROR:
    return "Configuration file could not be read";
  case ErrorCode::CONFIG_WRITE_ERROR:
    return "Configuration file could not be written";
  case ErrorCode::CONFIG_ALREADY_EXISTS:
    return "Configuration file already exists";
  case ErrorCode::FLAG_NOT_FOUND:
    return "Flag not found";
  case ErrorCode::FLAG_ALREADY_EXISTS:
    return "Flag already exists";
  case ErrorCode::DIGEST_FAILURE:
    return "Digest computation failed";
  case ErrorCode::INTERNAL_ERROR:
    return "Internal error";
  }
  return "Unknown error";
}

std::string FlagKitException::generateCorrelationId() {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::stringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

FlagKitException::FlagKitException(ErrorCode code, std::string message,
                                   ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string FlagKitException::toLogString() const {
  std::stringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << static_cast<int>(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string FlagKitException::toJsonString() const {
  nlohmann::json json = {
      {"correlationId", correlationId_},
      {"errorCode", static_cast<int>(errorCode_)},
      {"message", message_},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp_.time_since_epoch())
                        .count()}};
  if (!context_.empty()) {
    json["context"] = context_;
  }
  return json.dump();
}

void FlagKitException::addContext(const std::string &key,
                                  const std::string &value) {
  context_[key] = value;
}

void FlagKitException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

// ValidationException implementation
ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : FlagKitException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
  if (!field_.empty()) {
    addContext("field", field_);
  }
  if (!value_.empty()) {
    addContext("value", value_);
  }
}

std::string ValidationException::toLogString() const {
  std::stringstream ss;
  ss << "[VALIDATION] " << FlagKitException::toLogString();
  if (!field_.empty()) {
    ss << " Field=\"" << field_ << "\"";
  }
  if (!value_.empty()) {
    ss << " Value=\"" << value_ << "\"";
  }
  return ss.str();
}

// FlagNotFoundException implementation
FlagNotFoundException::FlagNotFoundException(std::string flagName,
                                             ErrorContext context)
    : FlagKitException(ErrorCode::FLAG_NOT_FOUND,
                       "Flag \"" + flagName + "\" not found",
                       std::move(context)),
      flagName_(std::move(flagName)) {
  addContext("flagName", flagName_);
}

std::string FlagNotFoundException::toLogString() const {
  return "[NOT_FOUND] " + FlagKitException::toLogString();
}

// ConfigParseException implementation
ConfigParseException::ConfigParseException(ErrorCode code, std::string message,
                                           std::string source,
                                           ErrorContext context)
    : FlagKitException(code, std::move(message), std::move(context)),
      source_(std::move(source)) {
  if (!source_.empty()) {
    addContext("source", source_);
  }
}

std::string ConfigParseException::toLogString() const {
  std::stringstream ss;
  ss << "[CONFIG] " << FlagKitException::toLogString();
  if (!source_.empty()) {
    ss << " Source=\"" << source_ << "\"";
  }
  return ss.str();
}

// SystemException implementation
SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : FlagKitException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::stringstream ss;
  ss << "[SYSTEM] " << FlagKitException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason) {
  ErrorContext context;
  context["reason"] = reason;
  return ValidationException(ErrorCode::INVALID_INPUT,
                             "Validation failed: " + reason, field, value,
                             context);
}

bool isValidationError(const std::exception &ex) {
  return dynamic_cast<const ValidationException *>(&ex) != nullptr;
}

bool isFlagNotFoundError(const std::exception &ex) {
  return dynamic_cast<const FlagNotFoundException *>(&ex) != nullptr;
}

bool isConfigParseError(const std::exception &ex) {
  return dynamic_cast<const ConfigParseException *>(&ex) != nullptr;
}

} // namespace flagkit
