#include <gtest/gtest.h>
#include "flagkit/exceptions.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace flagkit {

// Test fixture for exception tests
class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, BaseExceptionConstruction) {
    ErrorContext context = {{"key1", "value1"}, {"key2", "value2"}};
    FlagKitException ex(ErrorCode::INTERNAL_ERROR, "Test error message", context);

    EXPECT_EQ(ex.getCode(), ErrorCode::INTERNAL_ERROR);
    EXPECT_EQ(ex.getMessage(), "Test error message");
    EXPECT_STREQ(ex.what(), "Test error message");
    EXPECT_EQ(ex.getContext().size(), 2u);
    EXPECT_EQ(ex.getContext().at("key1"), "value1");

    auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - ex.getTimestamp());
    EXPECT_LT(age.count(), 5);
    EXPECT_EQ(ex.getCorrelationId().size(), 8u);
}

TEST_F(ExceptionTest, CopyKeepsCorrelationId) {
    FlagKitException original(ErrorCode::INTERNAL_ERROR, "Original message");
    FlagKitException copy = original;
    EXPECT_EQ(copy.getCorrelationId(), original.getCorrelationId());

    FlagKitException other(ErrorCode::INVALID_INPUT, "Other");
    EXPECT_NE(other.getCorrelationId(), original.getCorrelationId());

    other.setCorrelationId("req-42");
    EXPECT_EQ(other.getCorrelationId(), "req-42");
}

TEST_F(ExceptionTest, ValidationExceptionCarriesFieldAndValue) {
    ValidationException ex(ErrorCode::INVALID_RANGE,
                           "Flag \"checkout\": rollout.percentage must be between 0 and 100",
                           "checkout.rollout.percentage", "150");

    EXPECT_EQ(ex.getField(), "checkout.rollout.percentage");
    EXPECT_EQ(ex.getValue(), "150");
    EXPECT_EQ(ex.getContext().at("field"), "checkout.rollout.percentage");
    EXPECT_EQ(ex.getContext().at("value"), "150");

    std::string log = ex.toLogString();
    EXPECT_EQ(log.rfind("[VALIDATION] ", 0), 0u);
    EXPECT_NE(log.find("Field=\"checkout.rollout.percentage\""), std::string::npos);
    EXPECT_NE(log.find("ErrorCode=1003"), std::string::npos);
}

TEST_F(ExceptionTest, FlagNotFoundException) {
    FlagNotFoundException ex("dark_mode");

    EXPECT_EQ(ex.getCode(), ErrorCode::FLAG_NOT_FOUND);
    EXPECT_EQ(ex.getFlagName(), "dark_mode");
    EXPECT_STREQ(ex.what(), "Flag \"dark_mode\" not found");
    EXPECT_EQ(ex.getContext().at("flagName"), "dark_mode");
    EXPECT_EQ(ex.toLogString().rfind("[NOT_FOUND] ", 0), 0u);
}

TEST_F(ExceptionTest, ConfigParseAndSystemExceptions) {
    ConfigParseException parse(ErrorCode::CONFIG_NOT_FOUND,
                               "Config file not found: /tmp/x.yml", "/tmp/x.yml");
    EXPECT_EQ(parse.getSource(), "/tmp/x.yml");
    EXPECT_NE(parse.toLogString().find("Source=\"/tmp/x.yml\""), std::string::npos);

    SystemException system(ErrorCode::DIGEST_FAILURE, "SHA-256 failed", "Bucketer");
    EXPECT_EQ(system.getComponent(), "Bucketer");
    EXPECT_EQ(system.toLogString().rfind("[SYSTEM] ", 0), 0u);
}

TEST_F(ExceptionTest, JsonRendering) {
    ConfigParseException ex(ErrorCode::CONFIG_PARSE_ERROR, "Failed to parse YAML: bad",
                            "flags.yml");
    auto json = nlohmann::json::parse(ex.toJsonString());

    EXPECT_EQ(json["errorCode"], 2001);
    EXPECT_EQ(json["message"], "Failed to parse YAML: bad");
    EXPECT_EQ(json["correlationId"], ex.getCorrelationId());
    EXPECT_EQ(json["context"]["source"], "flags.yml");
    EXPECT_TRUE(json["timestamp"].is_number_integer());
}

TEST_F(ExceptionTest, TypeChecks) {
    ValidationException validation(ErrorCode::INVALID_TYPE, "bad type");
    FlagNotFoundException notFound("missing");
    ConfigParseException parse(ErrorCode::CONFIG_READ_ERROR, "unreadable");
    std::runtime_error plain("plain");

    EXPECT_TRUE(isValidationError(validation));
    EXPECT_FALSE(isValidationError(notFound));
    EXPECT_TRUE(isFlagNotFoundError(notFound));
    EXPECT_TRUE(isConfigParseError(parse));
    EXPECT_FALSE(isConfigParseError(plain));

    EXPECT_NE(asException<FlagKitException>(parse), nullptr);
    EXPECT_EQ(asException<FlagKitException>(plain), nullptr);
}

TEST_F(ExceptionTest, CreateValidationError) {
    auto ex = createValidationError("flagName", "Bad Name", "uppercase characters");

    EXPECT_EQ(ex.getCode(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(ex.getMessage(), "Validation failed: uppercase characters");
    EXPECT_EQ(ex.getField(), "flagName");
    EXPECT_EQ(ex.getContext().at("reason"), "uppercase characters");
}

TEST_F(ExceptionTest, ErrorCodeDescriptions) {
    EXPECT_STREQ(getErrorCodeDescription(ErrorCode::FLAG_NOT_FOUND), "Flag not found");
    EXPECT_STREQ(getErrorCodeDescription(ErrorCode::CONFIG_NOT_FOUND),
                 "Configuration file not found");
    EXPECT_STREQ(getErrorCodeDescription(ErrorCode::DIGEST_FAILURE),
                 "Digest computation failed");
}

TEST_F(ExceptionTest, CatchAsStdException) {
    try {
        throw FlagNotFoundException("beta");
    } catch (const std::exception& e) {
        EXPECT_TRUE(isFlagNotFoundError(e));
        EXPECT_STREQ(e.what(), "Flag \"beta\" not found");
    }
}

} // namespace flagkit
