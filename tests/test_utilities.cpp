/**
 * @file test_utilities.cpp
 * @brief Unit tests for utilities, configuration and error codes
 *
 * Tests shared helpers including:
 * - ISO 8601 timestamp formatting and parsing
 * - String helpers and UUID generation
 * - File I/O
 * - Configuration directories and scope validation
 * - Error code names and classification
 */

#include <gtest/gtest.h>
#include "agentauth/utilities.hpp"
#include "agentauth/config.hpp"
#include "agentauth/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <set>

using namespace agentauth;

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(UtilitiesTest, FormatTimestamp) {
    EXPECT_EQ(utilities::format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(utilities::format_timestamp(1700000000), "2023-11-14T22:13:20Z");
}

TEST(UtilitiesTest, ParseTimestamp) {
    EXPECT_EQ(utilities::parse_timestamp("2023-11-14T22:13:20Z"), 1700000000);
    EXPECT_EQ(utilities::parse_timestamp("2023-11-14T22:13:20.999Z"), 1700000000);
    EXPECT_EQ(utilities::parse_timestamp("2023-11-14T23:13:20+01:00"), 1700000000);
    EXPECT_EQ(utilities::parse_timestamp("2023-11-14T17:13:20-05:00"), 1700000000);
    EXPECT_EQ(utilities::parse_timestamp("2000-02-29T00:00:00Z"), 951782400);
}

TEST(UtilitiesTest, ParseTimestampRejectsInvalid) {
    EXPECT_FALSE(utilities::parse_timestamp("").has_value());
    EXPECT_FALSE(utilities::parse_timestamp("2023-11-14").has_value());
    EXPECT_FALSE(utilities::parse_timestamp("2023-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(utilities::parse_timestamp("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(utilities::parse_timestamp("2023-11-14T22:13:20X").has_value());
    EXPECT_FALSE(utilities::parse_timestamp("2023-11-14T22:13:20Z trailing").has_value());
}

TEST(UtilitiesTest, TimestampRoundTrip) {
    int64_t now = utilities::current_timestamp();
    EXPECT_EQ(utilities::parse_timestamp(utilities::format_timestamp(now)), now);
}

// ============================================================================
// String Tests
// ============================================================================

TEST(UtilitiesTest, SplitString) {
    EXPECT_EQ(utilities::split_string("a.b.c", '.'), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(utilities::split_string("a..c", '.'), (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(utilities::split_string("a.", '.'), (std::vector<std::string>{"a", ""}));
}

TEST(UtilitiesTest, StringHelpers) {
    EXPECT_EQ(utilities::trim_string("  token \t\n"), "token");
    EXPECT_EQ(utilities::to_lowercase("MoN"), "mon");
    EXPECT_TRUE(utilities::starts_with("Bearer abc", "Bearer "));
    EXPECT_FALSE(utilities::starts_with("Bear", "Bearer "));
}

TEST(UtilitiesTest, GenerateUuid) {
    std::set<std::string> uuids;
    for (int i = 0; i < 100; i++) {
        std::string uuid = utilities::generate_uuid();
        ASSERT_EQ(uuid.length(), 36u);
        EXPECT_EQ(uuid[14], '4');
        EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
        uuids.insert(uuid);
    }
    EXPECT_EQ(uuids.size(), 100u);
}

// ============================================================================
// File I/O Tests
// ============================================================================

TEST(UtilitiesTest, WriteAndReadFile) {
    auto path = std::filesystem::temp_directory_path() / "agentauth_utilities_test.txt";

    ASSERT_TRUE(utilities::write_file(path.string(), "hello\n"));
    EXPECT_EQ(utilities::read_file(path.string()), std::optional<std::string>("hello\n"));

    auto binary = utilities::read_file_binary(path.string());
    ASSERT_TRUE(binary.has_value());
    EXPECT_EQ(binary->size(), 6u);

    std::filesystem::remove(path);
    EXPECT_FALSE(utilities::read_file(path.string()).has_value());
}

// ============================================================================
// Logging Tests
// ============================================================================

TEST(UtilitiesTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("debug"), utilities::LogLevel::DEBUG);
    EXPECT_EQ(utilities::parse_log_level(" WARNING "), utilities::LogLevel::WARN);
    EXPECT_FALSE(utilities::parse_log_level("verbose").has_value());
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(ConfigTest, DataDirectoryFromEnvironment) {
    setenv("AGENTAUTH_DATA_DIR", "/tmp/agentauth_config_test", 1);
    EXPECT_EQ(config::get_data_directory(), std::filesystem::path("/tmp/agentauth_config_test"));
    EXPECT_EQ(config::get_identity_directory(), std::filesystem::path("/tmp/agentauth_config_test/identities"));
    unsetenv("AGENTAUTH_DATA_DIR");
}

TEST(ConfigTest, ZoneinfoDirectory) {
    setenv("AGENTAUTH_ZONEINFO_DIR", "/opt/zoneinfo", 1);
    EXPECT_EQ(config::get_zoneinfo_directory(), std::filesystem::path("/opt/zoneinfo"));
    unsetenv("AGENTAUTH_ZONEINFO_DIR");
}

TEST(ConfigTest, ValidateScope) {
    EXPECT_TRUE(config::validate_scope("mail.read"));
    EXPECT_TRUE(config::validate_scope("calendar:write"));
    EXPECT_FALSE(config::validate_scope(""));
    EXPECT_FALSE(config::validate_scope("mail read"));
    EXPECT_FALSE(config::validate_scope("mail\nread"));
}

// ============================================================================
// Error Code Tests
// ============================================================================

TEST(ErrorsTest, CodeNamesRoundTrip) {
    for (auto code : {ErrorCode::MALFORMED_TOKEN, ErrorCode::TOKEN_EXPIRED, ErrorCode::CHAIN_MISMATCH,
                      ErrorCode::USAGE_LIMIT_EXCEEDED, ErrorCode::UNKNOWN_TIME_ZONE}) {
        EXPECT_EQ(string_to_error_code(error_code_to_string(code)), code);
    }
    EXPECT_EQ(error_code_to_string(ErrorCode::TOKEN_EXPIRED), "TokenExpired");
    EXPECT_FALSE(string_to_error_code("NotAnError").has_value());
}

TEST(ErrorsTest, ExceptionCarriesCode) {
    AgentAuthError error(ErrorCode::SCOPE_NOT_DELEGATED, "mail.delete");
    EXPECT_EQ(error.code(), ErrorCode::SCOPE_NOT_DELEGATED);
    EXPECT_NE(std::string(error.what()).find("mail.delete"), std::string::npos);
}

TEST(ErrorsTest, AuthenticationVersusAuthorization) {
    EXPECT_TRUE(is_authentication_failure(ErrorCode::INVALID_SIGNATURE));
    EXPECT_TRUE(is_authentication_failure(ErrorCode::TOKEN_EXPIRED));
    EXPECT_FALSE(is_authentication_failure(ErrorCode::INSUFFICIENT_SCOPE));
    EXPECT_FALSE(is_authentication_failure(ErrorCode::USAGE_LIMIT_EXCEEDED));
}
