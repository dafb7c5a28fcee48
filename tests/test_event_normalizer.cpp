#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/utils/time_utils.hpp"

using namespace auditlens::analyzers;
using auditlens::utils::TimeUtils;
using json = nlohmann::json;

TEST(EventNormalizerTest, GraphDirectoryAuditShape) {
    json raw = {
        {"id", "Directory_123"},
        {"activityDateTime", "2024-03-06T10:15:00Z"},
        {"activityDisplayName", "Add member to role"},
        {"result", "success"},
        {"category", "RoleManagement"},
        {"correlationId", "corr-1"},
        {"initiatedBy", {
            {"user", {
                {"userPrincipalName", "alice@contoso.com"},
                {"ipAddress", "10.0.0.5"}
            }},
            {"app", {{"displayName", "Azure Portal"}}}
        }},
        {"targetResources", json::array({{{"displayName", "Global Administrator"}}})}
    };

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_EQ(event.id, "Directory_123");
    EXPECT_EQ(event.UserName(), "alice@contoso.com");
    EXPECT_FALSE(event.user.IsUnknown());
    EXPECT_EQ(event.operation, "Add member to role");
    EXPECT_EQ(event.result, "success");
    EXPECT_EQ(event.ip_address, "10.0.0.5");
    EXPECT_EQ(event.application, "Azure Portal");
    EXPECT_EQ(event.category, "RoleManagement");
    EXPECT_EQ(event.session_id, "corr-1");
    ASSERT_TRUE(event.timestamp.has_value());
    EXPECT_EQ(TimeUtils::FormatIso8601(*event.timestamp), "2024-03-06T10:15:00.000Z");
    EXPECT_EQ(event.target_resources.size(), 1u);
}

TEST(EventNormalizerTest, UnifiedAuditLogShape) {
    json raw = {
        {"CreationTime", "2024-03-06T08:00:00Z"},
        {"Operation", "Reset user password."},
        {"UserId", "bob@contoso.com"},
        {"ResultStatus", "Success"},
        {"ClientIP", "203.0.113.9"},
        {"Country", "Germany"}
    };

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_EQ(event.UserName(), "bob@contoso.com");
    EXPECT_EQ(event.operation, "Reset user password.");
    EXPECT_EQ(event.result, "Success");
    EXPECT_EQ(event.ip_address, "203.0.113.9");
    EXPECT_EQ(event.location, "Germany");
    EXPECT_EQ(event.user_agent, kUnknown);
    EXPECT_EQ(event.application, kUnknown);
    EXPECT_EQ(event.id.rfind("event_", 0), 0u);
}

TEST(EventNormalizerTest, MissingFieldsBecomeUnknown) {
    NormalizedEvent event = EventNormalizer::Normalize(json::object());

    EXPECT_EQ(event.operation, kUnknown);
    EXPECT_EQ(event.result, kUnknown);
    EXPECT_EQ(event.ip_address, kUnknown);
    EXPECT_EQ(event.location, kUnknown);
    EXPECT_FALSE(event.timestamp.has_value());
    EXPECT_FALSE(event.UserName().empty());
}

TEST(EventNormalizerTest, FlatDottedColumnsFromCsv) {
    json raw = {
        {"initiatedBy.user.userPrincipalName", "carol@contoso.com"},
        {"activityDisplayName", "Update user"}
    };

    NormalizedEvent event = EventNormalizer::Normalize(raw);
    EXPECT_EQ(event.UserName(), "carol@contoso.com");
}

TEST(EventNormalizerTest, EmptyStringFallsThroughToNextField) {
    json raw = {
        {"activityDisplayName", ""},
        {"Operation", "Add service principal."}
    };

    EXPECT_EQ(EventNormalizer::Normalize(raw).operation, "Add service principal.");
}

TEST(EventNormalizerTest, IdentityFromSession) {
    json raw = {{"SessionId", "sess-42"}, {"ClientIP", "198.51.100.1"}};

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_TRUE(event.user.IsUnknown());
    EXPECT_EQ(event.user.strategy, IdentityStrategy::SESSION);
    EXPECT_EQ(event.UserName(), "Unknown_Session_sess-42");
}

TEST(EventNormalizerTest, IdentityFromIp) {
    json raw = {{"ClientIP", "198.51.100.1"}, {"AppDisplayName", "Graph Explorer"}};

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_EQ(event.user.strategy, IdentityStrategy::IP);
    EXPECT_EQ(event.UserName(), "Unknown_IP_198.51.100.1");
}

TEST(EventNormalizerTest, IdentityFromApplication) {
    json raw = {{"AppDisplayName", "Graph Explorer"}};

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_EQ(event.user.strategy, IdentityStrategy::APPLICATION);
    EXPECT_EQ(event.UserName(), "Unknown_App_Graph Explorer");
}

TEST(EventNormalizerTest, IdentityFromTimestamp) {
    json raw = {{"Operation", "Sign-in"}, {"CreationTime", 1709719200000LL}};

    NormalizedEvent event = EventNormalizer::Normalize(raw);

    EXPECT_EQ(event.user.strategy, IdentityStrategy::TIMESTAMP);
    EXPECT_EQ(event.UserName().rfind("Unknown_Time_1709719200000_", 0), 0u);
}

TEST(EventNormalizerTest, EpochMillisTimestamp) {
    NormalizedEvent event = EventNormalizer::Normalize({{"TimeGenerated", 1709720100000}});

    ASSERT_TRUE(event.timestamp.has_value());
    EXPECT_EQ(TimeUtils::ToEpochMillis(*event.timestamp), 1709720100000);
}

TEST(EventNormalizerTest, FarFutureSentinelTimestampIsDropped) {
    NormalizedEvent event = EventNormalizer::Normalize({
        {"activityDateTime", "9999-12-31T23:59:59Z"},
        {"Operation", "Sign-in"}
    });

    EXPECT_FALSE(event.timestamp.has_value());
    EXPECT_EQ(event.operation, "Sign-in");
}

TEST(EventNormalizerTest, OversizedNumericTimestampIsDropped) {
    EXPECT_FALSE(EventNormalizer::Normalize({{"Timestamp", 99999999999999}}).timestamp.has_value());
    EXPECT_FALSE(EventNormalizer::Normalize({{"Timestamp", 1e300}}).timestamp.has_value());
    EXPECT_FALSE(EventNormalizer::Normalize({{"Timestamp", -1e300}}).timestamp.has_value());
    EXPECT_FALSE(EventNormalizer::Normalize(
        {{"Timestamp", std::numeric_limits<std::uint64_t>::max()}}).timestamp.has_value());
}

TEST(EventNormalizerTest, NormalizationIsDeterministic) {
    json raw = {{"Operation", "Sign-in"}, {"Location", "Paris"}};

    NormalizedEvent first = EventNormalizer::Normalize(raw);
    NormalizedEvent second = EventNormalizer::Normalize(raw);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.UserName(), second.UserName());
}

TEST(EventNormalizerTest, SyntheticIdentitiesDifferByContent) {
    NormalizedEvent a = EventNormalizer::Normalize({{"Operation", "Sign-in"}});
    NormalizedEvent b = EventNormalizer::Normalize({{"Operation", "Sign-out"}});

    EXPECT_NE(a.user, b.user);
}

TEST(EventNormalizerTest, ResultClassification) {
    EXPECT_TRUE(EventNormalizer::IsSuccess("success"));
    EXPECT_TRUE(EventNormalizer::IsSuccess("Success"));
    EXPECT_FALSE(EventNormalizer::IsSuccess("SUCCESS"));

    EXPECT_TRUE(EventNormalizer::IsFailure("failure"));
    EXPECT_TRUE(EventNormalizer::IsFailure("Failure"));
    EXPECT_TRUE(EventNormalizer::IsFailure("failed"));
    EXPECT_FALSE(EventNormalizer::IsFailure("Unknown"));
}
