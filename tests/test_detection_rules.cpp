#include <gtest/gtest.h>
#include "auditlens/analyzers/detection_rules.hpp"
#include "auditlens/analyzers/event_normalizer.hpp"
#include "auditlens/analyzers/run_context.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace auditlens::analyzers;
using auditlens::testing::MakeRecord;
using auditlens::testing::SaturdayMillis;
using auditlens::testing::WeekdayMillis;
using json = nlohmann::json;

class DetectionRulesTest : public ::testing::Test {
protected:
    DetectionRulesTest()
        : config({BlacklistEntry{"Azure CLI", "Scripted access"}},
                 {BlacklistEntry{"North Korea", ""}},
                 {BlacklistEntry{"python-requests", ""}})
        , context(config, catalog) {
    }

    void Run(const DetectionRule& rule, const json& raw) {
        NormalizedEvent event = EventNormalizer::Normalize(raw);
        context.RecordEvent(event);
        rule.Evaluate(event, context);
        context.PushRecentEvent(event);
    }

    std::vector<std::string> Types() const {
        std::vector<std::string> types;
        for (const auto& finding : context.Findings()) {
            types.push_back(finding.type);
        }
        return types;
    }

    DetectionConfig config;
    MitreCatalog catalog;
    RunContext context;
};

TEST_F(DetectionRulesTest, BlacklistedApplication) {
    BlacklistRule rule;
    json raw = MakeRecord("alice@contoso.com", "Sign-in", "Success", WeekdayMillis(10));
    raw["AppDisplayName"] = "Microsoft Azure CLI";
    raw["ClientIP"] = "10.1.1.1";

    Run(rule, raw);

    ASSERT_EQ(context.Findings().size(), 1u);
    const Finding& finding = context.Findings()[0];
    EXPECT_EQ(finding.type, "blacklisted_application");
    EXPECT_EQ(finding.severity, Severity::HIGH);
    EXPECT_EQ(finding.evidence["blacklistReason"], "Scripted access");
    EXPECT_EQ(finding.affected_entities.ip_addresses, std::vector<std::string>{"10.1.1.1"});

    RunStatistics stats = context.FinalizeStatistics();
    EXPECT_EQ(stats.blacklisted_applications, std::vector<std::string>{"Microsoft Azure CLI"});
}

TEST_F(DetectionRulesTest, BlacklistedCountryRecordsIpAddress) {
    BlacklistRule rule;
    json raw = MakeRecord("bob@contoso.com", "Sign-in", "Success", WeekdayMillis(10));
    raw["Country"] = "North Korea";
    raw["ClientIP"] = "175.45.176.1";

    Run(rule, raw);

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "blacklisted_country");
    EXPECT_EQ(context.Findings()[0].evidence["blacklistReason"], "Country is on blacklist");

    RunStatistics stats = context.FinalizeStatistics();
    EXPECT_EQ(stats.blacklisted_countries, std::vector<std::string>{"North Korea"});
    EXPECT_EQ(stats.blacklisted_ip_addresses, std::vector<std::string>{"175.45.176.1"});
}

TEST_F(DetectionRulesTest, BlacklistedUserAgentIsMedium) {
    BlacklistRule rule;
    json raw = MakeRecord("carol@contoso.com", "Sign-in", "Success", WeekdayMillis(10));
    raw["UserAgent"] = "python-requests/2.31";

    Run(rule, raw);

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "blacklisted_user_agent");
    EXPECT_EQ(context.Findings()[0].severity, Severity::MEDIUM);
}

TEST_F(DetectionRulesTest, UnknownValuesNeverMatchBlacklists) {
    BlacklistRule rule;
    Run(rule, MakeRecord("dave@contoso.com", "Sign-in", "Success", WeekdayMillis(10)));

    EXPECT_TRUE(context.Findings().empty());
}

TEST_F(DetectionRulesTest, MfaDisableIsCritical) {
    SuspiciousOperationRule rule;
    Run(rule, MakeRecord("eve@contoso.com", "Disable MFA for user", "success", WeekdayMillis(11)));

    ASSERT_EQ(context.Findings().size(), 1u);
    const Finding& finding = context.Findings()[0];
    EXPECT_EQ(finding.type, "mfa_disable");
    EXPECT_EQ(finding.severity, Severity::CRITICAL);
    EXPECT_EQ(finding.category, "security");
    EXPECT_FALSE(finding.mitre_mapping.tactics.empty());
    EXPECT_FALSE(finding.recommendations.empty());

    RunStatistics stats = context.FinalizeStatistics();
    EXPECT_EQ(stats.suspicious_activities, 1u);
    EXPECT_EQ(stats.critical_severity_events, 1u);
}

TEST_F(DetectionRulesTest, SuspiciousPatternsMatchCaseInsensitively) {
    SuspiciousOperationRule rule;
    Run(rule, MakeRecord("frank@contoso.com", "ADD MEMBER TO ROLE", "success", WeekdayMillis(11)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "role_assignment");
    EXPECT_EQ(context.FinalizeStatistics().high_severity_events, 1u);
}

TEST_F(DetectionRulesTest, OneOperationCanMatchSeveralPatterns) {
    SuspiciousOperationRule rule;
    Run(rule, MakeRecord("gina@contoso.com", "Grant admin consent and grant permission",
                         "success", WeekdayMillis(11)));

    auto types = Types();
    EXPECT_NE(std::find(types.begin(), types.end(), "permission_grant"), types.end());
    EXPECT_NE(std::find(types.begin(), types.end(), "admin_consent"), types.end());
}

TEST_F(DetectionRulesTest, AfterHoursActivity) {
    TimeAnomalyRule rule;
    Run(rule, MakeRecord("henry@contoso.com", "Update user", "success", WeekdayMillis(23, 30)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "after_hours_activity");
    EXPECT_EQ(context.Findings()[0].evidence["hour"], 23);
}

TEST_F(DetectionRulesTest, BusinessHoursBoundaries) {
    TimeAnomalyRule rule;
    Run(rule, MakeRecord("ivy@contoso.com", "Update user", "success", WeekdayMillis(6)));
    Run(rule, MakeRecord("ivy@contoso.com", "Update user", "success", WeekdayMillis(22, 59)));

    EXPECT_TRUE(context.Findings().empty());

    Run(rule, MakeRecord("ivy@contoso.com", "Update user", "success", WeekdayMillis(5, 59)));
    EXPECT_EQ(context.Findings().size(), 1u);
}

TEST_F(DetectionRulesTest, WeekendActivity) {
    TimeAnomalyRule rule;
    Run(rule, MakeRecord("jack@contoso.com", "Update user", "success", SaturdayMillis(12)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "weekend_activity");
    EXPECT_EQ(context.Findings()[0].severity, Severity::LOW);
    EXPECT_EQ(context.Findings()[0].evidence["dayOfWeek"], 6);
}

TEST_F(DetectionRulesTest, MissingTimestampSkipsTimeChecks) {
    TimeAnomalyRule rule;
    Run(rule, {{"UserId", "kate@contoso.com"}, {"Operation", "Update user"}});

    EXPECT_TRUE(context.Findings().empty());
}

TEST_F(DetectionRulesTest, PermissionChangeListsTargets) {
    PermissionChangeRule rule;
    json raw = MakeRecord("leo@contoso.com", "Assign role to user", "success", WeekdayMillis(10));
    raw["targetResources"] = json::array({{{"displayName", "Security Reader"}}});

    Run(rule, raw);

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "permission_change");
    EXPECT_EQ(context.Findings()[0].affected_entities.target_resources,
              std::vector<std::string>{"Security Reader"});
}

TEST_F(DetectionRulesTest, AccountLifecycleRequiresAdjacentUser) {
    AccountLifecycleRule rule;
    Run(rule, MakeRecord("mia@contoso.com", "Disable MFA for user", "success", WeekdayMillis(10)));
    EXPECT_TRUE(context.Findings().empty());

    Run(rule, MakeRecord("mia@contoso.com", "Delete user", "success", WeekdayMillis(10)));
    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "user_deletion");
    EXPECT_EQ(context.Findings()[0].category, "account_management");
}

TEST_F(DetectionRulesTest, PasswordChangeIsLow) {
    AccountLifecycleRule rule;
    Run(rule, MakeRecord("ned@contoso.com", "Change user password", "success", WeekdayMillis(10)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "password_change");
    EXPECT_EQ(context.Findings()[0].severity, Severity::LOW);
}

TEST_F(DetectionRulesTest, ApplicationLifecycle) {
    ApplicationLifecycleRule rule;
    Run(rule, MakeRecord("olga@contoso.com", "Add service principal", "success", WeekdayMillis(10)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "service_principal");
    EXPECT_EQ(context.Findings()[0].category, "application_management");
}

TEST_F(DetectionRulesTest, BruteForceNeedsMoreThanThreeFailures) {
    BruteForceRule rule;
    for (int i = 0; i < 3; ++i) {
        Run(rule, MakeRecord("pat@contoso.com", "UserLoginFailed", "Failure",
                             WeekdayMillis(10, i * 5)));
    }
    EXPECT_TRUE(context.Findings().empty());

    Run(rule, MakeRecord("pat@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 15)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "brute_force");
    EXPECT_EQ(context.Findings()[0].severity, Severity::HIGH);
    EXPECT_EQ(context.Findings()[0].evidence["failureCount"], 4);
}

TEST_F(DetectionRulesTest, BruteForceIgnoresFailuresOutsideWindow) {
    BruteForceRule rule;
    Run(rule, MakeRecord("quinn@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(8)));
    Run(rule, MakeRecord("quinn@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(9, 30)));
    Run(rule, MakeRecord("quinn@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(11)));
    Run(rule, MakeRecord("quinn@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(12, 30)));

    EXPECT_TRUE(context.Findings().empty());
}

TEST_F(DetectionRulesTest, BruteForceCountsPerUser) {
    BruteForceRule rule;
    Run(rule, MakeRecord("rita@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 0)));
    Run(rule, MakeRecord("sam@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 1)));
    Run(rule, MakeRecord("rita@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 2)));
    Run(rule, MakeRecord("sam@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 3)));

    EXPECT_TRUE(context.Findings().empty());
}

TEST_F(DetectionRulesTest, BruteForceSeesFailuresWithinLookback) {
    BruteForceRule rule;
    for (int i = 0; i < 3; ++i) {
        Run(rule, MakeRecord("uma@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, i)));
    }
    // 97 filler events keep all three failures among the last 100
    for (int i = 0; i < 97; ++i) {
        Run(rule, MakeRecord("victor@contoso.com", "Sign-in", "Success", WeekdayMillis(10, 10)));
    }
    Run(rule, MakeRecord("uma@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 20)));

    ASSERT_EQ(context.Findings().size(), 1u);
    EXPECT_EQ(context.Findings()[0].type, "brute_force");
    EXPECT_EQ(context.Findings()[0].evidence["failureCount"], 4);
}

TEST_F(DetectionRulesTest, BruteForceIgnoresFailuresBeyondLookback) {
    BruteForceRule rule;
    for (int i = 0; i < 3; ++i) {
        Run(rule, MakeRecord("uma@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, i)));
    }
    // 98 filler events push the oldest failure out of the last 100
    for (int i = 0; i < 98; ++i) {
        Run(rule, MakeRecord("victor@contoso.com", "Sign-in", "Success", WeekdayMillis(10, 10)));
    }
    EXPECT_EQ(context.RecentEvents().size(), 100u);

    Run(rule, MakeRecord("uma@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(10, 20)));

    EXPECT_TRUE(context.Findings().empty());
}

TEST_F(DetectionRulesTest, FindingIdsAreSequential) {
    SuspiciousOperationRule rule;
    Run(rule, MakeRecord("tom@contoso.com", "Disable MFA", "success", WeekdayMillis(10)));
    Run(rule, MakeRecord("tom@contoso.com", "Password reset", "success", WeekdayMillis(10)));

    ASSERT_EQ(context.Findings().size(), 2u);
    EXPECT_EQ(context.Findings()[0].id, "finding_1");
    EXPECT_EQ(context.Findings()[1].id, "finding_2");
}

TEST(DetectionRuleFactoryTest, DefaultRuleOrder) {
    auto rules = CreateDefaultRules();

    ASSERT_EQ(rules.size(), 7u);
    EXPECT_EQ(rules.front()->Name(), "blacklist");
    EXPECT_EQ(rules.back()->Name(), "brute_force");
}
