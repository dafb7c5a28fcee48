#include <gtest/gtest.h>
#include "auditlens/analyzers/audit_analyzer.hpp"
#include "auditlens/reporters/json_reporter.hpp"
#include "test_helpers.hpp"

using namespace auditlens::analyzers;
using auditlens::reporters::JsonReporter;
using auditlens::testing::MakeRecord;
using auditlens::testing::WeekdayMillis;
using json = nlohmann::json;

class AuditAnalyzerTest : public ::testing::Test {
protected:
    AuditAnalyzerTest()
        : analyzer(DetectionConfig::Empty()) {
    }

    AuditAnalyzer analyzer;
};

TEST_F(AuditAnalyzerTest, EmptyBatch) {
    AnalysisReport report = analyzer.Analyze({});

    EXPECT_TRUE(report.findings.empty());
    EXPECT_EQ(report.statistics.total_events, 0u);
    EXPECT_EQ(report.summary.total_findings, 0u);
    EXPECT_EQ(report.summary.risk_score, 0);
    EXPECT_TRUE(report.summary.top_threats.empty());
}

TEST_F(AuditAnalyzerTest, MfaDisableScenario) {
    std::vector<json> events = {
        MakeRecord("admin@contoso.com", "Disable MFA for user", "success", WeekdayMillis(10))
    };

    AnalysisReport report = analyzer.Analyze(events);

    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].type, "mfa_disable");
    EXPECT_EQ(report.findings[0].severity, Severity::CRITICAL);
    EXPECT_EQ(report.summary.critical_findings, 1u);
    EXPECT_EQ(report.summary.risk_score, 10);
    ASSERT_EQ(report.summary.top_threats.size(), 1u);
    EXPECT_EQ(report.summary.top_threats[0].type, "mfa_disable");

    EXPECT_EQ(report.statistics.total_events, 1u);
    EXPECT_EQ(report.statistics.successful_operations, 1u);
    EXPECT_EQ(report.statistics.critical_severity_events, 1u);
}

TEST_F(AuditAnalyzerTest, FourFailuresWithinAnHourIsBruteForce) {
    std::vector<json> events;
    for (int i = 0; i < 4; ++i) {
        events.push_back(MakeRecord("target@contoso.com", "UserLoginFailed", "Failure",
                                    WeekdayMillis(10, i * 10)));
    }

    AnalysisReport report = analyzer.Analyze(events);

    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].type, "brute_force");
    EXPECT_EQ(report.statistics.failed_operations, 4u);
    // 5 for the finding plus 0.4 for failed operations
    EXPECT_EQ(report.summary.risk_score, 5);
}

TEST_F(AuditAnalyzerTest, ThreeFailuresIsNotBruteForce) {
    std::vector<json> events;
    for (int i = 0; i < 3; ++i) {
        events.push_back(MakeRecord("target@contoso.com", "UserLoginFailed", "Failure",
                                    WeekdayMillis(10, i * 10)));
    }

    AnalysisReport report = analyzer.Analyze(events);

    EXPECT_TRUE(report.findings.empty());
    EXPECT_EQ(report.summary.risk_score, 0);
}

TEST_F(AuditAnalyzerTest, HighActivityUser) {
    std::vector<json> events(1001, MakeRecord("bot@contoso.com", "FileAccessed", "success",
                                              WeekdayMillis(12)));

    AnalysisReport report = analyzer.Analyze(events);

    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].type, "high_activity_user");
    EXPECT_EQ(report.statistics.unique_users, 1u);
}

TEST_F(AuditAnalyzerTest, CorrelationCanBeDisabled) {
    AuditAnalyzer::Config config;
    config.enable_correlation = false;
    AuditAnalyzer quiet(DetectionConfig::Empty(), config);

    std::vector<json> events(1001, MakeRecord("bot@contoso.com", "FileAccessed", "success",
                                              WeekdayMillis(12)));

    EXPECT_TRUE(quiet.Analyze(events).findings.empty());
}

TEST_F(AuditAnalyzerTest, AnalysisIsDeterministic) {
    std::vector<json> events = {
        MakeRecord("a@contoso.com", "Add member to role", "success", WeekdayMillis(23)),
        MakeRecord("b@contoso.com", "Delete user", "success", WeekdayMillis(9)),
        {{"Operation", "Update application"}, {"ClientIP", "198.51.100.7"}}
    };
    auto analysis_time = auditlens::utils::TimeUtils::FromEpochMillis(WeekdayMillis(15));

    json first = JsonReporter::ReportToJson(analyzer.Analyze(events, analysis_time));
    json second = JsonReporter::ReportToJson(analyzer.Analyze(events, analysis_time));

    EXPECT_EQ(first, second);
}

TEST_F(AuditAnalyzerTest, FindingsFollowInputAndRuleOrder) {
    std::vector<json> events = {
        MakeRecord("a@contoso.com", "Add member to role", "success", WeekdayMillis(23)),
        MakeRecord("b@contoso.com", "Delete user", "success", WeekdayMillis(9))
    };

    AnalysisReport report = analyzer.Analyze(events);

    std::vector<std::string> types;
    for (const auto& finding : report.findings) {
        types.push_back(finding.type);
    }

    std::vector<std::string> expected = {
        "role_assignment", "after_hours_activity",
        "user_deletion", "user_deletion"
    };
    EXPECT_EQ(types, expected);
    EXPECT_EQ(report.findings.front().id, "finding_1");
    EXPECT_EQ(report.findings.back().id, "finding_4");
}

TEST_F(AuditAnalyzerTest, SynthesizedUsersAreCounted) {
    std::vector<json> events = {
        {{"Operation", "Read"}, {"SessionId", "s-1"}},
        {{"Operation", "Read"}, {"ClientIP", "203.0.113.9"}}
    };

    AnalysisReport report = analyzer.Analyze(events);

    EXPECT_EQ(report.statistics.data_quality.total_unknown_users, 2u);
    EXPECT_EQ(report.statistics.data_quality.unknown_users_by_session, 1u);
    EXPECT_EQ(report.statistics.data_quality.unknown_users_by_ip, 1u);
}

TEST(AuditAnalyzerConstructionTest, NullConfigurationThrows) {
    EXPECT_THROW(AuditAnalyzer analyzer(nullptr), std::invalid_argument);
}
