#include <gtest/gtest.h>
#include "auditlens/analyzers/risk_scorer.hpp"

using namespace auditlens::analyzers;

namespace {

Finding MakeFinding(const std::string& type, Severity severity) {
    Finding finding;
    finding.type = type;
    finding.severity = severity;
    return finding;
}

} // anonymous namespace

class RiskScorerTest : public ::testing::Test {
protected:
    RiskScorer scorer;
    RunStatistics stats;
};

TEST_F(RiskScorerTest, EmptyRunScoresZero) {
    EXPECT_EQ(scorer.CalculateRiskScore({}, stats), 0);

    RunSummary summary = scorer.Summarize({}, stats);
    EXPECT_EQ(summary.total_findings, 0u);
    EXPECT_TRUE(summary.top_threats.empty());
}

TEST_F(RiskScorerTest, SeverityWeights) {
    std::vector<Finding> findings = {
        MakeFinding("a", Severity::CRITICAL),
        MakeFinding("b", Severity::HIGH),
        MakeFinding("c", Severity::MEDIUM),
        MakeFinding("d", Severity::LOW)
    };

    EXPECT_EQ(scorer.CalculateRiskScore(findings, stats), 18);
}

TEST_F(RiskScorerTest, StatisticsContribution) {
    stats.failed_operations = 15;                        // 1.5
    stats.blacklisted_applications = {"x"};              // 2
    stats.blacklisted_countries = {"y", "z"};            // 6
    stats.blacklisted_user_agents = {"w"};               // 1

    // 10.5 rounds half up
    EXPECT_EQ(scorer.CalculateRiskScore({}, stats), 11);
}

TEST_F(RiskScorerTest, ScoreIsClampedTo100) {
    std::vector<Finding> findings(20, MakeFinding("mfa_disable", Severity::CRITICAL));

    EXPECT_EQ(scorer.CalculateRiskScore(findings, stats), 100);
}

TEST_F(RiskScorerTest, AddingHighFindingsNeverLowersScore) {
    std::vector<Finding> findings;
    int previous = scorer.CalculateRiskScore(findings, stats);

    for (int i = 0; i < 30; ++i) {
        findings.push_back(MakeFinding("role_assignment", i % 2 ? Severity::HIGH : Severity::CRITICAL));
        int score = scorer.CalculateRiskScore(findings, stats);
        EXPECT_GE(score, previous);
        EXPECT_LE(score, 100);
        previous = score;
    }
}

TEST_F(RiskScorerTest, TopThreatsSortedAndLimited) {
    std::vector<Finding> findings;
    const std::vector<std::pair<std::string, int>> histogram = {
        {"weekend_activity", 1}, {"after_hours_activity", 3}, {"brute_force", 2},
        {"mfa_disable", 3}, {"role_assignment", 1}, {"permission_change", 4}
    };
    for (const auto& [type, count] : histogram) {
        for (int i = 0; i < count; ++i) {
            findings.push_back(MakeFinding(type, Severity::LOW));
        }
    }

    auto threats = scorer.IdentifyTopThreats(findings);

    ASSERT_EQ(threats.size(), 5u);
    EXPECT_EQ(threats[0].type, "permission_change");
    EXPECT_EQ(threats[1].type, "after_hours_activity");   // first seen among the 3s
    EXPECT_EQ(threats[2].type, "mfa_disable");
    EXPECT_EQ(threats[3].type, "brute_force");
    EXPECT_EQ(threats[4].type, "weekend_activity");       // first seen among the 1s
}

TEST_F(RiskScorerTest, SummaryCountsBySeverity) {
    std::vector<Finding> findings = {
        MakeFinding("a", Severity::CRITICAL),
        MakeFinding("b", Severity::HIGH),
        MakeFinding("b", Severity::HIGH),
        MakeFinding("c", Severity::LOW)
    };

    RunSummary summary = scorer.Summarize(findings, stats);

    EXPECT_EQ(summary.total_findings, 4u);
    EXPECT_EQ(summary.critical_findings, 1u);
    EXPECT_EQ(summary.high_severity_findings, 2u);
    EXPECT_EQ(summary.medium_severity_findings, 0u);
    EXPECT_EQ(summary.low_severity_findings, 1u);
    EXPECT_EQ(summary.risk_score, 21);
}
