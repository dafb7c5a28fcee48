#include <gtest/gtest.h>
#include "auditlens/reporters/alert_emitter.hpp"
#include "auditlens/reporters/alert_sinks.hpp"

#include <filesystem>
#include <fstream>

using namespace auditlens::reporters;
using namespace auditlens::analyzers;
using json = nlohmann::json;

namespace {

Finding MakeFinding(const std::string& id, Severity severity) {
    Finding finding;
    finding.id = id;
    finding.title = "Finding " + id;
    finding.description = "Description of " + id;
    finding.severity = severity;
    finding.type = "mfa_disable";
    finding.category = "security";
    finding.evidence = {{"operation", "Disable MFA"}};
    finding.affected_entities.users = {"admin@contoso.com"};
    finding.mitre_mapping.tactics = {"Defense Evasion"};
    finding.recommendations = {"Re-enable MFA"};
    return finding;
}

class RecordingSink : public AlertSink {
public:
    AlertPostResult PostAlert(const Alert& alert) override {
        posted.push_back(alert);
        if (fail_on_title == alert.title) {
            throw AlertDeliveryError("sink unavailable");
        }
        AlertPostResult result;
        result.success = alert.title != reject_title;
        result.alert = alert.ToJson();
        result.alert["id"] = "alert-" + std::to_string(posted.size());
        return result;
    }

    std::vector<Alert> posted;
    std::string fail_on_title;
    std::string reject_title;
};

} // anonymous namespace

TEST(AlertEmitterTest, OnlyHighAndCriticalFindingsAlert) {
    auto sink = std::make_shared<RecordingSink>();
    AlertEmitter emitter(sink);

    std::vector<Finding> findings = {
        MakeFinding("1", Severity::LOW),
        MakeFinding("2", Severity::HIGH),
        MakeFinding("3", Severity::MEDIUM),
        MakeFinding("4", Severity::CRITICAL)
    };

    auto alerts = emitter.Emit(findings, AlertContext{});

    ASSERT_EQ(alerts.size(), 2u);
    ASSERT_EQ(sink->posted.size(), 2u);
    EXPECT_EQ(sink->posted[0].severity, "high");
    EXPECT_EQ(sink->posted[1].severity, "critical");
    EXPECT_EQ(alerts[0]["id"], "alert-1");
}

TEST(AlertEmitterTest, AlertCarriesFindingAndContext) {
    AlertContext context;
    context.analysis_id = "analysis-7";
    context.extraction_id = "ext-3";

    Alert alert = Alert::FromFinding(MakeFinding("9", Severity::CRITICAL), context);

    EXPECT_EQ(alert.title, "Finding 9");
    EXPECT_EQ(alert.status, "new");
    EXPECT_EQ(alert.source, "entra_audit_logs");
    EXPECT_EQ(alert.organization_id, kDefaultOrganizationId);
    EXPECT_EQ(alert.analysis_id, "analysis-7");
    EXPECT_EQ(alert.data["finding"]["id"], "9");
    EXPECT_EQ(alert.data["evidence"]["operation"], "Disable MFA");
    EXPECT_EQ(alert.data["recommendations"][0], "Re-enable MFA");
    EXPECT_EQ(alert.data["mitreAttack"]["tactics"][0], "Defense Evasion");

    json j = alert.ToJson();
    EXPECT_EQ(j["organizationId"], kDefaultOrganizationId);
    EXPECT_EQ(j["extractionId"], "ext-3");
}

TEST(AlertEmitterTest, DeliveryFailuresAreSkipped) {
    auto sink = std::make_shared<RecordingSink>();
    sink->fail_on_title = "Finding 1";
    sink->reject_title = "Finding 2";
    AlertEmitter emitter(sink);

    std::vector<Finding> findings = {
        MakeFinding("1", Severity::CRITICAL),
        MakeFinding("2", Severity::HIGH),
        MakeFinding("3", Severity::HIGH)
    };

    auto alerts = emitter.Emit(findings, AlertContext{});

    EXPECT_EQ(sink->posted.size(), 3u);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0]["title"], "Finding 3");
}

TEST(AlertEmitterTest, RequiresSink) {
    EXPECT_THROW(AlertEmitter emitter(nullptr), std::invalid_argument);
}

TEST(JsonFileAlertSinkTest, AppendsJsonLines) {
    auto path = std::filesystem::temp_directory_path() / "auditlens_alerts_test" / "alerts.jsonl";
    std::filesystem::remove_all(path.parent_path());

    JsonFileAlertSink sink(path);
    AlertContext context;
    auto first = sink.PostAlert(Alert::FromFinding(MakeFinding("1", Severity::HIGH), context));
    auto second = sink.PostAlert(Alert::FromFinding(MakeFinding("2", Severity::HIGH), context));

    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.alert["id"].get<std::string>().rfind("alert_", 0), 0u);
    EXPECT_NE(first.alert["id"], second.alert["id"]);

    std::ifstream input(path);
    std::string line;
    std::vector<json> lines;
    while (std::getline(input, line)) {
        lines.push_back(json::parse(line));
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1]["title"], "Finding 2");

    std::filesystem::remove_all(path.parent_path());
}
