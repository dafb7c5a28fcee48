#include <gtest/gtest.h>
#include "auditlens/core/audit_task_handler.hpp"
#include "test_helpers.hpp"

using namespace auditlens::core;
using namespace auditlens::analyzers;
using auditlens::parsers::AuditDataSource;
using auditlens::parsers::NoDataFoundError;
using auditlens::reporters::Alert;
using auditlens::reporters::AlertPostResult;
using auditlens::reporters::AlertSink;
using auditlens::testing::MakeRecord;
using auditlens::testing::WeekdayMillis;
using json = nlohmann::json;

namespace {

class RecordingProgress : public ProgressReporter {
public:
    void Report(int percent, const std::string& message) override {
        steps.emplace_back(percent, message);
    }

    std::vector<std::pair<int, std::string>> steps;
};

class FakeDataSource : public AuditDataSource {
public:
    std::vector<json> Fetch(const std::string& extraction_id) override {
        requested = extraction_id;
        if (extraction_id == "missing") {
            throw NoDataFoundError("No extraction data found");
        }
        return records;
    }

    std::string Name() const override { return "fake"; }

    std::vector<json> records;
    std::string requested;
};

class CollectingSink : public AlertSink {
public:
    AlertPostResult PostAlert(const Alert& alert) override {
        alerts.push_back(alert);
        return AlertPostResult{true, alert.ToJson()};
    }

    std::vector<Alert> alerts;
};

Task AnalysisTask(json payload) {
    Task task;
    task.id = "analysis-1";
    task.kind = TaskKind::ANALYSIS;
    task.payload = std::move(payload);
    return task;
}

} // anonymous namespace

class AuditTaskHandlerTest : public ::testing::Test {
protected:
    AuditTaskHandlerTest()
        : source(std::make_shared<FakeDataSource>())
        , sink(std::make_shared<CollectingSink>())
        , handler(DetectionConfig::Empty(), source, sink) {
    }

    std::shared_ptr<FakeDataSource> source;
    std::shared_ptr<CollectingSink> sink;
    AuditTaskHandler handler;
    RecordingProgress progress;
};

TEST_F(AuditTaskHandlerTest, AnalysisFromExtraction) {
    source->records = {
        MakeRecord("admin@contoso.com", "Disable MFA for user", "success", WeekdayMillis(10)),
        MakeRecord("admin@contoso.com", "Add member to role", "success", WeekdayMillis(10, 5)),
        MakeRecord("user@contoso.com", "UserLoginFailed", "Failure", WeekdayMillis(11))
    };

    json result = handler.Execute(
        AnalysisTask({{"extractionId", "ext-1"}, {"organizationId", "org-5"}}), progress);

    EXPECT_EQ(source->requested, "ext-1");
    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_EQ(result["results"]["summary"]["totalFindings"], 2);
    EXPECT_EQ(result["results"]["summary"]["riskScore"], 15);
    EXPECT_EQ(result["results"]["statistics"]["totalEvents"], 3);

    ASSERT_EQ(result["alerts"].size(), 2u);
    ASSERT_EQ(sink->alerts.size(), 2u);
    EXPECT_EQ(sink->alerts[0].organization_id, "org-5");
    EXPECT_EQ(sink->alerts[0].extraction_id, "ext-1");
    EXPECT_EQ(sink->alerts[0].analysis_id, "analysis-1");

    const json& recommendations = result["results"]["recommendations"];
    ASSERT_EQ(recommendations.size(), 2u);
    EXPECT_EQ(recommendations[0]["title"], "Review failed authentication attempts");
    EXPECT_EQ(recommendations[1]["priority"], "critical");
}

TEST_F(AuditTaskHandlerTest, ProgressMilestones) {
    handler.Execute(AnalysisTask({{"events", json::array()}}), progress);

    std::vector<int> percents;
    for (const auto& step : progress.steps) {
        percents.push_back(step.first);
    }
    EXPECT_EQ(percents, (std::vector<int>{10, 20, 40, 70, 90}));
    EXPECT_EQ(progress.steps[2].second, "Analyzing audit logs");
}

TEST_F(AuditTaskHandlerTest, InlineEventsTakePrecedence) {
    json events = json::array({
        MakeRecord("night@contoso.com", "Update user", "success", WeekdayMillis(2))
    });

    json result = handler.Execute(
        AnalysisTask({{"extractionId", "ext-1"}, {"events", events}}), progress);

    EXPECT_TRUE(source->requested.empty());
    const json& recommendations = result["results"]["recommendations"];
    ASSERT_EQ(recommendations.size(), 1u);
    EXPECT_EQ(recommendations[0]["title"], "Monitor after-hours activity");
    EXPECT_TRUE(result["alerts"].empty());
}

TEST_F(AuditTaskHandlerTest, MissingDataFailsTask) {
    EXPECT_THROW(handler.Execute(AnalysisTask({{"extractionId", "missing"}}), progress),
                 NoDataFoundError);
}

TEST_F(AuditTaskHandlerTest, PayloadWithoutInputIsRejected) {
    EXPECT_THROW(handler.Execute(AnalysisTask(json::object()), progress),
                 std::invalid_argument);
    EXPECT_THROW(handler.Execute(AnalysisTask({{"events", "not-a-list"}}), progress),
                 std::invalid_argument);
}

TEST_F(AuditTaskHandlerTest, ExtractionTask) {
    Task task;
    task.id = "extract-1";
    task.kind = TaskKind::EXTRACTION;

    json result = handler.Execute(task, progress);

    EXPECT_TRUE(result["success"].get<bool>());
    EXPECT_EQ(result["message"], "Extraction completed successfully");
    ASSERT_EQ(progress.steps.size(), 3u);
    EXPECT_EQ(progress.steps.back().first, 90);
}

TEST(AuditTaskHandlerStandaloneTest, WorksWithoutSourceOrSink) {
    AuditTaskHandler handler(DetectionConfig::Empty(), nullptr, nullptr);
    RecordingProgress progress;

    json events = json::array({
        MakeRecord("admin@contoso.com", "Disable MFA", "success", WeekdayMillis(10))
    });
    json result = handler.Execute(AnalysisTask({{"events", events}}), progress);
    EXPECT_TRUE(result["alerts"].empty());

    EXPECT_THROW(handler.Execute(AnalysisTask({{"extractionId", "ext-1"}}), progress),
                 NoDataFoundError);
}
