#include <gtest/gtest.h>
#include "auditlens/core/worker_protocol.hpp"

using namespace auditlens::core;
using json = nlohmann::json;

TEST(WorkerProtocolTest, ProcessTaskCommand) {
    Task task;
    task.id = "analysis-1";
    task.kind = TaskKind::EXTRACTION;
    task.priority = TaskPriority::HIGH;
    task.payload = {{"extractionId", "ext-42"}};

    json command = json::parse(WorkerProtocol::EncodeProcessTask(task));
    EXPECT_EQ(command["type"], "process_task");
    EXPECT_EQ(command["task"]["kind"], "extraction");
    EXPECT_EQ(command["task"]["priority"], "high");

    Task decoded = WorkerProtocol::DecodeProcessTask(command.dump());
    EXPECT_EQ(decoded.id, "analysis-1");
    EXPECT_EQ(decoded.kind, TaskKind::EXTRACTION);
    EXPECT_EQ(decoded.priority, TaskPriority::HIGH);
    EXPECT_EQ(decoded.payload["extractionId"], "ext-42");
}

TEST(WorkerProtocolTest, RejectsUnknownCommand) {
    EXPECT_THROW(WorkerProtocol::DecodeProcessTask(R"({"type":"shutdown"})"),
                 std::invalid_argument);
    EXPECT_THROW(WorkerProtocol::DecodeProcessTask("not json"), std::invalid_argument);
    EXPECT_THROW(WorkerProtocol::DecodeProcessTask(R"({"type":"process_task"})"),
                 std::invalid_argument);
}

TEST(WorkerProtocolTest, RejectsUnknownPriority) {
    json command = {
        {"type", "process_task"},
        {"task", {{"id", "t"}, {"priority", "urgent"}}}
    };

    EXPECT_THROW(WorkerProtocol::DecodeProcessTask(command.dump()), std::invalid_argument);
}

TEST(WorkerProtocolTest, MessageWireNames) {
    EXPECT_EQ(WorkerProtocol::ToJson(TaskStarted{"t1"})["type"], "started");
    EXPECT_EQ(WorkerProtocol::ToJson(WorkerReady{})["type"], "ready");

    json progress = WorkerProtocol::ToJson(TaskProgress{"t1", 40, "Analyzing audit logs"});
    EXPECT_EQ(progress["type"], "progress");
    EXPECT_EQ(progress["taskId"], "t1");
    EXPECT_EQ(progress["percent"], 40);

    json failed = WorkerProtocol::ToJson(TaskFailed{"t1", TaskError{"boom", "runtime_error"}});
    EXPECT_EQ(failed["error"]["message"], "boom");
    EXPECT_EQ(failed["error"]["detail"], "runtime_error");
}

TEST(WorkerProtocolTest, EnvelopeCarriesSender) {
    WorkerEnvelope envelope;
    envelope.worker_id = 3;
    envelope.generation = 2;
    envelope.message = TaskCompleted{"t9", {{"success", true}}};

    WorkerEnvelope decoded = WorkerProtocol::DecodeEnvelope(
        WorkerProtocol::EncodeEnvelope(envelope));

    EXPECT_EQ(decoded.worker_id, 3u);
    EXPECT_EQ(decoded.generation, 2u);
    ASSERT_TRUE(std::holds_alternative<TaskCompleted>(decoded.message));
    EXPECT_EQ(std::get<TaskCompleted>(decoded.message).result["success"], true);
}

TEST(WorkerProtocolTest, EnvelopeToleratesInvalidUtf8) {
    WorkerEnvelope envelope;
    envelope.message = TaskFailed{"t1", TaskError{"bad byte \xFF here", ""}};

    std::string encoded;
    ASSERT_NO_THROW(encoded = WorkerProtocol::EncodeEnvelope(envelope));
    EXPECT_NO_THROW(WorkerProtocol::DecodeEnvelope(encoded));
}

TEST(WorkerProtocolTest, MalformedEnvelopes) {
    EXPECT_THROW(WorkerProtocol::DecodeEnvelope("{"), std::invalid_argument);
    EXPECT_THROW(WorkerProtocol::DecodeEnvelope(R"({"workerId":0})"), std::invalid_argument);
    EXPECT_THROW(WorkerProtocol::DecodeEnvelope(
                     R"({"workerId":0,"message":{"type":"teleport"}})"),
                 std::invalid_argument);
}
