/**
 * @file worker.cpp
 * @brief Worker thread loop
 *
 * @date 2025
 */

#include "auditlens/core/worker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace auditlens {
namespace core {

namespace {

/**
 * @brief Coarse exception category for the `failed` detail field
 */
std::string DescribeException(const std::exception& e) {
    if (dynamic_cast<const nlohmann::json::exception*>(&e) != nullptr) {
        return "json_error";
    }
    if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        return "invalid_argument";
    }
    if (dynamic_cast<const std::out_of_range*>(&e) != nullptr) {
        return "out_of_range";
    }
    if (dynamic_cast<const std::runtime_error*>(&e) != nullptr) {
        return "runtime_error";
    }
    if (dynamic_cast<const std::logic_error*>(&e) != nullptr) {
        return "logic_error";
    }
    return "exception";
}

/**
 * @class WorkerProgressReporter
 * @brief Posts `progress` messages for the running task
 */
class WorkerProgressReporter : public ProgressReporter {
public:
    using PostFn = std::function<void(WorkerMessage)>;

    WorkerProgressReporter(std::string task_id, PostFn post)
        : task_id_(std::move(task_id))
        , post_(std::move(post)) {
    }

    void Report(int percent, const std::string& message) override {
        post_(TaskProgress{task_id_, std::clamp(percent, 0, 100), message});
    }

private:
    std::string task_id_;
    PostFn post_;
};

} // anonymous namespace

Worker::Worker(std::size_t id, std::uint64_t generation,
               std::unique_ptr<TaskHandler> handler, MessageSink sink)
    : state_(std::make_shared<State>()) {

    if (!handler) {
        throw std::invalid_argument("Worker requires a task handler");
    }

    state_->id = id;
    state_->generation = generation;
    state_->handler = std::move(handler);
    state_->sink = std::move(sink);
}

Worker::~Worker() {
    Stop();
}

void Worker::Start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&Worker::Run, state_);
}

bool Worker::Send(const std::string& command) {
    return state_->inbox.Push(command);
}

void Worker::Stop() {
    state_->inbox.Close();

    if (!thread_.joinable()) {
        return;
    }

    if (state_->busy.load()) {
        spdlog::warn("Worker {} stopped while busy; abandoning in-flight task", state_->id);
        thread_.detach();
    } else {
        thread_.join();
    }
}

void Worker::Post(State& state, WorkerMessage message) {
    WorkerEnvelope envelope;
    envelope.worker_id = state.id;
    envelope.generation = state.generation;
    envelope.message = std::move(message);
    state.sink(WorkerProtocol::EncodeEnvelope(envelope));
}

// ============================================================================
// Worker thread
// Processes commands until the mailbox closes or the handler crashes

void Worker::Run(std::shared_ptr<State> state) {
    spdlog::debug("Worker {} (generation {}) started", state->id, state->generation);
    Post(*state, WorkerReady{});

    while (auto command = state->inbox.Pop()) {
        if (state->inbox.Closed()) {
            break;  // stopped: queued commands are abandoned
        }

        Task task;
        try {
            task = WorkerProtocol::DecodeProcessTask(*command);
        } catch (const std::exception& e) {
            spdlog::error("Worker {} received an undecodable command: {}", state->id, e.what());
            state->inbox.Close();
            Post(*state, WorkerExited{2, std::string("Broken command channel: ") + e.what()});
            return;
        }

        state->busy = true;
        Post(*state, TaskStarted{task.id});
        spdlog::debug("Worker {} processing {} task {}", state->id,
                      TaskKindToString(task.kind), task.id);

        WorkerProgressReporter reporter(task.id, [&state](WorkerMessage message) {
            Post(*state, std::move(message));
        });

        try {
            nlohmann::json result = state->handler->Execute(task, reporter);
            state->busy = false;
            Post(*state, TaskCompleted{task.id, std::move(result)});
        } catch (const std::exception& e) {
            state->busy = false;
            spdlog::error("Worker {} task {} failed: {}", state->id, task.id, e.what());
            Post(*state, TaskFailed{task.id, TaskError{e.what(), DescribeException(e)}});
        } catch (...) {
            // Non-standard exception: report exit and end the thread
            state->busy = false;
            state->inbox.Close();
            spdlog::critical("Worker {} crashed while processing task {}", state->id, task.id);
            Post(*state, WorkerExited{1, "Unhandled non-standard exception in task " + task.id});
            return;
        }
    }

    spdlog::debug("Worker {} (generation {}) stopped", state->id, state->generation);
}

} // namespace core
} // namespace auditlens
