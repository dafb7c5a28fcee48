/**
 * @file job_scheduler.cpp
 * @brief Scheduler thread, dispatch loop and worker recovery
 *
 * @date 2025
 */

#include "auditlens/core/job_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace auditlens {
namespace core {

std::size_t DefaultWorkerCount() {
    const unsigned int hardware = std::thread::hardware_concurrency();
    return hardware > 1 ? static_cast<std::size_t>(hardware - 1) : 1;
}

JobScheduler::JobScheduler(const Config& config, TaskHandlerFactory factory,
                           std::shared_ptr<JobStore> store)
    : config_(config)
    , factory_(std::move(factory))
    , store_(std::move(store)) {

    if (!factory_) {
        throw std::invalid_argument("JobScheduler requires a task handler factory");
    }
    if (!store_) {
        throw std::invalid_argument("JobScheduler requires a job store");
    }
    if (config_.workers == 0) {
        config_.workers = 1;
    }
}

JobScheduler::~JobScheduler() {
    Shutdown();
}

bool JobScheduler::Initialize() {
    if (IsRunning()) {
        return true;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING JOB SCHEDULER");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    inbox_ = std::make_shared<Mailbox<InboxItem>>();
    slots_.clear();
    slots_.resize(config_.workers);

    try {
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            slots_[i].worker = SpawnWorker(i, 0);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to create worker pool: {}", e.what());
        for (auto& slot : slots_) {
            if (slot.worker) {
                slot.worker->Stop();
            }
        }
        slots_.clear();
        return false;
    }

    queue_.Clear();
    terminal_.clear();
    orphaned_.clear();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = true;
        known_ids_.clear();
    }
    PublishStatus();

    thread_ = std::thread(&JobScheduler::Run, this);

    spdlog::info("  Workers:        {}", config_.workers);
    spdlog::info("  Retry interval: {} ms", config_.dispatch_retry_interval.count());
    spdlog::info("  Orphaned tasks: {}", config_.fail_orphaned_tasks ? "failed" : "kept");
    spdlog::info("✓ Job Scheduler initialized");
    return true;
}

void JobScheduler::Submit(Task task) {
    if (task.id.empty()) {
        throw std::invalid_argument("Task id must not be empty");
    }

    std::shared_ptr<Mailbox<InboxItem>> inbox;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            throw std::runtime_error("JobScheduler is not running");
        }
        if (!known_ids_.insert(task.id).second) {
            throw std::invalid_argument("Duplicate task id: " + task.id);
        }
        inbox = inbox_;
    }

    spdlog::debug("Submitting {} task {} ({})", TaskKindToString(task.kind), task.id,
                  TaskPriorityToString(task.priority));

    if (!inbox->Push(InboxItem(std::move(task)))) {
        throw std::runtime_error("JobScheduler is shutting down");
    }
}

JobScheduler::Status JobScheduler::GetStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

bool JobScheduler::IsRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

void JobScheduler::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    spdlog::info("Shutting down Job Scheduler...");

    inbox_->Close();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::size_t abandoned = 0;
    for (auto& slot : slots_) {
        if (slot.active_task) {
            ++abandoned;
            slot.active_task.reset();
        }
        if (slot.worker) {
            slot.worker->Stop();
            slot.worker.reset();
        }
    }

    if (abandoned > 0 || !queue_.Empty()) {
        spdlog::warn("Abandoned {} running and {} queued task(s)", abandoned, queue_.Size());
    }
    queue_.Clear();
    PublishStatus();

    spdlog::info("✓ Job Scheduler shut down");
}

std::unique_ptr<Worker> JobScheduler::SpawnWorker(std::size_t slot, std::uint64_t generation) {
    std::unique_ptr<TaskHandler> handler = factory_(slot);
    if (!handler) {
        throw std::runtime_error("Task handler factory returned no handler for worker " +
                                 std::to_string(slot));
    }

    auto inbox = inbox_;
    std::unique_ptr<Worker> worker = CreateWorker(slot, generation, std::move(handler),
        [inbox](std::string message) {
            inbox->Push(InboxItem(std::move(message)));
        });
    worker->Start();
    return worker;
}

std::unique_ptr<Worker> JobScheduler::CreateWorker(std::size_t slot, std::uint64_t generation,
                                                   std::unique_ptr<TaskHandler> handler,
                                                   MessageSink sink) {
    return std::make_unique<Worker>(slot, generation, std::move(handler), std::move(sink));
}

// ============================================================================
// Scheduler thread

void JobScheduler::Run() {
    spdlog::debug("Scheduler thread started");
    bool stalled = false;

    while (!inbox_->Closed()) {
        std::optional<InboxItem> item = stalled
            ? inbox_->PopFor(config_.dispatch_retry_interval)
            : inbox_->Pop();

        if (inbox_->Closed()) {
            break;
        }

        if (item) {
            if (auto* task = std::get_if<Task>(&*item)) {
                Enqueue(std::move(*task));
            } else {
                HandleWorkerMessage(std::get<std::string>(*item));
            }
        }

        stalled = Dispatch();
        PublishStatus();
    }

    spdlog::debug("Scheduler thread stopped");
}

void JobScheduler::Enqueue(Task task) {
    spdlog::debug("Queued task {} (queue length {})", task.id, queue_.Size() + 1);
    queue_.Push(std::move(task));
}

bool JobScheduler::Dispatch() {
    while (!queue_.Empty()) {
        auto idle = std::find_if(slots_.begin(), slots_.end(), [](const Slot& slot) {
            return slot.worker && !slot.active_task;
        });
        if (idle == slots_.end()) {
            return true;
        }

        std::optional<Task> task = queue_.PopFront();
        const std::size_t index = static_cast<std::size_t>(idle - slots_.begin());

        std::string command;
        try {
            command = WorkerProtocol::EncodeProcessTask(*task);
        }
        catch (const std::exception& e) {
            spdlog::error("Task {} cannot be serialized: {}", task->id, e.what());
            if (terminal_.insert(task->id).second) {
                try {
                    store_->MarkFailed(task->id, TaskError{"Task could not be serialized", e.what()});
                }
                catch (const std::exception& store_error) {
                    spdlog::error("Failed to record task {}: {}", task->id, store_error.what());
                }
            }
            continue;
        }

        idle->active_task = task->id;
        if (!idle->worker->Send(command)) {
            spdlog::warn("Delivery of task {} to worker {} failed; retrying", task->id, index);
            idle->active_task.reset();
            queue_.PushFront(std::move(*task));
            return true;
        }

        spdlog::debug("Dispatched task {} to worker {}", task->id, index);
    }
    return false;
}

void JobScheduler::HandleWorkerMessage(const std::string& serialized) {
    WorkerEnvelope envelope;
    try {
        envelope = WorkerProtocol::DecodeEnvelope(serialized);
    }
    catch (const std::exception& e) {
        spdlog::error("Dropping malformed worker message: {}", e.what());
        return;
    }

    const std::size_t index = envelope.worker_id;
    if (index >= slots_.size() || envelope.generation != slots_[index].generation) {
        spdlog::debug("Ignoring {} from stale worker {} (generation {})",
                      WorkerProtocol::TypeName(envelope.message), index, envelope.generation);
        return;
    }

    try {
        if (std::holds_alternative<WorkerReady>(envelope.message)) {
            spdlog::debug("Worker {} ready", index);
        }
        else if (auto* started = std::get_if<TaskStarted>(&envelope.message)) {
            if (terminal_.count(started->task_id) == 0) {
                slots_[index].active_task = started->task_id;
                spdlog::info("Worker {} started task {}", index, started->task_id);
            }
        }
        else if (auto* progress = std::get_if<TaskProgress>(&envelope.message)) {
            if (terminal_.count(progress->task_id) == 0) {
                spdlog::debug("Task {} progress {}%: {}", progress->task_id,
                              progress->percent, progress->message);
                store_->UpdateProgress(progress->task_id, progress->percent,
                                       progress->percent >= 100 ? "completed" : "running");
            }
        }
        else if (auto* completed = std::get_if<TaskCompleted>(&envelope.message)) {
            ReleaseSlot(index, completed->task_id);
            if (terminal_.insert(completed->task_id).second) {
                spdlog::info("✓ Task {} completed", completed->task_id);
                store_->MarkCompleted(completed->task_id, completed->result);
            }
        }
        else if (auto* failed = std::get_if<TaskFailed>(&envelope.message)) {
            ReleaseSlot(index, failed->task_id);
            if (terminal_.insert(failed->task_id).second) {
                spdlog::error("Task {} failed: {}", failed->task_id, failed->error.message);
                store_->MarkFailed(failed->task_id, failed->error);
            }
        }
        else if (auto* exited = std::get_if<WorkerExited>(&envelope.message)) {
            HandleWorkerExit(index, *exited);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Job store update for worker {} failed: {}", index, e.what());
    }
}

void JobScheduler::HandleWorkerExit(std::size_t index, const WorkerExited& exited) {
    Slot& slot = slots_[index];
    spdlog::warn("Worker {} exited unexpectedly (code {}): {}", index, exited.code, exited.reason);

    if (slot.active_task) {
        const std::string task_id = *slot.active_task;
        slot.active_task.reset();

        if (config_.fail_orphaned_tasks) {
            if (terminal_.insert(task_id).second) {
                try {
                    store_->MarkFailed(task_id, TaskError{"Worker terminated unexpectedly",
                                                          exited.reason});
                }
                catch (const std::exception& e) {
                    spdlog::error("Failed to record orphaned task {}: {}", task_id, e.what());
                }
            }
        } else {
            spdlog::warn("Task {} orphaned by worker {}", task_id, index);
            orphaned_.push_back(task_id);
        }
    }

    if (slot.worker) {
        slot.worker->Stop();
    }
    ++slot.generation;
    ++slot.restarts;

    try {
        slot.worker = SpawnWorker(index, slot.generation);
        spdlog::info("Replaced worker {} (generation {})", index, slot.generation);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to replace worker {}: {}", index, e.what());
        slot.worker.reset();
    }
}

void JobScheduler::ReleaseSlot(std::size_t index, const std::string& task_id) {
    auto& active = slots_[index].active_task;
    if (active && *active == task_id) {
        active.reset();
    }
}

void JobScheduler::PublishStatus() {
    Status status;
    status.queue_length = queue_.Size();
    status.queued_task_ids = queue_.Ids();
    status.is_processing = !queue_.Empty();
    status.orphaned_task_ids = orphaned_;

    for (const auto& slot : slots_) {
        if (slot.worker) {
            ++status.worker_count;
        }
        if (slot.active_task) {
            ++status.active_workers;
            status.active_task_ids.push_back(*slot.active_task);
        }
        status.restart_counts.push_back(slot.restarts);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    status_ = std::move(status);
}

} // namespace core
} // namespace auditlens
