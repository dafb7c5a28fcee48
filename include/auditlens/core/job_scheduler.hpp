/**
 * @file job_scheduler.hpp
 * @brief Fixed-size worker pool with a priority queue and crash recovery
 *
 * The JobScheduler owns N workers and a single scheduler thread. Every
 * interaction with the pool goes through the scheduler's inbox: submitted
 * tasks and serialized worker messages are processed in arrival order by that
 * one thread, which is also the only thread touching the queue and the
 * active-task registry.
 *
 * **Task lifecycle**: queued -> dispatched -> completed | failed.
 * Late messages about a task that already reached a terminal state, and any
 * message from a replaced worker generation, are ignored.
 *
 * **Example Usage**:
 * @code
 * auto store = std::make_shared<InMemoryJobStore>();
 * JobScheduler scheduler(JobScheduler::Config{}, factory, store);
 * scheduler.Initialize();
 * scheduler.Submit(task);
 * store->WaitForTerminal({task.id}, std::chrono::minutes(5));
 * scheduler.Shutdown();
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "auditlens/core/job_store.hpp"
#include "auditlens/core/mailbox.hpp"
#include "auditlens/core/task.hpp"
#include "auditlens/core/task_handler.hpp"
#include "auditlens/core/task_queue.hpp"
#include "auditlens/core/worker.hpp"

namespace auditlens {
namespace core {

/// Hardware concurrency minus one, at least 1
std::size_t DefaultWorkerCount();

class JobScheduler {
public:
    /**
     * @struct Config
     */
    struct Config {
        std::size_t workers = DefaultWorkerCount();
        std::chrono::milliseconds dispatch_retry_interval{1000};
        bool fail_orphaned_tasks = true;            ///< Fail the task of a crashed worker
    };

    /**
     * @struct Status
     * @brief Snapshot published by the scheduler thread
     */
    struct Status {
        std::size_t worker_count{0};
        std::size_t active_workers{0};
        std::size_t queue_length{0};
        std::vector<std::string> active_task_ids;
        std::vector<std::string> queued_task_ids;   ///< Dispatch order
        bool is_processing{false};
        std::vector<std::size_t> restart_counts;    ///< Per slot
        std::vector<std::string> orphaned_task_ids;
    };

    JobScheduler(const Config& config, TaskHandlerFactory factory,
                 std::shared_ptr<JobStore> store);
    virtual ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * @brief Create the workers and start the scheduler thread
     * @return false if a worker could not be created
     */
    bool Initialize();

    /**
     * @brief Queue a task for execution
     * @throws std::runtime_error if the scheduler is not running
     * @throws std::invalid_argument on an empty or already submitted id
     */
    void Submit(Task task);

    Status GetStatus() const;

    /**
     * @brief Stop every worker and drop the queue
     *
     * Tasks still running are abandoned: they are neither failed nor requeued.
     */
    void Shutdown();

    bool IsRunning() const;

protected:
    /**
     * @brief Build the worker for a slot
     *
     * Called from the scheduler thread when a crashed worker is replaced, so
     * a subclass overriding it must call Shutdown() in its own destructor.
     */
    virtual std::unique_ptr<Worker> CreateWorker(std::size_t slot, std::uint64_t generation,
                                                 std::unique_ptr<TaskHandler> handler,
                                                 MessageSink sink);

private:
    using InboxItem = std::variant<Task, std::string>;

    struct Slot {
        std::unique_ptr<Worker> worker;
        std::uint64_t generation{0};
        std::optional<std::string> active_task;
        std::size_t restarts{0};
    };

    std::unique_ptr<Worker> SpawnWorker(std::size_t slot, std::uint64_t generation);

    void Run();
    void Enqueue(Task task);
    void HandleWorkerMessage(const std::string& serialized);
    void HandleWorkerExit(std::size_t slot, const WorkerExited& exited);
    void ReleaseSlot(std::size_t slot, const std::string& task_id);

    /// @return true if tasks remain queued with no idle worker
    bool Dispatch();

    void PublishStatus();

    Config config_;
    TaskHandlerFactory factory_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<Mailbox<InboxItem>> inbox_;

    // Scheduler thread state
    TaskQueue queue_;
    std::vector<Slot> slots_;
    std::set<std::string> terminal_;
    std::vector<std::string> orphaned_;

    mutable std::mutex state_mutex_;
    bool running_{false};
    std::set<std::string> known_ids_;
    Status status_;

    std::thread thread_;
};

} // namespace core
} // namespace auditlens
