/**
 * @file worker.hpp
 * @brief Isolated execution unit running tasks on its own thread
 *
 * A Worker owns a thread, a command mailbox and a TaskHandler. It accepts
 * serialized `process_task` commands, runs one task at a time and reports
 * back through a message sink with serialized WorkerEnvelope documents.
 *
 * **Failure handling inside the worker**:
 * - std::exception from the handler: `failed` message, worker keeps running
 * - any other exception, or an undecodable command: `exited` message, the
 *   worker thread ends and must be replaced by the scheduler
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "auditlens/core/mailbox.hpp"
#include "auditlens/core/task_handler.hpp"
#include "auditlens/core/worker_protocol.hpp"

namespace auditlens {
namespace core {

/// Receives serialized WorkerEnvelope documents
using MessageSink = std::function<void(std::string)>;

class Worker {
public:
    /**
     * @param id Slot index in the pool
     * @param generation Incremented each time the slot is recreated
     * @param handler Task logic owned by this worker
     * @param sink Destination of serialized worker messages
     */
    Worker(std::size_t id, std::uint64_t generation,
           std::unique_ptr<TaskHandler> handler, MessageSink sink);

    virtual ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Start the worker thread; it posts `ready` once running
     */
    void Start();

    /**
     * @brief Deliver a serialized command
     * @return false if the worker no longer accepts commands
     */
    virtual bool Send(const std::string& command);

    /**
     * @brief Close the command mailbox and release the thread
     *
     * An idle worker is joined. A worker still inside a task is detached;
     * its result is dropped once the sink no longer accepts messages.
     */
    void Stop();

private:
    // Shared with the worker thread so a detached thread never outlives its state
    struct State {
        std::size_t id{0};
        std::uint64_t generation{0};
        std::unique_ptr<TaskHandler> handler;
        MessageSink sink;
        Mailbox<std::string> inbox;
        std::atomic<bool> busy{false};
    };

    static void Run(std::shared_ptr<State> state);
    static void Post(State& state, WorkerMessage message);

    std::shared_ptr<State> state_;
    std::thread thread_;
};

} // namespace core
} // namespace auditlens
