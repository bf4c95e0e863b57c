/*
 * agentmem - Fire-and-forget task dispatcher
 *
 * Fixed pool of worker threads for best-effort background work such as
 * access-count bumps. dispatch() never blocks on the work itself; a task that
 * throws is logged and dropped.
 */
#ifndef AGENTMEM_CORE_TASK_DISPATCHER_HPP
#define AGENTMEM_CORE_TASK_DISPATCHER_HPP

#include <vector>
#include <queue>
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace agentmem {

class TaskDispatcher {
public:
    explicit TaskDispatcher(size_t num_threads = 2, const std::string& name = "dispatcher");
    ~TaskDispatcher();

    // Queue a task. Returns false (and drops the task) once shut down.
    bool dispatch(std::function<void()> task);

    // Block until the queue is empty and no task is running
    void wait_idle();

    size_t size() const { return threads_.size(); }
    size_t pending() const;

    // Tasks that threw since construction
    size_t failed() const { return failed_.load(); }

    // Drain remaining tasks and join the workers
    void shutdown();

private:
    void worker();

    std::string name_;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;
    size_t active_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    std::atomic<bool> stop_;
    std::atomic<size_t> failed_;
};

} // namespace agentmem

#endif // AGENTMEM_CORE_TASK_DISPATCHER_HPP
