#include <agentmem/core/task_dispatcher.hpp>
#include <agentmem/core/logger.hpp>
#include <exception>

namespace agentmem {

TaskDispatcher::TaskDispatcher(size_t num_threads, const std::string& name)
    : name_(name)
    , active_(0)
    , stop_(false)
    , failed_(0)
{
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("[%s] started with %zu workers", name_.c_str(), num_threads);
}

TaskDispatcher::~TaskDispatcher() {
    shutdown();
}

bool TaskDispatcher::dispatch(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("[%s] task dropped - dispatcher is stopped", name_.c_str());
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void TaskDispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

size_t TaskDispatcher::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskDispatcher::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;  // Already stopped
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    LOG_DEBUG("[%s] shutdown complete", name_.c_str());
}

void TaskDispatcher::worker() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // Queued work is still drained after stop
            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            LOG_WARN("[%s] background task failed: %s", name_.c_str(), e.what());
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace agentmem
