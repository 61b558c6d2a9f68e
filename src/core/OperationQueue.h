#pragma once

#include "core/Logger.h"
#include "core/Types.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace segue {

enum class OperationPriority : int { low = 0, normal = 1, high = 2, critical = 3 };

inline const char* priorityName(OperationPriority priority)
{
    switch (priority) {
        case OperationPriority::low:      return "low";
        case OperationPriority::normal:   return "normal";
        case OperationPriority::high:     return "high";
        case OperationPriority::critical: return "critical";
    }
    return "unknown";
}

/// Cooperative cancellation flag shared between the queue and a body.
/// Bodies poll it at their own checkpoints; the queue never interrupts them.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }
    void cancel() const { flag_->store(true, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct QueueOptions {
    int maxDepth = 10;
    // When a high/critical operation is admitted, also signal the token of a
    // running lower-priority operation (it still runs to completion).
    bool signalRunningOnPreempt = true;
};

class OperationQueue {
public:
    OperationQueue();
    explicit OperationQueue(const QueueOptions& options);
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    /// Submit a body for serialized execution. `body` is called as
    /// body(const CancellationToken&) on the queue's worker thread.
    ///
    /// Returns false with ErrorCode::queueFull when the backlog is at its
    /// bound. Otherwise `result` receives a future for the body's return
    /// value; anything the body throws is rethrown from future.get(), and a
    /// body dropped before it starts resolves with OperationError(cancelled).
    template<typename Fn,
             typename R = std::invoke_result_t<Fn&, const CancellationToken&>>
    bool enqueue(OperationPriority priority, const std::string& tag, Fn body,
                 std::future<R>& result, Error& error)
    {
        auto promise = std::make_shared<std::promise<R>>();
        std::future<R> future = promise->get_future();

        Job job = [promise, body = std::move(body)](const CancellationToken& token) mutable
        {
            try
            {
                if constexpr (std::is_void_v<R>)
                {
                    body(token);
                    promise->set_value();
                }
                else
                {
                    promise->set_value(body(token));
                }
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        };

        Drop drop = [promise](const Error& why)
        {
            promise->set_exception(std::make_exception_ptr(OperationError(why)));
        };

        if (!admit(priority, tag, std::move(job), std::move(drop), error))
            return false;

        result = std::move(future);
        return true;
    }

    /// Pending plus running operations.
    int depth() const;
    int maxDepth() const { return options_.maxDepth; }

    /// Drop every pending operation and signal the running one.
    void cancelAll();

    /// Block until nothing is pending or running.
    void waitUntilIdle();

private:
    using Job = std::function<void(const CancellationToken&)>;
    using Drop = std::function<void(const Error&)>;

    struct Operation {
        uint64_t id = 0;
        OperationPriority priority = OperationPriority::normal;
        std::string tag;
        CancellationToken token;
        Job job;
        Drop drop;
    };

    bool admit(OperationPriority priority, const std::string& tag,
               Job job, Drop drop, Error& error);
    void preemptBelow(OperationPriority priority, const std::string& tag,
                      std::vector<std::unique_ptr<Operation>>& dropped);
    void workerLoop();

    QueueOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;

    std::list<std::unique_ptr<Operation>> pending_;
    std::unique_ptr<Operation> running_;
    uint64_t nextId_ = 1;
    bool stopping_ = false;

    std::thread worker_;
};

} // namespace segue
