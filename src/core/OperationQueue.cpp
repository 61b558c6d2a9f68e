#include "core/OperationQueue.h"

namespace segue {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

OperationQueue::OperationQueue()
    : OperationQueue(QueueOptions{})
{
}

OperationQueue::OperationQueue(const QueueOptions& options)
    : options_(options)
{
    if (options_.maxDepth < 1)
    {
        SG_WARN("OperationQueue: maxDepth %d out of range, using 1", options_.maxDepth);
        options_.maxDepth = 1;
    }
    worker_ = std::thread([this] { workerLoop(); });
    SG_INFO("OperationQueue: created maxDepth=%d signalRunning=%d",
            options_.maxDepth, options_.signalRunningOnPreempt ? 1 : 0);
}

OperationQueue::~OperationQueue()
{
    std::list<std::unique_ptr<Operation>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        dropped.swap(pending_);
        if (running_)
            running_->token.cancel();
    }
    workAvailable_.notify_all();

    Error why;
    why.set(ErrorCode::cancelled, "operation queue shut down");
    for (auto& op : dropped)
    {
        op->token.cancel();
        op->drop(why);
    }

    if (worker_.joinable())
        worker_.join();
    SG_INFO("OperationQueue: destroyed, dropped %d pending", static_cast<int>(dropped.size()));
}

// ═══════════════════════════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════════════════════════

bool OperationQueue::admit(OperationPriority priority, const std::string& tag,
                           Job job, Drop drop, Error& error)
{
    std::vector<std::unique_ptr<Operation>> dropped;
    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stopping_)
        {
            error.set(ErrorCode::cancelled, "operation queue shut down");
            return false;
        }

        // Preemption runs before the depth check so a high-priority command
        // can make room for itself.
        if (priority >= OperationPriority::high)
            preemptBelow(priority, tag, dropped);

        int depth = static_cast<int>(pending_.size()) + (running_ ? 1 : 0);
        if (depth >= options_.maxDepth)
        {
            error.set(ErrorCode::queueFull,
                      "operation queue full (max: " + std::to_string(options_.maxDepth) + ")",
                      options_.maxDepth);
            SG_WARN("OperationQueue: rejected '%s' (%s), depth=%d max=%d",
                    tag.c_str(), priorityName(priority), depth, options_.maxDepth);
        }
        else
        {
            auto op = std::make_unique<Operation>();
            op->id = nextId_++;
            op->priority = priority;
            op->tag = tag;
            op->job = std::move(job);
            op->drop = std::move(drop);
            SG_DEBUG("OperationQueue: admitted #%llu '%s' (%s), depth=%d",
                     static_cast<unsigned long long>(op->id), tag.c_str(),
                     priorityName(priority), depth + 1);
            pending_.push_back(std::move(op));
            admitted = true;
        }
    }

    if (admitted)
        workAvailable_.notify_one();

    if (!dropped.empty())
    {
        Error why;
        why.set(ErrorCode::cancelled, "preempted by '" + tag + "'");
        for (auto& op : dropped)
            op->drop(why);
    }

    return admitted;
}

void OperationQueue::preemptBelow(OperationPriority priority, const std::string& tag,
                                  std::vector<std::unique_ptr<Operation>>& dropped)
{
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        if ((*it)->priority < priority)
        {
            SG_INFO("OperationQueue: '%s' (%s) preempted by '%s' (%s)",
                    (*it)->tag.c_str(), priorityName((*it)->priority),
                    tag.c_str(), priorityName(priority));
            (*it)->token.cancel();
            dropped.push_back(std::move(*it));
            it = pending_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (options_.signalRunningOnPreempt && running_ && running_->priority < priority
        && !running_->token.isCancelled())
    {
        SG_INFO("OperationQueue: signalling running '%s' (%s) to stop for '%s'",
                running_->tag.c_str(), priorityName(running_->priority), tag.c_str());
        running_->token.cancel();
    }
}

// ═══════════════════════════════════════════════════════════════════
// Queries / control
// ═══════════════════════════════════════════════════════════════════

int OperationQueue::depth() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(pending_.size()) + (running_ ? 1 : 0);
}

void OperationQueue::cancelAll()
{
    std::list<std::unique_ptr<Operation>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(pending_);
        if (running_)
            running_->token.cancel();
    }

    Error why;
    why.set(ErrorCode::cancelled, "cancelled by cancelAll");
    for (auto& op : dropped)
    {
        op->token.cancel();
        op->drop(why);
    }
    idle_.notify_all();
    SG_INFO("OperationQueue: cancelAll dropped %d pending", static_cast<int>(dropped.size()));
}

void OperationQueue::waitUntilIdle()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return pending_.empty() && !running_; });
}

// ═══════════════════════════════════════════════════════════════════
// Worker thread
// ═══════════════════════════════════════════════════════════════════

void OperationQueue::workerLoop()
{
    SG_TRACE("OperationQueue: worker running");

    while (true)
    {
        Operation* op = nullptr;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            workAvailable_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (stopping_ && pending_.empty())
                break;

            running_ = std::move(pending_.front());
            pending_.pop_front();
            op = running_.get();
        }

        SG_DEBUG("OperationQueue: running #%llu '%s'",
                 static_cast<unsigned long long>(op->id), op->tag.c_str());
        op->job(op->token);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            SG_TRACE("OperationQueue: finished #%llu '%s'",
                     static_cast<unsigned long long>(op->id), op->tag.c_str());
            running_.reset();
        }
        idle_.notify_all();
    }

    SG_TRACE("OperationQueue: worker exiting");
}

} // namespace segue
