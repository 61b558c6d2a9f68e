#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace segue {

struct TransitionProgress {
    enum class Phase { idle, preparing, fading, switching, cleanup };

    Phase phase = Phase::idle;
    double duration = 0.0;
    double elapsed = 0.0;

    double progress() const
    {
        if (duration <= 0.0)
            return 0.0;
        return std::min(1.0, elapsed / duration);
    }

    bool isActive() const { return phase != Phase::idle; }
};

inline const char* progressPhaseName(TransitionProgress::Phase phase)
{
    switch (phase) {
        case TransitionProgress::Phase::idle:      return "idle";
        case TransitionProgress::Phase::preparing: return "preparing";
        case TransitionProgress::Phase::fading:    return "fading";
        case TransitionProgress::Phase::switching: return "switching";
        case TransitionProgress::Phase::cleanup:   return "cleanup";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════
// ProgressStream: one engine fade thread produces, one orchestrator
// call consumes. Events go through a lock-free ring; a counting
// semaphore wakes the consumer once per event and once on close.
// ═══════════════════════════════════════════════════════════════════

class ProgressStream {
public:
    static constexpr int kCapacity = 512;

    ProgressStream() = default;

    ProgressStream(const ProgressStream&) = delete;
    ProgressStream& operator=(const ProgressStream&) = delete;

    // --- Producer ---

    // Returns false when the stream is closed or the ring is full.
    bool push(const TransitionProgress& event)
    {
        if (closed_.load(std::memory_order_acquire))
            return false;

        int write = writePos_.load(std::memory_order_relaxed);
        int nextWrite = next(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire))
            return false;
        buffer_[write] = event;
        writePos_.store(nextWrite, std::memory_order_release);
        post();
        return true;
    }

    // Any thread. Idempotent. Events already pushed are still delivered.
    void close()
    {
        if (closed_.exchange(true, std::memory_order_acq_rel))
            return;
        post();
    }

    bool isClosed() const { return closed_.load(std::memory_order_acquire); }

    // --- Consumer ---

    // Blocks until an event is available (true) or the stream is closed and
    // fully drained (false).
    bool next(TransitionProgress& out)
    {
        while (true)
        {
            if (tryPop(out))
                return true;
            if (closed_.load(std::memory_order_acquire))
                return tryPop(out);
            wait();
        }
    }

private:
    std::array<TransitionProgress, kCapacity + 1> buffer_;
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};
    std::atomic<bool> closed_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    int signals_ = 0;

    int next(int pos) const { return (pos + 1) % (kCapacity + 1); }

    bool tryPop(TransitionProgress& out)
    {
        int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        out = buffer_[read];
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    void post()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++signals_;
        cv_.notify_one();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return signals_ > 0; });
        --signals_;
    }
};

} // namespace segue
