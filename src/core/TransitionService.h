#pragma once

#include "core/ChannelEngine.h"
#include "core/CrossfadeOrchestrator.h"
#include "core/OperationQueue.h"
#include "core/PlaybackStateCoordinator.h"
#include "core/ServiceConfig.h"
#include "core/TimeoutEstimator.h"
#include "core/Types.h"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace segue {

/// Caller-facing surface over one channel engine. Every command is a queued
/// operation; the calling thread blocks until its body has run.
///
/// Crossfades and resumed transitions run on a driver thread once started,
/// so a pause or stop can reach them while they are still ramping. The
/// command itself returns when the ramp has started or failed.
class TransitionService {
public:
    /// Returns nullptr and fills error if the config does not validate.
    static std::unique_ptr<TransitionService> create(std::shared_ptr<ChannelEngine> engine,
                                                     const ServiceConfig& config,
                                                     std::string& error,
                                                     TransitionObserver* observer = nullptr);
    ~TransitionService();

    TransitionService(const TransitionService&) = delete;
    TransitionService& operator=(const TransitionService&) = delete;

    // --- Commands (any thread, blocking) ---
    bool play(const std::string& uri, Error& error);
    bool crossfadeTo(const std::string& uri, TransitionKind kind, Error& error);
    bool pause(Error& error);
    bool resume(Error& error);
    bool stop(Error& error);

    // --- Queue passthrough ---
    template<typename Fn,
             typename R = std::invoke_result_t<Fn&, const CancellationToken&>>
    bool enqueue(OperationPriority priority, const std::string& tag, Fn body,
                 std::future<R>& result, Error& error)
    {
        return queue_.enqueue(priority, tag, std::move(body), result, error);
    }

    int depth() const { return queue_.depth(); }

    /// Block until no queued command or background transition is running.
    void waitUntilIdle();

    // --- Queries ---
    PlaybackMode mode() const { return coordinator_.mode(); }
    CoordinatorState state() const { return coordinator_.snapshot(); }
    bool isTransitioning() const { return orchestrator_.hasActiveTransition(); }
    bool hasPausedTransition() const { return orchestrator_.hasPausedTransition(); }
    double transitionProgress() const { return orchestrator_.activeProgress(); }
    const ServiceConfig& config() const { return config_; }

    TimeoutEstimator& timeouts() { return timeouts_; }

private:
    TransitionService(std::shared_ptr<ChannelEngine> engine, const ServiceConfig& config,
                      TransitionObserver* observer);

    // Forwards orchestrator callbacks to the host observer and releases the
    // command waiting for a driver to get going.
    class Relay : public TransitionObserver {
    public:
        Relay(TransitionService& owner, TransitionObserver* host) : owner_(owner), host_(host) {}
        void onTransitionStarted(const TransitionStrategy& strategy) override;
        void onTransitionProgress(const TransitionProgress& progress) override;
        void onTransitionFinished(TransitionResult result) override;

    private:
        TransitionService& owner_;
        TransitionObserver* host_;
    };

    // Fulfilled once, by whichever comes first: the ramp starting or the
    // driver returning.
    struct StartSignal {
        std::mutex mutex;
        bool fired = false;
        std::promise<Error> promise;

        void fire(const Error& error);
    };

    struct Driver {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Runs `body` as a queued operation and waits for it. Cancellation and
    // anything thrown come back through error.
    bool runCommand(OperationPriority priority, const char* tag,
                    std::function<Error(const CancellationToken&)> body, Error& error);

    // Start `run` on a driver thread, then wait until it either reports a
    // started ramp or returns.
    Error launchDriver(const char* tag, std::function<bool(Error&)> run);
    void signalStarted();
    void reapDrivers(bool all);

    Error playBody(const std::string& uri);
    Error crossfadeBody(const std::string& uri, TransitionKind kind, const CancellationToken& token);
    Error pauseBody();
    Error resumeBody(const CancellationToken& token);
    Error stopBody();

    ServiceConfig config_;
    std::shared_ptr<ChannelEngine> engine_;
    TimeoutEstimator timeouts_;
    PlaybackStateCoordinator coordinator_;
    Relay relay_;
    CrossfadeOrchestrator orchestrator_;

    std::mutex driverMutex_;
    std::vector<Driver> drivers_;
    std::shared_ptr<StartSignal> pendingStart_;

    // Declared last: its worker must stop before anything it touches goes away.
    OperationQueue queue_;
};

} // namespace segue
