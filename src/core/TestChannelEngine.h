#pragma once

#include "core/ChannelEngine.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace segue {

/// Concrete ChannelEngine for unit testing. No audio: channels are plain
/// records and transitions are progress streams the test drives by hand
/// (or that finish on their own after setAutoComplete()).
/// Records every call for test inspection.
class TestChannelEngine : public ChannelEngine
{
public:
    TestChannelEngine() = default;

    ~TestChannelEngine() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stream_)
                stream_->close();
        }
        for (auto& t : rampThreads_)
            if (t.joinable())
                t.join();
    }

    TestChannelEngine(const TestChannelEngine&) = delete;
    TestChannelEngine& operator=(const TestChannelEngine&) = delete;

    // --- Test setup ---

    void addAsset(const std::string& uri, double durationSeconds = 60.0)
    {
        auto asset = std::make_shared<Asset>();
        asset->uri = uri;
        asset->durationSeconds = durationSeconds;
        asset->sampleRate = 44100.0;
        asset->numChannels = 2;
        std::lock_guard<std::mutex> lock(mutex_);
        assets_[uri] = asset;
    }

    void setLoadDelay(std::chrono::milliseconds delay)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loadDelay_ = delay;
    }

    void failLoad(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(uri);
    }

    void setPosition(double position, double duration)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        position_ = position;
        duration_ = duration;
        positionSet_ = true;
    }

    void setSnapshotAvailable(bool available)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshotAvailable_ = available;
    }

    /// 0 = streams stay open until the test closes them.
    void setAutoComplete(std::chrono::milliseconds after)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        autoComplete_ = after;
    }

    /// Single-channel fades with a nonzero duration block this long, or
    /// until pause, stop, cancel, rollback or fast-forward cuts them short.
    void setFadeTime(std::chrono::milliseconds fadeTime)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fadeTime_ = fadeTime;
    }

    // --- Driving the current stream ---

    /// Block until at least `count` transition streams have been opened.
    bool waitForStreams(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return streamOpened_.wait_for(lock, timeout, [this, count] { return streamsOpened_ >= count; });
    }

    /// Block until at least `count` single-channel fades have begun.
    bool waitForFades(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return fadeChanged_.wait_for(lock, timeout, [this, count] { return fadesStarted_ >= count; });
    }

    /// Push a fading event and move the gains along a linear ramp.
    bool pushProgress(double elapsed, double duration)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_)
            return false;
        double p = duration > 0.0 ? std::min(1.0, elapsed / duration) : 1.0;
        active().gain = static_cast<float>(1.0 - p);
        inactive().gain = static_cast<float>(p);
        return stream_->push({TransitionProgress::Phase::fading, duration, elapsed});
    }

    /// Ramp ran to the end: gains at their targets, stream closed.
    void finishStream()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishLocked();
    }

    // --- Inspection ---

    std::vector<std::string> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int callCount(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(calls_.begin(), calls_.end(), name));
    }

    ChannelId activeChannel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return activeIndex_ == 0 ? ChannelId::a : ChannelId::b;
    }

    AssetPtr activeAsset() const { std::lock_guard<std::mutex> l(mutex_); return active().asset; }
    AssetPtr inactiveAsset() const { std::lock_guard<std::mutex> l(mutex_); return inactive().asset; }
    float activeGain() const { std::lock_guard<std::mutex> l(mutex_); return active().gain; }
    float inactiveGain() const { std::lock_guard<std::mutex> l(mutex_); return inactive().gain; }
    bool activePlaying() const { std::lock_guard<std::mutex> l(mutex_); return active().playing; }
    bool inactivePlaying() const { std::lock_guard<std::mutex> l(mutex_); return inactive().playing; }
    bool inCrossfade() const { std::lock_guard<std::mutex> l(mutex_); return crossfading_; }

    // --- ChannelEngine ---

    bool loadAsset(const std::string& uri, AssetPtr& asset, std::string& error) override
    {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back("loadAsset");
            delay = loadDelay_;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_.count(uri))
        {
            error = "decoder rejected " + uri;
            return false;
        }
        auto it = assets_.find(uri);
        if (it == assets_.end())
        {
            error = "no such asset: " + uri;
            return false;
        }
        asset = it->second;
        return true;
    }

    void assignInactiveChannel(AssetPtr asset) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("assignInactiveChannel");
        inactive().asset = std::move(asset);
        inactive().playing = false;
    }

    void prepareInactiveChannel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("prepareInactiveChannel");
        inactive().gain = 0.0f;
    }

    void clearInactiveAsset() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("clearInactiveAsset");
        inactive().asset.reset();
    }

    std::shared_ptr<ProgressStream> performSynchronizedTransition(double duration,
                                                                  FadeCurve /*curve*/) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("performSynchronizedTransition");
        inactive().playing = true;
        active().gain = 1.0f;
        inactive().gain = 0.0f;
        return openStreamLocked(duration);
    }

    std::shared_ptr<ProgressStream> resumeTransition(double duration, FadeCurve /*curve*/,
                                                     float activeGain, float inactiveGain) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("resumeTransition");
        active().gain = activeGain;
        inactive().gain = inactiveGain;
        active().playing = true;
        inactive().playing = true;
        lastResumeDuration = duration;
        return openStreamLocked(duration);
    }

    void pauseBothChannels() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("pauseBothChannels");
        channels_[0].playing = false;
        channels_[1].playing = false;
        closeLocked();
    }

    void stopBothChannels() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("stopBothChannels");
        channels_[0].playing = false;
        channels_[1].playing = false;
        crossfading_ = false;
        closeLocked();
    }

    float rollbackTransition(double /*duration*/) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("rollbackTransition");
        float from = active().gain;
        active().gain = 1.0f;
        inactive().gain = 0.0f;
        inactive().playing = false;
        crossfading_ = false;
        closeLocked();
        return from;
    }

    void fastForwardTransition(double duration) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("fastForwardTransition");
        lastFastForwardDuration = duration;
        finishLocked();
    }

    void cancelTransition() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("cancelTransition");
        active().gain = 1.0f;
        inactive().gain = 0.0f;
        inactive().playing = false;
        crossfading_ = false;
        closeLocked();
    }

    void fadeActiveChannel(float /*from*/, float to, double duration, FadeCurve /*curve*/) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back("fadeActiveChannel");
        ++fadesStarted_;
        fadeChanged_.notify_all();

        if (duration > 0.0 && fadeTime_.count() > 0)
        {
            int interrupts = fadeInterrupts_;
            if (fadeChanged_.wait_for(lock, fadeTime_, [&] { return fadeInterrupts_ != interrupts; }))
                return; // cut short, gain stays where it was
        }
        active().gain = to;
    }

    void startActiveChannel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("startActiveChannel");
        active().playing = true;
    }

    void switchActiveChannel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("switchActiveChannel");
        activeIndex_ = 1 - activeIndex_;
        crossfading_ = false;
    }

    void stopInactiveChannel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("stopInactiveChannel");
        inactive().playing = false;
    }

    void resetInactiveMixer() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back("resetInactiveMixer");
        inactive().gain = 0.0f;
    }

    bool getCrossfadeSnapshot(CrossfadeSnapshot& out) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!snapshotAvailable_ || !crossfading_)
            return false;
        out.activeGain = active().gain;
        out.inactiveGain = inactive().gain;
        out.activePosition = position_;
        out.inactivePosition = 0.0;
        out.activeChannel = activeIndex_ == 0 ? ChannelId::a : ChannelId::b;
        return true;
    }

    bool getCurrentPosition(PlaybackPosition& out) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active().asset)
            return false;
        out.position = positionSet_ ? position_ : 0.0;
        out.duration = positionSet_ ? duration_ : active().asset->durationSeconds;
        return true;
    }

    // --- Test inspection state ---
    double lastResumeDuration = 0.0;
    double lastFastForwardDuration = 0.0;

private:
    struct Channel {
        AssetPtr asset;
        float gain = 0.0f;
        bool playing = false;
    };

    Channel& active() { return channels_[activeIndex_]; }
    Channel& inactive() { return channels_[1 - activeIndex_]; }
    const Channel& active() const { return channels_[activeIndex_]; }
    const Channel& inactive() const { return channels_[1 - activeIndex_]; }

    std::shared_ptr<ProgressStream> openStreamLocked(double duration)
    {
        if (stream_)
            stream_->close();
        stream_ = std::make_shared<ProgressStream>();
        stream_->push({TransitionProgress::Phase::preparing, duration, 0.0});
        crossfading_ = true;
        ++streamsOpened_;
        streamOpened_.notify_all();

        if (autoComplete_.count() > 0)
        {
            auto stream = stream_;
            auto after = autoComplete_;
            rampThreads_.emplace_back([this, stream, after, duration]
            {
                auto end = std::chrono::steady_clock::now() + after;
                while (std::chrono::steady_clock::now() < end)
                {
                    if (stream->isClosed())
                        return;
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                std::lock_guard<std::mutex> lock(mutex_);
                if (stream_ == stream && !stream->isClosed())
                {
                    stream->push({TransitionProgress::Phase::fading, duration, duration});
                    finishLocked();
                }
            });
        }
        return stream_;
    }

    // Ends the open stream and any blocking single-channel fade.
    void closeLocked()
    {
        if (stream_)
            stream_->close();
        ++fadeInterrupts_;
        fadeChanged_.notify_all();
    }

    void finishLocked()
    {
        active().gain = 0.0f;
        inactive().gain = 1.0f;
        crossfading_ = false;
        closeLocked();
    }

    mutable std::mutex mutex_;
    std::condition_variable streamOpened_;

    std::unordered_map<std::string, AssetPtr> assets_;
    std::set<std::string> failing_;
    std::chrono::milliseconds loadDelay_{0};
    std::chrono::milliseconds autoComplete_{0};
    std::chrono::milliseconds fadeTime_{0};
    std::condition_variable fadeChanged_;
    int fadesStarted_ = 0;
    int fadeInterrupts_ = 0;

    Channel channels_[2];
    int activeIndex_ = 0;
    bool crossfading_ = false;
    bool snapshotAvailable_ = true;
    double position_ = 0.0;
    double duration_ = 0.0;
    bool positionSet_ = false;

    std::shared_ptr<ProgressStream> stream_;
    int streamsOpened_ = 0;
    std::vector<std::thread> rampThreads_;

    std::vector<std::string> calls_;
};

} // namespace segue
