#pragma once

#include "core/ChannelEngine.h"
#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace segue {

/// Asset decoded into memory. The sample rate is the file's; the mixer
/// plays samples 1:1 and does not resample.
struct DecodedAsset : Asset {
    juce::AudioBuffer<float> samples;
};

/// Reference ChannelEngine: two in-memory players, each with a gain stage,
/// summed by render(). Gain ramps run on a helper thread (or on the caller
/// for the blocking calls) at the fade step rate for their duration.
class MixerEngine : public ChannelEngine {
public:
    explicit MixerEngine(double sampleRate = 44100.0);
    ~MixerEngine() override;

    MixerEngine(const MixerEngine&) = delete;
    MixerEngine& operator=(const MixerEngine&) = delete;

    /// Register already decoded audio under `uri`; loadAsset() returns it
    /// without touching the file system.
    bool addAsset(const std::string& uri, juce::AudioBuffer<float>&& samples,
                  double sampleRate, std::string& error);

    void setMasterGain(float gain);
    float getMasterGain() const;
    double getSampleRate() const { return sampleRate_; }

    // --- ChannelEngine ---
    bool loadAsset(const std::string& uri, AssetPtr& asset, std::string& error) override;
    void assignInactiveChannel(AssetPtr asset) override;
    void prepareInactiveChannel() override;
    void clearInactiveAsset() override;

    std::shared_ptr<ProgressStream> performSynchronizedTransition(double duration,
                                                                  FadeCurve curve) override;
    std::shared_ptr<ProgressStream> resumeTransition(double duration, FadeCurve curve,
                                                     float activeGain, float inactiveGain) override;
    void pauseBothChannels() override;
    void stopBothChannels() override;
    float rollbackTransition(double duration) override;
    void fastForwardTransition(double duration) override;
    void cancelTransition() override;

    void fadeActiveChannel(float from, float to, double duration, FadeCurve curve) override;
    void startActiveChannel() override;
    void switchActiveChannel() override;
    void stopInactiveChannel() override;
    void resetInactiveMixer() override;

    bool getCrossfadeSnapshot(CrossfadeSnapshot& out) const override;
    bool getCurrentPosition(PlaybackPosition& out) const override;

    // --- Audio thread ---

    /// Sum both channels into `output` (overwritten), then advance positions.
    void render(float* const* output, int numChannels, int numSamples);

    // --- Queries ---
    ChannelId getActiveChannel() const;
    float getChannelGain(ChannelId id) const;
    bool isChannelPlaying(ChannelId id) const;
    AssetPtr getChannelAsset(ChannelId id) const;
    bool isRamping() const;

private:
    struct Channel {
        std::shared_ptr<const DecodedAsset> asset;
        float gain = 0.0f;
        int64_t position = 0; // samples
        bool playing = false;
    };

    struct Ramp {
        float activeFrom = 0.0f;
        float activeTo = 0.0f;
        float inactiveFrom = 0.0f;
        float inactiveTo = 0.0f;
        double duration = 0.0;
        FadeCurve curve = FadeCurve::equalPower;
    };

    Channel& active() { return channels_[activeIndex_]; }
    Channel& inactive() { return channels_[1 - activeIndex_]; }
    const Channel& active() const { return channels_[activeIndex_]; }
    const Channel& inactive() const { return channels_[1 - activeIndex_]; }
    static int indexOf(ChannelId id) { return id == ChannelId::a ? 0 : 1; }

    // Stop whatever ramp is running and wait for its thread. Returns the
    // generation the next ramp must run under.
    uint64_t interruptRamp();
    // Steps the ramp until done (true) or interrupted (false).
    bool runRamp(const Ramp& ramp, uint64_t generation, ProgressStream* stream);
    void applyRamp(const Ramp& ramp, double progress);
    std::shared_ptr<ProgressStream> startBackgroundRamp(const Ramp& ramp);

    double sampleRate_;
    std::atomic<float> masterGain_{1.0f};

    juce::AudioFormatManager formatManager_;
    std::mutex formatMutex_;
    std::mutex assetsMutex_;
    std::unordered_map<std::string, std::shared_ptr<const DecodedAsset>> assets_;

    mutable juce::SpinLock channelLock_;
    Channel channels_[2];
    int activeIndex_ = 0;
    bool inCrossfade_ = false;
    float preTransitionGain_ = 1.0f;

    std::mutex rampMutex_;
    std::condition_variable rampWake_;
    uint64_t rampGeneration_ = 0;
    std::thread rampThread_;
    std::atomic<bool> ramping_{false};
};

} // namespace segue
