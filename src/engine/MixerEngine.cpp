#include "engine/MixerEngine.h"

#include <algorithm>
#include <cmath>

namespace segue {

using ScopedChannelLock = juce::SpinLock::ScopedLockType;

MixerEngine::MixerEngine(double sampleRate)
    : sampleRate_(sampleRate)
{
    formatManager_.registerBasicFormats();
    SG_INFO("MixerEngine: sr=%.1f, %d audio formats", sampleRate_,
            formatManager_.getNumKnownFormats());
}

MixerEngine::~MixerEngine()
{
    interruptRamp();
    SG_DEBUG("MixerEngine: destroyed with %d registered assets", static_cast<int>(assets_.size()));
}

// ═══════════════════════════════════════════════════════════════════
// Assets
// ═══════════════════════════════════════════════════════════════════

bool MixerEngine::addAsset(const std::string& uri, juce::AudioBuffer<float>&& samples,
                           double sampleRate, std::string& error)
{
    if (uri.empty() || samples.getNumChannels() <= 0 || samples.getNumSamples() <= 0
        || sampleRate <= 0.0)
    {
        error = "Invalid asset parameters for '" + uri + "'";
        SG_WARN("MixerEngine::addAsset: %s", error.c_str());
        return false;
    }

    auto asset = std::make_shared<DecodedAsset>();
    asset->uri = uri;
    asset->sampleRate = sampleRate;
    asset->numChannels = samples.getNumChannels();
    asset->durationSeconds = samples.getNumSamples() / sampleRate;
    asset->samples = std::move(samples);

    std::lock_guard<std::mutex> lock(assetsMutex_);
    assets_[uri] = std::move(asset);
    SG_INFO("MixerEngine::addAsset: %s", uri.c_str());
    return true;
}

bool MixerEngine::loadAsset(const std::string& uri, AssetPtr& asset, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(assetsMutex_);
        auto it = assets_.find(uri);
        if (it != assets_.end())
        {
            asset = it->second;
            return true;
        }
    }

    if (!juce::File::isAbsolutePath(uri))
    {
        error = "Not a registered asset or absolute path: " + uri;
        SG_WARN("MixerEngine::loadAsset: %s", error.c_str());
        return false;
    }

    juce::File file(uri);
    if (!file.existsAsFile())
    {
        error = "File not found: " + uri;
        SG_WARN("MixerEngine::loadAsset: %s", error.c_str());
        return false;
    }

    std::unique_ptr<juce::AudioFormatReader> reader;
    {
        std::lock_guard<std::mutex> lock(formatMutex_);
        reader.reset(formatManager_.createReaderFor(file));
    }
    if (!reader)
    {
        error = "Unsupported or corrupted audio file: " + uri;
        SG_WARN("MixerEngine::loadAsset: %s", error.c_str());
        return false;
    }

    auto numChannels = static_cast<int>(reader->numChannels);
    auto numSamples = static_cast<int>(reader->lengthInSamples);

    auto decoded = std::make_shared<DecodedAsset>();
    decoded->samples.setSize(numChannels, numSamples);
    if (!reader->read(&decoded->samples, 0, numSamples, 0, true, true))
    {
        error = "Failed to read audio data from: " + uri;
        SG_WARN("MixerEngine::loadAsset: %s", error.c_str());
        return false;
    }

    decoded->uri = uri;
    decoded->sampleRate = reader->sampleRate;
    decoded->numChannels = numChannels;
    decoded->durationSeconds = reader->sampleRate > 0.0 ? numSamples / reader->sampleRate : 0.0;

    if (decoded->sampleRate != sampleRate_)
        SG_WARN("MixerEngine::loadAsset: %s is %.1f Hz, mixer runs at %.1f Hz",
                uri.c_str(), decoded->sampleRate, sampleRate_);

    SG_INFO("MixerEngine::loadAsset: %s ch=%d len=%d sr=%.1f", uri.c_str(), numChannels,
            numSamples, decoded->sampleRate);
    asset = std::move(decoded);
    return true;
}

void MixerEngine::assignInactiveChannel(AssetPtr asset)
{
    auto decoded = std::dynamic_pointer_cast<const DecodedAsset>(asset);
    if (asset && !decoded)
        SG_ERROR("MixerEngine::assignInactiveChannel: %s was not decoded by this engine",
                 asset->uri.c_str());

    ScopedChannelLock lock(channelLock_);
    Channel& ch = inactive();
    ch.asset = std::move(decoded);
    ch.position = 0;
    ch.playing = false;
}

void MixerEngine::prepareInactiveChannel()
{
    ScopedChannelLock lock(channelLock_);
    Channel& ch = inactive();
    ch.gain = 0.0f;
    ch.position = 0;
}

void MixerEngine::clearInactiveAsset()
{
    ScopedChannelLock lock(channelLock_);
    inactive().asset.reset();
}

// ═══════════════════════════════════════════════════════════════════
// Ramps
// ═══════════════════════════════════════════════════════════════════

uint64_t MixerEngine::interruptRamp()
{
    std::thread previous;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(rampMutex_);
        generation = ++rampGeneration_;
        previous = std::move(rampThread_);
    }
    rampWake_.notify_all();

    if (previous.joinable())
        previous.join();
    return generation;
}

void MixerEngine::applyRamp(const Ramp& ramp, double progress)
{
    float activeGain = rampGain(ramp.curve, ramp.activeFrom, ramp.activeTo, progress);
    float inactiveGain = rampGain(ramp.curve, ramp.inactiveFrom, ramp.inactiveTo, progress);

    ScopedChannelLock lock(channelLock_);
    active().gain = activeGain;
    inactive().gain = inactiveGain;
}

bool MixerEngine::runRamp(const Ramp& ramp, uint64_t generation, ProgressStream* stream)
{
    if (ramp.duration <= 0.0)
    {
        applyRamp(ramp, 1.0);
        if (stream)
            stream->push({TransitionProgress::Phase::fading, 0.0, 0.0});
        return true;
    }

    int steps = std::max(1, static_cast<int>(std::ceil(ramp.duration * fadeStepsPerSecond(ramp.duration))));
    auto interval = std::chrono::duration<double>(ramp.duration / steps);

    for (int i = 1; i <= steps; ++i)
    {
        {
            std::unique_lock<std::mutex> lock(rampMutex_);
            if (rampWake_.wait_for(lock, interval, [&] { return rampGeneration_ != generation; }))
                return false;
        }

        double progress = static_cast<double>(i) / steps;
        applyRamp(ramp, progress);
        if (stream)
            stream->push({TransitionProgress::Phase::fading, ramp.duration, progress * ramp.duration});
    }
    return true;
}

std::shared_ptr<ProgressStream> MixerEngine::startBackgroundRamp(const Ramp& ramp)
{
    uint64_t generation = interruptRamp();
    auto stream = std::make_shared<ProgressStream>();
    stream->push({TransitionProgress::Phase::preparing, ramp.duration, 0.0});

    std::lock_guard<std::mutex> lock(rampMutex_);
    ramping_.store(true);
    rampThread_ = std::thread([this, ramp, generation, stream]
    {
        bool finished = runRamp(ramp, generation, stream.get());
        SG_DEBUG("MixerEngine: ramp %s after %.2fs", finished ? "finished" : "interrupted",
                 ramp.duration);
        ramping_.store(false);
        stream->close();
    });
    return stream;
}

std::shared_ptr<ProgressStream> MixerEngine::performSynchronizedTransition(double duration,
                                                                           FadeCurve curve)
{
    Ramp ramp;
    {
        ScopedChannelLock lock(channelLock_);
        preTransitionGain_ = active().gain;
        inactive().playing = inactive().asset != nullptr;
        inCrossfade_ = true;
        ramp.activeFrom = active().gain;
        ramp.inactiveFrom = inactive().gain;
    }
    ramp.activeTo = 0.0f;
    ramp.inactiveTo = 1.0f;
    ramp.duration = duration;
    ramp.curve = curve;

    SG_INFO("MixerEngine: crossfade %.2fs (%s)", duration, fadeCurveName(curve));
    return startBackgroundRamp(ramp);
}

std::shared_ptr<ProgressStream> MixerEngine::resumeTransition(double duration, FadeCurve curve,
                                                              float activeGain, float inactiveGain)
{
    Ramp ramp;
    ramp.activeFrom = activeGain;
    ramp.inactiveFrom = inactiveGain;
    ramp.activeTo = 0.0f;
    ramp.inactiveTo = 1.0f;
    ramp.duration = duration;
    ramp.curve = curve;

    interruptRamp();
    {
        ScopedChannelLock lock(channelLock_);
        active().gain = activeGain;
        inactive().gain = inactiveGain;
        active().playing = active().asset != nullptr;
        inactive().playing = inactive().asset != nullptr;
        inCrossfade_ = true;
    }

    SG_INFO("MixerEngine: resuming crossfade from %.3f/%.3f over %.2fs",
            activeGain, inactiveGain, duration);
    return startBackgroundRamp(ramp);
}

void MixerEngine::pauseBothChannels()
{
    interruptRamp();
    ScopedChannelLock lock(channelLock_);
    channels_[0].playing = false;
    channels_[1].playing = false;
}

void MixerEngine::stopBothChannels()
{
    interruptRamp();
    ScopedChannelLock lock(channelLock_);
    for (auto& ch : channels_)
    {
        ch.playing = false;
        ch.position = 0;
    }
    inCrossfade_ = false;
}

float MixerEngine::rollbackTransition(double duration)
{
    uint64_t generation = interruptRamp();

    Ramp ramp;
    {
        ScopedChannelLock lock(channelLock_);
        ramp.activeFrom = active().gain;
        ramp.inactiveFrom = inactive().gain;
        ramp.activeTo = inCrossfade_ ? preTransitionGain_ : 1.0f;
        inCrossfade_ = false;
    }
    ramp.inactiveTo = 0.0f;
    ramp.duration = duration;
    ramp.curve = FadeCurve::linear;

    SG_INFO("MixerEngine: rollback from %.3f over %.2fs", ramp.activeFrom, duration);
    runRamp(ramp, generation, nullptr);
    return ramp.activeFrom;
}

void MixerEngine::fastForwardTransition(double duration)
{
    uint64_t generation = interruptRamp();

    Ramp ramp;
    {
        ScopedChannelLock lock(channelLock_);
        if (!inCrossfade_)
        {
            SG_DEBUG("MixerEngine: fast-forward with no crossfade running");
            return;
        }
        ramp.activeFrom = active().gain;
        ramp.inactiveFrom = inactive().gain;
    }
    ramp.activeTo = 0.0f;
    ramp.inactiveTo = 1.0f;
    ramp.duration = duration;
    ramp.curve = FadeCurve::linear;

    SG_INFO("MixerEngine: fast-forward over %.2fs", duration);
    runRamp(ramp, generation, nullptr);
}

void MixerEngine::cancelTransition()
{
    interruptRamp();
    ScopedChannelLock lock(channelLock_);
    Channel& out = inactive();
    out.playing = false;
    out.gain = 0.0f;
    out.position = 0;
    active().gain = 1.0f;
    inCrossfade_ = false;
}

// ═══════════════════════════════════════════════════════════════════
// Single-channel control
// ═══════════════════════════════════════════════════════════════════

void MixerEngine::fadeActiveChannel(float from, float to, double duration, FadeCurve curve)
{
    uint64_t generation = interruptRamp();

    Ramp ramp;
    ramp.activeFrom = from;
    ramp.activeTo = to;
    {
        ScopedChannelLock lock(channelLock_);
        ramp.inactiveFrom = inactive().gain;
        ramp.inactiveTo = inactive().gain;
    }
    ramp.duration = duration;
    ramp.curve = curve;

    runRamp(ramp, generation, nullptr);
}

void MixerEngine::startActiveChannel()
{
    ScopedChannelLock lock(channelLock_);
    active().playing = active().asset != nullptr;
}

void MixerEngine::switchActiveChannel()
{
    ScopedChannelLock lock(channelLock_);
    activeIndex_ = 1 - activeIndex_;
    inCrossfade_ = false;
}

void MixerEngine::stopInactiveChannel()
{
    ScopedChannelLock lock(channelLock_);
    inactive().playing = false;
    inactive().position = 0;
}

void MixerEngine::resetInactiveMixer()
{
    ScopedChannelLock lock(channelLock_);
    inactive().gain = 0.0f;
}

void MixerEngine::setMasterGain(float gain)
{
    masterGain_.store(juce::jlimit(0.0f, 1.0f, gain));
}

float MixerEngine::getMasterGain() const
{
    return masterGain_.load();
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

bool MixerEngine::getCrossfadeSnapshot(CrossfadeSnapshot& out) const
{
    ScopedChannelLock lock(channelLock_);
    if (!inCrossfade_)
        return false;

    const Channel& a = active();
    const Channel& b = inactive();
    out.activeGain = a.gain;
    out.inactiveGain = b.gain;
    out.activePosition = a.asset ? a.position / a.asset->sampleRate : 0.0;
    out.inactivePosition = b.asset ? b.position / b.asset->sampleRate : 0.0;
    out.activeChannel = activeIndex_ == 0 ? ChannelId::a : ChannelId::b;
    return true;
}

bool MixerEngine::getCurrentPosition(PlaybackPosition& out) const
{
    ScopedChannelLock lock(channelLock_);
    const Channel& ch = active();
    if (!ch.asset)
        return false;
    out.position = ch.position / ch.asset->sampleRate;
    out.duration = ch.asset->durationSeconds;
    return true;
}

ChannelId MixerEngine::getActiveChannel() const
{
    ScopedChannelLock lock(channelLock_);
    return activeIndex_ == 0 ? ChannelId::a : ChannelId::b;
}

float MixerEngine::getChannelGain(ChannelId id) const
{
    ScopedChannelLock lock(channelLock_);
    return channels_[indexOf(id)].gain;
}

bool MixerEngine::isChannelPlaying(ChannelId id) const
{
    ScopedChannelLock lock(channelLock_);
    return channels_[indexOf(id)].playing;
}

AssetPtr MixerEngine::getChannelAsset(ChannelId id) const
{
    ScopedChannelLock lock(channelLock_);
    return channels_[indexOf(id)].asset;
}

bool MixerEngine::isRamping() const
{
    return ramping_.load();
}

// ═══════════════════════════════════════════════════════════════════
// Audio thread
// ═══════════════════════════════════════════════════════════════════

void MixerEngine::render(float* const* output, int numChannels, int numSamples)
{
    for (int ch = 0; ch < numChannels; ++ch)
        juce::FloatVectorOperations::clear(output[ch], numSamples);

    float master = masterGain_.load(std::memory_order_relaxed);

    ScopedChannelLock lock(channelLock_);
    for (auto& channel : channels_)
    {
        if (!channel.playing || !channel.asset)
            continue;

        const auto& samples = channel.asset->samples;
        int64_t available = samples.getNumSamples() - channel.position;
        int count = static_cast<int>(std::min<int64_t>(numSamples, std::max<int64_t>(0, available)));
        float gain = channel.gain * master;

        for (int ch = 0; ch < numChannels && count > 0; ++ch)
        {
            int src = std::min(ch, samples.getNumChannels() - 1);
            juce::FloatVectorOperations::addWithMultiply(
                output[ch], samples.getReadPointer(src, static_cast<int>(channel.position)),
                gain, count);
        }

        channel.position += count;
        if (channel.position >= samples.getNumSamples())
        {
            channel.playing = false;
            SG_DEBUG_RT("MixerEngine: %s reached its end", channel.asset->uri.c_str());
        }
    }
}

} // namespace segue
