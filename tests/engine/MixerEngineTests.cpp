#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "engine/MixerEngine.h"

#include <chrono>
#include <thread>

using namespace segue;
using Catch::Matchers::WithinAbs;

// ═══════════════════════════════════════════════════════════════════
// Test helpers
// ═══════════════════════════════════════════════════════════════════

static juce::AudioBuffer<float> constantBuffer(int numChannels, int numSamples, float value)
{
    juce::AudioBuffer<float> buffer(numChannels, numSamples);
    for (int ch = 0; ch < numChannels; ++ch)
        juce::FloatVectorOperations::fill(buffer.getWritePointer(ch), value, numSamples);
    return buffer;
}

static void addConstant(MixerEngine& engine, const std::string& uri, float value,
                        int numSamples = 88200)
{
    std::string error;
    REQUIRE(engine.addAsset(uri, constantBuffer(2, numSamples, value), 44100.0, error));
}

// Puts `uri` on the active channel at full gain, playing.
static void makeActive(MixerEngine& engine, const std::string& uri)
{
    AssetPtr asset;
    std::string error;
    REQUIRE(engine.loadAsset(uri, asset, error));
    engine.assignInactiveChannel(asset);
    engine.switchActiveChannel();
    engine.fadeActiveChannel(1.0f, 1.0f, 0.0, FadeCurve::linear);
    engine.startActiveChannel();
}

static void cueInactive(MixerEngine& engine, const std::string& uri)
{
    AssetPtr asset;
    std::string error;
    REQUIRE(engine.loadAsset(uri, asset, error));
    engine.assignInactiveChannel(asset);
    engine.prepareInactiveChannel();
}

static TransitionProgress drain(ProgressStream& stream)
{
    TransitionProgress last;
    TransitionProgress event;
    while (stream.next(event))
        last = event;
    return last;
}

static ChannelId inactiveId(const MixerEngine& engine)
{
    return oppositeChannel(engine.getActiveChannel());
}

// ═══════════════════════════════════════════════════════════════════
// Assets
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("MixerEngine addAsset rejects empty audio")
{
    MixerEngine engine;
    std::string error;
    CHECK_FALSE(engine.addAsset("", constantBuffer(2, 10, 0.0f), 44100.0, error));
    CHECK_FALSE(error.empty());
    CHECK_FALSE(engine.addAsset("x", juce::AudioBuffer<float>(), 44100.0, error));
    CHECK_FALSE(engine.addAsset("x", constantBuffer(1, 10, 0.0f), 0.0, error));
}

TEST_CASE("MixerEngine loadAsset returns registered assets with their metadata")
{
    MixerEngine engine;
    addConstant(engine, "tone", 0.5f, 44100);

    AssetPtr asset;
    std::string error;
    REQUIRE(engine.loadAsset("tone", asset, error));
    CHECK(asset->uri == "tone");
    CHECK(asset->numChannels == 2);
    CHECK_THAT(asset->durationSeconds, WithinAbs(1.0, 1e-9));
}

TEST_CASE("MixerEngine loadAsset fails for unknown relative names")
{
    MixerEngine engine;
    AssetPtr asset;
    std::string error;
    CHECK_FALSE(engine.loadAsset("nothing.wav", asset, error));
    CHECK(asset == nullptr);
    CHECK(error.find("nothing.wav") != std::string::npos);
}

TEST_CASE("MixerEngine loadAsset fails for a nonexistent file")
{
    MixerEngine engine;
    AssetPtr asset;
    std::string error;
    CHECK_FALSE(engine.loadAsset("/nonexistent/path/foo.wav", asset, error));
    CHECK_FALSE(error.empty());
}

TEST_CASE("MixerEngine loadAsset decodes a WAV file")
{
    juce::TemporaryFile tmpFile(".wav");
    auto outFile = tmpFile.getFile();
    {
        juce::WavAudioFormat wavFormat;
        std::unique_ptr<juce::AudioFormatWriter> writer(
            wavFormat.createWriterFor(
                new juce::FileOutputStream(outFile),
                44100.0, 2, 16, {}, 0));
        REQUIRE(writer != nullptr);

        juce::AudioBuffer<float> data(2, 4410);
        data.clear();
        for (int i = 0; i < 4410; ++i)
            data.setSample(0, i, 0.25f);
        writer->writeFromAudioSampleBuffer(data, 0, 4410);
    }

    MixerEngine engine;
    AssetPtr asset;
    std::string error;
    REQUIRE(engine.loadAsset(outFile.getFullPathName().toStdString(), asset, error));
    CHECK(asset->numChannels == 2);
    CHECK_THAT(asset->durationSeconds, WithinAbs(0.1, 1e-6));
    CHECK_THAT(asset->sampleRate, WithinAbs(44100.0, 1.0));

    auto decoded = std::dynamic_pointer_cast<const DecodedAsset>(asset);
    REQUIRE(decoded != nullptr);
    CHECK_THAT(decoded->samples.getSample(0, 100), WithinAbs(0.25, 1e-3));
}

// ═══════════════════════════════════════════════════════════════════
// Render
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("MixerEngine renders silence with nothing playing")
{
    MixerEngine engine;
    auto out = constantBuffer(2, 64, 9.0f);
    engine.render(out.getArrayOfWritePointers(), 2, 64);
    CHECK(out.getMagnitude(0, 64) == 0.0f);
}

TEST_CASE("MixerEngine renders the active channel at its gain and the master gain")
{
    MixerEngine engine;
    addConstant(engine, "a", 0.5f);
    makeActive(engine, "a");

    juce::AudioBuffer<float> out(2, 64);
    engine.render(out.getArrayOfWritePointers(), 2, 64);
    CHECK_THAT(out.getSample(0, 0), WithinAbs(0.5, 1e-6));
    CHECK_THAT(out.getSample(1, 63), WithinAbs(0.5, 1e-6));

    engine.setMasterGain(0.5f);
    engine.render(out.getArrayOfWritePointers(), 2, 64);
    CHECK_THAT(out.getSample(0, 10), WithinAbs(0.25, 1e-6));

    PlaybackPosition position;
    REQUIRE(engine.getCurrentPosition(position));
    CHECK_THAT(position.position, WithinAbs(128.0 / 44100.0, 1e-9));
}

TEST_CASE("MixerEngine master gain is clamped to [0, 1]")
{
    MixerEngine engine;
    engine.setMasterGain(2.0f);
    CHECK(engine.getMasterGain() == 1.0f);
    engine.setMasterGain(-1.0f);
    CHECK(engine.getMasterGain() == 0.0f);
}

TEST_CASE("MixerEngine stops a channel at the end of its asset")
{
    MixerEngine engine;
    addConstant(engine, "short", 1.0f, 100);
    makeActive(engine, "short");

    juce::AudioBuffer<float> out(2, 64);
    engine.render(out.getArrayOfWritePointers(), 2, 64);
    engine.render(out.getArrayOfWritePointers(), 2, 64);
    CHECK_THAT(out.getSample(0, 35), WithinAbs(1.0, 1e-6));
    CHECK(out.getSample(0, 36) == 0.0f);
    CHECK_FALSE(engine.isChannelPlaying(engine.getActiveChannel()));
    Logger::drain();
}

TEST_CASE("MixerEngine getCurrentPosition is false with nothing loaded")
{
    MixerEngine engine;
    PlaybackPosition position;
    CHECK_FALSE(engine.getCurrentPosition(position));
}

// ═══════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("MixerEngine synchronized transition ramps to the other channel")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    cueInactive(engine, "b");

    CrossfadeSnapshot snapshot;
    CHECK_FALSE(engine.getCrossfadeSnapshot(snapshot));

    auto stream = engine.performSynchronizedTransition(0.1, FadeCurve::linear);
    REQUIRE(stream != nullptr);
    CHECK(engine.isChannelPlaying(inactiveId(engine)));

    auto last = drain(*stream);
    CHECK_THAT(last.progress(), WithinAbs(1.0, 1e-9));
    CHECK_FALSE(engine.isRamping());
    CHECK_THAT(engine.getChannelGain(engine.getActiveChannel()), WithinAbs(0.0, 1e-6));
    CHECK_THAT(engine.getChannelGain(inactiveId(engine)), WithinAbs(1.0, 1e-6));

    juce::AudioBuffer<float> out(2, 32);
    engine.render(out.getArrayOfWritePointers(), 2, 32);
    CHECK_THAT(out.getSample(0, 0), WithinAbs(0.5, 1e-6));
}

TEST_CASE("MixerEngine pause freezes a crossfade and keeps its snapshot")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    cueInactive(engine, "b");

    auto stream = engine.performSynchronizedTransition(5.0, FadeCurve::linear);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    engine.pauseBothChannels();
    drain(*stream);
    CHECK(stream->isClosed());

    CHECK_FALSE(engine.isChannelPlaying(ChannelId::a));
    CHECK_FALSE(engine.isChannelPlaying(ChannelId::b));

    CrossfadeSnapshot snapshot;
    REQUIRE(engine.getCrossfadeSnapshot(snapshot));
    CHECK(snapshot.activeChannel == engine.getActiveChannel());
    CHECK(snapshot.activeGain < 1.0f);
    CHECK(snapshot.inactiveGain > 0.0f);
    CHECK(snapshot.activeGain > snapshot.inactiveGain);

    // Gains hold while paused
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(engine.getChannelGain(engine.getActiveChannel()) == snapshot.activeGain);

    auto resumed = engine.resumeTransition(0.05, FadeCurve::linear,
                                           snapshot.activeGain, snapshot.inactiveGain);
    CHECK(engine.isChannelPlaying(ChannelId::a));
    CHECK(engine.isChannelPlaying(ChannelId::b));
    drain(*resumed);
    CHECK_THAT(engine.getChannelGain(inactiveId(engine)), WithinAbs(1.0, 1e-6));
}

TEST_CASE("MixerEngine rollback returns to the pre-transition gains")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    cueInactive(engine, "b");

    auto stream = engine.performSynchronizedTransition(5.0, FadeCurve::linear);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    float from = engine.rollbackTransition(0.05);
    CHECK(from <= 1.0f);
    drain(*stream);

    CHECK_THAT(engine.getChannelGain(engine.getActiveChannel()), WithinAbs(1.0, 1e-5));
    CHECK_THAT(engine.getChannelGain(inactiveId(engine)), WithinAbs(0.0, 1e-5));
    CrossfadeSnapshot snapshot;
    CHECK_FALSE(engine.getCrossfadeSnapshot(snapshot));
}

TEST_CASE("MixerEngine fast-forward completes the running crossfade")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    cueInactive(engine, "b");

    auto stream = engine.performSynchronizedTransition(5.0, FadeCurve::equalPower);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    engine.fastForwardTransition(0.05);
    drain(*stream);

    CHECK_THAT(engine.getChannelGain(engine.getActiveChannel()), WithinAbs(0.0, 1e-5));
    CHECK_THAT(engine.getChannelGain(inactiveId(engine)), WithinAbs(1.0, 1e-5));
}

TEST_CASE("MixerEngine fast-forward outside a crossfade changes nothing")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    makeActive(engine, "a");

    engine.fastForwardTransition(0.05);
    CHECK(engine.getChannelGain(engine.getActiveChannel()) == 1.0f);
    CHECK(engine.getChannelGain(inactiveId(engine)) == 0.0f);
}

TEST_CASE("MixerEngine cancel silences the incoming channel at once")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    cueInactive(engine, "b");

    auto stream = engine.performSynchronizedTransition(5.0, FadeCurve::linear);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    engine.cancelTransition();
    drain(*stream);

    CHECK(engine.getChannelGain(engine.getActiveChannel()) == 1.0f);
    CHECK(engine.getChannelGain(inactiveId(engine)) == 0.0f);
    CHECK_FALSE(engine.isChannelPlaying(inactiveId(engine)));
    CHECK(engine.isChannelPlaying(engine.getActiveChannel()));
}

TEST_CASE("MixerEngine fadeActiveChannel blocks until the ramp is done")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    makeActive(engine, "a");

    engine.fadeActiveChannel(1.0f, 0.0f, 0.05, FadeCurve::sCurve);
    CHECK_THAT(engine.getChannelGain(engine.getActiveChannel()), WithinAbs(0.0, 1e-6));
}

TEST_CASE("MixerEngine switch, stop and clear the inactive side")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    addConstant(engine, "b", 0.5f);
    makeActive(engine, "a");
    ChannelId first = engine.getActiveChannel();
    cueInactive(engine, "b");

    engine.switchActiveChannel();
    CHECK(engine.getActiveChannel() == oppositeChannel(first));
    CHECK(engine.getChannelAsset(engine.getActiveChannel())->uri == "b");

    engine.stopInactiveChannel();
    engine.resetInactiveMixer();
    engine.clearInactiveAsset();
    CHECK_FALSE(engine.isChannelPlaying(first));
    CHECK(engine.getChannelGain(first) == 0.0f);
    CHECK(engine.getChannelAsset(first) == nullptr);
}

TEST_CASE("MixerEngine stopBothChannels rewinds")
{
    MixerEngine engine;
    addConstant(engine, "a", 1.0f);
    makeActive(engine, "a");

    juce::AudioBuffer<float> out(2, 441);
    engine.render(out.getArrayOfWritePointers(), 2, 441);
    engine.stopBothChannels();

    PlaybackPosition position;
    REQUIRE(engine.getCurrentPosition(position));
    CHECK(position.position == 0.0);
    CHECK_FALSE(engine.isChannelPlaying(engine.getActiveChannel()));
}
