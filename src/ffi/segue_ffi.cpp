#include "ffi/segue_ffi.h"
#include "core/Logger.h"
#include "core/TransitionService.h"
#include "engine/MixerEngine.h"

#include <cstdlib>
#include <cstring>
#include <memory>

// --- ServiceHandle ---

struct ServiceHandle {
    std::shared_ptr<segue::MixerEngine> mixer;
    std::unique_ptr<segue::TransitionService> service;
};

static ServiceHandle* cast(SgService s)
{
    return static_cast<ServiceHandle*>(s);
}

static segue::TransitionService& svc(SgService s)
{
    return *cast(s)->service;
}

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

static bool report(bool ok, const segue::Error& err, char** error)
{
    if (!ok)
        set_error(error, std::string(segue::errorCodeName(err.code)) + ": " + err.message);
    return ok;
}

static const segue::FadeCurve kCurves[] = {
    segue::FadeCurve::equalPower, segue::FadeCurve::linear, segue::FadeCurve::logarithmic,
    segue::FadeCurve::exponential, segue::FadeCurve::sCurve,
};

// --- Logger API ---

void sg_set_log_level(int level)
{
    segue::Logger::setLevel(static_cast<segue::LogLevel>(level));
}

bool sg_set_log_level_name(const char* name)
{
    return name && segue::Logger::setLevelByName(name);
}

void sg_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    segue::Logger::setCallback(callback, user_data);
}

void sg_free_string(char* s)
{
    free(s);
}

// ═══════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════

SgConfig sg_config_default(void)
{
    segue::ServiceConfig defaults;
    SgConfig c;
    c.crossfade_duration = defaults.crossfadeDuration;
    c.fade_curve = 0;
    c.max_queue_depth = defaults.maxQueueDepth;
    c.rollback_duration = defaults.rollbackDuration;
    c.quick_finish_duration = defaults.quickFinishDuration;
    c.expected_asset_load = defaults.expectedAssetLoad;
    c.signal_running_on_preempt = defaults.signalRunningOnPreempt;
    c.volume = defaults.volume;
    return c;
}

int sg_fade_curve_from_name(const char* name)
{
    segue::FadeCurve curve;
    if (!name || !segue::fadeCurveFromName(name, curve))
        return -1;
    for (int i = 0; i < 5; ++i)
        if (kCurves[i] == curve)
            return i;
    return -1;
}

// ═══════════════════════════════════════════════════════════════════
// Service lifecycle
// ═══════════════════════════════════════════════════════════════════

SgService sg_service_create(double sample_rate, const SgConfig* config, char** error)
{
    SgConfig c = config ? *config : sg_config_default();
    if (c.fade_curve < 0 || c.fade_curve > 4)
    {
        set_error(error, "fade_curve must be 0..4");
        return nullptr;
    }
    if (sample_rate <= 0.0)
    {
        set_error(error, "sample_rate must be positive");
        return nullptr;
    }

    segue::ServiceConfig sc;
    sc.crossfadeDuration = c.crossfade_duration;
    sc.fadeCurve = kCurves[c.fade_curve];
    sc.maxQueueDepth = c.max_queue_depth;
    sc.rollbackDuration = c.rollback_duration;
    sc.quickFinishDuration = c.quick_finish_duration;
    sc.expectedAssetLoad = c.expected_asset_load;
    sc.signalRunningOnPreempt = c.signal_running_on_preempt;
    sc.volume = c.volume;

    try
    {
        auto handle = std::make_unique<ServiceHandle>();
        handle->mixer = std::make_shared<segue::MixerEngine>(sample_rate);
        handle->mixer->setMasterGain(sc.volume / 100.0f);

        std::string why;
        handle->service = segue::TransitionService::create(handle->mixer, sc, why);
        if (!handle->service)
        {
            set_error(error, why);
            return nullptr;
        }
        return static_cast<SgService>(handle.release());
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return nullptr;
    }
}

void sg_service_destroy(SgService service)
{
    if (!service) return;
    delete cast(service);
}

// ═══════════════════════════════════════════════════════════════════
// Assets
// ═══════════════════════════════════════════════════════════════════

bool sg_add_asset(SgService service, const char* uri, const float* const* channels,
                  int num_channels, int num_samples, double sample_rate, char** error)
{
    if (!uri || !channels || num_channels <= 0 || num_samples <= 0)
    {
        set_error(error, "invalid asset arguments");
        return false;
    }

    juce::AudioBuffer<float> samples(num_channels, num_samples);
    for (int ch = 0; ch < num_channels; ++ch)
        samples.copyFrom(ch, 0, channels[ch], num_samples);

    std::string why;
    if (!cast(service)->mixer->addAsset(uri, std::move(samples), sample_rate, why))
    {
        set_error(error, why);
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════

bool sg_play(SgService service, const char* uri, char** error)
{
    if (!uri) { set_error(error, "uri is NULL"); return false; }
    segue::Error err;
    return report(svc(service).play(uri, err), err, error);
}

bool sg_crossfade(SgService service, const char* uri, int automatic, char** error)
{
    if (!uri) { set_error(error, "uri is NULL"); return false; }
    segue::Error err;
    auto kind = automatic ? segue::TransitionKind::automaticLoop
                          : segue::TransitionKind::manualChange;
    return report(svc(service).crossfadeTo(uri, kind, err), err, error);
}

bool sg_pause(SgService service, char** error)
{
    segue::Error err;
    return report(svc(service).pause(err), err, error);
}

bool sg_resume(SgService service, char** error)
{
    segue::Error err;
    return report(svc(service).resume(err), err, error);
}

bool sg_stop(SgService service, char** error)
{
    segue::Error err;
    return report(svc(service).stop(err), err, error);
}

void sg_wait_idle(SgService service)
{
    svc(service).waitUntilIdle();
    segue::Logger::drain();
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

int sg_queue_depth(SgService service)
{
    return svc(service).depth();
}

int sg_playback_mode(SgService service)
{
    switch (svc(service).mode())
    {
        case segue::PlaybackMode::stopped: return 0;
        case segue::PlaybackMode::playing: return 1;
        case segue::PlaybackMode::paused:  return 2;
    }
    return 0;
}

int sg_active_channel(SgService service)
{
    return svc(service).state().activeChannel == segue::ChannelId::a ? 0 : 1;
}

char* sg_active_asset(SgService service)
{
    auto asset = svc(service).state().activeAsset;
    return asset ? to_c_string(asset->uri) : nullptr;
}

bool sg_is_transitioning(SgService service)
{
    return svc(service).isTransitioning();
}

bool sg_has_paused_transition(SgService service)
{
    return svc(service).hasPausedTransition();
}

double sg_transition_progress(SgService service)
{
    return svc(service).transitionProgress();
}

// ═══════════════════════════════════════════════════════════════════
// Audio
// ═══════════════════════════════════════════════════════════════════

void sg_render(SgService service, float** output, int num_channels, int num_samples)
{
    cast(service)->mixer->render(output, num_channels, num_samples);
}
