#ifndef SEGUE_FFI_H
#define SEGUE_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Opaque handle ─────────────────────────────────────────────── */

typedef void* SgService;

/* ── String ownership ──────────────────────────────────────────── */

/// Free a string returned by any sg_* function.
/// Passing NULL is safe (no-op).
void sg_free_string(char* s);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=error, 2=warn, 3=info, 4=debug, 5=trace.
void sg_set_log_level(int level);

/// Same, by name ("off", "error", "warn", "info", "debug", "trace").
/// Returns false and leaves the level unchanged for an unknown name.
bool sg_set_log_level_name(const char* name);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
void sg_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── Configuration ─────────────────────────────────────────────── */

/* fade_curve: 0=equal_power, 1=linear, 2=logarithmic, 3=exponential, 4=s_curve */
typedef struct {
    double crossfade_duration;
    int    fade_curve;
    int    max_queue_depth;
    double rollback_duration;
    double quick_finish_duration;
    double expected_asset_load;
    bool   signal_running_on_preempt;
    int    volume;
} SgConfig;

/// Defaults: 10 s equal-power crossfade, queue depth 10, volume 100.
SgConfig sg_config_default(void);

/// Returns the curve index for a name, or -1 if unknown.
int sg_fade_curve_from_name(const char* name);

/* ── Service lifecycle ─────────────────────────────────────────── */

/// Create a service over a two-channel mixer running at sample_rate.
/// config may be NULL for defaults. Returns NULL on failure (sets *error).
SgService sg_service_create(double sample_rate, const SgConfig* config, char** error);

/// Destroy the service. Cancels queued commands and running transitions.
/// Passing NULL is safe (no-op).
void sg_service_destroy(SgService service);

/* ── Assets ────────────────────────────────────────────────────── */

/// Register decoded audio under uri so play/crossfade can use it without a
/// file. channels[num_channels][num_samples] is copied.
bool sg_add_asset(SgService service, const char* uri, const float* const* channels,
                  int num_channels, int num_samples, double sample_rate, char** error);

/* ── Commands (blocking, serialized) ───────────────────────────── */

/// uri is a registered asset or an absolute audio file path.
bool sg_play(SgService service, const char* uri, char** error);

/// Crossfade to uri with the configured duration and curve.
/// automatic != 0 marks it as a loop transition rather than a manual change.
bool sg_crossfade(SgService service, const char* uri, int automatic, char** error);

bool sg_pause(SgService service, char** error);
bool sg_resume(SgService service, char** error);
bool sg_stop(SgService service, char** error);

/// Block until no command or transition is running.
void sg_wait_idle(SgService service);

/* ── State queries ─────────────────────────────────────────────── */

int sg_queue_depth(SgService service);

/// 0=stopped, 1=playing, 2=paused
int sg_playback_mode(SgService service);

/// 0=A, 1=B
int sg_active_channel(SgService service);

/// URI of the active asset, or NULL. Caller must sg_free_string() the result.
char* sg_active_asset(SgService service);

bool sg_is_transitioning(SgService service);
bool sg_has_paused_transition(SgService service);
double sg_transition_progress(SgService service);

/* ── Audio ─────────────────────────────────────────────────────── */

/// Render num_samples into output[num_channels] (overwritten).
void sg_render(SgService service, float** output, int num_channels, int num_samples);

#ifdef __cplusplus
}
#endif

#endif /* SEGUE_FFI_H */
