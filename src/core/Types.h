#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace segue {

// ═══════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════

enum class ErrorCode {
    none,
    queueFull,
    invalidState,
    assetLoadTimeout,
    assetLoadFailed,
    cancelled,
    invalidConfiguration,
    engineFailure
};

inline const char* errorCodeName(ErrorCode code)
{
    switch (code) {
        case ErrorCode::none:                 return "none";
        case ErrorCode::queueFull:            return "queueFull";
        case ErrorCode::invalidState:         return "invalidState";
        case ErrorCode::assetLoadTimeout:     return "assetLoadTimeout";
        case ErrorCode::assetLoadFailed:      return "assetLoadFailed";
        case ErrorCode::cancelled:            return "cancelled";
        case ErrorCode::invalidConfiguration: return "invalidConfiguration";
        case ErrorCode::engineFailure:        return "engineFailure";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::none;
    std::string message;
    int limit = 0; // queueFull: the configured bound

    void set(ErrorCode c, std::string msg, int lim = 0)
    {
        code = c;
        message = std::move(msg);
        limit = lim;
    }

    void clear() { set(ErrorCode::none, ""); }

    explicit operator bool() const { return code != ErrorCode::none; }
};

/// Thrown through an operation's future when the queue drops it before it runs.
class OperationError : public std::runtime_error {
public:
    explicit OperationError(const Error& error)
        : std::runtime_error(error.message), error_(error) {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

// ═══════════════════════════════════════════════════════════════════
// Playback domain
// ═══════════════════════════════════════════════════════════════════

enum class ChannelId { a, b };

inline ChannelId oppositeChannel(ChannelId id)
{
    return id == ChannelId::a ? ChannelId::b : ChannelId::a;
}

inline const char* channelName(ChannelId id)
{
    return id == ChannelId::a ? "A" : "B";
}

enum class PlaybackMode { stopped, playing, paused };

inline const char* playbackModeName(PlaybackMode mode)
{
    switch (mode) {
        case PlaybackMode::stopped: return "stopped";
        case PlaybackMode::playing: return "playing";
        case PlaybackMode::paused:  return "paused";
    }
    return "unknown";
}

enum class TransitionKind { automaticLoop, manualChange };

enum class TransitionResult { completed, paused, cancelled };

inline const char* transitionResultName(TransitionResult result)
{
    switch (result) {
        case TransitionResult::completed: return "completed";
        case TransitionResult::paused:    return "paused";
        case TransitionResult::cancelled: return "cancelled";
    }
    return "unknown";
}

/// A decoded, engine-owned audio asset. Engines derive from this to attach
/// their sample data; the core only reads the metadata.
struct Asset {
    std::string uri;
    double durationSeconds = 0.0;
    double sampleRate = 0.0;
    int numChannels = 0;

    virtual ~Asset() = default;
};

using AssetPtr = std::shared_ptr<const Asset>;

} // namespace segue
