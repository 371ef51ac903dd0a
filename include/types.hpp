#pragma once

#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

namespace qrplay {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum class PlaybackState {
    IDLE,
    LOADING,
    PLAYING,
    PAUSED
};

enum class Command {
    PAUSE,
    STOP,
    VOLUME_UP,
    VOLUME_DOWN,
    MUTE,
    SEEK_FORWARD,
    SEEK_BACKWARD,
    EXIT
};

// Conditions the controller handles locally. Logged by name, never fatal.
enum class ErrorKind {
    DEVICE_UNAVAILABLE,
    MEDIA_NOT_FOUND,
    NO_ACTIVE_SESSION,
    ENGINE_LAUNCH_FAILED,
    ENGINE_CRASHED,
    INVALID_COMMAND
};

struct InputEvent {
    uint16_t code{0};
    int32_t value{0};   // 0 release, 1 press, 2 autorepeat
    TimePoint timestamp{};
};

struct ScanToken {
    std::string text;
    TimePoint received{};
};

struct InputSignal {
    enum class Kind {
        TOKEN,
        EXIT
    };

    Kind kind{Kind::TOKEN};
    ScanToken token;
};

using InputCallback = std::function<void(const InputSignal&)>;
using ExtensionList = std::vector<std::string>;

const char* to_string(PlaybackState state);
const char* to_string(Command command);
const char* to_string(ErrorKind kind);

}
