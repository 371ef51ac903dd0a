#include "types.hpp"

namespace qrplay {

const char* to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::IDLE: return "Idle";
        case PlaybackState::LOADING: return "Loading";
        case PlaybackState::PLAYING: return "Playing";
        case PlaybackState::PAUSED: return "Paused";
    }
    return "Unknown";
}

const char* to_string(Command command) {
    switch (command) {
        case Command::PAUSE: return "Pause";
        case Command::STOP: return "Stop";
        case Command::VOLUME_UP: return "VolumeUp";
        case Command::VOLUME_DOWN: return "VolumeDown";
        case Command::MUTE: return "Mute";
        case Command::SEEK_FORWARD: return "SeekForward";
        case Command::SEEK_BACKWARD: return "SeekBackward";
        case Command::EXIT: return "Exit";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DEVICE_UNAVAILABLE: return "DeviceUnavailable";
        case ErrorKind::MEDIA_NOT_FOUND: return "MediaNotFound";
        case ErrorKind::NO_ACTIVE_SESSION: return "NoActiveSession";
        case ErrorKind::ENGINE_LAUNCH_FAILED: return "EngineLaunchFailed";
        case ErrorKind::ENGINE_CRASHED: return "EngineCrashed";
        case ErrorKind::INVALID_COMMAND: return "InvalidCommand";
    }
    return "Unknown";
}

}
