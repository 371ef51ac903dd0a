#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qrplay {
namespace mpv {

// One line of mpv's JSON IPC stream, either a reply to a request or an
// asynchronous event.
struct Message {
    enum class Kind {
        RESPONSE,
        EVENT,
        UNKNOWN
    };

    Kind kind{Kind::UNKNOWN};

    // RESPONSE
    int64_t request_id = 0;
    std::string error;

    // EVENT
    std::string event;
    std::string reason;          // end-file
    std::string property;        // property-change
    std::optional<bool> flag;    // property-change with a boolean payload

    bool succeeded() const { return error == "success"; }
    // A load error leaves mpv idle on a black window, so it ends playback too.
    bool is_playback_end() const { return kind == Kind::EVENT && event == "end-file" && (reason == "eof" || reason == "error"); }
    bool is_pause_change() const { return kind == Kind::EVENT && event == "property-change" && property == "pause" && flag.has_value(); }
};

constexpr int64_t PAUSE_OBSERVER_ID = 1;

std::string encode_command(const std::vector<std::string>& args, int64_t request_id);
std::string encode_observe_property(const std::string& property, int64_t observer_id, int64_t request_id);

// Never throws; malformed input yields Kind::UNKNOWN.
Message parse_message(const std::string& line);

std::vector<std::string> build_launch_args(const std::string& binary,
                                           const std::string& socket_path,
                                           const std::string& media_path,
                                           bool fullscreen,
                                           bool start_paused,
                                           const std::vector<std::string>& extra_args);

}
}
