#pragma once

#include "types.hpp"
#include <iosfwd>
#include <string>
#include <vector>
#include <chrono>

namespace qrplay {

struct Config {
    std::string media_dir = "media";
    std::string splash_path = "assets/splash.png";

    std::string engine_binary = "mpv";
    std::string socket_path = "/tmp/kids-mpv-socket";
    std::vector<std::string> engine_extra_args;
    bool fullscreen = true;

    ExtensionList video_extensions = {".mp4", ".mkv", ".avi", ".webm", ".mov", ".m4v", ".ts", ".flv"};

    std::string command_prefix = "CMD:";
    std::string scanner_device_name = "SCANNER";
    bool keyboard_mode = false;
    bool verbose = false;

    std::chrono::milliseconds scan_debounce{2000};
    std::chrono::milliseconds scanner_reconnect_interval{3000};
    std::chrono::milliseconds engine_startup_timeout{5000};
    std::chrono::milliseconds engine_startup_poll{250};
    std::chrono::milliseconds engine_request_timeout{2000};
    std::chrono::milliseconds engine_terminate_grace{2000};

    int volume_step = 5;
    int seek_step_seconds = 10;
    int max_splash_retries = 3;
};

enum class ParseResult {
    OK,
    HELP,
    ERROR
};

// Fills `config` from argv. On ERROR, `error` says which argument was wrong.
ParseResult parse_command_line(int argc, const char* const argv[], Config& config, std::string& error);

void print_usage(std::ostream& out);

}
