#include "config.hpp"
#include <ostream>
#include <stdexcept>

namespace qrplay {

namespace {

bool parse_seconds(const std::string& text, std::chrono::milliseconds& out) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(text, &consumed);
        if (consumed != text.size() || seconds < 0.0) {
            return false;
        }
        out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}

ParseResult parse_command_line(int argc, const char* const argv[], Config& config, std::string& error) {
    auto take_value = [&](int& i, const std::string& arg, std::string& value) {
        if (i + 1 >= argc) {
            error = arg + " requires a value";
            return false;
        }
        value = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        std::string value;

        if (arg == "--keyboard" || arg == "-k") {
            config.keyboard_mode = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--windowed") {
            config.fullscreen = false;
        } else if (arg == "--media-dir" || arg == "-m") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.media_dir = value;
        } else if (arg == "--splash" || arg == "-s") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.splash_path = value;
        } else if (arg == "--device" || arg == "-d") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.scanner_device_name = value;
        } else if (arg == "--socket") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.socket_path = value;
        } else if (arg == "--engine") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.engine_binary = value;
        } else if (arg == "--engine-arg") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            config.engine_extra_args.push_back(value);
        } else if (arg == "--debounce") {
            if (!take_value(i, arg, value)) return ParseResult::ERROR;
            if (!parse_seconds(value, config.scan_debounce)) {
                error = "--debounce expects a non-negative number of seconds, got '" + value + "'";
                return ParseResult::ERROR;
            }
        } else if (arg == "--help" || arg == "-h") {
            return ParseResult::HELP;
        } else {
            error = "Unknown argument: " + arg;
            return ParseResult::ERROR;
        }
    }

    if (config.scanner_device_name.empty()) {
        error = "--device must not be empty";
        return ParseResult::ERROR;
    }

    return ParseResult::OK;
}

void print_usage(std::ostream& out) {
    out << "Usage: qrplay [options]\n";
    out << "Options:\n";
    out << "  --keyboard, -k               Read scans from stdin instead of the USB scanner\n";
    out << "  --media-dir <dir>, -m <dir>  Directory holding the videos (default: media)\n";
    out << "  --splash <path>, -s <path>   Image or video shown while idle (default: assets/splash.png)\n";
    out << "  --device <name>, -d <name>   Substring of the scanner's input device name (default: SCANNER)\n";
    out << "  --socket <path>              mpv IPC socket path (default: /tmp/kids-mpv-socket)\n";
    out << "  --engine <binary>            Playback engine executable (default: mpv)\n";
    out << "  --engine-arg <arg>           Extra engine argument, may be repeated\n";
    out << "  --debounce <seconds>         Duplicate scan suppression window (default: 2)\n";
    out << "  --windowed                   Do not start the engine fullscreen\n";
    out << "  --verbose, -v                Enable debug logging\n";
    out << "  --help, -h                   Show this help message\n";
    out << "\nQR codes:\n";
    out << "  <name>                       Play media/<name>.<ext> (case-insensitive)\n";
    out << "  CMD:PAUSE                    Pause/Resume\n";
    out << "  CMD:STOP                     Stop and return to the splash screen\n";
    out << "  CMD:VOLUP / CMD:VOLDOWN      Volume up/down\n";
    out << "  CMD:MUTE                     Mute toggle\n";
    out << "  CMD:FWD / CMD:RWD            Seek forward/backward\n";
    out << "  CMD:EXIT                     Quit\n";
    out << "\nKeyboard:\n";
    out << "  Q / Escape                   Quit\n";
}

}
