#include "config.hpp"
#include "engine_client.hpp"
#include "key_watcher.hpp"
#include "logger.hpp"
#include "media_resolver.hpp"
#include "playback_controller.hpp"
#include "scan_source.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) {
    g_stop_requested = true;
}

void install_signal_handlers() {
    struct sigaction action{};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

}

namespace qrplay {

class QrPlayer {
private:
    Config m_config;
    std::unique_ptr<IMediaResolver> m_resolver;
    std::unique_ptr<IEngineClient> m_engine;
    std::unique_ptr<PlaybackController> m_controller;
    std::unique_ptr<IScanSource> m_scanner;
    std::unique_ptr<IScanSource> m_key_watcher;

public:
    explicit QrPlayer(Config config) : m_config(std::move(config)) {
        m_resolver = create_media_resolver(m_config.media_dir, m_config.video_extensions);
        m_engine = create_engine_client(EngineSettings::from_config(m_config));
        m_controller = std::make_unique<PlaybackController>(*m_engine, *m_resolver, m_config);
        m_scanner = create_scan_source(m_config.keyboard_mode, m_config.scanner_device_name,
                                       m_config.scanner_reconnect_interval);
        m_key_watcher = create_key_watcher();
    }

    ~QrPlayer() {
        shutdown();
    }

    bool initialize() {
        if (!engine_binary_available(m_config.engine_binary)) {
            Logger::error("Playback engine '" + m_config.engine_binary + "' not found on PATH");
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(m_config.splash_path, ec)) {
            Logger::error("Splash file not found: " + m_config.splash_path);
            return false;
        }

        if (!std::filesystem::exists(m_config.media_dir, ec)) {
            if (!std::filesystem::create_directories(m_config.media_dir, ec)) {
                Logger::error("Could not create media directory " + m_config.media_dir + ": " + ec.message());
                return false;
            }
            Logger::info("Created media directory " + m_config.media_dir);
        }

        auto forward = [this](const InputSignal& signal) {
            m_controller->post_input(signal);
        };

        if (!m_scanner->initialize()) {
            Logger::error("Failed to initialize scan input");
            return false;
        }
        m_scanner->set_callback(forward);

        // The local keyboard is optional; without a display only the scanner can quit.
        if (m_key_watcher->initialize()) {
            m_key_watcher->set_callback(forward);
            Logger::info("Keyboard: Q or Escape quits");
        } else {
            m_key_watcher.reset();
        }

        return true;
    }

    void run() {
        Logger::info("qrplay - QR code video player");
        Logger::info("Media directory: " + m_config.media_dir);
        Logger::info(m_config.keyboard_mode ? "Input: keyboard (type a code and press Enter)"
                                            : "Input: scanner matching '" + m_config.scanner_device_name + "'");

        m_controller->start();

        m_scanner->process_messages();
        if (m_key_watcher) {
            m_key_watcher->process_messages();
        }

        m_controller->run([] { return g_stop_requested.load(); });
        Logger::info("Goodbye");
    }

    void shutdown() {
        if (m_scanner) {
            m_scanner->shutdown();
        }
        if (m_key_watcher) {
            m_key_watcher->shutdown();
        }
        if (m_engine) {
            m_engine->terminate();
        }
    }
};

}

int main(int argc, char* argv[]) {
    try {
        qrplay::Config config;
        std::string error;

        switch (qrplay::parse_command_line(argc, argv, config, error)) {
            case qrplay::ParseResult::HELP:
                qrplay::print_usage(std::cout);
                return 0;
            case qrplay::ParseResult::ERROR:
                std::cerr << "Error: " << error << "\n";
                std::cerr << "Use --help for usage information\n";
                return 1;
            case qrplay::ParseResult::OK:
                break;
        }

        if (config.verbose) {
            qrplay::Logger::set_level(qrplay::Logger::Level::DEBUG);
        }

        install_signal_handlers();

        qrplay::QrPlayer player(config);

        if (!player.initialize()) {
            std::cerr << "Failed to initialize qrplay\n";
            return 1;
        }

        player.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
