#include "playback_controller.hpp"
#include "logger.hpp"
#include <utility>

namespace qrplay {

PlaybackController::PlaybackController(IEngineClient& engine, IMediaResolver& resolver, const Config& config)
    : m_engine(engine)
    , m_resolver(resolver)
    , m_classifier(config.scan_debounce, config.command_prefix)
    , m_splash_path(config.splash_path)
    , m_fullscreen(config.fullscreen)
    , m_volume_step(config.volume_step)
    , m_seek_step_seconds(config.seek_step_seconds)
    , m_max_splash_retries(config.max_splash_retries) {
    m_engine.set_event_callback([this](const EngineEvent& event) {
        m_queue.push(ControllerEvent::from_engine(event));
    });
}

PlaybackController::~PlaybackController() {
    m_engine.set_event_callback(nullptr);
}

void PlaybackController::start() {
    m_running = true;
    show_splash();
}

void PlaybackController::post(ControllerEvent event) {
    m_queue.push(std::move(event));
}

void PlaybackController::post_input(const InputSignal& signal) {
    if (signal.kind == InputSignal::Kind::EXIT) {
        m_queue.push(ControllerEvent::exit_requested());
    } else {
        m_queue.push(ControllerEvent::scan(signal.token));
    }
}

bool PlaybackController::process_next(std::chrono::milliseconds timeout) {
    auto event = m_queue.wait_pop(timeout);
    if (!event) {
        return false;
    }
    handle_event(*event);
    return true;
}

void PlaybackController::run(const std::function<bool()>& stop_requested) {
    while (m_running) {
        if (stop_requested && stop_requested()) {
            Logger::info("Controller: shutdown signal received");
            handle_command(Command::EXIT);
            break;
        }
        process_next(std::chrono::milliseconds(200));
    }
}

void PlaybackController::handle_event(const ControllerEvent& event) {
    if (!m_running) {
        return;
    }

    switch (event.type) {
        case ControllerEvent::Type::SCAN_TOKEN:
            handle_token(event.token);
            break;
        case ControllerEvent::Type::EXIT_REQUESTED:
            handle_command(Command::EXIT);
            break;
        case ControllerEvent::Type::ENGINE:
            handle_engine_event(event.engine);
            break;
    }
}

void PlaybackController::handle_token(const ScanToken& token) {
    auto classification = m_classifier.classify(token.text, token.received);
    if (!classification) {
        return;
    }

    switch (classification->kind) {
        case Classification::Kind::COMMAND:
            Logger::info(std::string("Controller: command ") + to_string(classification->command));
            handle_command(classification->command);
            break;
        case Classification::Kind::MEDIA:
            handle_media(classification->reference);
            break;
        case Classification::Kind::INVALID:
            break;
    }
}

void PlaybackController::handle_media(const std::string& reference) {
    auto path = m_resolver.resolve(reference);
    if (!path) {
        Logger::warn(std::string("Controller: ") + to_string(ErrorKind::MEDIA_NOT_FOUND) +
                     ": no video for '" + reference + "'");
        return;
    }

    // A re-scan of the playing reference restarts it from the beginning.
    play_media(*path);
}

void PlaybackController::handle_command(Command command) {
    if (command == Command::EXIT) {
        Logger::info("Controller: exit requested, shutting down");
        shutdown_engine();
        m_running = false;
        return;
    }

    if (m_state != PlaybackState::PLAYING && m_state != PlaybackState::PAUSED) {
        Logger::debug(std::string("Controller: ignoring ") + to_string(command) + " while " + to_string(m_state));
        return;
    }

    switch (command) {
        case Command::PAUSE:
            if (send({"cycle", "pause"}) == EngineError::SUCCESS) {
                m_state = (m_state == PlaybackState::PLAYING) ? PlaybackState::PAUSED : PlaybackState::PLAYING;
                Logger::info(std::string("Controller: ") + to_string(m_state));
            }
            break;
        case Command::STOP:
            m_engine.terminate();
            show_splash();
            break;
        case Command::VOLUME_UP:
            send({"add", "volume", std::to_string(m_volume_step)});
            break;
        case Command::VOLUME_DOWN:
            send({"add", "volume", std::to_string(-m_volume_step)});
            break;
        case Command::MUTE:
            send({"cycle", "mute"});
            break;
        case Command::SEEK_FORWARD:
            send({"seek", std::to_string(m_seek_step_seconds), "relative"});
            break;
        case Command::SEEK_BACKWARD:
            send({"seek", std::to_string(-m_seek_step_seconds), "relative"});
            break;
        case Command::EXIT:
            break;
    }
}

void PlaybackController::handle_engine_event(const EngineEvent& event) {
    if (event.session_id != m_session) {
        Logger::debug("Controller: dropping event from stale session " + std::to_string(event.session_id));
        return;
    }

    bool media_session = m_state == PlaybackState::PLAYING || m_state == PlaybackState::PAUSED;

    switch (event.type) {
        case EngineEvent::Type::END_OF_FILE:
            if (media_session) {
                Logger::info("Controller: finished " + m_current_media);
                m_engine.terminate();
                show_splash();
            } else if (m_state == PlaybackState::IDLE && m_showing_splash) {
                // A video splash ran out; mpv would otherwise idle on a black window
                Logger::debug("Controller: splash ended, showing it again");
                m_engine.terminate();
                show_splash();
            }
            break;

        case EngineEvent::Type::PAUSE_STATE_CHANGED:
            if (media_session) {
                m_state = event.paused ? PlaybackState::PAUSED : PlaybackState::PLAYING;
            }
            break;

        case EngineEvent::Type::PROCESS_EXITED:
            if (m_state == PlaybackState::IDLE) {
                if (event.synthesized) {
                    ++m_splash_failures;
                }
                Logger::warn("Controller: splash session ended (code " + std::to_string(event.exit_code) + ")");
            } else {
                ErrorKind kind = event.synthesized ? ErrorKind::ENGINE_LAUNCH_FAILED : ErrorKind::ENGINE_CRASHED;
                Logger::warn(std::string("Controller: ") + to_string(kind) + " while " + to_string(m_state) +
                             " (code " + std::to_string(event.exit_code) + "), returning to splash");
            }
            show_splash();
            break;
    }
}

void PlaybackController::play_media(const std::string& path) {
    Logger::info("Controller: playing " + path);

    m_state = PlaybackState::LOADING;
    m_current_media = path;
    m_showing_splash = false;

    LaunchOptions options;
    options.path = path;
    options.fullscreen = m_fullscreen;

    LaunchResult result = m_engine.launch(options);
    m_session = result.session_id;

    if (result.error_code != EngineError::SUCCESS) {
        // The engine queues a PROCESS_EXITED for this session; that brings us back to the splash.
        Logger::error("Controller: could not start " + path + ": " + result.error_message);
        return;
    }

    m_splash_failures = 0;
    m_state = PlaybackState::PLAYING;
}

void PlaybackController::show_splash() {
    m_state = PlaybackState::IDLE;
    m_current_media.clear();

    if (m_splash_failures >= m_max_splash_retries) {
        Logger::error("Controller: splash failed " + std::to_string(m_splash_failures) +
                      " times, staying idle without a picture until the next scan");
        shutdown_engine();
        return;
    }

    LaunchOptions options;
    options.path = m_splash_path;
    options.fullscreen = m_fullscreen;

    LaunchResult result = m_engine.launch(options);
    m_session = result.session_id;
    m_showing_splash = result.error_code == EngineError::SUCCESS;

    if (result.error_code != EngineError::SUCCESS) {
        Logger::error("Controller: could not show splash: " + result.error_message);
        return;
    }

    m_splash_failures = 0;
    Logger::info("Controller: showing splash screen");
}

void PlaybackController::shutdown_engine() {
    m_engine.terminate();
    m_session = 0;
    m_showing_splash = false;
}

EngineError PlaybackController::send(const std::vector<std::string>& args) {
    EngineError error = m_engine.command(args);
    if (error == EngineError::NO_ACTIVE_SESSION) {
        Logger::warn(std::string("Controller: ") + to_string(ErrorKind::NO_ACTIVE_SESSION) +
                     ": '" + args.front() + "' ignored");
    } else if (error != EngineError::SUCCESS) {
        Logger::warn("Controller: '" + args.front() + "' failed: " + to_string(error));
    }
    return error;
}

}
