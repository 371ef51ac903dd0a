#pragma once

#include "types.hpp"
#include "config.hpp"
#include "engine_client.hpp"
#include "event_queue.hpp"
#include "media_resolver.hpp"
#include "token_classifier.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace qrplay {

// Owns PlaybackState. All transitions run on the thread that drains the queue;
// other threads only post().
class PlaybackController {
private:
    IEngineClient& m_engine;
    IMediaResolver& m_resolver;
    TokenClassifier m_classifier;
    EventQueue m_queue;

    std::string m_splash_path;
    bool m_fullscreen;
    int m_volume_step;
    int m_seek_step_seconds;
    int m_max_splash_retries;

    PlaybackState m_state = PlaybackState::IDLE;
    std::string m_current_media;
    SessionId m_session = 0;
    bool m_showing_splash = false;
    int m_splash_failures = 0;
    bool m_running = true;

public:
    PlaybackController(IEngineClient& engine, IMediaResolver& resolver, const Config& config);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Puts the splash on screen.
    void start();

    void post(ControllerEvent event);
    void post_input(const InputSignal& signal);

    // Handles at most one queued event; false if none arrived within `timeout`.
    bool process_next(std::chrono::milliseconds timeout);
    void run(const std::function<bool()>& stop_requested);

    void handle_event(const ControllerEvent& event);

    PlaybackState state() const { return m_state; }
    const std::string& current_media() const { return m_current_media; }
    bool showing_splash() const { return m_showing_splash; }
    bool is_running() const { return m_running; }
    size_t pending_events() const { return m_queue.size(); }

private:
    void handle_token(const ScanToken& token);
    void handle_media(const std::string& reference);
    void handle_command(Command command);
    void handle_engine_event(const EngineEvent& event);

    void play_media(const std::string& path);
    void show_splash();
    void shutdown_engine();
    EngineError send(const std::vector<std::string>& args);
};

}
