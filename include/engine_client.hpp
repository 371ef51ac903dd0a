#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace qrplay {

struct Config;

using SessionId = uint64_t;

enum class EngineError {
    SUCCESS = 0,
    NO_ACTIVE_SESSION = 1,
    LAUNCH_FAILED = 2,
    CHANNEL_ERROR = 3,
    COMMAND_REJECTED = 4
};

const char* to_string(EngineError error);

struct LaunchOptions {
    std::string path;
    bool fullscreen = true;
    bool start_paused = false;
};

struct LaunchResult {
    EngineError error_code = EngineError::SUCCESS;
    SessionId session_id = 0;
    std::string error_message;
};

struct EngineEvent {
    enum class Type {
        END_OF_FILE,
        PROCESS_EXITED,
        PAUSE_STATE_CHANGED
    };

    Type type{Type::PROCESS_EXITED};
    SessionId session_id = 0;
    int exit_code = 0;
    bool paused = false;
    bool synthesized = false;   // PROCESS_EXITED produced by a failed launch
};

using EngineEventCallback = std::function<void(const EngineEvent&)>;

struct EngineSettings {
    std::string binary = "mpv";
    std::string socket_path = "/tmp/kids-mpv-socket";
    std::vector<std::string> extra_args;
    std::chrono::milliseconds startup_timeout{5000};
    std::chrono::milliseconds startup_poll{250};
    std::chrono::milliseconds request_timeout{2000};
    std::chrono::milliseconds terminate_grace{2000};

    static EngineSettings from_config(const Config& config);
};

class IEngineClient {
public:
    virtual ~IEngineClient() = default;

    // Replaces any running session. Blocks until the control channel is
    // ready or the launch failed; failures also emit a synthesized PROCESS_EXITED.
    virtual LaunchResult launch(const LaunchOptions& options) = 0;
    virtual EngineError command(const std::vector<std::string>& args) = 0;
    virtual void terminate() = 0;

    virtual bool has_session() const = 0;
    virtual SessionId session_id() const = 0;

    virtual void set_event_callback(EngineEventCallback callback) = 0;
};

class MpvEngineClient : public IEngineClient {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    explicit MpvEngineClient(EngineSettings settings);
    ~MpvEngineClient() override;

    LaunchResult launch(const LaunchOptions& options) override;
    EngineError command(const std::vector<std::string>& args) override;
    void terminate() override;

    bool has_session() const override;
    SessionId session_id() const override;

    void set_event_callback(EngineEventCallback callback) override;
};

std::unique_ptr<IEngineClient> create_engine_client(const EngineSettings& settings);

// Searches PATH when `binary` has no slash.
bool engine_binary_available(const std::string& binary);

}
