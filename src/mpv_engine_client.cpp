#include "engine_client.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "mpv_protocol.hpp"
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace qrplay {

const char* to_string(EngineError error) {
    switch (error) {
        case EngineError::SUCCESS: return "Success";
        case EngineError::NO_ACTIVE_SESSION: return "NoActiveSession";
        case EngineError::LAUNCH_FAILED: return "EngineLaunchFailed";
        case EngineError::CHANNEL_ERROR: return "ChannelError";
        case EngineError::COMMAND_REJECTED: return "CommandRejected";
    }
    return "Unknown";
}

EngineSettings EngineSettings::from_config(const Config& config) {
    EngineSettings settings;
    settings.binary = config.engine_binary;
    settings.socket_path = config.socket_path;
    settings.extra_args = config.engine_extra_args;
    settings.startup_timeout = config.engine_startup_timeout;
    settings.startup_poll = config.engine_startup_poll;
    settings.request_timeout = config.engine_request_timeout;
    settings.terminate_grace = config.engine_terminate_grace;
    return settings;
}

bool engine_binary_available(const std::string& binary) {
    if (binary.empty()) {
        return false;
    }
    if (binary.find('/') != std::string::npos) {
        return access(binary.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + binary;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

namespace {

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Waits up to `grace` for the child to exit, then kills it.
int wait_or_kill(pid_t pid, std::chrono::milliseconds grace) {
    auto deadline = Clock::now() + grace;
    int status = 0;
    for (;;) {
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return decode_wait_status(status);
        }
        if (result < 0 && errno != EINTR) {
            return -1;
        }
        if (Clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    Logger::warn("mpv: process " + std::to_string(pid) + " did not exit in time, killing it");
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_wait_status(status);
}

int connect_unix_socket(const std::string& path) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        return -1;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

}

struct MpvEngineClient::Impl {
    struct Session {
        SessionId id = 0;
        pid_t pid = -1;
        int fd = -1;

        std::thread reader;
        std::atomic<bool> closing{false};
        std::atomic<bool> channel_open{true};

        std::mutex write_mutex;

        std::mutex response_mutex;
        std::condition_variable response_cv;
        std::map<int64_t, mpv::Message> responses;

        std::mutex reap_mutex;
        bool reaped = false;
        int exit_code = 0;
    };

    EngineSettings settings;
    std::unique_ptr<Session> session;
    SessionId next_session_id = 0;
    std::atomic<int64_t> next_request_id{1};

    std::mutex callback_mutex;
    EngineEventCallback callback;

    void emit(const EngineEvent& event) {
        EngineEventCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = callback;
        }
        if (cb) {
            cb(event);
        }
    }

    pid_t spawn(const std::vector<std::string>& args) {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid == 0) {
            execvp(argv[0], argv.data());
            _exit(127);
        }
        return pid;
    }

    // Safe to call from both the reader thread and terminate().
    int reap(Session& s, std::chrono::milliseconds grace) {
        std::lock_guard<std::mutex> lock(s.reap_mutex);
        if (!s.reaped && s.pid > 0) {
            s.exit_code = wait_or_kill(s.pid, grace);
            s.reaped = true;
        }
        return s.exit_code;
    }

    void handle_line(Session& s, const std::string& line) {
        mpv::Message message = mpv::parse_message(line);

        if (message.kind == mpv::Message::Kind::RESPONSE) {
            {
                std::lock_guard<std::mutex> lock(s.response_mutex);
                s.responses[message.request_id] = message;
            }
            s.response_cv.notify_all();
            return;
        }

        if (message.kind != mpv::Message::Kind::EVENT || s.closing) {
            return;
        }

        Logger::debug("mpv: event " + message.event + (message.reason.empty() ? "" : " (" + message.reason + ")"));

        if (message.is_playback_end()) {
            EngineEvent event;
            event.type = EngineEvent::Type::END_OF_FILE;
            event.session_id = s.id;
            emit(event);
        } else if (message.is_pause_change()) {
            EngineEvent event;
            event.type = EngineEvent::Type::PAUSE_STATE_CHANGED;
            event.session_id = s.id;
            event.paused = *message.flag;
            emit(event);
        }
    }

    void reader_loop(Session* s) {
        std::string pending;
        char buffer[4096];

        for (;;) {
            ssize_t n = read(s->fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }

            pending.append(buffer, static_cast<size_t>(n));
            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                if (!line.empty()) {
                    handle_line(*s, line);
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(s->response_mutex);
            s->channel_open = false;
        }
        s->response_cv.notify_all();

        if (s->closing) {
            return;
        }

        int code = reap(*s, settings.terminate_grace);
        if (s->closing) {
            return;
        }

        Logger::warn("mpv: session " + std::to_string(s->id) + " exited with code " + std::to_string(code));
        EngineEvent event;
        event.type = EngineEvent::Type::PROCESS_EXITED;
        event.session_id = s->id;
        event.exit_code = code;
        emit(event);
    }

    bool send_line(Session& s, const std::string& line) {
        std::lock_guard<std::mutex> lock(s.write_mutex);
        size_t sent = 0;
        while (sent < line.size()) {
            ssize_t n = send(s.fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    EngineError request(Session& s, const std::string& line, int64_t request_id) {
        if (!s.channel_open) {
            return EngineError::NO_ACTIVE_SESSION;
        }
        if (!send_line(s, line)) {
            Logger::warn(std::string("mpv: write failed: ") + std::strerror(errno));
            return EngineError::CHANNEL_ERROR;
        }

        std::unique_lock<std::mutex> lock(s.response_mutex);
        bool answered = s.response_cv.wait_for(lock, settings.request_timeout, [&] {
            return s.responses.count(request_id) > 0 || !s.channel_open;
        });

        auto it = s.responses.find(request_id);
        if (!answered || it == s.responses.end()) {
            return EngineError::CHANNEL_ERROR;
        }

        mpv::Message response = it->second;
        s.responses.erase(it);
        if (!response.succeeded()) {
            Logger::warn("mpv: request rejected: " + response.error);
            return EngineError::COMMAND_REJECTED;
        }
        return EngineError::SUCCESS;
    }

    LaunchResult fail_launch(SessionId id, int exit_code, const std::string& reason) {
        unlink(settings.socket_path.c_str());

        Logger::error("mpv: " + std::string(to_string(ErrorKind::ENGINE_LAUNCH_FAILED)) + ": " + reason);

        EngineEvent event;
        event.type = EngineEvent::Type::PROCESS_EXITED;
        event.session_id = id;
        event.exit_code = exit_code;
        event.synthesized = true;
        emit(event);

        LaunchResult result;
        result.error_code = EngineError::LAUNCH_FAILED;
        result.session_id = id;
        result.error_message = reason;
        return result;
    }

    LaunchResult launch(const LaunchOptions& options) {
        terminate();

        SessionId id = ++next_session_id;
        unlink(settings.socket_path.c_str());

        auto args = mpv::build_launch_args(settings.binary, settings.socket_path, options.path,
                                           options.fullscreen, options.start_paused, settings.extra_args);

        pid_t pid = spawn(args);
        if (pid < 0) {
            return fail_launch(id, -1, std::string("fork failed: ") + std::strerror(errno));
        }

        Logger::debug("mpv: started pid " + std::to_string(pid) + " for " + options.path);

        int fd = -1;
        auto deadline = Clock::now() + settings.startup_timeout;
        for (;;) {
            int status = 0;
            if (waitpid(pid, &status, WNOHANG) == pid) {
                int code = decode_wait_status(status);
                return fail_launch(id, code, "engine exited during startup with code " + std::to_string(code));
            }

            fd = connect_unix_socket(settings.socket_path);
            if (fd >= 0) {
                break;
            }

            if (Clock::now() >= deadline) {
                int code = wait_or_kill(pid, std::chrono::milliseconds(0));
                return fail_launch(id, code, "control socket " + settings.socket_path +
                                   " not ready after " + std::to_string(settings.startup_timeout.count()) + "ms");
            }
            std::this_thread::sleep_for(settings.startup_poll);
        }

        session = std::make_unique<Session>();
        session->id = id;
        session->pid = pid;
        session->fd = fd;
        session->reader = std::thread(&Impl::reader_loop, this, session.get());

        int64_t request_id = next_request_id++;
        EngineError observed = request(*session,
                                       mpv::encode_observe_property("pause", mpv::PAUSE_OBSERVER_ID, request_id),
                                       request_id);
        if (observed != EngineError::SUCCESS) {
            Logger::warn(std::string("mpv: could not observe pause state: ") + to_string(observed));
        }

        Logger::info("mpv: session " + std::to_string(id) + " playing " + options.path);

        LaunchResult result;
        result.session_id = id;
        return result;
    }

    EngineError command(const std::vector<std::string>& args) {
        if (!session || !session->channel_open) {
            return EngineError::NO_ACTIVE_SESSION;
        }
        int64_t request_id = next_request_id++;
        return request(*session, mpv::encode_command(args, request_id), request_id);
    }

    void terminate() {
        if (!session) {
            return;
        }

        Session& s = *session;
        s.closing = true;

        if (s.channel_open && !send_line(s, mpv::encode_command({"quit"}, next_request_id++))) {
            Logger::debug("mpv: quit request not delivered, waiting for exit");
        }
        reap(s, settings.terminate_grace);

        if (s.fd >= 0) {
            shutdown(s.fd, SHUT_RDWR);
        }
        if (s.reader.joinable()) {
            s.reader.join();
        }
        if (s.fd >= 0) {
            close(s.fd);
            s.fd = -1;
        }
        unlink(settings.socket_path.c_str());

        Logger::debug("mpv: session " + std::to_string(s.id) + " terminated");
        session.reset();
    }
};

MpvEngineClient::MpvEngineClient(EngineSettings settings) : m_impl(std::make_unique<Impl>()) {
    m_impl->settings = std::move(settings);
}

MpvEngineClient::~MpvEngineClient() {
    terminate();
}

LaunchResult MpvEngineClient::launch(const LaunchOptions& options) {
    return m_impl->launch(options);
}

EngineError MpvEngineClient::command(const std::vector<std::string>& args) {
    return m_impl->command(args);
}

void MpvEngineClient::terminate() {
    m_impl->terminate();
}

bool MpvEngineClient::has_session() const {
    return m_impl->session && m_impl->session->channel_open;
}

SessionId MpvEngineClient::session_id() const {
    return m_impl->session ? m_impl->session->id : 0;
}

void MpvEngineClient::set_event_callback(EngineEventCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->callback_mutex);
    m_impl->callback = std::move(callback);
}

std::unique_ptr<IEngineClient> create_engine_client(const EngineSettings& settings) {
    return std::make_unique<MpvEngineClient>(settings);
}

}
