#include "scan_source.hpp"
#include "logger.hpp"
#include "string_util.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace qrplay {

struct ConsoleScanSource::Impl {
    int input_fd = STDIN_FILENO;
    InputCallback callback;
    std::mutex callback_mutex;

    std::thread input_thread;
    std::atomic<bool> should_stop{false};
    int wake_pipe[2] = {-1, -1};

    void deliver(const InputSignal& signal) {
        InputCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = callback;
        }
        if (cb) {
            cb(signal);
        }
    }

    void handle_line(const std::string& line) {
        std::string text = trim(line);
        if (text.empty()) {
            return;
        }

        InputSignal signal;
        signal.kind = InputSignal::Kind::TOKEN;
        signal.token.text = std::move(text);
        signal.token.received = Clock::now();
        Logger::info("Console: scanned '" + signal.token.text + "'");
        deliver(signal);
    }

    void input_loop() {
        std::string pending;
        char buffer[512];

        while (!should_stop) {
            pollfd fds[2] = {
                {input_fd, POLLIN, 0},
                {wake_pipe[0], POLLIN, 0},
            };
            int rc = poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                Logger::error(std::string("Console: poll failed: ") + std::strerror(errno));
                return;
            }
            if (fds[1].revents & POLLIN) {
                return;
            }
            if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }

            ssize_t n = read(input_fd, buffer, sizeof(buffer));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                if (!pending.empty()) {
                    handle_line(pending);
                }
                Logger::info("Console: end of input, requesting exit");
                InputSignal signal;
                signal.kind = InputSignal::Kind::EXIT;
                signal.token.received = Clock::now();
                deliver(signal);
                return;
            }

            pending.append(buffer, static_cast<size_t>(n));
            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                handle_line(pending.substr(0, newline));
                pending.erase(0, newline + 1);
            }
        }
    }
};

ConsoleScanSource::ConsoleScanSource(int input_fd) : m_impl(std::make_unique<Impl>()) {
    m_impl->input_fd = input_fd;
}

ConsoleScanSource::~ConsoleScanSource() {
    shutdown();
}

bool ConsoleScanSource::initialize() {
    if (m_impl->wake_pipe[0] >= 0) {
        return true;
    }
    if (pipe2(m_impl->wake_pipe, O_CLOEXEC) != 0) {
        Logger::error(std::string("Console: cannot create wake pipe: ") + std::strerror(errno));
        return false;
    }
    Logger::info("Console: keyboard mode, type QR code text and press Enter");
    return true;
}

void ConsoleScanSource::shutdown() {
    m_impl->should_stop = true;
    if (m_impl->wake_pipe[1] >= 0) {
        char byte = 0;
        if (write(m_impl->wake_pipe[1], &byte, 1) < 0) {
            Logger::debug(std::string("Console: wake write failed: ") + std::strerror(errno));
        }
    }
    if (m_impl->input_thread.joinable()) {
        m_impl->input_thread.join();
    }
    for (int& fd : m_impl->wake_pipe) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void ConsoleScanSource::set_callback(InputCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->callback_mutex);
    m_impl->callback = std::move(callback);
}

void ConsoleScanSource::process_messages() {
    if (m_impl->wake_pipe[0] < 0 || m_impl->input_thread.joinable()) {
        return;
    }
    m_impl->should_stop = false;
    m_impl->input_thread = std::thread(&Impl::input_loop, m_impl.get());
}

}
