#include "scan_source.hpp"
#include "logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace qrplay {

std::optional<std::string> find_input_device(const std::string& name_substring) {
    std::vector<std::string> nodes;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, 5, "event") == 0) {
            nodes.push_back(entry.path().string());
        }
    }
    std::sort(nodes.begin(), nodes.end());

    for (const auto& node : nodes) {
        int fd = open(node.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
        if (fd < 0) {
            continue;
        }
        char name[256] = {};
        int rc = ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name);
        close(fd);
        if (rc >= 0 && std::string(name).find(name_substring) != std::string::npos) {
            Logger::debug("Scanner: matched '" + std::string(name) + "' at " + node);
            return node;
        }
    }
    return std::nullopt;
}

struct EvdevScanSource::Impl {
    std::string device_name;
    std::chrono::milliseconds reconnect_interval{3000};

    InputCallback callback;
    std::mutex callback_mutex;

    std::thread reader_thread;
    std::atomic<bool> should_stop{false};
    int wake_pipe[2] = {-1, -1};
    int device_fd = -1;
    bool reported_unavailable = false;

    LineAssembler assembler;

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

    // Sleeps for the reconnect interval unless shutdown wakes us first.
    void wait_for_retry() {
        pollfd pfd{wake_pipe[0], POLLIN, 0};
        poll(&pfd, 1, static_cast<int>(reconnect_interval.count()));
    }

    void report_unavailable(const std::string& detail) {
        std::string message = "Scanner: " + std::string(to_string(ErrorKind::DEVICE_UNAVAILABLE)) + ": " + detail +
                              ", retrying in " + std::to_string(reconnect_interval.count()) + "ms";
        if (reported_unavailable) {
            Logger::debug(message);
        } else {
            Logger::warn(message);
            reported_unavailable = true;
        }
    }

    bool open_device() {
        auto node = find_input_device(device_name);
        if (!node) {
            report_unavailable("no input device named '" + device_name + "'");
            return false;
        }

        device_fd = open(node->c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
        if (device_fd < 0) {
            report_unavailable("cannot open " + *node + ": " + std::strerror(errno));
            return false;
        }

        if (ioctl(device_fd, EVIOCGRAB, 1) != 0) {
            report_unavailable("cannot grab " + *node + ": " + std::strerror(errno));
            close(device_fd);
            device_fd = -1;
            return false;
        }

        reported_unavailable = false;
        Logger::info("Scanner: grabbed " + *node + " exclusively");
        return true;
    }

    void close_device() {
        if (device_fd >= 0) {
            ioctl(device_fd, EVIOCGRAB, 0);
            close(device_fd);
            device_fd = -1;
        }
        assembler.reset();
    }

    // Returns when the device goes away or shutdown is requested.
    void read_events() {
        input_event events[64];

        while (!should_stop) {
            pollfd fds[2] = {
                {device_fd, POLLIN, 0},
                {wake_pipe[0], POLLIN, 0},
            };
            int rc = poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                Logger::error(std::string("Scanner: poll failed: ") + std::strerror(errno));
                return;
            }
            if (fds[1].revents & POLLIN) {
                return;
            }
            if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                return;
            }
            if (!(fds[0].revents & POLLIN)) {
                continue;
            }

            ssize_t n = read(device_fd, events, sizeof(events));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                return;
            }
            if (n == 0) {
                return;
            }

            size_t count = static_cast<size_t>(n) / sizeof(input_event);
            for (size_t i = 0; i < count; ++i) {
                if (events[i].type != EV_KEY) {
                    continue;
                }
                InputEvent event;
                event.code = events[i].code;
                event.value = events[i].value;
                event.timestamp = Clock::now();

                auto signal = assembler.feed(event);
                if (!signal) {
                    continue;
                }
                if (signal->kind == InputSignal::Kind::TOKEN) {
                    Logger::info("Scanner: scanned '" + signal->token.text + "'");
                } else {
                    Logger::info("Scanner: exit key pressed");
                }
                deliver(*signal);
            }
        }
    }

    void reader_loop() {
        while (!should_stop) {
            if (!open_device()) {
                wait_for_retry();
                continue;
            }

            read_events();
            close_device();

            if (!should_stop) {
                report_unavailable("device '" + device_name + "' disconnected");
                wait_for_retry();
            }
        }
    }
};

EvdevScanSource::EvdevScanSource(std::string device_name, std::chrono::milliseconds reconnect_interval)
    : m_impl(std::make_unique<Impl>()) {
    m_impl->device_name = std::move(device_name);
    m_impl->reconnect_interval = reconnect_interval;
}

EvdevScanSource::~EvdevScanSource() {
    shutdown();
}

bool EvdevScanSource::initialize() {
    if (m_impl->wake_pipe[0] >= 0) {
        return true;
    }
    if (pipe2(m_impl->wake_pipe, O_CLOEXEC) != 0) {
        Logger::error(std::string("Scanner: cannot create wake pipe: ") + std::strerror(errno));
        return false;
    }
    return true;
}

void EvdevScanSource::shutdown() {
    m_impl->should_stop = true;
    if (m_impl->wake_pipe[1] >= 0) {
        char byte = 0;
        if (write(m_impl->wake_pipe[1], &byte, 1) < 0) {
            Logger::debug(std::string("Scanner: wake write failed: ") + std::strerror(errno));
        }
    }
    if (m_impl->reader_thread.joinable()) {
        m_impl->reader_thread.join();
    }
    m_impl->close_device();

    for (int& fd : m_impl->wake_pipe) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void EvdevScanSource::set_callback(InputCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->callback_mutex);
    m_impl->callback = std::move(callback);
}

void EvdevScanSource::process_messages() {
    if (m_impl->wake_pipe[0] < 0 || m_impl->reader_thread.joinable()) {
        return;
    }
    m_impl->should_stop = false;
    m_impl->reader_thread = std::thread(&Impl::reader_loop, m_impl.get());
}

std::unique_ptr<IScanSource> create_scan_source(bool keyboard_mode,
                                                const std::string& device_name,
                                                std::chrono::milliseconds reconnect_interval) {
    if (keyboard_mode) {
        return std::make_unique<ConsoleScanSource>(STDIN_FILENO);
    }
    return std::make_unique<EvdevScanSource>(device_name, reconnect_interval);
}

}
