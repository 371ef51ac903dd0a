#include "key_watcher.hpp"
#include "logger.hpp"
#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <sys/select.h>

namespace qrplay {

namespace {

// XGrabKey reports BadAccess asynchronously; this records it.
std::atomic<bool> grab_failed{false};

int record_grab_error(Display*, XErrorEvent* error) {
    if (error->error_code == BadAccess) {
        grab_failed = true;
    }
    return 0;
}

}

struct X11KeyWatcher::Impl {
    Display* display = nullptr;
    Window root = 0;
    InputCallback callback;
    std::mutex callback_mutex;
    std::thread message_thread;
    std::atomic<bool> should_stop{false};
    bool grabbed = false;

    bool create_display() {
        display = XOpenDisplay(nullptr);
        if (!display) {
            return false;
        }
        root = DefaultRootWindow(display);
        return true;
    }

    void deliver_exit() {
        InputCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = callback;
        }
        if (!cb) return;

        InputSignal signal;
        signal.kind = InputSignal::Kind::EXIT;
        signal.token.received = Clock::now();
        cb(signal);
    }

    void message_loop() {
        XEvent event;
        while (!should_stop) {
            fd_set readfds;
            FD_ZERO(&readfds);
            int x11_fd = ConnectionNumber(display);
            FD_SET(x11_fd, &readfds);

            struct timeval timeout;
            timeout.tv_sec = 0;
            timeout.tv_usec = 100000; // 100ms

            int result = select(x11_fd + 1, &readfds, nullptr, nullptr, &timeout);

            if (result > 0 && FD_ISSET(x11_fd, &readfds)) {
                while (XPending(display) > 0) {
                    XNextEvent(display, &event);

                    if (event.type == KeyPress) {
                        KeySym keysym = XLookupKeysym(&event.xkey, 0);
                        if (keysym == XK_q || keysym == XK_Q || keysym == XK_Escape) {
                            Logger::info("Keyboard: exit key pressed");
                            deliver_exit();
                        }
                    }
                }
            }
        }
    }
};

X11KeyWatcher::X11KeyWatcher() : m_impl(std::make_unique<Impl>()) {}

X11KeyWatcher::~X11KeyWatcher() {
    shutdown();
}

bool X11KeyWatcher::initialize() {
    if (m_impl->display) {
        return true;
    }
    if (!m_impl->create_display()) {
        Logger::warn("Keyboard: could not open X11 display, Q/Escape exit disabled "
                     "(make sure DISPLAY is set, e.g. export DISPLAY=:0)");
        return false;
    }
    return register_hotkeys();
}

void X11KeyWatcher::shutdown() {
    m_impl->should_stop = true;
    if (m_impl->message_thread.joinable()) {
        m_impl->message_thread.join();
    }

    unregister_hotkeys();

    if (m_impl->display) {
        XCloseDisplay(m_impl->display);
        m_impl->display = nullptr;
    }
}

void X11KeyWatcher::set_callback(InputCallback callback) {
    std::lock_guard<std::mutex> lock(m_impl->callback_mutex);
    m_impl->callback = std::move(callback);
}

bool X11KeyWatcher::register_hotkeys() {
    if (!m_impl->display) {
        return false;
    }

    KeyCode q_key = XKeysymToKeycode(m_impl->display, XK_q);
    KeyCode escape_key = XKeysymToKeycode(m_impl->display, XK_Escape);

    grab_failed = false;
    XErrorHandler previous = XSetErrorHandler(record_grab_error);
    XGrabKey(m_impl->display, q_key, AnyModifier, m_impl->root, False, GrabModeAsync, GrabModeAsync);
    XGrabKey(m_impl->display, escape_key, AnyModifier, m_impl->root, False, GrabModeAsync, GrabModeAsync);
    XSync(m_impl->display, False);
    XSetErrorHandler(previous);

    if (grab_failed) {
        Logger::warn("Keyboard: Q/Escape are grabbed by another client, exit keys disabled");
        XUngrabKey(m_impl->display, q_key, AnyModifier, m_impl->root);
        XUngrabKey(m_impl->display, escape_key, AnyModifier, m_impl->root);
        XFlush(m_impl->display);
        return false;
    }

    m_impl->grabbed = true;
    Logger::info("Keyboard: Q/Escape registered as exit keys");
    return true;
}

void X11KeyWatcher::unregister_hotkeys() {
    if (!m_impl->display || !m_impl->grabbed) {
        return;
    }

    KeyCode q_key = XKeysymToKeycode(m_impl->display, XK_q);
    KeyCode escape_key = XKeysymToKeycode(m_impl->display, XK_Escape);

    XUngrabKey(m_impl->display, q_key, AnyModifier, m_impl->root);
    XUngrabKey(m_impl->display, escape_key, AnyModifier, m_impl->root);
    XFlush(m_impl->display);
    m_impl->grabbed = false;
}

void X11KeyWatcher::process_messages() {
    if (m_impl->grabbed && !m_impl->message_thread.joinable()) {
        m_impl->should_stop = false;
        m_impl->message_thread = std::thread(&Impl::message_loop, m_impl.get());
    }
}

std::unique_ptr<IScanSource> create_key_watcher() {
    return std::make_unique<X11KeyWatcher>();
}

}
