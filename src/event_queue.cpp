#include "event_queue.hpp"
#include <utility>

namespace qrplay {

ControllerEvent ControllerEvent::scan(ScanToken token) {
    ControllerEvent event;
    event.type = Type::SCAN_TOKEN;
    event.token = std::move(token);
    return event;
}

ControllerEvent ControllerEvent::exit_requested() {
    ControllerEvent event;
    event.type = Type::EXIT_REQUESTED;
    return event;
}

ControllerEvent ControllerEvent::from_engine(const EngineEvent& engine_event) {
    ControllerEvent event;
    event.type = Type::ENGINE;
    event.engine = engine_event;
    return event;
}

void EventQueue::push(ControllerEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(event));
    }
    m_cv.notify_one();
}

std::optional<ControllerEvent> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) {
        return std::nullopt;
    }
    ControllerEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

std::optional<ControllerEvent> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this] { return !m_events.empty(); })) {
        return std::nullopt;
    }
    ControllerEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.empty();
}

}
