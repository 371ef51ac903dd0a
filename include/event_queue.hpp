#pragma once

#include "types.hpp"
#include "engine_client.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace qrplay {

struct ControllerEvent {
    enum class Type {
        SCAN_TOKEN,
        EXIT_REQUESTED,
        ENGINE
    };

    Type type{Type::EXIT_REQUESTED};
    ScanToken token;
    EngineEvent engine;

    static ControllerEvent scan(ScanToken token);
    static ControllerEvent exit_requested();
    static ControllerEvent from_engine(const EngineEvent& event);
};

// Multi-producer, single-consumer. Events come out in push order.
class EventQueue {
private:
    std::deque<ControllerEvent> m_events;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

public:
    void push(ControllerEvent event);
    std::optional<ControllerEvent> try_pop();
    std::optional<ControllerEvent> wait_pop(std::chrono::milliseconds timeout);
    size_t size() const;
    bool empty() const;
};

}
