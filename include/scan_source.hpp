#pragma once

#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace qrplay {

// Rebuilds typed lines from raw key transitions (US layout).
class LineAssembler {
private:
    std::string m_buffer;
    bool m_left_shift = false;
    bool m_right_shift = false;

public:
    // Returns a signal when the event completes a token (Enter) or asks to exit (Escape).
    std::optional<InputSignal> feed(const InputEvent& event);
    void reset();

    const std::string& pending() const { return m_buffer; }

    static std::optional<char> key_to_char(uint16_t code, bool shifted);
};

class IScanSource {
public:
    virtual ~IScanSource() = default;
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual void set_callback(InputCallback callback) = 0;
    virtual void process_messages() = 0;
};

class EvdevScanSource : public IScanSource {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    EvdevScanSource(std::string device_name, std::chrono::milliseconds reconnect_interval);
    ~EvdevScanSource() override;

    bool initialize() override;
    void shutdown() override;
    void set_callback(InputCallback callback) override;
    void process_messages() override;
};

class ConsoleScanSource : public IScanSource {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    // Reads newline-terminated scans from `input_fd` (stdin by default).
    explicit ConsoleScanSource(int input_fd = 0);
    ~ConsoleScanSource() override;

    bool initialize() override;
    void shutdown() override;
    void set_callback(InputCallback callback) override;
    void process_messages() override;
};

// Returns the /dev/input/event* node whose name contains `name_substring`.
std::optional<std::string> find_input_device(const std::string& name_substring);

std::unique_ptr<IScanSource> create_scan_source(bool keyboard_mode,
                                                const std::string& device_name,
                                                std::chrono::milliseconds reconnect_interval);

}
