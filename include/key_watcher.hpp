#pragma once

#include "scan_source.hpp"
#include <memory>

namespace qrplay {

// Local keyboard on the playback display: Q or Escape asks the player to exit.
class X11KeyWatcher : public IScanSource {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    X11KeyWatcher();
    ~X11KeyWatcher() override;

    bool initialize() override;
    void shutdown() override;
    void set_callback(InputCallback callback) override;
    void process_messages() override;

    bool register_hotkeys();
    void unregister_hotkeys();
};

std::unique_ptr<IScanSource> create_key_watcher();

}
