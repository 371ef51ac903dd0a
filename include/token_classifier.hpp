#pragma once

#include "types.hpp"
#include <string>
#include <chrono>
#include <optional>

namespace qrplay {

struct Classification {
    enum class Kind {
        MEDIA,
        COMMAND,
        INVALID
    };

    Kind kind{Kind::INVALID};
    Command command{Command::PAUSE};
    std::string reference;   // normalized media reference, MEDIA only
    std::string key;         // debounce identity
};

class TokenClassifier {
private:
    std::string m_command_prefix;
    std::chrono::milliseconds m_debounce_window;

    std::string m_last_key;
    TimePoint m_last_accepted{};
    bool m_has_last = false;

public:
    explicit TokenClassifier(std::chrono::milliseconds debounce_window = std::chrono::milliseconds(2000),
                             std::string command_prefix = "CMD:");

    // Returns nullopt for tokens that are empty or debounced. INVALID results
    // are returned so the caller can log them; they do not update the debounce slot.
    std::optional<Classification> classify(const std::string& token, TimePoint now);

    Classification interpret(const std::string& token) const;

    void reset();

    static std::optional<Command> parse_command_name(const std::string& name);
    static std::string normalize(const std::string& text);
};

}
