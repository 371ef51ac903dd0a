#include "token_classifier.hpp"
#include "logger.hpp"
#include "string_util.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace qrplay {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

}

TokenClassifier::TokenClassifier(std::chrono::milliseconds debounce_window, std::string command_prefix)
    : m_command_prefix(std::move(command_prefix))
    , m_debounce_window(debounce_window) {
}

std::optional<Command> TokenClassifier::parse_command_name(const std::string& name) {
    std::string upper = to_upper(trim(name));

    if (upper == "PAUSE") return Command::PAUSE;
    if (upper == "STOP") return Command::STOP;
    if (upper == "VOLUP" || upper == "VOLUMEUP") return Command::VOLUME_UP;
    if (upper == "VOLDOWN" || upper == "VOLUMEDOWN") return Command::VOLUME_DOWN;
    if (upper == "MUTE") return Command::MUTE;
    if (upper == "FWD" || upper == "SEEKFORWARD") return Command::SEEK_FORWARD;
    if (upper == "RWD" || upper == "SEEKBACKWARD") return Command::SEEK_BACKWARD;
    if (upper == "EXIT") return Command::EXIT;

    return std::nullopt;
}

std::string TokenClassifier::normalize(const std::string& text) {
    std::string normalized = trim(text);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

Classification TokenClassifier::interpret(const std::string& token) const {
    Classification result;
    std::string text = trim(token);

    if (text.find('/') != std::string::npos || text.find("..") != std::string::npos) {
        result.kind = Classification::Kind::INVALID;
        result.key = text;
        return result;
    }

    if (text.compare(0, m_command_prefix.size(), m_command_prefix) == 0) {
        auto command = parse_command_name(text.substr(m_command_prefix.size()));
        if (!command) {
            result.kind = Classification::Kind::INVALID;
            result.key = text;
            return result;
        }
        result.kind = Classification::Kind::COMMAND;
        result.command = *command;
        result.key = m_command_prefix + to_string(*command);
        return result;
    }

    result.kind = Classification::Kind::MEDIA;
    result.reference = normalize(text);
    result.key = result.reference;
    return result;
}

std::optional<Classification> TokenClassifier::classify(const std::string& token, TimePoint now) {
    if (trim(token).empty()) {
        return std::nullopt;
    }

    Classification result = interpret(token);

    if (result.kind == Classification::Kind::INVALID) {
        Logger::warn("Classifier: " + std::string(to_string(ErrorKind::INVALID_COMMAND)) +
                     ": dropping token '" + token + "'");
        return result;
    }

    if (m_has_last && result.key == m_last_key && now - m_last_accepted < m_debounce_window) {
        Logger::debug("Classifier: debounced duplicate scan '" + token + "'");
        return std::nullopt;
    }

    m_last_key = result.key;
    m_last_accepted = now;
    m_has_last = true;

    return result;
}

void TokenClassifier::reset() {
    m_last_key.clear();
    m_last_accepted = TimePoint{};
    m_has_last = false;
}

}
