#include "scan_source.hpp"
#include "string_util.hpp"
#include <linux/input-event-codes.h>
#include <unordered_map>
#include <utility>

namespace qrplay {

namespace {

const std::unordered_map<uint16_t, std::pair<char, char>>& us_keymap() {
    static const std::unordered_map<uint16_t, std::pair<char, char>> keymap = {
        {KEY_1, {'1', '!'}}, {KEY_2, {'2', '@'}}, {KEY_3, {'3', '#'}}, {KEY_4, {'4', '$'}},
        {KEY_5, {'5', '%'}}, {KEY_6, {'6', '^'}}, {KEY_7, {'7', '&'}}, {KEY_8, {'8', '*'}},
        {KEY_9, {'9', '('}}, {KEY_0, {'0', ')'}}, {KEY_MINUS, {'-', '_'}}, {KEY_EQUAL, {'=', '+'}},
        {KEY_Q, {'q', 'Q'}}, {KEY_W, {'w', 'W'}}, {KEY_E, {'e', 'E'}}, {KEY_R, {'r', 'R'}},
        {KEY_T, {'t', 'T'}}, {KEY_Y, {'y', 'Y'}}, {KEY_U, {'u', 'U'}}, {KEY_I, {'i', 'I'}},
        {KEY_O, {'o', 'O'}}, {KEY_P, {'p', 'P'}}, {KEY_LEFTBRACE, {'[', '{'}}, {KEY_RIGHTBRACE, {']', '}'}},
        {KEY_A, {'a', 'A'}}, {KEY_S, {'s', 'S'}}, {KEY_D, {'d', 'D'}}, {KEY_F, {'f', 'F'}},
        {KEY_G, {'g', 'G'}}, {KEY_H, {'h', 'H'}}, {KEY_J, {'j', 'J'}}, {KEY_K, {'k', 'K'}},
        {KEY_L, {'l', 'L'}}, {KEY_SEMICOLON, {';', ':'}}, {KEY_APOSTROPHE, {'\'', '"'}}, {KEY_GRAVE, {'`', '~'}},
        {KEY_BACKSLASH, {'\\', '|'}}, {KEY_Z, {'z', 'Z'}}, {KEY_X, {'x', 'X'}}, {KEY_C, {'c', 'C'}},
        {KEY_V, {'v', 'V'}}, {KEY_B, {'b', 'B'}}, {KEY_N, {'n', 'N'}}, {KEY_M, {'m', 'M'}},
        {KEY_COMMA, {',', '<'}}, {KEY_DOT, {'.', '>'}}, {KEY_SLASH, {'/', '?'}}, {KEY_SPACE, {' ', ' '}},
    };
    return keymap;
}

}

std::optional<char> LineAssembler::key_to_char(uint16_t code, bool shifted) {
    const auto& keymap = us_keymap();
    auto it = keymap.find(code);
    if (it == keymap.end()) {
        return std::nullopt;
    }
    return shifted ? it->second.second : it->second.first;
}

std::optional<InputSignal> LineAssembler::feed(const InputEvent& event) {
    constexpr int32_t KEY_RELEASE = 0;
    constexpr int32_t KEY_PRESS = 1;

    if (event.code == KEY_LEFTSHIFT) {
        m_left_shift = event.value != KEY_RELEASE;
        return std::nullopt;
    }
    if (event.code == KEY_RIGHTSHIFT) {
        m_right_shift = event.value != KEY_RELEASE;
        return std::nullopt;
    }

    if (event.value != KEY_PRESS) {
        return std::nullopt;
    }

    if (event.code == KEY_ENTER || event.code == KEY_KPENTER) {
        std::string text = trim(m_buffer);
        m_buffer.clear();
        if (text.empty()) {
            return std::nullopt;
        }
        InputSignal signal;
        signal.kind = InputSignal::Kind::TOKEN;
        signal.token.text = std::move(text);
        signal.token.received = event.timestamp;
        return signal;
    }

    if (event.code == KEY_ESC) {
        m_buffer.clear();
        InputSignal signal;
        signal.kind = InputSignal::Kind::EXIT;
        signal.token.received = event.timestamp;
        return signal;
    }

    auto c = key_to_char(event.code, m_left_shift || m_right_shift);
    if (c) {
        m_buffer.push_back(*c);
    }
    return std::nullopt;
}

void LineAssembler::reset() {
    m_buffer.clear();
    m_left_shift = false;
    m_right_shift = false;
}

}
