#include "LineReader.hpp"
#include <utility>

LineReader::Event LineReader::feed(int c) {
    const bool afterCr = _afterCr;
    _afterCr = (c == '\r');

    if (c == '\n' && afterCr)
        return Event::Ignored;

    if (c == KEY_CTRL_C) {
        _pending.clear();
        return Event::Interrupt;
    }
    if (c == '\r' || c == '\n') {
        _done = std::move(_pending);
        _pending.clear();
        return Event::Line;
    }
    if (c == KEY_BACKSPACE || c == KEY_DELETE) {
        if (_pending.empty())
            return Event::Ignored;
        _pending.pop_back();
        return Event::Erased;
    }
    if (c < 0x20 || c > 0xFF)
        return Event::Ignored;

    _pending.push_back((char)c);
    return Event::Appended;
}
