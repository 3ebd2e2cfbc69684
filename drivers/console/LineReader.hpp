#pragma once
#include <cstdint>
#include <string>

/**
 * Line editing for a serial console, one received character at a time.
 * CR, LF or CR+LF end a line; the LF of a CR+LF pair is swallowed so it
 * does not show up as a second, empty line.
 */
class LineReader {
public:
    enum class Event : uint8_t {
        Ignored,    // nothing to echo
        Appended,   // character added, echo it
        Erased,     // last character removed, echo "\b \b"
        Line,       // line complete, available from line()
        Interrupt,  // Ctrl-C
    };

    static constexpr int KEY_CTRL_C    = 0x03;
    static constexpr int KEY_BACKSPACE = 0x08;
    static constexpr int KEY_DELETE    = 0x7F;

    Event feed(int c);

    // Text of the most recently completed line.
    const std::string& line() const { return _done; }

private:
    std::string _pending;
    std::string _done;
    bool _afterCr = false;
};
