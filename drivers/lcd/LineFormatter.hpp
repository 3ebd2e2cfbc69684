#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Lays a block of text out on a fixed number of fixed-width display lines.
class LineFormatter {
public:
    // Split on every '\n'. "" gives one empty line, a trailing '\n' gives a
    // trailing empty line.
    static std::vector<std::string_view> splitLines(std::string_view text);

    // Exactly lineCount strings of exactly `columns` characters. Input line i
    // lands on output line i, space padded or truncated (never wrapped).
    // Output lines without input are blank; input beyond lineCount is dropped.
    static std::vector<std::string> format(const std::vector<std::string_view>& lines,
                                           uint8_t columns, size_t lineCount);
};
