#include "LineFormatter.hpp"
#include <utility>

std::vector<std::string_view> LineFormatter::splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (;;) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
}

std::vector<std::string> LineFormatter::format(const std::vector<std::string_view>& lines,
                                               uint8_t columns, size_t lineCount) {
    std::vector<std::string> out;
    out.reserve(lineCount);
    for (size_t i = 0; i < lineCount; ++i) {
        std::string row(columns, ' ');
        if (i < lines.size()) {
            std::string_view src = lines[i].substr(0, columns);
            row.replace(0, src.size(), src.data(), src.size());
        }
        out.push_back(std::move(row));
    }
    return out;
}
