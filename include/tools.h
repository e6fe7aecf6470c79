// include/tools.h

#ifndef TOOLS_H
#define TOOLS_H

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

class Tools {
public:

/// Join items with a separator
static std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

/// Replace every occurrence of `from` in `s` with `to`
static std::string replaceAll(std::string s, std::string_view from, std::string_view to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

/// Strict UTF-8 check: rejects overlong forms, surrogates and stray continuation bytes
static bool isValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        unsigned int cp;
        if (c < 0x80)                { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

/// Number of terminal cells `s` occupies: ANSI CSI sequences are skipped,
/// UTF-8 continuation bytes are not counted.
static int visibleWidth(std::string_view s) {
    int width = 0;
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == 0x1B && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            // parameter and intermediate bytes, then one final byte in 0x40..0x7E
            while (i < s.size()) {
                const auto p = static_cast<unsigned char>(s[i++]);
                if (p >= 0x40 && p <= 0x7E) break;
            }
            continue;
        }
        if ((c & 0xC0) != 0x80) ++width;
        ++i;
    }
    return width;
}

static std::string spaces(int n) {
    return std::string(static_cast<size_t>(std::max(0, n)), ' ');
}

/// Word-wrap `text` to the terminal width with a 4-column indent.
static std::string formatParagraph(const std::string& text, int termWidth) {
    constexpr int padding = 4;
    const int maxLineWidth = std::max(20, termWidth - padding * 2);

    std::vector<std::vector<std::string>> lines(1);
    int lineLength = 0;
    std::istringstream words(text);
    std::string word;
    while (words >> word) {
        const int wlen = visibleWidth(word);
        if (!lines.back().empty() && lineLength + wlen > maxLineWidth) {
            lines.emplace_back();
            lineLength = 0;
        }
        lines.back().push_back(word);
        lineLength += wlen + 1;
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        if (lines[i].empty()) continue;
        out += spaces(padding) + join(lines[i], " ");
    }
    return out;
}
};
#endif //TOOLS_H
