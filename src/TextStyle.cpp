// src/TextStyle.cpp

#include "TextStyle.h"

namespace pkgreport {

    namespace {
        class AnsiTextStyle final : public TextStyle {
        public:
            std::string decorate(const std::string& text, int colorId) const override {
                if (text.empty()) return text;
                // 0-7 -> "\033[0;3Nm", 8-15 -> bold "\033[1;3Nm"
                const bool bright = colorId >= 8;
                const int base = (bright ? colorId - 8 : colorId) & 7;
                return std::string("\033[") + (bright ? "1" : "0") + ";3"
                     + std::to_string(base) + "m" + text + "\033[0m";
            }

            std::string bold(const std::string& text) const override {
                if (text.empty()) return text;
                return "\033[0;1m" + text + "\033[0m";
            }
        };

        class PlainTextStyle final : public TextStyle {
        public:
            std::string decorate(const std::string& text, int) const override { return text; }
            std::string bold(const std::string& text) const override { return text; }
        };
    }

    const TextStyle& TextStyle::ansi() {
        static const AnsiTextStyle style{};
        return style;
    }

    const TextStyle& TextStyle::plain() {
        static const PlainTextStyle style{};
        return style;
    }

    int repoColor(const std::string& repoName) {
        unsigned int hash = 0;
        for (const unsigned char c : repoName)
            hash = hash * 31 + c;
        return static_cast<int>(hash % 5) + 10;
    }

} // namespace pkgreport
