// include/TextStyle.h

#ifndef TEXTSTYLE_H
#define TEXTSTYLE_H

#include <string>

namespace pkgreport {

    // Fixed color indices (0-7 normal, 8-15 bright)
    constexpr int kDependencyColor  = 3;
    constexpr int kProvidedColor    = 2;
    constexpr int kGroupColor       = 4;
    constexpr int kReplacementColor = 14;
    constexpr int kAurColor         = 9;
    constexpr int kInstalledColor   = 14;
    constexpr int kRatingColor      = 3;
    constexpr int kWarningColor     = 11;

    /// Colorizing capability. The plain implementation returns text unchanged,
    /// so rendering code never branches on whether color is enabled.
    class TextStyle {
    public:
        virtual ~TextStyle() = default;

        virtual std::string decorate(const std::string& text, int colorId) const = 0;
        virtual std::string bold(const std::string& text) const = 0;

        static const TextStyle& ansi();
        static const TextStyle& plain();
    };

    /// Same repository name always maps to the same color in {10..14}.
    int repoColor(const std::string& repoName);

} // namespace pkgreport

#endif //TEXTSTYLE_H
