// include/UpgradeFormatter.h

#ifndef UPGRADEFORMATTER_H
#define UPGRADEFORMATTER_H

#include "LineTemplate.h"
#include "Package.h"
#include "ReportConfig.h"
#include "TextStyle.h"
#include "Translator.h"

#include <optional>
#include <string>
#include <vector>

namespace pkgreport {

    constexpr int kMaxColumnWidth = 37;
    constexpr int kMinColumnWidth = 8;
    constexpr int kMinPadding = 1;
    // Heuristic width reserved for the version decoration in the second column
    constexpr int kDecorationAllowance = 18;

    struct LineStyle {
        bool showRepo = false;
        bool verbose = false;
        int terminalWidth = 80;
        SortMode sortMode = SortMode::DiffWeight;
        VersionColors colors;
        std::optional<LineTemplate> lineTemplate;
        // prefix replacement lines with "# " (manual selection lists)
        bool commentReplacements = false;
    };

    struct RenderedLine {
        std::string line;
        std::string sortKey;
    };

    /// min(width / 2.5, 37), never below kMinColumnWidth.
    int columnWidthFor(int terminalWidth);

    std::string makeSortKey(const InstallInfo& info, int diffWeight, SortMode mode);

    class UpgradeLineFormatter {
    public:
        UpgradeLineFormatter(const TextStyle& text, const Translator& i18n);

        [[nodiscard]] RenderedLine render(const InstallInfo& info, const LineStyle& style) const;

        /// Decorated "repo/name (for ...) (...)" part of the line.
        [[nodiscard]] std::string displayName(const InstallInfo& info, const LineStyle& style) const;

    private:
        const TextStyle& text_;
        const Translator& i18n_;

        std::string decoratedList(const std::string& tmpl, const std::string& key,
                                  const std::vector<std::string>& items,
                                  int color, int itemColor) const;
        std::string versionPart(const std::string& full, const std::string& shared,
                                int sharedColor, int diffColor) const;
    };

    class UpgradeSetFormatter {
    public:
        UpgradeSetFormatter(const TextStyle& text, const Translator& i18n);

        /// Render every record, stable-sort by sort key, join with '\n'.
        [[nodiscard]] std::string render(const std::vector<InstallInfo>& records,
                                         const LineStyle& style) const;

    private:
        UpgradeLineFormatter line_;
    };

} // namespace pkgreport

#endif //UPGRADEFORMATTER_H
