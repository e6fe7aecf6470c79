// include/SysupgradeReport.h

#ifndef SYSUPGRADEREPORT_H
#define SYSUPGRADEREPORT_H

#include "Package.h"
#include "ReportConfig.h"
#include "TextStyle.h"
#include "Translator.h"

#include <array>
#include <string>
#include <vector>

namespace pkgreport {

    /// Fixed per-tag presentation.
    struct CategoryTraits {
        const char* singular;
        const char* plural;
        int color;
        bool newDependency;
    };

    CategoryTraits categoryTraits(CategoryTag tag);

    /// Order in which categories appear in the report.
    extern const std::array<CategoryTag, 8> kCategoryOrder;

    class SysupgradeReportBuilder {
    public:
        SysupgradeReportBuilder(const ReportConfig& config, const TextStyle& text,
                                const Translator& i18n);

        /// Headered report over all non-empty categories, ending with a newline.
        /// Manual selection mode drops color and the new-dependency categories.
        [[nodiscard]] std::string build(const std::vector<Category>& categories,
                                        bool manualSelectionMode,
                                        bool verbose,
                                        int terminalWidth) const;

    private:
        const ReportConfig& config_;
        const TextStyle& text_;
        const Translator& i18n_;

        bool showsOrigin(CategoryTag tag) const;
    };

} // namespace pkgreport

#endif //SYSUPGRADEREPORT_H
