// src/SysupgradeReport.cpp

#include "SysupgradeReport.h"
#include "UpgradeFormatter.h"

namespace pkgreport {

    const std::array<CategoryTag, 8> kCategoryOrder = {
        CategoryTag::RepoReplacement,
        CategoryTag::ThirdpartyReplacement,
        CategoryTag::RepoUpdate,
        CategoryTag::RepoNewDep,
        CategoryTag::ThirdpartyUpdate,
        CategoryTag::ThirdpartyNewDep,
        CategoryTag::AurUpdate,
        CategoryTag::AurNewDep,
    };

    CategoryTraits categoryTraits(CategoryTag tag) {
        switch (tag) {
            case CategoryTag::RepoReplacement:
                return {"Repository package suggested as a replacement:",
                        "Repository packages suggested as a replacement:", 12, false};
            case CategoryTag::ThirdpartyReplacement:
                return {"Third-party repository package suggested as a replacement:",
                        "Third-party repository packages suggested as a replacement:", 12, false};
            case CategoryTag::RepoUpdate:
                return {"Repository package will be installed:",
                        "Repository packages will be installed:", 12, false};
            case CategoryTag::RepoNewDep:
                return {"New dependency will be installed from repository:",
                        "New dependencies will be installed from repository:", 11, true};
            case CategoryTag::ThirdpartyUpdate:
                return {"Third-party repository package will be installed:",
                        "Third-party repository packages will be installed:", 12, false};
            case CategoryTag::ThirdpartyNewDep:
                return {"New dependency will be installed from third-party repository:",
                        "New dependencies will be installed from third-party repository:", 11, true};
            case CategoryTag::AurUpdate:
                return {"AUR package will be installed:",
                        "AUR packages will be installed:", 14, false};
            case CategoryTag::AurNewDep:
                return {"New dependency will be installed from AUR:",
                        "New dependencies will be installed from AUR:", 11, true};
        }
        return {"", "", 12, false};
    }

    SysupgradeReportBuilder::SysupgradeReportBuilder(const ReportConfig& config,
                                                     const TextStyle& text,
                                                     const Translator& i18n)
      : config_(config), text_(text), i18n_(i18n) {}

    bool SysupgradeReportBuilder::showsOrigin(CategoryTag tag) const {
        switch (tag) {
            case CategoryTag::ThirdpartyUpdate:
                return true;
            case CategoryTag::AurUpdate:
            case CategoryTag::AurNewDep:
                return false;
            default:
                return config_.alwaysShowPkgOrigin;
        }
    }

    std::string SysupgradeReportBuilder::build(const std::vector<Category>& categories,
                                               bool manualSelectionMode,
                                               bool verbose,
                                               int terminalWidth) const {
        const TextStyle& text = manualSelectionMode ? TextStyle::plain() : text_;
        const UpgradeSetFormatter formatter(text, i18n_);

        std::vector<std::string> parts;
        for (const auto tag : kCategoryOrder) {
            const auto traits = categoryTraits(tag);
            if (manualSelectionMode && traits.newDependency) continue;

            for (const auto& category : categories) {
                if (category.tag != tag || category.records.empty()) continue;

                parts.push_back("\n" + text.decorate("::", traits.color) + " "
                    + text.bold(i18n_.pluralize(traits.singular, traits.plural,
                                                category.records.size())));

                LineStyle style;
                style.showRepo = showsOrigin(tag);
                style.verbose = verbose;
                style.terminalWidth = terminalWidth;
                style.sortMode = config_.sortMode;
                style.colors = config_.colors;
                style.commentReplacements = manualSelectionMode;
                parts.push_back(formatter.render(category.records, style));
            }
        }
        parts.emplace_back();

        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += '\n';
            out += parts[i];
        }
        return out;
    }

} // namespace pkgreport
