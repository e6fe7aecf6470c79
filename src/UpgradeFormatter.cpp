// src/UpgradeFormatter.cpp

#include "UpgradeFormatter.h"
#include "VersionDiff.h"
#include "tools.h"

#include <algorithm>
#include <cstdio>

namespace pkgreport {

    namespace {
        struct OriginPrefix {
            const TextStyle& text;
            bool showRepo;
            bool verbose;

            std::string operator()(const RepoOrigin& repo) const {
                if (!(showRepo || verbose) || repo.name.empty()) return "";
                return text.decorate(repo.name + "/", repoColor(repo.name));
            }
            std::string operator()(const AurOrigin&) const {
                return showRepo ? text.decorate("aur/", kAurColor) : "";
            }
        };
    }

    int columnWidthFor(int terminalWidth) {
        const int fromTerminal = static_cast<int>(terminalWidth / 2.5);
        return std::max(kMinColumnWidth, std::min(fromTerminal, kMaxColumnWidth));
    }

    std::string makeSortKey(const InstallInfo& info, int diffWeight, SortMode mode) {
        switch (mode) {
            case SortMode::Name:
                return info.name;
            case SortMode::Repo:
                return repositoryName(info.origin) + info.name;
            case SortMode::DiffWeight:
                break;
        }
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%04d",
                      kMaxDiffWeight - std::clamp(diffWeight, 0, kMaxDiffWeight));
        return buf + info.name;
    }

    UpgradeLineFormatter::UpgradeLineFormatter(const TextStyle& text, const Translator& i18n)
      : text_(text), i18n_(i18n) {}

    std::string UpgradeLineFormatter::decoratedList(const std::string& tmpl, const std::string& key,
                                                    const std::vector<std::string>& items,
                                                    int color, int itemColor) const {
        std::vector<std::string> colored;
        colored.reserve(items.size());
        for (const auto& item : items)
            colored.push_back(text_.decorate(item, itemColor));
        const std::string joined = Tools::join(colored, text_.decorate(", ", color));

        const auto pos = tmpl.find(key);
        if (pos == std::string::npos)
            return text_.decorate(" (" + tmpl + ")", color);
        return text_.decorate(" (" + tmpl.substr(0, pos), color)
             + joined
             + text_.decorate(tmpl.substr(pos + key.size()) + ")", color);
    }

    std::string UpgradeLineFormatter::displayName(const InstallInfo& info, const LineStyle& style) const {
        std::string name = std::visit(OriginPrefix{text_, style.showRepo, style.verbose}, info.origin)
                         + text_.bold(info.name);

        if (!info.requiredBy.empty()) {
            name += decoratedList(i18n_.translate("for {pkg}"), "{pkg}", info.requiredBy,
                                  kDependencyColor, kDependencyColor + 8);
        }
        if (!info.providedBy.empty()) {
            name += text_.decorate(" (" + Tools::join(info.providedBy, " # ") + ")", kProvidedColor);
        }
        if (!info.memberOf.empty()) {
            name += decoratedList(i18n_.pluralize("{grp} group", "{grp} groups", info.memberOf.size()),
                                  "{grp}", info.memberOf, kGroupColor, kGroupColor + 8);
        }
        if (!info.replaces.empty()) {
            name += decoratedList(i18n_.translate("replaces {pkg}"), "{pkg}", info.replaces,
                                  kReplacementColor, kReplacementColor);
            if (style.commentReplacements)
                name = "# " + name;
        }
        return name;
    }

    std::string UpgradeLineFormatter::versionPart(const std::string& full, const std::string& shared,
                                                  int sharedColor, int diffColor) const {
        return text_.decorate(shared, sharedColor)
             + text_.decorate(versionSuffix(full, shared), diffColor);
    }

    RenderedLine UpgradeLineFormatter::render(const InstallInfo& info, const LineStyle& style) const {
        const auto common = commonPrefix(info.currentVersion, info.newVersion);

        RenderedLine out;
        out.sortKey = makeSortKey(info, common.weight, style.sortMode);

        const std::string name = displayName(info, style);
        const std::string current = versionPart(info.currentVersion, common.shared,
                                                style.colors.version, style.colors.diffOld);
        const std::string next = versionPart(info.newVersion, common.shared,
                                             style.colors.version, style.colors.diffNew);
        const std::string separator =
            (info.currentVersion.empty() && info.newVersion.empty()) ? "" : " -> ";

        std::string daysOld;
        if (info.develPkgAgeDays) {
            daysOld = " " + Tools::replaceAll(i18n_.translate("({days} days old)"), "{days}",
                                              std::to_string(*info.develPkgAgeDays));
        }

        if (style.lineTemplate) {
            const std::string repo = repositoryName(info.origin);
            out.line = style.lineTemplate->render({
                {"pkgName", name},
                {"currentVersion", current},
                {"newVersion", next},
                {"versionSeparator", separator},
                {"daysOld", daysOld},
                {"repository", repo.empty() ? "aur" : repo},
            });
            return out;
        }

        const int nameLen = Tools::visibleWidth(name);
        const int columnWidth = columnWidthFor(style.terminalWidth);
        const int spacing = std::max(kMinPadding, columnWidth - nameLen);
        const int spacing2 = std::max(kMinPadding,
            columnWidth - kDecorationAllowance
            - Tools::visibleWidth(info.currentVersion)
            - std::max(-1, nameLen - columnWidth));

        std::string verbose;
        if (style.verbose && !info.description.empty())
            verbose = "\n" + Tools::formatParagraph(info.description, style.terminalWidth);

        out.line = " " + name + Tools::spaces(spacing)
                 + " " + current + Tools::spaces(spacing2)
                 + separator + next + daysOld + verbose;
        return out;
    }

    UpgradeSetFormatter::UpgradeSetFormatter(const TextStyle& text, const Translator& i18n)
      : line_(text, i18n) {}

    std::string UpgradeSetFormatter::render(const std::vector<InstallInfo>& records,
                                            const LineStyle& style) const {
        std::vector<RenderedLine> lines;
        lines.reserve(records.size());
        for (const auto& info : records)
            lines.push_back(line_.render(info, style));

        std::stable_sort(lines.begin(), lines.end(),
            [](const RenderedLine& a, const RenderedLine& b) { return a.sortKey < b.sortKey; });

        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i) out += '\n';
            out += lines[i].line;
        }
        return out;
    }

} // namespace pkgreport
