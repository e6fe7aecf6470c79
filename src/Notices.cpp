// src/Notices.cpp

#include "Notices.h"
#include "LineTemplate.h"
#include "UpgradeFormatter.h"
#include "tools.h"

namespace pkgreport {

    Notices::Notices(const TextStyle& text, const Translator& i18n)
      : text_(text), i18n_(i18n) {}

    std::string Notices::warningPrefix() const {
        return text_.decorate(":: " + i18n_.translate("warning:"), kWarningColor) + " ";
    }

    std::string Notices::notFound(const std::vector<std::string>& names, bool repo,
                                  int terminalWidth) const {
        const std::string header = repo
            ? i18n_.pluralize("Following package cannot be found in repositories:",
                              "Following packages cannot be found in repositories:",
                              names.size())
            : i18n_.pluralize("Following package cannot be found in AUR:",
                              "Following packages cannot be found in AUR:",
                              names.size());

        std::string out = warningPrefix() + text_.bold(header);
        for (const auto& name : names)
            out += "\n" + Tools::formatParagraph(name, terminalWidth);
        return out;
    }

    std::string Notices::ignoredPackage(const std::string& name,
                                        const std::string& currentVersion,
                                        const std::string& newVersion) const {
        InstallInfo info;
        info.name = name;
        info.currentVersion = currentVersion;
        info.newVersion = newVersion;

        LineStyle style;
        const bool bothKnown = !currentVersion.empty() && !newVersion.empty();
        std::string message;
        if (bothKnown) {
            style.lineTemplate = LineTemplate::parse("{pkgName} ({currentVersion} => {newVersion})");
            message = i18n_.translate("Ignoring package update {}");
        } else {
            style.lineTemplate = LineTemplate::parse(
                currentVersion.empty() ? "{pkgName} {newVersion}" : "{pkgName} {currentVersion}");
            message = i18n_.translate("Ignoring package {}");
        }

        const UpgradeSetFormatter formatter(text_, i18n_);
        return text_.decorate("::", kWarningColor) + " "
             + Tools::replaceAll(message, "{}", formatter.render({info}, style));
    }

    std::string Notices::upToDate(const std::string& name, const std::string& version,
                                  const std::string& source) const {
        std::string msg = i18n_.translate("{name} {version} {package_source} package is up to date - skipping");
        msg = Tools::replaceAll(msg, "{name}", name);
        msg = Tools::replaceAll(msg, "{version}", text_.bold(version));
        msg = Tools::replaceAll(msg, "{package_source}", source);
        return warningPrefix() + msg;
    }

} // namespace pkgreport
