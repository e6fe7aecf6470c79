// include/Notices.h

#ifndef NOTICES_H
#define NOTICES_H

#include "TextStyle.h"
#include "Translator.h"

#include <string>
#include <vector>

namespace pkgreport {

    /// Short messages written to stderr around a sysupgrade.
    class Notices {
    public:
        Notices(const TextStyle& text, const Translator& i18n);

        /// Warning header plus one line per missing package.
        [[nodiscard]] std::string notFound(const std::vector<std::string>& names, bool repo,
                                           int terminalWidth) const;

        /// ":: Ignoring package update foo (1.0 => 1.1)", or
        /// ":: Ignoring package foo 1.0" when only one version is known.
        [[nodiscard]] std::string ignoredPackage(const std::string& name,
                                                 const std::string& currentVersion,
                                                 const std::string& newVersion) const;

        [[nodiscard]] std::string upToDate(const std::string& name, const std::string& version,
                                           const std::string& source) const;

    private:
        const TextStyle& text_;
        const Translator& i18n_;

        std::string warningPrefix() const;
    };

} // namespace pkgreport

#endif //NOTICES_H
