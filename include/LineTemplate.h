// include/LineTemplate.h

#ifndef LINETEMPLATE_H
#define LINETEMPLATE_H

#include <map>
#include <string>
#include <vector>

namespace pkgreport {

    /// A pre-validated "{placeholder}" format for terse single-line output,
    /// e.g. "{pkgName} ({currentVersion} => {newVersion})".
    /// Known placeholders: pkgName, currentVersion, newVersion,
    /// versionSeparator, daysOld, repository.
    class LineTemplate {
    public:
        /// Throws std::invalid_argument on unknown or unterminated placeholders.
        static LineTemplate parse(const std::string& format);

        static bool isKnownPlaceholder(const std::string& name);

        /// Placeholders missing from `values` render empty.
        std::string render(const std::map<std::string, std::string>& values) const;

        const std::string& format() const { return format_; }

    private:
        struct Segment {
            bool placeholder;
            std::string text;
        };

        std::string format_;
        std::vector<Segment> segments_;
    };

} // namespace pkgreport

#endif //LINETEMPLATE_H
