// include/ReportConfig.h

#ifndef REPORTCONFIG_H
#define REPORTCONFIG_H

#include <string>

namespace pkgreport {

    enum class SortMode {
        DiffWeight,
        Name,
        Repo,
    };

    struct VersionColors {
        int version = 10;
        int diffOld = 11;
        int diffNew = 9;
    };

    /// User preferences, read once and passed into every render call.
    struct ReportConfig {
        SortMode sortMode = SortMode::DiffWeight;
        bool alwaysShowPkgOrigin = false;
        VersionColors colors;

        /// Load YAML from `path`. A missing file leaves the defaults and succeeds.
        bool load(const std::string& path);
        /// Same, from an in-memory YAML document.
        bool loadFromString(const std::string& content);

        static std::string defaultPath();
    };

    /// "pkgname" -> Name, "repo" -> Repo, anything else -> DiffWeight.
    SortMode parseSortMode(const std::string& value);

} // namespace pkgreport

#endif //REPORTCONFIG_H
