// include/Package.h

#ifndef PACKAGE_H
#define PACKAGE_H

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace pkgreport {

    /// Package comes from a configured repository.
    struct RepoOrigin {
        std::string name;
    };

    /// Package comes from the AUR (no repository metadata).
    struct AurOrigin {};

    using Origin = std::variant<RepoOrigin, AurOrigin>;

    /// Repository name, or "" for AUR packages.
    std::string repositoryName(const Origin& origin);
    bool isAur(const Origin& origin);

    /// One package's pending version change.
    struct InstallInfo {
        std::string name;
        std::string currentVersion;
        std::string newVersion;
        Origin origin = AurOrigin{};
        std::vector<std::string> requiredBy;
        std::vector<std::string> providedBy;
        std::vector<std::string> memberOf;
        std::vector<std::string> replaces;
        std::string description;
        std::optional<int> develPkgAgeDays;
    };

    /// One search hit, from a repository or the AUR.
    struct SearchRecord {
        std::string name, version, description;
        Origin origin = AurOrigin{};
        std::set<std::string> groups;
        std::optional<int> numVotes;
        std::optional<double> popularity;
        std::optional<int64_t> outOfDateTimestamp;
    };

    enum class CategoryTag {
        RepoReplacement,
        ThirdpartyReplacement,
        RepoUpdate,
        RepoNewDep,
        ThirdpartyUpdate,
        ThirdpartyNewDep,
        AurUpdate,
        AurNewDep,
    };

    struct Category {
        CategoryTag tag;
        std::vector<InstallInfo> records;
    };

} // namespace pkgreport

#endif //PACKAGE_H
