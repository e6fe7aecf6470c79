// include/VersionDiff.h

#ifndef VERSIONDIFF_H
#define VERSIONDIFF_H

#include <string>
#include <string_view>

namespace pkgreport {

    /// Weight reported when nothing can be shared (empty or malformed input).
    constexpr int kMaxDiffWeight = 9999;

    struct CommonVersion {
        std::string shared;
        int weight = 0;
    };

    bool isVersionSeparator(char c);

    /// Longest common prefix of two versions at delimiter granularity:
    /// "1.2.3" vs "1.2.4" shares "1.2.", "1.2.3" vs "1.3.0" shares "1.".
    /// `weight` counts the segments from the first mismatch onward and is
    /// 0 only for identical strings.
    CommonVersion commonPrefix(std::string_view a, std::string_view b);

    /// `full` without its `shared` prefix.
    std::string versionSuffix(std::string_view full, std::string_view shared);

} // namespace pkgreport

#endif //VERSIONDIFF_H
