// include/YamlParser.h

#ifndef YAMLPARSER_H
#define YAMLPARSER_H

#include <map>
#include <string>
#include <vector>
#include "Package.h"

namespace pkgreport {

    class YamlParser {
    public:
        /// Category lists keyed repo_updates, aur_new_deps, ...; unknown keys are ignored.
        static bool parseUpgrades(const std::string& yamlPath, std::vector<Category>& out);
        static bool parseUpgradesFromString(const std::string& content, std::vector<Category>& out);

        /// `results:` sequence plus optional `installed:` name -> version map.
        static bool parseSearchResults(const std::string& yamlPath,
                                       std::vector<SearchRecord>& out,
                                       std::map<std::string, std::string>& installed);
        static bool parseSearchResultsFromString(const std::string& content,
                                                 std::vector<SearchRecord>& out,
                                                 std::map<std::string, std::string>& installed);

        /// YAML key for a category, e.g. "thirdparty_new_deps".
        static const char* categoryKey(CategoryTag tag);
    };

} // namespace pkgreport

#endif //YAMLPARSER_H
