// src/YamlParser.cpp

#include "YamlParser.h"
#include "SysupgradeReport.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace pkgreport {

namespace {

bool readFile(const std::string& path, std::string& content) {
    if (!fs::exists(path)) {
        std::cerr << "\033[31merror:\033[0m file not found at '" << path << "'\n";
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        std::cerr << "\033[31merror:\033[0m failed to open '" << path << "' for reading\n";
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return true;
}

bool loadRoot(const std::string& content, YAML::Node& root) {
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        std::cerr << "\033[31merror:\033[0m YAML parse failed: " << e.what() << "\n";
        return false;
    }
    if (root.IsNull()) return true;
    if (!root.IsMap()) {
        std::cerr << "\033[31merror:\033[0m expected a mapping at the document root\n";
        return false;
    }
    return true;
}

void readList(const YAML::Node& node, const char* key, std::vector<std::string>& dst) {
    if (node[key] && node[key].IsSequence()) {
        for (const auto& item : node[key]) {
            dst.push_back(item.as<std::string>());
        }
    }
}

std::string readString(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) return "";
    return node[key].as<std::string>();
}

Origin readOrigin(const YAML::Node& node) {
    const std::string repo = readString(node, "repository");
    if (repo.empty()) return AurOrigin{};
    return RepoOrigin{repo};
}

InstallInfo readInstallInfo(const YAML::Node& node) {
    InstallInfo info;
    info.name           = node["name"].as<std::string>();
    info.currentVersion = readString(node, "current_version");
    info.newVersion     = readString(node, "new_version");
    info.origin         = readOrigin(node);
    info.description    = readString(node, "description");

    readList(node, "required_by", info.requiredBy);
    readList(node, "provided_by", info.providedBy);
    readList(node, "members_of",  info.memberOf);
    readList(node, "replaces",    info.replaces);

    if (node["devel_pkg_age_days"] && !node["devel_pkg_age_days"].IsNull())
        info.develPkgAgeDays = node["devel_pkg_age_days"].as<int>();
    return info;
}

SearchRecord readSearchRecord(const YAML::Node& node) {
    SearchRecord rec;
    rec.name        = node["name"].as<std::string>();
    rec.version     = readString(node, "version");
    rec.description = readString(node, "description");
    rec.origin      = readOrigin(node);

    std::vector<std::string> groups;
    readList(node, "groups", groups);
    rec.groups.insert(groups.begin(), groups.end());

    if (node["num_votes"] && !node["num_votes"].IsNull())
        rec.numVotes = node["num_votes"].as<int>();
    if (node["popularity"] && !node["popularity"].IsNull())
        rec.popularity = node["popularity"].as<double>();
    if (node["out_of_date"] && !node["out_of_date"].IsNull())
        rec.outOfDateTimestamp = node["out_of_date"].as<int64_t>();
    return rec;
}

} // namespace

const char* YamlParser::categoryKey(CategoryTag tag) {
    switch (tag) {
        case CategoryTag::RepoReplacement:       return "repo_replacements";
        case CategoryTag::ThirdpartyReplacement: return "thirdparty_replacements";
        case CategoryTag::RepoUpdate:            return "repo_updates";
        case CategoryTag::RepoNewDep:            return "repo_new_deps";
        case CategoryTag::ThirdpartyUpdate:      return "thirdparty_updates";
        case CategoryTag::ThirdpartyNewDep:      return "thirdparty_new_deps";
        case CategoryTag::AurUpdate:             return "aur_updates";
        case CategoryTag::AurNewDep:             return "aur_new_deps";
    }
    return "";
}

bool YamlParser::parseUpgradesFromString(const std::string& content, std::vector<Category>& out) {
    YAML::Node root;
    if (!loadRoot(content, root)) return false;

    const YAML::Node doc = root;
    std::vector<Category> parsed;
    try {
        for (const auto tag : kCategoryOrder) {
            const auto node = doc[categoryKey(tag)];
            if (!node || !node.IsSequence()) continue;

            Category category{tag, {}};
            for (const auto& item : node)
                category.records.push_back(readInstallInfo(item));
            parsed.push_back(std::move(category));
        }
    }
    catch (const YAML::Exception& e) {
        std::cerr << "\033[31merror:\033[0m invalid upgrade record: " << e.what() << "\n";
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool YamlParser::parseUpgrades(const std::string& path, std::vector<Category>& out) {
    std::string content;
    if (!readFile(path, content)) return false;
    return parseUpgradesFromString(content, out);
}

bool YamlParser::parseSearchResultsFromString(const std::string& content,
                                              std::vector<SearchRecord>& out,
                                              std::map<std::string, std::string>& installed) {
    YAML::Node root;
    if (!loadRoot(content, root)) return false;

    std::vector<SearchRecord> records;
    std::map<std::string, std::string> versions;
    const YAML::Node doc = root;
    try {
        if (const auto results = doc["results"]; results && results.IsSequence()) {
            for (const auto& item : results)
                records.push_back(readSearchRecord(item));
        }
        if (const auto inst = doc["installed"]; inst && inst.IsMap()) {
            for (const auto& kv : inst)
                versions[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    catch (const YAML::Exception& e) {
        std::cerr << "\033[31merror:\033[0m invalid search record: " << e.what() << "\n";
        return false;
    }

    out = std::move(records);
    installed = std::move(versions);
    return true;
}

bool YamlParser::parseSearchResults(const std::string& path,
                                    std::vector<SearchRecord>& out,
                                    std::map<std::string, std::string>& installed) {
    std::string content;
    if (!readFile(path, content)) return false;
    return parseSearchResultsFromString(content, out, installed);
}

} // namespace pkgreport
