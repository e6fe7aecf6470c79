// src/ReportConfig.cpp

#include "ReportConfig.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace pkgreport {

    namespace {
        bool apply(const YAML::Node& root, ReportConfig& cfg) {
            if (!root || root.IsNull()) return true;
            if (!root.IsMap()) {
                std::cerr << "\033[31merror:\033[0m config root must be a mapping\n";
                return false;
            }
            try {
                if (const auto sync = root["sync"]) {
                    if (sync["UpgradeSorting"])
                        cfg.sortMode = parseSortMode(sync["UpgradeSorting"].as<std::string>());
                    if (sync["AlwaysShowPkgOrigin"])
                        cfg.alwaysShowPkgOrigin = sync["AlwaysShowPkgOrigin"].as<bool>();
                }
                if (const auto colors = root["colors"]) {
                    if (colors["Version"])
                        cfg.colors.version = colors["Version"].as<int>();
                    if (colors["VersionDiffOld"])
                        cfg.colors.diffOld = colors["VersionDiffOld"].as<int>();
                    if (colors["VersionDiffNew"])
                        cfg.colors.diffNew = colors["VersionDiffNew"].as<int>();
                }
            }
            catch (const YAML::Exception& e) {
                std::cerr << "\033[31merror:\033[0m invalid config value: " << e.what() << "\n";
                return false;
            }
            return true;
        }
    }

    SortMode parseSortMode(const std::string& value) {
        if (value == "pkgname") return SortMode::Name;
        if (value == "repo") return SortMode::Repo;
        return SortMode::DiffWeight;
    }

    bool ReportConfig::loadFromString(const std::string& content) {
        YAML::Node root;
        try {
            root = YAML::Load(content);
        } catch (const YAML::Exception& e) {
            std::cerr << "\033[31merror:\033[0m failed to parse config: " << e.what() << "\n";
            return false;
        }
        // *this only changes on success
        ReportConfig parsed = *this;
        if (!apply(root, parsed)) return false;
        *this = parsed;
        return true;
    }

    bool ReportConfig::load(const std::string& path) {
        if (!fs::exists(path)) return true;

        std::ifstream in(path);
        if (!in) {
            std::cerr << "\033[31merror:\033[0m cannot open config '" << path << "'\n";
            return false;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return loadFromString(buffer.str());
    }

    std::string ReportConfig::defaultPath() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
            return (fs::path(xdg) / "pkgreport" / "config.yaml").string();
        if (const char* home = std::getenv("HOME"); home && *home)
            return (fs::path(home) / ".config" / "pkgreport" / "config.yaml").string();
        return "pkgreport.yaml";
    }

} // namespace pkgreport
