// src/CLI.cpp

#include "CLI.h"
#include "Database.h"
#include "Notices.h"
#include "SearchRenderer.h"
#include "SysupgradeReport.h"
#include "Terminal.h"
#include "YamlParser.h"

#include <cxxopts.hpp>
#include <iostream>
#include <unistd.h>

#ifndef PKGREPORT_VERSION
#define PKGREPORT_VERSION "0.1.0"
#endif

namespace pkgreport {

CLI::CLI(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
{}

const TextStyle& CLI::styleFor(int fd) const {
    if (colorMode_ == "always") return TextStyle::ansi();
    if (colorMode_ == "never") return TextStyle::plain();
    return Terminal::isColorCapable(fd) ? TextStyle::ansi() : TextStyle::plain();
}

int CLI::run() {
    // Define global flags
    cxxopts::Options opts("pkgreport", "pkgreport - package upgrade and search report renderer");
    opts.positional_help("<command> [args]");
    opts.allow_unrecognised_options();
    opts.add_options()
        ("c,config",    "Configuration file",                  cxxopts::value<std::string>(configPath_))
        ("color",       "Colorize output: auto, always, never", cxxopts::value<std::string>(colorMode_))
        ("db",          "Installed-package database",           cxxopts::value<std::string>(dbPath_))
        ("v,verbose",   "Show repository and description",      cxxopts::value<bool>(verbose_))
        ("q,quiet",     "Print package names only",             cxxopts::value<bool>(quiet_))
        ("m,manual",    "Manual package selection layout",      cxxopts::value<bool>(manual_))
        ("e,enumerate", "Number search results",                cxxopts::value<bool>(enumerate_))
        ("repo",        "not-found: packages were looked up in repositories", cxxopts::value<bool>(repo_))
        ("version",     "Print version")
        ("h,help",      "Print help");

    // Parse
    auto result = opts.parse(argc_, argv_);
    if (result.count("help")) {
        std::cout << opts.help() << "\n";
        return 0;
    }
    if (result.count("version")) {
        std::cout << "pkgreport v" << PKGREPORT_VERSION << "\n";
        return 0;
    }

    // Extract command + args
    auto unmatched = result.unmatched();
    if (unmatched.empty()) {
        std::cout << opts.help() << "\n";
        return 1;
    }
    std::string cmd = unmatched[0];
    std::vector<std::string> args(unmatched.begin() + 1, unmatched.end());

    if (colorMode_ != "auto" && colorMode_ != "always" && colorMode_ != "never") {
        std::cerr << "\033[31merror:\033[0m invalid --color value '" << colorMode_ << "'\n";
        return 1;
    }
    if (!config_.load(configPath_.empty() ? ReportConfig::defaultPath() : configPath_))
        return 1;

    // Dispatch commands
    if (cmd == "upgrades")       return runUpgrades(args);
    if (cmd == "search")         return runSearch(args);
    if (cmd == "ignore")         return runIgnore(args);
    if (cmd == "not-found")      return runNotFound(args);
    if (cmd == "uptodate")       return runUpToDate(args);
    if (cmd == "mark-installed") return runMarkInstalled(args);
    if (cmd == "unmark-installed") return runUnmarkInstalled(args);

    std::cerr << "\033[31merror:\033[0m Unknown command '" << cmd << "'\n";
    return 1;
}

int CLI::runUpgrades(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "\033[31merror:\033[0m 'upgrades' requires a records file\n";
        return 1;
    }
    std::vector<Category> categories;
    if (!YamlParser::parseUpgrades(args[0], categories)) return 1;

    const SysupgradeReportBuilder builder(config_, styleFor(STDOUT_FILENO), i18n_);
    std::cout << builder.build(categories, manual_, verbose_, Terminal::columns()) << "\n";
    return 0;
}

int CLI::runSearch(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "\033[31merror:\033[0m 'search' requires a results file\n";
        return 1;
    }
    std::vector<SearchRecord> records;
    std::map<std::string, std::string> installed;
    if (!YamlParser::parseSearchResults(args[0], records, installed)) return 1;

    if (!dbPath_.empty()) {
        Database db(dbPath_);
        if (!db.open() || !db.initSchema()) return 1;
        for (auto& [name, version] : db.installedVersions())
            installed[name] = version;
    }

    SearchOptions options;
    options.quiet = quiet_;
    options.enumerated = enumerate_;
    options.terminalWidth = Terminal::columns();

    const SearchResultRenderer renderer(config_, styleFor(STDOUT_FILENO), i18n_);
    auto lines = renderer.render(std::move(records), std::move(installed), options);
    std::string line;
    while (lines.next(line))
        std::cout << line << "\n";
    return 0;
}

int CLI::runIgnore(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "\033[31merror:\033[0m 'ignore' requires a package name\n";
        return 1;
    }
    const std::string current = args.size() > 1 ? args[1] : "";
    const std::string next = args.size() > 2 ? args[2] : "";

    const Notices notices(styleFor(STDERR_FILENO), i18n_);
    std::cerr << notices.ignoredPackage(args[0], current, next) << "\n";
    return 0;
}

int CLI::runNotFound(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "\033[31merror:\033[0m 'not-found' requires at least one package name\n";
        return 1;
    }
    const Notices notices(styleFor(STDERR_FILENO), i18n_);
    std::cerr << notices.notFound(args, repo_, Terminal::columns()) << "\n";
    return 0;
}

int CLI::runUpToDate(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "\033[31merror:\033[0m 'uptodate' requires <name> <version> <source>\n";
        return 1;
    }
    const Notices notices(styleFor(STDERR_FILENO), i18n_);
    std::cerr << notices.upToDate(args[0], args[1], args[2]) << "\n";
    return 0;
}

int CLI::runMarkInstalled(const std::vector<std::string>& args) {
    if (dbPath_.empty()) {
        std::cerr << "\033[31merror:\033[0m 'mark-installed' requires --db\n";
        return 1;
    }
    if (args.size() < 2) {
        std::cerr << "\033[31merror:\033[0m 'mark-installed' requires <name> <version> [arch]\n";
        return 1;
    }

    Database db(dbPath_);
    if (!db.open() || !db.initSchema()) return 1;

    const InstalledPackage pkg{args[0], args[1], args.size() > 2 ? args[2] : "any"};
    if (!db.addPackage(pkg)) {
        std::cerr << "\033[31merror:\033[0m failed to record '" << pkg.name << "'\n";
        return 1;
    }
    std::cout << "\033[32minfo:\033[0m recorded " << pkg.name << " " << pkg.version << "\n";
    return 0;
}

int CLI::runUnmarkInstalled(const std::vector<std::string>& args) {
    if (dbPath_.empty()) {
        std::cerr << "\033[31merror:\033[0m 'unmark-installed' requires --db\n";
        return 1;
    }
    if (args.empty()) {
        std::cerr << "\033[31merror:\033[0m 'unmark-installed' requires at least one package name\n";
        return 1;
    }

    Database db(dbPath_);
    if (!db.open() || !db.initSchema()) return 1;

    int status = 0;
    for (const auto& name : args) {
        std::string version;
        if (!db.getPackageVersion(name, version)) {
            std::cerr << "\033[33mwarning:\033[0m '" << name << "' is not recorded\n";
            continue;
        }
        if (!db.removePackage(name)) {
            std::cerr << "\033[31merror:\033[0m failed to remove '" << name << "'\n";
            status = 1;
            continue;
        }
        std::cout << "\033[32minfo:\033[0m removed " << name << " " << version << "\n";
    }
    return status;
}

} // namespace pkgreport
