// include/CLI.h

#ifndef CLI_H
#define CLI_H

#include <string>
#include <vector>

#include "ReportConfig.h"
#include "TextStyle.h"
#include "Translator.h"

namespace pkgreport {
    class CLI {
    public:
        CLI(int argc, char* argv[]);
        /// Parse arguments and dispatch; returns the process exit status.
        int run();
    private:
        int runUpgrades(const std::vector<std::string>& args);
        int runSearch(const std::vector<std::string>& args);
        int runIgnore(const std::vector<std::string>& args);
        int runNotFound(const std::vector<std::string>& args);
        int runUpToDate(const std::vector<std::string>& args);
        int runMarkInstalled(const std::vector<std::string>& args);
        int runUnmarkInstalled(const std::vector<std::string>& args);

        const TextStyle& styleFor(int fd) const;

        int argc_; char** argv_;
        std::string configPath_;
        std::string colorMode_ = "auto";
        std::string dbPath_;
        bool verbose_ = false;
        bool quiet_ = false;
        bool manual_ = false;
        bool enumerate_ = false;
        bool repo_ = false;

        ReportConfig config_;
        GettextTranslator i18n_;
    };
} // namespace pkgreport

#endif //CLI_H
