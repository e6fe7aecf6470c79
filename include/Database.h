// include/Database.h
#pragma once

#include <map>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace pkgreport {

    struct InstalledPackage {
        std::string name;
        std::string version;
        std::string arch;
    };

    /// Local record of installed versions, the lookup behind the
    /// "[installed]" search markers.
    class Database {
    public:
        explicit Database(std::string path);
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        bool open();
        bool initSchema() const;

        bool addPackage(const InstalledPackage& pkg) const;
        bool removePackage(const std::string& name) const;
        bool getPackageVersion(const std::string& name, std::string& version) const;

        [[nodiscard]] std::vector<InstalledPackage> listPackages() const;
        /// name -> version for every installed package
        [[nodiscard]] std::map<std::string, std::string> installedVersions() const;

    private:
        bool prepare(const char* sql, sqlite3_stmt** stmt) const;

        sqlite3* db_;
        std::string path_;
    };

} // namespace pkgreport
