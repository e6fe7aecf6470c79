// src/Database.cpp
#include "Database.h"
#include <iostream>
#include <utility>

namespace pkgreport {

    Database::Database(std::string path)
      : db_(nullptr), path_(std::move(path)) {}

    Database::~Database() {
        if (db_) sqlite3_close(db_);
    }

    bool Database::open() {
        if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
            std::cerr << "\033[31merror:\033[0m cannot open database '" << path_ << "': "
                      << (db_ ? sqlite3_errmsg(db_) : "out of memory") << "\n";
            return false;
        }
        return true;
    }

    bool Database::initSchema() const {
        const auto sql = R"(
        CREATE TABLE IF NOT EXISTS packages (
          name    TEXT PRIMARY KEY,
          version TEXT NOT NULL,
          arch    TEXT NOT NULL
        );
        )";
        char* err = nullptr;
        const bool ok = sqlite3_exec(db_, sql, nullptr, nullptr, &err) == SQLITE_OK;
        if (!ok) {
            std::cerr << "DB schema error: " << (err ? err : "unknown") << "\n";
            sqlite3_free(err);
        }
        return ok;
    }

    bool Database::prepare(const char* sql, sqlite3_stmt** stmt) const {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) == SQLITE_OK)
            return true;
        std::cerr << "DB error: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }

    bool Database::addPackage(const InstalledPackage& pkg) const {
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("INSERT OR REPLACE INTO packages(name,version,arch) VALUES(?,?,?);", &stmt))
            return false;
        sqlite3_bind_text(stmt, 1, pkg.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, pkg.version.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, pkg.arch.c_str(), -1, SQLITE_TRANSIENT);
        const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::removePackage(const std::string& name) const {
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("DELETE FROM packages WHERE name = ?;", &stmt))
            return false;
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::getPackageVersion(const std::string& name, std::string& version) const {
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("SELECT version FROM packages WHERE name = ?;", &stmt))
            return false;
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        bool found = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            if (const auto txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0))) {
                version = txt;
                found = true;
            }
        }
        sqlite3_finalize(stmt);
        return found;
    }

    std::vector<InstalledPackage> Database::listPackages() const {
        std::vector<InstalledPackage> out;
        sqlite3_stmt* stmt = nullptr;
        if (!prepare("SELECT name, version, arch FROM packages ORDER BY name;", &stmt))
            return out;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            // rows without a name cannot be looked up, skip them
            const auto name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (!name) continue;
            InstalledPackage p;
            p.name = name;
            if (const auto txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)))
                p.version = txt;
            if (const auto txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)))
                p.arch = txt;
            out.push_back(std::move(p));
        }
        sqlite3_finalize(stmt);
        return out;
    }

    std::map<std::string, std::string> Database::installedVersions() const {
        std::map<std::string, std::string> out;
        for (auto& p : listPackages())
            out.emplace(std::move(p.name), std::move(p.version));
        return out;
    }

} // namespace pkgreport
