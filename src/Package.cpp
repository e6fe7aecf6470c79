// src/Package.cpp

#include "Package.h"

namespace pkgreport {

    namespace {
        struct RepositoryNameVisitor {
            std::string operator()(const RepoOrigin& repo) const { return repo.name; }
            std::string operator()(const AurOrigin&) const { return ""; }
        };
    }

    std::string repositoryName(const Origin& origin) {
        return std::visit(RepositoryNameVisitor{}, origin);
    }

    bool isAur(const Origin& origin) {
        return std::holds_alternative<AurOrigin>(origin);
    }

} // namespace pkgreport
