// include/SearchRenderer.h

#ifndef SEARCHRENDERER_H
#define SEARCHRENDERER_H

#include "Package.h"
#include "ReportConfig.h"
#include "TextStyle.h"
#include "Translator.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pkgreport {

    struct SearchOptions {
        bool quiet = false;
        bool enumerated = false;
        int enumerateFrom = 1;
        int terminalWidth = 80;
    };

    /// (votes + 1) * (popularity + 1) for AUR records with both metrics and a
    /// finite popularity, else 1.
    double relevanceKey(const SearchRecord& record);

    /// "YYYY/MM/DD" in local time, or the raw number when it has no calendar date.
    std::string formatOutOfDate(int64_t timestamp);

    /// Lazily produced output lines. Single pass: once next() returns false
    /// the sequence is exhausted.
    class SearchLines {
    public:
        bool next(std::string& line);

    private:
        friend class SearchResultRenderer;

        SearchLines(std::vector<SearchRecord> records,
                    std::map<std::string, std::string> installed,
                    SearchOptions options, VersionColors colors,
                    const TextStyle& text, const Translator& i18n);

        std::string headerLine(const SearchRecord& record, size_t position) const;

        std::vector<SearchRecord> records_;
        std::map<std::string, std::string> installed_;
        SearchOptions options_;
        VersionColors colors_;
        const TextStyle& text_;
        const Translator& i18n_;

        size_t position_ = 0;
        bool descriptionPending_ = false;
    };

    class SearchResultRenderer {
    public:
        SearchResultRenderer(const ReportConfig& config, const TextStyle& text,
                             const Translator& i18n);

        [[nodiscard]] SearchLines render(std::vector<SearchRecord> records,
                                         std::map<std::string, std::string> installedVersions,
                                         const SearchOptions& options) const;

    private:
        const ReportConfig& config_;
        const TextStyle& text_;
        const Translator& i18n_;
    };

} // namespace pkgreport

#endif //SEARCHRENDERER_H
