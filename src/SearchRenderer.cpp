// src/SearchRenderer.cpp

#include "SearchRenderer.h"
#include "tools.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <utility>

namespace pkgreport {

    namespace {
        struct RelevanceVisitor {
            const SearchRecord& record;

            double operator()(const AurOrigin&) const {
                if (!record.numVotes || !record.popularity || !std::isfinite(*record.popularity))
                    return 1.0;
                return (static_cast<double>(*record.numVotes) + 1.0) * (*record.popularity + 1.0);
            }
            double operator()(const RepoOrigin&) const { return 1.0; }
        };

        struct OriginLabel {
            const TextStyle& text;

            std::string operator()(const RepoOrigin& repo) const {
                return text.decorate(repo.name + "/", repoColor(repo.name));
            }
            std::string operator()(const AurOrigin&) const {
                return text.decorate("aur/", kAurColor);
            }
        };
    }

    double relevanceKey(const SearchRecord& record) {
        return std::visit(RelevanceVisitor{record}, record.origin);
    }

    std::string formatOutOfDate(int64_t timestamp) {
        time_t t = static_cast<time_t>(timestamp);
        struct tm tm{};
        char buf[32];
        if (!localtime_r(&t, &tm) || strftime(buf, sizeof(buf), "%Y/%m/%d", &tm) == 0)
            return std::to_string(timestamp);
        return buf;
    }

    SearchLines::SearchLines(std::vector<SearchRecord> records,
                             std::map<std::string, std::string> installed,
                             SearchOptions options, VersionColors colors,
                             const TextStyle& text, const Translator& i18n)
      : records_(std::move(records))
      , installed_(std::move(installed))
      , options_(options)
      , colors_(colors)
      , text_(text)
      , i18n_(i18n) {}

    std::string SearchLines::headerLine(const SearchRecord& record, size_t position) const {
        std::string idx;
        if (options_.enumerated)
            idx = text_.bold(std::to_string(position + options_.enumerateFrom) + ") ");

        const std::string origin = std::visit(OriginLabel{text_}, record.origin);

        std::string groups;
        if (!record.groups.empty()) {
            const std::vector<std::string> names(record.groups.begin(), record.groups.end());
            groups = text_.decorate("(" + Tools::join(names, " ") + ") ", kGroupColor);
        }

        std::string installed;
        if (auto it = installed_.find(record.name); it != installed_.end()) {
            if (it->second != record.version) {
                installed = text_.decorate(
                    Tools::replaceAll(i18n_.translate("[installed: {version}]"), "{version}", it->second) + " ",
                    kInstalledColor);
            } else {
                installed = text_.decorate(i18n_.translate("[installed]") + " ", kInstalledColor);
            }
        }

        std::string rating;
        if (isAur(record.origin) && record.numVotes && record.popularity) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "(%d, %.2f)", *record.numVotes, *record.popularity);
            rating = text_.decorate(buf, kRatingColor);
        }

        int versionColor = colors_.version;
        std::string version = record.version;
        if (record.outOfDateTimestamp) {
            versionColor = colors_.diffOld;
            version += " [" + i18n_.translate("outofdate") + ": "
                     + formatOutOfDate(*record.outOfDateTimestamp) + "]";
        }

        return idx + origin + text_.bold(record.name) + " "
             + text_.decorate(version, versionColor) + " "
             + groups + installed + rating;
    }

    bool SearchLines::next(std::string& line) {
        if (descriptionPending_) {
            descriptionPending_ = false;
            line = Tools::formatParagraph(records_[position_ - 1].description, options_.terminalWidth);
            return true;
        }
        if (position_ >= records_.size()) return false;

        const SearchRecord& record = records_[position_];
        if (options_.quiet) {
            line = record.name;
        } else {
            line = headerLine(record, position_);
            descriptionPending_ = true;
        }
        ++position_;
        return true;
    }

    SearchResultRenderer::SearchResultRenderer(const ReportConfig& config, const TextStyle& text,
                                               const Translator& i18n)
      : config_(config), text_(text), i18n_(i18n) {}

    SearchLines SearchResultRenderer::render(std::vector<SearchRecord> records,
                                             std::map<std::string, std::string> installedVersions,
                                             const SearchOptions& options) const {
        std::stable_sort(records.begin(), records.end(),
            [](const SearchRecord& a, const SearchRecord& b) {
                return relevanceKey(a) > relevanceKey(b);
            });
        return SearchLines(std::move(records), std::move(installedVersions),
                           options, config_.colors, text_, i18n_);
    }

} // namespace pkgreport
