// src/LineTemplate.cpp

#include "LineTemplate.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace pkgreport {

    bool LineTemplate::isKnownPlaceholder(const std::string& name) {
        static const std::array<const char*, 6> known = {
            "pkgName", "currentVersion", "newVersion",
            "versionSeparator", "daysOld", "repository",
        };
        return std::any_of(known.begin(), known.end(),
                           [&](const char* k) { return name == k; });
    }

    LineTemplate LineTemplate::parse(const std::string& format) {
        LineTemplate tmpl;
        tmpl.format_ = format;

        std::string literal;
        size_t i = 0;
        while (i < format.size()) {
            if (format[i] != '{') {
                literal += format[i++];
                continue;
            }
            const auto close = format.find('}', i + 1);
            if (close == std::string::npos)
                throw std::invalid_argument("unterminated placeholder in template '" + format + "'");

            std::string name = format.substr(i + 1, close - i - 1);
            if (!isKnownPlaceholder(name))
                throw std::invalid_argument("unknown placeholder '{" + name + "}' in template");

            if (!literal.empty()) {
                tmpl.segments_.push_back({false, literal});
                literal.clear();
            }
            tmpl.segments_.push_back({true, std::move(name)});
            i = close + 1;
        }
        if (!literal.empty())
            tmpl.segments_.push_back({false, literal});
        return tmpl;
    }

    std::string LineTemplate::render(const std::map<std::string, std::string>& values) const {
        std::string out;
        for (const auto& seg : segments_) {
            if (!seg.placeholder) {
                out += seg.text;
            } else if (auto it = values.find(seg.text); it != values.end()) {
                out += it->second;
            }
        }
        return out;
    }

} // namespace pkgreport
