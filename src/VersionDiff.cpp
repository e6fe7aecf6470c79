// src/VersionDiff.cpp

#include "VersionDiff.h"
#include "tools.h"

#include <algorithm>
#include <vector>

namespace pkgreport {

    namespace {
        // Runs of non-separator bytes, each separator byte is a block of its own
        std::vector<std::string_view> splitBlocks(std::string_view v) {
            std::vector<std::string_view> blocks;
            size_t start = 0;
            for (size_t i = 0; i < v.size(); ++i) {
                if (!isVersionSeparator(v[i])) continue;
                if (i > start) blocks.push_back(v.substr(start, i - start));
                blocks.push_back(v.substr(i, 1));
                start = i + 1;
            }
            if (start < v.size()) blocks.push_back(v.substr(start));
            return blocks;
        }

        int countSegments(const std::vector<std::string_view>& blocks, size_t from) {
            int n = 0;
            for (size_t i = from; i < blocks.size(); ++i) {
                if (!(blocks[i].size() == 1 && isVersionSeparator(blocks[i][0]))) ++n;
            }
            return n;
        }
    }

    bool isVersionSeparator(char c) {
        switch (c) {
            case '.': case '-': case ':': case '+': case '_': case '~':
                return true;
            default:
                return false;
        }
    }

    CommonVersion commonPrefix(std::string_view a, std::string_view b) {
        if (a == b) return {std::string(a), 0};
        if (a.empty() || b.empty() || !Tools::isValidUtf8(a) || !Tools::isValidUtf8(b))
            return {"", kMaxDiffWeight};

        const auto blocksA = splitBlocks(a);
        const auto blocksB = splitBlocks(b);

        CommonVersion result;
        size_t i = 0;
        while (i < blocksA.size() && i < blocksB.size() && blocksA[i] == blocksB[i]) {
            result.shared += blocksA[i];
            ++i;
        }
        const int differing = std::max(countSegments(blocksA, i), countSegments(blocksB, i));
        result.weight = std::clamp(differing, 1, kMaxDiffWeight);
        return result;
    }

    std::string versionSuffix(std::string_view full, std::string_view shared) {
        if (full.substr(0, shared.size()) != shared) return std::string(full);
        return std::string(full.substr(shared.size()));
    }

} // namespace pkgreport
