#ifndef MCLI_UTILS_HPP
#define MCLI_UTILS_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcli::utils {

// Single-row edit distance (insert, delete, substitute all cost 1).
inline std::size_t levenshteinDistance(std::string_view from, std::string_view to) {
    if (from.size() < to.size()) std::swap(from, to);
    if (to.empty()) return from.size();

    std::vector<std::size_t> row(to.size() + 1);
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = j;

    for (std::size_t i = 0; i < from.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i + 1;
        for (std::size_t j = 0; j < to.size(); ++j) {
            const std::size_t above = row[j + 1];
            const std::size_t substitute = diagonal + (from[i] == to[j] ? 0 : 1);
            row[j + 1] = std::min({above + 1, row[j] + 1, substitute});
            diagonal = above;
        }
    }
    return row.back();
}

// Candidates starting with `input` score 0, the rest score their edit distance.
// Only scores up to maxDistance are kept, ordered by score, then alphabetically.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxResults = 3,
                                        std::size_t maxDistance = 2) {
    std::vector<std::pair<std::size_t, std::string_view>> ranked;
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        const std::string_view candidate(c);
        const auto score = candidate.substr(0, input.size()) == input ? 0 : levenshteinDistance(input, candidate);
        if (score <= maxDistance) ranked.emplace_back(score, candidate);
    }
    std::sort(ranked.begin(), ranked.end());
    ranked.erase(std::unique(ranked.begin(), ranked.end()), ranked.end());
    if (ranked.size() > maxResults) ranked.resize(maxResults);

    std::vector<std::string> out;
    out.reserve(ranked.size());
    for (const auto& entry : ranked) out.emplace_back(entry.second);
    return out;
}

// CLI style (create-new) to identifier style (create_new).
inline std::string toIdentifier(std::string name) {
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

// Identifier style back to the spelling a user types: -x or --create-new.
inline std::string toCliName(std::string name) {
    std::replace(name.begin(), name.end(), '_', '-');
    return (name.size() == 1 ? "-" : "--") + name;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep = ", ") {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace mcli::utils

#endif // MCLI_UTILS_HPP
