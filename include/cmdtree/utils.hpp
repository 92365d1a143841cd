#ifndef CMDTREE_UTILS_HPP
#define CMDTREE_UTILS_HPP

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace cmdtree::utils {

// Edit distance (insert, delete, substitute) using a single rolling row.
inline std::size_t editDistance(std::string_view from, std::string_view to) {
    if (from.size() < to.size()) std::swap(from, to);
    std::vector<std::size_t> row(to.size() + 1);
    std::iota(row.begin(), row.end(), std::size_t{0});

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

// Near misses for `input` among `known`, closest first. A candidate extending `input`
// counts as distance 0; ties are broken alphabetically.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& known,
                                        std::size_t maxResults = 3,
                                        std::size_t maxDistance = 2) {
    std::vector<std::tuple<std::size_t, std::string>> ranked;
    for (const auto& candidate : known) {
        if (candidate.empty()) continue;
        const bool extends = std::string_view(candidate).substr(0, input.size()) == input;
        const std::size_t distance = extends ? 0 : editDistance(input, candidate);
        if (distance <= maxDistance) ranked.emplace_back(distance, candidate);
    }
    std::sort(ranked.begin(), ranked.end());
    ranked.erase(std::unique(ranked.begin(), ranked.end()), ranked.end());

    std::vector<std::string> result;
    for (auto& entry : ranked) {
        if (result.size() == maxResults) break;
        result.push_back(std::move(std::get<1>(entry)));
    }
    return result;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    if (parts.empty()) return {};
    std::string joined = parts.front();
    for (auto it = parts.begin() + 1; it != parts.end(); ++it) {
        joined.append(sep.data(), sep.size());
        joined += *it;
    }
    return joined;
}

} // namespace cmdtree::utils

#endif // CMDTREE_UTILS_HPP
