#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace erp_sync {

/// Keys of entries whose parent chain loops back on itself.
/// @p Entry needs `std::string id` and `std::optional<std::string> parentId`.
/// Parents that are not in @p entries end the chain.
template <typename Entry>
std::vector<std::string> findParentCycles(const std::vector<Entry>& entries) {
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        index.emplace(entries[i].id, i);
    }

    // 0 = unvisited, 1 = on the current path, 2 = known to terminate
    std::vector<int> state(entries.size(), 0);
    std::vector<std::string> cyclic;

    for (std::size_t start = 0; start < entries.size(); ++start) {
        std::vector<std::size_t> path;
        std::size_t current = start;
        bool looped = false;

        while (true) {
            if (state[current] == 1) { looped = true; break; }
            if (state[current] == 2) break;

            state[current] = 1;
            path.push_back(current);

            const auto& parent = entries[current].parentId;
            if (!parent) break;
            auto it = index.find(*parent);
            if (it == index.end()) break;
            current = it->second;
        }

        if (looped) {
            // Walked back onto the path: everything from `current` loops.
            bool inLoop = false;
            for (std::size_t node : path) {
                if (node == current) inLoop = true;
                if (inLoop) cyclic.push_back(entries[node].id);
            }
        }
        for (std::size_t node : path) {
            state[node] = 2;
        }
    }
    return cyclic;
}

} // namespace erp_sync
