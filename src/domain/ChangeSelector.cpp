/**
 * @file ChangeSelector.cpp
 * @brief Implementation of ChangeSelector.
 */

#include "domain/ChangeSelector.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace chlog::domain {

std::string ChangeSelector::ToLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    return lower;
}

std::vector<ChangeCandidate> ChangeSelector::Select(const PendingChangeSet& changes, const RemovalQuery& query) {
    std::vector<ChangeCandidate> matches;
    const std::string needle = query.pattern ? ToLower(*query.pattern) : std::string();

    for (auto& candidate : changes.flatten()) {
        if (query.category && candidate.category != *query.category) continue;
        if (query.index && static_cast<long long>(candidate.globalIndex) != *query.index) continue;
        if (query.pattern && ToLower(candidate.entry.description).find(needle) == std::string::npos) continue;
        matches.push_back(std::move(candidate));
    }
    return matches;
}

std::vector<std::size_t> ChangeSelector::ParsePicks(const std::string& input, std::size_t count) {
    std::vector<std::size_t> picks;
    std::stringstream ss(input);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t\r\n") + 1);
        if (token.empty() || token.size() > 9) continue;
        if (!std::all_of(token.begin(), token.end(), [](unsigned char c){ return std::isdigit(c); })) continue;

        std::size_t number = static_cast<std::size_t>(std::stoul(token));
        if (number >= 1 && number <= count) {
            picks.push_back(number - 1);
        }
    }
    std::sort(picks.begin(), picks.end());
    picks.erase(std::unique(picks.begin(), picks.end()), picks.end());
    return picks;
}

} // namespace chlog::domain
