/**
 * @file PendingChangeSet.cpp
 * @brief Implementation of PendingChangeSet.
 */

#include "domain/PendingChangeSet.hpp"
#include <algorithm>
#include <functional>

namespace chlog::domain {

PendingChangeSet PendingChangeSet::CreateEmpty(const std::string& project, const std::string& timestamp) {
    PendingChangeSet set;
    set.m_project = project;
    set.m_created = timestamp;
    set.m_lastModified = timestamp;
    for (ChangeCategory category : AllCategories()) {
        set.m_changes[category];
    }
    set.recount();
    return set;
}

bool PendingChangeSet::hasCategory(ChangeCategory category) const {
    return m_changes.find(category) != m_changes.end();
}

const std::vector<ChangeEntry>& PendingChangeSet::entriesOf(ChangeCategory category) const {
    static const std::vector<ChangeEntry> none;
    auto it = m_changes.find(category);
    return it != m_changes.end() ? it->second : none;
}

void PendingChangeSet::declareCategory(ChangeCategory category) {
    m_changes[category];
}

const ChangeEntry& PendingChangeSet::append(ChangeCategory category, ChangeEntry entry) {
    auto& list = m_changes[category];
    list.push_back(std::move(entry));
    recount();
    return list.back();
}

bool PendingChangeSet::containsId(const std::string& id) const {
    for (const auto& [category, entries] : m_changes) {
        for (const auto& entry : entries) {
            if (entry.id == id) return true;
        }
    }
    return false;
}

std::vector<ChangeCandidate> PendingChangeSet::flatten() const {
    std::vector<ChangeCandidate> all;
    std::size_t global = 1;
    for (ChangeCategory category : AllCategories()) {
        const auto& entries = entriesOf(category);
        for (std::size_t i = 0; i < entries.size(); ++i) {
            all.push_back({category, i, global++, entries[i]});
        }
    }
    return all;
}

std::size_t PendingChangeSet::removeEntries(const std::vector<ChangeCandidate>& targets) {
    std::map<ChangeCategory, std::vector<std::size_t>> byCategory;
    for (const auto& target : targets) {
        byCategory[target.category].push_back(target.position);
    }

    std::size_t removed = 0;
    for (auto& [category, positions] : byCategory) {
        auto it = m_changes.find(category);
        if (it == m_changes.end()) continue;

        std::sort(positions.begin(), positions.end(), std::greater<std::size_t>());
        positions.erase(std::unique(positions.begin(), positions.end()), positions.end());

        auto& entries = it->second;
        for (std::size_t pos : positions) {
            if (pos >= entries.size()) continue;
            entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
            ++removed;
        }
        if (entries.empty()) {
            m_changes.erase(it);
        }
    }

    recount();
    return removed;
}

void PendingChangeSet::recount() {
    std::size_t total = 0;
    for (const auto& [category, entries] : m_changes) {
        total += entries.size();
    }
    m_totalChanges = total;
}

} // namespace chlog::domain
