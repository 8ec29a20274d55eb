/**
 * @file PendingChangeSet.hpp
 * @brief Aggregate holding every change entry that has not been released yet.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "ChangeCategory.hpp"
#include "ChangeEntry.hpp"

namespace chlog::domain {

/**
 * @struct ChangeCandidate
 * @brief A located entry: its category, its position in that list and its global index.
 */
struct ChangeCandidate {
    ChangeCategory category;
    std::size_t position;    ///< 0-based index inside the category list.
    std::size_t globalIndex; ///< 1-based index across all categories.
    ChangeEntry entry;
};

/**
 * @class PendingChangeSet
 * @brief The unreleased changes document.
 *
 * The set of category keys is explicit: a freshly reset set carries all six
 * categories (empty), while a category emptied by removal is dropped.
 * The total count is recomputed after every mutation.
 */
class PendingChangeSet {
public:
    using CategoryMap = std::map<ChangeCategory, std::vector<ChangeEntry>>;

    PendingChangeSet() = default;

    /**
     * @brief Creates the empty document written by init and after a release.
     * @param project Project name stored in the document.
     * @param timestamp Used for both created and last_modified.
     */
    static PendingChangeSet CreateEmpty(const std::string& project, const std::string& timestamp);

    const std::string& getProject() const { return m_project; }
    const std::string& getCreated() const { return m_created; }
    const std::string& getLastModified() const { return m_lastModified; }
    const CategoryMap& getChanges() const { return m_changes; }
    std::size_t getTotalChanges() const { return m_totalChanges; }
    bool isEmpty() const { return m_totalChanges == 0; }

    void setProject(const std::string& project) { m_project = project; }
    void setCreated(const std::string& created) { m_created = created; }
    void setLastModified(const std::string& lastModified) { m_lastModified = lastModified; }

    /** @brief True when the category key is present (even with no entries). */
    bool hasCategory(ChangeCategory category) const;

    /** @brief Entries of a category; empty when the key is absent. */
    const std::vector<ChangeEntry>& entriesOf(ChangeCategory category) const;

    /** @brief Ensures the key exists without adding entries. Used when loading files. */
    void declareCategory(ChangeCategory category);

    /** @brief Appends an entry to the category, creating the key if needed. */
    const ChangeEntry& append(ChangeCategory category, ChangeEntry entry);

    /** @brief True if any entry carries this id. */
    bool containsId(const std::string& id) const;

    /**
     * @brief Lists every entry in global order (categories in enum order).
     */
    std::vector<ChangeCandidate> flatten() const;

    /**
     * @brief Removes the given entries.
     *
     * Entries are deleted per category from the highest position down, so
     * positions of the remaining targets stay valid. Categories left empty
     * are dropped from the key set.
     * @return Number of entries removed.
     */
    std::size_t removeEntries(const std::vector<ChangeCandidate>& targets);

private:
    void recount();

    std::string m_project;
    std::string m_created;
    std::string m_lastModified;
    CategoryMap m_changes;
    std::size_t m_totalChanges = 0;
};

} // namespace chlog::domain
