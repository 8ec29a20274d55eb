/**
 * @file ChangelogRenderer.hpp
 * @brief Text rendering of pending changes, statistics and changelog release sections.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/PendingChangeSet.hpp"

namespace chlog::application {

/**
 * @enum OutputFormat
 * @brief Display modes for the pending changes.
 */
enum class OutputFormat {
    Pretty,   ///< Numbered console listing.
    Json,     ///< The stored document, verbatim.
    Markdown  ///< Keep-a-Changelog bullet list.
};

std::optional<OutputFormat> OutputFormatFromString(const std::string& name);

/**
 * @struct ChangeStats
 * @brief Aggregated counts over the pending changes.
 */
struct ChangeStats {
    std::vector<std::pair<domain::ChangeCategory, std::size_t>> perCategory; ///< Non-zero categories, in enum order.
    std::size_t total = 0;
    std::vector<std::pair<std::string, std::size_t>> perAuthor; ///< Sorted by count, descending.
};

class ChangelogRenderer {
public:
    static constexpr const char* kUnreleasedMarker = "## [Unreleased]";

    /**
     * @brief Renders the pending changes in the requested mode.
     */
    static std::string RenderPending(const domain::PendingChangeSet& changes, OutputFormat format);

    static std::string ToPretty(const domain::PendingChangeSet& changes);
    static std::string ToMarkdown(const domain::PendingChangeSet& changes);
    static std::string ToStructured(const domain::PendingChangeSet& changes);

    static std::string RenderStats(const ChangeStats& stats);

    /**
     * @brief Starting document written by init.
     */
    static std::string InitialDocument(const std::string& projectName);

    /**
     * @brief Document assumed when a release finds no changelog on disk.
     */
    static std::string FallbackDocument();

    /**
     * @brief Renders one release section.
     *
     * Layout: a "## [version] - date" heading, the optional notes paragraph,
     * then one "### Category" list per non-empty category in enum order.
     */
    static std::string ReleaseBlock(const std::string& version,
                                    const std::string& date,
                                    const std::string& notes,
                                    const domain::PendingChangeSet::CategoryMap& changes);

    /**
     * @brief Inserts @p block right after the first Unreleased marker line,
     *        or appends it when the document has no marker.
     */
    static std::string InsertRelease(const std::string& document, const std::string& block);
};

} // namespace chlog::application
