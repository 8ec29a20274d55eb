/**
 * @file RemovalPrompt.hpp
 * @brief Boundary for the interactive confirmation step of a removal.
 */

#pragma once

#include <vector>
#include "domain/PendingChangeSet.hpp"

namespace chlog::application {

/**
 * @struct RemovalDecision
 * @brief The user's answer when several entries match.
 */
struct RemovalDecision {
    enum class Kind { All, Subset, Abort };

    Kind kind = Kind::Abort;
    std::vector<std::size_t> picks; ///< 0-based positions into the candidate list (Subset only).
};

/**
 * @class RemovalPrompt
 * @brief Asks the user to confirm removals. Implemented by the console in the app layer.
 */
class RemovalPrompt {
public:
    virtual ~RemovalPrompt() = default;

    /** @brief Exactly one match: true removes it. */
    virtual bool confirmSingle(const domain::ChangeCandidate& candidate) = 0;

    /** @brief Several matches: all, a subset, or abort. */
    virtual RemovalDecision chooseMany(const std::vector<domain::ChangeCandidate>& candidates) = 0;
};

} // namespace chlog::application
