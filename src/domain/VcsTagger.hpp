/**
 * @file VcsTagger.hpp
 * @brief Interface for marking a release in version control.
 */

#pragma once

#include <string>

namespace chlog::domain {

/**
 * @class VcsTagger
 * @brief Creates an annotated tag for a released version.
 */
class VcsTagger {
public:
    virtual ~VcsTagger() = default;

    /**
     * @brief Creates the tag.
     * @throws VcsTagError if the tool is missing or the command fails.
     */
    virtual void createTag(const std::string& tag, const std::string& message) = 0;
};

} // namespace chlog::domain
