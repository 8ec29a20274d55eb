#pragma once

#include <string>
#include "domain/VcsTagger.hpp"

namespace chlog::infrastructure {

/**
 * @class GitTagger
 * @brief Runs `git tag -a` in the project root.
 */
class GitTagger : public domain::VcsTagger {
public:
    /**
     * @param workingDir Directory the git command runs in.
     * @param gitPath Executable to invoke.
     */
    explicit GitTagger(std::string workingDir, std::string gitPath = "git");

    void createTag(const std::string& tag, const std::string& message) override;

    /// Single-quotes an argument for a POSIX shell (double quotes on Windows).
    static std::string QuoteArgument(const std::string& arg);

private:
    std::string m_workingDir;
    std::string m_gitPath;
};

} // namespace chlog::infrastructure
