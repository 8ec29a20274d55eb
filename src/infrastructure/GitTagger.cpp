#include "infrastructure/GitTagger.hpp"

#include <cstdlib>
#include <sstream>
#include "domain/ChangelogErrors.hpp"

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace chlog::infrastructure {

GitTagger::GitTagger(std::string workingDir, std::string gitPath)
    : m_workingDir(std::move(workingDir))
    , m_gitPath(std::move(gitPath))
{}

std::string GitTagger::QuoteArgument(const std::string& arg) {
#if defined(_WIN32)
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') quoted += '\\';
        quoted += c;
    }
    return quoted + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
#endif
}

void GitTagger::createTag(const std::string& tag, const std::string& message) {
    std::stringstream cmd;
#if defined(_WIN32)
    cmd << "cd /d ";
#else
    cmd << "cd ";
#endif
    cmd << QuoteArgument(m_workingDir) << " && "
        << QuoteArgument(m_gitPath) << " tag -a " << QuoteArgument(tag)
        << " -m " << QuoteArgument(message);
#if defined(_WIN32)
    cmd << " > NUL 2>&1";
#else
    cmd << " > /dev/null 2>&1";
#endif

    int result = std::system(cmd.str().c_str());
    if (result == -1) {
        throw domain::VcsTagError("Could not start a shell to run git");
    }

#if defined(_WIN32)
    int exitCode = result;
#else
    int exitCode = WIFEXITED(result) ? WEXITSTATUS(result) : -1;
    if (exitCode == 127) {
        throw domain::VcsTagError("git not found");
    }
#endif
    if (exitCode != 0) {
        throw domain::VcsTagError("git tag failed with code: " + std::to_string(exitCode));
    }
}

} // namespace chlog::infrastructure
