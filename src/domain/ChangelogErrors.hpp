/**
 * @file ChangelogErrors.hpp
 * @brief Exception taxonomy for changelog operations.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chlog::domain {

/**
 * @class ChangelogError
 * @brief Base for every error the tool reports to the user as an expected outcome.
 */
class ChangelogError : public std::runtime_error {
public:
    explicit ChangelogError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A config or pending-store file could not be parsed. Recovered by reinitialization. */
class ConfigCorruptError : public ChangelogError {
public:
    explicit ConfigCorruptError(const std::string& message) : ChangelogError(message) {}
};

/** @brief A path, setting, project field or section key does not exist. */
class UnknownKeyError : public ChangelogError {
public:
    explicit UnknownKeyError(const std::string& message) : ChangelogError(message) {}
};

/** @brief A value was rejected (empty description, wrong-typed setting). */
class InvalidValueError : public ChangelogError {
public:
    explicit InvalidValueError(const std::string& message) : ChangelogError(message) {}
};

/** @brief The category is not one of the six fixed ones. */
class InvalidCategoryError : public ChangelogError {
public:
    explicit InvalidCategoryError(const std::string& message) : ChangelogError(message) {}
};

/** @brief A release was requested while nothing is pending. */
class NoPendingChangesError : public ChangelogError {
public:
    explicit NoPendingChangesError(const std::string& message) : ChangelogError(message) {}
};

/** @brief Removal filters matched no entry. */
class NoMatchError : public ChangelogError {
public:
    explicit NoMatchError(const std::string& message) : ChangelogError(message) {}
};

/** @brief A release record for the version is already on disk. */
class ReleaseExistsError : public ChangelogError {
public:
    explicit ReleaseExistsError(const std::string& message) : ChangelogError(message) {}
};

/** @brief The version-control tool is missing or failed. Callers downgrade it to a warning. */
class VcsTagError : public ChangelogError {
public:
    explicit VcsTagError(const std::string& message) : ChangelogError(message) {}
};

} // namespace chlog::domain
