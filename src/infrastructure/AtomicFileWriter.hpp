/**
 * @file AtomicFileWriter.hpp
 * @brief Whole-file writes through a temporary file and a rename.
 */

#pragma once
#include <filesystem>
#include <string>

namespace chlog::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes text files so readers never observe a half-written file.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes @p content to @p path (temp -> rename), creating parent directories.
     * @throws std::runtime_error if the file cannot be written.
     */
    static void Write(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Reads a whole text file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static std::string Read(const std::filesystem::path& path);
};

} // namespace chlog::infrastructure
