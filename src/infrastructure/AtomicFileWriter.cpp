/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chlog::infrastructure {

namespace fs = std::filesystem;

void AtomicFileWriter::Write(const fs::path& path, const std::string& content) {
    // filename.<timestamp>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (path.has_parent_path() && !fs::exists(path.parent_path())) {
        fs::create_directories(path.parent_path());
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Cannot open " + tempPath.string() + " for writing");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + path.string());
        }
    }

    try {
        fs::rename(tempPath, path);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw;
    }
}

std::string AtomicFileWriter::Read(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace chlog::infrastructure
