/**
 * @file AtomicFile.h
 * @brief Atomic file replacement (write temp, then rename).
 */

#pragma once

#include <filesystem>
#include <string>

namespace SmsBridge {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute the temp path next to finalPath ("<final>.part").
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Write content to finalPath so readers see either the old or the new
 * file, never a partial one.
 *
 * Creates the parent directory if needed. On failure the temp file is removed
 * and finalPath is left untouched.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg);

/**
 * @brief Read a whole file into a string.
 */
bool readWholeFile(const std::filesystem::path& path,
                   std::string& content,
                   std::string& errorMsg);

}  // namespace SmsBridge
