/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "smsbridge/AtomicFile.h"

#include <fstream>
#include <iterator>

namespace SmsBridge {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg)
{
    errorMsg.clear();
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        std::filesystem::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            errorMsg = "cannot create directory " + finalPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            errorMsg = "cannot open " + paths.tempPath.string() + " for writing";
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            errorMsg = "write to " + paths.tempPath.string() + " failed";
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    std::filesystem::rename(paths.tempPath, paths.finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code ignored;
        std::filesystem::remove(paths.tempPath, ignored);
        return false;
    }

    return true;
}

bool readWholeFile(const std::filesystem::path& path,
                   std::string& content,
                   std::string& errorMsg)
{
    errorMsg.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        errorMsg = "cannot open " + path.string();
        return false;
    }
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        errorMsg = "read from " + path.string() + " failed";
        return false;
    }
    return true;
}

}  // namespace SmsBridge
