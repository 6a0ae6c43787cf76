/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe lifecycle trace file
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace SmsBridge {

/**
 * @brief Thread-safe append-only trace log
 *
 * Records lifecycle events (listener start/stop, session transitions,
 * sweep start/end) to a plain text file so a failed transfer can be
 * reconstructed after the fact. Every module writes through this class
 * to keep concurrent appends from interleaving.
 *
 * Note: initialize() should be called once at startup, before any listener
 * or sweep threads are started. Until then log() does nothing.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the trace file path
     * @param logPath Path to the trace file (empty disables tracing)
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Whether a trace file has been configured
     */
    static bool isEnabled();

    /**
     * @brief Append a timestamped line
     * @param message Message to log
     *
     * Thread-safe: locks the global mutex before writing to the file.
     */
    static void log(const std::string& message);

    /**
     * @brief Append a timestamped line
     * @param message Message to log
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Trace file path (set by initialize())
    static std::filesystem::path s_logPath;
};

} // namespace SmsBridge
