/**
 * @file Timestamp.h
 * @brief ISO-8601 timestamp formatting and parsing for wire messages
 */

#pragma once

#include <chrono>
#include <string>

namespace SmsBridge {

using SystemTime = std::chrono::system_clock::time_point;

/**
 * @brief Format a time point as ISO-8601 UTC with millisecond precision
 * @return e.g. "2026-03-14T09:26:53.589Z"
 */
std::string formatIso8601(SystemTime t);

/**
 * @brief Current time as ISO-8601 UTC
 */
std::string nowIso8601();

/**
 * @brief Parse an ISO-8601 date-time
 * @param text Input such as "2026-03-14T09:26:53.589Z",
 *             "2026-03-14T09:26:53+02:00" or "2026-03-14T09:26:53.589123"
 * @param out Parsed time point (unchanged on failure)
 * @return true on success
 *
 * A missing zone designator is read as UTC. Fractional seconds of any
 * length are accepted and truncated to milliseconds.
 */
bool parseIso8601(const std::string& text, SystemTime& out);

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t toEpochMs(SystemTime t);

/**
 * @brief Time point from milliseconds since the Unix epoch
 */
SystemTime fromEpochMs(int64_t ms);

}  // namespace SmsBridge
