/**
 * @file SmsRecord.h
 * @brief A single SMS record as exchanged between devices
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace SmsBridge {

/**
 * @brief One message of the record set
 *
 * Wire keys: id, address, body, date (ms since epoch), read (0/1),
 * type (1 received / 2 sent), thread_id (string or null), message_type.
 */
struct SmsRecord {
    std::string id;
    std::string address;                 ///< Phone number / sender id
    std::string body;
    int64_t dateMs = 0;                  ///< Milliseconds since the Unix epoch
    bool isRead = false;
    bool isSent = false;
    std::optional<std::string> threadId;
    std::string messageType = "Unknown"; ///< Received, Sent, Draft, Outbox, Failed, Queued, Unknown

    nlohmann::json toJson() const;

    /**
     * @brief Decode a record object
     * @return false with errorMsg set when a required field is missing or mistyped
     */
    static bool fromJson(const nlohmann::json& j, SmsRecord& out, std::string& errorMsg);

    bool operator==(const SmsRecord& other) const {
        return id == other.id && address == other.address &&
               body == other.body && dateMs == other.dateMs;
    }
    bool operator!=(const SmsRecord& other) const { return !(*this == other); }
};

using SmsRecordList = std::vector<SmsRecord>;

/**
 * @brief Map the platform's numeric message kind to its display name
 * @param kind 1..6 as stored by the platform message provider
 */
std::string messageTypeFromKind(int kind);

/**
 * @brief Serialize a record list as a JSON array
 */
nlohmann::json recordsToJson(const SmsRecordList& records);

/**
 * @brief Decode a JSON array of records
 * @return false on the first malformed entry
 */
bool recordsFromJson(const nlohmann::json& j, SmsRecordList& out, std::string& errorMsg);

}  // namespace SmsBridge
