/**
 * @file MessageEnvelope.h
 * @brief Typed, session-tagged wire message exchanged between peers
 *
 * Envelope JSON:
 * @code
 * {"type":"SMS_DATA","session_id":"sess_...","timestamp":"2026-...Z","data":{...}}
 * @endcode
 *
 * The shape of "data" is fixed by "type":
 * - DISCOVERY, DISCOVERY_RESPONSE: DeviceIdentity
 * - TRANSFER_REQUEST:  {"total_messages": N}
 * - SMS_DATA:          RecordBatch
 * - TRANSFER_COMPLETE: {"total_messages": N, "completed_at": ISO-8601}
 * - ERROR:             {"error": "..."}
 */

#pragma once

#include "DeviceIdentity.h"
#include "RecordBatch.h"
#include "Timestamp.h"

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace SmsBridge {

//=============================================================================
// Envelope Type
//=============================================================================

enum class EnvelopeType : uint8_t {
    DISCOVERY,
    DISCOVERY_RESPONSE,
    TRANSFER_REQUEST,
    SMS_DATA,
    TRANSFER_COMPLETE,
    ERROR
};

/**
 * @brief Wire name of an envelope type (e.g. "SMS_DATA")
 */
const char* envelopeTypeToString(EnvelopeType type);

/**
 * @brief Parse a wire name
 * @return false for unknown names
 */
bool envelopeTypeFromString(const std::string& name, EnvelopeType& out);

//=============================================================================
// Typed Payloads
//=============================================================================

struct TransferRequestData {
    uint64_t totalMessages = 0;
};

struct TransferCompleteData {
    uint64_t totalMessages = 0;
    std::string completedAt;
};

struct ErrorData {
    std::string error;
};

using EnvelopePayload = std::variant<DeviceIdentity,
                                     TransferRequestData,
                                     RecordBatch,
                                     TransferCompleteData,
                                     ErrorData>;

//=============================================================================
// MessageEnvelope
//=============================================================================

/**
 * @class MessageEnvelope
 * @brief Immutable envelope whose payload alternative always matches its type
 *
 * Envelopes are built through the named factories or decoded with
 * fromJsonString(); there is no way to pair a type with the wrong payload.
 */
class MessageEnvelope {
public:
    static MessageEnvelope discovery(const std::string& sessionId, const DeviceIdentity& self);
    static MessageEnvelope discoveryResponse(const std::string& sessionId, const DeviceIdentity& self);
    static MessageEnvelope transferRequest(const std::string& sessionId, uint64_t totalMessages);
    static MessageEnvelope smsData(const RecordBatch& batch);
    static MessageEnvelope transferComplete(const std::string& sessionId, uint64_t totalMessages);
    static MessageEnvelope error(const std::string& sessionId, const std::string& message);

    EnvelopeType type() const { return m_type; }
    const std::string& sessionId() const { return m_sessionId; }
    SystemTime timestamp() const { return m_timestamp; }
    const EnvelopePayload& payload() const { return m_payload; }

    /**
     * @brief Typed payload access
     * @return nullptr when the envelope carries a different alternative
     */
    template <typename T>
    const T* payloadAs() const { return std::get_if<T>(&m_payload); }

    nlohmann::json toJson() const;

    /**
     * @brief Serialized envelope
     *
     * Invalid UTF-8 (e.g. echoed from a parse error) becomes U+FFFD instead
     * of throwing.
     */
    std::string toJsonString() const {
        return toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    /**
     * @brief Type-directed decode of an envelope
     * @param j Envelope object
     * @param out Decoded envelope
     * @param errorMsg Reason on failure
     * @return false when "type" is unknown, a header field is missing, or
     *         "data" does not match the shape required by "type"
     */
    static bool fromJson(const nlohmann::json& j, MessageEnvelope& out, std::string& errorMsg);

    /**
     * @brief Parse and decode envelope text. Never throws.
     */
    static bool fromJsonString(const std::string& text, MessageEnvelope& out, std::string& errorMsg);

    MessageEnvelope() : m_type(EnvelopeType::ERROR), m_payload(ErrorData{}) {}

private:
    MessageEnvelope(EnvelopeType type, const std::string& sessionId, EnvelopePayload payload);

    EnvelopeType m_type;
    std::string m_sessionId;
    SystemTime m_timestamp;
    EnvelopePayload m_payload;
};

/**
 * @brief Acknowledgment body returned by the transfer endpoint
 * @return {"status": status, "session_id": sessionId, "timestamp": now}
 */
nlohmann::json makeAck(const std::string& status, const std::string& sessionId);

}  // namespace SmsBridge
