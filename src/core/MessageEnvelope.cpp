/**
 * @file MessageEnvelope.cpp
 * @brief Envelope encoding and type-directed decoding
 */

#include "smsbridge/MessageEnvelope.h"

#include <chrono>
#include <utility>

namespace SmsBridge {

namespace {

struct PayloadToJson {
    nlohmann::json operator()(const DeviceIdentity& id) const { return id.toJson(); }

    nlohmann::json operator()(const TransferRequestData& d) const {
        nlohmann::json j;
        j["total_messages"] = d.totalMessages;
        return j;
    }

    nlohmann::json operator()(const RecordBatch& b) const { return b.toJson(); }

    nlohmann::json operator()(const TransferCompleteData& d) const {
        nlohmann::json j;
        j["total_messages"] = d.totalMessages;
        j["completed_at"] = d.completedAt;
        return j;
    }

    nlohmann::json operator()(const ErrorData& d) const {
        nlohmann::json j;
        j["error"] = d.error;
        return j;
    }
};

bool readTotal(const nlohmann::json& data, uint64_t& out, std::string& errorMsg) {
    if (!data.contains("total_messages") || !data["total_messages"].is_number_unsigned()) {
        errorMsg = "data missing 'total_messages'";
        return false;
    }
    out = data["total_messages"].get<uint64_t>();
    return true;
}

bool decodePayload(EnvelopeType type, const nlohmann::json& data,
                   EnvelopePayload& out, std::string& errorMsg) {
    switch (type) {
        case EnvelopeType::DISCOVERY:
        case EnvelopeType::DISCOVERY_RESPONSE: {
            DeviceIdentity id;
            if (!DeviceIdentity::fromJson(data, id, errorMsg)) {
                return false;
            }
            out = std::move(id);
            return true;
        }
        case EnvelopeType::TRANSFER_REQUEST: {
            TransferRequestData d;
            if (!readTotal(data, d.totalMessages, errorMsg)) {
                return false;
            }
            out = d;
            return true;
        }
        case EnvelopeType::SMS_DATA: {
            RecordBatch b;
            if (!RecordBatch::fromJson(data, b, errorMsg)) {
                return false;
            }
            out = std::move(b);
            return true;
        }
        case EnvelopeType::TRANSFER_COMPLETE: {
            TransferCompleteData d;
            if (!readTotal(data, d.totalMessages, errorMsg)) {
                return false;
            }
            if (data.contains("completed_at") && data["completed_at"].is_string()) {
                d.completedAt = data["completed_at"].get<std::string>();
            }
            out = std::move(d);
            return true;
        }
        case EnvelopeType::ERROR: {
            ErrorData d;
            if (data.contains("error") && data["error"].is_string()) {
                d.error = data["error"].get<std::string>();
            } else {
                d.error = "Unknown error";
            }
            out = std::move(d);
            return true;
        }
    }
    errorMsg = "unhandled envelope type";
    return false;
}

} // anonymous namespace

//=============================================================================
// Envelope type names
//=============================================================================

const char* envelopeTypeToString(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::DISCOVERY:          return "DISCOVERY";
        case EnvelopeType::DISCOVERY_RESPONSE: return "DISCOVERY_RESPONSE";
        case EnvelopeType::TRANSFER_REQUEST:   return "TRANSFER_REQUEST";
        case EnvelopeType::SMS_DATA:           return "SMS_DATA";
        case EnvelopeType::TRANSFER_COMPLETE:  return "TRANSFER_COMPLETE";
        case EnvelopeType::ERROR:              return "ERROR";
        default:                               return "UNKNOWN";
    }
}

bool envelopeTypeFromString(const std::string& name, EnvelopeType& out) {
    static const std::pair<const char*, EnvelopeType> kTypes[] = {
        {"DISCOVERY", EnvelopeType::DISCOVERY},
        {"DISCOVERY_RESPONSE", EnvelopeType::DISCOVERY_RESPONSE},
        {"TRANSFER_REQUEST", EnvelopeType::TRANSFER_REQUEST},
        {"SMS_DATA", EnvelopeType::SMS_DATA},
        {"TRANSFER_COMPLETE", EnvelopeType::TRANSFER_COMPLETE},
        {"ERROR", EnvelopeType::ERROR},
    };
    for (const auto& entry : kTypes) {
        if (name == entry.first) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

//=============================================================================
// Factories
//=============================================================================

MessageEnvelope::MessageEnvelope(EnvelopeType type, const std::string& sessionId,
                                 EnvelopePayload payload)
    : m_type(type)
    , m_sessionId(sessionId)
    , m_timestamp(std::chrono::system_clock::now())
    , m_payload(std::move(payload))
{
}

MessageEnvelope MessageEnvelope::discovery(const std::string& sessionId, const DeviceIdentity& self) {
    return MessageEnvelope(EnvelopeType::DISCOVERY, sessionId, self);
}

MessageEnvelope MessageEnvelope::discoveryResponse(const std::string& sessionId, const DeviceIdentity& self) {
    return MessageEnvelope(EnvelopeType::DISCOVERY_RESPONSE, sessionId, self);
}

MessageEnvelope MessageEnvelope::transferRequest(const std::string& sessionId, uint64_t totalMessages) {
    return MessageEnvelope(EnvelopeType::TRANSFER_REQUEST, sessionId,
                           TransferRequestData{totalMessages});
}

MessageEnvelope MessageEnvelope::smsData(const RecordBatch& batch) {
    return MessageEnvelope(EnvelopeType::SMS_DATA, batch.sessionId, batch);
}

MessageEnvelope MessageEnvelope::transferComplete(const std::string& sessionId, uint64_t totalMessages) {
    return MessageEnvelope(EnvelopeType::TRANSFER_COMPLETE, sessionId,
                           TransferCompleteData{totalMessages, nowIso8601()});
}

MessageEnvelope MessageEnvelope::error(const std::string& sessionId, const std::string& message) {
    return MessageEnvelope(EnvelopeType::ERROR, sessionId, ErrorData{message});
}

//=============================================================================
// Encoding / decoding
//=============================================================================

nlohmann::json MessageEnvelope::toJson() const {
    nlohmann::json j;
    j["type"] = envelopeTypeToString(m_type);
    j["session_id"] = m_sessionId;
    j["timestamp"] = formatIso8601(m_timestamp);
    j["data"] = std::visit(PayloadToJson{}, m_payload);
    return j;
}

bool MessageEnvelope::fromJson(const nlohmann::json& j, MessageEnvelope& out, std::string& errorMsg) {
    errorMsg.clear();

    if (!j.is_object()) {
        errorMsg = "envelope is not a JSON object";
        return false;
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        errorMsg = "envelope missing 'type'";
        return false;
    }

    EnvelopeType type;
    if (!envelopeTypeFromString(j["type"].get<std::string>(), type)) {
        errorMsg = "unknown envelope type '" + j["type"].get<std::string>() + "'";
        return false;
    }

    std::string sessionId;
    if (j.contains("session_id") && j["session_id"].is_string()) {
        sessionId = j["session_id"].get<std::string>();
    } else if (j.contains("session_id") && !j["session_id"].is_null()) {
        errorMsg = "envelope 'session_id' is not a string";
        return false;
    }

    SystemTime timestamp = std::chrono::system_clock::now();
    if (j.contains("timestamp")) {
        if (!j["timestamp"].is_string() || !parseIso8601(j["timestamp"].get<std::string>(), timestamp)) {
            errorMsg = "envelope 'timestamp' is not ISO-8601";
            return false;
        }
    }

    if (!j.contains("data") || !j["data"].is_object()) {
        errorMsg = "envelope missing 'data' object";
        return false;
    }

    EnvelopePayload payload;
    std::string err;
    if (!decodePayload(type, j["data"], payload, err)) {
        errorMsg = std::string(envelopeTypeToString(type)) + " " + err;
        return false;
    }

    MessageEnvelope env(type, sessionId, std::move(payload));
    env.m_timestamp = timestamp;
    out = std::move(env);
    return true;
}

bool MessageEnvelope::fromJsonString(const std::string& text, MessageEnvelope& out, std::string& errorMsg) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        errorMsg = std::string("envelope is not valid JSON: ") + e.what();
        return false;
    }
    return fromJson(j, out, errorMsg);
}

nlohmann::json makeAck(const std::string& status, const std::string& sessionId) {
    nlohmann::json j;
    j["status"] = status;
    j["session_id"] = sessionId;
    j["timestamp"] = nowIso8601();
    return j;
}

}  // namespace SmsBridge
