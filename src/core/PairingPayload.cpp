/**
 * @file PairingPayload.cpp
 * @brief Pairing token codec implementation
 */

#include "smsbridge/PairingPayload.h"
#include "smsbridge/ErrorCodes.h"
#include "smsbridge/config.h"

#include <chrono>

namespace SmsBridge {

namespace {

std::string majorVersion(const std::string& version) {
    const auto dot = version.find('.');
    return dot == std::string::npos ? version : version.substr(0, dot);
}

} // anonymous namespace

bool PairingPayload::isValid() const {
    return kindTag == PAIRING_TYPE_TAG &&
           !sessionId.empty() &&
           deviceIdentity.isWellFormed();
}

std::string pairingCheckMessage(PairingCheck check) {
    switch (check) {
        case PairingCheck::Accepted:  return "Pairing code accepted";
        case PairingCheck::Malformed: return "Invalid pairing code. Please scan the code shown on the sending device.";
        case PairingCheck::Expired:   return "This pairing code has expired. Ask the sender to generate a new one.";
        default:                      return "Unknown pairing result";
    }
}

const char* pairingCheckErrorCode(PairingCheck check) {
    switch (check) {
        case PairingCheck::Malformed: return ErrorCodes::PAIRING_MALFORMED;
        case PairingCheck::Expired:   return ErrorCodes::PAIRING_EXPIRED;
        default:                      return "";
    }
}

std::string PairingCodec::encode(const DeviceIdentity& identity, const std::string& sessionId) {
    return encode(identity, sessionId, std::chrono::system_clock::now());
}

std::string PairingCodec::encode(const DeviceIdentity& identity, const std::string& sessionId,
                                 SystemTime issuedAt) {
    nlohmann::json j;
    j["type"] = PAIRING_TYPE_TAG;
    j["version"] = PROTOCOL_VERSION;
    j["session_id"] = sessionId;
    j["device_info"] = identity.toJson();
    j["timestamp"] = formatIso8601(issuedAt);
    return j.dump();
}

bool PairingCodec::decode(const std::string& token, PairingPayload& out, std::string& errorMsg) {
    errorMsg.clear();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(token);
    } catch (const nlohmann::json::exception& e) {
        errorMsg = std::string("pairing code is not valid JSON: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        errorMsg = "pairing code is not a JSON object";
        return false;
    }
    if (!j.contains("type") || !j["type"].is_string() ||
        j["type"].get<std::string>() != PAIRING_TYPE_TAG) {
        errorMsg = "pairing code has wrong or missing type tag";
        return false;
    }
    if (!j.contains("session_id") || !j["session_id"].is_string() ||
        j["session_id"].get<std::string>().empty()) {
        errorMsg = "pairing code missing session_id";
        return false;
    }
    if (j["session_id"].get<std::string>().size() > MAX_SESSION_ID_LENGTH) {
        errorMsg = "pairing code session_id too long";
        return false;
    }
    if (!j.contains("device_info")) {
        errorMsg = "pairing code missing device_info";
        return false;
    }
    if (!j.contains("timestamp") || !j["timestamp"].is_string()) {
        errorMsg = "pairing code missing timestamp";
        return false;
    }

    PairingPayload p;
    p.kindTag = PAIRING_TYPE_TAG;
    p.sessionId = j["session_id"].get<std::string>();

    if (j.contains("version") && j["version"].is_string()) {
        p.protocolVersion = j["version"].get<std::string>();
    }
    if (p.protocolVersion.empty()) {
        errorMsg = "pairing code missing version";
        return false;
    }
    if (majorVersion(p.protocolVersion) != majorVersion(PROTOCOL_VERSION)) {
        errorMsg = std::string(ErrorCodes::PAIRING_VERSION_MISMATCH) + ": pairing code protocol version " +
                   p.protocolVersion +
                   " is not compatible with " + PROTOCOL_VERSION;
        return false;
    }

    std::string idErr;
    if (!DeviceIdentity::fromJson(j["device_info"], p.deviceIdentity, idErr)) {
        errorMsg = "pairing code " + idErr;
        return false;
    }

    if (!parseIso8601(j["timestamp"].get<std::string>(), p.issuedAt)) {
        errorMsg = "pairing code timestamp is not ISO-8601";
        return false;
    }

    out = std::move(p);
    return true;
}

bool PairingCodec::isExpired(const PairingPayload& payload) {
    return isExpired(payload, std::chrono::system_clock::now());
}

bool PairingCodec::isExpired(const PairingPayload& payload, SystemTime now) {
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - payload.issuedAt);
    return age.count() > PAIRING_MAX_AGE_MS;
}

PairingCheck PairingCodec::check(const std::string& token, PairingPayload& out, std::string& errorMsg) {
    if (!decode(token, out, errorMsg)) {
        return PairingCheck::Malformed;
    }
    if (isExpired(out)) {
        errorMsg = "pairing code issued at " + formatIso8601(out.issuedAt) + " is older than one hour";
        return PairingCheck::Expired;
    }
    return PairingCheck::Accepted;
}

}  // namespace SmsBridge
