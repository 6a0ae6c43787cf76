/**
 * @file PairingPayload.h
 * @brief Pairing token exchanged out-of-band (normally via a QR code)
 *
 * The sender encodes its identity and a freshly minted session id into a
 * token; the receiver decodes it once to bootstrap its own session.
 *
 * Token JSON:
 * @code
 * {"type":"sms_transfer_pairing","version":"1.0.0","session_id":"sess_...",
 *  "device_info":{...DeviceIdentity...},"timestamp":"2026-03-14T09:26:53.589Z"}
 * @endcode
 */

#pragma once

#include "DeviceIdentity.h"
#include "Timestamp.h"

#include <string>

namespace SmsBridge {

/**
 * @brief Decoded pairing token
 */
struct PairingPayload {
    std::string kindTag;          ///< Must equal PAIRING_TYPE_TAG
    std::string protocolVersion;
    std::string sessionId;
    DeviceIdentity deviceIdentity;
    SystemTime issuedAt{};

    /**
     * @brief True when the tag matches, the session id is set and the
     * embedded identity is well-formed
     */
    bool isValid() const;
};

/**
 * @brief Outcome of checking a scanned token before a session is opened
 */
enum class PairingCheck : uint8_t {
    Accepted,   ///< Well-formed and fresh
    Malformed,  ///< Not a pairing token, or missing/invalid fields
    Expired     ///< Well-formed but older than PAIRING_MAX_AGE_MS
};

/**
 * @brief User-facing message for a pairing check outcome
 */
std::string pairingCheckMessage(PairingCheck check);

/**
 * @brief Stable error code for a rejected pairing check (empty for Accepted)
 */
const char* pairingCheckErrorCode(PairingCheck check);

/**
 * @class PairingCodec
 * @brief Encode, decode and check pairing tokens
 *
 * None of the methods throw.
 */
class PairingCodec {
public:
    /**
     * @brief Build a token stamped with the current time
     */
    static std::string encode(const DeviceIdentity& identity, const std::string& sessionId);

    /**
     * @brief Build a token with an explicit issue time
     */
    static std::string encode(const DeviceIdentity& identity, const std::string& sessionId,
                              SystemTime issuedAt);

    /**
     * @brief Decode a token
     * @param token Token text
     * @param out Decoded payload (untouched on failure)
     * @param errorMsg Reason on failure
     * @return false when the input is not JSON, the tag mismatches, a required
     *         field is absent or mistyped, the identity is malformed, or the
     *         protocol major version differs. Expiry is not checked.
     */
    static bool decode(const std::string& token, PairingPayload& out, std::string& errorMsg);

    /**
     * @brief True when the token is older than PAIRING_MAX_AGE_MS
     */
    static bool isExpired(const PairingPayload& payload);
    static bool isExpired(const PairingPayload& payload, SystemTime now);

    /**
     * @brief Decode and check freshness in one step
     * @param token Token text
     * @param out Decoded payload when the result is Accepted or Expired
     * @param errorMsg Decode failure reason when Malformed
     */
    static PairingCheck check(const std::string& token, PairingPayload& out, std::string& errorMsg);

    PairingCodec() = delete;
};

}  // namespace SmsBridge
