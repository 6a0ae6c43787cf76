/**
 * @file TransferSession.h
 * @brief State and counters of one sender/receiver pairing
 */

#pragma once

#include "DeviceIdentity.h"
#include "Timestamp.h"

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace SmsBridge {

//=============================================================================
// Session Mode and Status Enums
//=============================================================================

/**
 * @brief Role of this device in a session
 */
enum class TransferMode : uint8_t {
    SENDER,   ///< Streams its records to the peer
    RECEIVER  ///< Accumulates records from the peer
};

/**
 * @brief Status of a transfer session
 *
 * IDLE -> PREPARING -> TRANSFERRING -> COMPLETED, and any non-terminal
 * status -> ERROR. COMPLETED and ERROR are terminal; a retry needs a fresh
 * session.
 */
enum class SessionStatus : uint8_t {
    IDLE,         ///< Session created, not paired
    PREPARING,    ///< Paired, waiting for the transfer to start
    TRANSFERRING, ///< Batches flowing
    COMPLETED,    ///< All batches delivered and handed off
    ERROR         ///< Failed, see errorMessage()
};

/**
 * @brief Convert SessionStatus to string
 */
inline std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:         return "idle";
        case SessionStatus::PREPARING:    return "preparing";
        case SessionStatus::TRANSFERRING: return "transferring";
        case SessionStatus::COMPLETED:    return "completed";
        case SessionStatus::ERROR:        return "error";
        default:                          return "unknown";
    }
}

inline std::string transferModeToString(TransferMode mode) {
    return mode == TransferMode::SENDER ? "sender" : "receiver";
}

//=============================================================================
// TransferSession Class
//=============================================================================

/**
 * @class TransferSession
 * @brief Value-type state machine for one transfer
 *
 * Every mutator refuses changes that would break the state machine or the
 * counter invariant (transferred <= total once the total is known) and
 * returns false, leaving the session unchanged.
 *
 * Thread Safety:
 * - Not thread-safe. The live session is owned by SessionController's event
 *   loop; other threads only ever see copies.
 */
class TransferSession {
public:
    TransferSession();
    TransferSession(const std::string& sessionId, TransferMode mode);

    //=========================================================================
    // Mutators
    //=========================================================================

    /**
     * @brief Record the peer taking part in this session
     */
    void setPeer(const DeviceIdentity& peer);

    /**
     * @brief Move to a new status
     * @return false if the transition is not allowed (same-status is a no-op
     *         that returns true)
     */
    bool transitionTo(SessionStatus next);

    /**
     * @brief Set the announced total record count
     * @return false if the session is terminal or the total is below the
     *         number of records already transferred
     */
    bool setTotalRecords(uint64_t total);

    /**
     * @brief Add delivered/received records
     * @return false if the session is terminal or the new count would exceed
     *         the announced total
     */
    bool addTransferred(uint64_t count);

    /**
     * @brief Move to ERROR and keep the cause
     * @return false if the session is already terminal
     */
    bool fail(const std::string& message);

    //=========================================================================
    // Queries
    //=========================================================================

    const std::string& sessionId() const { return m_sessionId; }
    TransferMode mode() const { return m_mode; }
    SessionStatus status() const { return m_status; }
    const std::string& peerDeviceName() const { return m_peerDeviceName; }
    const std::string& peerIp() const { return m_peerIp; }
    uint16_t peerPort() const { return m_peerPort; }
    SystemTime createdAt() const { return m_createdAt; }
    uint64_t totalRecords() const { return m_totalRecords; }
    bool hasTotalRecords() const { return m_hasTotal; }
    uint64_t transferredRecords() const { return m_transferredRecords; }
    const std::string& errorMessage() const { return m_errorMessage; }

    bool isTerminal() const {
        return m_status == SessionStatus::COMPLETED || m_status == SessionStatus::ERROR;
    }

    /**
     * @brief transferred / max(total, 1), clamped to [0, 1]
     */
    double progress() const;

    nlohmann::json toJson() const;

    /**
     * @brief Whether the state machine allows from -> to
     */
    static bool isTransitionAllowed(SessionStatus from, SessionStatus to);

private:
    std::string m_sessionId;
    TransferMode m_mode;
    SessionStatus m_status;
    std::string m_peerDeviceName;
    std::string m_peerIp;
    uint16_t m_peerPort;
    SystemTime m_createdAt;
    uint64_t m_totalRecords;
    bool m_hasTotal;
    uint64_t m_transferredRecords;
    std::string m_errorMessage;
};

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Progress/status observer
 *
 * Receives a snapshot after every change to the live session.
 */
using SessionObserver = std::function<void(const TransferSession& snapshot)>;

}  // namespace SmsBridge
