/**
 * @file TransferSession.cpp
 * @brief Transfer session state machine
 */

#include "smsbridge/TransferSession.h"

#include <algorithm>
#include <chrono>

namespace SmsBridge {

TransferSession::TransferSession()
    : TransferSession(std::string(), TransferMode::SENDER)
{
}

TransferSession::TransferSession(const std::string& sessionId, TransferMode mode)
    : m_sessionId(sessionId)
    , m_mode(mode)
    , m_status(SessionStatus::IDLE)
    , m_peerPort(0)
    , m_createdAt(std::chrono::system_clock::now())
    , m_totalRecords(0)
    , m_hasTotal(false)
    , m_transferredRecords(0)
{
}

void TransferSession::setPeer(const DeviceIdentity& peer) {
    m_peerDeviceName = peer.deviceName;
    m_peerIp = peer.ipAddress;
    m_peerPort = peer.port;
}

bool TransferSession::isTransitionAllowed(SessionStatus from, SessionStatus to) {
    switch (from) {
        case SessionStatus::IDLE:
            return to == SessionStatus::PREPARING || to == SessionStatus::ERROR;
        case SessionStatus::PREPARING:
            return to == SessionStatus::TRANSFERRING || to == SessionStatus::ERROR;
        case SessionStatus::TRANSFERRING:
            return to == SessionStatus::COMPLETED || to == SessionStatus::ERROR;
        case SessionStatus::COMPLETED:
        case SessionStatus::ERROR:
        default:
            return false;
    }
}

bool TransferSession::transitionTo(SessionStatus next) {
    if (next == m_status) {
        return true;
    }
    if (!isTransitionAllowed(m_status, next)) {
        return false;
    }
    m_status = next;
    return true;
}

bool TransferSession::setTotalRecords(uint64_t total) {
    if (isTerminal() || total < m_transferredRecords) {
        return false;
    }
    m_totalRecords = total;
    m_hasTotal = true;
    return true;
}

bool TransferSession::addTransferred(uint64_t count) {
    if (isTerminal()) {
        return false;
    }
    const uint64_t next = m_transferredRecords + count;
    if (m_hasTotal && next > m_totalRecords) {
        return false;
    }
    m_transferredRecords = next;
    return true;
}

bool TransferSession::fail(const std::string& message) {
    if (!transitionTo(SessionStatus::ERROR)) {
        return false;
    }
    m_errorMessage = message;
    return true;
}

double TransferSession::progress() const {
    const double total = static_cast<double>(std::max<uint64_t>(m_totalRecords, 1));
    const double p = static_cast<double>(m_transferredRecords) / total;
    return std::clamp(p, 0.0, 1.0);
}

nlohmann::json TransferSession::toJson() const {
    nlohmann::json j;
    j["session_id"] = m_sessionId;
    j["mode"] = transferModeToString(m_mode);
    j["status"] = sessionStatusToString(m_status);
    j["peer_device_name"] = m_peerDeviceName;
    j["peer_ip"] = m_peerIp;
    j["peer_port"] = m_peerPort;
    j["created_at"] = formatIso8601(m_createdAt);
    j["total_records"] = m_totalRecords;
    j["transferred_records"] = m_transferredRecords;
    j["progress"] = progress();
    if (!m_errorMessage.empty()) {
        j["error_message"] = m_errorMessage;
    }
    return j;
}

}  // namespace SmsBridge
