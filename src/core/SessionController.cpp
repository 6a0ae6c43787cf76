/**
 * @file SessionController.cpp
 * @brief Orchestration of one transfer session at a time
 */

#include "smsbridge/SessionController.h"
#include "smsbridge/Debug.h"
#include "smsbridge/ErrorCodes.h"
#include "smsbridge/MessageEnvelope.h"
#include "smsbridge/ThreadSafeLog.h"
#include "smsbridge/UuidGenerator.h"

#include <algorithm>
#include <chrono>

namespace SmsBridge {

namespace {

// Peer's ERROR text when it sent one, otherwise the transport failure
std::string describeFailure(const HttpResult& result) {
    if (result.status != 0 && !result.body.empty()) {
        MessageEnvelope reply;
        std::string err;
        if (MessageEnvelope::fromJsonString(result.body, reply, err)) {
            if (const ErrorData* data = reply.payloadAs<ErrorData>()) {
                if (!data->error.empty()) {
                    return std::string(ErrorCodes::TRANSFER_REJECTED_REMOTE) + ": " + data->error;
                }
            }
        }
    }
    return result.errorMsg;
}

} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

SessionController::SessionController(const Settings& settings,
                                     const DeviceIdentity& localIdentity,
                                     RecordStore& store,
                                     std::shared_ptr<EnvelopeTransport> transport)
    : m_settings(settings)
    , m_store(store)
    , m_transport(transport ? std::move(transport) : std::make_shared<HttpClient>())
    , m_localIdentity(localIdentity)
    , m_server(localIdentity, settings.transferPort)
    , m_hasSession(false)
    , m_loopStopping(false)
    , m_loopExited(false)
{
    m_server.setConnectionTimeoutMs(settings.requestTimeoutMs);
    m_server.setEnvelopeHandler([this](const MessageEnvelope& envelope) {
        return invoke([this, &envelope]() { return applyEnvelope(envelope); });
    });
    m_server.setDiscoveryObserver([this](const DeviceIdentity& peer, const std::string& sessionId,
                                         const std::string& remoteIp) {
        invoke([this, &peer, &sessionId, &remoteIp]() { recordInboundPeer(peer, sessionId, remoteIp); });
    });
    m_server.setSessionIdProvider([this]() {
        return invoke([this]() { return currentSessionId(); });
    });

    m_loopThread = std::thread(&SessionController::loopThreadFunc, this);
    m_loopThreadId = m_loopThread.get_id();
}

SessionController::~SessionController() {
    stopListening();

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_loopStopping = true;
    }
    m_queueCv.notify_all();
    if (m_loopThread.joinable()) {
        m_loopThread.join();
    }
}

//=============================================================================
// Event loop
//=============================================================================

void SessionController::loopThreadFunc() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this]() { return m_loopStopping || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                m_loopExited = true;
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }
}

void SessionController::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_loopExited) {
            m_tasks.push_back(std::move(task));
            m_queueCv.notify_one();
            return;
        }
    }
    // Loop already gone (destruction in progress)
    task();
}

void SessionController::notifyObserver() {
    if (!m_observer) {
        return;
    }
    try {
        m_observer(m_session);
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionController] progress callback threw: " << e.what());
    }
}

std::string SessionController::currentSessionId() {
    return m_hasSession ? m_session.sessionId() : std::string();
}

//=============================================================================
// Listener
//=============================================================================

bool SessionController::startListening(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    errorMsg.clear();
    if (m_server.isRunning()) {
        return true;
    }
    if (!m_server.start(errorMsg)) {
        return false;
    }
    m_localIdentity.port = m_server.localIdentity().port;
    return true;
}

void SessionController::stopListening() {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_server.stop();
}

bool SessionController::isListening() const {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    return m_server.isRunning();
}

DeviceIdentity SessionController::localIdentity() const {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    return m_localIdentity;
}

//=============================================================================
// Session lifecycle
//=============================================================================

void SessionController::openSession(const std::string& sessionId, TransferMode mode) {
    m_session = TransferSession(sessionId, mode);
    m_hasSession = true;
    m_consumer.clear();
    m_lastWrite = StoreWriteResult();
    ThreadSafeLog::log("Session " + sessionId + ": opened as " + transferModeToString(mode));
    notifyObserver();
}

bool SessionController::failIfCurrent(const std::string& sessionId, const std::string& message) {
    return invoke([this, &sessionId, &message]() {
        if (!m_hasSession || m_session.sessionId() != sessionId || !m_session.fail(message)) {
            return false;
        }
        ThreadSafeLog::log("Session " + sessionId + ": error: " + message);
        notifyObserver();
        return true;
    });
}

bool SessionController::transitionIfCurrent(const std::string& sessionId, SessionStatus next) {
    return invoke([this, &sessionId, next]() {
        if (!m_hasSession || m_session.sessionId() != sessionId) {
            return false;
        }
        const SessionStatus previous = m_session.status();
        if (!m_session.transitionTo(next)) {
            return false;
        }
        if (previous != next) {
            ThreadSafeLog::log("Session " + sessionId + ": " + sessionStatusToString(previous) +
                               " -> " + sessionStatusToString(next));
            notifyObserver();
        }
        return true;
    });
}

bool SessionController::beginSenderSession(std::string& token, std::string& errorMsg) {
    errorMsg.clear();

    const std::string sessionId = UuidGenerator::generateWithPrefix(SESSION_ID_PREFIX);
    if (sessionId.empty()) {
        errorMsg = "random number generator failed while minting session id";
        return false;
    }

    invoke([this, &sessionId]() { openSession(sessionId, TransferMode::SENDER); });

    std::string listenError;
    if (!startListening(listenError)) {
        failIfCurrent(sessionId, listenError);
        errorMsg = listenError;
        return false;
    }

    token = PairingCodec::encode(localIdentity(), sessionId);
    transitionIfCurrent(sessionId, SessionStatus::PREPARING);

    LOG_INFO("[SessionController] Sender session " << sessionId << " waiting for a receiver");
    return true;
}

bool SessionController::beginReceiverSession(const std::string& token, PairingCheck& check,
                                             std::string& errorMsg) {
    errorMsg.clear();

    PairingPayload pairing;
    std::string decodeError;
    check = PairingCodec::check(token, pairing, decodeError);
    if (check != PairingCheck::Accepted) {
        errorMsg = std::string(pairingCheckErrorCode(check)) + ": " + pairingCheckMessage(check);
        if (!decodeError.empty()) {
            errorMsg += " (" + decodeError + ")";
        }
        LOG_WARNING("[SessionController] Pairing rejected: " << errorMsg);
        return false;
    }

    const std::string sessionId = pairing.sessionId;
    const DeviceIdentity sender = pairing.deviceIdentity;

    invoke([this, &sessionId, &sender]() {
        openSession(sessionId, TransferMode::RECEIVER);
        m_session.setPeer(sender);
        notifyObserver();
    });

    std::string listenError;
    if (!startListening(listenError)) {
        failIfCurrent(sessionId, listenError);
        errorMsg = listenError;
        return false;
    }

    const HttpResult health = m_transport->get(sender.ipAddress, sender.port, HEALTH_PATH,
                                               m_settings.probeTimeoutMs);
    if (!health.ok) {
        errorMsg = std::string(ErrorCodes::PAIRING_PEER_UNREACHABLE) + ": sender " +
                   sender.ipAddress + ":" + std::to_string(sender.port) +
                   " is unreachable: " + health.errorMsg;
        failIfCurrent(sessionId, errorMsg);
        LOG_ERROR("[SessionController] " << errorMsg);
        return false;
    }

    transitionIfCurrent(sessionId, SessionStatus::PREPARING);

    // The sender learns where to stream from this announcement
    const HttpResult announce = m_transport->postEnvelope(
        sender.ipAddress, sender.port, DISCOVERY_PATH,
        MessageEnvelope::discovery(sessionId, localIdentity()), m_settings.requestTimeoutMs);
    if (!announce.ok) {
        LOG_WARNING("[SessionController] Announcement to " << sender.ipAddress
                    << " failed: " << describeFailure(announce));
    }

    LOG_INFO("[SessionController] Receiver session " << sessionId << " paired with "
             << sender.deviceName << " (" << sender.ipAddress << ")");
    return true;
}

bool SessionController::failSend(const std::string& sessionId, const std::string& message,
                                 std::string& errorMsg) {
    failIfCurrent(sessionId, message);
    errorMsg = std::string(ErrorCodes::TRANSFER_SEND_FAILED) + ": " + message;
    LOG_ERROR("[SessionController] " << message);
    return false;
}

bool SessionController::sendBatchStream(const DeviceIdentity& peer, const SmsRecordList& records,
                                        std::string& errorMsg) {
    errorMsg.clear();

    std::string sessionId;
    const bool ready = invoke([this, &peer, &records, &sessionId]() {
        if (!m_hasSession || m_session.mode() != TransferMode::SENDER ||
            m_session.status() != SessionStatus::PREPARING) {
            return false;
        }
        sessionId = m_session.sessionId();
        m_session.setPeer(peer);
        m_session.setTotalRecords(records.size());
        notifyObserver();
        return true;
    });
    if (!ready) {
        const TransferSession current = snapshot();
        errorMsg = std::string(ErrorCodes::TRANSFER_INVALID_STATE) + ": cannot send from a " +
                   transferModeToString(current.mode()) + " session in " +
                   sessionStatusToString(current.status());
        return false;
    }

    const uint32_t timeoutMs = m_settings.requestTimeoutMs;

    HttpResult reply = m_transport->postEnvelope(
        peer.ipAddress, peer.port, TRANSFER_PATH,
        MessageEnvelope::transferRequest(sessionId, records.size()), timeoutMs);
    if (!reply.ok) {
        return failSend(sessionId, "Transfer request failed: " + describeFailure(reply), errorMsg);
    }
    if (!transitionIfCurrent(sessionId, SessionStatus::TRANSFERRING)) {
        errorMsg = std::string(ErrorCodes::TRANSFER_INVALID_STATE) + ": session changed before streaming";
        return false;
    }

    BatchProducer producer(records, m_settings.batchSize, sessionId);
    ThreadSafeLog::log("Session " + sessionId + ": streaming " + std::to_string(records.size()) +
                       " records in " + std::to_string(producer.totalBatches()) + " batches to " +
                       peer.ipAddress);

    RecordBatch batch;
    bool first = true;
    while (producer.next(batch)) {
        if (!first && m_settings.batchDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.batchDelayMs));
        }
        first = false;

        const bool stillCurrent = invoke([this, &sessionId]() {
            return m_hasSession && m_session.sessionId() == sessionId &&
                   m_session.status() == SessionStatus::TRANSFERRING;
        });
        if (!stillCurrent) {
            errorMsg = std::string(ErrorCodes::TRANSFER_INVALID_STATE) +
                       ": session was aborted or reset during the transfer";
            LOG_WARNING("[SessionController] Stopping stream for " << sessionId << ": " << errorMsg);
            return false;
        }

        reply = m_transport->postEnvelope(peer.ipAddress, peer.port, TRANSFER_PATH,
                                          MessageEnvelope::smsData(batch), timeoutMs);
        if (!reply.ok) {
            return failSend(sessionId,
                            "Failed to send batch " + std::to_string(batch.batchNumber) + "/" +
                            std::to_string(batch.totalBatches) + ": " + describeFailure(reply),
                            errorMsg);
        }

        const size_t delivered = batch.records.size();
        invoke([this, &sessionId, delivered]() {
            if (m_hasSession && m_session.sessionId() == sessionId &&
                m_session.addTransferred(delivered)) {
                notifyObserver();
            }
        });
        LOG_DEBUG("[SessionController] Batch " << batch.batchNumber << "/" << batch.totalBatches
                  << " acknowledged");
    }

    reply = m_transport->postEnvelope(peer.ipAddress, peer.port, TRANSFER_PATH,
                                      MessageEnvelope::transferComplete(sessionId, records.size()),
                                      timeoutMs);
    if (!reply.ok) {
        return failSend(sessionId, "Failed to complete transfer: " + describeFailure(reply), errorMsg);
    }

    transitionIfCurrent(sessionId, SessionStatus::COMPLETED);
    LOG_INFO("[SessionController] Sent " << records.size() << " records to " << peer.deviceName);
    return true;
}

void SessionController::abortSession(const std::string& reason) {
    std::string sessionId;
    std::string peerIp;
    uint16_t peerPort = 0;

    const bool failed = invoke([&]() {
        if (!m_hasSession || !m_session.fail(reason)) {
            return false;
        }
        sessionId = m_session.sessionId();
        peerIp = m_session.peerIp();
        peerPort = m_session.peerPort();
        ThreadSafeLog::log("Session " + sessionId + ": aborted: " + reason);
        notifyObserver();
        return true;
    });

    if (!failed || peerIp.empty() || peerPort == 0) {
        return;
    }

    const HttpResult result = m_transport->postEnvelope(peerIp, peerPort, TRANSFER_PATH,
                                                        MessageEnvelope::error(sessionId, reason),
                                                        m_settings.probeTimeoutMs);
    if (!result.ok) {
        LOG_DEBUG("[SessionController] Peer not told about abort: " << result.errorMsg);
    }
}

void SessionController::reset() {
    invoke([this]() {
        if (m_hasSession) {
            ThreadSafeLog::log("Session " + m_session.sessionId() + ": reset");
        }
        m_session = TransferSession();
        m_hasSession = false;
        m_consumer.clear();
        m_inboundPeers.clear();
        m_lastWrite = StoreWriteResult();
        notifyObserver();
    });
}

//=============================================================================
// Inbound envelopes (loop thread)
//=============================================================================

EnvelopeDisposition SessionController::applyEnvelope(const MessageEnvelope& envelope) {
    if (!m_hasSession) {
        return EnvelopeDisposition::rejected("no active session");
    }
    if (m_settings.strictSessionMatch && envelope.sessionId() != m_session.sessionId()) {
        LOG_WARNING("[SessionController] Dropping " << envelopeTypeToString(envelope.type())
                    << " for session '" << envelope.sessionId() << "'");
        return EnvelopeDisposition::mismatch("session mismatch: expected '" + m_session.sessionId() +
                                             "', got '" + envelope.sessionId() + "'");
    }

    switch (envelope.type()) {
        case EnvelopeType::TRANSFER_REQUEST:
            return applyTransferRequest(*envelope.payloadAs<TransferRequestData>());

        case EnvelopeType::SMS_DATA:
            return applyBatch(*envelope.payloadAs<RecordBatch>());

        case EnvelopeType::TRANSFER_COMPLETE:
            return applyTransferComplete(*envelope.payloadAs<TransferCompleteData>());

        case EnvelopeType::ERROR: {
            const std::string& cause = envelope.payloadAs<ErrorData>()->error;
            if (m_session.fail(cause.empty() ? std::string("peer reported an error") : cause)) {
                ThreadSafeLog::log("Session " + m_session.sessionId() + ": peer error: " + cause);
                notifyObserver();
            }
            return EnvelopeDisposition::accepted();
        }

        default:
            return EnvelopeDisposition::rejected(std::string(envelopeTypeToString(envelope.type())) +
                                                 " is not a transfer envelope");
    }
}

EnvelopeDisposition SessionController::applyTransferRequest(const TransferRequestData& request) {
    if (m_session.mode() != TransferMode::RECEIVER) {
        return EnvelopeDisposition::rejected("this device is not receiving");
    }

    // Re-delivered request
    if (m_session.status() == SessionStatus::TRANSFERRING && m_session.hasTotalRecords() &&
        m_session.totalRecords() == request.totalMessages) {
        return EnvelopeDisposition::accepted();
    }

    if (m_session.status() == SessionStatus::IDLE) {
        m_session.transitionTo(SessionStatus::PREPARING);
    }
    if (m_session.status() != SessionStatus::PREPARING) {
        return EnvelopeDisposition::rejected(std::string(ErrorCodes::TRANSFER_INVALID_STATE) +
                                             ": transfer request in " +
                                             sessionStatusToString(m_session.status()) + " session");
    }

    m_consumer.clear();
    m_consumer.setExpectedTotal(static_cast<size_t>(request.totalMessages));
    m_session.setTotalRecords(request.totalMessages);
    m_session.transitionTo(SessionStatus::TRANSFERRING);

    ThreadSafeLog::log("Session " + m_session.sessionId() + ": receiving " +
                       std::to_string(request.totalMessages) + " records");
    notifyObserver();
    return EnvelopeDisposition::accepted();
}

EnvelopeDisposition SessionController::applyBatch(const RecordBatch& batch) {
    if (m_session.mode() != TransferMode::RECEIVER || m_session.status() != SessionStatus::TRANSFERRING) {
        return EnvelopeDisposition::rejected(std::string(ErrorCodes::TRANSFER_INVALID_STATE) +
                                             ": batch in " + sessionStatusToString(m_session.status()) +
                                             " session");
    }

    switch (m_consumer.apply(batch)) {
        case BatchConsumer::ApplyResult::Duplicate:
            LOG_DEBUG("[SessionController] Batch " << batch.batchNumber << " already applied");
            return EnvelopeDisposition::accepted();

        case BatchConsumer::ApplyResult::Invalid:
            return EnvelopeDisposition::rejected("invalid batch number " + std::to_string(batch.batchNumber) +
                                                 " of " + std::to_string(batch.totalBatches));

        case BatchConsumer::ApplyResult::Applied:
        default:
            break;
    }

    if (!m_session.addTransferred(batch.records.size())) {
        const std::string message = "received more records than the " +
                                    std::to_string(m_session.totalRecords()) + " announced";
        m_session.fail(message);
        notifyObserver();
        return EnvelopeDisposition::rejected(message);
    }

    notifyObserver();
    return EnvelopeDisposition::accepted();
}

EnvelopeDisposition SessionController::applyTransferComplete(const TransferCompleteData& complete) {
    if (m_session.status() == SessionStatus::COMPLETED) {
        return EnvelopeDisposition::accepted();
    }
    if (m_session.mode() != TransferMode::RECEIVER || m_session.status() != SessionStatus::TRANSFERRING) {
        return EnvelopeDisposition::rejected(std::string(ErrorCodes::TRANSFER_INVALID_STATE) +
                                             ": completion in " +
                                             sessionStatusToString(m_session.status()) + " session");
    }

    // Both the announced total and the completion total must be met
    const size_t received = m_consumer.receivedCount();
    const uint64_t expected = m_consumer.hasExpectedTotal() ? m_consumer.expectedTotal()
                                                            : complete.totalMessages;
    if (received != complete.totalMessages || received != expected) {
        const uint64_t shown = received != expected ? expected : complete.totalMessages;
        const std::string message = std::string(ErrorCodes::TRANSFER_INCOMPLETE) +
                                    ": incomplete transfer: received " + std::to_string(received) +
                                    " of " + std::to_string(shown);
        m_session.fail(message);
        ThreadSafeLog::log("Session " + m_session.sessionId() + ": " + message);
        notifyObserver();
        return EnvelopeDisposition::rejected(message);
    }

    StoreWriteResult written;
    std::string storeError;
    if (!m_store.writeRecords(m_consumer.records(), written, storeError)) {
        // Store's cause is kept as-is
        m_session.fail(storeError);
        ThreadSafeLog::log("Session " + m_session.sessionId() + ": store write failed: " + storeError);
        notifyObserver();
        return EnvelopeDisposition::rejected(std::string(ErrorCodes::STORE_WRITE_FAILED) + ": " + storeError);
    }

    m_lastWrite = written;
    m_session.transitionTo(SessionStatus::COMPLETED);
    ThreadSafeLog::log("Session " + m_session.sessionId() + ": completed, " +
                       std::to_string(written.written) + " written, " +
                       std::to_string(written.skipped) + " duplicates skipped");
    LOG_INFO("[SessionController] Stored " << written.written << " records (" << written.skipped
             << " duplicates skipped)");
    notifyObserver();
    return EnvelopeDisposition::accepted();
}

void SessionController::recordInboundPeer(DeviceIdentity peer, const std::string& sessionId,
                                          const std::string& remoteIp) {
    if (peer.deviceId == m_localIdentity.deviceId) {
        return;
    }
    // Only a device paired with the live session is a send target; sweeps
    // and other senders announce themselves too
    if (!m_hasSession || sessionId.empty() || sessionId != m_session.sessionId()) {
        LOG_DEBUG("[SessionController] Ignoring announcement from " << peer.deviceName
                  << " for session '" << sessionId << "'");
        return;
    }
    // Reply to the address the announcement actually came from
    if (isIpv4Address(remoteIp)) {
        peer.ipAddress = remoteIp;
    }

    auto it = std::find_if(m_inboundPeers.begin(), m_inboundPeers.end(),
                           [&peer](const DeviceIdentity& known) { return known.deviceId == peer.deviceId; });
    if (it != m_inboundPeers.end()) {
        *it = peer;
        return;
    }

    LOG_INFO("[SessionController] " << peer.deviceName << " announced itself from " << peer.ipAddress);
    m_inboundPeers.push_back(peer);
}

//=============================================================================
// Peers and observation
//=============================================================================

std::vector<DeviceIdentity> SessionController::discoverPeers(const DeviceFoundCallback& onFound,
                                                             bool sameSessionOnly) {
    const DeviceIdentity self = localIdentity();
    const std::string sessionId = invoke([this]() { return currentSessionId(); });

    DiscoverySweep::Options options;
    options.port = self.port != 0 ? self.port : TRANSFER_PORT_DEFAULT;
    options.probeTimeoutMs = m_settings.probeTimeoutMs;
    options.sweepTimeoutMs = m_settings.sweepTimeoutMs;
    if (sameSessionOnly) {
        if (sessionId.empty()) {
            return {};
        }
        options.sessionFilter = sessionId;
    }

    DiscoverySweep sweep(m_transport, self, options);
    return sweep.run(sessionId, onFound);
}

std::vector<DeviceIdentity> SessionController::inboundPeers() {
    return invoke([this]() { return m_inboundPeers; });
}

TransferSession SessionController::snapshot() {
    return invoke([this]() { return m_session; });
}

double SessionController::progress() {
    return invoke([this]() { return m_session.progress(); });
}

void SessionController::setProgressCallback(SessionObserver observer) {
    invoke([this, &observer]() { m_observer = std::move(observer); });
}

StoreWriteResult SessionController::lastWriteResult() {
    return invoke([this]() { return m_lastWrite; });
}

SmsRecordList SessionController::receivedRecords() {
    return invoke([this]() { return m_consumer.records(); });
}

}  // namespace SmsBridge
