/**
 * @file SessionController.h
 * @brief Orchestration of one transfer session at a time
 */

#pragma once

#include "DeviceIdentity.h"
#include "DiscoverySweep.h"
#include "EnvelopeTransport.h"
#include "PairingPayload.h"
#include "RecordBatch.h"
#include "RecordStore.h"
#include "Settings.h"
#include "TransferServer.h"
#include "TransferSession.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace SmsBridge {

/**
 * @class SessionController
 * @brief Owns the listener and the single live TransferSession
 *
 * Architecture:
 * - One event-loop thread owns the session, the batch consumer, the list of
 *   inbound peers and the store hand-off
 * - Listener handler threads and the sender loop never touch that state
 *   directly; they post tasks to the loop and wait for the result
 * - The progress callback is invoked on the loop thread after every change
 *
 * Sender flow:
 * @code
 * SessionController controller(settings, identity, store);
 * std::string token, err;
 * controller.beginSenderSession(token, err);   // show token to the receiver
 * // ... wait for controller.inboundPeers() or run discoverPeers()
 * controller.sendBatchStream(peer, records, err);
 * @endcode
 *
 * Receiver flow:
 * @code
 * PairingCheck check;
 * controller.beginReceiverSession(token, check, err);
 * // batches arrive through the listener; the store is written on
 * // TRANSFER_COMPLETE and the session moves to completed
 * @endcode
 */
class SessionController {
public:
    /**
     * @param settings Runtime settings
     * @param localIdentity This device
     * @param store Record sink for received transfers (must outlive the controller)
     * @param transport Outbound requests (HttpClient when null)
     */
    SessionController(const Settings& settings,
                      const DeviceIdentity& localIdentity,
                      RecordStore& store,
                      std::shared_ptr<EnvelopeTransport> transport = nullptr);

    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    //=========================================================================
    // Listener
    //=========================================================================

    /**
     * @brief Start the HTTP listener (no-op when already listening)
     */
    bool startListening(std::string& errorMsg);

    void stopListening();

    bool isListening() const;

    /**
     * @brief Identity advertised by this device (listener port filled in)
     */
    DeviceIdentity localIdentity() const;

    //=========================================================================
    // Session lifecycle
    //=========================================================================

    /**
     * @brief Open a sender session and issue its pairing token
     * @param token Pairing token for the receiver
     * @param errorMsg Reason on failure
     *
     * Mints a session id, starts listening and moves to preparing.
     */
    bool beginSenderSession(std::string& token, std::string& errorMsg);

    /**
     * @brief Open a receiver session from a scanned pairing token
     * @param token Pairing token text
     * @param check Malformed / Expired / Accepted
     * @param errorMsg Reason on failure, prefixed with its error code
     * @return false when the token is rejected (no session is created) or
     *         the sender is unreachable (the session moves to error)
     *
     * On success the sender has been probed at /health, this device has
     * announced itself at the sender's /discover, and the session is
     * preparing.
     */
    bool beginReceiverSession(const std::string& token, PairingCheck& check, std::string& errorMsg);

    /**
     * @brief Stream records to the receiver
     * @param peer Receiver to send to
     * @param records Records to send
     * @param errorMsg Reason on failure
     * @return true when every batch and TRANSFER_COMPLETE were acknowledged
     *
     * Requires a sender session in preparing. Sends TRANSFER_REQUEST, then one
     * batch at a time (each waits for its acknowledgment, with the configured
     * delay between batches), then TRANSFER_COMPLETE. The first failed send
     * moves the session to error and stops the stream.
     */
    bool sendBatchStream(const DeviceIdentity& peer, const SmsRecordList& records, std::string& errorMsg);

    /**
     * @brief Fail the live session and tell the peer (best effort)
     */
    void abortSession(const std::string& reason);

    /**
     * @brief Discard the session and its accumulated records
     *
     * Leaves a fresh idle session with no id; nothing partial is persisted.
     */
    void reset();

    //=========================================================================
    // Peers
    //=========================================================================

    /**
     * @brief Sweep the local /24 for listening devices
     * @param onFound Per-device callback
     * @param sameSessionOnly Keep only devices paired with the live session
     */
    std::vector<DeviceIdentity> discoverPeers(const DeviceFoundCallback& onFound = DeviceFoundCallback(),
                                              bool sameSessionOnly = false);

    /**
     * @brief Devices that announced themselves through POST /discover for
     * the live session
     */
    std::vector<DeviceIdentity> inboundPeers();

    //=========================================================================
    // Observation
    //=========================================================================

    /**
     * @brief Copy of the live session
     */
    TransferSession snapshot();

    double progress();

    /**
     * @brief Observe every change to the live session (called on the loop thread)
     */
    void setProgressCallback(SessionObserver observer);

    /**
     * @brief Counts of the last successful store hand-off
     */
    StoreWriteResult lastWriteResult();

    /**
     * @brief Records accumulated by the receiver so far
     */
    SmsRecordList receivedRecords();

private:
    //=========================================================================
    // Event loop
    //=========================================================================

    void loopThreadFunc();
    void post(std::function<void()> task);

    /**
     * @brief Run fn on the loop thread and return its result
     *
     * Runs inline when already on the loop thread.
     */
    template <typename Fn>
    auto invoke(Fn fn) -> decltype(fn()) {
        using Result = decltype(fn());
        if (std::this_thread::get_id() == m_loopThreadId) {
            return fn();
        }
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> result = task->get_future();
        post([task]() { (*task)(); });
        return result.get();
    }

    //=========================================================================
    // Loop-thread helpers
    //=========================================================================

    EnvelopeDisposition applyEnvelope(const MessageEnvelope& envelope);
    EnvelopeDisposition applyTransferRequest(const TransferRequestData& request);
    EnvelopeDisposition applyBatch(const RecordBatch& batch);
    EnvelopeDisposition applyTransferComplete(const TransferCompleteData& complete);
    void recordInboundPeer(DeviceIdentity peer, const std::string& sessionId, const std::string& remoteIp);
    void openSession(const std::string& sessionId, TransferMode mode);
    bool failIfCurrent(const std::string& sessionId, const std::string& message);
    bool transitionIfCurrent(const std::string& sessionId, SessionStatus next);
    void notifyObserver();
    std::string currentSessionId();

    bool failSend(const std::string& sessionId, const std::string& message, std::string& errorMsg);

    //=========================================================================
    // Member Variables
    //=========================================================================

    // Configuration
    Settings m_settings;
    RecordStore& m_store;
    std::shared_ptr<EnvelopeTransport> m_transport;

    // Listener
    mutable std::mutex m_listenerMutex;
    DeviceIdentity m_localIdentity;
    TransferServer m_server;

    // Loop-owned state
    TransferSession m_session;
    bool m_hasSession;
    BatchConsumer m_consumer;
    std::vector<DeviceIdentity> m_inboundPeers;
    StoreWriteResult m_lastWrite;
    SessionObserver m_observer;

    // Event loop
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<std::function<void()>> m_tasks;
    bool m_loopStopping;
    bool m_loopExited;
    std::thread m_loopThread;
    std::thread::id m_loopThreadId;
};

}  // namespace SmsBridge
