/**
 * @file RecordBatch.h
 * @brief Batch unit of the record transfer, with producer and consumer
 */

#pragma once

#include "SmsRecord.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace SmsBridge {

//=============================================================================
// RecordBatch
//=============================================================================

/**
 * @brief One chunk of the record set
 *
 * JSON keys: messages, batch_number, total_batches, session_id.
 */
struct RecordBatch {
    SmsRecordList records;
    uint32_t batchNumber = 0;    ///< 1-based
    uint32_t totalBatches = 0;
    std::string sessionId;

    nlohmann::json toJson() const;
    static bool fromJson(const nlohmann::json& j, RecordBatch& out, std::string& errorMsg);
};

//=============================================================================
// BatchProducer
//=============================================================================

/**
 * @class BatchProducer
 * @brief Splits a record collection into numbered batches on demand
 *
 * Batches are built lazily by next(); the sequence can only be restarted from
 * the beginning via rewind(). The producer keeps a reference to the records,
 * which must outlive it.
 *
 * Usage:
 * @code
 * BatchProducer producer(records, 100, sessionId);
 * RecordBatch batch;
 * while (producer.next(batch)) {
 *     // send batch, stop on failure
 * }
 * @endcode
 */
class BatchProducer {
public:
    /**
     * @param records Full record collection
     * @param batchSize Records per batch (0 is treated as 1)
     * @param sessionId Session id stamped on every batch
     */
    BatchProducer(const SmsRecordList& records, size_t batchSize, const std::string& sessionId);

    /**
     * @brief Produce the next batch
     * @return false once all batches have been produced
     */
    bool next(RecordBatch& out);

    /**
     * @brief Restart the sequence from batch 1
     */
    void rewind() { m_nextIndex = 0; }

    uint32_t totalBatches() const { return m_totalBatches; }
    size_t totalRecords() const { return m_records.size(); }

    /**
     * @brief Number of batches needed for count records
     */
    static uint32_t batchCount(size_t count, size_t batchSize);

private:
    const SmsRecordList& m_records;
    size_t m_batchSize;
    std::string m_sessionId;
    uint32_t m_totalBatches;
    size_t m_nextIndex;
};

//=============================================================================
// BatchConsumer
//=============================================================================

/**
 * @class BatchConsumer
 * @brief Accumulates arriving batches in arrival order
 *
 * A batch whose number was already applied is acknowledged but not applied
 * again, so a re-delivered batch does not duplicate records.
 *
 * Not thread-safe; owned by the session controller's event loop.
 */
class BatchConsumer {
public:
    enum class ApplyResult : uint8_t {
        Applied,    ///< Records appended
        Duplicate,  ///< Batch number seen before, nothing appended
        Invalid     ///< Batch number is 0 or exceeds totalBatches
    };

    BatchConsumer() : m_expectedTotal(0), m_hasExpectedTotal(false) {}

    /**
     * @brief Record the total announced by TRANSFER_REQUEST
     */
    void setExpectedTotal(size_t total) {
        m_expectedTotal = total;
        m_hasExpectedTotal = true;
    }

    ApplyResult apply(const RecordBatch& batch);

    const SmsRecordList& records() const { return m_records; }
    size_t receivedCount() const { return m_records.size(); }
    size_t expectedTotal() const { return m_expectedTotal; }
    bool hasExpectedTotal() const { return m_hasExpectedTotal; }
    size_t batchesApplied() const { return m_appliedBatches.size(); }

    /**
     * @brief True when a total was announced and that many records arrived
     */
    bool isComplete() const {
        return m_hasExpectedTotal && m_records.size() >= m_expectedTotal;
    }

    /**
     * @brief Drop all accumulated state
     */
    void clear();

private:
    SmsRecordList m_records;
    std::set<uint32_t> m_appliedBatches;
    size_t m_expectedTotal;
    bool m_hasExpectedTotal;
};

}  // namespace SmsBridge
