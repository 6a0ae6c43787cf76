/**
 * @file RecordBatch.cpp
 * @brief Batch JSON mapping, producer and consumer
 */

#include "smsbridge/RecordBatch.h"

#include <algorithm>

namespace SmsBridge {

//=============================================================================
// RecordBatch
//=============================================================================

nlohmann::json RecordBatch::toJson() const {
    nlohmann::json j;
    j["messages"] = recordsToJson(records);
    j["batch_number"] = batchNumber;
    j["total_batches"] = totalBatches;
    j["session_id"] = sessionId;
    return j;
}

bool RecordBatch::fromJson(const nlohmann::json& j, RecordBatch& out, std::string& errorMsg) {
    errorMsg.clear();

    if (!j.is_object()) {
        errorMsg = "batch is not an object";
        return false;
    }
    if (!j.contains("messages")) {
        errorMsg = "batch missing 'messages'";
        return false;
    }
    if (!j.contains("batch_number") || !j["batch_number"].is_number_unsigned()) {
        errorMsg = "batch missing 'batch_number'";
        return false;
    }
    if (!j.contains("total_batches") || !j["total_batches"].is_number_unsigned()) {
        errorMsg = "batch missing 'total_batches'";
        return false;
    }

    RecordBatch b;
    std::string err;
    if (!recordsFromJson(j["messages"], b.records, err)) {
        errorMsg = "batch " + err;
        return false;
    }
    b.batchNumber = j["batch_number"].get<uint32_t>();
    b.totalBatches = j["total_batches"].get<uint32_t>();
    if (j.contains("session_id") && j["session_id"].is_string()) {
        b.sessionId = j["session_id"].get<std::string>();
    }

    out = std::move(b);
    return true;
}

//=============================================================================
// BatchProducer
//=============================================================================

BatchProducer::BatchProducer(const SmsRecordList& records, size_t batchSize,
                             const std::string& sessionId)
    : m_records(records)
    , m_batchSize(batchSize == 0 ? 1 : batchSize)
    , m_sessionId(sessionId)
    , m_totalBatches(batchCount(records.size(), batchSize))
    , m_nextIndex(0)
{
}

uint32_t BatchProducer::batchCount(size_t count, size_t batchSize) {
    if (batchSize == 0) {
        batchSize = 1;
    }
    return static_cast<uint32_t>((count + batchSize - 1) / batchSize);
}

bool BatchProducer::next(RecordBatch& out) {
    if (m_nextIndex >= m_totalBatches) {
        return false;
    }

    const size_t begin = m_nextIndex * m_batchSize;
    const size_t end = std::min(begin + m_batchSize, m_records.size());

    RecordBatch batch;
    batch.records.assign(m_records.begin() + static_cast<std::ptrdiff_t>(begin),
                         m_records.begin() + static_cast<std::ptrdiff_t>(end));
    batch.batchNumber = static_cast<uint32_t>(m_nextIndex + 1);
    batch.totalBatches = m_totalBatches;
    batch.sessionId = m_sessionId;

    ++m_nextIndex;
    out = std::move(batch);
    return true;
}

//=============================================================================
// BatchConsumer
//=============================================================================

BatchConsumer::ApplyResult BatchConsumer::apply(const RecordBatch& batch) {
    if (batch.batchNumber == 0 ||
        (batch.totalBatches != 0 && batch.batchNumber > batch.totalBatches)) {
        return ApplyResult::Invalid;
    }
    if (!m_appliedBatches.insert(batch.batchNumber).second) {
        return ApplyResult::Duplicate;
    }
    m_records.insert(m_records.end(), batch.records.begin(), batch.records.end());
    return ApplyResult::Applied;
}

void BatchConsumer::clear() {
    m_records.clear();
    m_appliedBatches.clear();
    m_expectedTotal = 0;
    m_hasExpectedTotal = false;
}

}  // namespace SmsBridge
