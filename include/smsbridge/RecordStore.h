/**
 * @file RecordStore.h
 * @brief Record source/sink used at both ends of a transfer
 */

#pragma once

#include "SmsRecord.h"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>

namespace SmsBridge {

/**
 * @brief Result of a store write
 */
struct StoreWriteResult {
    size_t written = 0;   ///< Records added to the store
    size_t skipped = 0;   ///< Records matching an existing entry
};

//=============================================================================
// RecordStore Interface
//=============================================================================

/**
 * @class RecordStore
 * @brief Abstract record source/sink
 *
 * The sender reads its full record set from a store; the receiver hands the
 * accumulated set to a store once the transfer completes. Implementations
 * decide where records live.
 *
 * A record is a duplicate of a stored one when address and body are equal
 * and the dates are within DUPLICATE_WINDOW_MS of each other. Duplicates are
 * skipped and counted, not reported as errors.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @brief Read every stored record
     */
    virtual bool readAll(SmsRecordList& out, std::string& errorMsg) = 0;

    /**
     * @brief Add records, skipping duplicates of already stored ones
     * @param records Records to add
     * @param result Written and skipped counts
     * @param errorMsg Underlying cause on failure (kept verbatim by callers)
     * @return false if nothing could be persisted
     */
    virtual bool writeRecords(const SmsRecordList& records,
                              StoreWriteResult& result,
                              std::string& errorMsg) = 0;
};

/**
 * @brief True when candidate duplicates existing under the store rule
 */
bool isDuplicateRecord(const SmsRecord& existing, const SmsRecord& candidate);

/**
 * @brief Merge incoming into existing, appending non-duplicates
 *
 * Incoming records are also checked against each other.
 */
StoreWriteResult mergeRecords(SmsRecordList& existing, const SmsRecordList& incoming);

/**
 * @brief Source-side de-duplication before sending
 *
 * Keeps the first record of each (address, body, date rounded down to the
 * minute) group, preserving order.
 */
SmsRecordList deduplicateRecords(const SmsRecordList& records);

//=============================================================================
// InMemoryRecordStore
//=============================================================================

/**
 * @class InMemoryRecordStore
 * @brief Thread-safe in-process store
 */
class InMemoryRecordStore : public RecordStore {
public:
    InMemoryRecordStore() = default;
    explicit InMemoryRecordStore(SmsRecordList initial) : m_records(std::move(initial)) {}

    bool readAll(SmsRecordList& out, std::string& errorMsg) override;
    bool writeRecords(const SmsRecordList& records,
                      StoreWriteResult& result,
                      std::string& errorMsg) override;

    /**
     * @brief Make subsequent writes fail with the given cause (empty clears)
     */
    void setWriteFailure(const std::string& cause);

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    SmsRecordList m_records;
    std::string m_writeFailure;
};

//=============================================================================
// JsonFileRecordStore
//=============================================================================

/**
 * @class JsonFileRecordStore
 * @brief Store backed by a JSON array file
 *
 * A missing file reads as an empty store. A file that does not parse is an
 * error and is never overwritten. Writes replace the file atomically.
 */
class JsonFileRecordStore : public RecordStore {
public:
    explicit JsonFileRecordStore(const std::filesystem::path& path) : m_path(path) {}

    bool readAll(SmsRecordList& out, std::string& errorMsg) override;
    bool writeRecords(const SmsRecordList& records,
                      StoreWriteResult& result,
                      std::string& errorMsg) override;

    const std::filesystem::path& path() const { return m_path; }

private:
    bool readLocked(SmsRecordList& out, std::string& errorMsg);

    std::filesystem::path m_path;
    std::mutex m_mutex;
};

}  // namespace SmsBridge
