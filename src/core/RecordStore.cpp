/**
 * @file RecordStore.cpp
 * @brief Record store implementations and duplicate rules
 */

#include "smsbridge/RecordStore.h"
#include "smsbridge/AtomicFile.h"
#include "smsbridge/ErrorCodes.h"
#include "smsbridge/config.h"

#include <cstdlib>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace SmsBridge {

//=============================================================================
// Duplicate rules
//=============================================================================

bool isDuplicateRecord(const SmsRecord& existing, const SmsRecord& candidate) {
    if (existing.address != candidate.address || existing.body != candidate.body) {
        return false;
    }
    return std::llabs(existing.dateMs - candidate.dateMs) < DUPLICATE_WINDOW_MS;
}

namespace {

std::string conversationKey(const SmsRecord& r) {
    std::string key = r.address;
    key += '\x1f';
    key += r.body;
    return key;
}

} // anonymous namespace

StoreWriteResult mergeRecords(SmsRecordList& existing, const SmsRecordList& incoming) {
    StoreWriteResult result;
    existing.reserve(existing.size() + incoming.size());

    // Dates per address/body pair, so the window check is a single lookup
    std::unordered_map<std::string, std::set<int64_t>> dates;
    dates.reserve(existing.size() + incoming.size());
    for (const auto& stored : existing) {
        dates[conversationKey(stored)].insert(stored.dateMs);
    }

    for (const auto& candidate : incoming) {
        std::set<int64_t>& known = dates[conversationKey(candidate)];
        const auto nearest = known.lower_bound(candidate.dateMs - DUPLICATE_WINDOW_MS + 1);
        if (nearest != known.end() && *nearest < candidate.dateMs + DUPLICATE_WINDOW_MS) {
            ++result.skipped;
            continue;
        }
        known.insert(candidate.dateMs);
        existing.push_back(candidate);
        ++result.written;
    }
    return result;
}

SmsRecordList deduplicateRecords(const SmsRecordList& records) {
    SmsRecordList out;
    out.reserve(records.size());
    std::unordered_set<std::string> seen;

    for (const auto& r : records) {
        const int64_t minute = r.dateMs / 60000;
        std::string key = r.address;
        key += '\x1f';
        key += r.body;
        key += '\x1f';
        key += std::to_string(minute);
        if (seen.insert(std::move(key)).second) {
            out.push_back(r);
        }
    }
    return out;
}

//=============================================================================
// InMemoryRecordStore
//=============================================================================

bool InMemoryRecordStore::readAll(SmsRecordList& out, std::string& errorMsg) {
    errorMsg.clear();
    std::lock_guard<std::mutex> lock(m_mutex);
    out = m_records;
    return true;
}

bool InMemoryRecordStore::writeRecords(const SmsRecordList& records,
                                       StoreWriteResult& result,
                                       std::string& errorMsg) {
    errorMsg.clear();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_writeFailure.empty()) {
        errorMsg = m_writeFailure;
        return false;
    }
    result = mergeRecords(m_records, records);
    return true;
}

void InMemoryRecordStore::setWriteFailure(const std::string& cause) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_writeFailure = cause;
}

size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

//=============================================================================
// JsonFileRecordStore
//=============================================================================

bool JsonFileRecordStore::readLocked(SmsRecordList& out, std::string& errorMsg) {
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        out.clear();
        return true;
    }

    std::string content;
    std::string readErr;
    if (!readWholeFile(m_path, content, readErr)) {
        errorMsg = std::string(ErrorCodes::STORE_READ_FAILED) + ": " + readErr;
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        errorMsg = std::string(ErrorCodes::STORE_READ_FAILED) + ": record file " + m_path.string() +
                   " is corrupt: " + e.what();
        return false;
    }

    std::string err;
    if (!recordsFromJson(j, out, err)) {
        errorMsg = std::string(ErrorCodes::STORE_READ_FAILED) + ": record file " + m_path.string() + ": " + err;
        return false;
    }
    return true;
}

bool JsonFileRecordStore::readAll(SmsRecordList& out, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return readLocked(out, errorMsg);
}

bool JsonFileRecordStore::writeRecords(const SmsRecordList& records,
                                       StoreWriteResult& result,
                                       std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);

    SmsRecordList existing;
    if (!readLocked(existing, errorMsg)) {
        return false;
    }

    const StoreWriteResult merged = mergeRecords(existing, records);
    std::error_code ec;
    if (merged.written > 0 || !std::filesystem::exists(m_path, ec)) {
        if (!writeFileAtomically(m_path, recordsToJson(existing).dump(2), errorMsg)) {
            return false;
        }
    }

    result = merged;
    return true;
}

}  // namespace SmsBridge
