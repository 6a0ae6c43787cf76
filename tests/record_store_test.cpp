/**
 * @file record_store_test.cpp
 * @brief Tests for duplicate rules, the record stores and atomic writes.
 */

#include "smsbridge/AtomicFile.h"
#include "smsbridge/ErrorCodes.h"
#include "smsbridge/RecordStore.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>

using namespace SmsBridge;

namespace {

SmsRecord record(const std::string& address, const std::string& body, int64_t dateMs) {
    SmsRecord r;
    r.id = address + body;
    r.address = address;
    r.body = body;
    r.dateMs = dateMs;
    return r;
}

}  // namespace

TEST(AtomicFileTest, ComputePathsAddsPartSuffix) {
    const auto p = computeAtomicFilePaths(std::filesystem::path("/tmp/example.json"));
    EXPECT_EQ(p.finalPath, std::filesystem::path("/tmp/example.json"));
    EXPECT_EQ(p.tempPath, std::filesystem::path("/tmp/example.json.part"));
}

TEST(AtomicFileTest, WriteReplacesContentAndLeavesNoTemp) {
    const auto dir = SmsBridge::Test::scratchDir("atomic_file");
    const auto target = dir / "nested" / "out.json";

    std::string err;
    ASSERT_TRUE(writeFileAtomically(target, "first", err)) << err;
    ASSERT_TRUE(writeFileAtomically(target, "second", err)) << err;

    std::string content;
    ASSERT_TRUE(readWholeFile(target, content, err)) << err;
    EXPECT_EQ(content, "second");
    EXPECT_FALSE(std::filesystem::exists(computeAtomicFilePaths(target).tempPath));
}

TEST(AtomicFileTest, ReadMissingFileFails) {
    std::string content, err;
    EXPECT_FALSE(readWholeFile(SmsBridge::Test::scratchDir("atomic_missing") / "nope", content, err));
    EXPECT_FALSE(err.empty());
}

TEST(RecordStoreTest, DuplicateNeedsSameAddressBodyWithinFiveMinutes) {
    const int64_t t = 1710408413589LL;
    EXPECT_TRUE(isDuplicateRecord(record("+1", "hi", t), record("+1", "hi", t + 4 * 60000)));
    EXPECT_FALSE(isDuplicateRecord(record("+1", "hi", t), record("+1", "hi", t + 6 * 60000)));
    EXPECT_FALSE(isDuplicateRecord(record("+1", "hi", t), record("+2", "hi", t)));
    EXPECT_FALSE(isDuplicateRecord(record("+1", "hi", t), record("+1", "hey", t)));
}

TEST(RecordStoreTest, MergeCountsWrittenAndSkipped) {
    const int64_t t = 1710408413589LL;
    SmsRecordList existing = {record("+1", "hi", t)};
    const SmsRecordList incoming = {record("+1", "hi", t + 1000),
                                    record("+1", "later", t),
                                    record("+1", "later", t + 2000)};

    const StoreWriteResult r = mergeRecords(existing, incoming);
    EXPECT_EQ(r.written, 1u);
    EXPECT_EQ(r.skipped, 2u);
    EXPECT_EQ(existing.size(), 2u);
}

TEST(RecordStoreTest, MergeWindowIsOpenOnBothSides) {
    const int64_t t = 1710408413589LL;
    const int64_t window = 5 * 60000;
    SmsRecordList existing = {record("+1", "hi", t)};
    const SmsRecordList incoming = {record("+1", "hi", t - window + 1),
                                    record("+1", "hi", t + window - 1),
                                    record("+1", "hi", t + window),
                                    record("+1", "hi", t - window)};

    const StoreWriteResult r = mergeRecords(existing, incoming);
    EXPECT_EQ(r.skipped, 2u);
    EXPECT_EQ(r.written, 2u);
    ASSERT_EQ(existing.size(), 3u);
    EXPECT_EQ(existing[1].dateMs, t + window);
    EXPECT_EQ(existing[2].dateMs, t - window);
}

TEST(RecordStoreTest, MergeOfLargeResendStaysFast) {
    const SmsRecordList all = SmsBridge::Test::makeRecords(60000);
    SmsRecordList existing(all.begin(), all.begin() + 40000);
    // Second half of a previous transfer plus 20000 new records
    const SmsRecordList incoming(all.begin() + 20000, all.end());

    const auto begin = std::chrono::steady_clock::now();
    const StoreWriteResult r = mergeRecords(existing, incoming);
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(r.skipped, 20000u);
    EXPECT_EQ(r.written, 20000u);
    EXPECT_EQ(existing.size(), 60000u);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(RecordStoreTest, SourceDedupKeysOnMinute) {
    const int64_t minuteStart = 1710408360000LL;
    const SmsRecordList records = {record("+1", "hi", minuteStart + 1000),
                                   record("+1", "hi", minuteStart + 59000),
                                   record("+1", "hi", minuteStart + 61000),
                                   record("+2", "hi", minuteStart + 1000)};
    const auto out = deduplicateRecords(records);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].dateMs, minuteStart + 1000);
    EXPECT_EQ(out[1].dateMs, minuteStart + 61000);
    EXPECT_EQ(out[2].address, "+2");
}

TEST(RecordStoreTest, InMemoryStoreHonoursWriteFailure) {
    InMemoryRecordStore store;
    StoreWriteResult r;
    std::string err;

    ASSERT_TRUE(store.writeRecords(SmsBridge::Test::makeRecords(3), r, err)) << err;
    EXPECT_EQ(r.written, 3u);
    EXPECT_EQ(store.size(), 3u);

    store.setWriteFailure("database is locked");
    EXPECT_FALSE(store.writeRecords(SmsBridge::Test::makeRecords(1), r, err));
    EXPECT_EQ(err, "database is locked");
    EXPECT_EQ(store.size(), 3u);
}

TEST(RecordStoreTest, JsonFileStorePersistsAndSkipsDuplicates) {
    const auto file = SmsBridge::Test::scratchDir("json_store") / "records.json";
    const auto records = SmsBridge::Test::makeRecords(4);

    {
        JsonFileRecordStore store(file);
        SmsRecordList empty;
        std::string err;
        ASSERT_TRUE(store.readAll(empty, err)) << err;
        EXPECT_TRUE(empty.empty());

        StoreWriteResult r;
        ASSERT_TRUE(store.writeRecords(records, r, err)) << err;
        EXPECT_EQ(r.written, 4u);
    }

    JsonFileRecordStore reopened(file);
    StoreWriteResult again;
    std::string err;
    ASSERT_TRUE(reopened.writeRecords(records, again, err)) << err;
    EXPECT_EQ(again.written, 0u);
    EXPECT_EQ(again.skipped, 4u);

    SmsRecordList stored;
    ASSERT_TRUE(reopened.readAll(stored, err)) << err;
    EXPECT_EQ(stored, records);
}

TEST(RecordStoreTest, CorruptFileIsAnErrorAndLeftAlone) {
    const auto file = SmsBridge::Test::scratchDir("json_store_corrupt") / "records.json";
    {
        std::ofstream out(file);
        out << "[{\"id\": ";
    }

    JsonFileRecordStore store(file);
    SmsRecordList out;
    StoreWriteResult r;
    std::string err;
    EXPECT_FALSE(store.readAll(out, err));
    EXPECT_EQ(err.rfind(ErrorCodes::STORE_READ_FAILED, 0), 0u) << err;
    EXPECT_FALSE(store.writeRecords(SmsBridge::Test::makeRecords(1), r, err));
    EXPECT_NE(err.find("corrupt"), std::string::npos);

    std::string content;
    ASSERT_TRUE(readWholeFile(file, content, err));
    EXPECT_EQ(content, "[{\"id\": ");
}

TEST(SmsRecordTest, AcceptsNumericOrStringIdsAndDates) {
    const auto j = nlohmann::json::parse(
        R"({"id": 17, "address": "+15550001", "body": "hi", "date": "1710408413589", "read": 1, "type": 2, "thread_id": 4})");
    SmsRecord r;
    std::string err;
    ASSERT_TRUE(SmsRecord::fromJson(j, r, err)) << err;
    EXPECT_EQ(r.id, "17");
    EXPECT_EQ(r.dateMs, 1710408413589LL);
    EXPECT_TRUE(r.isRead);
    EXPECT_TRUE(r.isSent);
    ASSERT_TRUE(r.threadId.has_value());
    EXPECT_EQ(*r.threadId, "4");
    EXPECT_EQ(r.messageType, "Sent");
}

TEST(SmsRecordTest, MissingBodyIsRejected) {
    SmsRecord r;
    std::string err;
    EXPECT_FALSE(SmsRecord::fromJson(nlohmann::json::parse(R"({"id":"1","address":"+1","date":0})"), r, err));
    EXPECT_NE(err.find("body"), std::string::npos);
}
