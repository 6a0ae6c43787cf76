/**
 * @file message_envelope_test.cpp
 * @brief Tests for type-directed envelope encoding and decoding.
 */

#include "smsbridge/MessageEnvelope.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace SmsBridge;

TEST(MessageEnvelopeTest, TypeNamesRoundTrip) {
    const EnvelopeType all[] = {EnvelopeType::DISCOVERY, EnvelopeType::DISCOVERY_RESPONSE,
                                EnvelopeType::TRANSFER_REQUEST, EnvelopeType::SMS_DATA,
                                EnvelopeType::TRANSFER_COMPLETE, EnvelopeType::ERROR};
    for (EnvelopeType t : all) {
        EnvelopeType parsed;
        ASSERT_TRUE(envelopeTypeFromString(envelopeTypeToString(t), parsed));
        EXPECT_EQ(parsed, t);
    }
    EnvelopeType ignored;
    EXPECT_FALSE(envelopeTypeFromString("HELLO", ignored));
}

TEST(MessageEnvelopeTest, EnvelopeJsonHasHeaderFields) {
    const auto j = MessageEnvelope::transferRequest("sess_1", 250).toJson();
    EXPECT_EQ(j["type"], "TRANSFER_REQUEST");
    EXPECT_EQ(j["session_id"], "sess_1");
    EXPECT_TRUE(j["timestamp"].is_string());
    EXPECT_EQ(j["data"]["total_messages"], 250);
}

TEST(MessageEnvelopeTest, SmsDataDecodesToBatch) {
    RecordBatch batch;
    batch.records = SmsBridge::Test::makeRecords(3);
    batch.batchNumber = 2;
    batch.totalBatches = 3;
    batch.sessionId = "sess_1";
    const auto envelope = MessageEnvelope::smsData(batch);
    EXPECT_EQ(envelope.sessionId(), "sess_1");

    MessageEnvelope decoded;
    std::string err;
    ASSERT_TRUE(MessageEnvelope::fromJsonString(envelope.toJsonString(), decoded, err)) << err;
    EXPECT_EQ(decoded.type(), EnvelopeType::SMS_DATA);

    const RecordBatch* got = decoded.payloadAs<RecordBatch>();
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->batchNumber, 2u);
    EXPECT_EQ(got->totalBatches, 3u);
    EXPECT_EQ(got->records, batch.records);
    EXPECT_EQ(decoded.payloadAs<ErrorData>(), nullptr);
}

TEST(MessageEnvelopeTest, DiscoveryDecodesToIdentity) {
    const DeviceIdentity self = SmsBridge::Test::makeIdentity("dev-a", "10.0.0.5", 9090);
    MessageEnvelope decoded;
    std::string err;
    ASSERT_TRUE(MessageEnvelope::fromJsonString(
        MessageEnvelope::discoveryResponse("", self).toJsonString(), decoded, err)) << err;
    EXPECT_EQ(decoded.type(), EnvelopeType::DISCOVERY_RESPONSE);
    ASSERT_NE(decoded.payloadAs<DeviceIdentity>(), nullptr);
    EXPECT_EQ(*decoded.payloadAs<DeviceIdentity>(), self);
}

TEST(MessageEnvelopeTest, CompleteAndErrorPayloads) {
    MessageEnvelope decoded;
    std::string err;

    ASSERT_TRUE(MessageEnvelope::fromJsonString(
        MessageEnvelope::transferComplete("s", 42).toJsonString(), decoded, err)) << err;
    ASSERT_NE(decoded.payloadAs<TransferCompleteData>(), nullptr);
    EXPECT_EQ(decoded.payloadAs<TransferCompleteData>()->totalMessages, 42u);
    EXPECT_FALSE(decoded.payloadAs<TransferCompleteData>()->completedAt.empty());

    ASSERT_TRUE(MessageEnvelope::fromJsonString(
        MessageEnvelope::error("s", "disk full").toJsonString(), decoded, err)) << err;
    ASSERT_NE(decoded.payloadAs<ErrorData>(), nullptr);
    EXPECT_EQ(decoded.payloadAs<ErrorData>()->error, "disk full");
}

TEST(MessageEnvelopeTest, DataMustMatchType) {
    MessageEnvelope decoded;
    std::string err;

    // SMS_DATA carrying a transfer-request body
    EXPECT_FALSE(MessageEnvelope::fromJsonString(
        R"({"type":"SMS_DATA","session_id":"s","timestamp":"2024-03-14T09:26:53.589Z","data":{"total_messages":3}})",
        decoded, err));
    EXPECT_NE(err.find("SMS_DATA"), std::string::npos);

    // TRANSFER_REQUEST with a negative total
    EXPECT_FALSE(MessageEnvelope::fromJsonString(
        R"({"type":"TRANSFER_REQUEST","session_id":"s","data":{"total_messages":-1}})", decoded, err));

    // Unknown type
    EXPECT_FALSE(MessageEnvelope::fromJsonString(
        R"({"type":"PING","session_id":"s","data":{}})", decoded, err));

    // Missing data
    EXPECT_FALSE(MessageEnvelope::fromJsonString(R"({"type":"ERROR","session_id":"s"})", decoded, err));

    // Not JSON
    EXPECT_FALSE(MessageEnvelope::fromJsonString("<html>", decoded, err));
}

TEST(MessageEnvelopeTest, InvalidUtf8TextIsReplacedWhenSerialized) {
    const MessageEnvelope env = MessageEnvelope::error("s", std::string("bad byte \xff here"));
    std::string text;
    ASSERT_NO_THROW(text = env.toJsonString());

    MessageEnvelope back;
    std::string err;
    ASSERT_TRUE(MessageEnvelope::fromJsonString(text, back, err)) << err;
    ASSERT_NE(back.payloadAs<ErrorData>(), nullptr);
    EXPECT_EQ(back.payloadAs<ErrorData>()->error, "bad byte \xef\xbf\xbd here");
}

TEST(MessageEnvelopeTest, AckCarriesStatusAndSession) {
    const auto ack = makeAck("received", "sess_9");
    EXPECT_EQ(ack["status"], "received");
    EXPECT_EQ(ack["session_id"], "sess_9");
    EXPECT_TRUE(ack["timestamp"].is_string());
}
