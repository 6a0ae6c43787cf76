/**
 * @file SmsRecord.cpp
 * @brief SmsRecord JSON mapping
 */

#include "smsbridge/SmsRecord.h"

#include <cstdlib>

namespace SmsBridge {

namespace {

// The platform provider hands out ids and dates as either numbers or strings
bool readLooseString(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<int64_t>());
        return true;
    }
    return false;
}

bool readLooseInt(const nlohmann::json& v, int64_t& out) {
    if (v.is_number_integer()) {
        out = v.get<int64_t>();
        return true;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s.empty()) {
            return false;
        }
        char* end = nullptr;
        const long long parsed = std::strtoll(s.c_str(), &end, 10);
        if (end == nullptr || *end != '\0') {
            return false;
        }
        out = static_cast<int64_t>(parsed);
        return true;
    }
    return false;
}

} // anonymous namespace

std::string messageTypeFromKind(int kind) {
    switch (kind) {
        case 1: return "Received";
        case 2: return "Sent";
        case 3: return "Draft";
        case 4: return "Outbox";
        case 5: return "Failed";
        case 6: return "Queued";
        default: return "Unknown";
    }
}

nlohmann::json SmsRecord::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["address"] = address;
    j["body"] = body;
    j["date"] = dateMs;
    j["read"] = isRead ? 1 : 0;
    j["type"] = isSent ? 2 : 1;
    if (threadId) {
        j["thread_id"] = *threadId;
    } else {
        j["thread_id"] = nullptr;
    }
    j["message_type"] = messageType;
    return j;
}

bool SmsRecord::fromJson(const nlohmann::json& j, SmsRecord& out, std::string& errorMsg) {
    errorMsg.clear();

    if (!j.is_object()) {
        errorMsg = "record is not an object";
        return false;
    }

    SmsRecord r;
    if (!j.contains("id") || !readLooseString(j["id"], r.id)) {
        errorMsg = "record missing 'id'";
        return false;
    }
    if (!j.contains("address") || !j["address"].is_string()) {
        errorMsg = "record missing 'address'";
        return false;
    }
    if (!j.contains("body") || !j["body"].is_string()) {
        errorMsg = "record missing 'body'";
        return false;
    }
    if (!j.contains("date") || !readLooseInt(j["date"], r.dateMs)) {
        errorMsg = "record missing 'date'";
        return false;
    }
    r.address = j["address"].get<std::string>();
    r.body = j["body"].get<std::string>();

    if (j.contains("read")) {
        const auto& read = j["read"];
        r.isRead = (read.is_boolean() && read.get<bool>()) ||
                   (read.is_number_integer() && read.get<int64_t>() == 1);
    }

    int64_t kind = 0;
    if (j.contains("type") && readLooseInt(j["type"], kind)) {
        r.isSent = (kind == 2);
    }

    if (j.contains("thread_id") && !j["thread_id"].is_null()) {
        std::string thread;
        if (readLooseString(j["thread_id"], thread)) {
            r.threadId = thread;
        }
    }

    if (j.contains("message_type") && j["message_type"].is_string()) {
        r.messageType = j["message_type"].get<std::string>();
    } else {
        r.messageType = messageTypeFromKind(static_cast<int>(kind));
    }

    out = std::move(r);
    return true;
}

nlohmann::json recordsToJson(const SmsRecordList& records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) {
        arr.push_back(r.toJson());
    }
    return arr;
}

bool recordsFromJson(const nlohmann::json& j, SmsRecordList& out, std::string& errorMsg) {
    errorMsg.clear();
    if (!j.is_array()) {
        errorMsg = "records is not an array";
        return false;
    }

    SmsRecordList records;
    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        SmsRecord r;
        std::string err;
        if (!SmsRecord::fromJson(j[i], r, err)) {
            errorMsg = "record " + std::to_string(i) + ": " + err;
            return false;
        }
        records.push_back(std::move(r));
    }

    out = std::move(records);
    return true;
}

}  // namespace SmsBridge
