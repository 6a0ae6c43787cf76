/**
 * @file Settings.cpp
 * @brief Settings JSON mapping and persistence
 */

#include "smsbridge/Settings.h"
#include "smsbridge/AtomicFile.h"

namespace SmsBridge {

namespace {

bool readUnsigned(const nlohmann::json& j, const char* key, uint64_t minValue, uint64_t maxValue,
                  uint64_t& out, std::string& errorMsg) {
    if (!j.contains(key)) {
        return true;
    }
    const auto& v = j[key];
    if (!v.is_number_unsigned()) {
        errorMsg = std::string("setting '") + key + "' must be a non-negative integer";
        return false;
    }
    const uint64_t value = v.get<uint64_t>();
    if (value < minValue || value > maxValue) {
        errorMsg = std::string("setting '") + key + "' out of range [" +
                   std::to_string(minValue) + ", " + std::to_string(maxValue) + "]";
        return false;
    }
    out = value;
    return true;
}

} // anonymous namespace

nlohmann::json Settings::toJson() const {
    nlohmann::json j;
    j["device_name"] = deviceName;
    j["transfer_port"] = transferPort;
    j["batch_size"] = batchSize;
    j["batch_delay_ms"] = batchDelayMs;
    j["probe_timeout_ms"] = probeTimeoutMs;
    j["sweep_timeout_ms"] = sweepTimeoutMs;
    j["request_timeout_ms"] = requestTimeoutMs;
    j["strict_session_match"] = strictSessionMatch;
    j["log_file"] = logFile;
    j["log_level"] = logLevelToString(logLevel);
    return j;
}

bool Settings::applyJson(const nlohmann::json& j, std::string& errorMsg) {
    errorMsg.clear();

    if (!j.is_object()) {
        errorMsg = "settings must be a JSON object";
        return false;
    }

    Settings next = *this;

    if (j.contains("device_name")) {
        if (!j["device_name"].is_string()) {
            errorMsg = "setting 'device_name' must be a string";
            return false;
        }
        next.deviceName = j["device_name"].get<std::string>();
        if (next.deviceName.size() > MAX_DEVICE_NAME) {
            next.deviceName.resize(MAX_DEVICE_NAME);
        }
    }

    uint64_t port = next.transferPort;
    uint64_t batchSizeValue = next.batchSize;
    uint64_t delay = next.batchDelayMs;
    uint64_t probe = next.probeTimeoutMs;
    uint64_t sweep = next.sweepTimeoutMs;
    uint64_t request = next.requestTimeoutMs;

    if (!readUnsigned(j, "transfer_port", 1, 65535, port, errorMsg) ||
        !readUnsigned(j, "batch_size", 1, MAX_BATCH_SIZE, batchSizeValue, errorMsg) ||
        !readUnsigned(j, "batch_delay_ms", 0, 60000, delay, errorMsg) ||
        !readUnsigned(j, "probe_timeout_ms", 100, 60000, probe, errorMsg) ||
        !readUnsigned(j, "sweep_timeout_ms", 100, 600000, sweep, errorMsg) ||
        !readUnsigned(j, "request_timeout_ms", 100, 600000, request, errorMsg)) {
        return false;
    }

    next.transferPort = static_cast<uint16_t>(port);
    next.batchSize = static_cast<size_t>(batchSizeValue);
    next.batchDelayMs = static_cast<uint32_t>(delay);
    next.probeTimeoutMs = static_cast<uint32_t>(probe);
    next.sweepTimeoutMs = static_cast<uint32_t>(sweep);
    next.requestTimeoutMs = static_cast<uint32_t>(request);

    if (j.contains("strict_session_match")) {
        if (!j["strict_session_match"].is_boolean()) {
            errorMsg = "setting 'strict_session_match' must be a boolean";
            return false;
        }
        next.strictSessionMatch = j["strict_session_match"].get<bool>();
    }

    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            errorMsg = "setting 'log_file' must be a string";
            return false;
        }
        next.logFile = j["log_file"].get<std::string>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string() ||
            !logLevelFromString(j["log_level"].get<std::string>(), next.logLevel)) {
            errorMsg = "setting 'log_level' must be one of debug, info, warning, error";
            return false;
        }
    }

    *this = std::move(next);
    return true;
}

bool Settings::loadFromFile(const std::filesystem::path& path, Settings& out, std::string& errorMsg) {
    std::string content;
    if (!readWholeFile(path, content, errorMsg)) {
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        errorMsg = "settings file " + path.string() + " is not valid JSON: " + e.what();
        return false;
    }

    Settings loaded;
    if (!loaded.applyJson(j, errorMsg)) {
        errorMsg = path.string() + ": " + errorMsg;
        return false;
    }
    out = std::move(loaded);
    return true;
}

bool Settings::saveToFile(const std::filesystem::path& path, std::string& errorMsg) const {
    return writeFileAtomically(path, toJson().dump(2), errorMsg);
}

}  // namespace SmsBridge
