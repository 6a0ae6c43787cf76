/**
 * @file config.h
 * @brief Configuration constants for SmsBridge
 *
 * This file contains the compile-time configuration constants used throughout
 * SmsBridge: the transfer port, endpoint paths, protocol identifiers, timing
 * budgets and size limits.
 *
 * Runtime overrides for a subset of these values live in Settings (see
 * Settings.h). The constants here are the defaults that Settings starts from.
 *
 * @note Changes to the protocol constants affect compatibility with peers.
 *       Ensure both devices run a compatible build.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace SmsBridge
 * @brief SmsBridge namespace containing all public APIs
 */
namespace SmsBridge {

//=========================================================================
// Network Ports and Endpoints
//=========================================================================

/** @defgroup NetworkPorts Network Ports and Endpoints
 * @brief Listener port and HTTP paths served by TransferServer
 *
 * Both peers listen on the same well-known port so that the discovery sweep
 * can probe every host of the subnet without prior knowledge.
 * @{
 */

/**
 * @brief Default HTTP listener port.
 *
 * The sweep probes this port on every host of the local /24.
 */
constexpr uint16_t TRANSFER_PORT_DEFAULT = 8080;

/**
 * @brief Discovery endpoint.
 *
 * GET returns the local identity; POST with a DISCOVERY envelope announces
 * the caller and returns the local identity.
 */
constexpr const char* DISCOVERY_PATH = "/discover";

/**
 * @brief Transfer endpoint (POST only).
 *
 * Accepts TRANSFER_REQUEST, SMS_DATA, TRANSFER_COMPLETE and ERROR envelopes.
 */
constexpr const char* TRANSFER_PATH = "/sms-transfer";

/**
 * @brief Liveness probe endpoint, independent of session state.
 */
constexpr const char* HEALTH_PATH = "/health";

/**
 * @brief Address the listener binds to (all interfaces).
 */
constexpr const char* LISTEN_ADDRESS = "0.0.0.0";

/**
 * @brief Localhost IP address, used when no LAN interface is found.
 */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/** @} */ // end of NetworkPorts

//=========================================================================
// Protocol
//=========================================================================

/** @defgroup Protocol Protocol Identifiers
 * @brief Pairing tag and version strings
 * @{
 */

/**
 * @brief Kind tag carried in the "type" field of every pairing token.
 */
constexpr const char* PAIRING_TYPE_TAG = "sms_transfer_pairing";

/**
 * @brief Protocol / application version embedded in pairing tokens and
 * device identities.
 *
 * Peers accept tokens whose major version matches their own.
 */
constexpr const char* PROTOCOL_VERSION = "1.0.0";

/**
 * @brief Application version reported in DeviceIdentity::appVersion.
 */
constexpr const char* APP_VERSION = "1.0.0";

/**
 * @brief Session id prefix used when minting a new sender session.
 */
constexpr const char* SESSION_ID_PREFIX = "sess_";

/** @} */ // end of Protocol

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timeouts and delays (in milliseconds)
 * @{
 */

/**
 * @brief Maximum age of a pairing token before it is rejected as expired.
 */
constexpr int64_t PAIRING_MAX_AGE_MS = 60LL * 60LL * 1000LL;  // 1 hour

/**
 * @brief Per-host probe timeout during a discovery sweep.
 *
 * Covers connect, write and read of a single POST /discover.
 */
constexpr uint32_t PROBE_TIMEOUT_MS = 2000;

/**
 * @brief Overall discovery sweep ceiling.
 *
 * The sweep returns whatever it collected once this elapses. Outstanding
 * probes are abandoned.
 */
constexpr uint32_t SWEEP_TIMEOUT_MS = 10000;

/**
 * @brief Timeout for a single envelope round-trip during a transfer.
 */
constexpr uint32_t REQUEST_TIMEOUT_MS = 30000;

/**
 * @brief Receive timeout applied to accepted listener connections.
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;

/**
 * @brief Delay inserted by the sender between consecutive batches.
 */
constexpr uint32_t BATCH_DELAY_MS = 50;

/**
 * @brief Poll interval of the non-blocking accept loop.
 */
constexpr uint32_t ACCEPT_POLL_INTERVAL_MS = 50;

/**
 * @brief Window within which two records with identical address and body
 * are treated as the same message by the record store.
 */
constexpr int64_t DUPLICATE_WINDOW_MS = 5LL * 60LL * 1000LL;  // 5 minutes

/** @} */ // end of Timing

//=========================================================================
// Sizes and Limits
//=========================================================================

/** @defgroup Limits Sizes and Limits
 * @{
 */

/**
 * @brief Default number of records per SMS_DATA batch.
 */
constexpr size_t BATCH_SIZE_DEFAULT = 100;

/**
 * @brief Largest batch size accepted from settings.
 */
constexpr size_t MAX_BATCH_SIZE = 1000;

/**
 * @brief Maximum accepted HTTP request body.
 *
 * One SMS_DATA envelope of MAX_BATCH_SIZE long messages fits comfortably.
 */
constexpr uint64_t MAX_REQUEST_BODY_BYTES = 16ULL * 1024ULL * 1024ULL;  // 16 MB

/**
 * @brief Maximum device name length. Longer names are truncated.
 */
constexpr size_t MAX_DEVICE_NAME = 64;

/**
 * @brief Maximum session id length accepted from the wire.
 */
constexpr size_t MAX_SESSION_ID_LENGTH = 64;

/** @} */ // end of Limits

//=========================================================================
// Multi-threading Configuration
//=========================================================================

/** @defgroup Threading Multi-threading Configuration
 * @{
 */

/**
 * @brief Maximum concurrent listener handler threads.
 *
 * TransferServer spawns one handler thread per accepted connection.
 * Connections beyond this limit are closed immediately.
 */
constexpr size_t MAX_CONCURRENT_HANDLER_THREADS = 32;

/**
 * @brief Worker threads used by a discovery sweep.
 *
 * 254 hosts over 64 workers with a 2 s probe timeout finishes a fully
 * unresponsive subnet in about 8 s, inside the default sweep ceiling.
 */
constexpr size_t SWEEP_WORKER_COUNT = 64;

/** @} */ // end of Threading

}  // namespace SmsBridge
