/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace SmsBridge {
namespace ErrorCodes {

// Pairing (token decode / freshness)
inline constexpr const char* PAIRING_MALFORMED = "SMB-PAIR-1001";
inline constexpr const char* PAIRING_EXPIRED = "SMB-PAIR-1002";
inline constexpr const char* PAIRING_VERSION_MISMATCH = "SMB-PAIR-1003";
inline constexpr const char* PAIRING_PEER_UNREACHABLE = "SMB-PAIR-1100";

// Transfer (envelope exchange with the peer)
inline constexpr const char* TRANSFER_SEND_FAILED = "SMB-XFER-2001";
inline constexpr const char* TRANSFER_REJECTED_REMOTE = "SMB-XFER-2002";
inline constexpr const char* TRANSFER_INCOMPLETE = "SMB-XFER-2003";
inline constexpr const char* TRANSFER_INVALID_STATE = "SMB-XFER-2004";

// Listener
inline constexpr const char* LISTENER_BIND_FAILED = "SMB-NET-3001";

// Record store
inline constexpr const char* STORE_WRITE_FAILED = "SMB-STORE-4001";
inline constexpr const char* STORE_READ_FAILED = "SMB-STORE-4002";

}  // namespace ErrorCodes
}  // namespace SmsBridge
