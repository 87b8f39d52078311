#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    // Protocol rejections (never answered on the wire)
    AuthFailure = 0,
    MalformedEnvelope,
    WrongTarget,
    ExpiredTimestamp,
    CryptoStructuralFailure,

    // Operational failures (drive the device state machine)
    TimeSyncFailure,
    ConnectFailure,

    // Command execution errors (answered inside an encrypted response)
    MissingArgs,
    BadArgsJson,
    ArgsTooLarge,
    InvalidSlot,
    InvalidBool,
    InvalidWeekdayMask,
    InvalidHour,
    InvalidMinute,
    NotReady,
    IoError,
    SetFailed,
    Failed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::AuthFailure: return "AuthFailure";
    case ErrorCode::MalformedEnvelope: return "MalformedEnvelope";
    case ErrorCode::WrongTarget: return "WrongTarget";
    case ErrorCode::ExpiredTimestamp: return "ExpiredTimestamp";
    case ErrorCode::CryptoStructuralFailure: return "CryptoStructuralFailure";
    case ErrorCode::TimeSyncFailure: return "TimeSyncFailure";
    case ErrorCode::ConnectFailure: return "ConnectFailure";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::BadArgsJson: return "BadArgsJson";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::InvalidSlot: return "InvalidSlot";
    case ErrorCode::InvalidBool: return "InvalidBool";
    case ErrorCode::InvalidWeekdayMask: return "InvalidWeekdayMask";
    case ErrorCode::InvalidHour: return "InvalidHour";
    case ErrorCode::InvalidMinute: return "InvalidMinute";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::SetFailed: return "SetFailed";
    case ErrorCode::Failed: return "Failed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::TimeSyncFailure:
    case ErrorCode::ConnectFailure:
    case ErrorCode::NotReady:
    case ErrorCode::IoError:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}

static inline bool writeErrorJsonWithSlot(char* out, size_t outLen, ErrorCode code, const char* where, uint8_t slot)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"slot\":%u,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        (unsigned)slot,
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
