#pragma once
/**
 * @file CommandProtocol.h
 * @brief Authenticated-encryption envelope codec for link commands.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/CommandKind.h"
#include "Core/CryptoManager.h"
#include "Core/DeviceIdentity.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"

/** @brief One request or response on the link. */
struct Command {
    CommandKind kind = CommandKind::Ping;
    char target[Limits::Link::Serial] = {0};     ///< serial of the addressed device
    uint64_t issuedAt = 0;                       ///< UTC seconds at the sender
    char args[Limits::Link::ArgsJson] = {0};     ///< raw JSON object, empty when absent

    void setTarget(const char* serial);
    /** @brief Copy raw JSON args; false when it does not fit. */
    bool setArgs(const char* json);
};

/** @brief Outcome of `CommandProtocol::decode`. */
enum class DecodeStatus : uint8_t {
    Ok,
    AuthFailure,
    MalformedEnvelope,
    WrongTarget,
    ExpiredTimestamp
};

const char* decodeStatusStr(DecodeStatus st);
/** @brief Map a rejection onto the shared error taxonomy (Ok maps to `ErrorCode::Failed`). */
ErrorCode decodeStatusToErrorCode(DecodeStatus st);

/**
 * @brief Envelope = IV(16) || AES-256-CBC(JSON) || HMAC-SHA256 tag(32).
 *
 * The tag covers `"WRL1" || window (8 bytes big endian) || IV || ciphertext`
 * so a captured envelope cannot be replayed into another topic window.
 */
class CommandProtocol {
public:
    explicit CommandProtocol(CryptoManager& crypto) : crypto_(crypto) {}

    /** @brief Serialize, encrypt with a fresh IV and sign. */
    bool encode(const Command& cmd, const DeviceIdentity& identity, uint64_t window,
                uint8_t* out, size_t outCap, size_t& outLen);

    /**
     * @brief Verify, decrypt and validate one envelope.
     *
     * Checks run in order: framing, tag, decryption, JSON, target, skew.
     * The first failure is returned and `out` is left untouched.
     */
    static DecodeStatus decode(const uint8_t* env, size_t envLen,
                               const DeviceIdentity& identity, uint64_t window,
                               uint64_t nowSec, uint32_t skewToleranceSec,
                               Command& out);

    /** @brief Command -> plaintext JSON. */
    static bool toJson(const Command& cmd, char* out, size_t outCap, size_t& outLen);
    /** @brief Plaintext JSON -> Command; false on any structural problem. */
    static bool fromJson(const char* json, size_t len, Command& out);

private:
    static bool computeTag_(const CryptoKey& key, uint64_t window,
                            const uint8_t* iv, const uint8_t* ct, size_t ctLen,
                            uint8_t tagOut[Limits::Link::TagLen]);

    CryptoManager& crypto_;
};
