#pragma once
/**
 * @file CryptoManager.h
 * @brief AES-256-CBC + HMAC-SHA256 primitives for the secure command link.
 */
#include <stddef.h>
#include <stdint.h>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>

#include "Core/DeviceIdentity.h"

/** @brief Result of a crypto primitive. */
enum class CryptoStatus : uint8_t {
    Ok,
    LengthError,     ///< ciphertext length is 0 or not a multiple of the block size
    PaddingError,    ///< PKCS7 pad byte out of range or inconsistent
    BufferTooSmall,
    NotSeeded,
    BackendFailure
};

/** @brief Read-only view over one input buffer of a signed message. */
struct ByteSpan {
    const uint8_t* data;
    size_t len;
};

/**
 * @brief Symmetric primitives used by CommandProtocol and TopicRotator.
 *
 * Holds only the random generator state; keys are passed per call so the
 * manager never owns credential material.
 */
class CryptoManager {
public:
    CryptoManager();
    ~CryptoManager();

    CryptoManager(const CryptoManager&) = delete;
    CryptoManager& operator=(const CryptoManager&) = delete;

    /** @brief Seed CTR_DRBG from the platform entropy source. */
    bool begin(const char* personalization = "wakerelay");
    /** @brief True once `begin()` succeeded. */
    bool isSeeded() const { return seeded_; }

    /** @brief `SHA-256(passphrase)`; both ends derive the link key this way. */
    static bool deriveKey(const char* passphrase, CryptoKey& out);

    /** @brief Ciphertext length for a plaintext of `plainLen` bytes (PKCS7 always adds 1..16). */
    static size_t paddedLength(size_t plainLen) {
        return (plainLen / Limits::Link::BlockLen + 1U) * Limits::Link::BlockLen;
    }

    /**
     * @brief Encrypt with a fresh random IV.
     * @param ivOut receives `Limits::Link::IvLen` bytes.
     */
    CryptoStatus encrypt(const CryptoKey& key,
                         const uint8_t* plain, size_t plainLen,
                         uint8_t* ivOut,
                         uint8_t* ctOut, size_t ctCap, size_t& ctLen);

    /** @brief Encrypt with a caller supplied IV. */
    static CryptoStatus encryptWithIv(const CryptoKey& key,
                                      const uint8_t* iv,
                                      const uint8_t* plain, size_t plainLen,
                                      uint8_t* ctOut, size_t ctCap, size_t& ctLen);

    /** @brief Decrypt and strip PKCS7 padding. */
    static CryptoStatus decrypt(const CryptoKey& key,
                                const uint8_t* iv,
                                const uint8_t* ct, size_t ctLen,
                                uint8_t* plainOut, size_t plainCap, size_t& plainLen);

    /** @brief HMAC-SHA256 over the concatenation of `parts`. */
    static bool sign(const CryptoKey& key, const ByteSpan* parts, size_t partCount,
                     uint8_t tagOut[Limits::Link::TagLen]);

    /** @brief Recompute the tag and compare it in constant time. */
    static bool verify(const CryptoKey& key, const ByteSpan* parts, size_t partCount,
                       const uint8_t* tag, size_t tagLen);

    /** @brief Length-independent comparison with no early exit. */
    static bool constantTimeEqual(const uint8_t* a, const uint8_t* b, size_t len);

private:
    mbedtls_entropy_context entropy_;
    mbedtls_ctr_drbg_context drbg_;
    bool seeded_ = false;
};
