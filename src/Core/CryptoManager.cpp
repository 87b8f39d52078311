/**
 * @file CryptoManager.cpp
 * @brief Implementation file.
 */
#include "Core/CryptoManager.h"

#include <string.h>

#include <mbedtls/aes.h>
#include <mbedtls/md.h>

namespace {

constexpr size_t kBlock = Limits::Link::BlockLen;

class AesGuard {
public:
    AesGuard() { mbedtls_aes_init(&ctx); }
    ~AesGuard() { mbedtls_aes_free(&ctx); }
    mbedtls_aes_context ctx;
};

class MdGuard {
public:
    MdGuard() { mbedtls_md_init(&ctx); }
    ~MdGuard() { mbedtls_md_free(&ctx); }
    mbedtls_md_context_t ctx;
};

}  // namespace

CryptoManager::CryptoManager()
{
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&drbg_);
}

CryptoManager::~CryptoManager()
{
    mbedtls_ctr_drbg_free(&drbg_);
    mbedtls_entropy_free(&entropy_);
}

bool CryptoManager::begin(const char* personalization)
{
    if (seeded_) return true;
    const char* pers = personalization ? personalization : "";
    const int rc = mbedtls_ctr_drbg_seed(&drbg_, mbedtls_entropy_func, &entropy_,
                                         reinterpret_cast<const unsigned char*>(pers),
                                         strlen(pers));
    seeded_ = (rc == 0);
    return seeded_;
}

bool CryptoManager::deriveKey(const char* passphrase, CryptoKey& out)
{
    if (!passphrase) return false;
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info) return false;
    return mbedtls_md(info,
                      reinterpret_cast<const unsigned char*>(passphrase),
                      strlen(passphrase),
                      out.bytes) == 0;
}

CryptoStatus CryptoManager::encrypt(const CryptoKey& key,
                                    const uint8_t* plain, size_t plainLen,
                                    uint8_t* ivOut,
                                    uint8_t* ctOut, size_t ctCap, size_t& ctLen)
{
    ctLen = 0;
    if (!seeded_) return CryptoStatus::NotSeeded;
    if (!ivOut) return CryptoStatus::BufferTooSmall;

    if (mbedtls_ctr_drbg_random(&drbg_, ivOut, Limits::Link::IvLen) != 0) {
        return CryptoStatus::BackendFailure;
    }
    return encryptWithIv(key, ivOut, plain, plainLen, ctOut, ctCap, ctLen);
}

CryptoStatus CryptoManager::encryptWithIv(const CryptoKey& key,
                                          const uint8_t* iv,
                                          const uint8_t* plain, size_t plainLen,
                                          uint8_t* ctOut, size_t ctCap, size_t& ctLen)
{
    ctLen = 0;
    if (!iv || !ctOut || (!plain && plainLen > 0)) return CryptoStatus::BufferTooSmall;

    const size_t padded = paddedLength(plainLen);
    if (padded > ctCap) return CryptoStatus::BufferTooSmall;

    // PKCS7: pad value equals pad length, always 1..16.
    if (plainLen > 0) memmove(ctOut, plain, plainLen);
    const uint8_t pad = (uint8_t)(padded - plainLen);
    memset(ctOut + plainLen, pad, pad);

    // mbedtls advances the IV in place.
    uint8_t ivWork[Limits::Link::IvLen];
    memcpy(ivWork, iv, sizeof(ivWork));

    AesGuard aes;
    if (mbedtls_aes_setkey_enc(&aes.ctx, key.bytes, Limits::Link::KeyLen * 8U) != 0) {
        return CryptoStatus::BackendFailure;
    }
    if (mbedtls_aes_crypt_cbc(&aes.ctx, MBEDTLS_AES_ENCRYPT, padded, ivWork, ctOut, ctOut) != 0) {
        return CryptoStatus::BackendFailure;
    }

    ctLen = padded;
    return CryptoStatus::Ok;
}

CryptoStatus CryptoManager::decrypt(const CryptoKey& key,
                                    const uint8_t* iv,
                                    const uint8_t* ct, size_t ctLen,
                                    uint8_t* plainOut, size_t plainCap, size_t& plainLen)
{
    plainLen = 0;
    if (!iv || !ct || !plainOut) return CryptoStatus::BufferTooSmall;
    if (ctLen == 0 || (ctLen % kBlock) != 0) return CryptoStatus::LengthError;
    if (ctLen > plainCap) return CryptoStatus::BufferTooSmall;

    uint8_t ivWork[Limits::Link::IvLen];
    memcpy(ivWork, iv, sizeof(ivWork));

    AesGuard aes;
    if (mbedtls_aes_setkey_dec(&aes.ctx, key.bytes, Limits::Link::KeyLen * 8U) != 0) {
        return CryptoStatus::BackendFailure;
    }
    if (mbedtls_aes_crypt_cbc(&aes.ctx, MBEDTLS_AES_DECRYPT, ctLen, ivWork, ct, plainOut) != 0) {
        return CryptoStatus::BackendFailure;
    }

    const uint8_t pad = plainOut[ctLen - 1];
    if (pad == 0 || pad > kBlock) {
        memset(plainOut, 0, ctLen);
        return CryptoStatus::PaddingError;
    }
    uint8_t diff = 0;
    for (size_t i = ctLen - pad; i < ctLen; ++i) {
        diff |= (uint8_t)(plainOut[i] ^ pad);
    }
    if (diff != 0) {
        memset(plainOut, 0, ctLen);
        return CryptoStatus::PaddingError;
    }

    plainLen = ctLen - pad;
    return CryptoStatus::Ok;
}

bool CryptoManager::sign(const CryptoKey& key, const ByteSpan* parts, size_t partCount,
                         uint8_t tagOut[Limits::Link::TagLen])
{
    if (!tagOut || (!parts && partCount > 0)) return false;

    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info) return false;

    MdGuard md;
    if (mbedtls_md_setup(&md.ctx, info, 1) != 0) return false;  // 1 = HMAC
    if (mbedtls_md_hmac_starts(&md.ctx, key.bytes, sizeof(key.bytes)) != 0) return false;
    for (size_t i = 0; i < partCount; ++i) {
        if (parts[i].len == 0) continue;
        if (!parts[i].data) return false;
        if (mbedtls_md_hmac_update(&md.ctx, parts[i].data, parts[i].len) != 0) return false;
    }
    return mbedtls_md_hmac_finish(&md.ctx, tagOut) == 0;
}

bool CryptoManager::verify(const CryptoKey& key, const ByteSpan* parts, size_t partCount,
                           const uint8_t* tag, size_t tagLen)
{
    if (!tag || tagLen != Limits::Link::TagLen) return false;

    uint8_t expected[Limits::Link::TagLen];
    if (!sign(key, parts, partCount, expected)) return false;
    const bool ok = constantTimeEqual(expected, tag, sizeof(expected));
    memset(expected, 0, sizeof(expected));
    return ok;
}

bool CryptoManager::constantTimeEqual(const uint8_t* a, const uint8_t* b, size_t len)
{
    if (!a || !b) return false;
    volatile uint8_t acc = 0;
    for (size_t i = 0; i < len; ++i) {
        acc |= (uint8_t)(a[i] ^ b[i]);
    }
    return acc == 0;
}
