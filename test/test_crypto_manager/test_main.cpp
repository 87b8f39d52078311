#include <unity.h>
#include <string.h>

#include "Core/CryptoManager.h"

void setUp() {}
void tearDown() {}

static void fromHex(const char* hex, uint8_t* out, size_t outLen)
{
    for (size_t i = 0; i < outLen; ++i) {
        unsigned v = 0;
        for (int k = 0; k < 2; ++k) {
            const char c = hex[i * 2 + k];
            v <<= 4;
            if (c >= '0' && c <= '9') v |= (unsigned)(c - '0');
            else if (c >= 'a' && c <= 'f') v |= (unsigned)(c - 'a' + 10);
        }
        out[i] = (uint8_t)v;
    }
}

static CryptoKey keyFromBytes(const uint8_t* b, size_t n)
{
    CryptoKey k{};
    memcpy(k.bytes, b, n);
    return k;
}

void test_derive_key_is_sha256_of_passphrase()
{
    CryptoKey k{};
    TEST_ASSERT_TRUE(CryptoManager::deriveKey("abc", k));
    uint8_t expected[32];
    fromHex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", expected, 32);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, k.bytes, 32);
}

void test_hmac_matches_rfc4231_case1()
{
    // HMAC zero-pads short keys, so a 20 byte key inside the 32 byte slot is equivalent.
    uint8_t raw[20];
    memset(raw, 0x0b, sizeof(raw));
    const CryptoKey k = keyFromBytes(raw, sizeof(raw));

    const char* msg = "Hi There";
    const ByteSpan parts[] = {{reinterpret_cast<const uint8_t*>(msg), strlen(msg)}};
    uint8_t tag[32];
    TEST_ASSERT_TRUE(CryptoManager::sign(k, parts, 1, tag));

    uint8_t expected[32];
    fromHex("b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7", expected, 32);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, tag, 32);
}

void test_hmac_scatter_list_equals_contiguous_input()
{
    const CryptoKey k = keyFromBytes(reinterpret_cast<const uint8_t*>("Jefe"), 4);
    const char* a = "what do ya ";
    const char* b = "want for nothing?";
    const ByteSpan split[] = {
        {reinterpret_cast<const uint8_t*>(a), strlen(a)},
        {nullptr, 0},
        {reinterpret_cast<const uint8_t*>(b), strlen(b)},
    };
    uint8_t tag[32];
    TEST_ASSERT_TRUE(CryptoManager::sign(k, split, 3, tag));

    uint8_t expected[32];
    fromHex("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843", expected, 32);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, tag, 32);
    TEST_ASSERT_TRUE(CryptoManager::verify(k, split, 3, expected, 32));
}

void test_verify_rejects_flipped_tag_and_short_tag()
{
    CryptoKey k{};
    TEST_ASSERT_TRUE(CryptoManager::deriveKey("secret", k));
    const uint8_t data[] = {1, 2, 3, 4};
    const ByteSpan parts[] = {{data, sizeof(data)}};
    uint8_t tag[32];
    TEST_ASSERT_TRUE(CryptoManager::sign(k, parts, 1, tag));
    TEST_ASSERT_TRUE(CryptoManager::verify(k, parts, 1, tag, 32));

    tag[31] ^= 0x01;
    TEST_ASSERT_FALSE(CryptoManager::verify(k, parts, 1, tag, 32));
    tag[31] ^= 0x01;
    TEST_ASSERT_FALSE(CryptoManager::verify(k, parts, 1, tag, 31));
}

void test_aes256_cbc_first_block_matches_sp800_38a()
{
    uint8_t raw[32];
    fromHex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4", raw, 32);
    const CryptoKey k = keyFromBytes(raw, 32);
    uint8_t iv[16];
    fromHex("000102030405060708090a0b0c0d0e0f", iv, 16);
    uint8_t plain[16];
    fromHex("6bc1bee22e409f96e93d7e117393172a", plain, 16);

    uint8_t ct[32];
    size_t ctLen = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::Ok,
                      CryptoManager::encryptWithIv(k, iv, plain, 16, ct, sizeof(ct), ctLen));
    TEST_ASSERT_EQUAL_UINT32(32, ctLen);

    uint8_t expected[16];
    fromHex("f58c4c04d6e5f1ba779eabfb5f7bfbd6", expected, 16);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, ct, 16);
}

void test_padding_always_adds_one_to_sixteen_bytes()
{
    TEST_ASSERT_EQUAL_UINT32(16, CryptoManager::paddedLength(0));
    TEST_ASSERT_EQUAL_UINT32(16, CryptoManager::paddedLength(15));
    TEST_ASSERT_EQUAL_UINT32(32, CryptoManager::paddedLength(16));
    TEST_ASSERT_EQUAL_UINT32(48, CryptoManager::paddedLength(33));
}

void test_encrypt_decrypt_round_trip_with_fresh_iv()
{
    CryptoManager crypto;
    TEST_ASSERT_TRUE(crypto.begin());
    CryptoKey k{};
    TEST_ASSERT_TRUE(CryptoManager::deriveKey("round-trip", k));

    const char* msg = "{\"kind\":\"WAKE\"}";
    uint8_t iv1[16], iv2[16];
    uint8_t ct1[64], ct2[64];
    size_t len1 = 0, len2 = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::Ok,
                      crypto.encrypt(k, reinterpret_cast<const uint8_t*>(msg), strlen(msg),
                                     iv1, ct1, sizeof(ct1), len1));
    TEST_ASSERT_EQUAL(CryptoStatus::Ok,
                      crypto.encrypt(k, reinterpret_cast<const uint8_t*>(msg), strlen(msg),
                                     iv2, ct2, sizeof(ct2), len2));
    TEST_ASSERT_TRUE(memcmp(iv1, iv2, 16) != 0);

    uint8_t plain[64];
    size_t plainLen = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::Ok,
                      CryptoManager::decrypt(k, iv1, ct1, len1, plain, sizeof(plain), plainLen));
    TEST_ASSERT_EQUAL_UINT32(strlen(msg), plainLen);
    TEST_ASSERT_EQUAL_MEMORY(msg, plain, plainLen);
}

void test_encrypt_requires_seeded_generator()
{
    CryptoManager crypto;
    CryptoKey k{};
    uint8_t iv[16], ct[32];
    size_t len = 0;
    const uint8_t b = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::NotSeeded, crypto.encrypt(k, &b, 1, iv, ct, sizeof(ct), len));
}

void test_decrypt_rejects_bad_length()
{
    CryptoKey k{};
    uint8_t iv[16] = {0};
    uint8_t ct[31] = {0};
    uint8_t out[32];
    size_t len = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::LengthError, CryptoManager::decrypt(k, iv, ct, 0, out, sizeof(out), len));
    TEST_ASSERT_EQUAL(CryptoStatus::LengthError, CryptoManager::decrypt(k, iv, ct, 15, out, sizeof(out), len));
    TEST_ASSERT_EQUAL(CryptoStatus::LengthError, CryptoManager::decrypt(k, iv, ct, 31, out, sizeof(out), len));
}

void test_decrypt_rejects_invalid_padding()
{
    CryptoKey k{};
    TEST_ASSERT_TRUE(CryptoManager::deriveKey("pad", k));
    uint8_t iv[16] = {0};
    uint8_t ct[16];
    size_t ctLen = 0;
    // Empty plaintext encrypts to one block of sixteen 0x10 bytes.
    TEST_ASSERT_EQUAL(CryptoStatus::Ok, CryptoManager::encryptWithIv(k, iv, nullptr, 0, ct, sizeof(ct), ctLen));

    uint8_t out[16];
    size_t outLen = 0;
    uint8_t badIv[16];

    // Last byte 0x00.
    memcpy(badIv, iv, 16);
    badIv[15] ^= 0x10;
    TEST_ASSERT_EQUAL(CryptoStatus::PaddingError, CryptoManager::decrypt(k, badIv, ct, 16, out, sizeof(out), outLen));

    // Last byte 0x11 (above block size).
    memcpy(badIv, iv, 16);
    badIv[15] ^= (0x10 ^ 0x11);
    TEST_ASSERT_EQUAL(CryptoStatus::PaddingError, CryptoManager::decrypt(k, badIv, ct, 16, out, sizeof(out), outLen));

    // Last byte 0x02 but the byte before it is still 0x10.
    memcpy(badIv, iv, 16);
    badIv[15] ^= (0x10 ^ 0x02);
    TEST_ASSERT_EQUAL(CryptoStatus::PaddingError, CryptoManager::decrypt(k, badIv, ct, 16, out, sizeof(out), outLen));
    TEST_ASSERT_EQUAL_UINT32(0, outLen);
}

void test_constant_time_equal()
{
    const uint8_t a[4] = {1, 2, 3, 4};
    const uint8_t b[4] = {1, 2, 3, 4};
    const uint8_t c[4] = {0, 2, 3, 4};
    TEST_ASSERT_TRUE(CryptoManager::constantTimeEqual(a, b, 4));
    TEST_ASSERT_FALSE(CryptoManager::constantTimeEqual(a, c, 4));
    TEST_ASSERT_FALSE(CryptoManager::constantTimeEqual(a, nullptr, 4));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_derive_key_is_sha256_of_passphrase);
    RUN_TEST(test_hmac_matches_rfc4231_case1);
    RUN_TEST(test_hmac_scatter_list_equals_contiguous_input);
    RUN_TEST(test_verify_rejects_flipped_tag_and_short_tag);
    RUN_TEST(test_aes256_cbc_first_block_matches_sp800_38a);
    RUN_TEST(test_padding_always_adds_one_to_sixteen_bytes);
    RUN_TEST(test_encrypt_decrypt_round_trip_with_fresh_iv);
    RUN_TEST(test_encrypt_requires_seeded_generator);
    RUN_TEST(test_decrypt_rejects_bad_length);
    RUN_TEST(test_decrypt_rejects_invalid_padding);
    RUN_TEST(test_constant_time_equal);
    return UNITY_END();
}
