#include <unity.h>
#include <string.h>

#include "Modules/Network/MQTTModule/CommandProtocol.h"
#include "Modules/Network/MQTTModule/TopicRotator.h"

void setUp() {}
void tearDown() {}

static CryptoManager gCrypto;

static DeviceIdentity makeIdentity(const char* serial)
{
    DeviceIdentity id;
    id.setSerial(serial);
    for (uint8_t i = 0; i < sizeof(id.key.bytes); ++i) id.key.bytes[i] = (uint8_t)(0xA0 + i);
    return id;
}

static Command makeCommand(CommandKind kind, const char* target, uint64_t issuedAt)
{
    Command c;
    c.kind = kind;
    c.setTarget(target);
    c.issuedAt = issuedAt;
    return c;
}

struct Envelope {
    uint8_t bytes[Limits::Link::EnvelopeMax];
    size_t len = 0;
};

static Envelope encodeOrFail(const Command& c, const DeviceIdentity& id, uint64_t window)
{
    CommandProtocol proto(gCrypto);
    Envelope e;
    TEST_ASSERT_TRUE(proto.encode(c, id, window, e.bytes, sizeof(e.bytes), e.len));
    return e;
}

void test_round_trip_returns_same_command()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    Command c = makeCommand(CommandKind::SetSchedule, "DEV01", 1700000000ULL);
    TEST_ASSERT_TRUE(c.setArgs("{\"slots\":[{\"slot\":1,\"enabled\":true,\"days\":31,\"hour\":7,\"minute\":30}]}"));

    const Envelope e = encodeOrFail(c, id, 7);
    TEST_ASSERT_EQUAL_UINT32(0, (e.len - Limits::Link::IvLen - Limits::Link::TagLen) % 16);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::Ok,
                      CommandProtocol::decode(e.bytes, e.len, id, 7, c.issuedAt, 120, out));
    TEST_ASSERT_EQUAL(CommandKind::SetSchedule, out.kind);
    TEST_ASSERT_EQUAL_STRING("DEV01", out.target);
    TEST_ASSERT_EQUAL_UINT64(c.issuedAt, out.issuedAt);
    TEST_ASSERT_EQUAL_STRING(c.args, out.args);
}

void test_every_single_bit_flip_is_auth_failure()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    const Command c = makeCommand(CommandKind::Status, "DEV01", 5000);
    Envelope e = encodeOrFail(c, id, 83);

    for (size_t i = 0; i < e.len; ++i) {
        for (uint8_t bit = 0; bit < 8; ++bit) {
            e.bytes[i] ^= (uint8_t)(1U << bit);
            Command out;
            TEST_ASSERT_EQUAL(DecodeStatus::AuthFailure,
                              CommandProtocol::decode(e.bytes, e.len, id, 83, 5000, 120, out));
            e.bytes[i] ^= (uint8_t)(1U << bit);
        }
    }
}

void test_window_is_bound_into_tag()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    const Command c = makeCommand(CommandKind::Wake, "DEV01", 1000);
    const Envelope e = encodeOrFail(c, id, 16);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::AuthFailure,
                      CommandProtocol::decode(e.bytes, e.len, id, 17, 1000, 120, out));
}

void test_wrong_key_is_auth_failure()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    DeviceIdentity other = makeIdentity("DEV01");
    other.key.bytes[5] ^= 0x40;

    const Envelope e = encodeOrFail(makeCommand(CommandKind::Ping, "DEV01", 1000), id, 1);
    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::AuthFailure,
                      CommandProtocol::decode(e.bytes, e.len, other, 1, 1000, 120, out));
}

void test_skew_boundary_is_inclusive()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    const Envelope e = encodeOrFail(makeCommand(CommandKind::Usage, "DEV01", 10000), id, 2);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::Ok, CommandProtocol::decode(e.bytes, e.len, id, 2, 10120, 120, out));
    TEST_ASSERT_EQUAL(DecodeStatus::Ok, CommandProtocol::decode(e.bytes, e.len, id, 2, 9880, 120, out));
    TEST_ASSERT_EQUAL(DecodeStatus::ExpiredTimestamp,
                      CommandProtocol::decode(e.bytes, e.len, id, 2, 10121, 120, out));
    TEST_ASSERT_EQUAL(DecodeStatus::ExpiredTimestamp,
                      CommandProtocol::decode(e.bytes, e.len, id, 2, 9879, 120, out));
}

void test_other_serial_is_wrong_target()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    const Envelope e = encodeOrFail(makeCommand(CommandKind::Wake, "DEV02", 1000), id, 16);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::WrongTarget,
                      CommandProtocol::decode(e.bytes, e.len, id, 16, 1000, 120, out));
}

void test_short_envelope_is_malformed()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    uint8_t tiny[Limits::Link::EnvelopeMin - 1] = {0};
    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::MalformedEnvelope,
                      CommandProtocol::decode(tiny, sizeof(tiny), id, 0, 0, 120, out));
    TEST_ASSERT_EQUAL(DecodeStatus::MalformedEnvelope,
                      CommandProtocol::decode(nullptr, 0, id, 0, 0, 120, out));
}

static size_t sealRaw(const DeviceIdentity& id, uint64_t window, const uint8_t* ct, size_t ctLen, uint8_t* out)
{
    // Authentic envelope around arbitrary ciphertext, to reach the post-auth checks.
    memset(out, 0x11, Limits::Link::IvLen);
    memcpy(out + Limits::Link::IvLen, ct, ctLen);
    uint8_t windowBe[8];
    for (int i = 7; i >= 0; --i) windowBe[i] = (uint8_t)((window >> ((7 - i) * 8)) & 0xFF);
    const uint8_t domain[4] = {'W', 'R', 'L', '1'};
    const ByteSpan parts[] = {
        {domain, 4}, {windowBe, 8}, {out, Limits::Link::IvLen}, {out + Limits::Link::IvLen, ctLen}};
    TEST_ASSERT_TRUE(CryptoManager::sign(id.key, parts, 4, out + Limits::Link::IvLen + ctLen));
    return Limits::Link::IvLen + ctLen + Limits::Link::TagLen;
}

void test_authentic_but_misaligned_ciphertext_is_malformed()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    uint8_t ct[20] = {0};
    uint8_t env[Limits::Link::EnvelopeMax];
    const size_t len = sealRaw(id, 3, ct, sizeof(ct), env);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::MalformedEnvelope,
                      CommandProtocol::decode(env, len, id, 3, 0, 120, out));
}

void test_authentic_but_non_json_plaintext_is_malformed()
{
    const DeviceIdentity id = makeIdentity("DEV01");
    const uint8_t iv[16] = {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11,
                            0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x11};
    const char* junk = "not json at all";
    uint8_t ct[32];
    size_t ctLen = 0;
    TEST_ASSERT_EQUAL(CryptoStatus::Ok,
                      CryptoManager::encryptWithIv(id.key, iv, reinterpret_cast<const uint8_t*>(junk),
                                                   strlen(junk), ct, sizeof(ct), ctLen));
    uint8_t env[Limits::Link::EnvelopeMax];
    const size_t len = sealRaw(id, 3, ct, ctLen, env);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::MalformedEnvelope,
                      CommandProtocol::decode(env, len, id, 3, 0, 120, out));
}

void test_json_parser_rejects_unknown_kind_and_missing_fields()
{
    Command out;
    const char* ok = "{\"kind\":\"PING\",\"target\":\"DEV01\",\"issued_at\":12}";
    TEST_ASSERT_TRUE(CommandProtocol::fromJson(ok, strlen(ok), out));
    TEST_ASSERT_EQUAL(CommandKind::Ping, out.kind);
    TEST_ASSERT_EQUAL_STRING("", out.args);

    const char* unknownKind = "{\"kind\":\"REBOOT\",\"target\":\"DEV01\",\"issued_at\":12}";
    TEST_ASSERT_FALSE(CommandProtocol::fromJson(unknownKind, strlen(unknownKind), out));

    const char* noTarget = "{\"kind\":\"WAKE\",\"issued_at\":12}";
    TEST_ASSERT_FALSE(CommandProtocol::fromJson(noTarget, strlen(noTarget), out));

    const char* badTime = "{\"kind\":\"WAKE\",\"target\":\"DEV01\",\"issued_at\":\"soon\"}";
    TEST_ASSERT_FALSE(CommandProtocol::fromJson(badTime, strlen(badTime), out));

    const char* argsNotObject = "{\"kind\":\"WAKE\",\"target\":\"DEV01\",\"issued_at\":1,\"args\":[1]}";
    TEST_ASSERT_FALSE(CommandProtocol::fromJson(argsNotObject, strlen(argsNotObject), out));
}

void test_decode_status_maps_to_error_codes()
{
    TEST_ASSERT_EQUAL(ErrorCode::AuthFailure, decodeStatusToErrorCode(DecodeStatus::AuthFailure));
    TEST_ASSERT_EQUAL(ErrorCode::MalformedEnvelope, decodeStatusToErrorCode(DecodeStatus::MalformedEnvelope));
    TEST_ASSERT_EQUAL(ErrorCode::WrongTarget, decodeStatusToErrorCode(DecodeStatus::WrongTarget));
    TEST_ASSERT_EQUAL(ErrorCode::ExpiredTimestamp, decodeStatusToErrorCode(DecodeStatus::ExpiredTimestamp));
}

void test_dev01_scenario()
{
    DeviceIdentity id;
    id.setSerial("DEV01");
    for (uint8_t i = 0; i < 32; ++i) id.key.bytes[i] = i;

    const uint32_t rotation = 60;
    const uint32_t tolerance = 120;
    uint64_t window = 0;
    TEST_ASSERT_TRUE(TopicRotator::windowOf(1000, rotation, window));

    const Envelope e = encodeOrFail(makeCommand(CommandKind::Wake, "DEV01", 1000), id, window);

    Command out;
    TEST_ASSERT_EQUAL(DecodeStatus::Ok,
                      CommandProtocol::decode(e.bytes, e.len, id, window, 1100, tolerance, out));
    TEST_ASSERT_EQUAL(CommandKind::Wake, out.kind);

    TEST_ASSERT_EQUAL(DecodeStatus::ExpiredTimestamp,
                      CommandProtocol::decode(e.bytes, e.len, id, window, 1125, tolerance, out));

    Envelope flipped = e;
    flipped.bytes[Limits::Link::IvLen + 3] ^= 0x01;
    TEST_ASSERT_EQUAL(DecodeStatus::AuthFailure,
                      CommandProtocol::decode(flipped.bytes, flipped.len, id, window, 1050, tolerance, out));

    TopicRotator r;
    r.configure(&id, "wol");
    char tSame1[128], tSame2[128], t1000[128], t1060[128];
    TEST_ASSERT_TRUE(r.deriveTopic(960, rotation, tSame1, sizeof(tSame1)));
    TEST_ASSERT_TRUE(r.deriveTopic(1019, rotation, tSame2, sizeof(tSame2)));
    TEST_ASSERT_EQUAL_STRING(tSame1, tSame2);
    TEST_ASSERT_TRUE(r.deriveTopic(1000, rotation, t1000, sizeof(t1000)));
    TEST_ASSERT_TRUE(r.deriveTopic(1060, rotation, t1060, sizeof(t1060)));
    TEST_ASSERT_TRUE(strcmp(t1000, t1060) != 0);
}

int main()
{
    gCrypto.begin("wakerelay-test");

    UNITY_BEGIN();
    RUN_TEST(test_round_trip_returns_same_command);
    RUN_TEST(test_every_single_bit_flip_is_auth_failure);
    RUN_TEST(test_window_is_bound_into_tag);
    RUN_TEST(test_wrong_key_is_auth_failure);
    RUN_TEST(test_skew_boundary_is_inclusive);
    RUN_TEST(test_other_serial_is_wrong_target);
    RUN_TEST(test_short_envelope_is_malformed);
    RUN_TEST(test_authentic_but_misaligned_ciphertext_is_malformed);
    RUN_TEST(test_authentic_but_non_json_plaintext_is_malformed);
    RUN_TEST(test_json_parser_rejects_unknown_kind_and_missing_fields);
    RUN_TEST(test_decode_status_maps_to_error_codes);
    RUN_TEST(test_dev01_scenario);
    return UNITY_END();
}
