#include <unity.h>
#include <string.h>

#include "Modules/WakeModule/MagicPacket.h"

void setUp() {}
void tearDown() {}

static const uint8_t kMac[6] = {0x00, 0x1A, 0x2B, 0x3C, 0x4D, 0x5E};

void test_parse_mac_accepts_common_separators()
{
    uint8_t mac[6];
    TEST_ASSERT_TRUE(MagicPacket::parseMac("00:1A:2B:3C:4D:5E", mac));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(kMac, mac, 6);
    memset(mac, 0, sizeof(mac));
    TEST_ASSERT_TRUE(MagicPacket::parseMac("00-1a-2b-3c-4d-5e", mac));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(kMac, mac, 6);
    memset(mac, 0, sizeof(mac));
    TEST_ASSERT_TRUE(MagicPacket::parseMac("001A2B3C4D5E", mac));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(kMac, mac, 6);
}

void test_parse_mac_rejects_malformed_text()
{
    uint8_t mac[6];
    TEST_ASSERT_FALSE(MagicPacket::parseMac("", mac));
    TEST_ASSERT_FALSE(MagicPacket::parseMac("00:1A:2B:3C:4D", mac));
    TEST_ASSERT_FALSE(MagicPacket::parseMac("00:1A-2B:3C:4D:5E", mac));
    TEST_ASSERT_FALSE(MagicPacket::parseMac("00:1A:2B:3C:4D:5G", mac));
    TEST_ASSERT_FALSE(MagicPacket::parseMac("00.1A.2B.3C.4D.5E", mac));
    TEST_ASSERT_FALSE(MagicPacket::parseMac(nullptr, mac));
}

void test_packet_layout()
{
    uint8_t pkt[MagicPacket::Length];
    TEST_ASSERT_TRUE(MagicPacket::build(kMac, pkt, sizeof(pkt)));
    TEST_ASSERT_EQUAL_UINT32(102, MagicPacket::Length);
    for (size_t i = 0; i < 6; ++i) TEST_ASSERT_EQUAL_HEX8(0xFF, pkt[i]);
    for (size_t rep = 0; rep < 16; ++rep) {
        TEST_ASSERT_EQUAL_UINT8_ARRAY(kMac, pkt + 6 + rep * 6, 6);
    }
}

void test_packet_needs_full_buffer()
{
    uint8_t pkt[101];
    TEST_ASSERT_FALSE(MagicPacket::build(kMac, pkt, sizeof(pkt)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_parse_mac_accepts_common_separators);
    RUN_TEST(test_parse_mac_rejects_malformed_text);
    RUN_TEST(test_packet_layout);
    RUN_TEST(test_packet_needs_full_buffer);
    return UNITY_END();
}
