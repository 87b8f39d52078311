/**
 * @file MagicPacket.cpp
 * @brief Implementation file.
 */
#include "Modules/WakeModule/MagicPacket.h"

#include <string.h>

namespace MagicPacket {

static int hexNibble(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool parseMac(const char* text, uint8_t out[MacLen])
{
    if (!text || !out) return false;

    const size_t len = strlen(text);
    char sep = '\0';
    if (len == 17) {
        sep = text[2];
        if (sep != ':' && sep != '-') return false;
    } else if (len != 12) {
        return false;
    }

    uint8_t mac[MacLen] = {0};
    const char* p = text;
    for (size_t i = 0; i < MacLen; ++i) {
        const int hi = hexNibble(p[0]);
        const int lo = hexNibble(p[1]);
        if (hi < 0 || lo < 0) return false;
        mac[i] = (uint8_t)((hi << 4) | lo);
        p += 2;
        if (sep != '\0' && i + 1 < MacLen) {
            if (*p != sep) return false;
            ++p;
        }
    }

    memcpy(out, mac, MacLen);
    return true;
}

bool build(const uint8_t mac[MacLen], uint8_t* out, size_t outLen)
{
    if (!mac || !out || outLen < Length) return false;
    memset(out, 0xFF, MacLen);
    for (size_t i = 0; i < 16; ++i) {
        memcpy(out + MacLen + i * MacLen, mac, MacLen);
    }
    return true;
}

}  // namespace MagicPacket
