/**
 * @file TopicRotator.cpp
 * @brief Implementation file.
 */
#include "Modules/Network/MQTTModule/TopicRotator.h"

#include <stdio.h>
#include <string.h>

#include "Core/CryptoManager.h"
#include "Core/MqttTopics.h"

namespace {

constexpr char kTopicLabel[] = "topic";
constexpr size_t kTokenBytes = Limits::Link::TopicTokenHex / 2U;

void writeBe64(uint64_t v, uint8_t out[8])
{
    for (int i = 7; i >= 0; --i) {
        out[i] = (uint8_t)(v & 0xFFU);
        v >>= 8;
    }
}

}  // namespace

void TopicRotator::configure(const DeviceIdentity* identity, const char* prefix)
{
    identity_ = identity;
    prefix_ = prefix;
    reset();
}

bool TopicRotator::windowOf(uint64_t utcSec, uint32_t intervalSec, uint64_t& outWindow)
{
    if (intervalSec == 0U) return false;
    outWindow = utcSec / intervalSec;
    return true;
}

bool TopicRotator::deriveToken(const CryptoKey& key, const char* serial, uint64_t window,
                               char* out, size_t outLen)
{
    if (!serial || !out || outLen < Limits::Link::TopicTokenHex + 1U) return false;

    static const uint8_t kSep = 0x00;
    uint8_t windowBe[8];
    writeBe64(window, windowBe);

    const ByteSpan parts[] = {
        {reinterpret_cast<const uint8_t*>(kTopicLabel), sizeof(kTopicLabel) - 1U},
        {reinterpret_cast<const uint8_t*>(serial), strlen(serial)},
        {&kSep, 1U},
        {windowBe, sizeof(windowBe)},
    };

    uint8_t mac[Limits::Link::TagLen];
    if (!CryptoManager::sign(key, parts, sizeof(parts) / sizeof(parts[0]), mac)) return false;

    static const char kHex[] = "0123456789abcdef";
    for (size_t i = 0; i < kTokenBytes; ++i) {
        out[i * 2U] = kHex[(mac[i] >> 4) & 0x0F];
        out[i * 2U + 1U] = kHex[mac[i] & 0x0F];
    }
    out[Limits::Link::TopicTokenHex] = '\0';
    return true;
}

bool TopicRotator::topicForWindow(const CryptoKey& key, const char* prefix, const char* serial,
                                  uint64_t window, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    char token[Limits::Link::TopicTokenHex + 1U];
    if (!deriveToken(key, serial, window, token, sizeof(token))) return false;

    const char* p = prefix ? prefix : "";
    int n = 0;
    if (p[0] == '\0') {
        n = snprintf(out, outLen, "%s", token);
    } else {
        n = snprintf(out, outLen, "%s/%s", p, token);
    }
    return n > 0 && (size_t)n < outLen;
}

bool TopicRotator::deriveTopic(uint64_t utcSec, uint32_t intervalSec, char* out, size_t outLen) const
{
    if (!identity_) return false;
    uint64_t window = 0;
    if (!windowOf(utcSec, intervalSec, window)) return false;
    return topicForWindow(identity_->key, prefix_, identity_->serial, window, out, outLen);
}

bool TopicRotator::advance(uint64_t utcSec, uint32_t intervalSec, TopicRotation& out)
{
    out = TopicRotation{};
    if (!identity_) return false;

    uint64_t window = 0;
    if (!windowOf(utcSec, intervalSec, window)) return false;
    if (hasCurrent_ && window == currentWindow_) return true;

    if (hasCurrent_ && hasPrevious_ && window == previousWindow_) {
        // Clock stepped back one window: both topics are live, only swap roles.
        char tmp[sizeof(currentTopic_)];
        copyTopic_(tmp, currentTopic_);
        copyTopic_(currentTopic_, previousTopic_);
        copyTopic_(previousTopic_, tmp);
        previousWindow_ = currentWindow_;
        currentWindow_ = window;
        out.rotated = true;
        return true;
    }

    char topic[sizeof(currentTopic_)];
    if (!topicForWindow(identity_->key, prefix_, identity_->serial, window, topic, sizeof(topic))) {
        return false;
    }

    if (hasCurrent_) {
        if (hasPrevious_) release_(out, previousTopic_, topic);
        if (window == currentWindow_ + 1U) {
            copyTopic_(previousTopic_, currentTopic_);
            previousWindow_ = currentWindow_;
            hasPrevious_ = true;
        } else {
            release_(out, currentTopic_, topic);
            hasPrevious_ = false;
        }
    }

    copyTopic_(currentTopic_, topic);
    currentWindow_ = window;
    hasCurrent_ = true;

    out.rotated = true;
    out.subscribe = true;
    copyTopic_(out.subscribeTopic, currentTopic_);
    return true;
}

void TopicRotator::release_(TopicRotation& out, const char* topic, const char* keep)
{
    if (strcmp(topic, keep) == 0) return;
    copyTopic_(out.unsubscribeTopics[out.unsubscribeCount++], topic);
}

void TopicRotator::copyTopic_(char* dst, const char* src)
{
    strncpy(dst, src, Limits::Mqtt::Buffers::Topic - 1U);
    dst[Limits::Mqtt::Buffers::Topic - 1U] = '\0';
}

bool TopicRotator::windowForTopic(const char* topic, uint64_t& outWindow) const
{
    if (!topic) return false;
    if (hasCurrent_ && strcmp(topic, currentTopic_) == 0) {
        outWindow = currentWindow_;
        return true;
    }
    if (hasPrevious_ && strcmp(topic, previousTopic_) == 0) {
        outWindow = previousWindow_;
        return true;
    }
    return false;
}

void TopicRotator::reset()
{
    hasCurrent_ = false;
    hasPrevious_ = false;
    currentWindow_ = 0;
    previousWindow_ = 0;
    currentTopic_[0] = '\0';
    previousTopic_[0] = '\0';
}

bool TopicRotator::responseTopic(char* out, size_t outLen) const
{
    if (!hasCurrent_ || !out || outLen == 0) return false;
    const int n = snprintf(out, outLen, "%s/%s", currentTopic_, MqttTopics::SuffixResponse);
    return n > 0 && (size_t)n < outLen;
}
