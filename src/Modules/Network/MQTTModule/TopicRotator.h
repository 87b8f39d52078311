#pragma once
/**
 * @file TopicRotator.h
 * @brief Deterministic time-windowed topic derivation and subscription tracking.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/DeviceIdentity.h"
#include "Core/SystemLimits.h"

/** @brief Subscription changes produced by `TopicRotator::advance`. */
struct TopicRotation {
    bool rotated = false;                               ///< active window changed
    bool subscribe = false;                             ///< `subscribeTopic` must be subscribed
    uint8_t unsubscribeCount = 0;                       ///< entries of `unsubscribeTopics` to release
    char subscribeTopic[Limits::Mqtt::Buffers::Topic] = {0};
    char unsubscribeTopics[2][Limits::Mqtt::Buffers::Topic] = {{0}};
};

/**
 * @brief Maps (serial, UTC time) to a broker topic and tracks the live topics.
 *
 * Window = floor(utc / interval). Token = first 16 bytes of
 * HMAC-SHA256(key, "topic" || serial || 0x00 || window as 8 bytes big endian),
 * rendered as lower-case hex. Topic = `<prefix>/<token>`.
 *
 * The previous window stays subscribed for one extra window so that a command
 * computed by the sender just before a boundary still reaches the device.
 */
class TopicRotator {
public:
    /** @brief Bind identity and prefix; both are borrowed and must outlive the rotator. */
    void configure(const DeviceIdentity* identity, const char* prefix);

    /** @brief `floor(utc / intervalSec)`; false when interval is 0. */
    static bool windowOf(uint64_t utcSec, uint32_t intervalSec, uint64_t& outWindow);

    /** @brief 32 hex chars token for a window. */
    static bool deriveToken(const CryptoKey& key, const char* serial, uint64_t window,
                            char* out, size_t outLen);

    /** @brief `<prefix>/<token>` for an explicit window. */
    static bool topicForWindow(const CryptoKey& key, const char* prefix, const char* serial,
                               uint64_t window, char* out, size_t outLen);

    /** @brief `<prefix>/<token>` for a UTC time (pure; independent of tracker state). */
    bool deriveTopic(uint64_t utcSec, uint32_t intervalSec, char* out, size_t outLen) const;

    /**
     * @brief Recompute the active window and report subscription changes.
     *
     * First call subscribes the current window. On each later window change
     * the new topic is subscribed and the topic two windows behind is released.
     * A jump of more than one window releases both tracked topics. A step
     * back onto the previous window swaps current and previous and touches
     * no subscription. The new topic is never listed for release.
     */
    bool advance(uint64_t utcSec, uint32_t intervalSec, TopicRotation& out);

    /** @brief Window attributed to an inbound topic (current or previous). */
    bool windowForTopic(const char* topic, uint64_t& outWindow) const;

    /** @brief Forget tracked topics (after disconnect the broker drops subscriptions). */
    void reset();

    bool hasCurrent() const { return hasCurrent_; }
    uint64_t currentWindow() const { return currentWindow_; }
    const char* currentTopic() const { return currentTopic_; }
    const char* previousTopic() const { return hasPrevious_ ? previousTopic_ : nullptr; }

    /** @brief `<current topic>/response`. */
    bool responseTopic(char* out, size_t outLen) const;

private:
    static void copyTopic_(char* dst, const char* src);
    static void release_(TopicRotation& out, const char* topic, const char* keep);

    const DeviceIdentity* identity_ = nullptr;
    const char* prefix_ = nullptr;

    bool hasCurrent_ = false;
    bool hasPrevious_ = false;
    uint64_t currentWindow_ = 0;
    uint64_t previousWindow_ = 0;
    char currentTopic_[Limits::Mqtt::Buffers::Topic] = {0};
    char previousTopic_[Limits::Mqtt::Buffers::Topic] = {0};
};
