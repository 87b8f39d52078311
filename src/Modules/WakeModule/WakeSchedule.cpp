/**
 * @file WakeSchedule.cpp
 * @brief Implementation file.
 */
#include "Modules/WakeModule/WakeSchedule.h"

#include <stdio.h>
#include <string.h>

#include <ArduinoJson.h>

static constexpr uint32_t kNoTrigger = 0xFFFFFFFFUL;

void WakeSchedule::clear()
{
    for (uint8_t i = 0; i < MaxSlots; ++i) {
        slots_[i] = WakeSlot{};
        lastTriggerMinute_[i] = kNoTrigger;
    }
}

bool WakeSchedule::isValid(const WakeSlot& s)
{
    if ((s.weekdayMask & AllDays) == 0 || (s.weekdayMask & ~AllDays) != 0) return false;
    if (s.hour > 23 || s.minute > 59) return false;
    return true;
}

uint8_t WakeSchedule::usedCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < MaxSlots; ++i) {
        if (slots_[i].used) ++n;
    }
    return n;
}

uint8_t WakeSchedule::weekBitFromEpoch(uint64_t utcSec)
{
    // 1970-01-01 was a Thursday (bit 3 with Monday = bit 0).
    const uint64_t days = utcSec / 86400ULL;
    return (uint8_t)((days + 3ULL) % 7ULL);
}

bool WakeSchedule::parseBlob(const char* blob)
{
    clear();
    if (!blob) return true;

    const char* p = blob;
    while (*p) {
        while (*p == ';' || *p == ' ' || *p == '\n' || *p == '\r' || *p == '\t') ++p;
        if (*p == '\0') break;

        char token[32] = {0};
        size_t t = 0;
        while (*p && *p != ';') {
            if (t + 1 < sizeof(token)) token[t++] = *p;
            ++p;
        }
        if (*p == ';') ++p;
        token[t] = '\0';

        unsigned idx = 0, enabled = 0, mask = 0, hour = 0, minute = 0;
        const int n = sscanf(token, "%u,%u,%u,%u,%u", &idx, &enabled, &mask, &hour, &minute);
        if (n != 5 || idx >= MaxSlots) continue;

        WakeSlot s;
        s.used = true;
        s.enabled = (enabled != 0);
        s.weekdayMask = (uint8_t)(mask & 0xFFU);
        s.hour = (uint8_t)(hour > 0xFFU ? 0xFFU : hour);
        s.minute = (uint8_t)(minute > 0xFFU ? 0xFFU : minute);
        if (mask > 0xFFU || !isValid(s)) continue;
        slots_[idx] = s;
    }
    return true;
}

bool WakeSchedule::serializeBlob(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';

    size_t pos = 0;
    for (uint8_t i = 0; i < MaxSlots; ++i) {
        const WakeSlot& s = slots_[i];
        if (!s.used) continue;
        const int n = snprintf(out + pos, outLen - pos, "%u,%u,%u,%u,%u;",
                               (unsigned)i,
                               s.enabled ? 1U : 0U,
                               (unsigned)s.weekdayMask,
                               (unsigned)s.hour,
                               (unsigned)s.minute);
        if (n <= 0 || (size_t)n >= (outLen - pos)) {
            out[outLen - 1] = '\0';
            return false;
        }
        pos += (size_t)n;
    }
    return true;
}

bool WakeSchedule::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::Wake::JsonSchedArgsBuf> doc;
    JsonArray arr = doc.createNestedArray("slots");
    for (uint8_t i = 0; i < MaxSlots; ++i) {
        const WakeSlot& s = slots_[i];
        if (!s.used) continue;
        JsonObject o = arr.createNestedObject();
        o["slot"] = i;
        o["enabled"] = s.enabled;
        o["days"] = s.weekdayMask;
        o["hour"] = s.hour;
        o["minute"] = s.minute;
    }
    if (doc.overflowed()) return false;
    if (measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

static bool parseSlot(JsonVariantConst v, WakeSlot* next, ErrorCode& err)
{
    JsonObjectConst o = v.as<JsonObjectConst>();
    if (o.isNull()) {
        err = ErrorCode::BadArgsJson;
        return false;
    }

    JsonVariantConst jSlot = o["slot"];
    JsonVariantConst jEnabled = o["enabled"];
    JsonVariantConst jDays = o["days"];
    JsonVariantConst jHour = o["hour"];
    JsonVariantConst jMinute = o["minute"];
    if (jSlot.isNull() || jEnabled.isNull() || jDays.isNull() || jHour.isNull() || jMinute.isNull()) {
        err = ErrorCode::MissingArgs;
        return false;
    }

    if (!jSlot.is<unsigned>() || jSlot.as<unsigned>() >= WakeSchedule::MaxSlots) {
        err = ErrorCode::InvalidSlot;
        return false;
    }
    if (!jEnabled.is<bool>()) {
        err = ErrorCode::InvalidBool;
        return false;
    }
    const unsigned days = jDays.is<unsigned>() ? jDays.as<unsigned>() : 0U;
    if (days == 0 || days > WakeSchedule::AllDays) {
        err = ErrorCode::InvalidWeekdayMask;
        return false;
    }
    if (!jHour.is<unsigned>() || jHour.as<unsigned>() > 23) {
        err = ErrorCode::InvalidHour;
        return false;
    }
    if (!jMinute.is<unsigned>() || jMinute.as<unsigned>() > 59) {
        err = ErrorCode::InvalidMinute;
        return false;
    }

    WakeSlot& s = next[jSlot.as<unsigned>()];
    if (s.used) {
        // Same index twice in one request.
        err = ErrorCode::InvalidSlot;
        return false;
    }
    s.used = true;
    s.enabled = jEnabled.as<bool>();
    s.weekdayMask = (uint8_t)days;
    s.hour = (uint8_t)jHour.as<unsigned>();
    s.minute = (uint8_t)jMinute.as<unsigned>();
    return true;
}

bool WakeSchedule::applyJson(const char* json, ErrorCode& err, uint8_t& badSlot, uint8_t& saved)
{
    badSlot = 0;
    saved = 0;
    if (!json || json[0] == '\0') {
        err = ErrorCode::MissingArgs;
        return false;
    }

    StaticJsonDocument<Limits::Wake::JsonSchedArgsBuf> doc;
    if (deserializeJson(doc, json)) {
        err = ErrorCode::BadArgsJson;
        return false;
    }

    JsonArrayConst arr = doc["slots"].as<JsonArrayConst>();
    if (arr.isNull()) {
        err = ErrorCode::MissingArgs;
        return false;
    }
    if (arr.size() > MaxSlots) {
        badSlot = MaxSlots;
        err = ErrorCode::InvalidSlot;
        return false;
    }

    WakeSlot next[MaxSlots]{};
    uint8_t entry = 0;
    for (JsonVariantConst v : arr) {
        badSlot = entry++;
        if (!parseSlot(v, next, err)) return false;
    }

    for (uint8_t i = 0; i < MaxSlots; ++i) {
        slots_[i] = next[i];
    }
    badSlot = 0;
    saved = usedCount();
    return true;
}

uint8_t WakeSchedule::due(uint64_t utcSec)
{
    const uint32_t minuteKey = (uint32_t)(utcSec / 60ULL);
    const uint8_t weekBit = weekBitFromEpoch(utcSec);
    const uint32_t secOfDay = (uint32_t)(utcSec % 86400ULL);
    const uint8_t hour = (uint8_t)(secOfDay / 3600U);
    const uint8_t minute = (uint8_t)((secOfDay % 3600U) / 60U);

    uint8_t mask = 0;
    for (uint8_t i = 0; i < MaxSlots; ++i) {
        const WakeSlot& s = slots_[i];
        if (!s.used || !s.enabled) continue;
        if ((s.weekdayMask & (uint8_t)(1U << weekBit)) == 0) continue;
        if (s.hour != hour || s.minute != minute) continue;
        if (lastTriggerMinute_[i] == minuteKey) continue;
        lastTriggerMinute_[i] = minuteKey;
        mask |= (uint8_t)(1U << i);
    }
    return mask;
}
