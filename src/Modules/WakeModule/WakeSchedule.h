#pragma once
/**
 * @file WakeSchedule.h
 * @brief Weekly UTC auto-wake slots with NVS blob and JSON forms.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"

/** @brief One recurring wake slot. Weekday bit0 = Monday ... bit6 = Sunday. */
struct WakeSlot {
    bool used = false;
    bool enabled = false;
    uint8_t weekdayMask = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
};

class WakeSchedule {
public:
    static constexpr uint8_t MaxSlots = Limits::Wake::MaxScheduleSlots;
    static constexpr uint8_t AllDays = 0x7F;

    WakeSchedule() { clear(); }

    void clear();

    /**
     * @brief Load `slot,enabled,mask,hour,minute;` tokens.
     *
     * Invalid tokens are skipped; the rest of the blob still loads.
     */
    bool parseBlob(const char* blob);
    bool serializeBlob(char* out, size_t outLen) const;

    /** @brief `{"slots":[{"slot","enabled","days","hour","minute"}...]}`. */
    bool toJson(char* out, size_t outLen) const;

    /**
     * @brief Replace the whole table from `{"slots":[...]}`.
     *
     * On failure nothing changes, `err` holds the reason and `badSlot` the
     * offending entry index.
     */
    bool applyJson(const char* json, ErrorCode& err, uint8_t& badSlot, uint8_t& saved);

    /**
     * @brief Bitmask of slots that fire at `utcSec`.
     *
     * A slot fires at most once per matching minute.
     */
    uint8_t due(uint64_t utcSec);

    const WakeSlot& slot(uint8_t idx) const { return slots_[idx < MaxSlots ? idx : 0]; }
    uint8_t usedCount() const;

    static uint8_t weekBitFromEpoch(uint64_t utcSec);
    static bool isValid(const WakeSlot& s);

private:
    WakeSlot slots_[MaxSlots]{};
    uint32_t lastTriggerMinute_[MaxSlots]{};
};
