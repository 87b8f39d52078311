#include <unity.h>
#include <string.h>

#include "Modules/WakeModule/WakeSchedule.h"

void setUp() {}
void tearDown() {}

// 2024-01-01 00:00:00 UTC, a Monday.
static const uint64_t kMonday = 1704067200ULL;

void test_week_bit_starts_on_monday()
{
    TEST_ASSERT_EQUAL_UINT8(3, WakeSchedule::weekBitFromEpoch(0));            // Thursday
    TEST_ASSERT_EQUAL_UINT8(0, WakeSchedule::weekBitFromEpoch(kMonday));
    TEST_ASSERT_EQUAL_UINT8(6, WakeSchedule::weekBitFromEpoch(kMonday - 1));  // Sunday
}

void test_blob_round_trip_and_invalid_tokens_skipped()
{
    WakeSchedule s;
    TEST_ASSERT_TRUE(s.parseBlob("0,1,31,7,30;3,0,96,9,0;9,1,1,1,1;4,1,0,1,1;5,1,1,25,0;garbage;"));
    TEST_ASSERT_EQUAL_UINT8(2, s.usedCount());
    TEST_ASSERT_TRUE(s.slot(0).enabled);
    TEST_ASSERT_EQUAL_UINT8(31, s.slot(0).weekdayMask);
    TEST_ASSERT_FALSE(s.slot(3).enabled);

    char blob[Limits::Wake::ScheduleBlob];
    TEST_ASSERT_TRUE(s.serializeBlob(blob, sizeof(blob)));
    TEST_ASSERT_EQUAL_STRING("0,1,31,7,30;3,0,96,9,0;", blob);
}

void test_slot_fires_once_per_matching_minute()
{
    WakeSchedule s;
    TEST_ASSERT_TRUE(s.parseBlob("1,1,1,7,30;"));  // Monday 07:30

    const uint64_t t = kMonday + 7 * 3600 + 30 * 60;
    TEST_ASSERT_EQUAL_UINT8(0, s.due(t - 1));
    TEST_ASSERT_EQUAL_UINT8(0x02, s.due(t));
    TEST_ASSERT_EQUAL_UINT8(0, s.due(t + 10));
    TEST_ASSERT_EQUAL_UINT8(0, s.due(t + 59));
    TEST_ASSERT_EQUAL_UINT8(0, s.due(t + 60));

    // Next Monday fires again; Tuesday does not.
    TEST_ASSERT_EQUAL_UINT8(0, s.due(t + 86400));
    TEST_ASSERT_EQUAL_UINT8(0x02, s.due(t + 7 * 86400));
}

void test_disabled_slot_never_fires()
{
    WakeSchedule s;
    TEST_ASSERT_TRUE(s.parseBlob("0,0,127,0,0;"));
    TEST_ASSERT_EQUAL_UINT8(0, s.due(kMonday));
}

void test_apply_json_replaces_table_atomically()
{
    WakeSchedule s;
    TEST_ASSERT_TRUE(s.parseBlob("0,1,127,6,0;"));

    ErrorCode err = ErrorCode::Failed;
    uint8_t bad = 0, saved = 0;
    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":[{\"slot\":1,\"enabled\":true,\"days\":0,\"hour\":6,\"minute\":0}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidWeekdayMask, err);
    TEST_ASSERT_TRUE(s.slot(0).used);

    TEST_ASSERT_TRUE(s.applyJson("{\"slots\":[{\"slot\":4,\"enabled\":false,\"days\":64,\"hour\":22,\"minute\":15}]}",
                                 err, bad, saved));
    TEST_ASSERT_EQUAL_UINT8(1, saved);
    TEST_ASSERT_FALSE(s.slot(0).used);
    TEST_ASSERT_TRUE(s.slot(4).used);
    TEST_ASSERT_EQUAL_UINT8(22, s.slot(4).hour);
}

void test_apply_json_error_codes()
{
    WakeSchedule s;
    ErrorCode err = ErrorCode::Failed;
    uint8_t bad = 0, saved = 0;

    TEST_ASSERT_FALSE(s.applyJson("", err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::MissingArgs, err);

    TEST_ASSERT_FALSE(s.applyJson("{nope", err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::BadArgsJson, err);

    TEST_ASSERT_FALSE(s.applyJson("{\"other\":1}", err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::MissingArgs, err);

    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":[{\"slot\":8,\"enabled\":true,\"days\":1,\"hour\":1,\"minute\":1}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidSlot, err);

    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":[{\"slot\":1,\"enabled\":\"yes\",\"days\":1,\"hour\":1,\"minute\":1}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidBool, err);

    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":[{\"slot\":1,\"enabled\":true,\"days\":1,\"hour\":1,\"minute\":60}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidMinute, err);

    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":[{\"slot\":1,\"enabled\":true,\"hour\":1,\"minute\":1}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::MissingArgs, err);
}

void test_apply_json_rejects_duplicate_slot_index()
{
    WakeSchedule s;
    TEST_ASSERT_TRUE(s.parseBlob("0,1,127,6,0;"));

    ErrorCode err = ErrorCode::Failed;
    uint8_t bad = 0, saved = 0;
    TEST_ASSERT_FALSE(s.applyJson("{\"slots\":["
                                  "{\"slot\":2,\"enabled\":true,\"days\":1,\"hour\":7,\"minute\":0},"
                                  "{\"slot\":2,\"enabled\":true,\"days\":2,\"hour\":8,\"minute\":30}]}",
                                  err, bad, saved));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidSlot, err);
    TEST_ASSERT_EQUAL_UINT8(1, bad);

    // Table left untouched.
    TEST_ASSERT_TRUE(s.slot(0).used);
    TEST_ASSERT_FALSE(s.slot(2).used);
    TEST_ASSERT_EQUAL_UINT8(1, s.usedCount());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_week_bit_starts_on_monday);
    RUN_TEST(test_blob_round_trip_and_invalid_tokens_skipped);
    RUN_TEST(test_slot_fires_once_per_matching_minute);
    RUN_TEST(test_disabled_slot_never_fires);
    RUN_TEST(test_apply_json_replaces_table_atomically);
    RUN_TEST(test_apply_json_error_codes);
    RUN_TEST(test_apply_json_rejects_duplicate_slot_index);
    return UNITY_END();
}
