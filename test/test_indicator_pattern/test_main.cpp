#include <unity.h>

#include "Modules/System/IndicatorModule/IndicatorPattern.h"

void setUp() {}
void tearDown() {}

static DeviceStateSnapshot snap(DeviceState s, uint16_t seq = 0, uint8_t count = 0)
{
    DeviceStateSnapshot out;
    out.state = s;
    out.pulseSeq = seq;
    out.pulseCount = count;
    return out;
}

void test_booting_toggles_every_100ms()
{
    IndicatorPattern p;
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Booting), 0));
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Booting), 99));
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Booting), 100));
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Booting), 200));
}

void test_connecting_toggles_every_300ms()
{
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Connecting, 299));
    TEST_ASSERT_FALSE(IndicatorPattern::baseLevel(DeviceState::Connecting, 300));
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Connecting, 600));
}

void test_idle_is_short_heartbeat()
{
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Idle, 0));
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Idle, 49));
    TEST_ASSERT_FALSE(IndicatorPattern::baseLevel(DeviceState::Idle, 50));
    TEST_ASSERT_FALSE(IndicatorPattern::baseLevel(DeviceState::Idle, 4049));
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Idle, 4050));
}

void test_error_blinks_fast()
{
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Error, 0));
    TEST_ASSERT_FALSE(IndicatorPattern::baseLevel(DeviceState::Error, 50));
    TEST_ASSERT_TRUE(IndicatorPattern::baseLevel(DeviceState::Error, 100));
}

void test_pulse_overrides_then_base_resumes()
{
    IndicatorPattern p;
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Idle), 0));
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Idle), 1000));

    // Three flashes of 50 on / 50 off starting at t=1000.
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Signaling, 1, 3), 1000));
    TEST_ASSERT_TRUE(p.pulseActive());
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Signaling, 1, 3), 1050));
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Signaling, 1, 3), 1100));
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Signaling, 1, 3), 1249));
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Signaling, 1, 3), 1250));

    // Sequence done: base pattern restarts with its on-phase.
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Idle, 1, 3), 1300));
    TEST_ASSERT_FALSE(p.pulseActive());
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Idle, 1, 3), 1400));
}

void test_same_sequence_is_not_replayed()
{
    IndicatorPattern p;
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Idle, 4, 1), 0));
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Idle, 4, 1), 60));
    TEST_ASSERT_TRUE(p.update(snap(DeviceState::Idle, 4, 1), 100));
    TEST_ASSERT_FALSE(p.pulseActive());
    TEST_ASSERT_FALSE(p.update(snap(DeviceState::Idle, 4, 1), 200));
    TEST_ASSERT_FALSE(p.pulseActive());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_booting_toggles_every_100ms);
    RUN_TEST(test_connecting_toggles_every_300ms);
    RUN_TEST(test_idle_is_short_heartbeat);
    RUN_TEST(test_error_blinks_fast);
    RUN_TEST(test_pulse_overrides_then_base_resumes);
    RUN_TEST(test_same_sequence_is_not_replayed);
    return UNITY_END();
}
