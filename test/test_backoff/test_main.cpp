#include <unity.h>

#include "Core/Backoff.h"

void setUp() {}
void tearDown() {}

void test_ladder_steps()
{
    TEST_ASSERT_EQUAL_UINT32(5000, Backoff::nextDelayMs(2000));
    TEST_ASSERT_EQUAL_UINT32(10000, Backoff::nextDelayMs(5000));
    TEST_ASSERT_EQUAL_UINT32(30000, Backoff::nextDelayMs(10000));
    TEST_ASSERT_EQUAL_UINT32(60000, Backoff::nextDelayMs(30000));
    TEST_ASSERT_EQUAL_UINT32(300000, Backoff::nextDelayMs(60000));
    TEST_ASSERT_EQUAL_UINT32(300000, Backoff::nextDelayMs(300000));
}

void test_jittered_values_advance_to_next_step()
{
    // 15% jitter around 5000 can land anywhere in [4250, 5750].
    TEST_ASSERT_EQUAL_UINT32(5000, Backoff::nextDelayMs(4250));
    TEST_ASSERT_EQUAL_UINT32(10000, Backoff::nextDelayMs(5750));
}

void test_jitter_bounds()
{
    TEST_ASSERT_EQUAL_UINT32(8500, Backoff::jitterMs(10000, 15, 0));
    TEST_ASSERT_EQUAL_UINT32(10000, Backoff::jitterMs(10000, 15, 1500));
    TEST_ASSERT_EQUAL_UINT32(11500, Backoff::jitterMs(10000, 15, 3000));
    TEST_ASSERT_EQUAL_UINT32(8500, Backoff::jitterMs(10000, 15, 3001));
    TEST_ASSERT_EQUAL_UINT32(10000, Backoff::jitterMs(10000, 0, 12345));
}

void test_clamp()
{
    TEST_ASSERT_EQUAL_UINT32(2, Backoff::clampU32(1, 2, 5));
    TEST_ASSERT_EQUAL_UINT32(5, Backoff::clampU32(9, 2, 5));
    TEST_ASSERT_EQUAL_UINT32(3, Backoff::clampU32(3, 2, 5));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_ladder_steps);
    RUN_TEST(test_jittered_values_advance_to_next_step);
    RUN_TEST(test_jitter_bounds);
    RUN_TEST(test_clamp);
    return UNITY_END();
}
