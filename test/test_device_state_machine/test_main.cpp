#include <unity.h>

#include "Core/DeviceStateMachine.h"

void setUp() {}
void tearDown() {}

static void bringToIdle(DeviceStateMachine& sm)
{
    sm.onTimeSynced(0);
    sm.onBrokerConnected(10);
}

void test_initial_state_is_booting_and_published()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    TEST_ASSERT_EQUAL(DeviceState::Booting, sm.state());
    TEST_ASSERT_EQUAL(DeviceState::Booting, slot.load().state);
    TEST_ASSERT_FALSE(sm.acceptsCommands());
}

void test_nominal_path_to_idle()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.onBrokerConnected(0);
    TEST_ASSERT_EQUAL(DeviceState::Booting, sm.state());

    sm.onTimeSynced(5);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
    TEST_ASSERT_EQUAL(DeviceState::Connecting, slot.load().state);

    sm.onBrokerConnected(10);
    TEST_ASSERT_EQUAL(DeviceState::Idle, sm.state());
    TEST_ASSERT_TRUE(sm.acceptsCommands());
}

void test_time_sync_failure_enters_error()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.onTimeSyncFailed(0);
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
}

void test_connect_attempts_exhausted_enters_error()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(3, 10000);
    sm.onTimeSynced(0);

    sm.onConnectAttemptFailed(1);
    sm.onConnectAttemptFailed(2);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
    TEST_ASSERT_EQUAL_UINT8(2, sm.connectAttempts());
    sm.onConnectAttemptFailed(3);
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
}

void test_connection_lost_returns_to_connecting_and_resets_attempts()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(2, 10000);
    sm.onTimeSynced(0);
    sm.onConnectAttemptFailed(1);
    sm.onBrokerConnected(2);
    TEST_ASSERT_EQUAL_UINT8(0, sm.connectAttempts());

    sm.onConnectionLost(3);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
    sm.onConnectAttemptFailed(4);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
}

void test_station_outage_while_connecting_enters_error_then_restarts()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(3, 1000, 100);
    bringToIdle(sm);

    sm.onNetworkLost(20);
    sm.onConnectionLost(21);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());

    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(319));
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());

    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(320));
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
    TEST_ASSERT_EQUAL(DeviceState::Error, slot.load().state);

    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(1319));
    TEST_ASSERT_EQUAL(DeviceAction::Restart, sm.tick(1320));
}

void test_station_outage_while_idle_enters_error()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(2, 1000, 100);
    bringToIdle(sm);

    sm.onNetworkLost(50);
    sm.tick(249);
    TEST_ASSERT_EQUAL(DeviceState::Idle, sm.state());
    sm.tick(250);
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
}

void test_station_recovery_clears_outage_budget()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(3, 1000, 100);
    bringToIdle(sm);

    sm.onNetworkLost(20);
    sm.onConnectionLost(21);
    sm.tick(200);
    sm.onNetworkReady();
    sm.tick(5000);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());

    // A second outage is timed from its own start.
    sm.onNetworkLost(6000);
    sm.tick(6299);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
    sm.tick(6300);
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
}

void test_accepted_command_signals_then_returns_to_idle()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    bringToIdle(sm);

    const uint16_t seqBefore = slot.load().pulseSeq;
    sm.onCommandAccepted(CommandKind::Wake, 1000);
    TEST_ASSERT_EQUAL(DeviceState::Signaling, sm.state());
    TEST_ASSERT_EQUAL(CommandKind::Wake, sm.signalingKind());

    const DeviceStateSnapshot snap = slot.load();
    TEST_ASSERT_EQUAL(DeviceState::Signaling, snap.state);
    TEST_ASSERT_EQUAL(CommandKind::Wake, snap.kind);
    TEST_ASSERT_EQUAL_UINT8(3, snap.pulseCount);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)(seqBefore + 1), snap.pulseSeq);

    const uint32_t duration = DeviceStateMachine::signalDurationMs(3);
    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(1000 + duration - 1));
    TEST_ASSERT_EQUAL(DeviceState::Signaling, sm.state());
    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(1000 + duration));
    TEST_ASSERT_EQUAL(DeviceState::Idle, sm.state());
}

void test_rejected_command_pulses_without_leaving_idle()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    bringToIdle(sm);

    const uint16_t seqBefore = slot.load().pulseSeq;
    sm.onCommandRejected(50);
    TEST_ASSERT_EQUAL(DeviceState::Idle, sm.state());
    const DeviceStateSnapshot snap = slot.load();
    TEST_ASSERT_EQUAL(DeviceState::Idle, snap.state);
    TEST_ASSERT_EQUAL_UINT8(1, snap.pulseCount);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)(seqBefore + 1), snap.pulseSeq);
}

void test_commands_ignored_before_idle()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.onTimeSynced(0);
    sm.onCommandAccepted(CommandKind::Status, 1);
    TEST_ASSERT_EQUAL(DeviceState::Connecting, sm.state());
    TEST_ASSERT_EQUAL_UINT16(0, slot.load().pulseSeq);
}

void test_fault_from_any_state_and_restart_after_dwell()
{
    DeviceStateSlot slot;
    DeviceStateMachine sm(slot);
    sm.configure(8, 10000);
    bringToIdle(sm);

    sm.onFault(2000);
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
    TEST_ASSERT_FALSE(sm.acceptsCommands());

    TEST_ASSERT_EQUAL(DeviceAction::None, sm.tick(11999));
    TEST_ASSERT_EQUAL(DeviceState::Error, sm.state());
    TEST_ASSERT_EQUAL(DeviceAction::Restart, sm.tick(12000));
    TEST_ASSERT_EQUAL(DeviceState::Booting, sm.state());
    TEST_ASSERT_EQUAL(DeviceState::Booting, slot.load().state);
}

void test_flash_counts_per_kind()
{
    TEST_ASSERT_EQUAL_UINT8(3, DeviceStateMachine::flashCountFor(CommandKind::Wake));
    TEST_ASSERT_EQUAL_UINT8(2, DeviceStateMachine::flashCountFor(CommandKind::Status));
    TEST_ASSERT_EQUAL_UINT8(1, DeviceStateMachine::flashCountFor(CommandKind::Usage));
    TEST_ASSERT_EQUAL_UINT8(1, DeviceStateMachine::flashCountFor(CommandKind::Ping));
}

void test_slot_pack_unpack_keeps_all_fields()
{
    DeviceStateSnapshot s;
    s.state = DeviceState::Error;
    s.kind = CommandKind::SetSchedule;
    s.pulseCount = 7;
    s.pulseSeq = 0xBEEF;
    const DeviceStateSnapshot r = DeviceStateSlot::unpack(DeviceStateSlot::pack(s));
    TEST_ASSERT_EQUAL(s.state, r.state);
    TEST_ASSERT_EQUAL(s.kind, r.kind);
    TEST_ASSERT_EQUAL_UINT8(7, r.pulseCount);
    TEST_ASSERT_EQUAL_UINT16(0xBEEF, r.pulseSeq);
}

void test_state_publish_keeps_pending_pulse()
{
    DeviceStateSlot slot;
    slot.requestPulse(3);
    slot.publishState(DeviceState::Idle, CommandKind::Wake);
    const DeviceStateSnapshot s = slot.load();
    TEST_ASSERT_EQUAL(DeviceState::Idle, s.state);
    TEST_ASSERT_EQUAL_UINT8(3, s.pulseCount);
    TEST_ASSERT_EQUAL_UINT16(1, s.pulseSeq);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_initial_state_is_booting_and_published);
    RUN_TEST(test_nominal_path_to_idle);
    RUN_TEST(test_time_sync_failure_enters_error);
    RUN_TEST(test_connect_attempts_exhausted_enters_error);
    RUN_TEST(test_connection_lost_returns_to_connecting_and_resets_attempts);
    RUN_TEST(test_accepted_command_signals_then_returns_to_idle);
    RUN_TEST(test_rejected_command_pulses_without_leaving_idle);
    RUN_TEST(test_commands_ignored_before_idle);
    RUN_TEST(test_fault_from_any_state_and_restart_after_dwell);
    RUN_TEST(test_flash_counts_per_kind);
    RUN_TEST(test_slot_pack_unpack_keeps_all_fields);
    RUN_TEST(test_state_publish_keeps_pending_pulse);
    RUN_TEST(test_station_outage_while_connecting_enters_error_then_restarts);
    RUN_TEST(test_station_outage_while_idle_enters_error);
    RUN_TEST(test_station_recovery_clears_outage_budget);
    return UNITY_END();
}
