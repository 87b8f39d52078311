/**
 * @file DeviceStateMachine.cpp
 * @brief Implementation file.
 */
#include "Core/DeviceStateMachine.h"

const char* deviceStateStr(DeviceState s)
{
    switch (s) {
    case DeviceState::Booting: return "Booting";
    case DeviceState::Connecting: return "Connecting";
    case DeviceState::Idle: return "Idle";
    case DeviceState::Signaling: return "Signaling";
    case DeviceState::Error: return "Error";
    }
    return "Unknown";
}

uint32_t DeviceStateSlot::pack(const DeviceStateSnapshot& s)
{
    return ((uint32_t)s.state & 0x0FU) |
           (((uint32_t)s.kind & 0x0FU) << 4) |
           ((uint32_t)s.pulseCount << 8) |
           ((uint32_t)s.pulseSeq << 16);
}

DeviceStateSnapshot DeviceStateSlot::unpack(uint32_t word)
{
    DeviceStateSnapshot s;
    s.state = (DeviceState)(word & 0x0FU);
    s.kind = (CommandKind)((word >> 4) & 0x0FU);
    s.pulseCount = (uint8_t)((word >> 8) & 0xFFU);
    s.pulseSeq = (uint16_t)(word >> 16);
    return s;
}

void DeviceStateSlot::publishState(DeviceState state, CommandKind kind)
{
    uint32_t cur = word_.load(std::memory_order_relaxed);
    for (;;) {
        DeviceStateSnapshot s = unpack(cur);
        s.state = state;
        s.kind = kind;
        if (word_.compare_exchange_weak(cur, pack(s), std::memory_order_release,
                                        std::memory_order_relaxed)) {
            return;
        }
    }
}

void DeviceStateSlot::requestPulse(uint8_t count)
{
    if (count == 0) return;
    uint32_t cur = word_.load(std::memory_order_relaxed);
    for (;;) {
        DeviceStateSnapshot s = unpack(cur);
        s.pulseCount = count;
        s.pulseSeq = (uint16_t)(s.pulseSeq + 1U);
        if (word_.compare_exchange_weak(cur, pack(s), std::memory_order_release,
                                        std::memory_order_relaxed)) {
            return;
        }
    }
}

DeviceStateSnapshot DeviceStateSlot::load() const
{
    return unpack(word_.load(std::memory_order_acquire));
}

DeviceStateMachine::DeviceStateMachine(DeviceStateSlot& slot)
    : slot_(slot)
{
    slot_.publishState(state_, kind_);
}

void DeviceStateMachine::configure(uint8_t maxConnectAttempts, uint32_t errorDwellMs,
                                   uint32_t networkAttemptMs)
{
    maxConnectAttempts_ = (maxConnectAttempts == 0) ? 1 : maxConnectAttempts;
    errorDwellMs_ = errorDwellMs;
    networkAttemptMs_ = (networkAttemptMs == 0) ? 1 : networkAttemptMs;
}

uint8_t DeviceStateMachine::flashCountFor(CommandKind kind)
{
    switch (kind) {
    case CommandKind::Wake: return WakeDefaults::FlashesWake;
    case CommandKind::Status: return WakeDefaults::FlashesStatus;
    case CommandKind::Usage:
    case CommandKind::Ping:
    case CommandKind::GetSchedule:
    case CommandKind::SetSchedule:
        return WakeDefaults::FlashesOther;
    }
    return WakeDefaults::FlashesOther;
}

uint32_t DeviceStateMachine::signalDurationMs(uint8_t flashes)
{
    return (uint32_t)flashes * (WakeDefaults::FlashOnMs + WakeDefaults::FlashOffMs);
}

void DeviceStateMachine::enter_(DeviceState s, uint32_t nowMs)
{
    state_ = s;
    enteredMs_ = nowMs;
    slot_.publishState(state_, kind_);
}

void DeviceStateMachine::onTimeSynced(uint32_t nowMs)
{
    if (state_ != DeviceState::Booting) return;
    connectAttempts_ = 0;
    enter_(DeviceState::Connecting, nowMs);
}

void DeviceStateMachine::onTimeSyncFailed(uint32_t nowMs)
{
    if (state_ != DeviceState::Booting && state_ != DeviceState::Connecting) return;
    enter_(DeviceState::Error, nowMs);
}

void DeviceStateMachine::onBrokerConnected(uint32_t nowMs)
{
    if (state_ != DeviceState::Connecting) return;
    connectAttempts_ = 0;
    enter_(DeviceState::Idle, nowMs);
}

void DeviceStateMachine::onConnectAttemptFailed(uint32_t nowMs)
{
    if (state_ != DeviceState::Connecting) return;
    if (connectAttempts_ < 0xFF) ++connectAttempts_;
    if (connectAttempts_ >= maxConnectAttempts_) {
        enter_(DeviceState::Error, nowMs);
    }
}

void DeviceStateMachine::onConnectionLost(uint32_t nowMs)
{
    if (state_ != DeviceState::Idle && state_ != DeviceState::Signaling) return;
    connectAttempts_ = 0;
    enter_(DeviceState::Connecting, nowMs);
}

void DeviceStateMachine::onNetworkLost(uint32_t nowMs)
{
    if (networkDown_) return;
    networkDown_ = true;
    networkDownMs_ = nowMs;
}

void DeviceStateMachine::onNetworkReady()
{
    networkDown_ = false;
}

void DeviceStateMachine::onFault(uint32_t nowMs)
{
    if (state_ == DeviceState::Error) return;
    enter_(DeviceState::Error, nowMs);
}

void DeviceStateMachine::onCommandAccepted(CommandKind kind, uint32_t nowMs)
{
    if (!acceptsCommands()) return;
    kind_ = kind;
    const uint8_t flashes = flashCountFor(kind);
    signalMs_ = signalDurationMs(flashes);
    enter_(DeviceState::Signaling, nowMs);
    slot_.requestPulse(flashes);
}

void DeviceStateMachine::onCommandRejected(uint32_t)
{
    if (!acceptsCommands()) return;
    slot_.requestPulse(WakeDefaults::FlashesReceived);
}

DeviceAction DeviceStateMachine::tick(uint32_t nowMs)
{
    if (networkDown_ && state_ != DeviceState::Booting && state_ != DeviceState::Error) {
        const uint64_t budgetMs = (uint64_t)maxConnectAttempts_ * networkAttemptMs_;
        if ((uint64_t)(uint32_t)(nowMs - networkDownMs_) >= budgetMs) {
            enter_(DeviceState::Error, nowMs);
            return DeviceAction::None;
        }
    }

    const uint32_t elapsed = nowMs - enteredMs_;
    switch (state_) {
    case DeviceState::Signaling:
        if (elapsed >= signalMs_) enter_(DeviceState::Idle, nowMs);
        return DeviceAction::None;

    case DeviceState::Error:
        if (elapsed < errorDwellMs_) return DeviceAction::None;
        connectAttempts_ = 0;
        networkDown_ = false;
        enter_(DeviceState::Booting, nowMs);
        return DeviceAction::Restart;

    case DeviceState::Booting:
    case DeviceState::Connecting:
    case DeviceState::Idle:
        return DeviceAction::None;
    }
    return DeviceAction::None;
}
