#pragma once
/**
 * @file DeviceStateMachine.h
 * @brief Connectivity / command-processing state and the shared indicator slot.
 */
#include <atomic>
#include <stdint.h>

#include "Core/CommandKind.h"
#include "Domain/WakeDefaults.h"

enum class DeviceState : uint8_t { Booting = 0, Connecting, Idle, Signaling, Error };

/** @brief Side effect requested by `DeviceStateMachine::tick`. */
enum class DeviceAction : uint8_t { None, Restart };

const char* deviceStateStr(DeviceState s);

/** @brief Decoded copy of the slot word. */
struct DeviceStateSnapshot {
    DeviceState state = DeviceState::Booting;
    CommandKind kind = CommandKind::Wake;
    uint8_t pulseCount = 0;
    uint16_t pulseSeq = 0;
};

/**
 * @brief Single word shared between the protocol task and the indicator task.
 *
 * Layout: bits 0..3 state, 4..7 kind, 8..15 pulse count, 16..31 pulse sequence.
 * Writers use compare-exchange so a state publish never loses a concurrent pulse.
 */
class DeviceStateSlot {
public:
    void publishState(DeviceState state, CommandKind kind);
    /** @brief Start a new pulse of `count` flashes; bumps the sequence. */
    void requestPulse(uint8_t count);
    DeviceStateSnapshot load() const;

    static uint32_t pack(const DeviceStateSnapshot& s);
    static DeviceStateSnapshot unpack(uint32_t word);

private:
    std::atomic<uint32_t> word_{0};
};

/**
 * @brief Authoritative device state, mutated only from the protocol task.
 *
 * Every transition is published into the slot; the indicator only loads it.
 */
class DeviceStateMachine {
public:
    explicit DeviceStateMachine(DeviceStateSlot& slot);

    /**
     * @brief Set retry bounds.
     *
     * `networkAttemptMs` is the outage length counted as one failed attempt;
     * a station down for `maxConnectAttempts * networkAttemptMs` while
     * connecting or connected is unrecoverable.
     */
    void configure(uint8_t maxConnectAttempts, uint32_t errorDwellMs,
                   uint32_t networkAttemptMs = WakeDefaults::NetworkAttemptMs);

    void onTimeSynced(uint32_t nowMs);
    void onTimeSyncFailed(uint32_t nowMs);
    void onBrokerConnected(uint32_t nowMs);
    void onConnectAttemptFailed(uint32_t nowMs);
    void onConnectionLost(uint32_t nowMs);
    void onNetworkLost(uint32_t nowMs);
    void onNetworkReady();
    void onFault(uint32_t nowMs);
    void onCommandAccepted(CommandKind kind, uint32_t nowMs);
    void onCommandRejected(uint32_t nowMs);

    /** @brief Time driven transitions: end of signaling, network outage budget, error dwell expiry. */
    DeviceAction tick(uint32_t nowMs);

    DeviceState state() const { return state_; }
    CommandKind signalingKind() const { return kind_; }
    uint8_t connectAttempts() const { return connectAttempts_; }
    bool acceptsCommands() const {
        return state_ == DeviceState::Idle || state_ == DeviceState::Signaling;
    }

    static uint8_t flashCountFor(CommandKind kind);
    static uint32_t signalDurationMs(uint8_t flashes);

private:
    void enter_(DeviceState s, uint32_t nowMs);

    DeviceStateSlot& slot_;
    DeviceState state_ = DeviceState::Booting;
    CommandKind kind_ = CommandKind::Wake;
    uint32_t enteredMs_ = 0;
    uint32_t signalMs_ = 0;
    uint8_t connectAttempts_ = 0;
    uint8_t maxConnectAttempts_ = WakeDefaults::MaxConnectAttempts;
    uint32_t errorDwellMs_ = WakeDefaults::ErrorDwellMs;
    uint32_t networkAttemptMs_ = WakeDefaults::NetworkAttemptMs;
    bool networkDown_ = false;
    uint32_t networkDownMs_ = 0;
};
