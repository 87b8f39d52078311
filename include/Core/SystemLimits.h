#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 2048;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 16;
/** @brief Events delivered per `EventBusModule` loop iteration. */
constexpr uint8_t EventDispatchBurst = 8;

/** @brief Secure command link sizes shared by the envelope codec and the MQTT transport. */
namespace Link {
/** @brief AES block size and IV length in bytes (`CryptoManager`). */
constexpr size_t BlockLen = 16;
/** @brief IV length carried at the head of every envelope. */
constexpr size_t IvLen = 16;
/** @brief HMAC-SHA256 tag length carried at the tail of every envelope. */
constexpr size_t TagLen = 32;
/** @brief AES-256 key length in bytes. */
constexpr size_t KeyLen = 32;
/** @brief Device serial buffer length (`DeviceIdentity::serial`, `Command::target`). */
constexpr size_t Serial = 24;
/** @brief Secret passphrase buffer length (`device.secret`). */
constexpr size_t Secret = 96;
/** @brief Raw JSON `args` buffer length inside `Command`. */
constexpr size_t ArgsJson = 512;
/** @brief Maximum serialized plaintext length of one `Command`. */
constexpr size_t PlainMax = 768;
/** @brief ArduinoJson document capacity used to build and parse a `Command`. */
constexpr size_t JsonCommandDoc = 1536;
/** @brief Maximum ciphertext length (`PlainMax` plus one full padding block). */
constexpr size_t CipherMax = PlainMax + BlockLen;
/** @brief Maximum envelope length on the wire (`IV || ciphertext || tag`). */
constexpr size_t EnvelopeMax = IvLen + CipherMax + TagLen;
/** @brief Minimum envelope length that can be framed (one ciphertext block). */
constexpr size_t EnvelopeMin = IvLen + BlockLen + TagLen;
/** @brief Hex characters of the rotated topic token (16 bytes of HMAC output). */
constexpr size_t TopicTokenHex = 32;
}  // namespace Link

/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT module task stack size returned by `MQTTModule::taskStackSize` (crypto + JSON path). */
constexpr uint16_t TaskStackSize = 8192;

/** @brief MQTT static capacities (queues, tables). */
namespace Capacity {
/** @brief FreeRTOS RX queue length for inbound envelopes in `MQTTModule`. */
constexpr uint8_t RxQueueLen = 4;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port` in `MQTTModule`. */
constexpr int32_t Port = 1883;
/** @brief Broker keepalive in seconds passed to `AsyncMqttClient::setKeepAlive`. */
constexpr uint16_t KeepAliveSec = 60;
/** @brief `AsyncMqttClient::publish` tries before a response is dropped. */
constexpr uint8_t PublishAttempts = 3;
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
/** @brief MQTT config buffer length for `MQTTConfig::host` in `MQTTModule`. */
constexpr size_t Host = 64;
/** @brief MQTT config buffer length for `MQTTConfig::user` in `MQTTModule`. */
constexpr size_t User = 32;
/** @brief MQTT config buffer length for `MQTTConfig::pass` in `MQTTModule`. */
constexpr size_t Pass = 64;
/** @brief MQTT config buffer length for `MQTTConfig::prefix` (fixed topic prefix). */
constexpr size_t Prefix = 48;
/** @brief MQTT client identifier buffer length (`MQTTConfig::clientId`, e.g. `WAKE-XXXXXX`). */
constexpr size_t ClientId = 32;
/** @brief MQTT topic buffer length used for rotated command and response topics. */
constexpr size_t Topic = 128;
/** @brief RX topic buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxTopic = 128;
/** @brief RX binary payload buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxPayload = Link::EnvelopeMax;
}  // namespace Buffers

/** @brief MQTT timing constants (runtime behavior). */
namespace Timing {
/** @brief Delay in ms while MQTT is disabled in `MQTTModule::loop`. */
constexpr uint32_t DisabledDelayMs = 2000;
/** @brief Network warmup delay in ms before first MQTT connect attempt in `MQTTModule::loop`. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief MQTT connection timeout in ms before forcing reconnect in `MQTTModule::loop`. */
constexpr uint32_t ConnectTimeoutMs = 10000;
/** @brief Main MQTT task loop delay in ms (`MQTTModule::loop`). */
constexpr uint32_t LoopDelayMs = 50;
/** @brief Pause in ms between two publish tries (lets AsyncTCP drain its send buffer). */
constexpr uint32_t PublishRetryMs = 20;
}  // namespace Timing

/** @brief MQTT reconnect backoff profile. */
namespace Backoff {
/** @brief Minimum MQTT reconnect backoff in ms (`MQTTModule` error-wait state). */
constexpr uint32_t MinMs = 2000;
/** @brief MQTT reconnect backoff step #1 threshold in ms. */
constexpr uint32_t Step1Ms = 5000;
/** @brief MQTT reconnect backoff step #2 threshold in ms. */
constexpr uint32_t Step2Ms = 10000;
/** @brief MQTT reconnect backoff step #3 threshold in ms. */
constexpr uint32_t Step3Ms = 30000;
/** @brief MQTT reconnect backoff step #4 threshold in ms. */
constexpr uint32_t Step4Ms = 60000;
/** @brief Maximum MQTT reconnect backoff in ms. */
constexpr uint32_t MaxMs = 300000;
/** @brief Random jitter percentage applied to MQTT reconnect backoff delay. */
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt

/** @brief Station connect timings (`WifiModule`). */
namespace Wifi {
/** @brief Association and DHCP must complete within this many ms. */
constexpr uint32_t ConnectTimeoutMs = 15000;
constexpr uint32_t DisabledPollMs = 2000;
constexpr uint32_t ConnectPollMs = 200;
constexpr uint32_t LinkPollMs = 1000;
/** @brief Minimum ms between two "SSID empty" warnings. */
constexpr uint32_t EmptySsidLogMs = 10000;
}  // namespace Wifi

/** @brief Time synchronization timings (`TimeModule`). */
namespace Time {
/** @brief Network warmup delay in ms before the first NTP attempt. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief Maximum wait in ms inside `getLocalTime` for one sync attempt. */
constexpr uint32_t SyncWaitMs = 4000;
/** @brief Periodic resync interval in ms once synced. */
constexpr uint32_t ResyncPeriodMs = 6UL * 3600UL * 1000UL;
/** @brief Time task loop delay in ms. */
constexpr uint32_t LoopDelayMs = 250;
/** @brief Epoch seconds below which the system clock is considered unset (2021-01-01). */
constexpr uint64_t MinValidEpoch = 1609459200ULL;
}  // namespace Time

/** @brief Wake-on-LAN collaborator limits (`WakeModule`). */
namespace Wake {
/** @brief Magic packet length (6 sync bytes + 16 MAC repetitions). */
constexpr size_t MagicPacketLen = 102;
/** @brief Number of auto-wake schedule slots. */
constexpr uint8_t MaxScheduleSlots = 8;
/** @brief Persisted schedule blob length (`wake.sched`). */
constexpr size_t ScheduleBlob = 160;
/** @brief ICMP reachability probe timeout in ms. */
constexpr uint32_t ProbeTimeoutMs = 2000;
/** @brief Auto-wake scheduler evaluation period in ms. */
constexpr uint32_t SchedulerCheckMs = 10000;
/** @brief Wake task loop delay in ms. */
constexpr uint32_t LoopDelayMs = 500;
/** @brief JSON capacity for schedule documents in `WakeSchedule::toJson` / `applyJson`. */
constexpr size_t JsonSchedArgsBuf = 1024;
}  // namespace Wake

/** @brief Status LED task limits (`IndicatorModule`). */
namespace Indicator {
/** @brief Indicator task stack size. */
constexpr uint16_t TaskStackSize = 2048;
/** @brief Indicator task tick in ms. */
constexpr uint32_t TickMs = 10;
}  // namespace Indicator

/** @brief System supervision timings (`SystemModule`). */
namespace System {
/** @brief Delay in ms left to the log dispatcher before `esp_restart()`. */
constexpr uint32_t RestartDrainMs = 200;
/** @brief Supervision loop delay in ms (also the serial console poll period). */
constexpr uint32_t LoopDelayMs = 100;
/** @brief Serial provisioning console line buffer (`cfg set {...}`). */
constexpr size_t ConsoleLine = 384;
/** @brief Buffer for one module's JSON in `cfg get <module>`. */
constexpr size_t ConsoleJsonOut = 512;
/** @brief System task stack size. */
constexpr uint16_t TaskStackSize = 4096;
}  // namespace System

}  // namespace Limits
