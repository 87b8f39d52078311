#pragma once
/**
 * @file MQTTModule.h
 * @brief Secure command link over MQTT.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Core/CryptoManager.h"
#include "Core/DeviceIdentity.h"
#include "Core/DeviceStateMachine.h"
#include "Core/SystemLimits.h"
#include "Domain/WakeDefaults.h"
#include "CommandDispatcher.h"
#include "CommandProtocol.h"
#include "TopicRotator.h"
#include <AsyncMqttClient.h>
#include <freertos/queue.h>

/** @brief Device identity values. */
struct DeviceConfig {
    char serial[Limits::Link::Serial] = "";
    char secret[Limits::Link::Secret] = "";
};

/** @brief Broker connection values. */
struct MQTTConfig {
    bool enabled = true;
    char host[Limits::Mqtt::Buffers::Host] = "broker.hivemq.com";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
    char clientId[Limits::Mqtt::Buffers::ClientId] = "";
    char prefix[Limits::Mqtt::Buffers::Prefix] = "wakerelay";
};

/** @brief Topic rotation and acceptance window values. */
struct LinkConfig {
    int32_t rotationSec = (int32_t)WakeDefaults::RotationIntervalSec;
    int32_t skewSec = (int32_t)WakeDefaults::SkewToleranceSec;
    uint8_t maxConnAttempts = WakeDefaults::MaxConnectAttempts;
};

/** @brief MQTT connection state. */
enum class MQTTState : uint8_t { Disabled, WaitingNetwork, Connecting, Connected, ErrorWait };

/**
 * @brief Protocol context: owns the identity, the envelope codec, the topic
 * rotator, the device state machine and the broker client.
 *
 * Broker and event callbacks only set flags or enqueue; every protocol
 * component is touched from this module's task alone.
 */
class MQTTModule : public Module {
public:
    MQTTModule() : protocol_(crypto_), stateMachine_(slot_) {}

    const char* moduleId() const override { return "mqtt"; }
    const char* taskName() const override { return "mqtt"; }
    BaseType_t taskCore() const override { return 1; }
    uint16_t taskStackSize() const override { return Limits::Mqtt::TaskStackSize; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "time";
        if (i == 3) return "wifi";
        if (i == 4) return "system";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    bool publish(const char* topic, const uint8_t* payload, size_t len);
    bool isConnected() const { return state == MQTTState::Connected; }

private:
    DeviceConfig devCfg{};
    MQTTConfig cfgData{};
    LinkConfig linkCfg{};
    MQTTState state = MQTTState::WaitingNetwork;
    uint32_t stateTs = 0;

    AsyncMqttClient client;

    const WifiService* wifiSvc = nullptr;
    const TimeService* timeSvc = nullptr;
    const SystemService* sysSvc = nullptr;
    const WakeService* wakeSvc = nullptr;
    EventBus* eventBus = nullptr;

    DeviceIdentity identity_{};
    bool identityOk_ = false;
    CryptoManager crypto_;
    CommandProtocol protocol_;
    TopicRotator rotator_;
    DeviceStateSlot slot_;
    DeviceStateMachine stateMachine_;
    CommandDispatcher dispatcher_;

    struct RxMsg {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        uint16_t len;
        uint8_t payload[Limits::Mqtt::Buffers::RxPayload];
    };
    QueueHandle_t rxQ = nullptr;
    RxMsg rxMsg_{};
    Command request_{};
    Command response_{};
    uint8_t txBuf_[Limits::Link::EnvelopeMax] = {0};

    MqttLinkStats stats_{};
    // Snapshot of the active topic for readers outside the task.
    portMUX_TYPE topicMux_ = portMUX_INITIALIZER_UNLOCKED;
    char topicSnapshot_[Limits::Mqtt::Buffers::Topic] = {0};
    MqttService mqttSvc{};
    DeviceStateService devStateSvc{};

    // Set from broker and event callbacks, consumed by loop().
    volatile bool sessionUp_ = false;
    volatile bool sessionDown_ = false;
    volatile bool netReady_ = false;
    volatile bool timeSynced_ = false;
    volatile bool timeSyncFailed_ = false;
    volatile bool reconnectRequested_ = false;
    uint32_t netReadyTs_ = 0;
    bool timeSyncSeen_ = false;
    bool netReported_ = true;   ///< last station state fed to the state machine
    uint32_t retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;

    ConfigVariable<char> serialVar {
        NVS_KEY(NvsKeys::Device::Serial),"serial","device",ConfigType::CharArray,
        devCfg.serial,ConfigPersistence::Persistent,sizeof(devCfg.serial)
    };
    ConfigVariable<char> secretVar {
        NVS_KEY(NvsKeys::Device::Secret),"secret","device",ConfigType::CharArray,
        devCfg.secret,ConfigPersistence::Persistent,sizeof(devCfg.secret)
    };
    ConfigVariable<char> hostVar {
        NVS_KEY(NvsKeys::Mqtt::Host),"host","mqtt",ConfigType::CharArray,
        cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t> portVar {
        NVS_KEY(NvsKeys::Mqtt::Port),"port","mqtt",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0,1,65535
    };
    ConfigVariable<char> userVar {
        NVS_KEY(NvsKeys::Mqtt::User),"user","mqtt",ConfigType::CharArray,
        cfgData.user,ConfigPersistence::Persistent,sizeof(cfgData.user)
    };
    ConfigVariable<char> passVar {
        NVS_KEY(NvsKeys::Mqtt::Pass),"pass","mqtt",ConfigType::CharArray,
        cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };
    ConfigVariable<char> clientIdVar {
        NVS_KEY(NvsKeys::Mqtt::ClientId),"client_id","mqtt",ConfigType::CharArray,
        cfgData.clientId,ConfigPersistence::Persistent,sizeof(cfgData.clientId)
    };
    ConfigVariable<char> prefixVar {
        NVS_KEY(NvsKeys::Mqtt::Prefix),"prefix","mqtt",ConfigType::CharArray,
        cfgData.prefix,ConfigPersistence::Persistent,sizeof(cfgData.prefix)
    };
    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Mqtt::Enabled),"enabled","mqtt",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> rotationVar {
        NVS_KEY(NvsKeys::Link::RotationSec),"rotation_s","link",ConfigType::Int32,
        &linkCfg.rotationSec,ConfigPersistence::Persistent,0,1,7 * 86400
    };
    ConfigVariable<int32_t> skewVar {
        NVS_KEY(NvsKeys::Link::SkewSec),"skew_s","link",ConfigType::Int32,
        &linkCfg.skewSec,ConfigPersistence::Persistent,0,0,3600
    };
    ConfigVariable<uint8_t> maxConnVar {
        NVS_KEY(NvsKeys::Link::MaxConnAttempts),"max_conn","link",ConfigType::UInt8,
        &linkCfg.maxConnAttempts,ConfigPersistence::Persistent,0
    };

    void setState(MQTTState s);
    bool buildIdentity_();
    uint32_t rotationSec_() const;
    void connectMqtt();
    void onConnectAttemptFailed_(const char* why);
    void enterConnected_();
    void rotateTopics_(uint64_t nowSec);
    void drainRx_();
    void processRx_(const RxMsg& msg);
    void publishResponse_(const Command& response);
    void bumpStat_(uint32_t& counter);
    void pumpStateMachine_(uint32_t nowMs);

    void onConnect(bool sessionPresent);
    void onDisconnect(AsyncMqttClientDisconnectReason reason);
    void onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties properties,
                   size_t len, size_t index, size_t total);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool svcIsConnected(void* ctx);
    static bool svcCurrentTopic(void* ctx, char* out, size_t outLen);
    static void svcStats(void* ctx, MqttLinkStats* out);
};
