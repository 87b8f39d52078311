/**
 * @file MQTTModule.cpp
 * @brief Implementation file.
 */
#include "MQTTModule.h"
#include "Core/Backoff.h"
#include "Core/EventBus/EventPayloads.h"
#include <esp_system.h>
#include <initializer_list>
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static bool isAnyOf(const char* key, std::initializer_list<const char*> keys)
{
    if (!key || key[0] == '\0') return false;
    for (const char* candidate : keys) {
        if (candidate && strcmp(key, candidate) == 0) return true;
    }
    return false;
}

static bool isLinkConnKey(const char* key)
{
    return isAnyOf(key, {
        NvsKeys::Device::Serial,
        NvsKeys::Device::Secret,
        NvsKeys::Mqtt::Host,
        NvsKeys::Mqtt::Port,
        NvsKeys::Mqtt::User,
        NvsKeys::Mqtt::Pass,
        NvsKeys::Mqtt::ClientId,
        NvsKeys::Mqtt::Prefix,
        NvsKeys::Mqtt::Enabled
    });
}

static void makeDeviceId(char* out, size_t len) {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "WAKE-%02X%02X%02X", mac[3], mac[4], mac[5]);
}

bool MQTTModule::svcIsConnected(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->isConnected() : false;
}

bool MQTTModule::svcCurrentTopic(void* ctx, char* out, size_t outLen)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    if (!self || !out || outLen == 0) return false;

    portENTER_CRITICAL(&self->topicMux_);
    const bool has = self->topicSnapshot_[0] != '\0';
    strncpy(out, self->topicSnapshot_, outLen - 1);
    out[outLen - 1] = '\0';
    portEXIT_CRITICAL(&self->topicMux_);
    return has;
}

void MQTTModule::svcStats(void* ctx, MqttLinkStats* out)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    if (!self || !out) return;
    portENTER_CRITICAL(&self->topicMux_);
    *out = self->stats_;
    portEXIT_CRITICAL(&self->topicMux_);
}

void MQTTModule::bumpStat_(uint32_t& counter)
{
    // Also called from the AsyncTCP task (onMessage).
    portENTER_CRITICAL(&topicMux_);
    ++counter;
    portEXIT_CRITICAL(&topicMux_);
}

void MQTTModule::setState(MQTTState s) {
    state = s;
    stateTs = millis();
}

uint32_t MQTTModule::rotationSec_() const
{
    return (linkCfg.rotationSec > 0) ? (uint32_t)linkCfg.rotationSec : WakeDefaults::RotationIntervalSec;
}

bool MQTTModule::buildIdentity_()
{
    identity_.wipe();
    if (devCfg.serial[0] == '\0') {
        makeDeviceId(devCfg.serial, sizeof(devCfg.serial));
        LOGI("device.serial not set, using %s", devCfg.serial);
    }
    identity_.setSerial(devCfg.serial);

    if (devCfg.secret[0] == '\0') {
        LOGE("device.secret not set, secure link disabled");
        return false;
    }
    if (!CryptoManager::deriveKey(devCfg.secret, identity_.key)) {
        LOGE("Key derivation failed");
        identity_.wipe();
        return false;
    }
    return true;
}

void MQTTModule::connectMqtt() {
    const char* cid = (cfgData.clientId[0] != '\0') ? cfgData.clientId : identity_.serial;
    sessionUp_ = false;
    sessionDown_ = false;

    client.setServer(cfgData.host, (uint16_t)cfgData.port);
    client.setClientId(cid);
    client.setKeepAlive(Limits::Mqtt::Defaults::KeepAliveSec);
    client.setCleanSession(true);
    if (cfgData.user[0] != '\0') client.setCredentials(cfgData.user, cfgData.pass);
    client.connect();
    setState(MQTTState::Connecting);
    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);
}

void MQTTModule::onConnectAttemptFailed_(const char* why)
{
    LOGW("Connect attempt failed (%s)", why);
    stateMachine_.onConnectAttemptFailed(millis());
    setState(MQTTState::ErrorWait);
}

void MQTTModule::enterConnected_()
{
    sessionUp_ = false;
    retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;
    rotator_.reset();
    setState(MQTTState::Connected);
    stateMachine_.onBrokerConnected(millis());

    if (timeSvc && timeSvc->epoch) {
        rotateTopics_(timeSvc->epoch(timeSvc->ctx));
    }
    LOGI("Connected, link state %s", deviceStateStr(stateMachine_.state()));
}

void MQTTModule::onConnect(bool) {
    sessionUp_ = true;
}

void MQTTModule::onDisconnect(AsyncMqttClientDisconnectReason reason) {
    LOGW("Disconnected (reason=%u)", (unsigned)reason);
    sessionDown_ = true;
}

void MQTTModule::onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties,
                           size_t len, size_t index, size_t total) {
    if (!rxQ) return;
    if (!topic || !payload || index != 0 || len != total) {
        bumpStat_(stats_.rxDropped);
        return;
    }

    const size_t topicLen = strlen(topic);
    if (topicLen >= sizeof(RxMsg{}.topic) || len > sizeof(RxMsg{}.payload)) {
        bumpStat_(stats_.rxDropped);
        return;
    }

    RxMsg m;
    memcpy(m.topic, topic, topicLen);
    m.topic[topicLen] = '\0';
    memcpy(m.payload, payload, len);
    m.len = (uint16_t)len;

    if (xQueueSend(rxQ, &m, 0) != pdTRUE) {
        bumpStat_(stats_.rxDropped);
    }
}

void MQTTModule::rotateTopics_(uint64_t nowSec)
{
    if (nowSec == 0) return;

    const bool first = !rotator_.hasCurrent();
    TopicRotation rot;
    if (!rotator_.advance(nowSec, rotationSec_(), rot)) {
        LOGW("Topic derivation failed");
        return;
    }
    if (!rot.rotated) return;

    if (rot.subscribe && client.subscribe(rot.subscribeTopic, 1) == 0) {
        LOGW("Subscribe refused");
    }
    for (uint8_t i = 0; i < rot.unsubscribeCount; ++i) {
        if (client.unsubscribe(rot.unsubscribeTopics[i]) == 0) {
            LOGW("Unsubscribe refused");
        }
    }

    portENTER_CRITICAL(&topicMux_);
    strncpy(topicSnapshot_, rotator_.currentTopic(), sizeof(topicSnapshot_) - 1);
    topicSnapshot_[sizeof(topicSnapshot_) - 1] = '\0';
    portEXIT_CRITICAL(&topicMux_);

    LOGI("Listening on window %llu", (unsigned long long)rotator_.currentWindow());
    if (first) return;

    TopicRotatedPayload p{rotator_.currentWindow()};
    if (eventBus) eventBus->post(EventId::TopicRotated, &p, sizeof(p));
    if (timeSvc && timeSvc->requestResync) timeSvc->requestResync(timeSvc->ctx);
}

bool MQTTModule::publish(const char* topic, const uint8_t* payload, size_t len)
{
    if (!topic || !payload || len == 0) return false;

    for (uint8_t attempt = 1; attempt <= Limits::Mqtt::Defaults::PublishAttempts; ++attempt) {
        if (state != MQTTState::Connected || !client.connected()) {
            bumpStat_(stats_.publishRefused);
            LOGW("Publish dropped: not connected");
            return false;
        }
        if (client.publish(topic, 0, false, (const char*)payload, len) != 0U) {
            bumpStat_(stats_.published);
            return true;
        }
        if (attempt < Limits::Mqtt::Defaults::PublishAttempts) {
            vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::PublishRetryMs));
        }
    }

    bumpStat_(stats_.publishRefused);
    LOGW("Publish dropped after %u tries (len=%u)",
         (unsigned)Limits::Mqtt::Defaults::PublishAttempts, (unsigned)len);
    return false;
}

void MQTTModule::publishResponse_(const Command& response)
{
    char topic[Limits::Mqtt::Buffers::Topic];
    if (!rotator_.responseTopic(topic, sizeof(topic))) {
        LOGW("%s response dropped: no active topic", commandKindStr(response.kind));
        return;
    }

    size_t len = 0;
    if (!protocol_.encode(response, identity_, rotator_.currentWindow(), txBuf_, sizeof(txBuf_), len)) {
        LOGW("%s response encode failed", commandKindStr(response.kind));
        return;
    }
    if (publish(topic, txBuf_, len)) {
        LOGD("%s response sent (%u bytes)", commandKindStr(response.kind), (unsigned)len);
    }
}

void MQTTModule::processRx_(const RxMsg& msg)
{
    if (!stateMachine_.acceptsCommands()) {
        bumpStat_(stats_.rxDropped);
        LOGW("Message dropped in state %s", deviceStateStr(stateMachine_.state()));
        return;
    }

    uint64_t window = 0;
    if (!rotator_.windowForTopic(msg.topic, window)) {
        bumpStat_(stats_.rxDropped);
        LOGW("Message on untracked topic dropped");
        return;
    }

    const uint64_t nowSec = (timeSvc && timeSvc->epoch) ? timeSvc->epoch(timeSvc->ctx) : 0;
    const uint32_t skew = (linkCfg.skewSec > 0) ? (uint32_t)linkCfg.skewSec : 0U;
    const DecodeStatus st = CommandProtocol::decode(msg.payload, msg.len, identity_, window,
                                                    nowSec, skew, request_);
    if (st != DecodeStatus::Ok) {
        bumpStat_(stats_.rejected);
        LOGW("Command rejected: %s", decodeStatusStr(st));
        stateMachine_.onCommandRejected(millis());
        return;
    }

    bumpStat_(stats_.accepted);
    LOGI("Command %s accepted", commandKindStr(request_.kind));
    stateMachine_.onCommandAccepted(request_.kind, millis());

    const DispatchResult r = dispatcher_.handle(request_, nowSec, response_);
    if (!r.actionOk) {
        LOGW("Command %s action failed", commandKindStr(request_.kind));
    }
    if (r.hasResponse) publishResponse_(response_);
}

void MQTTModule::drainRx_()
{
    while (xQueueReceive(rxQ, &rxMsg_, 0) == pdTRUE) {
        processRx_(rxMsg_);
    }
}

void MQTTModule::pumpStateMachine_(uint32_t nowMs)
{
    const bool net = netReady_;
    if (net != netReported_) {
        netReported_ = net;
        if (net) {
            stateMachine_.onNetworkReady();
        } else {
            stateMachine_.onNetworkLost(nowMs);
        }
    }
    if (timeSynced_) {
        timeSynced_ = false;
        timeSyncSeen_ = true;
        stateMachine_.onTimeSynced(nowMs);
    }
    if (timeSyncFailed_) {
        timeSyncFailed_ = false;
        stateMachine_.onTimeSyncFailed(nowMs);
    }

    if (stateMachine_.tick(nowMs) == DeviceAction::Restart) {
        client.disconnect(true);
        if (sysSvc && sysSvc->restart) {
            sysSvc->restart(sysSvc->ctx, "link error dwell elapsed");
        } else {
            LOGE("Restart requested but system service missing");
            esp_restart();
        }
    }
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(serialVar);
    cfg.registerVar(secretVar);
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(clientIdVar);
    cfg.registerVar(prefixVar);
    cfg.registerVar(enabledVar);
    cfg.registerVar(rotationVar);
    cfg.registerVar(skewVar);
    cfg.registerVar(maxConnVar);

    wifiSvc = services.get<WifiService>("wifi");
    timeSvc = services.get<TimeService>("time");
    sysSvc = services.get<SystemService>("system");

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::NetworkReady, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::NetworkLost, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::TimeSynced, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::TimeSyncFailed, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, &MQTTModule::onEventStatic, this);
    }

    mqttSvc.isConnected = MQTTModule::svcIsConnected;
    mqttSvc.currentTopic = MQTTModule::svcCurrentTopic;
    mqttSvc.stats = MQTTModule::svcStats;
    mqttSvc.ctx = this;
    services.add("mqtt", &mqttSvc);

    devStateSvc.slot = &slot_;
    services.add("devstate", &devStateSvc);

    rxQ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(RxMsg));
    if (!rxQ) {
        LOGE("RX queue allocation failed");
    }

    client.onConnect([this](bool sp){ this->onConnect(sp); });
    client.onDisconnect([this](AsyncMqttClientDisconnectReason r){ this->onDisconnect(r); });
    client.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties pr, size_t l, size_t i, size_t tot){
        this->onMessage(t, p, pr, l, i, tot);
    });
}

void MQTTModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services) {
    wakeSvc = services.get<WakeService>("wake");
    if (!wakeSvc) {
        LOGW("WakeService missing, commands will report NotReady");
    }

    identityOk_ = buildIdentity_();
    if (!crypto_.begin()) {
        LOGE("DRBG seeding failed");
        identityOk_ = false;
        stateMachine_.onFault(millis());
    }

    const uint32_t dwell = (sysSvc && sysSvc->errorDwellMs) ? sysSvc->errorDwellMs(sysSvc->ctx)
                                                             : WakeDefaults::ErrorDwellMs;
    stateMachine_.configure(linkCfg.maxConnAttempts, dwell, WakeDefaults::NetworkAttemptMs);
    rotator_.configure(&identity_, cfgData.prefix);
    dispatcher_.bind(wakeSvc, identity_.serial);

    netReady_ = wifiSvc && wifiSvc->isConnected && wifiSvc->isConnected(wifiSvc->ctx);
    netReadyTs_ = millis();
    retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;

    LOGI("Link serial=%s prefix=%s rotation=%lus skew=%lds",
         identity_.serial, cfgData.prefix, (unsigned long)rotationSec_(), (long)linkCfg.skewSec);
    setState(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
}

void MQTTModule::loop() {
    const uint32_t nowMs = millis();
    if (sysSvc && sysSvc->heartbeat) sysSvc->heartbeat(sysSvc->ctx);

    if (!timeSyncSeen_ && timeSvc && timeSvc->isSynced && timeSvc->isSynced(timeSvc->ctx)) {
        timeSynced_ = true;
    }
    pumpStateMachine_(nowMs);

    if (reconnectRequested_) {
        reconnectRequested_ = false;
        LOGI("Link config changed -> reconnect");
        if (state == MQTTState::Connected) {
            stateMachine_.onConnectionLost(nowMs);
            bumpStat_(stats_.reconnects);
        }
        client.disconnect();
        rotator_.reset();
        identityOk_ = buildIdentity_() && crypto_.isSeeded();
        netReadyTs_ = nowMs;
        setState(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
    }

    if (!cfgData.enabled || !identityOk_) {
        if (state != MQTTState::Disabled) {
            client.disconnect();
            rotator_.reset();
            setState(MQTTState::Disabled);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::DisabledDelayMs));
        return;
    }

    switch (state) {
    case MQTTState::Disabled:
        setState(MQTTState::WaitingNetwork);
        break;

    case MQTTState::WaitingNetwork:
        if (!netReady_ || !timeSyncSeen_) break;
        if (nowMs - netReadyTs_ >= Limits::Mqtt::Timing::NetWarmupMs) connectMqtt();
        break;

    case MQTTState::Connecting:
        if (sessionUp_) {
            enterConnected_();
        } else if (sessionDown_) {
            onConnectAttemptFailed_("refused");
        } else if (nowMs - stateTs > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            client.disconnect(true);
            onConnectAttemptFailed_("timeout");
        }
        break;

    case MQTTState::Connected:
        if (sessionDown_) {
            sessionDown_ = false;
            bumpStat_(stats_.reconnects);
            rotator_.reset();
            stateMachine_.onConnectionLost(nowMs);
            setState(MQTTState::ErrorWait);
            break;
        }
        if (timeSvc && timeSvc->epoch) rotateTopics_(timeSvc->epoch(timeSvc->ctx));
        drainRx_();
        break;

    case MQTTState::ErrorWait:
        if (!netReady_) {
            setState(MQTTState::WaitingNetwork);
            break;
        }
        if (nowMs - stateTs >= retryDelayMs_) {
            retryDelayMs_ = Backoff::jitterMs(Backoff::nextDelayMs(retryDelayMs_),
                                              Limits::Mqtt::Backoff::JitterPct, esp_random());
            setState(MQTTState::WaitingNetwork);
        }
        break;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::LoopDelayMs));
}

void MQTTModule::onEventStatic(const Event& e, void* user)
{
    static_cast<MQTTModule*>(user)->onEvent(e);
}

void MQTTModule::onEvent(const Event& e)
{
    switch (e.id) {
    case EventId::NetworkReady:
        netReady_ = true;
        netReadyTs_ = millis();
        LOGD("Network ready -> warmup");
        return;

    case EventId::NetworkLost:
        netReady_ = false;
        LOGD("Network lost -> disconnect");
        client.disconnect(true);
        return;

    case EventId::TimeSynced:
        timeSynced_ = true;
        return;

    case EventId::TimeSyncFailed:
        timeSyncFailed_ = true;
        return;

    case EventId::ConfigChanged: {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (isLinkConnKey(p->nvsKey)) reconnectRequested_ = true;
        return;
    }

    default:
        return;
    }
}
