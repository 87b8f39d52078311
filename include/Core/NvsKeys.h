#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "wakerelay"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Device {
constexpr char Serial[] = "dev_serial"; // Device identity persisted key for field `dev_serial`.
constexpr char Secret[] = "dev_secret"; // Device identity persisted key for field `dev_secret`.
}  // namespace Device

namespace Wifi {
constexpr char Enabled[] = "wifi_en"; // WiFi module persisted key for field `wifi_en`.
constexpr char Ssid[] = "wifi_ssid"; // WiFi module persisted key for field `wifi_ssid`.
constexpr char Pass[] = "wifi_pass"; // WiFi module persisted key for field `wifi_pass`.
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host"; // MQTT module persisted key for field `mq_host`.
constexpr char Port[] = "mq_port"; // MQTT module persisted key for field `mq_port`.
constexpr char User[] = "mq_user"; // MQTT module persisted key for field `mq_user`.
constexpr char Pass[] = "mq_pass"; // MQTT module persisted key for field `mq_pass`.
constexpr char ClientId[] = "mq_cid"; // MQTT module persisted key for field `mq_cid`.
constexpr char Prefix[] = "mq_prefix"; // MQTT module persisted key for field `mq_prefix`.
constexpr char Enabled[] = "mq_en"; // MQTT module persisted key for field `mq_en`.
}  // namespace Mqtt

namespace Link {
constexpr char RotationSec[] = "lk_rot_s"; // Secure link persisted key for field `lk_rot_s`.
constexpr char SkewSec[] = "lk_skew_s"; // Secure link persisted key for field `lk_skew_s`.
constexpr char MaxConnAttempts[] = "lk_max_conn"; // Secure link persisted key for field `lk_max_conn`.
}  // namespace Link

namespace Time {
constexpr char Server1[] = "ntp_s1"; // Time module persisted key for field `ntp_s1`.
constexpr char Server2[] = "ntp_s2"; // Time module persisted key for field `ntp_s2`.
constexpr char Enabled[] = "ntp_en"; // Time module persisted key for field `ntp_en`.
constexpr char MaxAttempts[] = "ntp_max_try"; // Time module persisted key for field `ntp_max_try`.
}  // namespace Time

namespace Wake {
constexpr char Mac[] = "wk_mac"; // Wake module persisted key for field `wk_mac`.
constexpr char BroadcastIp[] = "wk_bcast"; // Wake module persisted key for field `wk_bcast`.
constexpr char Port[] = "wk_port"; // Wake module persisted key for field `wk_port`.
constexpr char HostIp[] = "wk_host"; // Wake module persisted key for field `wk_host`.
constexpr char ScheduleBlob[] = "wk_sched"; // Wake module persisted key for field `wk_sched`.
}  // namespace Wake

namespace Indicator {
constexpr char Enabled[] = "led_en"; // Indicator module persisted key for field `led_en`.
constexpr char Pin[] = "led_pin"; // Indicator module persisted key for field `led_pin`.
constexpr char ActiveHigh[] = "led_act_hi"; // Indicator module persisted key for field `led_act_hi`.
}  // namespace Indicator

namespace System {
constexpr char MaintenanceSec[] = "sys_maint_s"; // System module persisted key for field `sys_maint_s`.
constexpr char ErrorDwellMs[] = "sys_err_ms"; // System module persisted key for field `sys_err_ms`.
}  // namespace System

}  // namespace NvsKeys
