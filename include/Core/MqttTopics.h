#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic suffixes shared across modules.
 */

namespace MqttTopics {

/** @brief Response suffix appended to the active rotated topic (`<prefix>/<token>/response`). */
constexpr char SuffixResponse[] = "response";

}  // namespace MqttTopics
