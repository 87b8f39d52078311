/**
 * @file CommandProtocol.cpp
 * @brief Implementation file.
 */
#include "Modules/Network/MQTTModule/CommandProtocol.h"

#include <string.h>

#include <ArduinoJson.h>

static constexpr uint8_t kTagDomain[4] = {'W', 'R', 'L', '1'};

void Command::setTarget(const char* serial)
{
    if (!serial) serial = "";
    strncpy(target, serial, sizeof(target) - 1);
    target[sizeof(target) - 1] = '\0';
}

bool Command::setArgs(const char* json)
{
    if (!json) {
        args[0] = '\0';
        return true;
    }
    const size_t n = strlen(json);
    if (n >= sizeof(args)) return false;
    memcpy(args, json, n + 1U);
    return true;
}

const char* decodeStatusStr(DecodeStatus st)
{
    switch (st) {
    case DecodeStatus::Ok: return "Ok";
    case DecodeStatus::AuthFailure: return "AuthFailure";
    case DecodeStatus::MalformedEnvelope: return "MalformedEnvelope";
    case DecodeStatus::WrongTarget: return "WrongTarget";
    case DecodeStatus::ExpiredTimestamp: return "ExpiredTimestamp";
    }
    return "Unknown";
}

ErrorCode decodeStatusToErrorCode(DecodeStatus st)
{
    switch (st) {
    case DecodeStatus::AuthFailure: return ErrorCode::AuthFailure;
    case DecodeStatus::MalformedEnvelope: return ErrorCode::MalformedEnvelope;
    case DecodeStatus::WrongTarget: return ErrorCode::WrongTarget;
    case DecodeStatus::ExpiredTimestamp: return ErrorCode::ExpiredTimestamp;
    case DecodeStatus::Ok: break;
    }
    return ErrorCode::Failed;
}

bool CommandProtocol::toJson(const Command& cmd, char* out, size_t outCap, size_t& outLen)
{
    outLen = 0;
    if (!out || outCap == 0) return false;

    StaticJsonDocument<Limits::Link::JsonCommandDoc> doc;
    doc["kind"] = commandKindStr(cmd.kind);
    doc["target"] = (const char*)cmd.target;
    doc["issued_at"] = cmd.issuedAt;
    if (cmd.args[0] != '\0') {
        doc["args"] = serialized((const char*)cmd.args);
    }
    if (doc.overflowed()) return false;

    const size_t need = measureJson(doc);
    if (need >= outCap) return false;
    outLen = serializeJson(doc, out, outCap);
    return outLen == need;
}

bool CommandProtocol::fromJson(const char* json, size_t len, Command& out)
{
    if (!json || len == 0) return false;

    StaticJsonDocument<Limits::Link::JsonCommandDoc> doc;
    const DeserializationError err = deserializeJson(doc, json, len);
    if (err) return false;

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) return false;

    Command cmd;
    if (!parseCommandKind(root["kind"].as<const char*>(), cmd.kind)) return false;

    const char* target = root["target"].as<const char*>();
    if (!target || target[0] == '\0' || strlen(target) >= sizeof(cmd.target)) return false;
    cmd.setTarget(target);

    JsonVariantConst issued = root["issued_at"];
    if (!issued.is<uint64_t>()) return false;
    cmd.issuedAt = issued.as<uint64_t>();

    JsonVariantConst args = root["args"];
    if (!args.isNull()) {
        if (!args.is<JsonObjectConst>()) return false;
        if (measureJson(args) >= sizeof(cmd.args)) return false;
        serializeJson(args, cmd.args, sizeof(cmd.args));
    }

    out = cmd;
    return true;
}

bool CommandProtocol::computeTag_(const CryptoKey& key, uint64_t window,
                                  const uint8_t* iv, const uint8_t* ct, size_t ctLen,
                                  uint8_t tagOut[Limits::Link::TagLen])
{
    uint8_t windowBe[8];
    for (int i = 7; i >= 0; --i) {
        windowBe[i] = (uint8_t)(window & 0xFFU);
        window >>= 8;
    }
    const ByteSpan parts[] = {
        {kTagDomain, sizeof(kTagDomain)},
        {windowBe, sizeof(windowBe)},
        {iv, Limits::Link::IvLen},
        {ct, ctLen},
    };
    return CryptoManager::sign(key, parts, sizeof(parts) / sizeof(parts[0]), tagOut);
}

bool CommandProtocol::encode(const Command& cmd, const DeviceIdentity& identity, uint64_t window,
                             uint8_t* out, size_t outCap, size_t& outLen)
{
    outLen = 0;
    if (!out) return false;

    char plain[Limits::Link::PlainMax];
    size_t plainLen = 0;
    if (!toJson(cmd, plain, sizeof(plain), plainLen)) return false;

    const size_t ctLen = CryptoManager::paddedLength(plainLen);
    if (outCap < Limits::Link::IvLen + ctLen + Limits::Link::TagLen) {
        memset(plain, 0, sizeof(plain));
        return false;
    }

    uint8_t* iv = out;
    uint8_t* ct = out + Limits::Link::IvLen;
    size_t written = 0;
    const CryptoStatus st = crypto_.encrypt(identity.key,
                                            reinterpret_cast<const uint8_t*>(plain), plainLen,
                                            iv, ct, ctLen, written);
    memset(plain, 0, sizeof(plain));
    if (st != CryptoStatus::Ok || written != ctLen) return false;

    if (!computeTag_(identity.key, window, iv, ct, ctLen, ct + ctLen)) return false;

    outLen = Limits::Link::IvLen + ctLen + Limits::Link::TagLen;
    return true;
}

DecodeStatus CommandProtocol::decode(const uint8_t* env, size_t envLen,
                                     const DeviceIdentity& identity, uint64_t window,
                                     uint64_t nowSec, uint32_t skewToleranceSec,
                                     Command& out)
{
    if (!env || envLen < Limits::Link::EnvelopeMin || envLen > Limits::Link::EnvelopeMax) {
        return DecodeStatus::MalformedEnvelope;
    }

    const uint8_t* iv = env;
    const uint8_t* ct = env + Limits::Link::IvLen;
    const size_t ctLen = envLen - Limits::Link::IvLen - Limits::Link::TagLen;
    const uint8_t* tag = env + envLen - Limits::Link::TagLen;

    uint8_t expected[Limits::Link::TagLen];
    if (!computeTag_(identity.key, window, iv, ct, ctLen, expected)) {
        return DecodeStatus::AuthFailure;
    }
    const bool authentic = CryptoManager::constantTimeEqual(expected, tag, sizeof(expected));
    memset(expected, 0, sizeof(expected));
    if (!authentic) return DecodeStatus::AuthFailure;

    // +1 keeps room for the terminator handed to the JSON parser.
    uint8_t plain[Limits::Link::CipherMax + 1U];
    size_t plainLen = 0;
    const CryptoStatus st = CryptoManager::decrypt(identity.key, iv, ct, ctLen,
                                                   plain, sizeof(plain) - 1U, plainLen);
    if (st != CryptoStatus::Ok) {
        memset(plain, 0, sizeof(plain));
        return DecodeStatus::MalformedEnvelope;
    }
    plain[plainLen] = '\0';

    Command cmd;
    const bool parsed = fromJson(reinterpret_cast<const char*>(plain), plainLen, cmd);
    memset(plain, 0, sizeof(plain));
    if (!parsed) return DecodeStatus::MalformedEnvelope;

    if (strcmp(cmd.target, identity.serial) != 0) return DecodeStatus::WrongTarget;

    const uint64_t skew = (nowSec >= cmd.issuedAt) ? (nowSec - cmd.issuedAt)
                                                   : (cmd.issuedAt - nowSec);
    if (skew > skewToleranceSec) return DecodeStatus::ExpiredTimestamp;

    out = cmd;
    return DecodeStatus::Ok;
}
