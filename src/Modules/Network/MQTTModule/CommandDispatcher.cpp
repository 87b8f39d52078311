/**
 * @file CommandDispatcher.cpp
 * @brief Implementation file.
 */
#include "Modules/Network/MQTTModule/CommandDispatcher.h"

#include <stdio.h>

void CommandDispatcher::bind(const WakeService* wake, const char* serial)
{
    wake_ = wake;
    serial_ = serial ? serial : "";
}

DispatchResult CommandDispatcher::handle(const Command& cmd, uint64_t nowSec, Command& response) const
{
    response = Command{};
    response.kind = cmd.kind;
    response.setTarget(serial_);
    response.issuedAt = nowSec;

    switch (cmd.kind) {
    case CommandKind::Wake: return handleWake_();
    case CommandKind::Status: return handleStatus_(response);
    case CommandKind::Usage: return handleUsage_(response);
    case CommandKind::Ping: return handlePing_(response);
    case CommandKind::GetSchedule: return handleGetSchedule_(response);
    case CommandKind::SetSchedule: return handleSetSchedule_(cmd, response);
    }
    DispatchResult r;
    r.actionOk = false;
    return r;
}

DispatchResult CommandDispatcher::respondError_(Command& response, ErrorCode code, const char* where)
{
    DispatchResult r;
    r.actionOk = false;
    r.hasResponse = writeErrorJson(response.args, sizeof(response.args), code, where);
    return r;
}

DispatchResult CommandDispatcher::handleWake_() const
{
    DispatchResult r;
    r.actionOk = (wake_ && wake_->sendMagicPacket) ? wake_->sendMagicPacket(wake_->ctx) : false;
    return r;
}

DispatchResult CommandDispatcher::handleStatus_(Command& response) const
{
    bool online = false;
    if (!wake_ || !wake_->probeTarget || !wake_->probeTarget(wake_->ctx, &online)) {
        return respondError_(response, ErrorCode::IoError, "status");
    }

    DispatchResult r;
    const int n = snprintf(response.args, sizeof(response.args),
                           "{\"online\":%s,\"status\":\"%s\"}",
                           online ? "true" : "false",
                           online ? "ONLINE" : "OFFLINE");
    r.hasResponse = (n > 0) && ((size_t)n < sizeof(response.args));
    return r;
}

DispatchResult CommandDispatcher::handleUsage_(Command& response) const
{
    WakeUsage u;
    if (!wake_ || !wake_->collectUsage || !wake_->collectUsage(wake_->ctx, &u)) {
        return respondError_(response, ErrorCode::NotReady, "usage");
    }

    DispatchResult r;
    const int n = snprintf(response.args, sizeof(response.args),
                           "{\"uptime_s\":%lu,\"heap_free\":%lu,\"heap_total\":%lu,"
                           "\"flash_used\":%lu,\"flash_total\":%lu,"
                           "\"cpu_mhz\":%u,\"cores\":%u,\"rssi\":%d}",
                           (unsigned long)u.uptimeS,
                           (unsigned long)u.heapFree,
                           (unsigned long)u.heapTotal,
                           (unsigned long)u.flashUsed,
                           (unsigned long)u.flashTotal,
                           (unsigned)u.cpuMhz,
                           (unsigned)u.cores,
                           (int)u.rssi);
    r.hasResponse = (n > 0) && ((size_t)n < sizeof(response.args));
    return r;
}

DispatchResult CommandDispatcher::handlePing_(Command& response) const
{
    DispatchResult r;
    r.hasResponse = response.setArgs("{\"pong\":true}");
    return r;
}

DispatchResult CommandDispatcher::handleGetSchedule_(Command& response) const
{
    if (!wake_ || !wake_->scheduleJson ||
        !wake_->scheduleJson(wake_->ctx, response.args, sizeof(response.args))) {
        return respondError_(response, ErrorCode::NotReady, "get_sched");
    }
    DispatchResult r;
    r.hasResponse = true;
    return r;
}

DispatchResult CommandDispatcher::handleSetSchedule_(const Command& cmd, Command& response) const
{
    if (cmd.args[0] == '\0') return respondError_(response, ErrorCode::MissingArgs, "set_sched");
    if (!wake_ || !wake_->setSchedule) return respondError_(response, ErrorCode::NotReady, "set_sched");

    ErrorCode err = ErrorCode::Failed;
    uint8_t badSlot = 0;
    uint8_t saved = 0;
    if (!wake_->setSchedule(wake_->ctx, cmd.args, &err, &badSlot, &saved)) {
        DispatchResult r;
        r.actionOk = false;
        r.hasResponse = writeErrorJsonWithSlot(response.args, sizeof(response.args),
                                               err, "set_sched", badSlot);
        return r;
    }

    DispatchResult r;
    const int n = snprintf(response.args, sizeof(response.args),
                           "{\"ok\":true,\"saved\":%u}", (unsigned)saved);
    r.hasResponse = (n > 0) && ((size_t)n < sizeof(response.args));
    return r;
}
