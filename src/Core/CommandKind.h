#pragma once
/**
 * @file CommandKind.h
 * @brief Closed set of command kinds carried on the secure link.
 */
#include <stdint.h>
#include <string.h>

enum class CommandKind : uint8_t {
    Wake = 0,
    Status,
    Usage,
    Ping,
    GetSchedule,
    SetSchedule
};

/** @brief Wire name of a kind (`"WAKE"`, `"STATUS"`...). */
static inline const char* commandKindStr(CommandKind kind)
{
    switch (kind) {
    case CommandKind::Wake: return "WAKE";
    case CommandKind::Status: return "STATUS";
    case CommandKind::Usage: return "USAGE";
    case CommandKind::Ping: return "PING";
    case CommandKind::GetSchedule: return "GET_SCHED";
    case CommandKind::SetSchedule: return "SET_SCHED";
    }
    return "UNKNOWN";
}

/** @brief Parse a wire name; false for unknown kinds. */
static inline bool parseCommandKind(const char* s, CommandKind& out)
{
    if (!s) return false;
    static const CommandKind kAll[] = {
        CommandKind::Wake, CommandKind::Status, CommandKind::Usage,
        CommandKind::Ping, CommandKind::GetSchedule, CommandKind::SetSchedule
    };
    for (CommandKind k : kAll) {
        if (strcmp(s, commandKindStr(k)) == 0) {
            out = k;
            return true;
        }
    }
    return false;
}
