#pragma once
/**
 * @file CommandDispatcher.h
 * @brief Maps a verified command to its action and optional response.
 */
#include <stdint.h>

#include "Core/Services/IWake.h"
#include "Modules/Network/MQTTModule/CommandProtocol.h"

/** @brief What `CommandDispatcher::handle` did. */
struct DispatchResult {
    bool hasResponse = false;   ///< `response` must be encoded and published
    bool actionOk = true;       ///< collaborator call succeeded
};

class CommandDispatcher {
public:
    /** @brief Collaborators are borrowed; `serial` becomes the response target. */
    void bind(const WakeService* wake, const char* serial);

    DispatchResult handle(const Command& cmd, uint64_t nowSec, Command& response) const;

private:
    DispatchResult handleWake_() const;
    DispatchResult handleStatus_(Command& response) const;
    DispatchResult handleUsage_(Command& response) const;
    DispatchResult handlePing_(Command& response) const;
    DispatchResult handleGetSchedule_(Command& response) const;
    DispatchResult handleSetSchedule_(const Command& cmd, Command& response) const;

    static DispatchResult respondError_(Command& response, ErrorCode code, const char* where);

    const WakeService* wake_ = nullptr;
    const char* serial_ = "";
};
