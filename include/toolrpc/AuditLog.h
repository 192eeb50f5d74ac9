//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuditLog.h
// Purpose: Structured audit records for every tool invocation
//==========================================================================================================

#pragma once

#include <functional>
#include <string>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

struct AuditRecord {
    std::string component{"dispatcher"};
    std::string action;
    std::string outcome;       // "success", "failure", "denied", "cancelled"
    std::string requestId;
    std::string actor;
    JSONValue metadata{JSONValue::Object{}};
};

//==========================================================================================================
// AuditLog
// Purpose: Serializes AuditRecords as single JSON lines.
// Notes:
//   - Default sink is Logger::writeStructured, so audit lines share the logger's mutex and sinks
//     (stderr, optional file). Never stdout.
//   - Records are written regardless of the configured log level.
//==========================================================================================================
class AuditLog {
public:
    using Sink = std::function<void(const std::string& jsonLine)>;

    AuditLog();
    explicit AuditLog(Sink sink);

    void Write(const AuditRecord& record) const;

    // {timestamp, level, component, message, action, outcome, requestId?, actor?, metadata}
    static JSONValue ToJSON(const AuditRecord& record);

private:
    Sink sink;
};

} // namespace toolrpc
