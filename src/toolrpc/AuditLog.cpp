//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuditLog.cpp
// Purpose: Audit record serialization
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/AuditLog.h"

namespace toolrpc {

AuditLog::AuditLog() : sink([](const std::string& line) { Logger::writeStructured(line); }) {}

AuditLog::AuditLog(Sink s) : sink(std::move(s)) {}

JSONValue AuditLog::ToJSON(const AuditRecord& record) {
    JSONValue::Object o;
    o["timestamp"] = MakeShared(JSONValue(Logger::isoTimestamp()));
    o["level"] = MakeShared(JSONValue("INFO"));
    o["component"] = MakeShared(JSONValue(record.component));
    o["message"] = MakeShared(JSONValue("Audit: " + record.action + " - " + record.outcome));
    o["action"] = MakeShared(JSONValue(record.action));
    o["outcome"] = MakeShared(JSONValue(record.outcome));
    if (!record.requestId.empty()) o["requestId"] = MakeShared(JSONValue(record.requestId));
    if (!record.actor.empty()) o["actor"] = MakeShared(JSONValue(record.actor));
    o["metadata"] = MakeShared(record.metadata);
    return JSONValue(std::move(o));
}

void AuditLog::Write(const AuditRecord& record) const {
    if (!sink) {
        return;
    }
    sink(SerializeJSON(ToJSON(record)));
}

} // namespace toolrpc
