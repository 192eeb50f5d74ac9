//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BatchExecutor.h
// Purpose: Runs many tool invocations with bounded parallelism and shared cancellation
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/Cancellation.h"
#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

class ToolRegistry;

struct BatchRequest {
    std::string tool;
    JSONValue args{JSONValue::Object{}};
};

struct BatchResult {
    std::string tool;
    bool success{false};
    std::optional<JSONValue> result;
    std::optional<std::string> error;

    // {tool, success, result | error}
    JSONValue ToJSON() const;
};

struct BatchOptions {
    std::size_t concurrency{10};
    std::size_t maxBatchSize{100};
};

struct ProgressUpdate {
    double progress{0.0};   // 0..1
    std::string message;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

//==========================================================================================================
// BatchExecutor
// Purpose: Executes requests through ToolRegistry::Execute, so unknown tools and schema violations become
//          failed records rather than exceptions.
// Notes:
//   - Results are one-to-one with requests, in input order.
//   - Requests beyond maxBatchSize are not run; their record says "Batch size limit exceeded".
//   - Accepted requests run in chunks of `concurrency` on std::async threads; a chunk finishes before the
//     next one starts.
//   - Each request checks the shared handle before starting; a cancelled one yields "Batch cancelled".
//   - Progress is reported as 0 at start, (index + 1) / n after each request, and 1 at the end. The
//     callback is never invoked concurrently.
//==========================================================================================================
class BatchExecutor {
public:
    explicit BatchExecutor(const ToolRegistry& registry);

    std::vector<BatchResult> Execute(const std::vector<BatchRequest>& requests,
                                     const BatchOptions& options = {},
                                     const CancellationHandle* cancel = nullptr,
                                     ProgressCallback progress = nullptr) const;

private:
    BatchResult runOne(const BatchRequest& request, const CancellationHandle& cancel) const;

    const ToolRegistry& registry;
};

} // namespace toolrpc
