//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BatchExecutor.cpp
// Purpose: Chunked parallel tool execution
//==========================================================================================================

#include <algorithm>
#include <future>
#include <mutex>

#include "logging/Logger.h"
#include "toolrpc/BatchExecutor.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/util/Sanitize.h"

namespace toolrpc {

JSONValue BatchResult::ToJSON() const {
    JSONValue::Object o;
    o["tool"] = MakeShared(JSONValue(tool));
    o["success"] = MakeShared(JSONValue(success));
    if (result) o["result"] = MakeShared(*result);
    if (error) o["error"] = MakeShared(JSONValue(*error));
    return JSONValue(std::move(o));
}

BatchExecutor::BatchExecutor(const ToolRegistry& reg) : registry(reg) {}

BatchResult BatchExecutor::runOne(const BatchRequest& request, const CancellationHandle& cancel) const {
    BatchResult r;
    r.tool = request.tool;
    if (cancel.IsCancelled()) {
        r.error = "Batch cancelled";
        return r;
    }
    try {
        r.result = registry.Execute(request.tool, request.args, cancel);
        r.success = true;
    } catch (const std::exception& e) {
        LOG_ERROR("Batch tool execution failed: {}: {}", sanitize::SanitizeName(request.tool), e.what());
        r.error = sanitize::SanitizeErrorMessage(e.what());
    } catch (...) {
        LOG_ERROR("Batch tool execution failed: {}: non-standard exception", sanitize::SanitizeName(request.tool));
        r.error = "Tool execution failed";
    }
    return r;
}

std::vector<BatchResult> BatchExecutor::Execute(const std::vector<BatchRequest>& requests,
                                                const BatchOptions& options,
                                                const CancellationHandle* cancel,
                                                ProgressCallback progress) const {
    std::vector<BatchResult> results(requests.size());
    if (requests.empty()) {
        return results;
    }
    CancellationHandle unshared;
    const CancellationHandle& handle = cancel ? *cancel : unshared;

    const std::size_t accepted = std::min(requests.size(), options.maxBatchSize);
    const std::size_t chunk = std::max<std::size_t>(1, options.concurrency);
    if (accepted < requests.size()) {
        LOG_WARN("Batch of {} requests exceeds limit {}; {} rejected",
                 requests.size(), options.maxBatchSize, requests.size() - accepted);
    }
    for (std::size_t i = accepted; i < requests.size(); ++i) {
        results[i].tool = requests[i].tool;
        results[i].error = "Batch size limit exceeded";
    }

    std::mutex progressMutex;
    auto report = [&](double value, std::string message) {
        if (!progress) return;
        std::lock_guard<std::mutex> lock(progressMutex);
        progress(ProgressUpdate{value, std::move(message)});
    };

    report(0.0, "Executing " + std::to_string(accepted) + " tools...");

    for (std::size_t start = 0; start < accepted; start += chunk) {
        const std::size_t end = std::min(accepted, start + chunk);
        std::vector<std::future<void>> inflight;
        inflight.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            inflight.push_back(std::async(std::launch::async, [&, i]() {
                results[i] = runOne(requests[i], handle);
                report(static_cast<double>(i + 1) / static_cast<double>(accepted),
                       "Executing " + requests[i].tool + "...");
            }));
        }
        for (auto& f : inflight) {
            f.get();
        }
    }

    report(1.0, "Completed " + std::to_string(accepted) + " tools");
    return results;
}

} // namespace toolrpc
