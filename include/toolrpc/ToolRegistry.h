//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Append-only catalog of callable tools with naming policy and argument validation
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/Cancellation.h"
#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Schema.h"
#include "toolrpc/resilience/RateLimiter.h"
#include "toolrpc/resilience/Retry.h"

namespace toolrpc {

// Executors receive validated arguments and the call's cancellation handle; they may throw.
using ToolExecutor = std::function<JSONValue(const JSONValue& args, const CancellationHandle& cancel)>;

// Optional per-tool guards applied by the dispatcher around execution.
struct ToolPolicy {
    std::optional<resilience::RateLimitConfig> rateLimit;
    std::optional<resilience::RetryOptions> retry;
    bool circuitBreaker{false};
};

struct Tool {
    std::string name;
    std::string description;
    ObjectSchema inputSchema;
    ToolExecutor executor;
    std::optional<std::string> icon;
    ToolPolicy policy;
};

using ToolPtr = std::shared_ptr<const Tool>;

// Where a tool definition came from. External names are rewritten to satisfy the naming policy.
enum class ToolSource {
    Trusted,
    External
};

//==========================================================================================================
// ToolRegistry
// Purpose: Holds immutable Tool definitions keyed by unique name.
// Notes:
//   - Registration only appends; there is no removal.
//   - Lookups hand out shared snapshots so executors run without holding the registry lock.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //======================================================================================================
    // Register
    // Purpose: Adds a tool after checking its definition.
    // Args:
    //   tool: Definition; name, description and executor are required.
    //   source: Trusted names must already satisfy the naming policy; External names are rewritten.
    // Returns:
    //   The name under which the tool was registered.
    // Throws:
    //   errors::ConfigurationError on an invalid definition or a duplicate name.
    //======================================================================================================
    std::string Register(Tool tool, ToolSource source = ToolSource::Trusted);

    // Convenience overload parsing a JSON inputSchema (see ObjectSchema::FromJSON).
    std::string Register(const std::string& name, const std::string& description, const JSONValue& inputSchema,
                         ToolExecutor executor, ToolSource source = ToolSource::Trusted);

    ToolPtr Find(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::size_t Size() const;

    // All tools ordered by name.
    std::vector<ToolPtr> List() const;

    // [{name, description, inputSchema, icon?}] ordered by name; the projection served by tools/list.
    JSONValue ListSchemas() const;

    //======================================================================================================
    // Execute
    // Purpose: Validates arguments against the tool's schema and runs its executor.
    // Throws:
    //   errors::ToolNotFoundError, errors::ValidationError, or whatever the executor throws.
    //======================================================================================================
    JSONValue Execute(const std::string& name, const JSONValue& args, const CancellationHandle& cancel) const;

private:
    mutable std::mutex mutex;
    std::map<std::string, ToolPtr> tools;
};

} // namespace toolrpc
