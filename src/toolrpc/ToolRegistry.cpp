//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration, lookup and validated execution
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/util/Sanitize.h"
#include "toolrpc/validation/SchemaValidator.h"
#include "toolrpc/validation/ToolNaming.h"

namespace toolrpc {

namespace {
bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

std::string ToolRegistry::Register(Tool tool, ToolSource source) {
    if (isBlank(tool.name)) {
        throw errors::ConfigurationError("Tool name must be a non-empty string");
    }

    const std::string originalName = tool.name;
    auto namingError = validation::ToolNaming::Validate(tool.name);
    if (namingError) {
        const std::string suggestion = validation::ToolNaming::Suggest(tool.name);
        if (source == ToolSource::Trusted) {
            throw errors::ConfigurationError("Tool '" + tool.name + "': " + *namingError +
                                             ". Suggested name: '" + suggestion + "'");
        }
        LOG_WARN("Tool name '{}' rewritten to '{}': {}", sanitize::SanitizeName(originalName), suggestion, *namingError);
        tool.name = suggestion;
    }

    if (isBlank(tool.description)) {
        throw errors::ConfigurationError("Tool '" + tool.name + "': description must be a non-empty string");
    }
    if (!tool.executor) {
        throw errors::ConfigurationError("Tool '" + tool.name + "': executor is required");
    }
    if (tool.policy.rateLimit) {
        try {
            (void)resilience::ParseWindow(tool.policy.rateLimit->window);
        } catch (const std::invalid_argument& e) {
            throw errors::ConfigurationError("Tool '" + tool.name + "': " + e.what());
        }
        if (tool.policy.rateLimit->max < 1) {
            throw errors::ConfigurationError("Tool '" + tool.name + "': rate limit max must be at least 1");
        }
    }
    for (const auto& req : tool.inputSchema.required) {
        if (tool.inputSchema.properties.find(req) == tool.inputSchema.properties.end()) {
            throw errors::ConfigurationError("Tool '" + tool.name + "': required property '" + req +
                                             "' does not exist in properties");
        }
    }

    const std::string name = tool.name;
    auto ptr = std::make_shared<const Tool>(std::move(tool));
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (tools.find(name) != tools.end()) {
            if (name != originalName) {
                throw errors::ConfigurationError("Tool name '" + name + "' (rewritten from '" + originalName +
                                                 "') already registered.");
            }
            throw errors::ConfigurationError("Tool name '" + name + "' already registered.");
        }
        tools.emplace(name, std::move(ptr));
    }
    LOG_DEBUG("Registered tool {}", name);
    return name;
}

std::string ToolRegistry::Register(const std::string& name, const std::string& description, const JSONValue& inputSchema,
                                   ToolExecutor executor, ToolSource source) {
    Tool t;
    t.name = name;
    t.description = description;
    t.inputSchema = ObjectSchema::FromJSON(inputSchema, name);
    t.executor = std::move(executor);
    return Register(std::move(t), source);
}

ToolPtr ToolRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second;
}

bool ToolRegistry::Has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return tools.find(name) != tools.end();
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tools.size();
}

std::vector<ToolPtr> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<ToolPtr> out;
    out.reserve(tools.size());
    for (const auto& [name, t] : tools) {
        out.push_back(t);
    }
    return out;
}

JSONValue ToolRegistry::ListSchemas() const {
    JSONValue::Array arr;
    for (const auto& t : List()) {
        JSONValue::Object o;
        o["name"] = MakeShared(JSONValue(t->name));
        o["description"] = MakeShared(JSONValue(t->description));
        o["inputSchema"] = MakeShared(t->inputSchema.ToJSON());
        if (t->icon) {
            o["icon"] = MakeShared(JSONValue(*t->icon));
        }
        arr.push_back(MakeShared(JSONValue(std::move(o))));
    }
    return JSONValue(std::move(arr));
}

JSONValue ToolRegistry::Execute(const std::string& name, const JSONValue& args, const CancellationHandle& cancel) const {
    ToolPtr tool = Find(name);
    if (!tool) {
        throw errors::ToolNotFoundError(name);
    }
    auto err = validation::ValidateArguments(args, tool->inputSchema);
    if (err) {
        throw errors::ValidationError(*err);
    }
    return tool->executor(args, cancel);
}

} // namespace toolrpc
