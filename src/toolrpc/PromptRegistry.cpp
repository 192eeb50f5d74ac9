//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptRegistry.cpp
// Purpose: Prompt registration and rendering
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/PromptRegistry.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

PromptMessage PromptMessage::Text(const std::string& role, const std::string& text) {
    PromptMessage m;
    m.role = role;
    m.content.push_back(MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}}));
    return m;
}

void PromptRegistry::Register(Prompt prompt) {
    if (prompt.name.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw errors::ConfigurationError("Prompt 'name' must be a non-empty string");
    }
    if (!prompt.provider) {
        throw errors::ConfigurationError("Prompt '" + prompt.name + "': message provider is required");
    }
    for (const auto& arg : prompt.arguments) {
        if (arg.name.empty()) {
            throw errors::ConfigurationError("Prompt '" + prompt.name + "': argument names must be non-empty");
        }
    }
    const std::string name = prompt.name;
    std::lock_guard<std::mutex> lock(mutex);
    if (prompts.find(name) != prompts.end()) {
        throw errors::ConfigurationError("Prompt with name '" + name + "' already registered.");
    }
    prompts.emplace(name, std::make_shared<const Prompt>(std::move(prompt)));
    LOG_DEBUG("Registered prompt {}", name);
}

std::shared_ptr<const Prompt> PromptRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = prompts.find(name);
    return it == prompts.end() ? nullptr : it->second;
}

std::size_t PromptRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return prompts.size();
}

JSONValue PromptRegistry::ListJSON() const {
    std::vector<std::shared_ptr<const Prompt>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [name, p] : prompts) snapshot.push_back(p);
    }
    JSONValue::Array arr;
    for (const auto& p : snapshot) {
        JSONValue::Object o;
        o["name"] = MakeShared(JSONValue(p->name));
        if (p->description) o["description"] = MakeShared(JSONValue(*p->description));
        if (p->icon) o["icon"] = MakeShared(JSONValue(*p->icon));
        if (!p->arguments.empty()) {
            JSONValue::Array args;
            for (const auto& a : p->arguments) {
                JSONValue::Object ao;
                ao["name"] = MakeShared(JSONValue(a.name));
                if (a.description) ao["description"] = MakeShared(JSONValue(*a.description));
                ao["required"] = MakeShared(JSONValue(a.required));
                args.push_back(MakeShared(JSONValue(std::move(ao))));
            }
            o["arguments"] = MakeShared(JSONValue(std::move(args)));
        }
        arr.push_back(MakeShared(JSONValue(std::move(o))));
    }
    return JSONValue(std::move(arr));
}

JSONValue PromptRegistry::Get(const std::string& name, const JSONValue& args) const {
    auto p = Find(name);
    if (!p) {
        throw errors::PromptNotFoundError(name);
    }
    const JSONValue emptyArgs{JSONValue::Object{}};
    const JSONValue& effective = args.isObject() ? args : emptyArgs;
    for (const auto& a : p->arguments) {
        if (!a.required) continue;
        const JSONValue* v = effective.find(a.name);
        if (!v || v->isNull()) {
            throw errors::ValidationError("Missing required argument: " + a.name);
        }
    }

    JSONValue::Array messages;
    for (auto& m : p->provider(effective)) {
        JSONValue::Array content;
        for (auto& c : m.content) content.push_back(MakeShared(std::move(c)));
        JSONValue::Object mo;
        mo["role"] = MakeShared(JSONValue(m.role));
        mo["content"] = MakeShared(JSONValue(std::move(content)));
        messages.push_back(MakeShared(JSONValue(std::move(mo))));
    }
    JSONValue::Object result;
    if (p->description) result["description"] = MakeShared(JSONValue(*p->description));
    result["messages"] = MakeShared(JSONValue(std::move(messages)));
    return JSONValue(std::move(result));
}

} // namespace toolrpc
