//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.cpp
// Purpose: Resource registration and reads
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/ResourceRegistry.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

namespace {
bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

void ResourceRegistry::Register(Resource resource) {
    if (isBlank(resource.uri)) {
        throw errors::ConfigurationError("Resource 'uri' must be a non-empty string");
    }
    if (isBlank(resource.name)) {
        throw errors::ConfigurationError("Resource '" + resource.uri + "': 'name' must be a non-empty string");
    }
    if (!resource.provider) {
        throw errors::ConfigurationError("Resource '" + resource.uri + "': content provider is required");
    }
    const std::string uri = resource.uri;
    std::lock_guard<std::mutex> lock(mutex);
    if (resources.find(uri) != resources.end()) {
        throw errors::ConfigurationError("Resource with URI '" + uri + "' already registered.");
    }
    resources.emplace(uri, std::make_shared<const Resource>(std::move(resource)));
    LOG_DEBUG("Registered resource {}", uri);
}

std::shared_ptr<const Resource> ResourceRegistry::Find(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = resources.find(uri);
    return it == resources.end() ? nullptr : it->second;
}

std::size_t ResourceRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return resources.size();
}

JSONValue ResourceRegistry::ListJSON() const {
    std::vector<std::shared_ptr<const Resource>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [uri, r] : resources) snapshot.push_back(r);
    }
    JSONValue::Array arr;
    for (const auto& r : snapshot) {
        JSONValue::Object o;
        o["uri"] = MakeShared(JSONValue(r->uri));
        o["name"] = MakeShared(JSONValue(r->name));
        if (r->description) o["description"] = MakeShared(JSONValue(*r->description));
        if (r->mimeType) o["mimeType"] = MakeShared(JSONValue(*r->mimeType));
        if (r->icon) o["icon"] = MakeShared(JSONValue(*r->icon));
        arr.push_back(MakeShared(JSONValue(std::move(o))));
    }
    return JSONValue(std::move(arr));
}

JSONValue ResourceRegistry::Read(const std::string& uri) const {
    auto r = Find(uri);
    if (!r) {
        throw errors::ResourceNotFoundError(uri);
    }
    ResourceContent c = r->provider(uri);
    JSONValue::Object item;
    item["uri"] = MakeShared(JSONValue(uri));
    const auto mime = c.mimeType ? c.mimeType : r->mimeType;
    if (mime) item["mimeType"] = MakeShared(JSONValue(*mime));
    if (c.blob) {
        item["blob"] = MakeShared(JSONValue(*c.blob));
    } else {
        item["text"] = MakeShared(JSONValue(c.text.value_or(std::string())));
    }
    JSONValue::Array contents;
    contents.push_back(MakeShared(JSONValue(std::move(item))));
    JSONValue::Object result;
    result["contents"] = MakeShared(JSONValue(std::move(contents)));
    return JSONValue(std::move(result));
}

} // namespace toolrpc
