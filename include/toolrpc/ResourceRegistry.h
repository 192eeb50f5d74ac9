//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.h
// Purpose: Read-only resources exposed through resources/list and resources/read
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {

// Exactly one of text or blob (base64) is set.
struct ResourceContent {
    std::optional<std::string> text;
    std::optional<std::string> blob;
    std::optional<std::string> mimeType;

    static ResourceContent Text(std::string t, std::optional<std::string> mime = std::nullopt) {
        ResourceContent c; c.text = std::move(t); c.mimeType = std::move(mime); return c;
    }
    static ResourceContent Blob(std::string base64, std::optional<std::string> mime = std::nullopt) {
        ResourceContent c; c.blob = std::move(base64); c.mimeType = std::move(mime); return c;
    }
};

using ResourceProvider = std::function<ResourceContent(const std::string& uri)>;

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
    std::optional<std::string> icon;
    ResourceProvider provider;
};

class ResourceRegistry {
public:
    ResourceRegistry() = default;
    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // Throws errors::ConfigurationError for a blank uri/name, a missing provider or a duplicate uri.
    void Register(Resource resource);

    std::shared_ptr<const Resource> Find(const std::string& uri) const;
    std::size_t Size() const;
    bool Empty() const { return Size() == 0; }

    // [{uri, name, description?, mimeType?, icon?}] ordered by uri.
    JSONValue ListJSON() const;

    //======================================================================================================
    // Read
    // Purpose: Invokes the provider and shapes {contents:[{uri, mimeType?, text | blob}]}.
    // Throws:
    //   errors::ResourceNotFoundError for an unknown uri; provider exceptions propagate.
    //======================================================================================================
    JSONValue Read(const std::string& uri) const;

private:
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<const Resource>> resources;
};

} // namespace toolrpc
