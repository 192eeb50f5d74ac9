//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.cpp
// Purpose: Cancellation handle listeners and bounded registry
//==========================================================================================================

#include "logging/Logger.h"
#include "toolrpc/Cancellation.h"

namespace toolrpc {

void CancellationHandle::OnCancel(std::function<void()> listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenerMutex);
    listeners.push_back(std::make_unique<std::stop_callback<std::function<void()>>>(source.get_token(), std::move(listener)));
}

CancellationRegistry::CancellationRegistry(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

CancellationHandlePtr CancellationRegistry::Register(const std::string& id) {
    auto handle = std::make_shared<CancellationHandle>();
    std::lock_guard<std::mutex> lock(mutex);
    auto existing = entries.find(id);
    if (existing != entries.end()) {
        LOG_DEBUG("Cancellation handle for id {} replaced by a newer request", id);
        order.erase(existing->second.orderIt);
        entries.erase(existing);
    }
    while (entries.size() >= capacity && !order.empty()) {
        const std::string oldest = order.front();
        order.pop_front();
        entries.erase(oldest);
        LOG_WARN("Cancellation registry full ({}); evicted oldest id {}", capacity, oldest);
    }
    order.push_back(id);
    entries.emplace(id, Entry{handle, std::prev(order.end())});
    return handle;
}

bool CancellationRegistry::Cancel(const std::string& id) {
    CancellationHandlePtr handle;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(id);
        if (it == entries.end()) {
            return false;
        }
        handle = it->second.handle;
    }
    // Listeners run outside the registry lock
    handle->Cancel();
    return true;
}

void CancellationRegistry::Remove(const std::string& id, const CancellationHandlePtr& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end() || it->second.handle != handle) {
        return;
    }
    order.erase(it->second.orderIt);
    entries.erase(it);
}

bool CancellationRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.find(id) != entries.end();
}

std::size_t CancellationRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

CancellationScope::CancellationScope(CancellationRegistry* reg, std::string requestId)
    : registry(reg), id(std::move(requestId)) {
    if (registry && !id.empty()) {
        handle = registry->Register(id);
    } else {
        handle = std::make_shared<CancellationHandle>();
    }
}

CancellationScope::~CancellationScope() {
    if (registry && !id.empty()) {
        registry->Remove(id, handle);
    }
}

} // namespace toolrpc
