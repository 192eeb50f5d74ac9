//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.h
// Purpose: Cooperative cancellation handles and the bounded registry of in-flight calls
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolrpc/Protocol.h"

namespace toolrpc {

//==========================================================================================================
// CancellationHandle
// Purpose: Advisory cancellation flag for one in-flight call, backed by std::stop_source.
// Notes:
//   - Cancel() never interrupts running code; executors observe it by polling IsCancelled() or Token().
//   - OnCancel listeners registered after cancellation run immediately on the registering thread.
//==========================================================================================================
class CancellationHandle {
public:
    CancellationHandle() = default;
    CancellationHandle(const CancellationHandle&) = delete;
    CancellationHandle& operator=(const CancellationHandle&) = delete;

    bool IsCancelled() const noexcept { return source.stop_requested(); }

    // Returns true for the call that flipped the flag.
    bool Cancel() { return source.request_stop(); }

    void OnCancel(std::function<void()> listener);

    std::stop_token Token() const noexcept { return source.get_token(); }

private:
    std::stop_source source;
    std::mutex listenerMutex;
    std::vector<std::unique_ptr<std::stop_callback<std::function<void()>>>> listeners;
};

using CancellationHandlePtr = std::shared_ptr<CancellationHandle>;

//==========================================================================================================
// CancellationRegistry
// Purpose: Maps request ids to handles so a cancellation notification can reach the call.
// Notes:
//   - Capacity bounded; inserting into a full registry evicts the oldest entry. An evicted call keeps
//     running but can no longer be cancelled by id.
//   - All operations are guarded by one mutex.
//==========================================================================================================
class CancellationRegistry {
public:
    explicit CancellationRegistry(std::size_t capacity = DEFAULT_CANCELLATION_CAPACITY);

    // Creates a handle for id. A live entry with the same id is replaced.
    CancellationHandlePtr Register(const std::string& id);

    // Flips the handle registered for id. Returns false when the id is unknown.
    bool Cancel(const std::string& id);

    // Removes id only if it still maps to handle (a newer registration is left alone).
    void Remove(const std::string& id, const CancellationHandlePtr& handle);

    bool Contains(const std::string& id) const;
    std::size_t Size() const;
    std::size_t Capacity() const { return capacity; }

private:
    struct Entry {
        CancellationHandlePtr handle;
        std::list<std::string>::iterator orderIt;
    };

    std::size_t capacity;
    mutable std::mutex mutex;
    std::list<std::string> order;  // oldest first
    std::unordered_map<std::string, Entry> entries;
};

//==========================================================================================================
// CancellationScope
// Purpose: RAII registration of a handle for the lifetime of one call. Without a registry or id the
//          scope still owns a private handle, so callers can always poll it.
//==========================================================================================================
class CancellationScope {
public:
    CancellationScope(CancellationRegistry* registry, std::string id);
    ~CancellationScope();
    CancellationScope(const CancellationScope&) = delete;
    CancellationScope& operator=(const CancellationScope&) = delete;

    const CancellationHandlePtr& Handle() const { return handle; }

private:
    CancellationRegistry* registry;
    std::string id;
    CancellationHandlePtr handle;
};

} // namespace toolrpc
