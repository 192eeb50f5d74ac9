//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolrpc/InMemoryTransport.hpp"
#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/JsonRpcMessageRouter.h"

namespace toolrpc {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    InMemoryTransport::RawHandler rawHandler;
    std::queue<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;
    std::atomic<int> inflight{0};
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    // Shared between the two ends so either may be destroyed first.
    struct Link {
        std::mutex mutex;
        Impl* ends[2]{nullptr, nullptr};
    };
    std::shared_ptr<Link> link;
    int side{0};

    Impl() : router(MakeDefaultJsonRpcMessageRouter()) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        connected = false;
        queueCondition.notify_all();
        if (processingThread.joinable()) {
            processingThread.request_stop();
            processingThread.join();
        }
        if (link) {
            std::lock_guard<std::mutex> lk(link->mutex);
            link->ends[side] = nullptr;
        }
        // Detached request threads still reference this object.
        while (inflight.load() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (connected && !st.stop_requested()) {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || !connected || st.stop_requested(); });
                if (st.stop_requested()) {
                    break;
                }
                while (!messageQueue.empty() && connected) {
                    std::string message = std::move(messageQueue.front());
                    messageQueue.pop();
                    lock.unlock();
                    processMessage(message);
                    lock.lock();
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Processing in-memory message: {}", message);
        auto msg = router->parse(message);
        switch (msg.kind) {
            case IJsonRpcMessageRouter::MessageKind::Response:
                if (resolve(*msg.response)) {
                    return;
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Request:
                if (requestHandler) {
                    // Each request runs on its own thread so a cancellation notification can arrive while
                    // a long-running request is executing.
                    ++inflight;
                    std::thread([this, req = std::move(msg.request)]() {
                        (void)sendToPeer(router->handleRequest(*req, requestHandler));
                        --inflight;
                    }).detach();
                    return;
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Notification:
                if (notificationHandler) {
                    notificationHandler(std::move(msg.notification));
                    return;
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Invalid:
                if (msg.errorReply && requestHandler) {
                    (void)sendToPeer(*msg.errorReply);
                    return;
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Unparsable:
            default:
                break;
        }
        if (rawHandler) {
            rawHandler(message);
        }
    }

    bool resolve(JSONRPCResponse& response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            return false;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
        return true;
    }

    void enqueueMessage(const std::string& message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        messageQueue.push(message);
        queueCondition.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        if (!link) {
            LOG_WARN("InMemoryTransport: no peer; dropping message");
            return false;
        }
        std::lock_guard<std::mutex> lk(link->mutex);
        Impl* peer = link->ends[1 - side];
        if (!peer || !peer->connected.load()) {
            LOG_WARN("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        peer->enqueueMessage(message);
        return true;
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    auto link = std::make_shared<Impl::Link>();
    link->ends[0] = transport1->pImpl.get();
    link->ends[1] = transport2->pImpl.get();
    transport1->pImpl->link = link;
    transport1->pImpl->side = 0;
    transport2->pImpl->link = link;
    transport2->pImpl->side = 1;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryTransport");
    if (!pImpl->connected.exchange(true)) {
        pImpl->startProcessing();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing InMemoryTransport");
    pImpl->connected = false;
    pImpl->queueCondition.notify_all();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        for (auto& [idStr, prom] : pImpl->pendingRequests) {
            auto resp = CreateErrorResponse(JSONRPCId{idStr}, JSONRPCErrorCodes::InternalError, "Transport closed");
            prom.set_value(std::move(resp));
        }
        pImpl->pendingRequests.clear();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::string requestId = IdToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("Sending in-memory request: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(requestId);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Peer not connected"));
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

bool InMemoryTransport::SendRaw(const std::string& body) {
    return pImpl->sendToPeer(body);
}

void InMemoryTransport::SetRawMessageHandler(RawHandler handler) {
    pImpl->rawHandler = std::move(handler);
}

std::future<void> InMemoryTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending in-memory notification: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        if (pImpl->errorHandler) {
            pImpl->errorHandler("Peer not connected");
        }
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<InMemoryTransport>();
}

} // namespace toolrpc
