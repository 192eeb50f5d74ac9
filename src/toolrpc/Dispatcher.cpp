//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Method table, initialize negotiation and the tools/call pipeline
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolrpc/AuditLog.h"
#include "toolrpc/Cancellation.h"
#include "toolrpc/Dispatcher.h"
#include "toolrpc/PromptRegistry.h"
#include "toolrpc/ResourceRegistry.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/resilience/CircuitBreaker.h"
#include "toolrpc/resilience/RateLimiter.h"
#include "toolrpc/resilience/Retry.h"
#include "toolrpc/util/Sanitize.h"
#include "toolrpc/validation/SchemaValidator.h"

namespace toolrpc {

namespace {

struct ScopeGuard {
    std::function<void()> f;
    ~ScopeGuard() {
        if (!f) return;
        try {
            f();
        } catch (const std::exception& e) {
            LOG_ERROR("Scope cleanup failed: {}", e.what());
        }
    }
};

std::unique_ptr<JSONRPCResponse> success(const JSONRPCId& id, JSONValue result) {
    return std::make_unique<JSONRPCResponse>(id, std::move(result));
}

std::unique_ptr<JSONRPCResponse> failure(const JSONRPCId& id, int code, const std::string& message,
                                         std::optional<JSONValue> data = std::nullopt) {
    return errors::makeErrorResponse(id, errors::makeRpcError(code, message, std::move(data)));
}

const JSONValue& emptyObject() {
    static const JSONValue empty{JSONValue::Object{}};
    return empty;
}

// params when it is an object, otherwise an empty object.
const JSONValue& paramsOf(const JSONRPCRequest& req) {
    return (req.params && req.params->isObject()) ? *req.params : emptyObject();
}

JSONValue argumentKeys(const JSONValue& args) {
    JSONValue::Array keys;
    if (const auto* o = std::get_if<JSONValue::Object>(&args.value)) {
        std::vector<std::string> names;
        names.reserve(o->size());
        for (const auto& [k, v] : *o) names.push_back(sanitize::SanitizeName(k));
        std::sort(names.begin(), names.end());
        for (auto& n : names) keys.push_back(MakeShared(JSONValue(std::move(n))));
    }
    return JSONValue(std::move(keys));
}

} // namespace

class Dispatcher::Impl {
public:
    using Handler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    Impl(DispatcherContext c, DispatcherOptions o)
        : ctx(c), options(std::move(o)), cancellations(options.cancellationCapacity) {
        methods[Methods::Initialize] = [this](const JSONRPCRequest& r) { return handleInitialize(r); };
        methods[Methods::Ping] = [](const JSONRPCRequest& r) { return success(r.id, JSONValue(JSONValue::Object{})); };
        methods[Methods::ListTools] = [this](const JSONRPCRequest& r) { return handleToolsList(r); };
        methods[Methods::CallTool] = [this](const JSONRPCRequest& r) { return handleToolsCall(r); };
        methods[Methods::ListResources] = [this](const JSONRPCRequest& r) { return handleResourcesList(r); };
        methods[Methods::ReadResource] = [this](const JSONRPCRequest& r) { return handleResourcesRead(r); };
        methods[Methods::ListPrompts] = [this](const JSONRPCRequest& r) { return handlePromptsList(r); };
        methods[Methods::GetPrompt] = [this](const JSONRPCRequest& r) { return handlePromptsGet(r); };
        methods[Methods::SamplingCreate] = [](const JSONRPCRequest& r) {
            return failure(r.id, JSONRPCErrorCodes::SamplingNotSupported, "Sampling is not supported by this server");
        };
        const Handler roots = [](const JSONRPCRequest& r) {
            return failure(r.id, JSONRPCErrorCodes::RootsNotSupported, "Roots are not supported by this server");
        };
        methods[Methods::RootsList] = roots;
        methods[Methods::RootsRead] = roots;
        methods[Methods::ElicitationElicit] = [](const JSONRPCRequest& r) {
            return failure(r.id, JSONRPCErrorCodes::ElicitationNotSupported, "Elicitation is not supported by this server");
        };
    }

    DispatcherContext ctx;
    DispatcherOptions options;
    CancellationRegistry cancellations;
    std::unordered_map<std::string, Handler> methods;
    ITransport::ErrorHandler errorHandler;
    std::unique_ptr<ITransport> transport;
    std::atomic<bool> initialized{false};
    mutable std::mutex actorMutex;
    std::string actor{"anonymous"};

    std::string currentActor() const {
        std::lock_guard<std::mutex> lock(actorMutex);
        return actor;
    }

    ServerCapabilities capabilities() const {
        ServerCapabilities caps;
        caps.tools = ToolsCapability{};
        if (!ctx.resources.Empty()) caps.resources = ResourcesCapability{};
        if (!ctx.prompts.Empty()) caps.prompts = PromptsCapability{};
        caps.logging = LoggingCapability{};
        return caps;
    }

    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCRequest& req) {
        auto it = methods.find(req.method);
        if (it == methods.end()) {
            LOG_DEBUG("Method not found: {}", sanitize::SanitizeName(req.method));
            return failure(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + sanitize::SanitizeName(req.method));
        }
        try {
            auto resp = it->second(req);
            if (!resp) {
                LOG_ERROR("Handler for {} returned no response", req.method);
                return failure(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
            }
            resp->id = req.id;
            return resp;
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled error in {}: {}", req.method, e.what());
            return failure(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
        } catch (...) {
            LOG_ERROR("Unhandled non-standard exception in {}", req.method);
            return failure(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
        }
    }

    ////////////////////////////////////////// initialize //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req) {
        const JSONValue& params = paramsOf(req);
        auto requested = GetString(params, "protocolVersion");
        if (!requested) {
            return failure(req.id, JSONRPCErrorCodes::InvalidParams, "Missing or invalid protocolVersion");
        }
        std::string negotiated = *requested;
        if (!IsSupportedProtocolVersion(negotiated)) {
            LOG_WARN("Client requested unsupported protocol version {}; answering with {}",
                     sanitize::SanitizeName(negotiated), PROTOCOL_VERSION);
            negotiated = PROTOCOL_VERSION;
        }

        std::string clientName;
        if (const JSONValue* info = params.find("clientInfo")) {
            clientName = GetString(*info, "name").value_or(std::string());
        }
        {
            std::lock_guard<std::mutex> lock(actorMutex);
            actor = sanitize::SanitizeActorId(clientName);
        }
        initialized = true;
        LOG_INFO("Initialized session for client {} (protocol {})", currentActor(), negotiated);

        JSONValue::Object result;
        result["protocolVersion"] = MakeShared(JSONValue(negotiated));
        result["capabilities"] = MakeShared(SerializeServerCapabilities(capabilities()));
        result["serverInfo"] = MakeShared(MakeObject({
            {"name", JSONValue(options.serverInfo.name)},
            {"version", JSONValue(options.serverInfo.version)}
        }));
        return success(req.id, JSONValue(std::move(result)));
    }

    ////////////////////////////////////////// tools //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        return success(req.id, MakeObject({{"tools", ctx.tools.ListSchemas()}}));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        const auto started = std::chrono::steady_clock::now();
        const std::string caller = currentActor();
        const std::string idStr = IdToString(req.id);

        AuditRecord record;
        record.action = Methods::CallTool;
        record.outcome = "failure";
        record.requestId = idStr;
        record.actor = caller;
        std::string toolName;
        JSONValue args{JSONValue::Object{}};
        std::optional<int> errorCode;

        ScopeGuard audit{[&]() {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            JSONValue::Object md;
            md["tool"] = MakeShared(JSONValue(sanitize::SanitizeName(toolName)));
            md["argumentKeys"] = MakeShared(argumentKeys(args));
            md["durationMs"] = MakeShared(JSONValue(static_cast<int64_t>(elapsed)));
            if (errorCode) md["errorCode"] = MakeShared(JSONValue(*errorCode));
            record.metadata = JSONValue(std::move(md));
            ctx.audit.Write(record);
        }};

        auto fail = [&](int code, const std::string& message, std::optional<JSONValue> data = std::nullopt) {
            errorCode = code;
            return failure(req.id, code, message, std::move(data));
        };

        if (!req.params || !req.params->isObject()) {
            return fail(JSONRPCErrorCodes::InvalidParams, "Missing or invalid tool name");
        }
        auto name = GetString(*req.params, "name");
        if (!name) {
            return fail(JSONRPCErrorCodes::InvalidParams, "Missing or invalid tool name");
        }
        toolName = *name;

        ToolPtr tool = ctx.tools.Find(toolName);
        if (!tool) {
            return fail(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + sanitize::SanitizeName(toolName));
        }

        if (const JSONValue* a = req.params->find("arguments")) {
            if (!a->isObject()) {
                return fail(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
            }
            args = *a;
        }

        if (auto err = validation::ValidateArguments(args, tool->inputSchema)) {
            return fail(JSONRPCErrorCodes::InvalidParams, *err);
        }

        const ToolPolicy& policy = tool->policy;
        if (policy.rateLimit) {
            const auto rl = ctx.rateLimiter.Check(tool->name, caller, *policy.rateLimit);
            if (!rl.allowed) {
                record.outcome = "denied";
                LOG_WARN("Rate limit exceeded for tool {} caller {}", tool->name, caller);
                return fail(JSONRPCErrorCodes::ToolExecutionError, "Rate limit exceeded",
                            MakeObject({{"resetTime", JSONValue(rl.resetTime)}}));
            }
        }
        if (policy.circuitBreaker && ctx.circuitBreaker.IsOpen(tool->name)) {
            record.outcome = "denied";
            LOG_WARN("Circuit open for tool {}", tool->name);
            return fail(JSONRPCErrorCodes::ToolExecutionError, "Circuit open");
        }

        CancellationScope scope(IsNullId(req.id) ? nullptr : &cancellations, idStr);
        const CancellationHandle& handle = *scope.Handle();

        JSONValue result;
        try {
            auto run = [&]() { return tool->executor(args, handle); };
            result = policy.retry ? ctx.retry.Execute(run, *policy.retry, handle.Token()) : run();
            if (policy.circuitBreaker) ctx.circuitBreaker.RecordSuccess(tool->name);
        } catch (const std::exception& e) {
            if (policy.circuitBreaker) ctx.circuitBreaker.RecordFailure(tool->name);
            if (handle.IsCancelled()) {
                record.outcome = "cancelled";
                return fail(JSONRPCErrorCodes::RequestCancelled, "Request cancelled");
            }
            LOG_ERROR("Tool {} failed: {}", tool->name, sanitize::SanitizeErrorMessage(e.what()));
            return fail(JSONRPCErrorCodes::ToolExecutionError, "Tool execution failed");
        } catch (...) {
            if (policy.circuitBreaker) ctx.circuitBreaker.RecordFailure(tool->name);
            if (handle.IsCancelled()) {
                record.outcome = "cancelled";
                return fail(JSONRPCErrorCodes::RequestCancelled, "Request cancelled");
            }
            LOG_ERROR("Tool {} failed with a non-standard exception", tool->name);
            return fail(JSONRPCErrorCodes::ToolExecutionError, "Tool execution failed");
        }

        if (handle.IsCancelled()) {
            record.outcome = "cancelled";
            return fail(JSONRPCErrorCodes::RequestCancelled, "Request cancelled");
        }

        record.outcome = "success";
        JSONValue::Array content;
        content.push_back(MakeShared(MakeObject({
            {"type", JSONValue("text")},
            {"text", JSONValue(sanitize::SanitizeToolResult(result, options.maxMessageSize))}
        })));
        JSONValue::Object out;
        out["content"] = MakeShared(JSONValue(std::move(content)));
        out["isError"] = MakeShared(JSONValue(false));
        return success(req.id, JSONValue(std::move(out)));
    }

    ////////////////////////////////////////// resources //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req) {
        return success(req.id, MakeObject({{"resources", ctx.resources.ListJSON()}}));
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req) {
        auto uri = GetString(paramsOf(req), "uri");
        if (!uri) {
            return failure(req.id, JSONRPCErrorCodes::InvalidParams, "Missing or invalid uri");
        }
        try {
            return success(req.id, ctx.resources.Read(*uri));
        } catch (const errors::ResourceNotFoundError&) {
            return failure(req.id, JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + sanitize::SanitizeUri(*uri));
        } catch (const std::exception& e) {
            LOG_ERROR("Resource provider failed for {}: {}", sanitize::SanitizeUri(*uri), e.what());
            return failure(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
        }
    }

    ////////////////////////////////////////// prompts //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handlePromptsList(const JSONRPCRequest& req) {
        return success(req.id, MakeObject({{"prompts", ctx.prompts.ListJSON()}}));
    }

    std::unique_ptr<JSONRPCResponse> handlePromptsGet(const JSONRPCRequest& req) {
        const JSONValue& params = paramsOf(req);
        auto name = GetString(params, "name");
        if (!name) {
            return failure(req.id, JSONRPCErrorCodes::InvalidParams, "Missing or invalid prompt name");
        }
        const JSONValue* args = params.find("arguments");
        if (args && !args->isObject() && !args->isNull()) {
            return failure(req.id, JSONRPCErrorCodes::InvalidParams, "Prompt arguments must be an object");
        }
        try {
            return success(req.id, ctx.prompts.Get(*name, args ? *args : emptyObject()));
        } catch (const errors::PromptNotFoundError&) {
            return failure(req.id, JSONRPCErrorCodes::PromptNotFound, "Prompt not found: " + sanitize::SanitizeName(*name));
        } catch (const errors::ValidationError& e) {
            return failure(req.id, JSONRPCErrorCodes::InvalidParams, e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Prompt provider failed for {}: {}", sanitize::SanitizeName(*name), e.what());
            return failure(req.id, JSONRPCErrorCodes::InternalError, "Internal error");
        }
    }

    ////////////////////////////////////////// notifications //////////////////////////////////////////
    void handleNotification(const JSONRPCNotification& n) {
        if (n.method == Methods::Cancelled) {
            const JSONValue& params = (n.params && n.params->isObject()) ? *n.params : emptyObject();
            const JSONValue* idVal = params.find("requestId");
            if (!idVal) idVal = params.find("id");
            std::optional<JSONRPCId> id;
            if (idVal) id = IdFromValue(*idVal);
            if (!id || IsNullId(*id)) {
                LOG_DEBUG("Ignoring cancellation without a usable request id");
                return;
            }
            const std::string key = IdToString(*id);
            if (cancellations.Cancel(key)) {
                LOG_INFO("Cancelled request {}", sanitize::SanitizeName(key));
            } else {
                LOG_DEBUG("Cancellation for unknown request {}", sanitize::SanitizeName(key));
            }
            return;
        }
        if (n.method == Methods::Initialized) {
            LOG_DEBUG("Client reported initialized");
            return;
        }
        LOG_DEBUG("Ignoring notification {}", sanitize::SanitizeName(n.method));
    }

    void wire(const std::function<void(ITransport::RequestHandler, ITransport::NotificationHandler,
                                       ITransport::ErrorHandler)>& set) {
        set([this](const JSONRPCRequest& req) { return dispatch(req); },
            [this](std::unique_ptr<JSONRPCNotification> n) {
                if (!n) return;
                try {
                    handleNotification(*n);
                } catch (const std::exception& e) {
                    LOG_ERROR("Notification handler exception: {}", e.what());
                }
            },
            [this](const std::string& err) {
                LOG_ERROR("Transport error: {}", err);
                if (errorHandler) {
                    errorHandler(err);
                }
            });
    }
};

Dispatcher::Dispatcher(DispatcherContext context, DispatcherOptions options)
    : pImpl(std::make_unique<Impl>(context, std::move(options))) {
    FUNC_SCOPE();
}

Dispatcher::~Dispatcher() {
    FUNC_SCOPE();
    if (pImpl->transport) {
        try {
            pImpl->transport->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Transport close failed: {}", e.what());
        }
    }
}

std::unique_ptr<JSONRPCResponse> Dispatcher::HandleRequest(const JSONRPCRequest& request) {
    return pImpl->dispatch(request);
}

void Dispatcher::HandleNotification(const JSONRPCNotification& notification) {
    pImpl->handleNotification(notification);
}

std::future<void> Dispatcher::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    pImpl->transport = std::move(transport);
    ITransport& t = *pImpl->transport;
    pImpl->wire([&t](ITransport::RequestHandler r, ITransport::NotificationHandler n, ITransport::ErrorHandler e) {
        t.SetRequestHandler(std::move(r));
        t.SetNotificationHandler(std::move(n));
        t.SetErrorHandler(std::move(e));
    });
    return t.Start();
}

std::future<void> Dispatcher::Stop() {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    auto fut = pImpl->transport->Close();
    return fut;
}

void Dispatcher::Attach(ITransportAcceptor& acceptor) {
    pImpl->wire([&acceptor](ITransport::RequestHandler r, ITransport::NotificationHandler n, ITransport::ErrorHandler e) {
        acceptor.SetRequestHandler(std::move(r));
        acceptor.SetNotificationHandler(std::move(n));
        acceptor.SetErrorHandler(std::move(e));
    });
}

void Dispatcher::SetErrorHandler(ITransport::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

bool Dispatcher::IsInitialized() const { return pImpl->initialized.load(); }

std::string Dispatcher::Actor() const { return pImpl->currentActor(); }

ServerCapabilities Dispatcher::Capabilities() const { return pImpl->capabilities(); }

CancellationRegistry& Dispatcher::Cancellations() { return pImpl->cancellations; }

} // namespace toolrpc
