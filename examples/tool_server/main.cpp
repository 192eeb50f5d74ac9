//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolrpc server executable (stdio or HTTP)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolrpc/AuditLog.h"
#include "toolrpc/BatchExecutor.h"
#include "toolrpc/Cancellation.h"
#include "toolrpc/CatalogLoader.h"
#include "toolrpc/Config.h"
#include "toolrpc/Dispatcher.h"
#include "toolrpc/HTTPServer.hpp"
#include "toolrpc/PromptRegistry.h"
#include "toolrpc/ResourceRegistry.h"
#include "toolrpc/StdioTransport.hpp"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/resilience/CircuitBreaker.h"
#include "toolrpc/resilience/RateLimiter.h"
#include "toolrpc/resilience/Retry.h"
#include "toolrpc/version.h"

using namespace toolrpc;

namespace {

std::atomic<bool> gSignalled{false};

extern "C" void onSignal(int) { gSignalled.store(true); }

//==========================================================================================================
// SignalScope
// Purpose: Installs SIGINT/SIGTERM handlers once and restores the previous handlers exactly once.
//==========================================================================================================
class SignalScope {
public:
    SignalScope() {
        struct sigaction sa{};
        sa.sa_handler = onSignal;
        sigemptyset(&sa.sa_mask);
        installed = (::sigaction(SIGINT, &sa, &prevInt) == 0);
        installed = (::sigaction(SIGTERM, &sa, &prevTerm) == 0) && installed;
        if (!installed) {
            LOG_WARN("Failed to install signal handlers (errno={})", errno);
        }
    }
    ~SignalScope() { Restore(); }
    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

    void Restore() {
        if (restored.exchange(true)) {
            return;
        }
        (void)::sigaction(SIGINT, &prevInt, nullptr);
        (void)::sigaction(SIGTERM, &prevTerm, nullptr);
    }

private:
    struct sigaction prevInt{};
    struct sigaction prevTerm{};
    bool installed{false};
    std::atomic<bool> restored{false};
};

// Parses --key=value command-line options.
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        const std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

JSONValue textResult(const std::string& s) { return JSONValue{s}; }

void registerBuiltinTools(ToolRegistry& tools, const ServerConfig& config) {
    tools.Register(Tool{
        "echo", "Echo a message back to the caller",
        SchemaBuilder().Property("message", PropertyType::String, "Text to echo", true).Build(),
        [](const JSONValue& args, const CancellationHandle&) {
            return textResult(GetString(args, "message").value_or(""));
        },
        std::nullopt, ToolPolicy{}});

    Tool add{
        "add", "Add two numbers",
        SchemaBuilder()
            .Property("a", PropertyType::Number, "First addend", true)
            .Property("b", PropertyType::Number, "Second addend", true)
            .Build(),
        [](const JSONValue& args, const CancellationHandle&) {
            auto num = [&](const char* k) {
                const JSONValue* v = args.find(k);
                if (v->isInteger()) return static_cast<double>(std::get<int64_t>(v->value));
                return std::get<double>(v->value);
            };
            return JSONValue{num("a") + num("b")};
        },
        std::nullopt, ToolPolicy{}};
    add.policy.rateLimit = resilience::RateLimitConfig{600, "1m"};
    tools.Register(std::move(add));

    // Cooperative: polls the handle between 10 ms slices.
    Tool sleeper{
        "sleep", "Wait for the given number of milliseconds",
        SchemaBuilder().Property("ms", PropertyType::Integer, "Duration in milliseconds", true).Build(),
        [](const JSONValue& args, const CancellationHandle& cancel) {
            const int64_t ms = GetInteger(args, "ms").value_or(0);
            const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
            while (std::chrono::steady_clock::now() < until && !cancel.IsCancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return JSONValue{MakeObject({{"sleptMs", JSONValue{ms}}, {"cancelled", JSONValue{cancel.IsCancelled()}}})};
        },
        std::nullopt, ToolPolicy{}};
    sleeper.policy.circuitBreaker = true;
    tools.Register(std::move(sleeper));

    BatchOptions batchOpts;
    batchOpts.concurrency = config.batchConcurrency;
    batchOpts.maxBatchSize = config.batchMaxSize;
    JSONValue batchSchema = MakeObject({
        {"type", JSONValue{"object"}},
        {"properties", MakeObject({
            {"calls", MakeObject({
                {"type", JSONValue{"array"}},
                {"description", JSONValue{"List of {tool, args} entries"}}})}})},
        {"required", MakeArray({JSONValue{"calls"}})}});
    tools.Register("batch", "Run several tool calls with bounded concurrency", batchSchema,
        [&tools, batchOpts](const JSONValue& args, const CancellationHandle& cancel) {
            std::vector<BatchRequest> requests;
            const JSONValue* calls = args.find("calls");
            for (const auto& item : std::get<JSONValue::Array>(calls->value)) {
                BatchRequest r;
                if (item && item->isObject()) {
                    r.tool = GetString(*item, "tool").value_or("");
                    if (const JSONValue* a = item->find("args"); a && a->isObject()) {
                        r.args = *a;
                    }
                }
                requests.push_back(std::move(r));
            }
            const auto results = BatchExecutor(tools).Execute(requests, batchOpts, &cancel,
                [](const ProgressUpdate& p) { LOG_DEBUG("batch progress {:.2f}: {}", p.progress, p.message); });
            JSONValue::Array out;
            for (const auto& r : results) {
                out.push_back(MakeShared(r.ToJSON()));
            }
            return JSONValue{MakeObject({{"results", JSONValue{std::move(out)}}})};
        });
}

void registerBuiltinResources(ResourceRegistry& resources, const ServerConfig& config) {
    Resource info;
    info.uri = "toolrpc://server/info";
    info.name = "Server information";
    info.description = "Name and version of this server";
    info.mimeType = "application/json";
    const std::string name = config.serverName;
    const std::string version = config.EffectiveServerVersion();
    info.provider = [name, version](const std::string&) {
        return ResourceContent::Text(SerializeJSON(MakeObject({
            {"name", JSONValue{name}},
            {"version", JSONValue{version}},
            {"library", JSONValue{getVersionString()}}})), "application/json");
    };
    resources.Register(std::move(info));
}

void registerBuiltinPrompts(PromptRegistry& prompts) {
    Prompt p;
    p.name = "summarize";
    p.description = "Ask for a short summary of a text";
    p.arguments.push_back(PromptArgument{"text", std::string("Text to summarize"), true});
    p.arguments.push_back(PromptArgument{"style", std::string("Optional tone, e.g. formal"), false});
    p.provider = [](const JSONValue& args) {
        std::string instruction = "Summarize the following text";
        if (auto style = GetString(args, "style")) {
            instruction += " in a " + *style + " style";
        }
        return std::vector<PromptMessage>{
            PromptMessage::Text("user", instruction + ":\n\n" + GetString(args, "text").value_or(""))};
    };
    prompts.Register(std::move(p));
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();

    // 1. Config
    ServerConfig config;
    try {
        config = ServerConfig::FromEnvironment();
        if (auto v = getArgValue(argc, argv, "--config")) {
            config.ApplyConfigString(*v);
        }
        if (auto v = getArgValue(argc, argv, "--transport")) {
            config.Set("transport", *v);
        }
        if (auto v = getArgValue(argc, argv, "--catalog")) {
            config.Set("catalog", *v);
        }
        config.Validate();
    } catch (const errors::ConfigurationError& e) {
        Logger::log("ERROR", std::string("Configuration error: ") + e.what(), __FILE__, __LINE__);
        return 2;
    }

    // 2. Logger
    config.ApplyLogging();
    LOG_INFO("{} {} starting (library {})", config.serverName, config.EffectiveServerVersion(), getVersionString());

    // 3. Registries
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    try {
        registerBuiltinTools(tools, config);
        registerBuiltinResources(resources, config);
        registerBuiltinPrompts(prompts);
        if (!config.catalogPath.empty()) {
            const auto names = LoadCatalogFile(config.catalogPath, tools);
            LOG_INFO("Loaded {} catalog tools from {}", names.size(), config.catalogPath);
        }
    } catch (const errors::ConfigurationError& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
    }

    // 4. Resilience tables
    resilience::RateLimiter rateLimiter;
    resilience::CircuitBreaker circuitBreaker;
    resilience::Retry retry;
    AuditLog audit;

    // 5. Dispatcher
    DispatcherOptions dopts;
    dopts.serverInfo = Implementation{config.serverName, config.EffectiveServerVersion()};
    dopts.maxMessageSize = config.maxMessageBytes;
    dopts.cancellationCapacity = config.cancellationCapacity;
    Dispatcher dispatcher(DispatcherContext{tools, resources, prompts, rateLimiter, circuitBreaker, retry, audit}, dopts);

    // 6. Transport
    SignalScope signals;
    std::promise<void> stopped;
    std::atomic<bool> stopSignalled{false};
    auto signalStop = [&stopped, &stopSignalled](const std::string& reason) {
        if (stopSignalled.exchange(true)) {
            return;
        }
        LOG_INFO("Server stopping: {}", reason);
        stopped.set_value();
    };
    auto waitForStop = [&stopped, &signalStop]() {
        auto fut = stopped.get_future();
        while (fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (gSignalled.load()) {
                signalStop("signal");
            }
        }
    };

    if (config.transport == "stdio") {
        StdioTransportOptions sopts;
        sopts.framing = config.framing;
        sopts.maxMessageBytes = config.maxMessageBytes;
        sopts.frameTimeout = std::chrono::milliseconds(config.frameTimeoutMs);
        dispatcher.SetErrorHandler([&signalStop](const std::string& err) { signalStop(err); });
        dispatcher.Start(std::make_unique<StdioTransport>(sopts)).get();
        waitForStop();
        dispatcher.Stop().get();
    } else {
        HTTPServerFactory hf;
        std::unique_ptr<ITransportAcceptor> acceptor;
        try {
            acceptor = hf.CreateTransportAcceptor(config.transport);
        } catch (const errors::ConfigurationError& e) {
            LOG_ERROR("Cannot create HTTP listener: {}", e.what());
            return 1;
        }
        dispatcher.Attach(*acceptor);
        try {
            acceptor->Start().get();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTP listener failed to start: {}", e.what());
            return 1;
        }
        waitForStop();
        acceptor->Stop().get();
    }

    signals.Restore();
    LOG_INFO("Server stopped");
    return 0;
}
