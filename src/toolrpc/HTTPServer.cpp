//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolrpc/HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "toolrpc/HTTPServer.hpp"
#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/JsonRpcMessageRouter.h"
#include "toolrpc/errors/Errors.h"

#include <openssl/ssl.h>

namespace toolrpc {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> localPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o)
        : opts(o), router(MakeDefaultJsonRpcMessageRouter(o.maxBodyBytes)) {
        if (opts.scheme == "https") {
            if (opts.certFile.empty() || opts.keyFile.empty()) {
                throw errors::ConfigurationError("HTTPS requires both cert and key PEM files");
            }
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw errors::ConfigurationError(std::string("Failed to load TLS certificate/key: ") + e.what());
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw errors::ConfigurationError("Unsupported HTTP scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
            return;
        }
        setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        auto res = makeResponse(parser.get());
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionError("TLS", e);
        }
        co_return;
    }

    static http::response<http::string_body> jsonResponse(http::status status, unsigned version, std::string body) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        const std::string target = std::string(req.target());
        if (target != opts.rpcPath) {
            return jsonResponse(http::status::not_found, req.version(), "{\"error\":\"Not found\"}");
        }
        if (req.method() != http::verb::post) {
            return jsonResponse(http::status::method_not_allowed, req.version(), "{\"error\":\"POST required\"}");
        }

        auto msg = router->parse(req.body());
        switch (msg.kind) {
            case IJsonRpcMessageRouter::MessageKind::Request:
                return jsonResponse(http::status::ok, req.version(), router->handleRequest(*msg.request, requestHandler));
            case IJsonRpcMessageRouter::MessageKind::Notification:
                if (notificationHandler) {
                    try {
                        notificationHandler(std::move(msg.notification));
                    } catch (const std::exception& e) {
                        setError(std::string("Notification handler error: ") + e.what());
                    }
                }
                return jsonResponse(http::status::ok, req.version(), "{}");
            case IJsonRpcMessageRouter::MessageKind::Invalid:
                if (msg.errorReply) {
                    return jsonResponse(http::status::ok, req.version(), *msg.errorReply);
                }
                return jsonResponse(http::status::bad_request, req.version(),
                                    CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize());
            case IJsonRpcMessageRouter::MessageKind::Response:
                return jsonResponse(http::status::bad_request, req.version(),
                                    CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize());
            case IJsonRpcMessageRouter::MessageKind::Unparsable:
            default:
                LOG_DEBUG("HTTPServer: unparsable body ({} bytes)", req.body().size());
                return jsonResponse(http::status::bad_request, req.version(),
                                    CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize());
        }
    }

    void bindAndListen() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw errors::ConfigurationError("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::ConfigurationError("HTTPServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        localPort.store(acceptor->local_endpoint().port());
        LOG_INFO("HTTPServer listening on {}://{}:{}{}", opts.scheme, opts.address, localPort.load(), opts.rpcPath);
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
#ifdef _DEBUG
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
#endif
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bindAndListen();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->setError(std::string("HTTPServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: I/O loop terminated: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
        if (ec) {
            LOG_DEBUG("HTTPServer: acceptor close: {}", ec.message());
        }
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void HTTPServer::SetRequestHandler(ITransport::RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetNotificationHandler(ITransport::NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::uint16_t HTTPServer::LocalPort() const { return pImpl->localPort.load(); }

const HTTPServer::Options& HTTPServer::GetOptions() const { return pImpl->opts; }

std::unique_ptr<ITransportAcceptor> HTTPServerFactory::CreateTransportAcceptor(const std::string& config) {
    HTTPServer::Options opts;

    std::string cfg = config;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        const std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            opts.rpcPath = path;
        }
    }
    trim(hostPort);

    // host[:port], IPv6 as [addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "9443";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") {
                opts.certFile = val;
            } else if (key == "key") {
                opts.keyFile = val;
            } else {
                LOG_DEBUG("HTTPServerFactory: ignoring query parameter {}", key);
            }
        }
    }

    return std::make_unique<HTTPServer>(opts);
}

} // namespace toolrpc
