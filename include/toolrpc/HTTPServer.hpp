//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <future>
#include <functional>
#include <memory>
#include "toolrpc/Protocol.h"
#include "toolrpc/Transport.h"

namespace toolrpc {

  class HTTPServer : public ITransportAcceptor {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, JSON-RPC path, and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see LocalPort)
    //   rpcPath: Path accepting one JSON-RPC message per POST
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   maxBodyBytes: Request bodies above this size are rejected by the parser
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"9443"};
        std::string rpcPath{"/rpc"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{DEFAULT_MAX_MESSAGE_SIZE};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer() override;

    //==========================================================================================================
    // Binds and listens on the calling thread, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; it carries the exception when binding fails.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetRequestHandler(ITransport::RequestHandler handler) override;
    void SetNotificationHandler(ITransport::NotificationHandler handler) override;
    void SetErrorHandler(ITransport::ErrorHandler handler) override;

    // Port actually bound; 0 before Start().
    std::uint16_t LocalPort() const;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Creates HTTP/HTTPS acceptors from a URI-style configuration string:
  //            - "http://<address>:<port>[/path]" (e.g., http://127.0.0.1:0/rpc)
  //            - "https://<address>:<port>[/path]?cert=<pem>&key=<pem>"
  //          Unknown query parameters are ignored. If scheme is omitted, defaults to http.
  //==========================================================================================================
  class HTTPServerFactory : public ITransportAcceptorFactory {
  public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;
  };

} // namespace toolrpc
