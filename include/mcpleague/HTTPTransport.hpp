//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>

#include "mcpleague/Transport.h"

namespace mcpleague {

//==========================================================================================================
// HTTPTransport
// Purpose: One POST per JSON-RPC message. Connectivity faults, timeouts, empty or unparsable bodies fail
//          the request future with errors::TransportError; a JSON-RPC error body is returned as a response.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for HTTP/HTTPS endpoints and TLS verification.
    // Fields:
    //   scheme: "http" or "https" (default: http)
    //   host/port: Server endpoint
    //   rpcPath: JSON-RPC request path
    //   notifyPath: Notification path; empty means rpcPath
    //   serverName: TLS SNI and hostname verification name (when https); defaults to host
    //   caFile/caPath: Optional CA bundle/path for trust store
    //   connectTimeoutMs/readTimeoutMs: Socket timeouts in milliseconds
    //   bearerToken: Opaque credential sent as "Authorization: Bearer <token>" when non-empty
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string host{"localhost"};
        std::string port{"80"};
        std::string rpcPath{"/mcp"};
        std::string notifyPath;
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string bearerToken;
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    //==========================================================================================================
    // ApplyUrl
    // Purpose: Fills scheme, host, port and rpcPath from "scheme://host[:port]/path".
    //==========================================================================================================
    static void ApplyUrl(const std::string& url, Options& opts);

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the I/O thread. Fails with TransportError when the HTTPS trust store could not be loaded.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the I/O loop; requests still in flight fail with TransportError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    // Plain request/response HTTP has no server push; the handler is kept for interface parity.
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPTransportFactory
// Purpose: Parses "url=...;readTimeoutMs=...;bearerToken=..." into Options. Malformed numbers throw
//          std::invalid_argument; unknown keys are logged and ignored.
//==========================================================================================================
class HTTPTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpleague
