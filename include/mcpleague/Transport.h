//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - one send/receive contract shared by HTTP, stream and in-memory
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace mcpleague {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: Moves serialized JSON-RPC messages to one remote agent. Transports never retry and never
//          interpret payloads; connectivity failures surface as errors::TransportError on the returned
//          future, while a well-formed JSON-RPC error response is delivered as a response.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Outstanding requests fail with TransportError.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Transport session identifier for diagnostics.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Request to send; its id is used for correlation.
    // Returns:
    //   Future resolving to the peer's response, or holding errors::TransportError.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been handed to the wire.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    // Callback for server-pushed notifications; invoked with ownership of the notification object.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Callback receiving asynchronous transport faults that are not tied to a request.
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcpleague/HTTPTransport.hpp
//  - mcpleague/StreamTransport.hpp
//  - mcpleague/InMemoryTransport.hpp

//==========================================================================================================
// ITransportFactory
// Purpose: Factory for creating transports from "key=value;" configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g., "url=http://127.0.0.1:8101/mcp").
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace mcpleague
