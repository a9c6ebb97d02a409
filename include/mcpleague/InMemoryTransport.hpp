//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "mcpleague/Transport.h"
#include "mcpleague/JsonRpcMessageRouter.h"
#include <memory>
#include <utility>

namespace mcpleague {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport. Two paired instances deliver messages to each other without I/O. The
//          peer side may install a request handler and so act as a fake remote agent.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the transport. Pending requests fail with TransportError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Sends a JSON-RPC request to the paired transport. Fails with TransportError when the peer is gone.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestHandler
    // Purpose: Serves requests arriving from the peer. Each request runs on its own thread; a handler
    //          returning nullptr sends no reply, which simulates a silent server.
    //==========================================================================================================
    void SetRequestHandler(RequestHandler handler);

    //==========================================================================================================
    // SendNotificationToPeer
    // Purpose: Convenience for fake servers pushing notifications (resource updates, list changes).
    //==========================================================================================================
    bool SendNotificationToPeer(const JSONRPCNotification& notification);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpleague
