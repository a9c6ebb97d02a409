//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and dispatch of inbound JSON-RPC messages for stream-style transports
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpleague/Transport.h"
#include "mcpleague/JSONRPCTypes.h"

namespace mcpleague {

// Peer-side request handler. Returning nullptr means "send no reply".
using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

//========================================================================================================
// RouterHandlers
// Purpose: Targets for each message kind. Any handler may be empty; the message is then dropped.
//========================================================================================================
struct RouterHandlers {
    RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
    std::function<void(JSONRPCResponse&&)> responseHandler;
};

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message by its top-level members without invoking handlers.
    virtual MessageKind Classify(const std::string& json) = 0;

    //====================================================================================================
    // Route
    // Purpose: Classifies and delivers one message. Requests are answered synchronously through the
    //          request handler and the serialized reply is returned; all other kinds return std::nullopt.
    //====================================================================================================
    virtual std::optional<std::string> Route(const std::string& json, const RouterHandlers& handlers) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcpleague
