//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpleague/JsonRpcMessageRouter.h"
#include "mcpleague/JSONRPCTypes.h"

namespace mcpleague {

namespace {

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind Classify(const std::string& json) override {
        try {
            return classifyDocument(ParseJSON(json));
        } catch (const std::exception& e) {
            LOG_DEBUG("Router: unparsable message: {}", e.what());
            return MessageKind::Unknown;
        }
    }

    std::optional<std::string> Route(const std::string& json, const RouterHandlers& handlers) override {
        MessageKind kind = Classify(json);
        switch (kind) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(json)) {
                    if (handlers.responseHandler) {
                        handlers.responseHandler(std::move(response));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(json)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                                    "No request handler installed");
                    return resp->Serialize();
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        return std::nullopt;
                    }
                    resp->id = request.id;
                    return resp->Serialize();
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what())->Serialize();
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(json)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }

private:
    static MessageKind classifyDocument(const JSONValue& doc) {
        if (!doc.IsObject()) {
            return MessageKind::Unknown;
        }
        if (FindMember(doc, "result") != nullptr || FindMember(doc, "error") != nullptr) {
            return MessageKind::Response;
        }
        if (GetStringMember(doc, "method").has_value()) {
            return FindMember(doc, "id") != nullptr ? MessageKind::Request : MessageKind::Notification;
        }
        return MessageKind::Unknown;
    }
};

} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcpleague
