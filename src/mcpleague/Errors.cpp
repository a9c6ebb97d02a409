//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Error classification helpers
//==========================================================================================================

#include "mcpleague/errors/Errors.h"

namespace mcpleague {
namespace errors {

namespace {
std::string describeAmbiguity(const std::string& name, const std::vector<std::string>& candidates) {
    std::string msg = "Ambiguous tool name '" + name + "' matches:";
    for (const auto& c : candidates) {
        msg += " " + c;
    }
    return msg;
}
} // namespace

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::CircuitOpen: return "CircuitOpenError";
        case ErrorKind::ToolNotFound: return "ToolNotFoundError";
        case ErrorKind::AmbiguousToolName: return "AmbiguousToolNameError";
        case ErrorKind::SessionClosed: return "SessionClosedError";
        case ErrorKind::SessionNotFound: return "SessionNotFoundError";
        case ErrorKind::ResourceNotFound: return "ResourceNotFoundError";
        case ErrorKind::QueueFull: return "QueueFullError";
        case ErrorKind::Cancelled: return "CancelledError";
    }
    return "Error";
}

AmbiguousToolNameError::AmbiguousToolNameError(const std::string& name, std::vector<std::string> candidates)
    : Error(ErrorKind::AmbiguousToolName, false, describeAmbiguity(name, candidates)),
      candidates(std::move(candidates)) {}

bool IsRetryable(const std::exception_ptr& ep) {
    if (!ep) {
        return false;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const Error& e) {
        return e.IsRetryable();
    } catch (const std::exception&) {
        return false;
    }
}

ProtocolError MakeProtocolError(const JSONRPCResponse& response) {
    auto err = mcpErrorFromResponse(response);
    if (err.has_value()) {
        return ProtocolError(std::move(*err));
    }
    return ProtocolError("Malformed JSON-RPC error object");
}

} // namespace errors
} // namespace mcpleague
