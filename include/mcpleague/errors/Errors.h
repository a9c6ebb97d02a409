//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exception hierarchy for the client core plus JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcpleague/JSONRPCTypes.h"

namespace mcpleague {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpResourceNotFound,
    McpToolNotFound,
    Unknown
};

// Typed error representation of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = FindMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (code == nullptr || !message.has_value() || !std::holds_alternative<int64_t>(code->value)) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::move(*message);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

///////////////////////////////////////// Exception hierarchy ///////////////////////////////////////////
enum class ErrorKind {
    Transport,
    Timeout,
    Protocol,
    CircuitOpen,
    ToolNotFound,
    AmbiguousToolName,
    SessionClosed,
    SessionNotFound,
    ResourceNotFound,
    QueueFull,
    Cancelled
};

const char* ErrorKindToString(ErrorKind kind);

//==========================================================================================================
// Error
// Purpose: Root of every error the client core surfaces. Retryable errors are transient ("try again
//          later"); the rest will not succeed by repetition.
//==========================================================================================================
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, bool retryable, const std::string& message)
        : std::runtime_error(message), kind(kind), retryable(retryable) {}

    ErrorKind Kind() const noexcept { return kind; }
    bool IsRetryable() const noexcept { return retryable; }

private:
    ErrorKind kind;
    bool retryable;
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message) : Error(ErrorKind::Transport, true, message) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message) : Error(ErrorKind::Timeout, true, message) {}
};

//==========================================================================================================
// ProtocolError
// Purpose: Peer answered with a JSON-RPC error, or sent something the core cannot interpret.
//==========================================================================================================
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message)
        : Error(ErrorKind::Protocol, false, message) {}
    explicit ProtocolError(McpError err)
        : Error(ErrorKind::Protocol, false, err.message), mcpError(std::move(err)) {}

    int Code() const noexcept { return mcpError ? mcpError->code : 0; }
    ErrorCategory Category() const noexcept { return mcpError ? mcpError->category : ErrorCategory::Unknown; }
    const std::optional<McpError>& GetMcpError() const noexcept { return mcpError; }

private:
    std::optional<McpError> mcpError;
};

class CircuitOpenError : public Error {
public:
    explicit CircuitOpenError(const std::string& message) : Error(ErrorKind::CircuitOpen, false, message) {}
};

class ToolNotFoundError : public Error {
public:
    explicit ToolNotFoundError(const std::string& message) : Error(ErrorKind::ToolNotFound, false, message) {}
};

class AmbiguousToolNameError : public Error {
public:
    AmbiguousToolNameError(const std::string& name, std::vector<std::string> candidates);

    const std::vector<std::string>& Candidates() const noexcept { return candidates; }

private:
    std::vector<std::string> candidates;
};

class SessionClosedError : public Error {
public:
    explicit SessionClosedError(const std::string& message) : Error(ErrorKind::SessionClosed, false, message) {}
};

class SessionNotFoundError : public Error {
public:
    explicit SessionNotFoundError(const std::string& message) : Error(ErrorKind::SessionNotFound, false, message) {}
};

class ResourceNotFoundError : public Error {
public:
    explicit ResourceNotFoundError(const std::string& message) : Error(ErrorKind::ResourceNotFound, false, message) {}
};

class QueueFullError : public Error {
public:
    explicit QueueFullError(const std::string& message) : Error(ErrorKind::QueueFull, true, message) {}
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message) : Error(ErrorKind::Cancelled, false, message) {}
};

//==========================================================================================================
// IsRetryable
// Purpose: Classifies a captured exception. Anything outside the hierarchy is non-retryable.
//==========================================================================================================
bool IsRetryable(const std::exception_ptr& ep);

// Builds the exception a JSON-RPC error response maps to.
ProtocolError MakeProtocolError(const JSONRPCResponse& response);

//==========================================================================================================
// MakeFailedFuture
// Purpose: Already-ready future carrying the given exception so synchronous rejections share the
//          asynchronous error path.
//==========================================================================================================
template <typename T, typename E>
std::future<T> MakeFailedFuture(E&& error) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::forward<E>(error)));
    return promise.get_future();
}

// Same, for an exception already captured (keeps the dynamic type).
template <typename T>
std::future<T> MakeFailedFutureFromPtr(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}

} // namespace errors
} // namespace mcpleague
