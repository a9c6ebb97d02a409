//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a pair of file descriptors (stdio by default)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <string>

#include "mcpleague/Transport.h"

namespace mcpleague {

//==========================================================================================================
// StreamTransport
// Purpose: One JSON document per '\n'-terminated line. A reader thread polls readFd together with an
//          eventfd used for wake-up; a writer thread drains a bounded queue into writeFd. The descriptors
//          are borrowed and never closed by the transport.
//==========================================================================================================
class StreamTransport : public ITransport {
public:
    struct Options {
        int readFd{0};
        int writeFd{1};
        // Longer lines are dropped and reported through the error handler.
        std::size_t maxLineBytes{1024 * 1024};
        // Sends are rejected with TransportError once this many bytes are waiting to be written.
        std::size_t writeQueueMaxBytes{2 * 1024 * 1024};
    };

    explicit StreamTransport(const Options& opts);
    ~StreamTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops both threads. Pending requests fail with TransportError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Queues the request line. The future resolves when a response with the same id is read, or fails
    // with TransportError on EOF, I/O error, queue overflow or Close.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamTransportFactory
// Purpose: Keys: readFd, writeFd, maxLineBytes, writeQueueMaxBytes. Malformed numbers throw
//          std::invalid_argument.
//==========================================================================================================
class StreamTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpleague
