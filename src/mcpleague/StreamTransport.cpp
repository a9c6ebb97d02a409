//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpleague/StreamTransport.cpp
// Purpose: Newline-delimited JSON-RPC transport over file descriptors (poll + eventfd reader, queued writer)
//==========================================================================================================

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcpleague/Config.h"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/JsonRpcMessageRouter.h"
#include "mcpleague/StreamTransport.hpp"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

namespace {

std::size_t parseSize(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(val, &used);
        if (used != val.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::size_t>(v);
    } catch (const std::exception&) {
        throw std::invalid_argument("Stream transport: invalid value '" + val + "' for " + key);
    }
}

int parseFd(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(val, &used);
        if (used != val.size() || v < 0) {
            throw std::invalid_argument("bad descriptor");
        }
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument("Stream transport: invalid descriptor '" + val + "' for " + key);
    }
}

} // namespace

class StreamTransport::Impl {
public:
    StreamTransport::Options opts;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> stopping{false};
    int wakeEventFd{-1};

    std::thread readerThread;
    std::thread writerThread;

    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};

    std::mutex handlerMutex;
    StreamTransport::NotificationHandler notificationHandler;
    StreamTransport::ErrorHandler errorHandler;

    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::atomic<uint64_t> requestCounter{0};

    std::unique_ptr<IJsonRpcMessageRouter> router;

    explicit Impl(const StreamTransport::Options& o) : opts(o), router(MakeDefaultJsonRpcMessageRouter()) {
        sessionId = "stream-" + std::to_string(opts.readFd) + "-" + std::to_string(opts.writeFd);
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StreamTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StreamTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void reportError(const std::string& msg) {
        StreamTransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    void failPending(const std::string& reason) {
        std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pending;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            pending.swap(pendingRequests);
        }
        for (auto& [id, p] : pending) {
            p.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
        }
    }

    // Terminal fault seen by either thread; the first report wins.
    void fault(const std::string& reason) {
        if (!connected.exchange(false)) {
            return;
        }
        LOG_ERROR("StreamTransport {}: {}", sessionId, reason);
        stopping.store(true);
        wake();
        cvWrite.notify_all();
        failPending(reason);
        reportError(reason);
    }

    bool enqueueLine(std::string payload) {
        payload.push_back('\n');
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + payload.size() > opts.writeQueueMaxBytes) {
                LOG_ERROR("StreamTransport: write queue overflow (queued={} add={} max={})", queuedBytes, payload.size(), opts.writeQueueMaxBytes);
                return false;
            }
            queuedBytes += payload.size();
            writeQueue.emplace_back(std::move(payload));
        }
        cvWrite.notify_one();
        return true;
    }

    ////////////////////////////////////////// Reader //////////////////////////////////////////

    void deliverResponse(JSONRPCResponse&& response) {
        const std::string key = JSONRPCIdToString(response.id);
        std::promise<std::unique_ptr<JSONRPCResponse>> deliverPromise;
        bool havePromise = false;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            auto it = pendingRequests.find(key);
            if (it != pendingRequests.end()) {
                deliverPromise = std::move(it->second);
                pendingRequests.erase(it);
                havePromise = true;
            }
        }
        if (!havePromise) {
            LOG_WARN("StreamTransport: response for unknown id {}", key);
            return;
        }
        deliverPromise.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
    }

    void handleLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            return;
        }
        RouterHandlers handlers;
        handlers.responseHandler = [this](JSONRPCResponse&& r) { deliverResponse(std::move(r)); };
        handlers.notificationHandler = [this](std::unique_ptr<JSONRPCNotification> n) {
            StreamTransport::NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                handler = notificationHandler;
            }
            if (handler) {
                handler(std::move(n));
            } else {
                LOG_DEBUG("StreamTransport: dropping notification {} (no handler)", n->method);
            }
        };
        handlers.errorHandler = [this](const std::string& err) { reportError(err); };
        // The client serves no methods; the router answers inbound requests with MethodNotFound.
        if (auto reply = router->Route(line, handlers)) {
            if (!enqueueLine(std::move(*reply))) {
                reportError("StreamTransport: write queue full, reply dropped");
            }
        }
    }

    void consume(std::string& buffer, bool& discarding, const char* data, std::size_t n) {
        buffer.append(data, n);
        std::size_t start = 0;
        while (true) {
            const std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            std::string line = buffer.substr(start, nl - start);
            start = nl + 1;
            if (discarding) {
                discarding = false;
                continue;
            }
            if (line.size() > opts.maxLineBytes) {
                LOG_WARN("StreamTransport: dropped line of {} bytes (max {})", line.size(), opts.maxLineBytes);
                reportError("StreamTransport: line exceeds maxLineBytes");
                continue;
            }
            handleLine(std::move(line));
        }
        buffer.erase(0, start);
        if (!discarding && buffer.size() > opts.maxLineBytes) {
            LOG_WARN("StreamTransport: discarding oversized line (>{} bytes)", opts.maxLineBytes);
            reportError("StreamTransport: line exceeds maxLineBytes");
            discarding = true;
        }
        if (discarding) {
            buffer.clear();
        }
    }

    void readerLoop() {
        std::string buffer;
        bool discarding = false;
        std::array<char, 8192> chunk{};
        std::string exitReason;
        while (!stopping.load()) {
            struct pollfd pfds[2];
            pfds[0].fd = opts.readFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
            const int rc = ::poll(pfds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                exitReason = std::string("StreamTransport: poll failed: ") + ::strerror(errno);
                break;
            }
            if (pfds[1].revents & POLLIN) {
                uint64_t v = 0;
                ssize_t r;
                do {
                    r = ::read(wakeEventFd, &v, sizeof(v));
                } while (r < 0 && errno == EINTR);
                if (stopping.load()) {
                    break;
                }
            }
            if (pfds[0].revents & POLLNVAL) {
                exitReason = "StreamTransport: invalid read descriptor";
                break;
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                const ssize_t n = ::read(opts.readFd, chunk.data(), chunk.size());
                if (n > 0) {
                    consume(buffer, discarding, chunk.data(), static_cast<std::size_t>(n));
                } else if (n == 0) {
                    exitReason = "StreamTransport: EOF on stream";
                    break;
                } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    exitReason = std::string("StreamTransport: read error: ") + ::strerror(errno);
                    break;
                }
            }
        }
        if (!exitReason.empty()) {
            fault(exitReason);
        }
    }

    ////////////////////////////////////////// Writer //////////////////////////////////////////

    bool writeAll(const std::string& frame) {
        std::size_t total = 0;
        while (total < frame.size()) {
            if (stopping.load()) {
                return true;
            }
            const ssize_t w = ::write(opts.writeFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd pfd;
                pfd.fd = opts.writeFd; pfd.events = POLLOUT; pfd.revents = 0;
                (void)::poll(&pfd, 1, 100);
                continue;
            }
            LOG_ERROR("StreamTransport: write error (errno={} msg={})", errno, ::strerror(errno));
            return false;
        }
        return true;
    }

    void writerLoop() {
        while (true) {
            std::string frame;
            {
                std::unique_lock<std::mutex> lk(writeMutex);
                cvWrite.wait(lk, [&]{ return stopping.load() || !writeQueue.empty(); });
                if (stopping.load()) {
                    break;
                }
                frame = std::move(writeQueue.front());
                writeQueue.pop_front();
            }
            const bool ok = writeAll(frame);
            {
                std::lock_guard<std::mutex> lk(writeMutex);
                queuedBytes = queuedBytes >= frame.size() ? queuedBytes - frame.size() : 0;
            }
            if (!ok) {
                fault("StreamTransport: write error");
                break;
            }
        }
    }
};

StreamTransport::StreamTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

StreamTransport::~StreamTransport() {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        Close().get();
    }
}

std::future<void> StreamTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->wakeEventFd < 0) {
        return errors::MakeFailedFuture<void>(errors::TransportError("StreamTransport: no wake-up eventfd"));
    }
    if (pImpl->opts.readFd < 0 || pImpl->opts.writeFd < 0) {
        return errors::MakeFailedFuture<void>(errors::TransportError("StreamTransport: invalid descriptors"));
    }
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->started.exchange(true)) {
        ready.set_value();
        return fut;
    }
    const int flags = ::fcntl(pImpl->opts.writeFd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(pImpl->opts.writeFd, F_SETFL, flags | O_NONBLOCK);
    }
    pImpl->connected.store(true);
    Impl* impl = pImpl.get();
    pImpl->readerThread = std::thread([impl]() { impl->readerLoop(); });
    pImpl->writerThread = std::thread([impl]() { impl->writerLoop(); });
    LOG_INFO("StreamTransport {} started (readFd={} writeFd={})", pImpl->sessionId, pImpl->opts.readFd, pImpl->opts.writeFd);
    ready.set_value();
    return fut;
}

std::future<void> StreamTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    pImpl->connected.store(false);
    pImpl->stopping.store(true);
    pImpl->wake();
    pImpl->cvWrite.notify_all();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    if (pImpl->writerThread.joinable()) {
        pImpl->writerThread.join();
    }
    pImpl->failPending("StreamTransport closed");
    done.set_value();
    return fut;
}

bool StreamTransport::IsConnected() const {
    FUNC_SCOPE(); return pImpl->connected.load();
}

std::string StreamTransport::GetSessionId() const {
    FUNC_SCOPE(); return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> StreamTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    if (!request) {
        return errors::MakeFailedFuture<std::unique_ptr<JSONRPCResponse>>(std::invalid_argument("null request"));
    }
    if (!pImpl->connected.load()) {
        return errors::MakeFailedFuture<std::unique_ptr<JSONRPCResponse>>(
            errors::TransportError("StreamTransport not connected"));
    }
    if (std::holds_alternative<std::nullptr_t>(request->id)) {
        request->id = "stream-req-" + std::to_string(++pImpl->requestCounter);
    }
    const std::string key = JSONRPCIdToString(request->id);

    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        if (pImpl->pendingRequests.count(key) != 0) {
            return errors::MakeFailedFuture<std::unique_ptr<JSONRPCResponse>>(
                std::invalid_argument("Duplicate request id " + key));
        }
        pImpl->pendingRequests.emplace(key, std::move(promise));
    }
    if (!pImpl->enqueueLine(request->Serialize())) {
        std::promise<std::unique_ptr<JSONRPCResponse>> p;
        bool found = false;
        {
            std::lock_guard<std::mutex> lk(pImpl->requestMutex);
            auto it = pImpl->pendingRequests.find(key);
            if (it != pImpl->pendingRequests.end()) {
                p = std::move(it->second);
                pImpl->pendingRequests.erase(it);
                found = true;
            }
        }
        if (found) {
            p.set_exception(std::make_exception_ptr(errors::TransportError("StreamTransport: write queue full")));
        }
    }
    // A fault between the connected check and the insert would leave the entry behind.
    if (!pImpl->connected.load()) {
        pImpl->failPending("StreamTransport not connected");
    }
    return fut;
}

std::future<void> StreamTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!notification) {
        return errors::MakeFailedFuture<void>(std::invalid_argument("null notification"));
    }
    if (!pImpl->connected.load()) {
        return errors::MakeFailedFuture<void>(errors::TransportError("StreamTransport not connected"));
    }
    if (!pImpl->enqueueLine(notification->Serialize())) {
        return errors::MakeFailedFuture<void>(errors::TransportError("StreamTransport: write queue full"));
    }
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void StreamTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void StreamTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<ITransport> StreamTransportFactory::CreateTransport(const std::string& config) {
    StreamTransport::Options opts;
    for (const auto& [key, val] : ParseKeyValueConfig(config)) {
        if (key == "readFd") {
            opts.readFd = parseFd(key, val);
        } else if (key == "writeFd") {
            opts.writeFd = parseFd(key, val);
        } else if (key == "maxLineBytes") {
            opts.maxLineBytes = parseSize(key, val);
        } else if (key == "writeQueueMaxBytes") {
            opts.writeQueueMaxBytes = parseSize(key, val);
        } else {
            LOG_WARN("Stream transport: ignoring unknown key '{}'", key);
        }
    }
    return std::make_unique<StreamTransport>(opts);
}

} // namespace mcpleague
