//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: Per-session dispatch, circuit breaking, retry/backoff, deadlines and heartbeat
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "mcpleague/ConnectionManager.h"
#include "mcpleague/Protocol.h"
#include "mcpleague/RetryPolicy.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

namespace {

constexpr auto kDequeuePoll = std::chrono::milliseconds(50);
constexpr auto kMaintenancePeriod = std::chrono::milliseconds(20);
constexpr auto kResponsePoll = std::chrono::milliseconds(25);

//==========================================================================================================
// PendingRequest
// Purpose: One submitted call. It lives in the pending map until settled; whoever removes it from the
//          map owns the right to fulfil the promise, which makes resolution exactly-once.
//==========================================================================================================
struct PendingRequest {
    std::string correlationId;
    std::string method;
    std::optional<JSONValue> params;
    Priority priority{Priority::Normal};
    std::chrono::steady_clock::time_point deadline;
    bool allowRetry{true};
    unsigned int attempt{0};
    std::promise<JSONValue> promise;
    std::atomic<bool> inFlight{false};
    std::optional<std::stop_callback<std::function<void()>>> cancelCallback;
};

} // namespace

class ConnectionManager::Impl {
public:
    Impl(std::string name, std::unique_ptr<ITransport> t, const ClientConfig& cfg, Clock clock)
        : serverName(std::move(name)),
          transport(std::move(t)),
          config(cfg),
          breaker(cfg.circuitBreaker, std::move(clock)),
          retryPolicy(cfg.retry),
          outbound(cfg.queueMaxSize),
          inbound(cfg.queueMaxSize) {}

    std::string serverName;
    std::unique_ptr<ITransport> transport;
    ClientConfig config;
    CircuitBreaker breaker;
    RetryPolicy retryPolicy;
    PriorityMessageQueue outbound;
    PriorityMessageQueue inbound;

    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<uint64_t> correlationCounter{0};

    mutable std::mutex pendingMutex;
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending;

    mutable std::mutex handlerMutex;
    NotificationSink notificationSink;
    GiveUpHandler giveUpHandler;
    HeartbeatHandler heartbeatHandler;

    mutable std::mutex statsMutex;
    ConnectionStats stats;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeatAt;
    unsigned int heartbeatMisses{0};
    std::atomic<bool> degraded{false};
    bool gaveUp{false};

    // Retries waiting out their backoff, keyed by the time they may be dispatched again. Workers never
    // sleep, so a backoff cannot hold up queued heartbeats.
    std::mutex retryMutex;
    std::multimap<std::chrono::steady_clock::time_point, std::string> retryDue;

    // Interruptible sleeps (maintenance period, heartbeat interval).
    std::mutex sleepMutex;
    std::condition_variable_any sleepCv;

    std::vector<std::jthread> workers;
    std::jthread maintenanceThread;
    std::jthread routerThread;
    std::jthread heartbeatThread;

    ////////////////////////////////////////// Pending bookkeeping //////////////////////////////////////////
    std::shared_ptr<PendingRequest> take(const std::string& correlationId) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(correlationId);
        if (it == pending.end()) {
            return nullptr;
        }
        auto req = it->second;
        pending.erase(it);
        return req;
    }

    bool isPending(const std::string& correlationId) const {
        std::lock_guard<std::mutex> lock(pendingMutex);
        return pending.find(correlationId) != pending.end();
    }

    template <typename E>
    bool fail(const std::string& correlationId, E&& error) {
        auto req = take(correlationId);
        if (!req) {
            return false;
        }
        req->promise.set_exception(std::make_exception_ptr(std::forward<E>(error)));
        return true;
    }

    bool failWith(const std::string& correlationId, const std::exception_ptr& error) {
        auto req = take(correlationId);
        if (!req) {
            return false;
        }
        req->promise.set_exception(error);
        return true;
    }

    bool succeed(const std::string& correlationId, JSONValue value) {
        auto req = take(correlationId);
        if (!req) {
            return false;
        }
        req->promise.set_value(std::move(value));
        return true;
    }

    void noteError(const std::string& message) {
        std::lock_guard<std::mutex> lock(statsMutex);
        ++stats.totalErrors;
        stats.lastErrorMessage = message;
    }

    void noteTimeout(const std::string& message) {
        std::lock_guard<std::mutex> lock(statsMutex);
        ++stats.totalTimeouts;
        ++stats.totalErrors;
        stats.lastErrorMessage = message;
    }

    // Sleeps for d unless stop is requested; returns false when interrupted.
    bool sleepFor(std::chrono::milliseconds d, std::stop_token st) {
        std::unique_lock<std::mutex> lock(sleepMutex);
        sleepCv.wait_for(lock, st, d, [] { return false; });
        return !st.stop_requested();
    }

    ////////////////////////////////////////// Submission //////////////////////////////////////////
    std::future<JSONValue> submit(const std::string& method, std::optional<JSONValue> params,
                                  CallOptions options, bool allowRetry) {
        if (closed.load()) {
            return errors::MakeFailedFuture<JSONValue>(
                errors::SessionClosedError("Session to '" + serverName + "' is closed"));
        }
        if (options.stopToken.stop_requested()) {
            return errors::MakeFailedFuture<JSONValue>(errors::CancelledError("Call cancelled before dispatch"));
        }
        if (breaker.WouldReject()) {
            return errors::MakeFailedFuture<JSONValue>(
                errors::CircuitOpenError("Circuit open for server '" + serverName + "'"));
        }

        auto req = std::make_shared<PendingRequest>();
        req->correlationId = options.correlationId.empty()
            ? "req-" + std::to_string(++correlationCounter)
            : options.correlationId;
        req->method = method;
        req->params = std::move(params);
        req->priority = options.priority;
        req->deadline = std::chrono::steady_clock::now() + options.timeout.value_or(config.RequestTimeout());
        req->allowRetry = allowRetry;
        auto future = req->promise.get_future();

        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (!pending.emplace(req->correlationId, req).second) {
                return errors::MakeFailedFuture<JSONValue>(
                    std::invalid_argument("Duplicate correlation id '" + req->correlationId + "'"));
            }
        }
        // Close() may have snapshotted the pending map before this insert.
        if (closed.load()) {
            fail(req->correlationId, errors::SessionClosedError("Session to '" + serverName + "' is closed"));
            return future;
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            ++stats.totalRequests;
        }

        QueuedMessage msg;
        msg.direction = MessageDirection::Outbound;
        msg.correlationId = req->correlationId;
        msg.method = method;
        msg.deadline = req->deadline;
        try {
            outbound.Enqueue(std::move(msg), options.priority);
        } catch (const errors::QueueFullError& e) {
            LOG_WARN("Dispatch queue for '{}' rejected {}: {}", serverName, method, e.what());
            fail(req->correlationId, e);
            return future;
        }

        if (options.stopToken.stop_possible()) {
            const std::string cid = req->correlationId;
            // May run immediately when stop was requested in the meantime.
            req->cancelCallback.emplace(options.stopToken, std::function<void()>([this, cid]() {
                if (fail(cid, errors::CancelledError("Call cancelled"))) {
                    LOG_DEBUG("Call {} cancelled by caller", cid);
                }
            }));
        }
        return future;
    }

    ////////////////////////////////////////// Dispatch //////////////////////////////////////////
    void workerLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            auto msg = outbound.Dequeue(kDequeuePoll);
            if (!msg.has_value()) {
                if (outbound.IsClosed()) {
                    return;
                }
                continue;
            }
            std::shared_ptr<PendingRequest> req;
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                auto it = pending.find(msg->correlationId);
                if (it != pending.end()) {
                    req = it->second;
                }
            }
            if (!req) {
                // Settled while queued (timeout, cancellation or close).
                continue;
            }
            req->inFlight = true;
            execute(req);
        }
    }

    // Runs one attempt. A retryable failure is parked in retryDue and the worker moves on.
    void execute(const std::shared_ptr<PendingRequest>& req) {
        const std::string& cid = req->correlationId;
        const unsigned int attempt = req->attempt;
        if (!isPending(cid)) {
            return;
        }
        const auto admission = breaker.TryAcquire();
        if (admission == CircuitBreaker::Admission::Rejected) {
            fail(cid, errors::CircuitOpenError("Circuit open for server '" + serverName + "'"));
            return;
        }
        const bool trial = admission == CircuitBreaker::Admission::Trial;
        if (trial) {
            LOG_INFO("Sending half-open trial {} to '{}'", req->method, serverName);
        }

        std::exception_ptr failure;
        try {
            auto request = std::make_unique<JSONRPCRequest>(
                JSONRPCId(cid + "." + std::to_string(attempt)), req->method, req->params);
            auto fut = transport->SendRequest(std::move(request));

            bool ready = false;
            bool abandoned = false;
            while (!ready) {
                const auto now = std::chrono::steady_clock::now();
                if (now >= req->deadline) {
                    break;
                }
                const auto slice = std::min<std::chrono::steady_clock::duration>(req->deadline - now, kResponsePoll);
                ready = fut.wait_for(slice) == std::future_status::ready;
                // A trial waits for its real outcome so the breaker never stays half-open.
                if (!ready && (closed.load() || (!trial && !isPending(cid)))) {
                    abandoned = true;
                    break;
                }
            }
            if (abandoned) {
                return;
            }
            if (!ready) {
                const std::string message = "Call " + req->method + " to '" + serverName + "' timed out";
                const bool won = fail(cid, errors::TimeoutError(message));
                if (won || trial) {
                    breaker.RecordFailure();
                    noteTimeout(message);
                    LOG_WARN("{}", message);
                }
                return;
            }

            auto response = fut.get();
            if (!response) {
                throw errors::TransportError("Transport returned no response");
            }
            // The endpoint answered, so the breaker sees a success even for an error reply.
            breaker.RecordSuccess();
            if (response->IsError()) {
                auto err = errors::MakeProtocolError(*response);
                noteError(err.what());
                fail(cid, std::move(err));
                return;
            }
            succeed(cid, response->result.value_or(JSONValue{}));
            return;
        } catch (const errors::Error&) {
            failure = std::current_exception();
        } catch (const std::exception& e) {
            failure = std::make_exception_ptr(errors::TransportError(e.what()));
        }

        std::string message = "unknown error";
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            message = e.what();
        }
        breaker.RecordFailure();
        noteError(message);

        if (!req->allowRetry || !retryPolicy.ShouldRetry(attempt, failure)) {
            LOG_WARN("Call {} to '{}' failed after {} attempt(s): {}", req->method, serverName, attempt + 1, message);
            failWith(cid, failure);
            return;
        }
        const auto delay = retryPolicy.ComputeDelay(attempt);
        const auto due = std::chrono::steady_clock::now() + delay;
        if (due >= req->deadline) {
            LOG_WARN("Call {} to '{}' failed; no time left for a retry: {}", req->method, serverName, message);
            failWith(cid, failure);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            ++stats.totalRetries;
        }
        LOG_WARN("Call {} to '{}' failed (attempt {}): {}; retrying in {} ms",
                 req->method, serverName, attempt + 1, message, delay.count());
        req->attempt = attempt + 1;
        // Back to the maintenance sweep's care until a worker picks the retry up again.
        req->inFlight = false;
        std::lock_guard<std::mutex> lock(retryMutex);
        retryDue.emplace(due, cid);
    }

    ////////////////////////////////////////// Maintenance //////////////////////////////////////////
    void maintenanceLoop(std::stop_token st) {
        while (sleepFor(kMaintenancePeriod, st)) {
            releaseRetries();
            sweepDeadlines();
            checkGivingUp();
        }
    }

    // Puts retries whose backoff has elapsed back on the outbound queue at their original priority.
    void releaseRetries() {
        const auto now = std::chrono::steady_clock::now();
        std::vector<std::string> due;
        {
            std::lock_guard<std::mutex> lock(retryMutex);
            auto end = retryDue.upper_bound(now);
            for (auto it = retryDue.begin(); it != end; ++it) {
                due.push_back(it->second);
            }
            retryDue.erase(retryDue.begin(), end);
        }
        for (const auto& cid : due) {
            std::shared_ptr<PendingRequest> req;
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                auto it = pending.find(cid);
                if (it != pending.end()) {
                    req = it->second;
                }
            }
            if (!req) {
                continue;
            }
            QueuedMessage msg;
            msg.direction = MessageDirection::Outbound;
            msg.correlationId = cid;
            msg.method = req->method;
            msg.deadline = req->deadline;
            try {
                outbound.Enqueue(std::move(msg), req->priority);
            } catch (const errors::QueueFullError& e) {
                LOG_WARN("Dispatch queue for '{}' rejected retry of {}: {}", serverName, req->method, e.what());
                fail(cid, e);
            }
        }
    }

    // Times out calls still waiting in the queue or in retryDue. In-flight calls are timed out by their worker.
    void sweepDeadlines() {
        const auto now = std::chrono::steady_clock::now();
        std::vector<std::string> expired;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            for (const auto& [cid, req] : pending) {
                if (!req->inFlight.load() && req->deadline <= now) {
                    expired.push_back(cid);
                }
            }
        }
        for (const auto& cid : expired) {
            const std::string message = "Call " + cid + " to '" + serverName + "' timed out in queue";
            if (fail(cid, errors::TimeoutError(message))) {
                breaker.RecordFailure();
                noteTimeout(message);
                LOG_WARN("{}", message);
            }
        }
    }

    void checkGivingUp() {
        if (config.givingUpWindowSeconds <= 0.0) {
            return;
        }
        const auto window = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(config.givingUpWindowSeconds));
        GiveUpHandler handler;
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            if (gaveUp || breaker.GetUnhealthyDuration() < window) {
                return;
            }
            gaveUp = true;
        }
        LOG_WARN("Giving up on '{}': circuit not closed for {} s", serverName, config.givingUpWindowSeconds);
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = giveUpHandler;
        }
        if (handler) {
            handler(serverName);
        }
    }

    ////////////////////////////////////////// Inbound //////////////////////////////////////////
    void onNotification(std::unique_ptr<JSONRPCNotification> notification) {
        if (!notification || closed.load()) {
            return;
        }
        QueuedMessage msg;
        msg.direction = MessageDirection::Inbound;
        msg.method = notification->method;
        if (notification->params.has_value()) {
            msg.payload = std::move(*notification->params);
        }
        try {
            inbound.Enqueue(std::move(msg), Priority::Normal);
        } catch (const errors::QueueFullError& e) {
            LOG_ERROR("Dropping notification {} from '{}': {}", notification->method, serverName, e.what());
        }
    }

    void routerLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            auto msg = inbound.Dequeue(kDequeuePoll);
            if (!msg.has_value()) {
                if (inbound.IsClosed()) {
                    return;
                }
                continue;
            }
            NotificationSink sink;
            {
                std::lock_guard<std::mutex> lock(handlerMutex);
                sink = notificationSink;
            }
            if (!sink) {
                LOG_DEBUG("No notification sink for '{}'; dropping {}", serverName, msg->method);
                continue;
            }
            JSONRPCNotification notification(msg->method);
            if (!msg->payload.IsNull()) {
                notification.params = std::move(msg->payload);
            }
            try {
                sink(notification);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification sink for '{}' threw on {}: {}", serverName, notification.method, e.what());
            }
        }
    }

    ////////////////////////////////////////// Heartbeat //////////////////////////////////////////
    void heartbeatLoop(std::stop_token st) {
        const auto interval = config.HeartbeatInterval();
        while (sleepFor(interval, st)) {
            const bool ok = checkOnce();
            bool isDegraded = false;
            {
                std::lock_guard<std::mutex> lock(statsMutex);
                if (ok) {
                    heartbeatMisses = 0;
                    lastHeartbeatAt = std::chrono::system_clock::now();
                    if (degraded.exchange(false)) {
                        LOG_INFO("Session '{}' recovered from DEGRADED", serverName);
                    }
                } else {
                    ++heartbeatMisses;
                    if (heartbeatMisses >= config.heartbeat.failureThreshold && !degraded.exchange(true)) {
                        LOG_INFO("Session '{}' marked DEGRADED after {} missed heartbeats", serverName, heartbeatMisses);
                    }
                }
                isDegraded = degraded.load();
            }
            HeartbeatHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlerMutex);
                handler = heartbeatHandler;
            }
            if (handler) {
                handler(ok, isDegraded);
            }
        }
    }

    bool checkOnce() {
        CallOptions opts;
        opts.priority = Priority::Urgent;
        opts.timeout = config.HeartbeatTimeout();
        std::future<JSONValue> fut;
        if (config.heartbeat.tool.empty()) {
            fut = submit(config.heartbeat.method, std::nullopt, opts, false);
        } else {
            fut = submit(Methods::CallTool,
                         MakeObject({{"name", JSONValue(config.heartbeat.tool)},
                                     {"arguments", JSONValue(JSONValue::Object{})}}),
                         opts, false);
        }
        try {
            fut.get();
            return true;
        } catch (const errors::ProtocolError& e) {
            // The server answered; an unsupported heartbeat method still proves liveness.
            LOG_DEBUG("Heartbeat to '{}' answered with error: {}", serverName, e.what());
            return true;
        } catch (const std::exception& e) {
            LOG_WARN("Heartbeat to '{}' failed: {}", serverName, e.what());
            return false;
        }
    }
};

ConnectionManager::ConnectionManager(std::string serverName, std::unique_ptr<ITransport> transport,
                                     const ClientConfig& config, Clock clock)
    : pImpl(std::make_unique<Impl>(std::move(serverName), std::move(transport), config, std::move(clock))) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw std::invalid_argument("ConnectionManager requires a transport");
    }
}

ConnectionManager::~ConnectionManager() {
    FUNC_SCOPE();
    Close();
}

std::future<void> ConnectionManager::Start() {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return errors::MakeFailedFuture<void>(errors::SessionClosedError("Session to '" + pImpl->serverName + "' is closed"));
    }
    if (pImpl->started.exchange(true)) {
        std::promise<void> p; p.set_value(); return p.get_future();
    }
    Impl* impl = pImpl.get();
    impl->transport->SetNotificationHandler([impl](std::unique_ptr<JSONRPCNotification> n) {
        impl->onNotification(std::move(n));
    });
    impl->transport->SetErrorHandler([impl](const std::string& err) {
        LOG_ERROR("Transport error from '{}': {}", impl->serverName, err);
    });

    auto started = impl->transport->Start();

    for (unsigned int i = 0; i < impl->config.dispatchConcurrency; ++i) {
        impl->workers.emplace_back([impl](std::stop_token st) { impl->workerLoop(st); });
    }
    impl->maintenanceThread = std::jthread([impl](std::stop_token st) { impl->maintenanceLoop(st); });
    impl->routerThread = std::jthread([impl](std::stop_token st) { impl->routerLoop(st); });
    if (impl->config.heartbeat.enabled && impl->config.heartbeat.intervalSeconds > 0.0) {
        impl->heartbeatThread = std::jthread([impl](std::stop_token st) { impl->heartbeatLoop(st); });
    }
    {
        std::lock_guard<std::mutex> lock(impl->statsMutex);
        impl->stats.connectedAt = std::chrono::system_clock::now();
    }
    LOG_INFO("Connection manager for '{}' started ({} dispatch workers)", impl->serverName, impl->config.dispatchConcurrency);
    return started;
}

std::future<JSONValue> ConnectionManager::Call(const std::string& method, std::optional<JSONValue> params,
                                               CallOptions options) {
    FUNC_SCOPE();
    return pImpl->submit(method, std::move(params), std::move(options), true);
}

std::future<void> ConnectionManager::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return errors::MakeFailedFuture<void>(errors::SessionClosedError("Session to '" + pImpl->serverName + "' is closed"));
    }
    return pImpl->transport->SendNotification(std::make_unique<JSONRPCNotification>(method, std::move(params)));
}

bool ConnectionManager::Cancel(const std::string& correlationId) {
    FUNC_SCOPE();
    return pImpl->fail(correlationId, errors::CancelledError("Call cancelled"));
}

void ConnectionManager::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return;
    }
    LOG_INFO("Closing connection manager for '{}'", pImpl->serverName);

    for (auto& w : pImpl->workers) {
        w.request_stop();
    }
    pImpl->maintenanceThread.request_stop();
    pImpl->routerThread.request_stop();
    pImpl->heartbeatThread.request_stop();
    pImpl->outbound.Close();
    pImpl->inbound.Close();

    // Fail everything still pending before joining so no thread waits on an unresolved call.
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        for (const auto& [cid, req] : pImpl->pending) {
            ids.push_back(cid);
        }
    }
    for (const auto& cid : ids) {
        pImpl->fail(cid, errors::SessionClosedError("Session to '" + pImpl->serverName + "' closed"));
    }

    const auto self = std::this_thread::get_id();
    auto joinOrDetach = [self](std::jthread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == self) {
            t.detach();
        } else {
            t.join();
        }
    };
    for (auto& w : pImpl->workers) {
        joinOrDetach(w);
    }
    joinOrDetach(pImpl->maintenanceThread);
    joinOrDetach(pImpl->routerThread);
    joinOrDetach(pImpl->heartbeatThread);

    try {
        pImpl->transport->Close().get();
    } catch (const std::exception& e) {
        LOG_WARN("Transport close for '{}' failed: {}", pImpl->serverName, e.what());
    }
}

bool ConnectionManager::IsClosed() const { return pImpl->closed.load(); }

void ConnectionManager::SetNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->notificationSink = std::move(sink);
}

void ConnectionManager::SetGiveUpHandler(GiveUpHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->giveUpHandler = std::move(handler);
}

void ConnectionManager::SetHeartbeatHandler(HeartbeatHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->heartbeatHandler = std::move(handler);
}

const std::string& ConnectionManager::GetServerName() const { return pImpl->serverName; }

CircuitState ConnectionManager::GetCircuitState() const { return pImpl->breaker.GetState(); }

std::optional<std::chrono::system_clock::time_point> ConnectionManager::GetLastHeartbeatAt() const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    return pImpl->lastHeartbeatAt;
}

bool ConnectionManager::IsDegraded() const { return pImpl->degraded.load(); }

ConnectionStats ConnectionManager::GetStats() const {
    ConnectionStats out;
    {
        std::lock_guard<std::mutex> lock(pImpl->statsMutex);
        out = pImpl->stats;
    }
    out.consecutiveFailures = pImpl->breaker.GetConsecutiveFailures();
    {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        out.pendingCount = pImpl->pending.size();
    }
    return out;
}

MessageQueueStats ConnectionManager::GetQueueStats() const { return pImpl->outbound.GetStats(); }

} // namespace mcpleague
