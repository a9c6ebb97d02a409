//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpleague/HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpleague/Config.h"
#include "mcpleague/HTTPTransport.hpp"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct HttpReply {
    unsigned int status{0};
    std::string body;
};

bool isSuccessStatus(unsigned int status) {
    return status >= 200 && status < 300;
}

unsigned int parseMillis(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        const unsigned long v = std::stoul(val, &used);
        if (used != val.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<unsigned int>(v);
    } catch (const std::exception&) {
        throw std::invalid_argument("HTTP transport: invalid value '" + val + "' for " + key);
    }
}

} // namespace

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;
    std::string sessionId;
    std::atomic<bool> connected{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::string caInitError;

    std::mutex handlerMutex;
    HTTPTransport::ErrorHandler errorHandler;
    HTTPTransport::NotificationHandler notificationHandler;

    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<uint64_t, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<uint64_t, std::promise<void>> pendingNotifications;
    uint64_t nextKey{0};

    explicit Impl(const HTTPTransport::Options& o) : opts(o) {
        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "http-" + std::to_string(dis(gen));
        if (opts.serverName.empty()) {
            opts.serverName = opts.host;
        }
        if (opts.notifyPath.empty()) {
            opts.notifyPath = opts.rpcPath;
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            try {
                if (userProvidedCA) {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } else {
                    sslCtx->set_default_verify_paths();
                }
            } catch (const boost::system::system_error& e) {
                caInitError = std::string("HTTPS: failed to load trust store: ") + e.what();
                LOG_ERROR("{}", caInitError);
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    ~Impl() {
        stopLoop();
    }

    void stopLoop() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void reportError(const std::string& msg) {
        HTTPTransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    std::string generateRequestId() { return std::string("http-req-") + std::to_string(++requestCounter); }

    http::request<http::string_body> buildRequest(const std::string& path, const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, path, 11};
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        if (!opts.bearerToken.empty()) {
            req.set(http::field::authorization, std::string("Bearer ") + opts.bearerToken);
        }
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: POST JSON and return status and body. Network failures propagate as exceptions.
    net::awaitable<HttpReply> coPostJson(const std::string path, const std::string body) {
        http::request<http::string_body> req = buildRequest(path, body);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        LOG_DEBUG("HTTP resolved {}:{} path={}", opts.host, opts.port, path);

        HttpReply reply;
        if (opts.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), opts.serverName.c_str())) {
                throw errors::TransportError("HTTPS: failed to set SNI hostname '" + opts.serverName + "'");
            }
            if (::SSL_set1_host(stream.native_handle(), opts.serverName.c_str()) != 1) {
                throw errors::TransportError("HTTPS: failed to set verification hostname '" + opts.serverName + "'");
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            req.set(http::field::host, opts.serverName);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            reply.status = res.result_int();
            reply.body = std::move(res.body());
            boost::system::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("HTTPS shutdown: {}", ec.message());
            }
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            req.set(http::field::host, opts.host);
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            reply.status = res.result_int();
            reply.body = std::move(res.body());
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        LOG_DEBUG("HTTP {} {} -> status {} ({} bytes)", opts.host, path, reply.status, reply.body.size());
        co_return reply;
    }

    std::optional<std::promise<std::unique_ptr<JSONRPCResponse>>> takeRequest(uint64_t key) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingRequests.find(key);
        if (it == pendingRequests.end()) {
            return std::nullopt;
        }
        auto p = std::move(it->second);
        pendingRequests.erase(it);
        return p;
    }

    std::optional<std::promise<void>> takeNotification(uint64_t key) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingNotifications.find(key);
        if (it == pendingNotifications.end()) {
            return std::nullopt;
        }
        auto p = std::move(it->second);
        pendingNotifications.erase(it);
        return p;
    }

    // Interprets a reply to a request; throws TransportError when it carries no JSON-RPC response.
    std::unique_ptr<JSONRPCResponse> interpret(const HttpReply& reply) {
        if (reply.body.empty()) {
            throw errors::TransportError("Empty HTTP response (status " + std::to_string(reply.status) + ")");
        }
        auto resp = std::make_unique<JSONRPCResponse>();
        if (!resp->Deserialize(reply.body)) {
            if (!isSuccessStatus(reply.status)) {
                throw errors::TransportError("HTTP status " + std::to_string(reply.status));
            }
            throw errors::TransportError("Unparsable HTTP response body");
        }
        return resp;
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() {
    FUNC_SCOPE();
    if (pImpl->connected.load()) {
        Close().get();
    }
}

void HTTPTransport::ApplyUrl(const std::string& url, Options& opts) {
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        opts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        opts.scheme = "http";
    }
    if (opts.scheme != "http" && opts.scheme != "https") {
        throw std::invalid_argument("HTTP transport: unsupported scheme '" + opts.scheme + "'");
    }

    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        opts.rpcPath = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        opts.rpcPath = url.substr(slash);
    }

    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        opts.host = hostPort;
        opts.port = opts.scheme == "https" ? "443" : "80";
    } else {
        opts.host = hostPort.substr(0, colon);
        opts.port = hostPort.substr(colon + 1);
    }
    if (opts.host.empty()) {
        throw std::invalid_argument("HTTP transport: URL '" + url + "' has no host");
    }
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    if (!pImpl->caInitError.empty()) {
        return errors::MakeFailedFuture<void>(errors::TransportError(pImpl->caInitError));
    }
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->connected.exchange(true)) {
        ready.set_value();
        return fut;
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    Impl* impl = pImpl.get();
    pImpl->ioThread = std::thread([impl]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTP io loop terminated: {}", e.what());
            impl->connected.store(false);
            impl->reportError(e.what());
        }
    });
    LOG_INFO("HTTP transport {} started for {}://{}:{}{}", pImpl->sessionId, pImpl->opts.scheme,
             pImpl->opts.host, pImpl->opts.port, pImpl->opts.rpcPath);
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    pImpl->connected.store(false);
    pImpl->stopLoop();

    // Completion handlers no longer run once the loop is stopped.
    std::unordered_map<uint64_t, std::promise<std::unique_ptr<JSONRPCResponse>>> requests;
    std::unordered_map<uint64_t, std::promise<void>> notifications;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        requests.swap(pImpl->pendingRequests);
        notifications.swap(pImpl->pendingNotifications);
    }
    for (auto& [key, p] : requests) {
        p.set_exception(std::make_exception_ptr(errors::TransportError("HTTP transport closed")));
    }
    for (auto& [key, p] : notifications) {
        p.set_exception(std::make_exception_ptr(errors::TransportError("HTTP transport closed")));
    }
    if (!requests.empty() || !notifications.empty()) {
        LOG_DEBUG("HTTP Close: failed {} pending request(s), {} notification(s)", requests.size(), notifications.size());
    }
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    FUNC_SCOPE(); return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    FUNC_SCOPE(); return pImpl->sessionId;
}

const HTTPTransport::Options& HTTPTransport::GetOptions() const {
    return pImpl->opts;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    if (!request) {
        return errors::MakeFailedFuture<std::unique_ptr<JSONRPCResponse>>(std::invalid_argument("null request"));
    }
    if (!pImpl->connected.load()) {
        return errors::MakeFailedFuture<std::unique_ptr<JSONRPCResponse>>(
            errors::TransportError("HTTP transport not connected"));
    }
    if (std::holds_alternative<std::nullptr_t>(request->id)) {
        request->id = pImpl->generateRequestId();
    }
    std::string payload = request->Serialize();

    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();
    uint64_t key = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        key = ++pImpl->nextKey;
        pImpl->pendingRequests.emplace(key, std::move(promise));
    }

    Impl* impl = pImpl.get();
    net::co_spawn(pImpl->ioc, pImpl->coPostJson(pImpl->opts.rpcPath, std::move(payload)),
        [impl, key](std::exception_ptr eptr, HttpReply reply) {
            auto p = impl->takeRequest(key);
            if (!p) {
                return;
            }
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const errors::Error&) {
                    p->set_exception(std::current_exception());
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTP request failed: {}", e.what());
                    p->set_exception(std::make_exception_ptr(errors::TransportError(e.what())));
                }
                return;
            }
            try {
                p->set_value(impl->interpret(reply));
            } catch (const errors::TransportError&) {
                p->set_exception(std::current_exception());
            }
        });

    return fut;
}

std::future<void> HTTPTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!notification) {
        return errors::MakeFailedFuture<void>(std::invalid_argument("null notification"));
    }
    if (!pImpl->connected.load()) {
        return errors::MakeFailedFuture<void>(errors::TransportError("HTTP transport not connected"));
    }
    std::string payload = notification->Serialize();

    std::promise<void> done;
    auto fut = done.get_future();
    uint64_t key = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        key = ++pImpl->nextKey;
        pImpl->pendingNotifications.emplace(key, std::move(done));
    }

    Impl* impl = pImpl.get();
    net::co_spawn(pImpl->ioc, pImpl->coPostJson(pImpl->opts.notifyPath, std::move(payload)),
        [impl, key](std::exception_ptr eptr, HttpReply reply) {
            auto p = impl->takeNotification(key);
            if (!p) {
                return;
            }
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    p->set_exception(std::make_exception_ptr(errors::TransportError(e.what())));
                }
                return;
            }
            if (!isSuccessStatus(reply.status)) {
                p->set_exception(std::make_exception_ptr(
                    errors::TransportError("HTTP status " + std::to_string(reply.status) + " for notification")));
                return;
            }
            p->set_value();
        });

    return fut;
}

void HTTPTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

//==========================================================================================================
// HTTPTransportFactory::CreateTransport
// Purpose: Parse semicolon-delimited key=value config into Options and create transport.
//==========================================================================================================
std::unique_ptr<ITransport> HTTPTransportFactory::CreateTransport(const std::string& config) {
    HTTPTransport::Options opts;
    for (const auto& [key, val] : ParseKeyValueConfig(config)) {
        if (key == "url") {
            HTTPTransport::ApplyUrl(val, opts);
        } else if (key == "scheme") {
            opts.scheme = val;
        } else if (key == "host") {
            opts.host = val;
        } else if (key == "port") {
            opts.port = val;
        } else if (key == "rpcPath") {
            opts.rpcPath = val;
        } else if (key == "notifyPath") {
            opts.notifyPath = val;
        } else if (key == "serverName") {
            opts.serverName = val;
        } else if (key == "caFile") {
            opts.caFile = val;
        } else if (key == "caPath") {
            opts.caPath = val;
        } else if (key == "connectTimeoutMs") {
            opts.connectTimeoutMs = parseMillis(key, val);
        } else if (key == "readTimeoutMs") {
            opts.readTimeoutMs = parseMillis(key, val);
        } else if (key == "bearerToken" || key == "token") {
            opts.bearerToken = val;
        } else {
            LOG_WARN("HTTP transport: ignoring unknown key '{}'", key);
        }
    }
    return std::make_unique<HTTPTransport>(opts);
}

} // namespace mcpleague
