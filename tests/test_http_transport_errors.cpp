//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_transport_errors.cpp
// Purpose: HTTPTransport happy path and negative-path tests (invalid/empty responses, refused connects)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpleague/HTTPTransport.hpp"
#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/errors/Errors.h"

using namespace mcpleague;

namespace {

namespace http = boost::beast::http;

// Blocking one-request-per-connection server; the target picks the canned reply.
struct MiniServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};
    std::mutex seenMutex;
    std::string lastAuthorization;
    std::string lastTarget;
    std::string lastError;

    static void writeResponse(boost::beast::tcp_stream& stream,
                              const http::request<http::string_body>& req,
                              http::status status,
                              const std::string& body,
                              const std::string& contentType) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::server, "mini-server");
        res.set(http::field::content_type, contentType);
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        http::write(stream, res);
    }

    static std::string echoReply(const std::string& requestBody, const std::string& authorization) {
        JSONRPCRequest req;
        if (!req.Deserialize(requestBody)) {
            return "{}";
        }
        JSONRPCResponse resp(req.id, MakeObject({{"method", JSONValue(req.method)},
                                                 {"authorization", JSONValue(authorization)}}));
        return resp.Serialize();
    }

    void runOnce() {
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(stream, buffer, req);
            const std::string target(req.target());
            const std::string authorization(req[http::field::authorization]);
            {
                std::lock_guard<std::mutex> lock(seenMutex);
                lastTarget = target;
                lastAuthorization = authorization;
            }
            if (target == "/empty") {
                writeResponse(stream, req, http::status::ok, "", "application/json");
            } else if (target == "/text") {
                writeResponse(stream, req, http::status::ok, "ok", "text/plain");
            } else if (target == "/badjson") {
                writeResponse(stream, req, http::status::ok, "notjson", "application/json");
            } else if (target == "/500") {
                writeResponse(stream, req, http::status::internal_server_error, "oops", "text/plain");
            } else if (target == "/500rpc") {
                auto err = CreateErrorResponse(JSONRPCId(std::string("e1")), JSONRPCErrorCodes::InternalError, "boom", std::nullopt);
                writeResponse(stream, req, http::status::internal_server_error, err->Serialize(), "application/json");
            } else if (target == "/notify") {
                writeResponse(stream, req, http::status::accepted, "", "application/json");
            } else if (target == "/notify_fail") {
                writeResponse(stream, req, http::status::service_unavailable, "", "application/json");
            } else {
                writeResponse(stream, req, http::status::ok, echoReply(req.body(), authorization), "application/json");
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception& e) {
            // Client hang-ups are expected in the negative tests; keep the last one for diagnostics.
            std::lock_guard<std::mutex> lock(seenMutex);
            lastError = e.what();
        }
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        // Unblock accept() with a throwaway connection.
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket poke{io};
        poke.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    ~MiniServer() { stop(); }

    std::string Config(const std::string& path) const {
        std::ostringstream cfg;
        cfg << "url=http://127.0.0.1:" << port << path << "; connectTimeoutMs=500; readTimeoutMs=1500";
        return cfg.str();
    }
};

std::unique_ptr<JSONRPCResponse> sendOne(ITransport& t, const std::string& id) {
    auto fut = t.SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId(id), "noop"));
    EXPECT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    return fut.get();
}

} // namespace

TEST(HTTPTransport, ValidResponseResolvesWithBearerHeader) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/mcp") + "; bearerToken=s3cret");
    t->Start().get();
    EXPECT_TRUE(t->IsConnected());

    auto resp = sendOne(*t, "ok-1");
    ASSERT_TRUE(resp);
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(JSONRPCIdToString(resp->id), "ok-1");
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(GetStringMember(*resp->result, "method").value_or(""), "noop");
    EXPECT_EQ(GetStringMember(*resp->result, "authorization").value_or(""), "Bearer s3cret");

    t->Close().get();
    EXPECT_FALSE(t->IsConnected());
    srv.stop();
}

TEST(HTTPTransportErrors, EmptyBodyFailsWithTransportError) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/empty"));
    t->Start().get();
    EXPECT_THROW(sendOne(*t, "e1"), errors::TransportError);
    t->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, NonJsonBodyFailsWithTransportError) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/text"));
    t->Start().get();
    EXPECT_THROW(sendOne(*t, "e2"), errors::TransportError);
    t->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, InvalidJsonFailsWithTransportError) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/badjson"));
    t->Start().get();
    EXPECT_THROW(sendOne(*t, "e3"), errors::TransportError);
    t->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, Http500WithoutRpcBodyFailsWithTransportError) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/500"));
    t->Start().get();
    try {
        sendOne(*t, "e4");
        FAIL() << "expected TransportError";
    } catch (const errors::TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
        EXPECT_TRUE(e.IsRetryable());
    }
    t->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, Http500WithRpcErrorBodyIsDeliveredAsResponse) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto t = f.CreateTransport(srv.Config("/500rpc"));
    t->Start().get();
    auto resp = sendOne(*t, "e5");
    ASSERT_TRUE(resp);
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errors::MakeProtocolError(*resp).Code(), JSONRPCErrorCodes::InternalError);
    t->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, ConnectionRefusedFailsWithTransportError) {
    unsigned short freePort = 0;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor a{io, {boost::asio::ip::make_address("127.0.0.1"), 0}};
        freePort = a.local_endpoint().port();
    }
    HTTPTransportFactory f;
    auto t = f.CreateTransport("url=http://127.0.0.1:" + std::to_string(freePort) + "/mcp; connectTimeoutMs=500");
    t->Start().get();
    EXPECT_THROW(sendOne(*t, "refused"), errors::TransportError);
    t->Close().get();
}

TEST(HTTPTransportErrors, NotificationStatusIsChecked) {
    MiniServer srv; srv.start();
    HTTPTransportFactory f;
    auto ok = f.CreateTransport(srv.Config("/mcp") + "; notifyPath=/notify");
    ok->Start().get();
    EXPECT_NO_THROW(ok->SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized")).get());
    ok->Close().get();

    auto bad = f.CreateTransport(srv.Config("/mcp") + "; notifyPath=/notify_fail");
    bad->Start().get();
    EXPECT_THROW(bad->SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized")).get(),
                 errors::TransportError);
    bad->Close().get();
    srv.stop();
}

TEST(HTTPTransportErrors, SendAfterCloseFails) {
    HTTPTransportFactory f;
    auto t = f.CreateTransport("url=http://127.0.0.1:1/mcp");
    t->Start().get();
    t->Close().get();
    auto fut = t->SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId(std::string("late")), "noop"));
    EXPECT_THROW(fut.get(), errors::TransportError);
}

TEST(HTTPTransportOptions, ApplyUrlFillsEndpoint) {
    HTTPTransport::Options opts;
    HTTPTransport::ApplyUrl("https://agents.example.org:8443/rpc/v1", opts);
    EXPECT_EQ(opts.scheme, "https");
    EXPECT_EQ(opts.host, "agents.example.org");
    EXPECT_EQ(opts.port, "8443");
    EXPECT_EQ(opts.rpcPath, "/rpc/v1");

    HTTPTransport::ApplyUrl("https://agents.example.org", opts);
    EXPECT_EQ(opts.port, "443");
    EXPECT_EQ(opts.rpcPath, "/");

    HTTPTransport::ApplyUrl("localhost:9000/mcp", opts);
    EXPECT_EQ(opts.scheme, "http");
    EXPECT_EQ(opts.host, "localhost");
    EXPECT_EQ(opts.port, "9000");
}

TEST(HTTPTransportOptions, ApplyUrlRejectsBadInput) {
    HTTPTransport::Options opts;
    EXPECT_THROW(HTTPTransport::ApplyUrl("ftp://host/mcp", opts), std::invalid_argument);
    EXPECT_THROW(HTTPTransport::ApplyUrl("http:///mcp", opts), std::invalid_argument);
}

TEST(HTTPTransportOptions, FactoryDefaultsNotifyPathAndServerName) {
    HTTPTransportFactory f;
    auto t = f.CreateTransport("url=http://10.1.2.3:8080/rpc; readTimeoutMs=2500");
    auto* httpTransport = dynamic_cast<HTTPTransport*>(t.get());
    ASSERT_NE(httpTransport, nullptr);
    EXPECT_EQ(httpTransport->GetOptions().notifyPath, "/rpc");
    EXPECT_EQ(httpTransport->GetOptions().serverName, "10.1.2.3");
    EXPECT_EQ(httpTransport->GetOptions().readTimeoutMs, 2500u);
    EXPECT_THROW(f.CreateTransport("url=http://h/mcp; connectTimeoutMs=soon"), std::invalid_argument);
}
