//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_core.cpp
// Purpose: Client facade end to end against in-memory agents: handshake, routing, subscriptions, health
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "FakeAgent.h"
#include "mcpleague/Client.h"
#include "mcpleague/errors/Errors.h"

using namespace mcpleague;
using namespace mcpleague::fakes;
using namespace std::chrono_literals;

namespace {

ClientConfig testConfig() {
    ClientConfig c;
    c.clientName = "referee";
    c.retry.maxAttempts = 2;
    c.retry.baseDelaySeconds = 0.01;
    c.heartbeat.enabled = false;
    c.givingUpWindowSeconds = 0.0;
    c.requestTimeoutSeconds = 2.0;
    return c;
}

ServerConfig agentServer(const std::string& name, const std::shared_ptr<FakeAgent>& agent) {
    ServerConfig sc;
    sc.serverName = name;
    sc.transport = "memory";
    sc.transportFactory = agent;
    return sc;
}

std::string str(const JSONValue& v, const std::string& key) {
    return GetStringMember(v, key).value_or("");
}

int64_t intAt(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    return m ? std::get<int64_t>(m->value) : -1;
}

} // namespace

TEST(ClientCore, ConnectRunsHandshakeAndDiscovery) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    Client client(testConfig());

    auto handle = client.Connect(agentServer("alpha", agent)).get();
    EXPECT_TRUE(handle.created);
    EXPECT_EQ(handle.serverName, "alpha");
    EXPECT_EQ(handle.sessionId, "alpha_1");
    EXPECT_EQ(handle.serverInfo.name, "alpha");
    EXPECT_EQ(handle.protocolVersion, PROTOCOL_VERSION);
    EXPECT_EQ(handle.toolCount, 2u);

    EXPECT_EQ(agent->Received(), (std::vector<std::string>{"initialize", "tools/list", "resources/list"}));
    EXPECT_TRUE(WaitUntil([&] { return !agent->NotificationsReceived().empty(); }));
    EXPECT_EQ(agent->NotificationsReceived().front(), "notifications/initialized");

    auto initParams = agent->LastParams("initialize");
    ASSERT_TRUE(initParams.has_value());
    const JSONValue* clientInfo = FindMember(*initParams, "clientInfo");
    ASSERT_NE(clientInfo, nullptr);
    EXPECT_EQ(str(*clientInfo, "name"), "referee");

    auto status = client.GetSessionStatus("alpha");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, SessionState::Active);
}

TEST(ClientCore, ConnectTwiceReusesTheSession) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    Client client(testConfig());
    client.Connect(agentServer("alpha", agent)).get();

    auto again = client.Connect(agentServer("alpha", agent)).get();
    EXPECT_FALSE(again.created);
    EXPECT_EQ(again.sessionId, "alpha_1");
    EXPECT_EQ(agent->CountReceived("initialize"), 1u);
}

TEST(ClientCore, FailedInitializeTearsSessionDown) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    agent->On(Methods::Initialize, [](const JSONRPCRequest& req) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "not today");
    });
    Client client(testConfig());

    auto fut = client.Connect(agentServer("alpha", agent));
    EXPECT_THROW(fut.get(), errors::ProtocolError);
    EXPECT_TRUE(client.ListSessions().empty());
    EXPECT_TRUE(client.ListTools().empty());
}

TEST(ClientCore, MissingResourceListIsTolerated) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    agent->On(Methods::ListResources, nullptr);
    Client client(testConfig());

    auto handle = client.Connect(agentServer("alpha", agent)).get();
    EXPECT_EQ(handle.toolCount, 2u);
    EXPECT_EQ(client.GetSessionStatus("alpha")->state, SessionState::Active);
}

TEST(ClientCore, CallToolRoutesToOwningServer) {
    auto alpha = std::make_shared<FakeAgent>("alpha");
    auto beta = std::make_shared<FakeAgent>("beta");
    beta->SetTools({"search", "score"});
    Client client(testConfig());
    client.Connect(agentServer("alpha", alpha)).get();
    client.Connect(agentServer("beta", beta)).get();

    auto viaBeta = client.CallTool("beta.search", MakeObject({{"q", JSONValue("chess")}})).get();
    EXPECT_EQ(str(viaBeta, "server"), "beta");
    EXPECT_EQ(str(viaBeta, "tool"), "search");
    EXPECT_EQ(str(*FindMember(viaBeta, "arguments"), "q"), "chess");

    auto unique = client.CallTool("translate", JSONValue(nullptr)).get();
    EXPECT_EQ(str(unique, "server"), "alpha");
    const JSONValue* args = FindMember(unique, "arguments");
    ASSERT_NE(args, nullptr);
    EXPECT_TRUE(args->IsObject());

    auto ambiguous = client.CallTool("search", MakeObject({}));
    EXPECT_THROW(ambiguous.get(), errors::AmbiguousToolNameError);
    auto missing = client.CallTool("teleport", MakeObject({}));
    EXPECT_THROW(missing.get(), errors::ToolNotFoundError);

    EXPECT_EQ(client.ListTools().size(), 4u);
    EXPECT_EQ(client.ListTools(std::string("beta")).size(), 2u);
}

TEST(ClientCore, ToolListChangedTriggersRefresh) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    Client client(testConfig());
    client.Connect(agentServer("alpha", agent)).get();

    agent->SetTools({"search", "translate", "summarize"});
    ASSERT_TRUE(agent->Push(JSONRPCNotification(Methods::ToolListChanged)));
    EXPECT_TRUE(WaitUntil([&] { return client.ListTools(std::string("alpha")).size() == 3u; }));
    EXPECT_EQ(agent->CountReceived("tools/list"), 2u);
}

TEST(ClientCore, RefreshToolsReplacesCatalog) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    Client client(testConfig());
    client.Connect(agentServer("alpha", agent)).get();

    agent->SetTools({"summarize"});
    auto refreshed = client.RefreshTools("alpha").get();
    ASSERT_EQ(refreshed.size(), 1u);
    EXPECT_EQ(refreshed.front().namespacedName, "alpha.summarize");
    EXPECT_THROW(client.CallTool("alpha.search", MakeObject({})).get(), errors::ToolNotFoundError);

    auto unknown = client.RefreshTools("nobody");
    EXPECT_THROW(unknown.get(), errors::SessionNotFoundError);
}

TEST(ClientCore, DisconnectDropsToolsAndFailsPendingCalls) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    agent->On(Methods::CallTool, [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> { return nullptr; });
    Client client(testConfig());
    client.Connect(agentServer("alpha", agent)).get();

    auto pending = client.CallTool("alpha.search", MakeObject({}));
    ASSERT_TRUE(WaitUntil([&] { return agent->CountReceived("tools/call") == 1u; }));

    EXPECT_TRUE(client.Disconnect("alpha"));
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(pending.get(), errors::SessionClosedError);
    EXPECT_TRUE(client.ListTools().empty());
    EXPECT_FALSE(client.Disconnect("alpha"));
}

TEST(ClientCore, SubscriptionReceivesUpdatesAndUnsubscribes) {
    auto agent = std::make_shared<FakeAgent>("arena");
    agent->SetResources({"league://standings"});
    Client client(testConfig());
    client.Connect(agentServer("arena", agent)).get();

    std::mutex m;
    std::vector<std::string> seen;
    auto handle = client.SubscribeResource("league://standings", [&](const std::string& uri, const JSONValue& v) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back(uri + "=" + str(v, "text"));
    });
    EXPECT_TRUE(handle.created);
    EXPECT_EQ(handle.serverName, "arena");
    EXPECT_EQ(handle.subscriberId, "referee");
    EXPECT_EQ(agent->CountReceived("resources/subscribe"), 1u);

    agent->Push(JSONRPCNotification(Methods::ResourceUpdated,
        MakeObject({{"uri", JSONValue("league://standings")},
                    {"contents", MakeObject({{"text", JSONValue("round 2")}})}})));
    ASSERT_TRUE(WaitUntil([&] {
        std::lock_guard<std::mutex> lock(m);
        return !seen.empty();
    }));
    {
        std::lock_guard<std::mutex> lock(m);
        EXPECT_EQ(seen.front(), "league://standings=round 2");
    }

    // The update is served from cache without another resources/read.
    auto cached = client.ReadResource("league://standings").get();
    EXPECT_EQ(str(cached, "text"), "round 2");
    EXPECT_EQ(agent->CountReceived("resources/read"), 0u);

    EXPECT_TRUE(client.UnsubscribeResource("league://standings"));
    EXPECT_EQ(agent->CountReceived("resources/unsubscribe"), 1u);
}

TEST(ClientCore, SubscribeToUnknownResourceFails) {
    auto agent = std::make_shared<FakeAgent>("arena");
    Client client(testConfig());
    client.Connect(agentServer("arena", agent)).get();

    EXPECT_THROW(client.SubscribeResource("league://nowhere", nullptr), errors::ResourceNotFoundError);
    SubscribeOptions explicitServer;
    explicitServer.serverName = "ghost";
    EXPECT_THROW(client.SubscribeResource("league://nowhere", nullptr, explicitServer),
                 errors::SessionNotFoundError);
}

TEST(ClientCore, ReadResourceIsReadThrough) {
    auto agent = std::make_shared<FakeAgent>("arena");
    agent->SetResources({"league://rules"});
    Client client(testConfig());
    client.Connect(agentServer("arena", agent)).get();

    auto first = client.ReadResource("league://rules").get();
    EXPECT_EQ(str(first, "text"), "arena:league://rules");
    client.ReadResource("league://rules").get();
    EXPECT_EQ(agent->CountReceived("resources/read"), 1u);
    client.ReadResource("league://rules", false).get();
    EXPECT_EQ(agent->CountReceived("resources/read"), 2u);

    auto unknown = client.ReadResource("league://missing");
    EXPECT_THROW(unknown.get(), errors::ResourceNotFoundError);
}

TEST(ClientCore, ProtocolMessagesAreEnveloped) {
    auto agent = std::make_shared<FakeAgent>("player-1");
    Client client(testConfig());
    client.Connect(agentServer("player-1", agent)).get();

    auto envelope = MakeObject({{"message_type", JSONValue("GAME_INVITATION")}, {"match_id", JSONValue("m-7")}});
    auto reply = client.SendProtocolMessage("player-1", envelope).get();
    const JSONValue* ack = FindMember(reply, "ack");
    ASSERT_NE(ack, nullptr);
    EXPECT_EQ(str(*ack, "match_id"), "m-7");

    auto nobody = client.SendProtocolMessage("player-9", envelope);
    EXPECT_THROW(nobody.get(), errors::SessionNotFoundError);
}

TEST(ClientCore, OtherNotificationsReachUserHandler) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    Client client(testConfig());
    std::promise<std::string> got;
    auto gotFut = got.get_future();
    client.SetNotificationHandler([&got](const std::string& server, const JSONRPCNotification& n) {
        got.set_value(server + "|" + n.method);
    });
    client.Connect(agentServer("alpha", agent)).get();

    agent->Push(JSONRPCNotification(Methods::Progress, MakeObject({{"progress", JSONValue(int64_t(3))}})));
    ASSERT_EQ(gotFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(gotFut.get(), "alpha|notifications/progress");
}

TEST(ClientCore, HealthReportSummarisesState) {
    auto alpha = std::make_shared<FakeAgent>("alpha");
    auto beta = std::make_shared<FakeAgent>("beta");
    beta->SetResources({"league://standings"});
    Client client(testConfig());
    client.Connect(agentServer("alpha", alpha)).get();
    client.Connect(agentServer("beta", beta)).get();
    client.CallTool("alpha.translate", MakeObject({})).get();
    client.SubscribeResource("league://standings", nullptr);

    const JSONValue report = client.GetHealthReport();
    EXPECT_EQ(str(report, "client"), "referee");

    const JSONValue* sessions = FindMember(report, "sessions");
    ASSERT_NE(sessions, nullptr);
    const JSONValue* alphaStatus = FindMember(*sessions, "alpha");
    ASSERT_NE(alphaStatus, nullptr);
    EXPECT_EQ(str(*alphaStatus, "state"), "ACTIVE");
    EXPECT_EQ(str(*alphaStatus, "circuitState"), "CLOSED");
    EXPECT_GE(intAt(*alphaStatus, "totalRequests"), 3);
    ASSERT_NE(FindMember(*sessions, "beta"), nullptr);

    const JSONValue* tools = FindMember(report, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_EQ(intAt(*tools, "count"), 4);
    const JSONValue* collisions = FindMember(*tools, "collisions");
    ASSERT_NE(collisions, nullptr);
    EXPECT_NE(FindMember(*collisions, "search"), nullptr);

    const JSONValue* resources = FindMember(report, "resources");
    ASSERT_NE(resources, nullptr);
    EXPECT_EQ(intAt(*resources, "subscriptions"), 1);
    EXPECT_EQ(intAt(*resources, "uris"), 1);
}

TEST(ClientFactory, CreatesWorkingClient) {
    auto agent = std::make_shared<FakeAgent>("alpha");
    ClientFactory factory;
    auto client = factory.CreateClient(testConfig());
    ASSERT_TRUE(client);
    client->Connect(agentServer("alpha", agent)).get();
    EXPECT_EQ(client->ListSessions(), std::vector<std::string>{"alpha"});
}
