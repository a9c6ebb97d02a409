//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: League client example - connects to the agents named on the command line (or to an in-process
//          league server when none are given), lists their tools, calls one and prints the health report
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpleague/Client.h"
#include "mcpleague/Config.h"
#include "mcpleague/InMemoryTransport.hpp"
#include "mcpleague/Protocol.h"
#include "mcpleague/errors/Errors.h"
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace mcpleague;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--call")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

// Every "--server=<descriptor>" argument, e.g. --server="name=referee;url=http://127.0.0.1:8001"
static std::vector<std::string> getServerArgs(int argc, char** argv) {
    const std::string prefix = "--server=";
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind(prefix, 0) == 0) {
            out.push_back(a.substr(prefix.size()));
        }
    }
    return out;
}

//==========================================================================================================
// LocalLeagueServer
// Purpose: In-process league server. Serves get_standings and the league://standings resource over the
//          server end of an InMemoryTransport pair; the client end is handed to the Client.
//==========================================================================================================
class LocalLeagueServer : public ITransportFactory {
public:
    ~LocalLeagueServer() override {
        if (serverEnd) {
            serverEnd->Close().get();
        }
    }

    std::unique_ptr<ITransport> CreateTransport(const std::string&) override {
        auto pair = InMemoryTransport::CreatePair();
        pair.second->SetRequestHandler([this](const JSONRPCRequest& req) { return handle(req); });
        pair.second->Start().get();
        std::lock_guard<std::mutex> lock(mutex);
        serverEnd = std::move(pair.second);
        return std::move(pair.first);
    }

    // Announces a new round of standings to subscribers.
    bool PublishRound(int64_t next) {
        std::lock_guard<std::mutex> lock(mutex);
        round = next;
        if (!serverEnd) {
            return false;
        }
        return serverEnd->SendNotificationToPeer(JSONRPCNotification(Methods::ResourceUpdated,
            MakeObject({{"uri", JSONValue("league://standings")}, {"contents", standingsLocked()}})));
    }

private:
    std::unique_ptr<JSONRPCResponse> handle(const JSONRPCRequest& req) {
        auto ok = [&req](JSONValue result) { return std::make_unique<JSONRPCResponse>(req.id, std::move(result)); };
        if (req.method == Methods::Initialize) {
            return ok(MakeObject({
                {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
                {"capabilities", MakeObject({{"resources", MakeObject({{"subscribe", JSONValue(true)}})}})},
                {"serverInfo", MakeObject({{"name", JSONValue("league-manager")}, {"version", JSONValue("0.1.0")}})},
            }));
        }
        if (req.method == Methods::ListTools) {
            JSONValue::Array tools;
            tools.push_back(std::make_shared<JSONValue>(MakeObject({
                {"name", JSONValue("get_standings")},
                {"description", JSONValue("Current league table")},
                {"inputSchema", MakeObject({{"type", JSONValue("object")}})},
            })));
            return ok(MakeObject({{"tools", JSONValue(std::move(tools))}}));
        }
        if (req.method == Methods::ListResources) {
            JSONValue::Array resources;
            resources.push_back(std::make_shared<JSONValue>(MakeObject({
                {"uri", JSONValue("league://standings")}, {"name", JSONValue("Standings")},
            })));
            return ok(MakeObject({{"resources", JSONValue(std::move(resources))}}));
        }
        if (req.method == Methods::CallTool || req.method == Methods::ReadResource) {
            std::lock_guard<std::mutex> lock(mutex);
            return ok(req.method == Methods::CallTool ? standingsLocked()
                                                      : MakeObject({{"contents", standingsLocked()}}));
        }
        if (req.method == Methods::Ping || req.method == Methods::Subscribe || req.method == Methods::Unsubscribe) {
            return ok(MakeObject({}));
        }
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    }

    // Caller holds mutex.
    JSONValue standingsLocked() const {
        return MakeObject({
            {"round", JSONValue(round)},
            {"leader", JSONValue("player-1")},
            {"points", JSONValue(round * 3)},
        });
    }

    std::mutex mutex;
    std::unique_ptr<InMemoryTransport> serverEnd;
    int64_t round{1};
};

//==========================================================================================================
// runLocalDemo
// Purpose: Connects to the in-process league server, calls its tool, subscribes to the standings and
//          waits for one pushed update.
//==========================================================================================================
static int runLocalDemo(IClient& client) {
    auto league = std::make_shared<LocalLeagueServer>();
    ServerConfig sc;
    sc.serverName = "league";
    sc.transport = "memory";
    sc.transportFactory = league;

    try {
        auto handle = client.Connect(sc).get();
        LOG_INFO("Connected to '{}' ({}), {} tool(s)", handle.serverName, handle.serverInfo.name, handle.toolCount);

        auto standings = client.CallTool("league.get_standings", MakeObject({})).get();
        std::cout << "league.get_standings -> " << SerializeJSON(standings) << std::endl;

        std::promise<JSONValue> update;
        auto updateFut = update.get_future();
        std::once_flag once;
        client.SubscribeResource("league://standings", [&](const std::string& uri, const JSONValue& value) {
            std::call_once(once, [&] { update.set_value(value); });
            LOG_INFO("Update for {}", uri);
        });
        if (!league->PublishRound(2)) {
            LOG_WARN("League server has no connected client");
        }
        if (updateFut.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
            std::cout << "league://standings -> " << SerializeJSON(updateFut.get()) << std::endl;
        } else {
            LOG_WARN("No standings update within 2s");
        }
        client.UnsubscribeResource("league://standings");
    } catch (const std::exception& e) {
        LOG_ERROR("Local league demo failed: {}", e.what());
        client.DisconnectAll();
        return 1;
    }

    std::cout << SerializeJSON(client.GetHealthReport()) << std::endl;
    // The league server must outlive the session that borrows its transport.
    client.DisconnectAll();
    return 0;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnvironment();

    const auto servers = getServerArgs(argc, argv);

    ClientConfig config;
    try {
        config = ClientConfig::FromEnvironment();
        if (auto text = getArgValue(argc, argv, "--config")) {
            config = ParseClientConfig(*text, config);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }

    ClientFactory factory;
    auto client = factory.CreateClient(config);
    client->SetNotificationHandler([](const std::string& server, const JSONRPCNotification& n) {
        LOG_INFO("Notification from '{}': {}", server, n.method);
    });

    if (servers.empty()) {
        LOG_INFO("No --server given; running against the in-process league server");
        return runLocalDemo(*client);
    }

    int failures = 0;
    for (const auto& descriptor : servers) {
        try {
            auto handle = client->Connect(ParseServerConfig(descriptor)).get();
            LOG_INFO("Connected to '{}' ({} {}), session {}, {} tool(s)", handle.serverName, handle.serverInfo.name,
                     handle.serverInfo.version, handle.sessionId, handle.toolCount);
        } catch (const errors::Error& e) {
            LOG_ERROR("Connect failed for '{}': {} (retryable={})", descriptor, e.what(), e.IsRetryable());
            ++failures;
        } catch (const std::exception& e) {
            LOG_ERROR("Connect failed for '{}': {}", descriptor, e.what());
            ++failures;
        }
    }

    for (const auto& tool : client->ListTools()) {
        std::cout << tool.namespacedName << "  " << tool.description << std::endl;
    }

    if (auto toolName = getArgValue(argc, argv, "--call")) {
        try {
            auto result = client->CallTool(*toolName, MakeObject({})).get();
            std::cout << SerializeJSON(result) << std::endl;
        } catch (const std::exception& e) {
            LOG_ERROR("Call to '{}' failed: {}", *toolName, e.what());
            ++failures;
        }
    }

    std::cout << SerializeJSON(client->GetHealthReport()) << std::endl;
    client->DisconnectAll();
    return failures == 0 ? 0 : 1;
}
