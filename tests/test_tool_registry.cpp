//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: Namespaced tool catalog: registration, resolution, collisions and tools/list parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mcpleague/ToolRegistry.h"
#include "mcpleague/errors/Errors.h"

using namespace mcpleague;

namespace {

JSONValue schemaWith(const std::string& prop) {
    return MakeObject({{"type", JSONValue("object")},
                       {"properties", MakeObject({{prop, MakeObject({{"type", JSONValue("string")}})}})}});
}

} // namespace

TEST(ToolRegistry, RegisterIsIdempotentForIdenticalContent) {
    ToolRegistry reg;
    EXPECT_EQ(reg.RegisterTool("weather", ToolDescriptor::Make("weather", "forecast", "Daily forecast", schemaWith("city"))),
              RegisterResult::Added);
    EXPECT_EQ(reg.RegisterTool("weather", ToolDescriptor::Make("weather", "forecast", "Daily forecast", schemaWith("city"))),
              RegisterResult::Unchanged);
    EXPECT_EQ(reg.RegisterTool("weather", ToolDescriptor::Make("weather", "forecast", "Daily forecast", schemaWith("zip"))),
              RegisterResult::Updated);
    EXPECT_EQ(reg.Size(), 1u);

    const auto d = reg.Resolve("weather.forecast");
    EXPECT_EQ(d.serverName, "weather");
    EXPECT_EQ(d.rawName, "forecast");
    EXPECT_NE(FindMember(*FindMember(d.inputSchema, "properties"), "zip"), nullptr);
}

TEST(ToolRegistry, ServerNameArgumentWinsOverDescriptor) {
    ToolRegistry reg;
    reg.RegisterTool("billing", ToolDescriptor::Make("somewhere-else", "charge"));
    const auto d = reg.Resolve("billing.charge");
    EXPECT_EQ(d.serverName, "billing");
    EXPECT_EQ(d.namespacedName, "billing.charge");
}

TEST(ToolRegistry, UnqualifiedNameResolvesWhenUnique) {
    ToolRegistry reg;
    reg.RegisterServerTools("weather", {ToolDescriptor::Make("weather", "forecast")});
    reg.RegisterServerTools("maps", {ToolDescriptor::Make("maps", "route")});

    EXPECT_EQ(reg.Resolve("route").namespacedName, "maps.route");
    EXPECT_TRUE(reg.HasTool("forecast"));
    EXPECT_TRUE(reg.HasTool("maps.route"));
    EXPECT_FALSE(reg.HasTool("teleport"));
    EXPECT_THROW(reg.Resolve("teleport"), errors::ToolNotFoundError);
    EXPECT_THROW(reg.Resolve("weather.route"), errors::ToolNotFoundError);
}

TEST(ToolRegistry, AmbiguousUnqualifiedNameFailsLoudly) {
    ToolRegistry reg;
    reg.RegisterServerTools("alpha", {ToolDescriptor::Make("alpha", "search")});
    reg.RegisterServerTools("beta", {ToolDescriptor::Make("beta", "search")});

    try {
        reg.Resolve("search");
        FAIL() << "expected AmbiguousToolNameError";
    } catch (const errors::AmbiguousToolNameError& e) {
        EXPECT_EQ(e.Candidates(), (std::vector<std::string>{"alpha.search", "beta.search"}));
    }
    EXPECT_EQ(reg.Resolve("beta.search").serverName, "beta");

    const auto collisions = reg.GetCollisions();
    ASSERT_EQ(collisions.size(), 1u);
    EXPECT_EQ(collisions.at("search").size(), 2u);
}

TEST(ToolRegistry, DottedRawNameResolves) {
    ToolRegistry reg;
    reg.RegisterServerTools("arena", {ToolDescriptor::Make("arena", "game.move")});
    EXPECT_EQ(reg.Resolve("game.move").namespacedName, "arena.game.move");
    EXPECT_EQ(reg.Resolve("arena.game.move").rawName, "game.move");
}

TEST(ToolRegistry, DottedServerNameCannotShadowAnotherServer) {
    ToolRegistry reg;
    reg.RegisterTool("game", ToolDescriptor::Make("game", "server.get_state", "from game"));
    EXPECT_THROW(reg.RegisterTool("game.server", ToolDescriptor::Make("game.server", "get_state", "impostor")),
                 std::invalid_argument);
    EXPECT_THROW(reg.RegisterServerTools("game.server", {ToolDescriptor::Make("game.server", "get_state")}),
                 std::invalid_argument);
    EXPECT_THROW(reg.RegisterTool("", ToolDescriptor::Make("", "get_state")), std::invalid_argument);

    EXPECT_EQ(reg.Size(), 1u);
    const auto d = reg.Resolve("game.server.get_state");
    EXPECT_EQ(d.serverName, "game");
    EXPECT_EQ(d.description, "from game");
}

TEST(ToolRegistry, RegisterServerToolsReplacesCatalog) {
    ToolRegistry reg;
    reg.RegisterServerTools("weather", {ToolDescriptor::Make("weather", "forecast"),
                                        ToolDescriptor::Make("weather", "alerts")});
    reg.RegisterServerTools("maps", {ToolDescriptor::Make("maps", "route")});
    EXPECT_EQ(reg.ListTools("weather").size(), 2u);

    reg.RegisterServerTools("weather", {ToolDescriptor::Make("weather", "radar")});
    const auto weather = reg.ListTools("weather");
    ASSERT_EQ(weather.size(), 1u);
    EXPECT_EQ(weather.front().rawName, "radar");
    EXPECT_FALSE(reg.HasTool("weather.alerts"));
    EXPECT_EQ(reg.ListTools().size(), 2u);

    EXPECT_EQ(reg.UnregisterServerTools("weather"), 1u);
    EXPECT_EQ(reg.UnregisterServerTools("weather"), 0u);
    EXPECT_EQ(reg.ListTools().size(), 1u);
    EXPECT_TRUE(reg.ListTools("weather").empty());
}

TEST(ToolRegistry, ListingIsSortedByNamespacedName) {
    ToolRegistry reg;
    reg.RegisterServerTools("zeta", {ToolDescriptor::Make("zeta", "b"), ToolDescriptor::Make("zeta", "a")});
    reg.RegisterServerTools("alpha", {ToolDescriptor::Make("alpha", "c")});
    std::vector<std::string> names;
    for (const auto& d : reg.ListTools()) {
        names.push_back(d.namespacedName);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"alpha.c", "zeta.a", "zeta.b"}));
}

TEST(ToolRegistry, RecordsCallStatistics) {
    ToolRegistry reg;
    reg.RegisterServerTools("weather", {ToolDescriptor::Make("weather", "forecast")});
    EXPECT_FALSE(reg.GetToolStats("weather.forecast").has_value());
    reg.RecordCall("weather.forecast");
    reg.RecordCall("weather.forecast");
    auto stats = reg.GetToolStats("weather.forecast");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->callCount, 2u);
    EXPECT_TRUE(stats->lastCalled.has_value());
}

TEST(ToolRegistry, ParsesToolsListResult) {
    const auto result = ParseJSON(R"({"tools":[
        {"name":"forecast","description":"Daily forecast","inputSchema":{"type":"object"}},
        {"description":"no name here"},
        {"name":""},
        {"name":"alerts"}
    ]})");
    const auto tools = ToolRegistry::ParseToolsListResult("weather", result);
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].namespacedName, "weather.forecast");
    EXPECT_EQ(tools[0].description, "Daily forecast");
    EXPECT_EQ(GetStringMember(tools[0].inputSchema, "type").value_or(""), "object");
    EXPECT_EQ(tools[1].rawName, "alerts");
    EXPECT_TRUE(tools[1].description.empty());
    EXPECT_TRUE(tools[1].inputSchema.IsNull());

    EXPECT_TRUE(ToolRegistry::ParseToolsListResult("weather", ParseJSON(R"({"items":[]})")).empty());
}
