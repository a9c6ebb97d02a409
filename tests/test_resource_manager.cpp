//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_resource_manager.cpp
// Purpose: Subscription bookkeeping, upstream subscribe/unsubscribe, update fan-out and the cache
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcpleague/ResourceManager.h"
#include "mcpleague/errors/Errors.h"

using namespace mcpleague;
using namespace std::chrono_literals;

namespace {

// Records upstream traffic; every call succeeds unless failNext is set.
struct UpstreamRecorder {
    std::mutex mutex;
    std::vector<std::string> calls;
    bool failNext{false};
    std::shared_future<void> gate;

    ResourceManager::UpstreamCaller Caller() {
        return [this](const std::string& server, const std::string& method, const JSONValue& params) {
            bool fail = false;
            std::shared_future<void> wait;
            {
                std::lock_guard<std::mutex> lock(mutex);
                calls.push_back(server + " " + method + " " + GetStringMember(params, "uri").value_or("?"));
                fail = failNext;
                failNext = false;
                wait = gate;
            }
            if (wait.valid()) {
                wait.wait();
            }
            if (fail) {
                return errors::MakeFailedFuture<JSONValue>(errors::TransportError("upstream unavailable"));
            }
            std::promise<JSONValue> p;
            p.set_value(JSONValue(JSONValue::Object{}));
            return p.get_future();
        };
    }

    std::vector<std::string> Calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

JSONValue update(const std::string& uri, const std::string& text) {
    return MakeObject({{"uri", JSONValue(uri)},
                       {"contents", MakeObject({{"text", JSONValue(text)}})}});
}

} // namespace

TEST(ResourceManager, RequiresCaller) {
    EXPECT_THROW(ResourceManager(nullptr), std::invalid_argument);
}

TEST(ResourceManager, FirstSubscriberSubscribesUpstreamOnce) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());

    auto a = rm.Subscribe("files", "file:///a.txt", "agent-1", [](const std::string&, const JSONValue&) {});
    EXPECT_TRUE(a.created);
    EXPECT_EQ(a.serverName, "files");
    auto b = rm.Subscribe("files", "file:///a.txt", "agent-2", [](const std::string&, const JSONValue&) {});
    EXPECT_TRUE(b.created);
    auto again = rm.Subscribe("files", "file:///a.txt", "agent-1", [](const std::string&, const JSONValue&) {});
    EXPECT_FALSE(again.created);

    EXPECT_EQ(up.Calls(), std::vector<std::string>{"files resources/subscribe file:///a.txt"});
    EXPECT_EQ(rm.ListSubscribers("file:///a.txt"), (std::vector<std::string>{"agent-1", "agent-2"}));
    EXPECT_TRUE(rm.IsSubscribed("file:///a.txt", "agent-2"));

    const auto stats = rm.GetStats();
    EXPECT_EQ(stats.subscriptionCount, 2u);
    EXPECT_EQ(stats.uriCount, 1u);
}

TEST(ResourceManager, LastUnsubscribeGoesUpstream) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);
    rm.Subscribe("files", "file:///a.txt", "agent-2", nullptr);

    EXPECT_TRUE(rm.Unsubscribe("file:///a.txt", "agent-1"));
    EXPECT_EQ(up.Calls().size(), 1u);
    EXPECT_FALSE(rm.Unsubscribe("file:///a.txt", "agent-1"));
    EXPECT_TRUE(rm.Unsubscribe("file:///a.txt", "agent-2"));
    ASSERT_EQ(up.Calls().size(), 2u);
    EXPECT_EQ(up.Calls().back(), "files resources/unsubscribe file:///a.txt");
    EXPECT_FALSE(rm.Unsubscribe("file:///never", "agent-1"));
    EXPECT_EQ(rm.GetStats().uriCount, 0u);
}

TEST(ResourceManager, UpstreamUnsubscribeFailureStillRemovesLocally) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);
    up.failNext = true;
    EXPECT_TRUE(rm.Unsubscribe("file:///a.txt", "agent-1"));
    EXPECT_FALSE(rm.IsSubscribed("file:///a.txt", "agent-1"));
}

TEST(ResourceManager, FailedUpstreamSubscribeRollsBack) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    up.failNext = true;
    EXPECT_THROW(rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr), errors::TransportError);
    EXPECT_FALSE(rm.IsSubscribed("file:///a.txt", "agent-1"));
    EXPECT_EQ(rm.GetStats().uriCount, 0u);

    // A later attempt starts from scratch.
    auto h = rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);
    EXPECT_TRUE(h.created);
    EXPECT_EQ(up.Calls().size(), 2u);
}

TEST(ResourceManager, ConcurrentSubscribersShareOneUpstreamCall) {
    UpstreamRecorder up;
    std::promise<void> open;
    up.gate = open.get_future().share();
    ResourceManager rm(up.Caller());

    auto first = std::async(std::launch::async, [&] { return rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr); });
    // Let the first subscriber reach the upstream call before the second arrives.
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (up.Calls().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(up.Calls().size(), 1u);
    auto second = std::async(std::launch::async, [&] { return rm.Subscribe("files", "file:///a.txt", "agent-2", nullptr); });
    EXPECT_EQ(second.wait_for(50ms), std::future_status::timeout);

    open.set_value();
    EXPECT_TRUE(first.get().created);
    EXPECT_TRUE(second.get().created);
    EXPECT_EQ(up.Calls().size(), 1u);
}

TEST(ResourceManager, ResubscribeWaitsForUpstreamUnsubscribe) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);

    std::promise<void> open;
    up.gate = open.get_future().share();
    auto leaving = std::async(std::launch::async, [&] { return rm.Unsubscribe("file:///a.txt", "agent-1"); });
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (up.Calls().size() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(up.Calls().size(), 2u);

    auto joining = std::async(std::launch::async, [&] { return rm.Subscribe("files", "file:///a.txt", "agent-2", nullptr); });
    EXPECT_EQ(joining.wait_for(50ms), std::future_status::timeout);
    // The new upstream subscribe is held back until the unsubscribe settles.
    EXPECT_EQ(up.Calls().size(), 2u);

    open.set_value();
    EXPECT_TRUE(leaving.get());
    EXPECT_TRUE(joining.get().created);
    const std::vector<std::string> expected{"files resources/subscribe file:///a.txt",
                                            "files resources/unsubscribe file:///a.txt",
                                            "files resources/subscribe file:///a.txt"};
    EXPECT_EQ(up.Calls(), expected);
    EXPECT_TRUE(rm.IsSubscribed("file:///a.txt", "agent-2"));
}

TEST(ResourceManager, SubscribeOnDifferentServerIsRejected) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);
    EXPECT_THROW(rm.Subscribe("backup", "file:///a.txt", "agent-2", nullptr), std::invalid_argument);
    EXPECT_FALSE(rm.IsSubscribed("file:///a.txt", "agent-2"));
    EXPECT_EQ(rm.ListSubscribers("file:///a.txt"), std::vector<std::string>{"agent-1"});
    EXPECT_EQ(up.Calls().size(), 1u);
}

TEST(ResourceManager, UpdatesFanOutInOrderAndSurviveThrowingCallbacks) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    std::vector<std::string> order;
    rm.Subscribe("files", "file:///a.txt", "first", [&](const std::string& uri, const JSONValue& v) {
        order.push_back("first:" + uri + ":" + GetStringMember(v, "text").value_or(""));
    });
    rm.Subscribe("files", "file:///a.txt", "broken", [](const std::string&, const JSONValue&) {
        throw std::runtime_error("callback bug");
    });
    rm.Subscribe("files", "file:///a.txt", "last", [&](const std::string&, const JSONValue&) {
        order.push_back("last");
    });

    rm.OnResourceUpdated("files", update("file:///a.txt", "v2"));
    EXPECT_EQ(order, (std::vector<std::string>{"first:file:///a.txt:v2", "last"}));

    const auto stats = rm.GetStats();
    EXPECT_EQ(stats.notificationsDelivered, 2u);
    EXPECT_EQ(stats.callbackErrors, 1u);

    auto cached = rm.GetCached("file:///a.txt");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(GetStringMember(cached->value, "text").value_or(""), "v2");
}

TEST(ResourceManager, UpdateWithoutContentsCachesParamsAndIgnoresMissingUri) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.OnResourceUpdated("files", MakeObject({{"uri", JSONValue("file:///b.txt")}, {"etag", JSONValue("x1")}}));
    auto cached = rm.GetCached("file:///b.txt");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(GetStringMember(cached->value, "etag").value_or(""), "x1");

    rm.OnResourceUpdated("files", MakeObject({{"etag", JSONValue("x2")}}));
    EXPECT_EQ(rm.GetStats().cachedCount, 1u);
}

TEST(ResourceManager, CacheHonoursTtlAndVersions) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller(), 50ms);
    rm.PutCached("file:///a.txt", JSONValue("one"));
    auto v1 = rm.GetCached("file:///a.txt");
    ASSERT_TRUE(v1.has_value());
    rm.PutCached("file:///a.txt", JSONValue("two"));
    auto v2 = rm.GetCached("file:///a.txt");
    ASSERT_TRUE(v2.has_value());
    EXPECT_GT(v2->version, v1->version);

    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(rm.GetCached("file:///a.txt").has_value());

    rm.PutCached("file:///c.txt", JSONValue("three"));
    EXPECT_TRUE(rm.InvalidateCache("file:///c.txt"));
    EXPECT_FALSE(rm.InvalidateCache("file:///c.txt"));
    rm.PutCached("file:///d.txt", JSONValue("four"));
    rm.ClearCache();
    EXPECT_EQ(rm.GetStats().cachedCount, 0u);
}

TEST(ResourceManager, CatalogOwnershipAndParsing) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    const auto parsed = ResourceManager::ParseResourcesListResult(ParseJSON(R"({"resources":[
        {"uri":"file:///a.txt","name":"A","mimeType":"text/plain"},
        {"name":"no uri"},
        {"uri":"file:///b.txt"}
    ]})"));
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].name, "A");
    EXPECT_EQ(parsed[0].mimeType.value_or(""), "text/plain");
    EXPECT_EQ(parsed[1].name, "file:///b.txt");

    rm.RegisterServerResources("files", parsed);
    EXPECT_EQ(rm.FindOwner("file:///b.txt").value_or(""), "files");
    EXPECT_FALSE(rm.FindOwner("file:///zzz").has_value());
    EXPECT_EQ(rm.ListResources("files").size(), 2u);
    EXPECT_TRUE(rm.ListResources("other").empty());
}

TEST(ResourceManager, DropServerForgetsEverythingWithoutUpstreamTraffic) {
    UpstreamRecorder up;
    ResourceManager rm(up.Caller());
    rm.RegisterServerResources("files", {Resource("file:///a.txt", "A")});
    rm.Subscribe("files", "file:///a.txt", "agent-1", nullptr);
    rm.Subscribe("notes", "note://1", "agent-1", nullptr);
    rm.PutCached("file:///a.txt", JSONValue("cached"));
    const auto callsBefore = up.Calls().size();

    rm.DropServer("files");
    EXPECT_FALSE(rm.IsSubscribed("file:///a.txt", "agent-1"));
    EXPECT_TRUE(rm.IsSubscribed("note://1", "agent-1"));
    EXPECT_FALSE(rm.GetCached("file:///a.txt").has_value());
    EXPECT_FALSE(rm.FindOwner("file:///a.txt").has_value());
    EXPECT_EQ(up.Calls().size(), callsBefore);
}
