//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceManager.h
// Purpose: Resource subscriptions, last-value cache and change-notification fan-out
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpleague/JSONRPCTypes.h"
#include "mcpleague/Protocol.h"

namespace mcpleague {

// Invoked once per update with the new value of the resource.
using ResourceCallback = std::function<void(const std::string& uri, const JSONValue& value)>;

struct SubscriptionHandle {
    std::string uri;
    std::string subscriberId;
    std::string serverName;
    // false when the (subscriberId, uri) pair was already subscribed.
    bool created{false};
};

struct CachedResource {
    JSONValue value;
    std::chrono::steady_clock::time_point updatedAt;
    uint64_t version{0};
};

struct ResourceStats {
    std::size_t subscriptionCount{0};
    std::size_t uriCount{0};
    std::size_t cachedCount{0};
    uint64_t notificationsDelivered{0};
    uint64_t callbackErrors{0};
};

//==========================================================================================================
// ResourceManager
// Purpose: At most one subscription per (subscriberId, uri), at most one upstream subscription per uri.
//          Updates replace the cached value whole and reach every subscriber of the uri once, in the
//          order the server sent them.
//==========================================================================================================
class ResourceManager {
public:
    //==========================================================================================================
    // UpstreamCaller
    // Purpose: Sends method/params to the named server and yields the result (normally
    //          ConnectionManager::Call of that server's session).
    //==========================================================================================================
    using UpstreamCaller = std::function<std::future<JSONValue>(const std::string& serverName,
                                                                const std::string& method,
                                                                const JSONValue& params)>;

    explicit ResourceManager(UpstreamCaller caller,
                             std::chrono::milliseconds cacheTtl = std::chrono::seconds(60));
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    //==========================================================================================================
    // Subscribe
    // Purpose: Registers callback for (subscriberId, uri). The first subscriber of a uri issues the
    //          upstream resources/subscribe and blocks until it completes; later subscribers wait for
    //          that same call. A repeat for an existing pair returns the existing subscription. A first
    //          subscriber waits for any upstream unsubscribe of the uri still in flight.
    // Returns:
    //   The subscription handle. On upstream failure the local registration is rolled back and the
    //   upstream error is rethrown. Throws std::invalid_argument when the uri is already subscribed on a
    //   different server.
    //==========================================================================================================
    SubscriptionHandle Subscribe(const std::string& serverName, const std::string& uri,
                                 const std::string& subscriberId, ResourceCallback callback);

    //==========================================================================================================
    // Unsubscribe
    // Purpose: Removes the subscription. When it was the last one for the uri, resources/unsubscribe is
    //          sent upstream; a failure there is logged and the local removal stands.
    // Returns:
    //   false when no such subscription existed.
    //==========================================================================================================
    bool Unsubscribe(const std::string& uri, const std::string& subscriberId);

    //==========================================================================================================
    // OnResourceUpdated
    // Purpose: Handles notifications/resources/updated. The cached value becomes params.contents when
    //          present, else params. Callbacks run in registration order; a throwing callback is logged
    //          and the rest still run.
    //==========================================================================================================
    void OnResourceUpdated(const std::string& serverName, const JSONValue& params);

    ////////////////////////////////////////// Catalog //////////////////////////////////////////
    void RegisterServerResources(const std::string& serverName, std::vector<Resource> resources);
    std::optional<std::string> FindOwner(const std::string& uri) const;
    std::vector<Resource> ListResources(const std::optional<std::string>& serverName = std::nullopt) const;

    // { resources: [ {uri, name?, description?, mimeType?} ] } -> descriptors; entries without uri skipped.
    static std::vector<Resource> ParseResourcesListResult(const JSONValue& result);

    ////////////////////////////////////////// Cache //////////////////////////////////////////
    // Cached value, or std::nullopt when absent or older than the TTL.
    std::optional<CachedResource> GetCached(const std::string& uri) const;
    void PutCached(const std::string& uri, JSONValue value);
    bool InvalidateCache(const std::string& uri);
    void ClearCache();

    bool IsSubscribed(const std::string& uri, const std::string& subscriberId) const;
    std::vector<std::string> ListSubscribers(const std::string& uri) const;

    // Forgets everything owned by serverName (subscriptions, catalog, cache). No upstream traffic.
    void DropServer(const std::string& serverName);

    ResourceStats GetStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
