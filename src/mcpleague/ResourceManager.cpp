//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceManager.cpp
// Purpose: Resource subscriptions, cache and notification fan-out
//==========================================================================================================

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "logging/Logger.h"
#include "mcpleague/ResourceManager.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

namespace {

struct Subscriber {
    std::string id;
    ResourceCallback callback;
};

// Subscribers of one uri. Replaced, never reused, once the last subscriber leaves.
struct UriEntry {
    std::string serverName;
    std::vector<Subscriber> subscribers;
    std::shared_future<void> upstreamReady;
};

JSONValue uriParams(const std::string& uri) {
    return MakeObject({{"uri", JSONValue(uri)}});
}

} // namespace

class ResourceManager::Impl {
public:
    Impl(UpstreamCaller c, std::chrono::milliseconds ttl) : caller(std::move(c)), cacheTtl(ttl) {}

    UpstreamCaller caller;
    std::chrono::milliseconds cacheTtl;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<UriEntry>> entries;
    // Upstream unsubscribes still in flight per uri; a new first subscriber waits for them.
    // Keyed by uri; the number tells a replaced tombstone from the current one.
    std::unordered_map<std::string, std::pair<uint64_t, std::shared_future<void>>> unsubscribing;
    uint64_t unsubscribeSeq{0};
    // serverName -> uri -> resource
    std::map<std::string, std::map<std::string, Resource>> catalog;

    mutable std::mutex cacheMutex;
    std::unordered_map<std::string, std::shared_ptr<const CachedResource>> cache;
    uint64_t cacheVersion{0};

    mutable std::mutex statsMutex;
    uint64_t notificationsDelivered{0};
    uint64_t callbackErrors{0};

    // Drops a failed entry unless it has already been replaced.
    void rollback(const std::string& uri, const std::shared_ptr<UriEntry>& entry) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(uri);
        if (it != entries.end() && it->second == entry) {
            entries.erase(it);
        }
    }
};

ResourceManager::ResourceManager(UpstreamCaller caller, std::chrono::milliseconds cacheTtl)
    : pImpl(std::make_unique<Impl>(std::move(caller), cacheTtl)) {
    FUNC_SCOPE();
    if (!pImpl->caller) {
        throw std::invalid_argument("ResourceManager requires an upstream caller");
    }
}

ResourceManager::~ResourceManager() = default;

SubscriptionHandle ResourceManager::Subscribe(const std::string& serverName, const std::string& uri,
                                              const std::string& subscriberId, ResourceCallback callback) {
    FUNC_SCOPE();
    SubscriptionHandle handle{uri, subscriberId, serverName, false};
    std::shared_ptr<UriEntry> entry;
    std::promise<void> upstreamPromise;
    std::shared_future<void> priorUnsubscribe;
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->entries.find(uri);
        if (it == pImpl->entries.end()) {
            entry = std::make_shared<UriEntry>();
            entry->serverName = serverName;
            entry->upstreamReady = upstreamPromise.get_future().share();
            pImpl->entries.emplace(uri, entry);
            auto pending = pImpl->unsubscribing.find(uri);
            if (pending != pImpl->unsubscribing.end()) {
                priorUnsubscribe = pending->second.second;
            }
            first = true;
        } else {
            entry = it->second;
            if (entry->serverName != serverName) {
                throw std::invalid_argument("Resource " + uri + " is already subscribed on '" + entry->serverName +
                                            "', not '" + serverName + "'");
            }
        }
        handle.serverName = entry->serverName;
        auto existing = std::find_if(entry->subscribers.begin(), entry->subscribers.end(),
                                     [&](const Subscriber& s) { return s.id == subscriberId; });
        if (existing == entry->subscribers.end()) {
            entry->subscribers.push_back(Subscriber{subscriberId, std::move(callback)});
            handle.created = true;
        }
    }

    if (first) {
        if (priorUnsubscribe.valid()) {
            priorUnsubscribe.wait();
        }
        try {
            pImpl->caller(entry->serverName, Methods::Subscribe, uriParams(uri)).get();
        } catch (const std::exception& e) {
            LOG_WARN("Upstream subscribe of {} on '{}' failed: {}", uri, entry->serverName, e.what());
            pImpl->rollback(uri, entry);
            upstreamPromise.set_exception(std::current_exception());
            throw;
        }
        upstreamPromise.set_value();
        LOG_INFO("Subscribed to {} on '{}'", uri, entry->serverName);
        return handle;
    }

    // Wait for the upstream subscribe issued by the first subscriber.
    try {
        entry->upstreamReady.get();
    } catch (const std::exception&) {
        if (handle.created) {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            auto& subs = entry->subscribers;
            subs.erase(std::remove_if(subs.begin(), subs.end(),
                                      [&](const Subscriber& s) { return s.id == subscriberId; }),
                       subs.end());
        }
        throw;
    }
    return handle;
}

bool ResourceManager::Unsubscribe(const std::string& uri, const std::string& subscriberId) {
    FUNC_SCOPE();
    std::shared_ptr<UriEntry> emptied;
    std::promise<void> done;
    uint64_t tombstone = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->entries.find(uri);
        if (it == pImpl->entries.end()) {
            return false;
        }
        auto& subs = it->second->subscribers;
        auto sub = std::find_if(subs.begin(), subs.end(), [&](const Subscriber& s) { return s.id == subscriberId; });
        if (sub == subs.end()) {
            return false;
        }
        subs.erase(sub);
        if (subs.empty()) {
            emptied = it->second;
            pImpl->entries.erase(it);
            tombstone = ++pImpl->unsubscribeSeq;
            pImpl->unsubscribing[uri] = {tombstone, done.get_future().share()};
        }
    }
    if (!emptied) {
        return true;
    }

    bool upstreamExists = true;
    try {
        emptied->upstreamReady.get();
    } catch (const std::exception&) {
        // The upstream subscription never existed.
        upstreamExists = false;
    }
    if (upstreamExists) {
        try {
            pImpl->caller(emptied->serverName, Methods::Unsubscribe, uriParams(uri)).get();
            LOG_INFO("Unsubscribed from {} on '{}'", uri, emptied->serverName);
        } catch (const std::exception& e) {
            LOG_WARN("Upstream unsubscribe of {} on '{}' failed: {}", uri, emptied->serverName, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->unsubscribing.find(uri);
        // A later unsubscribe of the same uri may have replaced ours.
        if (it != pImpl->unsubscribing.end() && it->second.first == tombstone) {
            pImpl->unsubscribing.erase(it);
        }
    }
    done.set_value();
    return true;
}

void ResourceManager::OnResourceUpdated(const std::string& serverName, const JSONValue& params) {
    FUNC_SCOPE();
    auto uri = GetStringMember(params, "uri");
    if (!uri.has_value()) {
        LOG_WARN("Resource update from '{}' without uri ignored", serverName);
        return;
    }
    const JSONValue* contents = FindMember(params, "contents");
    JSONValue value = contents != nullptr ? *contents : params;
    PutCached(*uri, value);

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->entries.find(*uri);
        if (it != pImpl->entries.end()) {
            subscribers = it->second->subscribers;
        }
    }
    uint64_t delivered = 0, failed = 0;
    for (const auto& s : subscribers) {
        if (!s.callback) {
            continue;
        }
        try {
            s.callback(*uri, value);
            ++delivered;
        } catch (const std::exception& e) {
            ++failed;
            LOG_ERROR("Resource callback of '{}' for {} threw: {}", s.id, *uri, e.what());
        }
    }
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    pImpl->notificationsDelivered += delivered;
    pImpl->callbackErrors += failed;
}

void ResourceManager::RegisterServerResources(const std::string& serverName, std::vector<Resource> resources) {
    FUNC_SCOPE();
    std::map<std::string, Resource> fresh;
    for (auto& r : resources) {
        auto key = r.uri;
        fresh[key] = std::move(r);
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    LOG_DEBUG("Catalog for '{}': {} resource(s)", serverName, fresh.size());
    pImpl->catalog[serverName] = std::move(fresh);
}

std::optional<std::string> ResourceManager::FindOwner(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& [server, resources] : pImpl->catalog) {
        if (resources.find(uri) != resources.end()) {
            return server;
        }
    }
    auto it = pImpl->entries.find(uri);
    if (it != pImpl->entries.end()) {
        return it->second->serverName;
    }
    return std::nullopt;
}

std::vector<Resource> ResourceManager::ListResources(const std::optional<std::string>& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<Resource> out;
    for (const auto& [server, resources] : pImpl->catalog) {
        if (serverName.has_value() && server != *serverName) {
            continue;
        }
        for (const auto& [uri, r] : resources) {
            out.push_back(r);
        }
    }
    return out;
}

std::vector<Resource> ResourceManager::ParseResourcesListResult(const JSONValue& result) {
    std::vector<Resource> out;
    const JSONValue* list = FindMember(result, "resources");
    if (list == nullptr || !list->IsArray()) {
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(list->value)) {
        if (!item) {
            continue;
        }
        auto uri = GetStringMember(*item, "uri");
        if (!uri.has_value()) {
            continue;
        }
        out.emplace_back(*uri, GetStringMember(*item, "name").value_or(*uri),
                         GetStringMember(*item, "description"), GetStringMember(*item, "mimeType"));
    }
    return out;
}

std::optional<CachedResource> ResourceManager::GetCached(const std::string& uri) const {
    std::shared_ptr<const CachedResource> entry;
    {
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        auto it = pImpl->cache.find(uri);
        if (it == pImpl->cache.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    if (pImpl->cacheTtl.count() > 0 && std::chrono::steady_clock::now() - entry->updatedAt > pImpl->cacheTtl) {
        return std::nullopt;
    }
    return *entry;
}

void ResourceManager::PutCached(const std::string& uri, JSONValue value) {
    auto fresh = std::make_shared<CachedResource>();
    fresh->value = std::move(value);
    fresh->updatedAt = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    fresh->version = ++pImpl->cacheVersion;
    pImpl->cache[uri] = std::move(fresh);
}

bool ResourceManager::InvalidateCache(const std::string& uri) {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    return pImpl->cache.erase(uri) > 0;
}

void ResourceManager::ClearCache() {
    std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
    pImpl->cache.clear();
}

bool ResourceManager::IsSubscribed(const std::string& uri, const std::string& subscriberId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(uri);
    if (it == pImpl->entries.end()) {
        return false;
    }
    const auto& subs = it->second->subscribers;
    return std::any_of(subs.begin(), subs.end(), [&](const Subscriber& s) { return s.id == subscriberId; });
}

std::vector<std::string> ResourceManager::ListSubscribers(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> out;
    auto it = pImpl->entries.find(uri);
    if (it != pImpl->entries.end()) {
        for (const auto& s : it->second->subscribers) {
            out.push_back(s.id);
        }
    }
    return out;
}

void ResourceManager::DropServer(const std::string& serverName) {
    FUNC_SCOPE();
    std::vector<std::string> uris;
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto it = pImpl->entries.begin(); it != pImpl->entries.end();) {
            if (it->second->serverName == serverName) {
                dropped += it->second->subscribers.size();
                uris.push_back(it->first);
                it = pImpl->entries.erase(it);
            } else {
                ++it;
            }
        }
        auto cat = pImpl->catalog.find(serverName);
        if (cat != pImpl->catalog.end()) {
            for (const auto& [uri, r] : cat->second) {
                uris.push_back(uri);
            }
            pImpl->catalog.erase(cat);
        }
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        for (const auto& uri : uris) {
            pImpl->cache.erase(uri);
        }
    }
    if (dropped > 0) {
        LOG_INFO("Dropped {} subscription(s) of closed session '{}'", dropped, serverName);
    }
}

ResourceStats ResourceManager::GetStats() const {
    ResourceStats stats;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        stats.uriCount = pImpl->entries.size();
        for (const auto& [uri, e] : pImpl->entries) {
            stats.subscriptionCount += e->subscribers.size();
        }
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->cacheMutex);
        stats.cachedCount = pImpl->cache.size();
    }
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    stats.notificationsDelivered = pImpl->notificationsDelivered;
    stats.callbackErrors = pImpl->callbackErrors;
    return stats;
}

} // namespace mcpleague
