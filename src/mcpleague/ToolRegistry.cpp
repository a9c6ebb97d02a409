//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool catalog and name resolution
//==========================================================================================================

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpleague/ToolRegistry.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

void ValidateServerName(const std::string& serverName) {
    if (serverName.empty()) {
        throw std::invalid_argument("Server name must not be empty");
    }
    if (serverName.find('.') != std::string::npos) {
        throw std::invalid_argument("Server name '" + serverName + "' must not contain '.'");
    }
}

ToolDescriptor ToolDescriptor::Make(const std::string& serverName, const std::string& rawName,
                                    std::string description, JSONValue inputSchema) {
    ToolDescriptor d;
    d.serverName = serverName;
    d.rawName = rawName;
    d.namespacedName = serverName + "." + rawName;
    d.description = std::move(description);
    d.inputSchema = std::move(inputSchema);
    return d;
}

namespace {

bool sameContent(const ToolDescriptor& a, const ToolDescriptor& b) {
    return a.serverName == b.serverName && a.rawName == b.rawName && a.description == b.description &&
           JSONValueEquals(a.inputSchema, b.inputSchema);
}

} // namespace

class ToolRegistry::Impl {
public:
    mutable std::shared_mutex mutex;
    // Ordered so listings are stable.
    std::map<std::string, std::shared_ptr<const ToolDescriptor>> tools;

    mutable std::mutex statsMutex;
    std::unordered_map<std::string, ToolStats> stats;

    std::vector<std::shared_ptr<const ToolDescriptor>> matchRawLocked(const std::string& rawName) const {
        std::vector<std::shared_ptr<const ToolDescriptor>> out;
        for (const auto& [key, d] : tools) {
            if (d->rawName == rawName) {
                out.push_back(d);
            }
        }
        return out;
    }
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) {}
ToolRegistry::~ToolRegistry() = default;

RegisterResult ToolRegistry::RegisterTool(const std::string& serverName, ToolDescriptor descriptor) {
    FUNC_SCOPE();
    ValidateServerName(serverName);
    descriptor.serverName = serverName;
    descriptor.namespacedName = serverName + "." + descriptor.rawName;
    auto fresh = std::make_shared<const ToolDescriptor>(std::move(descriptor));

    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->tools.find(fresh->namespacedName);
    if (it == pImpl->tools.end()) {
        pImpl->tools.emplace(fresh->namespacedName, fresh);
        return RegisterResult::Added;
    }
    if (sameContent(*it->second, *fresh)) {
        return RegisterResult::Unchanged;
    }
    it->second = fresh;
    lock.unlock();
    LOG_INFO("Tool {} refreshed with changed descriptor", fresh->namespacedName);
    return RegisterResult::Updated;
}

void ToolRegistry::RegisterServerTools(const std::string& serverName, std::vector<ToolDescriptor> descriptors) {
    FUNC_SCOPE();
    ValidateServerName(serverName);
    std::map<std::string, std::shared_ptr<const ToolDescriptor>> fresh;
    for (auto& d : descriptors) {
        d.serverName = serverName;
        d.namespacedName = serverName + "." + d.rawName;
        auto key = d.namespacedName;
        fresh[key] = std::make_shared<const ToolDescriptor>(std::move(d));
    }

    std::size_t added = 0, updated = 0, removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        for (auto it = pImpl->tools.begin(); it != pImpl->tools.end();) {
            if (it->second->serverName == serverName && fresh.find(it->first) == fresh.end()) {
                it = pImpl->tools.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        for (auto& [key, d] : fresh) {
            auto it = pImpl->tools.find(key);
            if (it == pImpl->tools.end()) {
                pImpl->tools.emplace(key, d);
                ++added;
            } else if (!sameContent(*it->second, *d)) {
                it->second = d;
                ++updated;
            }
        }
    }
    if (updated > 0 || removed > 0) {
        LOG_INFO("Tools for '{}' refreshed: {} added, {} updated, {} removed", serverName, added, updated, removed);
    } else {
        LOG_DEBUG("Tools for '{}' registered: {} added", serverName, added);
    }
}

std::size_t ToolRegistry::UnregisterServerTools(const std::string& serverName) {
    FUNC_SCOPE();
    std::size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        for (auto it = pImpl->tools.begin(); it != pImpl->tools.end();) {
            if (it->second->serverName == serverName) {
                it = pImpl->tools.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        LOG_INFO("Dropped {} tool(s) of '{}'", removed, serverName);
    }
    return removed;
}

ToolDescriptor ToolRegistry::Resolve(const std::string& name) const {
    FUNC_SCOPE();
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->tools.find(name);
    if (it != pImpl->tools.end()) {
        return *it->second;
    }
    // Unqualified, or a dotted raw name such as "game.move".
    auto matches = pImpl->matchRawLocked(name);
    if (matches.empty()) {
        throw errors::ToolNotFoundError("Tool '" + name + "' not found");
    }
    if (matches.size() > 1) {
        std::vector<std::string> candidates;
        for (const auto& d : matches) {
            candidates.push_back(d->namespacedName);
        }
        throw errors::AmbiguousToolNameError(name, std::move(candidates));
    }
    return *matches.front();
}

std::vector<ToolDescriptor> ToolRegistry::ListTools(const std::optional<std::string>& serverName) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    std::vector<ToolDescriptor> out;
    for (const auto& [key, d] : pImpl->tools) {
        if (!serverName.has_value() || d->serverName == *serverName) {
            out.push_back(*d);
        }
    }
    return out;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    if (pImpl->tools.find(name) != pImpl->tools.end()) {
        return true;
    }
    return !pImpl->matchRawLocked(name).empty();
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->tools.size();
}

std::unordered_map<std::string, std::vector<std::string>> ToolRegistry::GetCollisions() const {
    std::unordered_map<std::string, std::vector<std::string>> byRaw;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
        for (const auto& [key, d] : pImpl->tools) {
            byRaw[d->rawName].push_back(d->namespacedName);
        }
    }
    for (auto it = byRaw.begin(); it != byRaw.end();) {
        if (it->second.size() < 2) {
            it = byRaw.erase(it);
        } else {
            ++it;
        }
    }
    return byRaw;
}

void ToolRegistry::RecordCall(const std::string& namespacedName) {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    auto& s = pImpl->stats[namespacedName];
    ++s.callCount;
    s.lastCalled = std::chrono::system_clock::now();
}

std::optional<ToolStats> ToolRegistry::GetToolStats(const std::string& namespacedName) const {
    std::lock_guard<std::mutex> lock(pImpl->statsMutex);
    auto it = pImpl->stats.find(namespacedName);
    if (it == pImpl->stats.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ToolDescriptor> ToolRegistry::ParseToolsListResult(const std::string& serverName, const JSONValue& result) {
    std::vector<ToolDescriptor> out;
    const JSONValue* tools = FindMember(result, "tools");
    if (tools == nullptr || !tools->IsArray()) {
        LOG_WARN("tools/list result from '{}' has no tools array", serverName);
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item) {
            continue;
        }
        auto name = GetStringMember(*item, "name");
        if (!name.has_value() || name->empty()) {
            LOG_WARN("Skipping unnamed tool from '{}'", serverName);
            continue;
        }
        JSONValue schema;
        if (const JSONValue* s = FindMember(*item, "inputSchema")) {
            schema = *s;
        }
        out.push_back(ToolDescriptor::Make(serverName, *name, GetStringMember(*item, "description").value_or(""),
                                           std::move(schema)));
    }
    return out;
}

} // namespace mcpleague
