//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Catalog of namespaced tool descriptors discovered per server, with name resolution
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpleague/JSONRPCTypes.h"

namespace mcpleague {

//==========================================================================================================
// ToolDescriptor
// Fields:
//   namespacedName: serverName + "." + rawName; the registry key.
//   inputSchema: JSON Schema as reported by tools/list.
//==========================================================================================================
struct ToolDescriptor {
    std::string serverName;
    std::string rawName;
    std::string namespacedName;
    std::string description;
    JSONValue inputSchema;

    static ToolDescriptor Make(const std::string& serverName, const std::string& rawName,
                               std::string description = {}, JSONValue inputSchema = JSONValue{});
};

struct ToolStats {
    uint64_t callCount{0};
    std::optional<std::chrono::system_clock::time_point> lastCalled;
};

// Throws std::invalid_argument for an empty server name or one containing '.', which would make
// namespaced keys of different servers collide.
void ValidateServerName(const std::string& serverName);

enum class RegisterResult {
    Added,
    Unchanged,
    Updated
};

//==========================================================================================================
// ToolRegistry
// Purpose: Multi-reader / single-writer catalog. Descriptors are immutable once published and replaced
//          whole, so readers never see a half-updated entry.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // RegisterTool
    // Purpose: Stores the descriptor under serverName.rawName. Identical content is a no-op; different
    //          content replaces the entry and is logged.
    //==========================================================================================================
    RegisterResult RegisterTool(const std::string& serverName, ToolDescriptor descriptor);

    // Replaces the server's whole catalog in one swap.
    void RegisterServerTools(const std::string& serverName, std::vector<ToolDescriptor> descriptors);

    // Returns the number of descriptors removed.
    std::size_t UnregisterServerTools(const std::string& serverName);

    //==========================================================================================================
    // Resolve
    // Purpose: Maps a qualified or unqualified tool name to its descriptor.
    //   - An exact namespaced key wins.
    //   - Otherwise the name is matched against raw names across all servers: one match resolves, none
    //     throws ToolNotFoundError, several throw AmbiguousToolNameError (never picks one).
    //==========================================================================================================
    ToolDescriptor Resolve(const std::string& name) const;

    std::vector<ToolDescriptor> ListTools(const std::optional<std::string>& serverName = std::nullopt) const;
    bool HasTool(const std::string& name) const;
    std::size_t Size() const;

    // Raw names offered by more than one server, with their namespaced names.
    std::unordered_map<std::string, std::vector<std::string>> GetCollisions() const;

    void RecordCall(const std::string& namespacedName);
    std::optional<ToolStats> GetToolStats(const std::string& namespacedName) const;

    //==========================================================================================================
    // ParseToolsListResult
    // Purpose: Converts a tools/list result ({ tools: [ {name, description?, inputSchema?} ] }) into
    //          descriptors for serverName. Entries without a string name are skipped.
    //==========================================================================================================
    static std::vector<ToolDescriptor> ParseToolsListResult(const std::string& serverName, const JSONValue& result);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
