/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PluginManager.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Implementation of the PluginManager, the traffic controller between the
 * HTTP surface and the in-process calculator plugins.
 * ============================================================================
 */

#include "PluginManager.hpp"
#include <utility>
#include "../../core/errors.hpp"
#include "../../core/logger.hpp"

namespace lgate {
namespace plugins {

void to_json(json& j, const PluginDefinition& def) {
    j = json{
        {"id", def.id},
        {"name", def.name},
        {"version", def.version},
        {"is_active", def.is_active}
    };
}

// ----------------------------------------------------------------------------
// Constructor / Destructor
// ----------------------------------------------------------------------------
PluginManager::PluginManager() {
    lgate_log("DEBUG", "Plugin Manager initialised.");
}

PluginManager::~PluginManager() {
    std::lock_guard<std::mutex> guard(mutex_);
    registry_.clear();
}

// ----------------------------------------------------------------------------
// RegisterPlugin
// Adds a plugin to the routing table. The first registration of an id wins.
// ----------------------------------------------------------------------------
bool PluginManager::RegisterPlugin(const PluginDefinition& def, std::unique_ptr<IPlugin> plugin) {
    if (def.id.empty() || !plugin) {
        lgate_log("ERROR", "Plugin registration rejected: missing id or implementation.");
        return false;
    }

    std::lock_guard<std::mutex> guard(mutex_);

    // Check if the plugin is already registered to prevent overwrites
    if (registry_.find(def.id) != registry_.end()) {
        lgate_log("ERROR", "Plugin ID conflict: " + def.id);
        return false;
    }

    Registration reg;
    reg.definition = def;
    if (reg.definition.name.empty()) reg.definition.name = plugin->get_plugin_name();
    reg.plugin = std::move(plugin);

    lgate_log("INFO", "Registered Plugin: " + reg.definition.name + " (" + def.id + ") v" + def.version);
    registry_[def.id] = std::move(reg);
    return true;
}

// ----------------------------------------------------------------------------
// ExecutePluginCommand
// The main bridge. The frontend asks the Core for a calculation, the Core
// realises it's a plugin's job, and forwards the payload.
// ----------------------------------------------------------------------------
json PluginManager::ExecutePluginCommand(const std::string& plugin_id,
                                         const std::string& command,
                                         const json& payload) {
    IPlugin* plugin = nullptr;
    {
        std::lock_guard<std::mutex> guard(mutex_);

        // 1. Verify the plugin exists in our registry
        auto it = registry_.find(plugin_id);
        if (it == registry_.end()) {
            throw LedgerError(ErrorCode::not_found, "Plugin '" + plugin_id + "' not found in the registry.");
        }

        // 2. Verify the plugin is currently active
        if (!it->second.definition.is_active) {
            throw LedgerError(ErrorCode::conflict, "Plugin '" + plugin_id + "' is registered but currently inactive.");
        }
        plugin = it->second.plugin.get();
    }

    // Plugins are stateless calculators; registrations are never removed
    // while the manager lives, so the pointer outlives the lock.
    json result = plugin->execute(command, payload);

    return {
        {"status", "SUCCESS"},
        {"plugin", plugin_id},
        {"command", command},
        {"result", result}
    };
}

bool PluginManager::SetActive(const std::string& plugin_id, bool active) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = registry_.find(plugin_id);
    if (it == registry_.end()) return false;

    if (it->second.definition.is_active != active) {
        it->second.definition.is_active = active;
        lgate_log(active ? "INFO" : "WARN", std::string("Plugin ") + (active ? "enabled: " : "disabled: ") + plugin_id);
    }
    return true;
}

json PluginManager::ListPlugins(bool active_only) const {
    std::lock_guard<std::mutex> guard(mutex_);
    json list = json::array();
    for (const auto& pair : registry_) {
        if (active_only && !pair.second.definition.is_active) continue;
        json item = pair.second.definition;
        item["commands"] = pair.second.plugin->get_commands();
        list.push_back(item);
    }
    return list;
}

} // namespace plugins
} // namespace lgate
