/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PluginManager.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The registry behind POST /api/plugin/{id}/{command}. Plugins are loaded
 * in-process at startup and addressed by a reverse-DNS id ("in.gov.gst").
 * The API handlers just call ExecutePluginCommand and the manager routes it.
 * ============================================================================
 */

#ifndef LGATE_PLUGIN_MANAGER_HPP
#define LGATE_PLUGIN_MANAGER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "plugin.hpp"

using json = nlohmann::json;

namespace lgate {
namespace plugins {

    struct PluginDefinition {
        std::string id;             // Unique ID (e.g., "in.gov.gst")
        std::string name;           // Human readable; defaults to get_plugin_name()
        std::string version;        // SemVer string
        bool is_active = true;      // Soft-disable switch
    };

    void to_json(json& j, const PluginDefinition& def);

    class PluginManager {
    public:
        PluginManager();
        ~PluginManager();

        /**
         * @brief Registers a plugin under def.id.
         * @return false on an empty id, a null plugin, or an id conflict.
         */
        bool RegisterPlugin(const PluginDefinition& def, std::unique_ptr<IPlugin> plugin);

        /**
         * @brief Routes a command to a registered plugin.
         * @return { "status": "SUCCESS", "plugin": id, "command": command, "result": ... }
         * Unknown plugin: LedgerError (NOT_FOUND). Inactive plugin: LedgerError
         * (CONFLICT). The plugin's own LedgerErrors propagate unchanged.
         */
        json ExecutePluginCommand(const std::string& plugin_id,
                                  const std::string& command,
                                  const json& payload);

        // false if the id is not registered
        bool SetActive(const std::string& plugin_id, bool active);

        // Registered plugins with their commands, ordered by id.
        json ListPlugins(bool active_only) const;

    private:
        struct Registration {
            PluginDefinition definition;
            std::unique_ptr<IPlugin> plugin;
        };

        mutable std::mutex mutex_;
        std::map<std::string, Registration> registry_;
    };

} // namespace plugins
} // namespace lgate

#endif // LGATE_PLUGIN_MANAGER_HPP
