/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Engine settings. Process wiring (database, port, config path) comes from
 * the environment; engine behaviour comes from lgate_config.json:
 *
 * {
 *   "fiscal_year_start_month": 4,
 *   "default_unlock_window_hours": 72,
 *   "allow_missing_context_bypass": false,
 *   "auto_relock_interval_seconds": 300,
 *   "organizations": {
 *     "org_abc": { "state_code": "27", "fiscal_year_start_month": 1 }
 *   }
 * }
 * ============================================================================
 */

#ifndef LGATE_CONFIG_HPP
#define LGATE_CONFIG_HPP

#include <map>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lgate {

    constexpr const char* DEFAULT_CONFIG_PATH = "/app/core/config/lgate_config.json";

    struct OrganizationSettings {
        std::string state_code;             // "27"; empty when unknown
        int fiscal_year_start_month = 0;    // 0 inherits the engine default
    };

    struct EngineConfig {
        int fiscal_year_start_month = 4;
        int default_unlock_window_hours = 72;
        bool allow_missing_context_bypass = false;
        int auto_relock_interval_seconds = 300;
        std::map<std::string, OrganizationSettings> organizations;

        int fiscal_year_start_for(const std::string& organization_id) const;
        std::string state_code_for(const std::string& organization_id) const;
    };

    /**
     * @brief Builds a config from its JSON form. Absent keys keep their
     * defaults; out-of-range values throw LedgerError (VALIDATION).
     */
    EngineConfig config_from_json(const json& j);

    /**
     * @brief Reads the config file. A missing file yields the defaults with a
     * WARN; an unreadable or invalid one yields the defaults with an ERROR.
     */
    EngineConfig load_engine_config(const std::string& path);

    void to_json(json& j, const EngineConfig& config);

    struct ServerSettings {
        std::string db_conn;                // empty: in-memory store
        int port = 8080;
        std::string config_path = DEFAULT_CONFIG_PATH;
    };

    // LGATE_DB_CONN, LGATE_PORT, LGATE_CONFIG
    ServerSettings server_settings_from_env();

} // namespace lgate

#endif // LGATE_CONFIG_HPP
