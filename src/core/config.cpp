/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include "errors.hpp"
#include "logger.hpp"

namespace lgate {

namespace {

    int read_int(const json& j, const char* key, int fallback, int min_value, int max_value) {
        if (!j.contains(key)) return fallback;
        if (!j.at(key).is_number_integer()) {
            throw LedgerError(ErrorCode::validation, std::string(key) + " must be an integer");
        }
        int value = j.at(key).get<int>();
        if (value < min_value || value > max_value) {
            throw LedgerError(ErrorCode::validation,
                              std::string(key) + " must be between " + std::to_string(min_value) +
                              " and " + std::to_string(max_value));
        }
        return value;
    }
}

int EngineConfig::fiscal_year_start_for(const std::string& organization_id) const {
    auto it = organizations.find(organization_id);
    if (it != organizations.end() && it->second.fiscal_year_start_month != 0) {
        return it->second.fiscal_year_start_month;
    }
    return fiscal_year_start_month;
}

std::string EngineConfig::state_code_for(const std::string& organization_id) const {
    auto it = organizations.find(organization_id);
    return it == organizations.end() ? std::string() : it->second.state_code;
}

EngineConfig config_from_json(const json& j) {
    if (!j.is_object()) throw LedgerError(ErrorCode::validation, "Configuration root must be an object");

    EngineConfig config;
    config.fiscal_year_start_month = read_int(j, "fiscal_year_start_month", config.fiscal_year_start_month, 1, 12);
    config.default_unlock_window_hours = read_int(j, "default_unlock_window_hours", config.default_unlock_window_hours, 1, 168);
    config.auto_relock_interval_seconds = read_int(j, "auto_relock_interval_seconds", config.auto_relock_interval_seconds, 1, 86400);

    if (j.contains("allow_missing_context_bypass")) {
        if (!j.at("allow_missing_context_bypass").is_boolean()) {
            throw LedgerError(ErrorCode::validation, "allow_missing_context_bypass must be a boolean");
        }
        config.allow_missing_context_bypass = j.at("allow_missing_context_bypass").get<bool>();
    }

    if (j.contains("organizations")) {
        const json& orgs = j.at("organizations");
        if (!orgs.is_object()) throw LedgerError(ErrorCode::validation, "organizations must be an object");
        for (auto it = orgs.begin(); it != orgs.end(); ++it) {
            if (!it.value().is_object()) {
                throw LedgerError(ErrorCode::validation, "organizations." + it.key() + " must be an object");
            }
            OrganizationSettings org;
            org.state_code = it.value().value("state_code", "");
            if (!org.state_code.empty() && org.state_code.size() != 2) {
                throw LedgerError(ErrorCode::validation, "organizations." + it.key() + ".state_code must be two digits");
            }
            org.fiscal_year_start_month = read_int(it.value(), "fiscal_year_start_month", 0, 1, 12);
            config.organizations[it.key()] = org;
        }
    }
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        lgate_log("WARN", "Config file " + path + " missing. Using system defaults.");
        return EngineConfig();
    }

    try {
        EngineConfig config = config_from_json(json::parse(ifs));
        lgate_log("INFO", "Engine configuration loaded from " + path);
        return config;
    } catch (const std::exception& e) {
        lgate_log("ERROR", "Config Parse Error: " + std::string(e.what()) + ". Using system defaults.");
        return EngineConfig();
    }
}

void to_json(json& j, const EngineConfig& config) {
    j = json{
        {"fiscal_year_start_month", config.fiscal_year_start_month},
        {"default_unlock_window_hours", config.default_unlock_window_hours},
        {"allow_missing_context_bypass", config.allow_missing_context_bypass},
        {"auto_relock_interval_seconds", config.auto_relock_interval_seconds},
        {"organizations", json::object()}
    };
    for (const auto& pair : config.organizations) {
        json org;
        org["state_code"] = pair.second.state_code;
        org["fiscal_year_start_month"] = config.fiscal_year_start_for(pair.first);
        j["organizations"][pair.first] = org;
    }
}

ServerSettings server_settings_from_env() {
    ServerSettings settings;
    if (const char* env_db = std::getenv("LGATE_DB_CONN")) settings.db_conn = env_db;
    if (const char* env_port = std::getenv("LGATE_PORT")) {
        try {
            settings.port = std::stoi(env_port);
        } catch (const std::exception&) {
            lgate_log("WARN", "LGATE_PORT is not a number. Falling back to 8080.");
        }
    }
    if (const char* env_config = std::getenv("LGATE_CONFIG")) settings.config_path = env_config;
    return settings;
}

} // namespace lgate
