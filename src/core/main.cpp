/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <httplib.h>
#include "api_routes.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "memory_store.hpp"
#include "period_lock.hpp"
#include "pg_store.hpp"
#include "posting_gate.hpp"
#include "../plugins/gst/gst_plugin.hpp"
#include "../plugins/interface/PluginManager.hpp"

using namespace lgate;

namespace {

    // Sleeps in one-second steps so shutdown is not held up by a long interval.
    void relock_loop(PeriodLockService& locks, int interval_seconds, const std::atomic<bool>& running) {
        int waited = 0;
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (++waited < interval_seconds) continue;
            waited = 0;
            try {
                locks.auto_relock();
            } catch (const std::exception& e) {
                lgate_log("ERROR", std::string("Auto-relock sweep failed: ") + e.what());
            }
        }
    }
}

int main() {
    ServerSettings settings = server_settings_from_env();
    EngineConfig config = load_engine_config(settings.config_path);
    Clock clock = system_clock_source();

    std::unique_ptr<Store> store;
    if (settings.db_conn.empty()) {
        lgate_log("WARN", "LGATE_DB_CONN not set. Running on the in-memory store; nothing will survive a restart.");
        store.reset(new MemoryStore());
    } else {
        try {
            std::unique_ptr<PgStore> pg(new PgStore(settings.db_conn));
            pg->ensure_schema();
            store = std::move(pg);
        } catch (const std::exception& e) {
            lgate_log("FATAL", std::string("Database unavailable. System halted: ") + e.what());
            return 1;
        }
    }

    AuditWriter audit(*store, clock);
    PeriodLockService locks(*store, audit, config, clock);
    PostingGate gate(locks, *store, audit, config, clock);

    plugins::PluginManager plugin_manager;
    plugins::PluginDefinition gst_plugin;
    gst_plugin.id = plugins::GST_PLUGIN_ID;
    gst_plugin.version = plugins::GST_PLUGIN_VERSION;
    plugin_manager.RegisterPlugin(gst_plugin, std::unique_ptr<plugins::IPlugin>(new plugins::GstPlugin(clock)));

    httplib::Server svr;
    ApiContext ctx{locks, gate, audit, plugin_manager, config};
    register_routes(svr, ctx);

    std::atomic<bool> running(true);
    std::thread relocker;
    if (config.auto_relock_interval_seconds > 0) {
        relocker = std::thread(relock_loop, std::ref(locks), config.auto_relock_interval_seconds, std::cref(running));
        lgate_log("INFO", "Auto-relock sweep every " + std::to_string(config.auto_relock_interval_seconds) + "s");
    }

    lgate_log("INFO", "LedgerGate: Engine Active. Listening on port " + std::to_string(settings.port));
    bool listened = svr.listen("0.0.0.0", settings.port);
    if (!listened) {
        lgate_log("FATAL", "Could not bind port " + std::to_string(settings.port));
    }

    running.store(false);
    if (relocker.joinable()) relocker.join();
    return listened ? 0 : 1;
}
