/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * api_routes.hpp - Administrative REST surface
 * Identity comes from the gateway: Remote-User, Remote-Role and
 * X-Organization-ID. Requests without Remote-User are rejected with 401.
 */

#ifndef LGATE_API_ROUTES_HPP
#define LGATE_API_ROUTES_HPP

#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "audit.hpp"
#include "config.hpp"
#include "period_lock.hpp"
#include "posting_gate.hpp"
#include "../plugins/interface/PluginManager.hpp"

using json = nlohmann::json;

namespace lgate {

struct ApiContext {
    PeriodLockService& locks;
    PostingGate& gate;
    AuditWriter& audit;
    plugins::PluginManager& plugins;
    const EngineConfig& config;
};

// Actor from the gateway headers; ip from X-Forwarded-For (first hop) or the socket.
Actor actor_from_request(const httplib::Request& req);

// Whole-number body field. Numbers beyond int and non-numeric strings are VALIDATION.
std::optional<int> int_field(const json& body, const char* key);

// Sets status and JSON body for an error raised by a handler.
void write_error(httplib::Response& res, const LedgerError& e);

void register_routes(httplib::Server& svr, ApiContext& ctx);

} // namespace lgate

#endif // LGATE_API_ROUTES_HPP
