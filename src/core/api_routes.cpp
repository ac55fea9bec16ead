/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * api_routes.cpp - Administrative REST surface
 */

#include "api_routes.hpp"
#include <climits>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include "errors.hpp"
#include "logger.hpp"
#include "postings.hpp"

namespace lgate {

namespace {

    const char* JSON_TYPE = "application/json";

    void send_json(httplib::Response& res, int status, const json& body) {
        res.status = status;
        res.set_content(body.dump(), JSON_TYPE);
    }

    bool is_authenticated(const httplib::Request& req) {
        return req.has_header("Remote-User") && !req.get_header_value("Remote-User").empty();
    }

    /**
     * guarded
     * Runs a handler behind the gateway check and maps whatever it throws
     * to a JSON error response.
     */
    void guarded(const httplib::Request& req, httplib::Response& res, const std::function<void()>& handler) {
        if (!is_authenticated(req)) {
            send_json(res, 401, {{"error", "Secure Gateway Login Required"}, {"code", "UNAUTHENTICATED"}});
            return;
        }
        try {
            handler();
        } catch (const LedgerError& e) {
            if (e.code() == ErrorCode::invariant_violation) {
                lgate_log("CRITICAL", req.method + " " + req.path + ": " + e.what());
            } else if (e.http_status() >= 500) {
                lgate_log("ERROR", req.method + " " + req.path + ": " + e.what());
            }
            write_error(res, e);
        } catch (const json::exception& e) {
            send_json(res, 400, {{"error", std::string("Invalid request format: ") + e.what()}, {"code", "VALIDATION"}});
        } catch (const std::invalid_argument& e) {
            // amounts outside the supported range
            send_json(res, 400, {{"error", e.what()}, {"code", "VALIDATION"}});
        } catch (const std::exception& e) {
            lgate_log("ERROR", "Unhandled exception on " + req.method + " " + req.path + ": " + e.what());
            send_json(res, 500, {{"error", "Internal server error"}, {"code", "INTERNAL_ERROR"}});
        }
    }

    std::string organization_of(const httplib::Request& req) {
        std::string org = req.has_header("X-Organization-ID") ? req.get_header_value("X-Organization-ID") : "";
        if (org.empty()) {
            throw LedgerError(ErrorCode::validation, "X-Organization-ID header is required");
        }
        return org;
    }

    json body_of(const httplib::Request& req) {
        if (req.body.empty()) return json::object();
        json body = json::parse(req.body);
        if (!body.is_object()) throw LedgerError(ErrorCode::validation, "Request body must be a JSON object");
        return body;
    }

    std::string string_field(const json& body, const char* key, bool required) {
        if (!body.contains(key) || body.at(key).is_null()) {
            if (required) throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' is required");
            return "";
        }
        if (!body.at(key).is_string()) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be a string");
        }
        return body.at(key).get<std::string>();
    }

    int parse_int(const std::string& text, const std::string& name) {
        size_t used = 0;
        int value = 0;
        try {
            value = std::stoi(text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != text.size()) {
            throw LedgerError(ErrorCode::validation, "'" + name + "' must be a whole number");
        }
        return value;
    }

    int required_int(const json& body, const char* key) {
        std::optional<int> v = int_field(body, key);
        if (!v) throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' is required");
        return *v;
    }

    void send_posting(httplib::Response& res, const PostingResult& result) {
        int status = 200;
        if (result.failure) {
            status = http_status_for(*result.failure);
        } else if (result.created) {
            status = 201;
        }
        send_json(res, status, result);
    }
}

std::optional<int> int_field(const json& body, const char* key) {
    if (!body.contains(key) || body.at(key).is_null()) return std::nullopt;
    const json& v = body.at(key);
    if (v.is_number_integer()) {
        bool in_range = v.is_number_unsigned()
            ? v.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
            : v.get<int64_t>() >= INT_MIN && v.get<int64_t>() <= INT_MAX;
        if (!in_range) {
            throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' is out of range");
        }
        return static_cast<int>(v.get<int64_t>());
    }
    if (v.is_string()) return parse_int(v.get<std::string>(), key);
    throw LedgerError(ErrorCode::validation, std::string("Field '") + key + "' must be a whole number");
}

Actor actor_from_request(const httplib::Request& req) {
    Actor actor;
    actor.user_id = req.get_header_value("Remote-User");
    actor.role = req.get_header_value("Remote-Role");

    std::string forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        std::string first = forwarded.substr(0, forwarded.find(','));
        size_t start = first.find_first_not_of(' ');
        size_t end = first.find_last_not_of(' ');
        actor.ip = start == std::string::npos ? "" : first.substr(start, end - start + 1);
    }
    if (actor.ip.empty()) actor.ip = req.remote_addr;
    return actor;
}

void write_error(httplib::Response& res, const LedgerError& e) {
    send_json(res, e.http_status(), e.to_json());
}

void register_routes(httplib::Server& svr, ApiContext& ctx) {

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        lgate_log("INFO", "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status));
    });

    // === [PERIOD LOCKS: READ] ===
    svr.Get("/api/period-locks", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::string org = organization_of(req);
            std::optional<int> year;
            if (req.has_param("year") && !req.get_param_value("year").empty()) {
                year = parse_int(req.get_param_value("year"), "year");
            }
            send_json(res, 200, {{"locks", ctx.locks.list(org, year)}});
        });
    });

    svr.Get(R"(/api/period-locks/(\d{4}-\d{2}))", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::string period = req.matches[1];
            std::optional<PeriodLock> lock = ctx.locks.get(organization_of(req), period);
            if (!lock) {
                throw LedgerError(ErrorCode::not_found, "No lock record for period " + period);
            }
            send_json(res, 200, *lock);
        });
    });

    svr.Get(R"(/api/period-locks/(\d{4}-\d{2})/history)", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::string period = req.matches[1];
            send_json(res, 200, {{"period", period}, {"history", ctx.locks.history(organization_of(req), period)}});
        });
    });

    // === [PERIOD LOCKS: TRANSITIONS] ===
    svr.Post("/api/period-locks/lock", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            PeriodLock lock = ctx.locks.lock(organization_of(req), string_field(body, "period", true),
                                             actor_from_request(req), string_field(body, "reason", false));
            send_json(res, 200, {{"status", "SUCCESS"}, {"lock", lock}});
        });
    });

    svr.Post("/api/period-locks/unlock", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            PeriodLock lock = ctx.locks.unlock(organization_of(req), string_field(body, "period", true),
                                               actor_from_request(req), string_field(body, "reason", true),
                                               int_field(body, "window_hours"));
            send_json(res, 200, {{"status", "SUCCESS"}, {"lock", lock}});
        });
    });

    svr.Post("/api/period-locks/extend", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            PeriodLock lock = ctx.locks.extend(organization_of(req), string_field(body, "period", true),
                                               actor_from_request(req), required_int(body, "additional_hours"));
            send_json(res, 200, {{"status", "SUCCESS"}, {"lock", lock}});
        });
    });

    svr.Post("/api/period-locks/check", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            std::string date = string_field(body, "date", false);
            ctx.locks.check(organization_of(req), date);
            send_json(res, 200, {{"allowed", true}, {"date", date}});
        });
    });

    svr.Post("/api/period-locks/lock-fiscal-year", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            std::vector<FiscalYearLockResult> results =
                ctx.locks.lock_fiscal_year(organization_of(req), required_int(body, "year"), actor_from_request(req));
            send_json(res, 200, {{"status", "SUCCESS"}, {"results", results}});
        });
    });

    svr.Post("/api/period-locks/auto-relock", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            if (!can_unlock_periods(actor_from_request(req).role)) {
                throw LedgerError(ErrorCode::forbidden, "Only admin or owner can run the auto-relock sweep");
            }
            int relocked = ctx.locks.auto_relock();
            send_json(res, 200, {{"status", "SUCCESS"}, {"relocked", relocked}});
        });
    });

    // === [LEDGER POSTING] ===
    svr.Post(R"(/api/ledger/post/([a-z_]+))", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            PostingEvent event = posting_from_json(req.matches[1], organization_of(req), body_of(req));
            send_posting(res, ctx.gate.post(event, actor_from_request(req)));
        });
    });

    svr.Post("/api/ledger/reverse", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json body = body_of(req);
            send_posting(res, ctx.gate.reverse(organization_of(req), string_field(body, "entry_id", true),
                                               string_field(body, "date", false), string_field(body, "reason", false),
                                               actor_from_request(req)));
        });
    });

    svr.Get(R"(/api/ledger/entries/([A-Za-z0-9_\-]+))", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::string entry_id = req.matches[1];
            std::optional<JournalEntry> entry = ctx.gate.find_entry(organization_of(req), entry_id);
            if (!entry) throw LedgerError(ErrorCode::not_found, "Journal entry " + entry_id + " not found");
            send_json(res, 200, entry_view(*entry));
        });
    });

    svr.Get("/api/ledger/entries", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::string source_type = req.get_param_value("source_type");
            std::string source_id = req.get_param_value("source_id");
            if (source_type.empty() || source_id.empty()) {
                throw LedgerError(ErrorCode::validation, "source_type and source_id are required");
            }
            std::optional<JournalEntry> entry = ctx.gate.find_entry_by_source(organization_of(req), source_type, source_id);
            if (!entry) {
                throw LedgerError(ErrorCode::not_found, "No journal entry for " + source_type + " " + source_id);
            }
            send_json(res, 200, entry_view(*entry));
        });
    });

    // === [AUDIT] ===
    svr.Get("/api/audit", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            std::vector<AuditLogEntry> trail = ctx.audit.history(organization_of(req),
                                                                 req.get_param_value("resource_type"),
                                                                 req.get_param_value("resource_id"));
            send_json(res, 200, {{"entries", trail}});
        });
    });

    // === [PLUGIN API ROUTES] ===
    svr.Post(R"(/api/plugin/([^/]+)/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            json payload = body_of(req);
            send_json(res, 200, ctx.plugins.ExecutePluginCommand(req.matches[1], req.matches[2], payload));
        });
    });

    svr.Get("/api/plugins/active", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            send_json(res, 200, ctx.plugins.ListPlugins(true));
        });
    });

    // === [SYSTEM] ===
    svr.Get("/api/settings/manifest", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            send_json(res, 200, ctx.config);
        });
    });

    svr.Get("/api/system/logs", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            if (!can_unlock_periods(actor_from_request(req).role)) {
                throw LedgerError(ErrorCode::forbidden, "Action requires administrator privileges.");
            }
            send_json(res, 200, {{"logs", lgate_recent_logs()}});
        });
    });
}

} // namespace lgate
