/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: audit.cpp
 * ============================================================================
 */

#include "audit.hpp"
#include <utility>
#include "logger.hpp"

namespace lgate {

AuditWriter::AuditWriter(Store& store, Clock clock)
    : store_(store), clock_(std::move(clock)), failed_appends_(0) {}

bool AuditWriter::append(const std::string& organization_id,
                         const std::string& user_id,
                         const std::string& user_role,
                         const std::string& action,
                         const std::string& resource_type,
                         const std::string& resource_id,
                         const json& before_snapshot,
                         const json& after_snapshot,
                         const std::string& ip) {
    AuditLogEntry entry;
    entry.organization_id = organization_id;
    entry.user_id = user_id;
    entry.user_role = user_role;
    entry.action = action;
    entry.resource_type = resource_type;
    entry.resource_id = resource_id;
    entry.timestamp = clock_();
    entry.ip = ip;
    entry.before_snapshot = before_snapshot;
    entry.after_snapshot = after_snapshot;

    try {
        store_.append_audit(entry);
        return true;
    } catch (const std::exception& e) {
        ++failed_appends_;
        lgate_log("ERROR", "Audit write failed (" + action + " on " + resource_type + "/" + resource_id +
                           ", org " + organization_id + "): " + e.what());
        return false;
    }
}

bool AuditWriter::append(const std::string& organization_id, const Actor& actor,
                         const std::string& action, const std::string& resource_type, const std::string& resource_id,
                         const json& before_snapshot, const json& after_snapshot) {
    return append(organization_id, actor.user_id, actor.role, action, resource_type, resource_id,
                  before_snapshot, after_snapshot, actor.ip);
}

std::vector<AuditLogEntry> AuditWriter::history(const std::string& organization_id,
                                                const std::string& resource_type,
                                                const std::string& resource_id) {
    return store_.list_audit(organization_id, resource_type, resource_id);
}

} // namespace lgate
