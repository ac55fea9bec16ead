/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: models.cpp
 * ============================================================================
 */

#include "models.hpp"

namespace lgate {

namespace {
    json optional_string(const std::optional<std::string>& v) {
        return v ? json(*v) : json(nullptr);
    }

    json optional_time(const std::optional<Timestamp>& v) {
        return v ? json(to_iso8601(*v)) : json(nullptr);
    }
}

const char* lock_status_name(LockStatus status) {
    switch (status) {
        case LockStatus::locked: return "locked";
        case LockStatus::unlocked_amendment: return "unlocked_amendment";
    }
    return "locked";
}

std::optional<LockStatus> lock_status_from_string(const std::string& s) {
    if (s == "locked") return LockStatus::locked;
    if (s == "unlocked_amendment") return LockStatus::unlocked_amendment;
    return std::nullopt;
}

void to_json(json& j, const PeriodLock& lock) {
    j = json{
        {"lock_id", lock.lock_id},
        {"organization_id", lock.organization_id},
        {"period", lock.period},
        {"status", lock_status_name(lock.status)},
        {"locked_by", lock.locked_by},
        {"locked_at", to_iso8601(lock.locked_at)},
        {"lock_reason", lock.lock_reason},
        {"unlocked_by", optional_string(lock.unlocked_by)},
        {"unlocked_at", optional_time(lock.unlocked_at)},
        {"unlock_reason", optional_string(lock.unlock_reason)},
        {"unlock_expires_at", optional_time(lock.unlock_expires_at)},
        {"unlock_extension_count", lock.unlock_extension_count},
        {"created_at", to_iso8601(lock.created_at)},
        {"updated_at", to_iso8601(lock.updated_at)}
    };
}

const char* entry_type_name(EntryType type) {
    switch (type) {
        case EntryType::sales: return "SALES";
        case EntryType::receipt: return "RECEIPT";
        case EntryType::purchase: return "PURCHASE";
        case EntryType::payment: return "PAYMENT";
        case EntryType::expense: return "EXPENSE";
        case EntryType::payroll: return "PAYROLL";
        case EntryType::reversal: return "REVERSAL";
    }
    return "JOURNAL";
}

const char* entry_reference_prefix(EntryType type) {
    switch (type) {
        case EntryType::sales: return "JE-SLS";
        case EntryType::receipt: return "JE-RCP";
        case EntryType::purchase: return "JE-PUR";
        case EntryType::payment: return "JE-PAY";
        case EntryType::expense: return "JE-EXP";
        case EntryType::payroll: return "JE-PRL";
        case EntryType::reversal: return "JE-REV";
    }
    return "JE";
}

std::optional<EntryType> entry_type_from_string(const std::string& s) {
    if (s == "SALES") return EntryType::sales;
    if (s == "RECEIPT") return EntryType::receipt;
    if (s == "PURCHASE") return EntryType::purchase;
    if (s == "PAYMENT") return EntryType::payment;
    if (s == "EXPENSE") return EntryType::expense;
    if (s == "PAYROLL") return EntryType::payroll;
    if (s == "REVERSAL") return EntryType::reversal;
    return std::nullopt;
}

money_micro JournalEntry::total_debit() const {
    money_micro total = 0;
    for (const auto& line : lines) total += line.debit;
    return total;
}

money_micro JournalEntry::total_credit() const {
    money_micro total = 0;
    for (const auto& line : lines) total += line.credit;
    return total;
}

void to_json(json& j, const LedgerLine& line) {
    j = json{
        {"account_code", line.account_code},
        {"account_name", line.account_name},
        {"debit", format_amount(line.debit)},
        {"credit", format_amount(line.credit)},
        {"description", line.description}
    };
}

void to_json(json& j, const JournalEntry& entry) {
    j = json{
        {"entry_id", entry.entry_id},
        {"reference_number", entry.reference_number},
        {"organization_id", entry.organization_id},
        {"entry_date", format_date(entry.entry_date)},
        {"entry_type", entry_type_name(entry.entry_type)},
        {"description", entry.description},
        {"lines", entry.lines},
        {"total_debit", format_amount(entry.total_debit())},
        {"total_credit", format_amount(entry.total_credit())},
        {"source_document_type", entry.source_document_type},
        {"source_document_id", entry.source_document_id},
        {"created_by", entry.created_by},
        {"reversal_of", entry.reversal_of.empty() ? json(nullptr) : json(entry.reversal_of)},
        {"created_at", to_iso8601(entry.created_at)},
        {"entry_hash", entry.entry_hash}
    };
}

json lines_to_storage_json(const std::vector<LedgerLine>& lines) {
    json arr = json::array();
    for (const auto& line : lines) {
        arr.push_back({
            {"account_code", line.account_code},
            {"account_name", line.account_name},
            {"debit_micros", line.debit},
            {"credit_micros", line.credit},
            {"description", line.description}
        });
    }
    return arr;
}

std::vector<LedgerLine> lines_from_storage_json(const json& j) {
    std::vector<LedgerLine> lines;
    for (const auto& item : j) {
        LedgerLine line;
        line.account_code = item.at("account_code").get<std::string>();
        line.account_name = item.value("account_name", "");
        line.debit = item.at("debit_micros").get<money_micro>();
        line.credit = item.at("credit_micros").get<money_micro>();
        line.description = item.value("description", "");
        lines.push_back(line);
    }
    return lines;
}

void to_json(json& j, const AuditLogEntry& entry) {
    j = json{
        {"organization_id", entry.organization_id},
        {"user_id", entry.user_id},
        {"user_role", entry.user_role},
        {"action", entry.action},
        {"resource_type", entry.resource_type},
        {"resource_id", entry.resource_id},
        {"timestamp", to_iso8601(entry.timestamp)},
        {"ip_address", entry.ip},
        {"before_snapshot", entry.before_snapshot},
        {"after_snapshot", entry.after_snapshot}
    };
}

} // namespace lgate
