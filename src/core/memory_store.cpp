/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * memory_store.cpp - Implementation of the process-local Store
 */

#include "memory_store.hpp"
#include <algorithm>

namespace lgate {

std::optional<PeriodLock> MemoryStore::find_lock(const std::string& organization_id, const std::string& period) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(LockKey(organization_id, period));
    if (it == locks_.end()) return std::nullopt;
    return it->second;
}

std::vector<PeriodLock> MemoryStore::list_locks(const std::string& organization_id, const std::string& year) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeriodLock> result;
    for (const auto& pair : locks_) {
        if (pair.first.first != organization_id) continue;
        if (!year.empty() && pair.second.period.compare(0, year.size() + 1, year + "-") != 0) continue;
        result.push_back(pair.second);
    }
    std::sort(result.begin(), result.end(), [](const PeriodLock& a, const PeriodLock& b) {
        return a.period > b.period;
    });
    return result;
}

bool MemoryStore::insert_lock(const PeriodLock& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.emplace(LockKey(record.organization_id, record.period), record).second;
}

bool MemoryStore::update_lock_if(const PeriodLock& updated, LockStatus expected_status, int expected_extension_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(LockKey(updated.organization_id, updated.period));
    if (it == locks_.end()) return false;
    if (it->second.status != expected_status || it->second.unlock_extension_count != expected_extension_count) {
        return false;
    }
    it->second = updated;
    return true;
}

std::vector<PeriodLock> MemoryStore::find_expired_amendments(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeriodLock> result;
    for (const auto& pair : locks_) {
        const PeriodLock& record = pair.second;
        if (record.status == LockStatus::unlocked_amendment && record.unlock_expires_at &&
            *record.unlock_expires_at <= now) {
            result.push_back(record);
        }
    }
    return result;
}

bool MemoryStore::insert_entry(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    SourceKey key(entry.organization_id, entry.source_document_type, entry.source_document_id);
    if (entries_by_source_.count(key) > 0) return false;
    entries_by_source_[key] = entries_.size();
    entries_.push_back(entry);
    return true;
}

std::optional<JournalEntry> MemoryStore::find_entry(const std::string& organization_id, const std::string& entry_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.organization_id == organization_id && entry.entry_id == entry_id) return entry;
    }
    return std::nullopt;
}

std::optional<JournalEntry> MemoryStore::find_entry_by_source(const std::string& organization_id,
                                                              const std::string& source_document_type,
                                                              const std::string& source_document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_by_source_.find(SourceKey(organization_id, source_document_type, source_document_id));
    if (it == entries_by_source_.end()) return std::nullopt;
    return entries_[it->second];
}

int64_t MemoryStore::next_sequence(const std::string& organization_id, const std::string& series) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++sequences_[std::make_pair(organization_id, series)];
}

void MemoryStore::append_audit(const AuditLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    audit_.push_back(entry);
}

std::vector<AuditLogEntry> MemoryStore::list_audit(const std::string& organization_id,
                                                   const std::string& resource_type,
                                                   const std::string& resource_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;
    for (const auto& entry : audit_) {
        if (entry.organization_id != organization_id) continue;
        if (!resource_type.empty() && entry.resource_type != resource_type) continue;
        if (!resource_id.empty() && entry.resource_id != resource_id) continue;
        result.push_back(entry);
    }
    return result;
}

size_t MemoryStore::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace lgate
