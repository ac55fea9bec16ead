/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Core ledger logic: double-entry enforcement, the entry seal, and the
 * translation of business events into balanced journal entries.
 * ============================================================================
 */

#ifndef LGATE_LEDGER_HPP
#define LGATE_LEDGER_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "models.hpp"
#include "postings.hpp"
#include "store.hpp"
#include "time_util.hpp"

using json = nlohmann::json;

namespace lgate {

class CoreLedger {
public:
    /**
     * enforce_balance
     * Ensures that the sum of debits equals the sum of credits, that the
     * entry has at least two lines, and that every line carries exactly one
     * positive side. Throws InvariantViolation otherwise.
     */
    static void enforce_balance(const JournalEntry& entry);

    /**
     * canonical_form
     * The byte string the seal is computed over: entry id, reference
     * number, organization, date, type, source, reversal_of, then each line's account code, debit
     * and credit in micros.
     */
    static std::string canonical_form(const JournalEntry& entry);

    // SHA-256 of canonical_form(), hex encoded.
    static std::string seal(const JournalEntry& entry);

    static bool verify_seal(const JournalEntry& entry);
};

// "JE-SLS-202507": reference prefix of the entry type plus the entry month.
std::string reference_series(EntryType type, const CivilDate& entry_date);

// series + "-" + sequence zero-padded to five digits.
std::string format_reference_number(const std::string& series, int64_t sequence);

// API view of an entry: to_json() plus "seal_valid".
json entry_view(const JournalEntry& entry);

struct PostOutcome {
    JournalEntry entry;
    bool created = false;   // false: the source document already had an entry
};

/**
 * @brief Builds and persists the journal entry for a business event.
 * The period lock check is the caller's job (PostingGate); the poster only
 * turns an event into a sealed, balanced entry and stores it once per
 * source document.
 */
class JournalPoster {
public:
    JournalPoster(Store& store, const EngineConfig& config, Clock clock);

    /**
     * @brief The sealed entry for an event, not persisted. Takes the next
     * reference number of the entry's series from the store.
     * Bad amounts or an incomplete payload throw LedgerError (VALIDATION);
     * a reversal of an unknown entry throws NOT_FOUND.
     */
    JournalEntry build(const PostingEvent& event, const CivilDate& entry_date, const std::string& created_by);

    /**
     * @brief Idempotent: when the source document already has an entry, that
     * entry is returned with created == false and nothing is written.
     */
    PostOutcome post(const PostingEvent& event, const CivilDate& entry_date, const std::string& created_by);

private:
    Store& store_;
    const EngineConfig& config_;
    Clock clock_;
};

} // namespace lgate

#endif // LGATE_LEDGER_HPP
