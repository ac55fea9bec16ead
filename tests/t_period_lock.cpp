/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * t_period_lock.cpp - Lock state machine, amendment windows, fiscal close
 */

#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace lgate;
using namespace lgate_test;

namespace {
  // Runs one competing write against the store just before the service's
  // own insert or compare-and-swap, as another instance would.
  struct interleaving_store : public MemoryStore {
    std::function<void(MemoryStore&)> competing_write;

    bool insert_lock(const PeriodLock& record) override {
      run_competing_write();
      return MemoryStore::insert_lock(record);
    }

    bool update_lock_if(const PeriodLock& updated, LockStatus expected_status, int expected_extension_count) override {
      run_competing_write();
      return MemoryStore::update_lock_if(updated, expected_status, expected_extension_count);
    }

    void run_competing_write() {
      std::function<void(MemoryStore&)> write;
      write.swap(competing_write);
      if (write) write(*this);
    }
  };

  void competing_extend(MemoryStore& store, const std::string& period) {
    PeriodLock record = *store.find_lock("org_mh", period);
    int seen = record.unlock_extension_count;
    record.unlock_extension_count = seen + 1;
    record.unlock_expires_at = *record.unlock_expires_at + std::chrono::hours(1);
    BOOST_REQUIRE(store.MemoryStore::update_lock_if(record, LockStatus::unlocked_amendment, seen));
  }

  void competing_transition(MemoryStore& store, const std::string& period, LockStatus from, LockStatus to) {
    PeriodLock record = *store.find_lock("org_mh", period);
    record.status = to;
    record.locked_by = "other-instance";
    BOOST_REQUIRE(store.MemoryStore::update_lock_if(record, from, record.unlock_extension_count));
  }

  bool lost_race(const LedgerError& e) {
    return e.code() == ErrorCode::conflict &&
           std::string(e.what()).find("changed by another request") != std::string::npos;
  }
}

BOOST_FIXTURE_TEST_SUITE(period_lock_tests, engine_fixture)

// ---------------------------------------------------------------------------
// Lock / check
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testLockBlocksPosting)
{
  BOOST_CHECK_NO_THROW(locks.check("org_mh", "2025-06-15"));

  PeriodLock record = locks.lock("org_mh", "2025-06", accountant(), "June close");
  BOOST_CHECK(record.status == LockStatus::locked);
  BOOST_CHECK_EQUAL(std::string("arjun"), record.locked_by);
  BOOST_CHECK(!record.lock_id.empty());

  try {
    locks.check("org_mh", "2025-06-15");
    BOOST_FAIL("expected PeriodLockedError");
  } catch (const PeriodLockedError& e) {
    BOOST_CHECK_EQUAL(std::string("2025-06"), e.period());
    BOOST_CHECK_EQUAL(std::string("arjun"), e.locked_by());
    BOOST_CHECK(e.code() == ErrorCode::period_locked);
    BOOST_CHECK_EQUAL(409, e.http_status());
  }

  // neighbouring months and other organizations are untouched
  BOOST_CHECK_NO_THROW(locks.check("org_mh", "2025-07-01"));
  BOOST_CHECK_NO_THROW(locks.check("org_mh", "2025-05-31"));
  BOOST_CHECK_NO_THROW(locks.check("org_ka", "2025-06-15"));
}

BOOST_AUTO_TEST_CASE(testCheckAcceptsTimestamps)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", "2025-06-30T23:59:59Z"), LedgerError,
                        code_is(ErrorCode::period_locked));
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", CivilDate{2025, 6, 1}), LedgerError,
                        code_is(ErrorCode::period_locked));
}

BOOST_AUTO_TEST_CASE(testLockTwiceConflicts)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "2025-06", owner(), "again"), LedgerError,
                        code_is(ErrorCode::conflict));
}

BOOST_AUTO_TEST_CASE(testLockRoles)
{
  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "2025-06", technician(), "June close"), LedgerError,
                        code_is(ErrorCode::forbidden));
  BOOST_CHECK(!store.find_lock("org_mh", "2025-06"));

  BOOST_CHECK(can_lock_periods("accountant"));
  BOOST_CHECK(!can_unlock_periods("accountant"));
  BOOST_CHECK(can_unlock_periods("owner"));
}

BOOST_AUTO_TEST_CASE(testInvalidPeriod)
{
  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "2025-13", admin(), "x"), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "25-06", admin(), "x"), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.get("org_mh", "June"), LedgerError, code_is(ErrorCode::validation));
}

BOOST_AUTO_TEST_CASE(testMissingContext)
{
  BOOST_CHECK_EXCEPTION(locks.check("", "2025-06-15"), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", ""), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", "garbage"), LedgerError, code_is(ErrorCode::validation));

  config.allow_missing_context_bypass = true;
  BOOST_CHECK_NO_THROW(locks.check("", "2025-06-15"));
  BOOST_CHECK_NO_THROW(locks.check("org_mh", "  "));
  // an unreadable date is never bypassed
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", "garbage"), LedgerError, code_is(ErrorCode::validation));
}

// ---------------------------------------------------------------------------
// Amendment windows
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testUnlockOpensWindow)
{
  locks.lock("org_mh", "2025-06", accountant(), "June close");
  PeriodLock record = locks.unlock("org_mh", "2025-06", owner(), "  Correcting a vendor bill  ");

  BOOST_CHECK(record.status == LockStatus::unlocked_amendment);
  BOOST_REQUIRE(record.unlock_expires_at);
  BOOST_CHECK(*record.unlock_expires_at == clock.now + std::chrono::hours(72));
  BOOST_CHECK_EQUAL(std::string("Correcting a vendor bill"), *record.unlock_reason);
  BOOST_CHECK_EQUAL(std::string("olivia"), *record.unlocked_by);
  BOOST_CHECK_NO_THROW(locks.check("org_mh", "2025-06-15"));
}

BOOST_AUTO_TEST_CASE(testUnlockValidation)
{
  locks.lock("org_mh", "2025-06", accountant(), "June close");

  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", accountant(), "Correcting a vendor bill"), LedgerError,
                        code_is(ErrorCode::forbidden));
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", admin(), "  too short "), LedgerError,
                        code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 0), LedgerError,
                        code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 169), LedgerError,
                        code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-05", admin(), "Correcting a vendor bill"), LedgerError,
                        code_is(ErrorCode::not_found));

  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 168);
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill"), LedgerError,
                        code_is(ErrorCode::conflict));
}

BOOST_AUTO_TEST_CASE(testExtendIsCapped)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  PeriodLock opened = locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 72);
  Timestamp unlocked_at = *opened.unlocked_at;

  PeriodLock first = locks.extend("org_mh", "2025-06", admin(), 48);
  BOOST_CHECK_EQUAL(1, first.unlock_extension_count);
  BOOST_CHECK(*first.unlock_expires_at == unlocked_at + std::chrono::hours(120));

  // would reach 192 hours; stops at seven days
  PeriodLock second = locks.extend("org_mh", "2025-06", admin(), 72);
  BOOST_CHECK_EQUAL(2, second.unlock_extension_count);
  BOOST_CHECK(*second.unlock_expires_at == unlocked_at + std::chrono::hours(168));

  try {
    locks.extend("org_mh", "2025-06", admin(), 1);
    BOOST_FAIL("expected a conflict");
  } catch (const LedgerError& e) {
    BOOST_CHECK(e.code() == ErrorCode::conflict);
    BOOST_CHECK_EQUAL(std::string("Maximum extensions (2) reached for period 2025-06"), std::string(e.what()));
  }
}

BOOST_AUTO_TEST_CASE(testExtendRequiresWindow)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  BOOST_CHECK_EXCEPTION(locks.extend("org_mh", "2025-06", admin(), 24), LedgerError, code_is(ErrorCode::conflict));
  BOOST_CHECK_EXCEPTION(locks.extend("org_mh", "2025-06", admin(), 0), LedgerError, code_is(ErrorCode::validation));
  BOOST_CHECK_EXCEPTION(locks.extend("org_mh", "2025-01", admin(), 24), LedgerError, code_is(ErrorCode::not_found));
}

BOOST_AUTO_TEST_CASE(testRelockClearsAmendment)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill");
  PeriodLock relocked = locks.lock("org_mh", "2025-06", accountant(), "Amendment done");

  BOOST_CHECK(relocked.status == LockStatus::locked);
  BOOST_CHECK(!relocked.unlock_expires_at);
  BOOST_CHECK(!relocked.unlocked_by);
  BOOST_CHECK_EQUAL(0, relocked.unlock_extension_count);
  BOOST_CHECK_EXCEPTION(locks.check("org_mh", "2025-06-15"), LedgerError, code_is(ErrorCode::period_locked));
}

BOOST_AUTO_TEST_CASE(testAutoRelockAfterExpiry)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 1);
  locks.lock("org_mh", "2025-05", admin(), "May close");
  locks.unlock("org_mh", "2025-05", admin(), "Correcting a vendor bill", 24);

  BOOST_CHECK_EQUAL(0, locks.auto_relock());

  clock.advance_hours(2);
  BOOST_CHECK_EQUAL(1, locks.auto_relock());
  BOOST_CHECK_EQUAL(0, locks.auto_relock());

  std::optional<PeriodLock> june = locks.get("org_mh", "2025-06");
  BOOST_REQUIRE(june);
  BOOST_CHECK(june->status == LockStatus::locked);
  BOOST_CHECK_EQUAL(std::string("system"), june->locked_by);
  BOOST_CHECK_EQUAL(std::string("Auto-relocked after amendment window expired"), june->lock_reason);
  BOOST_CHECK(locks.get("org_mh", "2025-05")->status == LockStatus::unlocked_amendment);

  std::vector<AuditLogEntry> trail = locks.history("org_mh", "2025-06");
  BOOST_REQUIRE_EQUAL(3u, trail.size());
  BOOST_CHECK_EQUAL(std::string("AUTO_RELOCK_PERIOD"), trail[2].action);
  BOOST_CHECK_EQUAL(std::string("system"), trail[2].user_id);
  BOOST_CHECK_EQUAL(std::string("system"), trail[2].user_role);
}

BOOST_AUTO_TEST_CASE(testConcurrentExtendsEachGetAnAnswer)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 24);

  std::atomic<int> extended(0);
  std::atomic<int> conflicts(0);
  std::atomic<int> unexpected(0);
  std::vector<std::thread> callers;
  for (int i = 0; i < 4; ++i) {
    callers.push_back(std::thread([&] {
      try {
        locks.extend("org_mh", "2025-06", owner(), 12);
        ++extended;
      } catch (const LedgerError& e) {
        if (e.code() == ErrorCode::conflict) ++conflicts; else ++unexpected;
      }
    }));
  }
  for (std::thread& t : callers) t.join();

  // a single attempt either wins or is told it lost; never both, never silently
  BOOST_CHECK_EQUAL(0, unexpected.load());
  BOOST_CHECK_EQUAL(4, extended.load() + conflicts.load());
  BOOST_CHECK(extended.load() >= 1 && extended.load() <= 2);
  BOOST_CHECK_EQUAL(extended.load(), locks.get("org_mh", "2025-06")->unlock_extension_count);
}

BOOST_AUTO_TEST_CASE(testConcurrentExtendsWithRetryStopAtTwo)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 24);

  std::atomic<int> extended(0);
  std::atomic<int> refused(0);
  std::atomic<int> unexpected(0);
  std::vector<std::thread> callers;
  for (int i = 0; i < 4; ++i) {
    callers.push_back(std::thread([&] {
      for (;;) {
        try {
          locks.extend("org_mh", "2025-06", owner(), 12);
          ++extended;
          return;
        } catch (const LedgerError& e) {
          if (lost_race(e)) continue;
          if (e.code() == ErrorCode::conflict) ++refused; else ++unexpected;
          return;
        }
      }
    }));
  }
  for (std::thread& t : callers) t.join();

  BOOST_CHECK_EQUAL(0, unexpected.load());
  BOOST_CHECK_EQUAL(2, extended.load());
  BOOST_CHECK_EQUAL(2, refused.load());

  std::optional<PeriodLock> june = locks.get("org_mh", "2025-06");
  BOOST_CHECK_EQUAL(2, june->unlock_extension_count);
  BOOST_CHECK(*june->unlock_expires_at == utc(2025, 7, 12, 9));

  std::vector<AuditLogEntry> trail = locks.history("org_mh", "2025-06");
  BOOST_REQUIRE_EQUAL(4u, trail.size());
  BOOST_CHECK_EQUAL(std::string("EXTEND_UNLOCK"), trail[2].action);
  BOOST_CHECK_EQUAL(std::string("EXTEND_UNLOCK"), trail[3].action);
}

// ---------------------------------------------------------------------------
// Fiscal year close
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testLockFiscalYear)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");

  std::vector<FiscalYearLockResult> results = locks.lock_fiscal_year("org_mh", 2025, accountant());
  BOOST_REQUIRE_EQUAL(12u, results.size());
  BOOST_CHECK_EQUAL(std::string("2025-04"), results[0].period);
  BOOST_CHECK_EQUAL(std::string("2026-03"), results[11].period);

  BOOST_CHECK_EQUAL(std::string("skipped"), results[2].status);
  BOOST_CHECK_EQUAL(std::string("Period 2025-06 is already locked"), results[2].reason);

  int locked = 0;
  for (const FiscalYearLockResult& r : results) {
    if (r.status == "locked") ++locked;
  }
  BOOST_CHECK_EQUAL(11, locked);

  BOOST_CHECK_EQUAL(std::string("Fiscal year 2025-2026 close"), locks.get("org_mh", "2026-01")->lock_reason);
  BOOST_CHECK_EQUAL(12u, locks.list("org_mh").size());
  BOOST_CHECK_EQUAL(9u, locks.list("org_mh", 2025).size());
}

BOOST_AUTO_TEST_CASE(testFiscalYearUsesOrganizationStart)
{
  OrganizationSettings calendar;
  calendar.fiscal_year_start_month = 1;
  config.organizations["org_cal"] = calendar;

  std::vector<FiscalYearLockResult> results = locks.lock_fiscal_year("org_cal", 2024, admin());
  BOOST_CHECK_EQUAL(std::string("2024-01"), results.front().period);
  BOOST_CHECK_EQUAL(std::string("2024-12"), results.back().period);
}

BOOST_AUTO_TEST_CASE(testFiscalYearRejectsBadInput)
{
  BOOST_CHECK_EXCEPTION(locks.lock_fiscal_year("org_mh", 2025, technician()), LedgerError,
                        code_is(ErrorCode::forbidden));
  BOOST_CHECK_EXCEPTION(locks.lock_fiscal_year("org_mh", 1999, admin()), LedgerError,
                        code_is(ErrorCode::validation));
  BOOST_CHECK(locks.list("org_mh").empty());
}

// ---------------------------------------------------------------------------
// Audit trail
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testTransitionsAreAudited)
{
  locks.lock("org_mh", "2025-06", accountant(), "June close");
  clock.advance_hours(1);
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill");
  locks.extend("org_mh", "2025-06", owner(), 12);

  std::vector<AuditLogEntry> trail = locks.history("org_mh", "2025-06");
  BOOST_REQUIRE_EQUAL(3u, trail.size());

  BOOST_CHECK_EQUAL(std::string("LOCK_PERIOD"), trail[0].action);
  BOOST_CHECK(trail[0].before_snapshot.is_null());
  BOOST_CHECK_EQUAL(std::string("locked"), trail[0].after_snapshot["status"].get<std::string>());

  BOOST_CHECK_EQUAL(std::string("UNLOCK_PERIOD"), trail[1].action);
  BOOST_CHECK_EQUAL(std::string("alice"), trail[1].user_id);
  BOOST_CHECK_EQUAL(std::string("admin"), trail[1].user_role);
  BOOST_CHECK_EQUAL(std::string("10.0.0.1"), trail[1].ip);
  BOOST_CHECK_EQUAL(std::string("period_lock"), trail[1].resource_type);
  BOOST_CHECK_EQUAL(std::string("2025-06"), trail[1].resource_id);
  BOOST_CHECK_EQUAL(std::string("unlocked_amendment"), trail[1].after_snapshot["status"].get<std::string>());

  BOOST_CHECK_EQUAL(std::string("EXTEND_UNLOCK"), trail[2].action);
  BOOST_CHECK(locks.history("org_mh", "2025-07").empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ---------------------------------------------------------------------------
// Losing a compare-and-swap
// ---------------------------------------------------------------------------

BOOST_FIXTURE_TEST_SUITE(lock_race_tests, basic_engine_fixture<interleaving_store>)

BOOST_AUTO_TEST_CASE(testLockLosesToConcurrentInsert)
{
  store.competing_write = [](MemoryStore& s) {
    PeriodLock other;
    other.lock_id = "lock_other";
    other.organization_id = "org_mh";
    other.period = "2025-06";
    other.locked_by = "other-instance";
    BOOST_REQUIRE(s.MemoryStore::insert_lock(other));
  };

  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "2025-06", admin(), "June close"), LedgerError, lost_race);
  BOOST_CHECK_EQUAL(std::string("other-instance"), locks.get("org_mh", "2025-06")->locked_by);
  BOOST_CHECK(locks.history("org_mh", "2025-06").empty());
}

BOOST_AUTO_TEST_CASE(testRelockLosesToConcurrentRelock)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 24);

  store.competing_write = [](MemoryStore& s) {
    competing_transition(s, "2025-06", LockStatus::unlocked_amendment, LockStatus::locked);
  };
  BOOST_CHECK_EXCEPTION(locks.lock("org_mh", "2025-06", owner(), "Done amending"), LedgerError, lost_race);
  BOOST_CHECK_EQUAL(std::string("other-instance"), locks.get("org_mh", "2025-06")->locked_by);
  BOOST_CHECK_EQUAL(2u, locks.history("org_mh", "2025-06").size());
}

BOOST_AUTO_TEST_CASE(testUnlockLosesToConcurrentUnlock)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");

  store.competing_write = [](MemoryStore& s) {
    competing_transition(s, "2025-06", LockStatus::locked, LockStatus::unlocked_amendment);
  };
  BOOST_CHECK_EXCEPTION(locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill"), LedgerError, lost_race);
  BOOST_CHECK(!locks.get("org_mh", "2025-06")->unlocked_by);
  BOOST_CHECK_EQUAL(1u, locks.history("org_mh", "2025-06").size());
}

BOOST_AUTO_TEST_CASE(testExtendLosesToConcurrentExtend)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 24);

  store.competing_write = [](MemoryStore& s) { competing_extend(s, "2025-06"); };
  BOOST_CHECK_EXCEPTION(locks.extend("org_mh", "2025-06", owner(), 48), LedgerError, lost_race);

  std::optional<PeriodLock> june = locks.get("org_mh", "2025-06");
  BOOST_CHECK_EQUAL(1, june->unlock_extension_count);
  BOOST_CHECK(*june->unlock_expires_at == utc(2025, 7, 11, 10));
}

BOOST_AUTO_TEST_CASE(testAutoRelockSkipsRecordChangedUnderIt)
{
  locks.lock("org_mh", "2025-06", admin(), "June close");
  locks.unlock("org_mh", "2025-06", admin(), "Correcting a vendor bill", 1);
  clock.advance_hours(2);

  // an extend lands between the sweep's read and its swap
  store.competing_write = [](MemoryStore& s) { competing_extend(s, "2025-06"); };
  BOOST_CHECK_EQUAL(0, locks.auto_relock());

  std::optional<PeriodLock> june = locks.get("org_mh", "2025-06");
  BOOST_CHECK(june->status == LockStatus::unlocked_amendment);
  BOOST_CHECK_EQUAL(1, june->unlock_extension_count);
  for (const AuditLogEntry& e : locks.history("org_mh", "2025-06")) {
    BOOST_CHECK(e.action != std::string("AUTO_RELOCK_PERIOD"));
  }
}

BOOST_AUTO_TEST_SUITE_END()
