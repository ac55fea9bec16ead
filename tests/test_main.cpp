/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * test_main.cpp - Boost.Test entry point
 */

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE lgate
#include <boost/test/unit_test.hpp>

#include "logger.hpp"

// Keeps stdout readable; the log ring still records for assertions.
struct quiet_log_fixture {
  quiet_log_fixture() { lgate::lgate_set_console_echo(false); }
};

BOOST_GLOBAL_FIXTURE(quiet_log_fixture);
