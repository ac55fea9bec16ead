/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * t_gstin.cpp - GSTIN layout, state table and check character
 */

#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "gstin.hpp"

using namespace lgate;

BOOST_AUTO_TEST_SUITE(gstin_tests)

BOOST_AUTO_TEST_CASE(testValidGstin)
{
  GstinValidation v = validate_gstin("27AABCU9603R1ZN");

  BOOST_CHECK(v.valid);
  BOOST_CHECK_EQUAL(std::string("27"), v.state_code);
  BOOST_CHECK_EQUAL(std::string("Maharashtra"), v.state_name);
  BOOST_CHECK_EQUAL(std::string("AABCU9603R"), v.pan);
  BOOST_CHECK_EQUAL(std::string("1"), v.entity_code);
  BOOST_CHECK(v.error.empty());
}

BOOST_AUTO_TEST_CASE(testNormalizesInput)
{
  GstinValidation v = validate_gstin("  29aagcb7383j1z4 ");

  BOOST_CHECK(v.valid);
  BOOST_CHECK_EQUAL(std::string("29AAGCB7383J1Z4"), v.gstin);
  BOOST_CHECK_EQUAL(std::string("Karnataka"), v.state_name);
}

BOOST_AUTO_TEST_CASE(testCheckCharacter)
{
  BOOST_CHECK_EQUAL('N', *gstin_check_character("27AABCU9603R1Z"));
  BOOST_CHECK_EQUAL('V', *gstin_check_character("27AAPFU0939F1Z"));
  BOOST_CHECK(!gstin_check_character("27AABCU9603R1#"));

  GstinValidation v = validate_gstin("27AABCU9603R1ZM");
  BOOST_CHECK(!v.valid);
  BOOST_CHECK_EQUAL(std::string("Invalid GSTIN checksum. Expected N at position 15."), v.error);
}

BOOST_AUTO_TEST_CASE(testRejectsMalformed)
{
  BOOST_CHECK_EQUAL(std::string("GSTIN is empty"), validate_gstin("   ").error);
  BOOST_CHECK_EQUAL(std::string("GSTIN must be 15 characters"), validate_gstin("27AABCU9603R1Z").error);
  BOOST_CHECK_EQUAL(std::string("Invalid GSTIN format"), validate_gstin("27AABC19603R1ZN").error);
  BOOST_CHECK_EQUAL(std::string("Invalid GSTIN format"), validate_gstin("27AABCU9603R1YN").error);
  BOOST_CHECK_EQUAL(std::string("Invalid state code: 99"), validate_gstin("99AABCU9603R1ZN").error);
}

BOOST_AUTO_TEST_CASE(testStateTable)
{
  BOOST_REQUIRE(find_gst_state("27") != nullptr);
  BOOST_CHECK_EQUAL(std::string("Maharashtra"), find_gst_state("27")->name);
  BOOST_CHECK(find_gst_state("00") == nullptr);
  BOOST_CHECK(find_gst_state("97") != nullptr);

  const std::vector<GstState>& states = gst_states();
  BOOST_REQUIRE(!states.empty());
  BOOST_CHECK_EQUAL(std::string("01"), states.front().code);
  for (size_t i = 1; i < states.size(); ++i) {
    BOOST_CHECK(states[i - 1].code < states[i].code);
  }
}

BOOST_AUTO_TEST_SUITE_END()
