#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include <cerrno>

#include "misc.hh"

using std::string;

BOOST_AUTO_TEST_SUITE(test_misc_hh)

BOOST_AUTO_TEST_CASE(test_stringtok) {
  vector<string> parts;
  stringtok(parts, "PROXY TCP4  192.0.2.1 ", " ");
  BOOST_REQUIRE_EQUAL(parts.size(), 3U);
  BOOST_CHECK_EQUAL(parts.at(0), "PROXY");
  BOOST_CHECK_EQUAL(parts.at(1), "TCP4");
  BOOST_CHECK_EQUAL(parts.at(2), "192.0.2.1");

  parts.clear();
  stringtok(parts, "   ", " ");
  BOOST_CHECK(parts.empty());
}

BOOST_AUTO_TEST_CASE(test_parsePortNumber) {
  uint16_t port = 42;
  BOOST_CHECK(proxyhdr::parsePortNumber("0", port));
  BOOST_CHECK_EQUAL(port, 0U);
  BOOST_CHECK(proxyhdr::parsePortNumber("65535", port));
  BOOST_CHECK_EQUAL(port, 65535U);
  BOOST_CHECK(proxyhdr::parsePortNumber("00053", port));
  BOOST_CHECK_EQUAL(port, 53U);

  port = 42;
  BOOST_CHECK(!proxyhdr::parsePortNumber("65536", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("99999", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("000053", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("-1", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("+1", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber(" 1", port));
  BOOST_CHECK(!proxyhdr::parsePortNumber("0x10", port));
  /* untouched on failure */
  BOOST_CHECK_EQUAL(port, 42U);
}

BOOST_AUTO_TEST_CASE(test_hex) {
  BOOST_CHECK_EQUAL(makeHexDump(string("\x0d\x0a\x00\xff", 4)), "0d 0a 00 ff ");
  BOOST_CHECK_EQUAL(makeHexDump("AB", ""), "4142");
  BOOST_CHECK_EQUAL(makeHexDump(""), "");
}

BOOST_AUTO_TEST_CASE(test_stringerror) {
  BOOST_CHECK(!stringerror(ENOENT).empty());
  BOOST_CHECK_EQUAL(stringerror(ENOENT), proxyhdr::getMessageFromErrno(ENOENT));
}

BOOST_AUTO_TEST_SUITE_END()
