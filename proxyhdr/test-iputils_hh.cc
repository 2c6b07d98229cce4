#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>
#include "iputils.hh"

using namespace boost;

BOOST_AUTO_TEST_SUITE(test_iputils_hh)

static ComboAddress makeAddress(const std::string& str)
{
  auto address = parseIPLiteral(str);
  BOOST_REQUIRE(address);
  return *address;
}

BOOST_AUTO_TEST_CASE(test_ComboAddress) {
  ComboAddress unset;
  BOOST_CHECK(unset.isIPv4());
  BOOST_CHECK_EQUAL(unset.getPort(), 0U);
  BOOST_CHECK_EQUAL(unset.toString(), "0.0.0.0");

  auto local = makeAddress("127.0.0.1");
  BOOST_CHECK_EQUAL(local.sin4.sin_family, AF_INET);
  BOOST_CHECK_EQUAL(local.sin4.sin_port, 0);
  BOOST_CHECK_EQUAL(local.sin4.sin_addr.s_addr, htonl(0x7f000001UL));

  local.setPort(53);
  BOOST_CHECK_EQUAL(local.sin4.sin_port, htons(53));
  BOOST_CHECK_EQUAL(local.getPort(), 53U);
  BOOST_CHECK_EQUAL(local.getNetworkOrderPort(), htons(53));
}

BOOST_AUTO_TEST_CASE(test_ComboAddressToString) {
  BOOST_CHECK_EQUAL(makeAddress("192.0.2.1").toString(), "192.0.2.1");
  BOOST_CHECK_EQUAL(makeAddress("2001:DB8:0:0:0:0:0:1").toString(), "2001:db8::1");

  auto v4 = makeAddress("192.0.2.1");
  v4.setPort(443);
  BOOST_CHECK_EQUAL(v4.toStringWithPort(), "192.0.2.1:443");

  auto v6 = makeAddress("2001:db8::1");
  v6.setPort(65535);
  BOOST_CHECK_EQUAL(v6.toStringWithPort(), "[2001:db8::1]:65535");
}

BOOST_AUTO_TEST_CASE(test_ComboAddressBytes) {
  BOOST_CHECK_EQUAL(makeAddress("65.66.67.68").toByteString(), "ABCD");
  BOOST_CHECK_EQUAL(makeAddress("::1").toByteString(), std::string(15, '\0') + "\x01");

  const auto v4 = makeComboAddressFromRaw(4, "ABCD");
  BOOST_CHECK(v4.isIPv4());
  BOOST_CHECK_EQUAL(v4.toString(), "65.66.67.68");

  const auto v6 = makeComboAddressFromRaw(6, std::string("\x20\x01\x0d\xb8", 4) + std::string(11, '\0') + "\x02");
  BOOST_CHECK(v6.isIPv6());
  BOOST_CHECK_EQUAL(v6.toString(), "2001:db8::2");

  BOOST_CHECK_THROW(makeComboAddressFromRaw(4, "ABC"), ProxyHdrException);
  BOOST_CHECK_THROW(makeComboAddressFromRaw(6, "ABCD"), ProxyHdrException);
  BOOST_CHECK_THROW(makeComboAddressFromRaw(5, "ABCD"), ProxyHdrException);
}

BOOST_AUTO_TEST_CASE(test_parseIPLiteral) {
  auto address = parseIPLiteral("192.168.0.1");
  BOOST_REQUIRE(address);
  BOOST_CHECK(address->isIPv4());
  BOOST_CHECK_EQUAL(address->toString(), "192.168.0.1");
  BOOST_CHECK_EQUAL(address->getPort(), 0U);

  address = parseIPLiteral("2001:db8::1");
  BOOST_REQUIRE(address);
  BOOST_CHECK(address->isIPv6());
  BOOST_CHECK_EQUAL(address->toString(), "2001:db8::1");

  address = parseIPLiteral("::ffff:192.0.2.1");
  BOOST_REQUIRE(address);
  BOOST_CHECK(address->isIPv6());

  /* ports, brackets, scope ids and inet_aton() shorthands are not literals */
  BOOST_CHECK(!parseIPLiteral("127.1"));
  BOOST_CHECK(!parseIPLiteral("192.168.0.1:53"));
  BOOST_CHECK(!parseIPLiteral("[::1]"));
  BOOST_CHECK(!parseIPLiteral("[::1]:53"));
  BOOST_CHECK(!parseIPLiteral("fe80::1%eth0"));

  BOOST_CHECK(!parseIPLiteral(""));
  BOOST_CHECK(!parseIPLiteral("192.168.0.256"));
  BOOST_CHECK(!parseIPLiteral(" 192.168.0.1"));
  BOOST_CHECK(!parseIPLiteral("192.168.0.1 "));
  BOOST_CHECK(!parseIPLiteral("example.com"));
  BOOST_CHECK(!parseIPLiteral(std::string("192.168.0.1\0", 12)));
}

BOOST_AUTO_TEST_SUITE_END()
