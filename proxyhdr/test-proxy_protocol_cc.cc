#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "iputils.hh"
#include "proxy-protocol.hh"

using namespace boost;
using std::string;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_cc)

#define BINARY(s) (std::string(s, sizeof(s) - 1))

#define PROXYMAGIC "\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49\x54\x0A"

static const string s_v1Example("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\n");

static const string s_v2Example = BINARY(
  PROXYMAGIC
  "\x21"             // version | command
  "\x11"             // ipv4=0x10 | TCP=0x1
  "\x00\x0c"         // 4 bytes IPv4 * 2 + 2 port numbers = 8 + 2 * 2 = 12 = 0xc
  "\xc0\xa8\x00\x01" // 192.168.0.1
  "\xc0\xa8\x00\x0b" // 192.168.0.11
  "\xdc\x04"         // 56324
  "\x01\xbb"         // 443
  );

static ComboAddress makeAddress(const string& str, uint16_t port = 0)
{
  auto address = parseIPLiteral(str);
  if (!address) {
    throw std::runtime_error("'" + str + "' is not an IP address");
  }
  address->setPort(port);
  return *address;
}

static std::optional<ProxyProtocolError> getDecodingError(const string& payload)
{
  StringProxyProtocolInput input(payload);
  try {
    readProxyHeader(input);
  }
  catch (const ProxyProtocolException& e) {
    return e.getKind();
  }
  return std::nullopt;
}

static void checkExampleFields(const ProxyHeader& header)
{
  BOOST_CHECK(header.getCommand() == ProxyProtocolCommand::Proxy);
  BOOST_CHECK(header.getTransportProtocol() == ProxyTransportProtocol::TCPv4);
  BOOST_CHECK_EQUAL(proxyAddressToString(header.getSourceAddress()), "192.168.0.1");
  BOOST_CHECK_EQUAL(proxyAddressToString(header.getDestinationAddress()), "192.168.0.11");
  BOOST_CHECK_EQUAL(header.getSourcePort(), 56324U);
  BOOST_CHECK_EQUAL(header.getDestinationPort(), 443U);
}

BOOST_AUTO_TEST_CASE(test_detection) {
  {
    StringProxyProtocolInput input("GET / HTTP/1.1\r\nHost: example.com\r\n\r\n");
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::None);
    BOOST_CHECK_EQUAL(input.getPosition(), 0U);
    BOOST_CHECK(!readProxyHeader(input));
    BOOST_CHECK_EQUAL(input.getPosition(), 0U);
  }

  {
    /* shorter than any signature */
    StringProxyProtocolInput input("PRO");
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::None);
    BOOST_CHECK(!readProxyHeader(input));
    BOOST_CHECK_EQUAL(input.getRemaining(), "PRO");
  }

  {
    StringProxyProtocolInput input("");
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::None);
    BOOST_CHECK(!readProxyHeader(input));
  }

  {
    /* an incomplete V2 signature is not a signature */
    StringProxyProtocolInput input(BINARY("\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49"));
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::None);
    BOOST_CHECK_EQUAL(input.getPosition(), 0U);
  }

  {
    StringProxyProtocolInput input(s_v1Example);
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::V1);
    BOOST_CHECK_EQUAL(input.getPosition(), 0U);
  }

  {
    StringProxyProtocolInput input(s_v2Example);
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::V2);
    BOOST_CHECK_EQUAL(input.getPosition(), 0U);
  }

  {
    /* the bare signature is enough for detection, not for decoding */
    StringProxyProtocolInput input(BINARY(PROXYMAGIC));
    BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::V2);
  }
}

BOOST_AUTO_TEST_CASE(test_v1_decode) {
  StringProxyProtocolInput input(s_v1Example + "GET / HTTP/1.1\r\n");
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  BOOST_CHECK_EQUAL(header->getVersion(), 1U);
  checkExampleFields(*header);
  BOOST_CHECK_EQUAL(input.getRemaining(), "GET / HTTP/1.1\r\n");
}

BOOST_AUTO_TEST_CASE(test_v1_roundtrip) {
  const std::vector<string> lines = {
    s_v1Example,
    "PROXY TCP4 255.255.255.255 255.255.255.255 65535 65535\r\n",
    "PROXY TCP4 10.0.0.1 10.0.0.2 0 0\r\n",
    "PROXY TCP6 2001:db8::1 ::1 18762 53\r\n",
    "PROXY TCP6 ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff 65535 65535\r\n",
    "PROXY UNKNOWN\r\n",
  };

  for (const auto& line : lines) {
    StringProxyProtocolInput input(line);
    auto header = readProxyHeader(input);
    BOOST_REQUIRE(header);
    BOOST_CHECK_EQUAL(header->toWire(), line);

    StringProxyProtocolOutput output;
    BOOST_CHECK_EQUAL(header->writeTo(output), line.size());
    BOOST_CHECK_EQUAL(output.getData(), line);
  }
}

BOOST_AUTO_TEST_CASE(test_v1_maximum_size) {
  const string widest("PROXY TCP6 ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff 65535 65535\r\n");
  BOOST_CHECK(!getDecodingError(widest));

  /* a line ending exactly at the limit, CRLF included, can be read */
  string line("PROXY UNKNOWN ");
  line.append(s_proxyProtocolV1MaximumHeaderSize - line.size() - 2, 'x');
  line.append("\r\n");
  BOOST_REQUIRE_EQUAL(line.size(), s_proxyProtocolV1MaximumHeaderSize);
  StringProxyProtocolInput input(line + "payload");
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  BOOST_CHECK(header->isLocal());
  BOOST_CHECK_EQUAL(input.getRemaining(), "payload");

  /* one byte more and it can't */
  string tooLong("PROXY UNKNOWN ");
  tooLong.append(s_proxyProtocolV1MaximumHeaderSize - tooLong.size() - 1, 'x');
  tooLong.append("\r\n");
  BOOST_CHECK(getDecodingError(tooLong) == ProxyProtocolError::CantReadHeaderLine);
}

BOOST_AUTO_TEST_CASE(test_v1_unknown) {
  {
    StringProxyProtocolInput input("PROXY UNKNOWN\r\npayload");
    auto header = readProxyHeader(input);
    BOOST_REQUIRE(header);
    BOOST_CHECK_EQUAL(header->getVersion(), 1U);
    BOOST_CHECK(header->isLocal());
    BOOST_CHECK(header->getTransportProtocol() == ProxyTransportProtocol::Unspec);
    BOOST_CHECK_EQUAL(input.getRemaining(), "payload");
  }

  {
    /* anything after UNKNOWN is ignored, even garbage */
    StringProxyProtocolInput input("PROXY UNKNOWN ffff:f...f:ffff ffff:f...f:ffff 65535 65535\r\npayload");
    auto header = readProxyHeader(input);
    BOOST_REQUIRE(header);
    BOOST_CHECK(header->isLocal());
    BOOST_CHECK(header->equalTo(ProxyHeader::makeLocal(2)));
    BOOST_CHECK_EQUAL(input.getRemaining(), "payload");
  }
}

BOOST_AUTO_TEST_CASE(test_v1_invalid_headers) {
  BOOST_CHECK(getDecodingError("PROXY\r\n") == ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError("PROXYTCP4 192.168.0.1 192.168.0.11 56324 443\r\n") == ProxyProtocolError::CantReadVersionAndCommand);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324\r\n") == ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443 80\r\n") == ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError("PROXY UDP4 192.168.0.1 192.168.0.11 56324 443\r\n") == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError("PROXY tcp4 192.168.0.1 192.168.0.11 56324 443\r\n") == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);

  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.256 192.168.0.11 56324 443\r\n") == ProxyProtocolError::InvalidAddress);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 example.com 56324 443\r\n") == ProxyProtocolError::InvalidAddress);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.1 192.168.0.11 56324 443\r\n") == ProxyProtocolError::InvalidAddress);
  BOOST_CHECK(getDecodingError("PROXY TCP4 ::1 192.168.0.11 56324 443\r\n") == ProxyProtocolError::FamilyMismatch);
  BOOST_CHECK(getDecodingError("PROXY TCP6 192.168.0.1 ::1 56324 443\r\n") == ProxyProtocolError::FamilyMismatch);
  BOOST_CHECK(getDecodingError("PROXY TCP6 ::1 192.168.0.1 56324 443\r\n") == ProxyProtocolError::FamilyMismatch);

  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 65536 443\r\n") == ProxyProtocolError::InvalidPortNumber);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 -1\r\n") == ProxyProtocolError::InvalidPortNumber);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443a\r\n") == ProxyProtocolError::InvalidPortNumber);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 +80 443\r\n") == ProxyProtocolError::InvalidPortNumber);

  /* line termination */
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\n") == ProxyProtocolError::CantReadHeaderLine);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\rX\n") == ProxyProtocolError::CantReadHeaderLine);
  BOOST_CHECK(getDecodingError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443") == ProxyProtocolError::CantReadHeaderLine);
  BOOST_CHECK(getDecodingError("PROXY " + string(200, 'A') + "\r\n") == ProxyProtocolError::CantReadHeaderLine);
}

BOOST_AUTO_TEST_CASE(test_v1_invalid_header_does_not_read_past_limit) {
  const string garbage = "PROXY " + string(200, 'A');
  StringProxyProtocolInput input(garbage);
  BOOST_CHECK_THROW(readProxyHeader(input), ProxyProtocolException);
  BOOST_CHECK_EQUAL(input.getPosition(), s_proxyProtocolV1MaximumHeaderSize);
}

BOOST_AUTO_TEST_CASE(test_v2_decode) {
  StringProxyProtocolInput input(s_v2Example + "payload");
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  BOOST_CHECK_EQUAL(header->getVersion(), 2U);
  checkExampleFields(*header);
  BOOST_CHECK_EQUAL(input.getRemaining(), "payload");

  /* same identity as the V1 example */
  StringProxyProtocolInput v1Input(s_v1Example);
  auto v1Header = readProxyHeader(v1Input);
  BOOST_REQUIRE(v1Header);
  BOOST_CHECK(header->equalTo(*v1Header));
  BOOST_CHECK(v1Header->equalTo(*header));
}

BOOST_AUTO_TEST_CASE(test_v2_encode) {
  const auto src = makeAddress("65.66.67.68", 18762);  // 18762 = 0x494a = "IJ"
  const auto dest = makeAddress("69.70.71.72", 19276); // 19276 = 0x4b4c = "KL"
  const auto header = ProxyHeader::fromComboAddresses(2, true, src, dest);

  BOOST_CHECK_EQUAL(header.toWire(), BINARY(
    PROXYMAGIC
    "\x21"          // version | command
    "\x11"          // ipv4=0x10 | TCP=0x1
    "\x00\x0c"      // 4 bytes IPv4 * 2 + 2 port numbers = 8 + 2 * 2 =12 = 0xc
    "ABCD"          // 65.66.67.68
    "EFGH"          // 69.70.71.72
    "IJ"            // src port
    "KL"            // dst port
    ));

  StringProxyProtocolInput input(header.toWire());
  auto parsed = readProxyHeader(input);
  BOOST_REQUIRE(parsed);
  BOOST_CHECK(parsed->equalTo(header));
  BOOST_CHECK_EQUAL(parsed->getSourcePort(), 18762U);
  BOOST_CHECK_EQUAL(parsed->getDestinationPort(), 19276U);
  BOOST_CHECK_EQUAL(input.getPosition(), 28U);
}

BOOST_AUTO_TEST_CASE(test_local_proxy_header) {
  auto payload = ProxyHeader::makeLocal(2).toWire();

  BOOST_CHECK_EQUAL(payload, BINARY(
    PROXYMAGIC
    "\x20"          // version | command
    "\x00"          // protocol family and address are set to 0
    "\x00\x00"      // no content
    ));

  StringProxyProtocolInput input(payload);
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  BOOST_CHECK(header->isLocal());
  BOOST_CHECK_EQUAL(header->getVersion(), 2U);
  BOOST_CHECK_EQUAL(input.getPosition(), 16U);

  /* a LOCAL header over a known family still announces the size of the block, zero-filled */
  const auto tcp4Local = ProxyHeader::makeLocal(2, ProxyTransportProtocol::TCPv4).toWire();
  BOOST_CHECK_EQUAL(tcp4Local, BINARY(PROXYMAGIC "\x20" "\x11" "\x00\x0c") + string(12, '\0'));
}

BOOST_AUTO_TEST_CASE(test_v2_local_with_content) {
  const auto payload = BINARY(
    PROXYMAGIC
    "\x20"
    "\x11"
    "\x00\x05"
    "\x01\x02\x03\x04\x05"
    "payload");

  StringProxyProtocolInput input(payload);
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  BOOST_CHECK(header->isLocal());
  BOOST_CHECK_EQUAL(input.getPosition(), 21U);
  BOOST_CHECK_EQUAL(input.getRemaining(), "payload");
  BOOST_CHECK(header->equalTo(ProxyHeader::makeLocal(1)));
  BOOST_CHECK(header->equalTo(ProxyHeader::makeLocal(2, ProxyTransportProtocol::UDPv6)));
}

BOOST_AUTO_TEST_CASE(test_v2_tlv_values_are_skipped) {
  const auto payload = BINARY(
    PROXYMAGIC
    "\x21"
    "\x11"
    "\x00\x13"         // 12 + 7 bytes of TLV
    "\xc0\xa8\x00\x01"
    "\xc0\xa8\x00\x0b"
    "\xdc\x04"
    "\x01\xbb"
    "\x04\x00\x04"     // type 4, length 4
    "abcd"
    "GET /");

  StringProxyProtocolInput input(payload);
  auto header = readProxyHeader(input);
  BOOST_REQUIRE(header);
  checkExampleFields(*header);
  BOOST_CHECK_EQUAL(input.getRemaining(), "GET /");

  /* TLV values are not emitted again */
  BOOST_CHECK_EQUAL(header->toWire(), s_v2Example);
}

BOOST_AUTO_TEST_CASE(test_v2_invalid_length) {
  const auto payload = BINARY(
    PROXYMAGIC
    "\x21"
    "\x11"
    "\x00\x08"         // IPv4 needs 12
    "\xc0\xa8\x00\x01"
    "\xc0\xa8\x00\x0b"
    "\xdc\x04"
    "\x01\xbb");

  StringProxyProtocolInput input(payload);
  try {
    readProxyHeader(input);
    BOOST_FAIL("an invalid length should have been detected");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::InvalidLength);
  }
  /* nothing was read past the fixed part */
  BOOST_CHECK_EQUAL(input.getPosition(), s_proxyProtocolMinimumHeaderSize);

  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x21" "\x00\x0c") + string(12, '\0')) == ProxyProtocolError::InvalidLength);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x31" "\x00\xd7") + string(215, '\0')) == ProxyProtocolError::InvalidLength);
}

BOOST_AUTO_TEST_CASE(test_v2_invalid_headers) {
  const auto addresses = BINARY("\x00\x0c" "\xc0\xa8\x00\x01" "\xc0\xa8\x00\x0b" "\xdc\x04" "\x01\xbb");

  BOOST_CHECK(!getDecodingError(BINARY(PROXYMAGIC "\x21" "\x11") + addresses));

  /* version */
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x11" "\x11") + addresses) == ProxyProtocolError::UnknownVersion);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x31" "\x11") + addresses) == ProxyProtocolError::UnknownVersion);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x01" "\x11") + addresses) == ProxyProtocolError::UnknownVersion);
  /* command */
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x22" "\x11") + addresses) == ProxyProtocolError::UnsupportedVersionAndCommand);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x2f" "\x11") + addresses) == ProxyProtocolError::UnsupportedVersionAndCommand);
  /* family and protocol */
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x13") + addresses) == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x41") + addresses) == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x10") + addresses) == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x01") + addresses) == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x20" "\x41") + addresses) == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);

  /* truncated fixed part */
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC)) == ProxyProtocolError::CantReadVersionAndCommand);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21")) == ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x11")) == ProxyProtocolError::CantReadLength);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x11" "\x00")) == ProxyProtocolError::CantReadLength);

  /* truncated content */
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x11" "\x00\x0c" "\xc0\xa8\x00\x01")) == ProxyProtocolError::TruncatedHeader);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x11" "\x00\x10") + addresses.substr(2)) == ProxyProtocolError::TruncatedHeader);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x20" "\x00" "\x00\x10" "abcd")) == ProxyProtocolError::TruncatedHeader);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x31" "\x00\xd8") + string(100, '\0')) == ProxyProtocolError::CantResolveSourceUnixAddress);
  BOOST_CHECK(getDecodingError(BINARY(PROXYMAGIC "\x21" "\x32" "\x00\xd8") + string(150, '\0')) == ProxyProtocolError::CantResolveDestinationUnixAddress);
}

BOOST_AUTO_TEST_CASE(test_v2_supported_family_grid) {
  for (unsigned int value = 0; value <= 0xff; value++) {
    /* large enough for every family, the remainder is skipped as TLV data */
    string payload = BINARY(PROXYMAGIC "\x21");
    payload.push_back(static_cast<char>(value));
    payload.append(BINARY("\x00\xd8"));
    payload.append(216, '\0');

    const auto error = getDecodingError(payload);
    const bool supported = value == 0x00 || value == 0x11 || value == 0x12 || value == 0x21 || value == 0x22 || value == 0x31 || value == 0x32;
    BOOST_CHECK_EQUAL(isSupportedTransportProtocol(static_cast<uint8_t>(value)), supported);
    if (supported) {
      BOOST_CHECK(!error);
    }
    else {
      BOOST_CHECK(error == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
    }
  }
}

BOOST_AUTO_TEST_CASE(test_v2_roundtrip) {
  const auto src4 = makeAddress("192.0.2.1");
  const auto dst4 = makeAddress("198.51.100.2");
  const auto src6 = makeAddress("2001:db8::1");
  const auto dst6 = makeAddress("::1");

  const std::vector<ProxyHeader> headers = {
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, src4, dst4, 0, 65535),
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::UDPv4, src4, dst4, 53, 5300),
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv6, src6, dst6, 443, 1),
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::UDPv6, src6, dst6, 65535, 0),
    ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, "/var/run/proxy.sock", "/var/run/backend.sock"),
    ProxyHeader::makeUnix(ProxyTransportProtocol::UnixDatagram, "", string(s_proxyProtocolUnixAddressSize, 'x')),
    ProxyHeader::makeUnspec(2),
    ProxyHeader::makeLocal(2),
    ProxyHeader::makeLocal(2, ProxyTransportProtocol::UnixStream),
  };

  for (const auto& header : headers) {
    const auto payload = header.toWire();
    BOOST_CHECK_EQUAL(payload.size(), s_proxyProtocolMinimumHeaderSize + getAddressBlockSize(header.getTransportProtocol()));

    StringProxyProtocolInput input(payload + "after");
    auto parsed = readProxyHeader(input);
    BOOST_REQUIRE(parsed);
    BOOST_CHECK(parsed->equalTo(header));
    BOOST_CHECK(header.equalTo(*parsed));
    BOOST_CHECK(parsed->getTransportProtocol() == header.getTransportProtocol());
    BOOST_CHECK_EQUAL(parsed->getVersion(), 2U);
    BOOST_CHECK_EQUAL(input.getRemaining(), "after");
  }
}

BOOST_AUTO_TEST_CASE(test_v2_unix_paths) {
  const auto header = ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, "/tmp/src", "/tmp/dst");
  const auto payload = header.toWire();
  BOOST_REQUIRE_EQUAL(payload.size(), 16U + 216U);
  BOOST_CHECK_EQUAL(payload.substr(12, 4), BINARY("\x21" "\x31" "\x00\xd8"));
  BOOST_CHECK_EQUAL(payload.substr(16, 8), "/tmp/src");
  BOOST_CHECK_EQUAL(payload.substr(24, 100), string(100, '\0'));
  BOOST_CHECK_EQUAL(payload.substr(124, 8), "/tmp/dst");

  StringProxyProtocolInput input(payload);
  auto parsed = readProxyHeader(input);
  BOOST_REQUIRE(parsed);
  const auto* source = std::get_if<ProxyUnixAddress>(&parsed->getSourceAddress());
  BOOST_REQUIRE(source != nullptr);
  BOOST_CHECK_EQUAL(source->path, "/tmp/src");
  BOOST_CHECK_EQUAL(proxyAddressToString(parsed->getDestinationAddress()), "/tmp/dst");
  BOOST_CHECK_EQUAL(parsed->getSourcePort(), 0U);

  BOOST_CHECK_THROW(ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, string(s_proxyProtocolUnixAddressSize + 1, 'a'), "/tmp/dst"), ProxyProtocolException);
  BOOST_CHECK_THROW(ProxyHeader::makeUnix(ProxyTransportProtocol::TCPv4, "/tmp/src", "/tmp/dst"), ProxyProtocolException);
}

BOOST_AUTO_TEST_CASE(test_v2_unix_abstract_names) {
  const string abstractName("\0abstract", 9);
  const string embeddedNul("a\0b", 3);
  const auto header = ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, abstractName, embeddedNul);

  StringProxyProtocolInput input(header.toWire());
  auto parsed = readProxyHeader(input);
  BOOST_REQUIRE(parsed);
  BOOST_CHECK(parsed->equalTo(header));
  BOOST_CHECK_EQUAL(std::get<ProxyUnixAddress>(parsed->getSourceAddress()).path.size(), abstractName.size());
  BOOST_CHECK(std::get<ProxyUnixAddress>(parsed->getSourceAddress()).path == abstractName);
  BOOST_CHECK(std::get<ProxyUnixAddress>(parsed->getDestinationAddress()).path == embeddedNul);

  /* two abstract names differing after the leading NUL stay apart */
  const auto other = ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, string("\0other", 6), embeddedNul);
  BOOST_CHECK(!parsed->equalTo(other));

  /* an abstract name using the whole 108 bytes */
  string fullName(s_proxyProtocolUnixAddressSize, 'x');
  fullName.at(0) = '\0';
  const auto full = ProxyHeader::makeUnix(ProxyTransportProtocol::UnixDatagram, fullName, "/run/b.sock");
  StringProxyProtocolInput fullInput(full.toWire());
  auto fullParsed = readProxyHeader(fullInput);
  BOOST_REQUIRE(fullParsed);
  BOOST_CHECK(fullParsed->equalTo(full));

  /* a trailing NUL would be taken for padding */
  try {
    ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, string("/tmp/src\0", 9), "/tmp/dst");
    BOOST_FAIL("a path ending with a NUL byte should have been rejected");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::InvalidAddress);
  }
  BOOST_CHECK_THROW(ProxyHeader::makeUnix(ProxyTransportProtocol::UnixStream, "/tmp/src", string(1, '\0')), ProxyProtocolException);
}

/* announces a V2 signature through peek() but has nothing left to read */
class VanishingInput : public ProxyProtocolInput
{
public:
  string peek(size_t count) override
  {
    return BINARY(PROXYMAGIC "\x21").substr(0, count);
  }

  void read(void* /* buffer */, size_t count) override
  {
    throw ProxyProtocolEOF("EOF after reading 0 of " + std::to_string(count) + " bytes");
  }
};

BOOST_AUTO_TEST_CASE(test_v2_signature_read_after_peek) {
  VanishingInput input;
  BOOST_REQUIRE(detectProxyProtocolSignature(input) == ProxyProtocolSignature::V2);
  try {
    readProxyHeaderV2(input);
    BOOST_FAIL("the stream ended inside the signature");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::TruncatedHeader);
  }
}

BOOST_AUTO_TEST_CASE(test_construction_validation) {
  const auto src4 = makeAddress("192.0.2.1");
  const auto src6 = makeAddress("2001:db8::1");

  try {
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, src4, src6, 1, 2);
    BOOST_FAIL("mixed families should have been rejected");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::FamilyMismatch);
  }

  try {
    ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv6, src4, src4, 1, 2);
    BOOST_FAIL("IPv4 addresses over TCP6 should have been rejected");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::FamilyMismatch);
  }

  BOOST_CHECK_THROW(ProxyHeader::makeProxy(2, ProxyTransportProtocol::UnixStream, src4, src4, 1, 2), ProxyProtocolException);
  BOOST_CHECK_THROW(ProxyHeader::fromComboAddresses(2, true, src4, src6), ProxyProtocolException);

  try {
    ProxyHeader::makeLocal(3);
    BOOST_FAIL("version 3 should have been rejected");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::UnknownVersion);
  }

  /* ports given with the addresses are not kept in them */
  const auto header = ProxyHeader::makeProxy(1, ProxyTransportProtocol::TCPv4, makeAddress("192.0.2.1", 53), makeAddress("192.0.2.2", 54), 1, 2);
  BOOST_CHECK_EQUAL(std::get<ComboAddress>(header.getSourceAddress()).getPort(), 0U);
  BOOST_CHECK_EQUAL(header.getSourcePort(), 1U);
}

BOOST_AUTO_TEST_CASE(test_v1_encoding) {
  const auto tcp6 = ProxyHeader::makeProxy(1, ProxyTransportProtocol::TCPv6, makeAddress("2001:db8::1"), makeAddress("2001:db8::2"), 1234, 80);
  BOOST_CHECK_EQUAL(tcp6.toWire(), "PROXY TCP6 2001:db8::1 2001:db8::2 1234 80\r\n");

  BOOST_CHECK_EQUAL(ProxyHeader::makeLocal(1, ProxyTransportProtocol::TCPv4).toWire(), "PROXY UNKNOWN\r\n");
  BOOST_CHECK_EQUAL(ProxyHeader::makeUnspec(1).toWire(), "PROXY UNKNOWN\r\n");

  /* no V1 shape for datagrams, nothing is written */
  const auto udp4 = ProxyHeader::makeProxy(1, ProxyTransportProtocol::UDPv4, makeAddress("192.0.2.1"), makeAddress("192.0.2.2"), 1, 2);
  StringProxyProtocolOutput output;
  try {
    udp4.writeTo(output);
    BOOST_FAIL("UDP can't be sent in a version 1 header");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  }
  BOOST_CHECK(output.getData().empty());
}

BOOST_AUTO_TEST_CASE(test_equality) {
  const auto proxy = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.11"), 56324, 443);
  const auto proxyV1 = ProxyHeader::makeProxy(1, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.11"), 56324, 443);
  const auto otherPort = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.11"), 56325, 443);
  const auto otherDestinationPort = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.11"), 56324, 444);
  const auto otherSource = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.2"), makeAddress("192.168.0.11"), 56324, 443);
  const auto otherDestination = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.12"), 56324, 443);
  const auto udp = ProxyHeader::makeProxy(2, ProxyTransportProtocol::UDPv4, makeAddress("192.168.0.1"), makeAddress("192.168.0.11"), 56324, 443);
  const auto local = ProxyHeader::makeLocal(2);
  const auto localV1 = ProxyHeader::makeLocal(1, ProxyTransportProtocol::Unspec);
  const auto localTCP6 = ProxyHeader::makeLocal(2, ProxyTransportProtocol::TCPv6);

  BOOST_CHECK(proxy.equalTo(proxy));
  BOOST_CHECK(proxy.equalTo(proxyV1));
  BOOST_CHECK(proxyV1.equalTo(proxy));

  for (const auto& other : {otherPort, otherDestinationPort, otherSource, otherDestination, udp, local}) {
    BOOST_CHECK(!proxy.equalTo(other));
    BOOST_CHECK(!other.equalTo(proxy));
  }

  BOOST_CHECK(local.equalTo(local));
  BOOST_CHECK(local.equalTo(localV1));
  BOOST_CHECK(localTCP6.equalTo(local));
  BOOST_CHECK(local.equalTo(localTCP6));

  BOOST_CHECK(proxyHeadersEqual(proxy, proxyV1));
  BOOST_CHECK(!proxyHeadersEqual(proxy, std::nullopt));
  BOOST_CHECK(!proxyHeadersEqual(std::nullopt, proxy));
  BOOST_CHECK(!proxyHeadersEqual(std::nullopt, std::nullopt));
  BOOST_CHECK(!proxyHeadersEqual(std::nullopt, local));
}

BOOST_AUTO_TEST_CASE(test_is_proxy_header_complete) {
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v2Example), 28);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v2Example + "payload"), 28);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v2Example.substr(0, 20)), -8);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v2Example.substr(0, 14)), -2);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v2Example.substr(0, 10)), -6);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(ProxyHeader::makeLocal(2).toWire()), 16);

  /* invalid length for the family */
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(BINARY(PROXYMAGIC "\x21" "\x11" "\x00\x08") + string(8, '\0')), 0);
  /* unsupported version */
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(BINARY(PROXYMAGIC "\x31" "\x11" "\x00\x0c") + string(12, '\0')), 0);
  /* wrong magic */
  BOOST_CHECK_EQUAL(isProxyHeaderComplete("GET / HTTP/1.1\r\n"), 0);

  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v1Example), static_cast<ssize_t>(s_v1Example.size()));
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v1Example + "GET / HTTP/1.1\r\n"), static_cast<ssize_t>(s_v1Example.size()));
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(s_v1Example.substr(0, 20)), -1);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete("PRO"), -2);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete("PROXY TCP4 192.168.0.1 192.168.0.11 56324 99999\r\n"), 0);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete("PROXY " + string(120, 'A')), 0);
}

BOOST_AUTO_TEST_CASE(test_transport_names) {
  BOOST_CHECK_EQUAL(transportProtocolToString(ProxyTransportProtocol::TCPv4), "TCP4");
  BOOST_CHECK_EQUAL(transportProtocolToString(ProxyTransportProtocol::UnixDatagram), "UNIX_DGRAM");
  BOOST_CHECK(transportProtocolFromString("UDP6") == ProxyTransportProtocol::UDPv6);
  BOOST_CHECK(!transportProtocolFromString("SCTP4"));

  const auto header = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv6, makeAddress("2001:db8::1"), makeAddress("::1"), 1, 2);
  BOOST_CHECK_EQUAL(header.toString(), "v2 PROXY TCP6 [2001:db8::1]:1 -> [::1]:2");
  BOOST_CHECK_EQUAL(ProxyHeader::makeLocal(1).toString(), "v1 LOCAL UNSPEC");
}

BOOST_AUTO_TEST_SUITE_END()
