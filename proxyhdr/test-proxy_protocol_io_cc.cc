#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include <array>
#include <unistd.h>

#include "misc.hh"
#include "proxy-protocol.hh"
#include "proxy-protocol-io.hh"

using namespace boost;
using std::string;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_io_cc)

static ComboAddress makeAddress(const string& str)
{
  auto address = parseIPLiteral(str);
  if (!address) {
    throw std::runtime_error("'" + str + "' is not an IP address");
  }
  return *address;
}

struct PipePair
{
  PipePair()
  {
    int fds[2];
    if (pipe(fds) != 0) {
      unixDie("Creating a pipe");
    }
    reader = FDWrapper(fds[0]);
    writer = FDWrapper(fds[1]);
  }

  void send(const string& data)
  {
    writen2(writer.getHandle(), data);
  }

  void closeWriter()
  {
    writer.reset();
  }

  FDWrapper reader;
  FDWrapper writer;
};

BOOST_AUTO_TEST_CASE(test_fd_input_peek_does_not_consume) {
  PipePair pipes;
  pipes.send("PROXY UNKNOWN\r\nGET / HTTP/1.1\r\n");
  pipes.closeWriter();

  FDProxyProtocolInput input(pipes.reader.getHandle(), 4);
  BOOST_CHECK_EQUAL(input.peek(5), "PROXY");
  BOOST_CHECK_EQUAL(input.peek(13), "PROXY UNKNOWN");
  BOOST_CHECK(detectProxyProtocolSignature(input) == ProxyProtocolSignature::V1);

  char chr = 0;
  input.read(&chr, 1);
  BOOST_CHECK_EQUAL(chr, 'P');
  BOOST_CHECK_EQUAL(input.peek(4), "ROXY");
}

BOOST_AUTO_TEST_CASE(test_fd_input_header_and_payload) {
  PipePair pipes;
  const auto header = ProxyHeader::makeProxy(2, ProxyTransportProtocol::TCPv6, makeAddress("2001:db8::1"), makeAddress("2001:db8::2"), 4242, 853);
  pipes.send(header.toWire() + "the payload");
  pipes.closeWriter();

  /* small reads, the header spans several of them */
  FDProxyProtocolInput input(pipes.reader.getHandle(), 7);
  auto parsed = readProxyHeader(input);
  BOOST_REQUIRE(parsed);
  BOOST_CHECK(parsed->equalTo(header));

  string payload = input.getBufferedData();
  std::array<char, 64> buffer{};
  size_t got = 0;
  while ((got = readAtMost(pipes.reader.getHandle(), buffer.data(), buffer.size())) > 0) {
    payload.append(buffer.data(), got);
  }
  BOOST_CHECK_EQUAL(payload, "the payload");
}

BOOST_AUTO_TEST_CASE(test_fd_input_without_header) {
  PipePair pipes;
  pipes.send("GET");
  pipes.closeWriter();

  FDProxyProtocolInput input(pipes.reader.getHandle());
  /* fewer bytes than requested, the stream ended */
  BOOST_CHECK_EQUAL(input.peek(s_proxyProtocolSignatureProbeSize), "GET");
  BOOST_CHECK(!readProxyHeader(input));
  BOOST_CHECK_EQUAL(input.getBufferedData(), "GET");
}

BOOST_AUTO_TEST_CASE(test_fd_input_eof) {
  PipePair pipes;
  pipes.send("abc");
  pipes.closeWriter();

  FDProxyProtocolInput input(pipes.reader.getHandle());
  std::array<char, 4> buffer{};
  BOOST_CHECK_THROW(input.read(buffer.data(), buffer.size()), ProxyProtocolEOF);
  BOOST_CHECK_THROW(input.read(buffer.data(), 1), ProxyProtocolEOF);
  BOOST_CHECK_EQUAL(input.peek(10), "");
}

BOOST_AUTO_TEST_CASE(test_fd_input_truncated_header) {
  PipePair pipes;
  pipes.send(ProxyHeader::makeProxy(2, ProxyTransportProtocol::UDPv4, makeAddress("192.0.2.1"), makeAddress("192.0.2.2"), 53, 53).toWire().substr(0, 20));
  pipes.closeWriter();

  FDProxyProtocolInput input(pipes.reader.getHandle());
  try {
    readProxyHeader(input);
    BOOST_FAIL("a truncated header should not be accepted");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ProxyProtocolError::TruncatedHeader);
  }
}

BOOST_AUTO_TEST_CASE(test_fd_output) {
  PipePair pipes;
  FDProxyProtocolOutput output(pipes.writer.getHandle());
  const auto header = ProxyHeader::makeLocal(2);
  BOOST_CHECK_EQUAL(header.writeTo(output), s_proxyProtocolMinimumHeaderSize);
  pipes.closeWriter();

  FDProxyProtocolInput input(pipes.reader.getHandle());
  std::array<char, s_proxyProtocolMinimumHeaderSize> buffer{};
  input.read(buffer.data(), buffer.size());
  BOOST_CHECK_EQUAL(string(buffer.data(), buffer.size()), header.toWire());
  BOOST_CHECK_EQUAL(input.peek(1), "");
}

BOOST_AUTO_TEST_CASE(test_string_input) {
  StringProxyProtocolInput input("0123456789");
  BOOST_CHECK_EQUAL(input.peek(4), "0123");
  BOOST_CHECK_EQUAL(input.peek(20), "0123456789");
  BOOST_CHECK_EQUAL(input.getPosition(), 0U);

  std::array<char, 3> buffer{};
  input.read(buffer.data(), buffer.size());
  BOOST_CHECK_EQUAL(string(buffer.data(), buffer.size()), "012");
  input.skip(2);
  BOOST_CHECK_EQUAL(input.getPosition(), 5U);
  BOOST_CHECK_EQUAL(input.getRemaining(), "56789");

  BOOST_CHECK_THROW(input.skip(6), ProxyProtocolEOF);
  BOOST_CHECK_EQUAL(input.getRemaining(), "");
  BOOST_CHECK_THROW(input.read(buffer.data(), 1), ProxyProtocolEOF);
}

BOOST_AUTO_TEST_CASE(test_string_output) {
  StringProxyProtocolOutput output;
  BOOST_CHECK_EQUAL(output.write("abc", 3), 3U);
  BOOST_CHECK_EQUAL(output.write("def", 3), 3U);
  BOOST_CHECK_EQUAL(output.getData(), "abcdef");
}

BOOST_AUTO_TEST_SUITE_END()
