/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <algorithm>
#include <array>

#include "proxy-protocol.hh"

#define PROXYMAGIC "\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49\x54\x0A"
#define PROXYMAGICLEN sizeof(PROXYMAGIC)-1

static const string proxymagic(PROXYMAGIC, PROXYMAGICLEN);
static const string proxymagicV1("PROXY");

const char* proxyProtocolErrorToString(ProxyProtocolError kind)
{
  switch (kind) {
  case ProxyProtocolError::NoProxyProtocolSignature:
    return "Proxy protocol signature not present";
  case ProxyProtocolError::CantReadVersionAndCommand:
    return "Can't read proxy protocol version and command";
  case ProxyProtocolError::CantReadAddressFamilyAndProtocol:
    return "Can't read address family or protocol";
  case ProxyProtocolError::CantReadLength:
    return "Can't read length";
  case ProxyProtocolError::CantReadHeaderLine:
    return "Can't read a CRLF-terminated proxy protocol header line";
  case ProxyProtocolError::CantResolveSourceUnixAddress:
    return "Can't resolve source Unix address";
  case ProxyProtocolError::CantResolveDestinationUnixAddress:
    return "Can't resolve destination Unix address";
  case ProxyProtocolError::UnknownVersion:
    return "Unknown proxy protocol version";
  case ProxyProtocolError::UnsupportedVersionAndCommand:
    return "Unsupported proxy protocol version and command";
  case ProxyProtocolError::UnsupportedAddressFamilyAndProtocol:
    return "Unsupported address family and protocol";
  case ProxyProtocolError::InvalidLength:
    return "Invalid length";
  case ProxyProtocolError::TruncatedHeader:
    return "Stream ended before the end of the proxy protocol header";
  case ProxyProtocolError::InvalidAddress:
    return "Invalid address";
  case ProxyProtocolError::FamilyMismatch:
    return "IP address(es) family doesn't match protocol";
  case ProxyProtocolError::InvalidPortNumber:
    return "Invalid port number";
  }
  return "Unknown proxy protocol error";
}

bool isSupportedTransportProtocol(uint8_t value)
{
  switch (value) {
  case static_cast<uint8_t>(ProxyTransportProtocol::Unspec):
  case static_cast<uint8_t>(ProxyTransportProtocol::TCPv4):
  case static_cast<uint8_t>(ProxyTransportProtocol::UDPv4):
  case static_cast<uint8_t>(ProxyTransportProtocol::TCPv6):
  case static_cast<uint8_t>(ProxyTransportProtocol::UDPv6):
  case static_cast<uint8_t>(ProxyTransportProtocol::UnixStream):
  case static_cast<uint8_t>(ProxyTransportProtocol::UnixDatagram):
    return true;
  default:
    return false;
  }
}

static const std::array<std::pair<ProxyTransportProtocol, const char*>, 7> s_transportNames{{
  {ProxyTransportProtocol::Unspec, "UNSPEC"},
  {ProxyTransportProtocol::TCPv4, "TCP4"},
  {ProxyTransportProtocol::UDPv4, "UDP4"},
  {ProxyTransportProtocol::TCPv6, "TCP6"},
  {ProxyTransportProtocol::UDPv6, "UDP6"},
  {ProxyTransportProtocol::UnixStream, "UNIX_STREAM"},
  {ProxyTransportProtocol::UnixDatagram, "UNIX_DGRAM"},
}};

string transportProtocolToString(ProxyTransportProtocol transport)
{
  for (const auto& entry : s_transportNames) {
    if (entry.first == transport) {
      return entry.second;
    }
  }
  return "UNKNOWN(" + std::to_string(static_cast<unsigned int>(transport)) + ")";
}

std::optional<ProxyTransportProtocol> transportProtocolFromString(const string& name)
{
  for (const auto& entry : s_transportNames) {
    if (name == entry.second) {
      return entry.first;
    }
  }
  return std::nullopt;
}

static uint8_t getFamily(ProxyTransportProtocol transport)
{
  return static_cast<uint8_t>(transport) >> 4;
}

static bool isIPTransport(ProxyTransportProtocol transport)
{
  return getFamily(transport) == 0x1 || getFamily(transport) == 0x2;
}

static bool isUnixTransport(ProxyTransportProtocol transport)
{
  return getFamily(transport) == 0x3;
}

size_t getAddressBlockSize(ProxyTransportProtocol transport)
{
  static const size_t addr4Size = sizeof(ComboAddress::sin4.sin_addr.s_addr);
  static const size_t addr6Size = sizeof(ComboAddress::sin6.sin6_addr.s6_addr);
  static const size_t portsSize = sizeof(uint16_t) * 2;

  switch (getFamily(transport)) {
  case 0x1:
    return addr4Size * 2 + portsSize;
  case 0x2:
    return addr6Size * 2 + portsSize;
  case 0x3:
    return s_proxyProtocolUnixAddressSize * 2;
  default:
    return 0;
  }
}

string proxyAddressToString(const ProxyAddress& address)
{
  if (const auto* ip = std::get_if<ComboAddress>(&address)) {
    return ip->toString();
  }
  if (const auto* unixAddress = std::get_if<ProxyUnixAddress>(&address)) {
    return unixAddress->path;
  }
  return "";
}

ProxyHeader::ProxyHeader(uint8_t version, ProxyProtocolCommand command, ProxyTransportProtocol transport, ProxyAddress source, ProxyAddress destination, uint16_t sourcePort, uint16_t destinationPort) :
  d_source(std::move(source)), d_destination(std::move(destination)), d_sourcePort(sourcePort), d_destinationPort(destinationPort), d_version(version), d_command(command), d_transport(transport)
{
  if (d_version != 1 && d_version != 2) {
    throw ProxyProtocolException(ProxyProtocolError::UnknownVersion, std::to_string(d_version));
  }
  if (!isSupportedTransportProtocol(static_cast<uint8_t>(d_transport))) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol);
  }
}

ProxyHeader ProxyHeader::makeLocal(uint8_t version, ProxyTransportProtocol transport)
{
  return ProxyHeader(version, ProxyProtocolCommand::Local, transport, std::monostate(), std::monostate(), 0, 0);
}

ProxyHeader ProxyHeader::makeUnspec(uint8_t version)
{
  return ProxyHeader(version, ProxyProtocolCommand::Proxy, ProxyTransportProtocol::Unspec, std::monostate(), std::monostate(), 0, 0);
}

ProxyHeader ProxyHeader::makeProxy(uint8_t version, ProxyTransportProtocol transport, const ComboAddress& source, const ComboAddress& destination, uint16_t sourcePort, uint16_t destinationPort)
{
  if (!isIPTransport(transport)) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, "an IPv4 or IPv6 transport is required for IP addresses");
  }

  const bool wantV4 = getFamily(transport) == 0x1;
  if (source.isIPv4() != wantV4 || destination.isIPv4() != wantV4 || (!source.isIPv4() && !source.isIPv6()) || (!destination.isIPv4() && !destination.isIPv6())) {
    throw ProxyProtocolException(ProxyProtocolError::FamilyMismatch, source.toString() + " -> " + destination.toString() + " over " + transportProtocolToString(transport));
  }

  ComboAddress src(source);
  ComboAddress dst(destination);
  src.setPort(0);
  dst.setPort(0);
  return ProxyHeader(version, ProxyProtocolCommand::Proxy, transport, src, dst, sourcePort, destinationPort);
}

static void checkUnixPath(const string& path, const string& which)
{
  if (path.size() > s_proxyProtocolUnixAddressSize) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidAddress, which + " Unix path is longer than " + std::to_string(s_proxyProtocolUnixAddressSize) + " bytes");
  }
  // trailing NULs can't be told apart from the padding once on the wire
  if (!path.empty() && path.back() == '\0') {
    throw ProxyProtocolException(ProxyProtocolError::InvalidAddress, which + " Unix path ends with a NUL byte");
  }
}

ProxyHeader ProxyHeader::makeUnix(ProxyTransportProtocol transport, const string& sourcePath, const string& destinationPath)
{
  if (!isUnixTransport(transport)) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, "a Unix transport is required for socket paths");
  }
  checkUnixPath(sourcePath, "source");
  checkUnixPath(destinationPath, "destination");

  return ProxyHeader(2, ProxyProtocolCommand::Proxy, transport, ProxyUnixAddress{sourcePath}, ProxyUnixAddress{destinationPath}, 0, 0);
}

ProxyHeader ProxyHeader::fromComboAddresses(uint8_t version, bool tcp, const ComboAddress& source, const ComboAddress& destination)
{
  if (source.sin4.sin_family != destination.sin4.sin_family) {
    throw ProxyProtocolException(ProxyProtocolError::FamilyMismatch, "the PROXY destination and source addresses must be of the same family");
  }

  ProxyTransportProtocol transport;
  if (source.isIPv4()) {
    transport = tcp ? ProxyTransportProtocol::TCPv4 : ProxyTransportProtocol::UDPv4;
  }
  else {
    transport = tcp ? ProxyTransportProtocol::TCPv6 : ProxyTransportProtocol::UDPv6;
  }

  return makeProxy(version, transport, source, destination, source.getPort(), destination.getPort());
}

bool ProxyHeader::equalTo(const ProxyHeader& rhs) const
{
  if (isLocal() || rhs.isLocal()) {
    return isLocal() && rhs.isLocal();
  }

  return d_transport == rhs.d_transport && proxyAddressToString(d_source) == proxyAddressToString(rhs.d_source) && proxyAddressToString(d_destination) == proxyAddressToString(rhs.d_destination) && d_sourcePort == rhs.d_sourcePort && d_destinationPort == rhs.d_destinationPort;
}

bool proxyHeadersEqual(const std::optional<ProxyHeader>& lhs, const std::optional<ProxyHeader>& rhs)
{
  if (!lhs || !rhs) {
    return false;
  }
  return lhs->equalTo(*rhs);
}

string ProxyHeader::toWireV1() const
{
  if (isLocal() || d_transport == ProxyTransportProtocol::Unspec) {
    return "PROXY UNKNOWN\r\n";
  }

  if (d_transport != ProxyTransportProtocol::TCPv4 && d_transport != ProxyTransportProtocol::TCPv6) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, transportProtocolToString(d_transport) + " can't be sent in a version 1 header");
  }

  string ret;
  ret.reserve(s_proxyProtocolV1MaximumHeaderSize);
  ret.append("PROXY ");
  ret.append(transportProtocolToString(d_transport));
  ret.append(" ");
  ret.append(proxyAddressToString(d_source));
  ret.append(" ");
  ret.append(proxyAddressToString(d_destination));
  ret.append(" ");
  ret.append(std::to_string(d_sourcePort));
  ret.append(" ");
  ret.append(std::to_string(d_destinationPort));
  ret.append("\r\n");
  return ret;
}

static void appendUnixPath(string& out, const ProxyAddress& address)
{
  string path;
  if (const auto* unixAddress = std::get_if<ProxyUnixAddress>(&address)) {
    path = unixAddress->path;
  }
  path.resize(s_proxyProtocolUnixAddressSize, '\0');
  out.append(path);
}

string ProxyHeader::toWireV2() const
{
  const uint8_t versioncommand = (0x20 | static_cast<uint8_t>(d_command));
  const uint8_t protocol = static_cast<uint8_t>(d_transport);
  const size_t additionalDataSize = getAddressBlockSize(d_transport);
  const uint16_t contentlen = htons(static_cast<uint16_t>(additionalDataSize));

  string ret;
  ret.reserve(s_proxyProtocolMinimumHeaderSize + additionalDataSize);
  ret.append(proxymagic);
  ret.append(reinterpret_cast<const char*>(&versioncommand), sizeof(versioncommand));
  ret.append(reinterpret_cast<const char*>(&protocol), sizeof(protocol));
  ret.append(reinterpret_cast<const char*>(&contentlen), sizeof(contentlen));

  if (isLocal()) {
    // no meaningful content, but the block still has the size announced for the family
    ret.append(additionalDataSize, '\0');
    return ret;
  }

  if (isIPTransport(d_transport)) {
    const auto& source = std::get<ComboAddress>(d_source);
    const auto& destination = std::get<ComboAddress>(d_destination);
    const uint16_t sourcePort = htons(d_sourcePort);
    const uint16_t destinationPort = htons(d_destinationPort);

    ret.append(source.toByteString());
    ret.append(destination.toByteString());
    ret.append(reinterpret_cast<const char*>(&sourcePort), sizeof(sourcePort));
    ret.append(reinterpret_cast<const char*>(&destinationPort), sizeof(destinationPort));
  }
  else if (isUnixTransport(d_transport)) {
    appendUnixPath(ret, d_source);
    appendUnixPath(ret, d_destination);
  }

  return ret;
}

string ProxyHeader::toWire() const
{
  switch (d_version) {
  case 1:
    return toWireV1();
  case 2:
    return toWireV2();
  default:
    throw ProxyProtocolException(ProxyProtocolError::UnknownVersion, std::to_string(d_version));
  }
}

size_t ProxyHeader::writeTo(ProxyProtocolOutput& output) const
{
  const auto payload = toWire();
  return output.write(payload.data(), payload.size());
}

string ProxyHeader::toString() const
{
  string ret = "v" + std::to_string(d_version) + " " + (isLocal() ? "LOCAL" : "PROXY") + " " + transportProtocolToString(d_transport);
  if (isLocal() || d_transport == ProxyTransportProtocol::Unspec) {
    return ret;
  }

  if (isUnixTransport(d_transport)) {
    return ret + " " + proxyAddressToString(d_source) + " -> " + proxyAddressToString(d_destination);
  }

  auto source = std::get<ComboAddress>(d_source);
  auto destination = std::get<ComboAddress>(d_destination);
  source.setPort(d_sourcePort);
  destination.setPort(d_destinationPort);
  return ret + " " + source.toStringWithPort() + " -> " + destination.toStringWithPort();
}

std::ostream& operator<<(std::ostream& stream, const ProxyHeader& header)
{
  return stream << header.toString();
}

ProxyProtocolSignature detectProxyProtocolSignature(ProxyProtocolInput& input)
{
  // don't touch the input before knowing whether this is a valid header
  const auto signature = input.peek(s_proxyProtocolSignatureProbeSize);

  if (signature.size() >= proxymagicV1.size() && signature.compare(0, proxymagicV1.size(), proxymagicV1) == 0) {
    return ProxyProtocolSignature::V1;
  }
  if (signature.size() >= proxymagic.size() && signature.compare(0, proxymagic.size(), proxymagic) == 0) {
    return ProxyProtocolSignature::V2;
  }
  return ProxyProtocolSignature::None;
}

std::optional<ProxyHeader> readProxyHeader(ProxyProtocolInput& input)
{
  switch (detectProxyProtocolSignature(input)) {
  case ProxyProtocolSignature::V1:
    return readProxyHeaderV1(input);
  case ProxyProtocolSignature::V2:
    return readProxyHeaderV2(input);
  case ProxyProtocolSignature::None:
    break;
  }
  return std::nullopt;
}

static void readOrThrow(ProxyProtocolInput& input, void* buffer, size_t len, ProxyProtocolError kind)
{
  try {
    input.read(buffer, len);
  }
  catch (const ProxyProtocolEOF& e) {
    throw ProxyProtocolException(kind, e.what());
  }
}

static void skipOrThrow(ProxyProtocolInput& input, size_t len, ProxyProtocolError kind)
{
  try {
    input.skip(len);
  }
  catch (const ProxyProtocolEOF& e) {
    throw ProxyProtocolException(kind, e.what());
  }
}

static string readHeaderLine(ProxyProtocolInput& input)
{
  string line;
  line.reserve(s_proxyProtocolV1MaximumHeaderSize);

  for (;;) {
    if (line.size() >= s_proxyProtocolV1MaximumHeaderSize) {
      throw ProxyProtocolException(ProxyProtocolError::CantReadHeaderLine, "no CRLF in the first " + std::to_string(s_proxyProtocolV1MaximumHeaderSize) + " bytes");
    }

    char chr = 0;
    readOrThrow(input, &chr, sizeof(chr), ProxyProtocolError::CantReadHeaderLine);

    if (!line.empty() && line.back() == '\r') {
      if (chr != '\n') {
        throw ProxyProtocolException(ProxyProtocolError::CantReadHeaderLine, "CR not followed by LF");
      }
      line.pop_back();
      return line;
    }
    if (chr == '\n') {
      throw ProxyProtocolException(ProxyProtocolError::CantReadHeaderLine, "LF not preceded by CR");
    }
    line.push_back(chr);
  }
}

static ComboAddress parseV1Address(const string& text, ProxyTransportProtocol transport)
{
  auto address = parseIPLiteral(text);
  if (!address) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidAddress, "'" + text + "'");
  }
  const bool wantV4 = transport == ProxyTransportProtocol::TCPv4;
  if (address->isIPv4() != wantV4) {
    throw ProxyProtocolException(ProxyProtocolError::FamilyMismatch, "'" + text + "' over " + transportProtocolToString(transport));
  }
  return *address;
}

static uint16_t parseV1Port(const string& text)
{
  uint16_t port = 0;
  if (!proxyhdr::parsePortNumber(text, port)) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidPortNumber, "'" + text + "'");
  }
  return port;
}

ProxyHeader readProxyHeaderV1(ProxyProtocolInput& input)
{
  if (detectProxyProtocolSignature(input) != ProxyProtocolSignature::V1) {
    throw ProxyProtocolException(ProxyProtocolError::NoProxyProtocolSignature);
  }

  const auto line = readHeaderLine(input);

  vector<string> tokens;
  stringtok(tokens, line, " ");

  if (tokens.empty() || tokens.at(0) != proxymagicV1) {
    throw ProxyProtocolException(ProxyProtocolError::CantReadVersionAndCommand);
  }
  if (tokens.size() < 2) {
    throw ProxyProtocolException(ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  }

  const auto& keyword = tokens.at(1);
  if (keyword == "UNKNOWN") {
    // whatever follows UNKNOWN is ignored
    return ProxyHeader::makeLocal(1, ProxyTransportProtocol::Unspec);
  }

  ProxyTransportProtocol transport;
  if (keyword == "TCP4") {
    transport = ProxyTransportProtocol::TCPv4;
  }
  else if (keyword == "TCP6") {
    transport = ProxyTransportProtocol::TCPv6;
  }
  else {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, "'" + keyword + "'");
  }

  if (tokens.size() != 6) {
    throw ProxyProtocolException(ProxyProtocolError::CantReadAddressFamilyAndProtocol, "expected 6 fields, got " + std::to_string(tokens.size()));
  }

  const auto source = parseV1Address(tokens.at(2), transport);
  const auto destination = parseV1Address(tokens.at(3), transport);
  const auto sourcePort = parseV1Port(tokens.at(4));
  const auto destinationPort = parseV1Port(tokens.at(5));

  return ProxyHeader::makeProxy(1, transport, source, destination, sourcePort, destinationPort);
}

/* Validates the 16 bytes following (and including) the signature. */
static void parseV2FixedHeader(const uint8_t* data, ProxyProtocolCommand& command, ProxyTransportProtocol& transport, uint16_t& contentlen)
{
  const uint8_t versioncommand = data[12];
  if ((versioncommand >> 4) != 0x2) {
    throw ProxyProtocolException(ProxyProtocolError::UnknownVersion, std::to_string(versioncommand >> 4));
  }

  /* remove the version to get the command */
  const uint8_t cmd = versioncommand & 0x0f;
  if (cmd == 0x00) {
    command = ProxyProtocolCommand::Local;
  }
  else if (cmd == 0x01) {
    command = ProxyProtocolCommand::Proxy;
  }
  else {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedVersionAndCommand, std::to_string(cmd));
  }

  const uint8_t protocol = data[13];
  if (!isSupportedTransportProtocol(protocol)) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, std::to_string(protocol));
  }
  transport = static_cast<ProxyTransportProtocol>(protocol);

  contentlen = (static_cast<uint16_t>(data[14]) << 8) + static_cast<uint16_t>(data[15]);
  if (command == ProxyProtocolCommand::Proxy && contentlen < getAddressBlockSize(transport)) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidLength, std::to_string(contentlen) + " is less than the " + std::to_string(getAddressBlockSize(transport)) + " bytes required for " + transportProtocolToString(transport));
  }
}

static string readUnixPath(ProxyProtocolInput& input, ProxyProtocolError kind)
{
  std::array<char, s_proxyProtocolUnixAddressSize> raw{};
  readOrThrow(input, raw.data(), raw.size(), kind);
  // only the trailing padding goes, abstract socket names start with a NUL
  size_t len = raw.size();
  while (len > 0 && raw.at(len - 1) == '\0') {
    len--;
  }
  return string(raw.data(), len);
}

ProxyHeader readProxyHeaderV2(ProxyProtocolInput& input)
{
  if (detectProxyProtocolSignature(input) != ProxyProtocolSignature::V2) {
    throw ProxyProtocolException(ProxyProtocolError::NoProxyProtocolSignature);
  }

  std::array<uint8_t, s_proxyProtocolMinimumHeaderSize> fixed{};
  readOrThrow(input, fixed.data(), proxymagic.size(), ProxyProtocolError::TruncatedHeader);
  readOrThrow(input, &fixed.at(12), 1, ProxyProtocolError::CantReadVersionAndCommand);
  readOrThrow(input, &fixed.at(13), 1, ProxyProtocolError::CantReadAddressFamilyAndProtocol);
  readOrThrow(input, &fixed.at(14), 2, ProxyProtocolError::CantReadLength);

  ProxyProtocolCommand command;
  ProxyTransportProtocol transport;
  uint16_t contentlen = 0;
  parseV2FixedHeader(fixed.data(), command, transport, contentlen);

  if (command == ProxyProtocolCommand::Local) {
    skipOrThrow(input, contentlen, ProxyProtocolError::TruncatedHeader);
    return ProxyHeader::makeLocal(2, transport);
  }

  const size_t addressBlockSize = getAddressBlockSize(transport);
  std::optional<ProxyHeader> header;

  if (transport == ProxyTransportProtocol::Unspec) {
    header = ProxyHeader::makeUnspec(2);
  }
  else if (isUnixTransport(transport)) {
    const auto source = readUnixPath(input, ProxyProtocolError::CantResolveSourceUnixAddress);
    const auto destination = readUnixPath(input, ProxyProtocolError::CantResolveDestinationUnixAddress);
    header = ProxyHeader::makeUnix(transport, source, destination);
  }
  else {
    const uint8_t ipVersion = getFamily(transport) == 0x1 ? 4 : 6;
    const size_t addrSize = (addressBlockSize - sizeof(uint16_t) * 2) / 2;
    std::array<char, 36> raw{};
    readOrThrow(input, raw.data(), addressBlockSize, ProxyProtocolError::TruncatedHeader);

    size_t pos = 0;
    const auto source = makeComboAddressFromRaw(ipVersion, &raw.at(pos), addrSize);
    pos += addrSize;
    const auto destination = makeComboAddressFromRaw(ipVersion, &raw.at(pos), addrSize);
    pos += addrSize;
    const uint16_t sourcePort = (static_cast<uint8_t>(raw.at(pos)) << 8) + static_cast<uint8_t>(raw.at(pos + 1));
    pos += sizeof(uint16_t);
    const uint16_t destinationPort = (static_cast<uint8_t>(raw.at(pos)) << 8) + static_cast<uint8_t>(raw.at(pos + 1));

    header = ProxyHeader::makeProxy(2, transport, source, destination, sourcePort, destinationPort);
  }

  /* TLV values, not interpreted but they have to go */
  skipOrThrow(input, contentlen - addressBlockSize, ProxyProtocolError::TruncatedHeader);

  return *header;
}

ssize_t isProxyHeaderComplete(const string& header)
{
  if (header.size() >= proxymagicV1.size() && header.compare(0, proxymagicV1.size(), proxymagicV1) == 0) {
    const auto end = header.find("\r\n");
    if (end == string::npos || end + 2 > s_proxyProtocolV1MaximumHeaderSize) {
      return header.size() >= s_proxyProtocolV1MaximumHeaderSize ? 0 : -1;
    }

    try {
      StringProxyProtocolInput input(header.substr(0, end + 2));
      readProxyHeaderV1(input);
    }
    catch (const ProxyProtocolException&) {
      return 0;
    }
    return static_cast<ssize_t>(end + 2);
  }

  if (header.size() < proxymagic.size()) {
    // could still become one of the two signatures
    if (proxymagicV1.compare(0, header.size(), header, 0, std::min(header.size(), proxymagicV1.size())) == 0) {
      return -static_cast<ssize_t>(proxymagicV1.size() - header.size());
    }
    if (proxymagic.compare(0, header.size(), header) == 0) {
      return -static_cast<ssize_t>(s_proxyProtocolMinimumHeaderSize - header.size());
    }
    return 0;
  }

  if (header.compare(0, proxymagic.size(), proxymagic) != 0) {
    // wrong magic, can not be a proxy header
    return 0;
  }

  if (header.size() < s_proxyProtocolMinimumHeaderSize) {
    return -static_cast<ssize_t>(s_proxyProtocolMinimumHeaderSize - header.size());
  }

  ProxyProtocolCommand command;
  ProxyTransportProtocol transport;
  uint16_t contentlen = 0;
  try {
    parseV2FixedHeader(reinterpret_cast<const uint8_t*>(header.data()), command, transport, contentlen);
  }
  catch (const ProxyProtocolException&) {
    return 0;
  }

  if (header.size() < s_proxyProtocolMinimumHeaderSize + contentlen) {
    return -static_cast<ssize_t>((s_proxyProtocolMinimumHeaderSize + contentlen) - header.size());
  }

  return static_cast<ssize_t>(s_proxyProtocolMinimumHeaderSize + contentlen);
}
