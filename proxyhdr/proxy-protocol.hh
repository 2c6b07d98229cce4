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
#pragma once

#include <optional>
#include <variant>

#include "iputils.hh"
#include "proxy-protocol-io.hh"

enum class ProxyProtocolError : uint8_t
{
  NoProxyProtocolSignature,
  CantReadVersionAndCommand,
  CantReadAddressFamilyAndProtocol,
  CantReadLength,
  CantReadHeaderLine,
  CantResolveSourceUnixAddress,
  CantResolveDestinationUnixAddress,
  UnknownVersion,
  UnsupportedVersionAndCommand,
  UnsupportedAddressFamilyAndProtocol,
  InvalidLength,
  TruncatedHeader,
  InvalidAddress,
  FamilyMismatch,
  InvalidPortNumber
};

const char* proxyProtocolErrorToString(ProxyProtocolError kind);

class ProxyProtocolException : public std::runtime_error
{
public:
  ProxyProtocolException(ProxyProtocolError kind) :
    std::runtime_error(proxyProtocolErrorToString(kind)), d_kind(kind)
  {
  }
  ProxyProtocolException(ProxyProtocolError kind, const string& details) :
    std::runtime_error(string(proxyProtocolErrorToString(kind)) + ": " + details), d_kind(kind)
  {
  }

  [[nodiscard]] ProxyProtocolError getKind() const
  {
    return d_kind;
  }

private:
  ProxyProtocolError d_kind;
};

enum class ProxyProtocolCommand : uint8_t
{
  Local = 0x00,
  Proxy = 0x01
};

/* the value is the V2 family and protocol byte: family in the high nibble,
   stream (1) or datagram (2) in the low nibble */
enum class ProxyTransportProtocol : uint8_t
{
  Unspec = 0x00,
  TCPv4 = 0x11,
  UDPv4 = 0x12,
  TCPv6 = 0x21,
  UDPv6 = 0x22,
  UnixStream = 0x31,
  UnixDatagram = 0x32
};

enum class ProxyProtocolSignature : uint8_t
{
  None,
  V1,
  V2
};

static const size_t s_proxyProtocolMinimumHeaderSize = 16;
static const size_t s_proxyProtocolV1MaximumHeaderSize = 107;
static const size_t s_proxyProtocolSignatureProbeSize = 13;
static const size_t s_proxyProtocolUnixAddressSize = 108;

bool isSupportedTransportProtocol(uint8_t value);
/* "TCP4", "UDP6", "UNIX_STREAM"... */
string transportProtocolToString(ProxyTransportProtocol transport);
std::optional<ProxyTransportProtocol> transportProtocolFromString(const string& name);
/* size of the fixed address block for this family: 12, 36, 216 or 0 */
size_t getAddressBlockSize(ProxyTransportProtocol transport);

struct ProxyUnixAddress
{
  string path;

  bool operator==(const ProxyUnixAddress& rhs) const
  {
    return path == rhs.path;
  }
};

/* no address (LOCAL or UNSPEC), an IPv4/IPv6 address, or a Unix socket path */
using ProxyAddress = std::variant<std::monostate, ComboAddress, ProxyUnixAddress>;

string proxyAddressToString(const ProxyAddress& address);

/* Immutable once built. Ports are kept apart from the addresses, the port
   of the ComboAddress members is always zero. */
class ProxyHeader
{
public:
  static ProxyHeader makeLocal(uint8_t version, ProxyTransportProtocol transport = ProxyTransportProtocol::Unspec);
  /* PROXY command with an UNSPEC transport: no address information */
  static ProxyHeader makeUnspec(uint8_t version);
  static ProxyHeader makeProxy(uint8_t version, ProxyTransportProtocol transport, const ComboAddress& source, const ComboAddress& destination, uint16_t sourcePort, uint16_t destinationPort);
  /* paths of up to 108 bytes, NULs allowed except as the last byte */
  static ProxyHeader makeUnix(ProxyTransportProtocol transport, const string& sourcePath, const string& destinationPath);
  /* takes the ports from the addresses */
  static ProxyHeader fromComboAddresses(uint8_t version, bool tcp, const ComboAddress& source, const ComboAddress& destination);

  [[nodiscard]] uint8_t getVersion() const
  {
    return d_version;
  }
  [[nodiscard]] ProxyProtocolCommand getCommand() const
  {
    return d_command;
  }
  [[nodiscard]] bool isLocal() const
  {
    return d_command == ProxyProtocolCommand::Local;
  }
  [[nodiscard]] ProxyTransportProtocol getTransportProtocol() const
  {
    return d_transport;
  }
  [[nodiscard]] const ProxyAddress& getSourceAddress() const
  {
    return d_source;
  }
  [[nodiscard]] const ProxyAddress& getDestinationAddress() const
  {
    return d_destination;
  }
  [[nodiscard]] uint16_t getSourcePort() const
  {
    return d_sourcePort;
  }
  [[nodiscard]] uint16_t getDestinationPort() const
  {
    return d_destinationPort;
  }

  [[nodiscard]] bool equalTo(const ProxyHeader& rhs) const;

  /* renders the header in the wire format of its version, throws
     ProxyProtocolException when it can't be represented */
  [[nodiscard]] string toWire() const;
  /* nothing is written if the header can't be rendered, errors from the
     output are propagated as they are */
  size_t writeTo(ProxyProtocolOutput& output) const;

  [[nodiscard]] string toString() const;

private:
  ProxyHeader(uint8_t version, ProxyProtocolCommand command, ProxyTransportProtocol transport, ProxyAddress source, ProxyAddress destination, uint16_t sourcePort, uint16_t destinationPort);

  [[nodiscard]] string toWireV1() const;
  [[nodiscard]] string toWireV2() const;

  ProxyAddress d_source;
  ProxyAddress d_destination;
  uint16_t d_sourcePort{0};
  uint16_t d_destinationPort{0};
  uint8_t d_version;
  ProxyProtocolCommand d_command;
  ProxyTransportProtocol d_transport;
};

std::ostream& operator<<(std::ostream& stream, const ProxyHeader& header);

/* an absent header is never equal to anything, not even another absent one */
bool proxyHeadersEqual(const std::optional<ProxyHeader>& lhs, const std::optional<ProxyHeader>& rhs);

/* peeks at the start of the input, never consumes anything */
ProxyProtocolSignature detectProxyProtocolSignature(ProxyProtocolInput& input);

/* Returns an empty optional, with the input untouched, when there is no
   PROXY protocol signature. Throws ProxyProtocolException when a header is
   present but invalid, the input must then be considered unusable. */
std::optional<ProxyHeader> readProxyHeader(ProxyProtocolInput& input);
ProxyHeader readProxyHeaderV1(ProxyProtocolInput& input);
ProxyHeader readProxyHeaderV2(ProxyProtocolInput& input);

/* returns: number of bytes consumed (positive) after successful parse
         or number of bytes missing (negative)
         or unfixable parse error (0)*/
ssize_t isProxyHeaderComplete(const string& header);
