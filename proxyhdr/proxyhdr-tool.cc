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
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <array>
#include <fstream>
#include <optional>
#include <boost/program_options.hpp>

#include "logger.hh"
#include "misc.hh"
#include "proxy-protocol.hh"

#include "namespaces.hh"

namespace po = boost::program_options;
static po::variables_map g_vm;

static void usage(const po::options_description& desc)
{
  cerr << "Syntax: proxyhdr-tool --decode FILE... | --encode [OPTIONS]" << endl;
  cerr << "Use '-' as FILE to read from standard input." << endl;
  cerr << desc << endl;
}

static size_t drain(int descriptor)
{
  std::array<char, 4096> buffer{};
  size_t total = 0;
  for (;;) {
    auto got = readAtMost(descriptor, buffer.data(), buffer.size());
    if (got == 0) {
      return total;
    }
    total += got;
  }
}

static std::optional<ProxyHeader> decodeOne(const string& fileName)
{
  FDWrapper file;
  int descriptor = STDIN_FILENO;
  if (fileName != "-") {
    file = FDWrapper(open(fileName.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.getHandle() < 0) {
      throw runtime_error("Unable to open '" + fileName + "': " + stringerror());
    }
    descriptor = file.getHandle();
  }

  FDProxyProtocolInput input(descriptor);
  auto header = readProxyHeader(input);
  const size_t payloadSize = input.getBufferedData().size() + drain(descriptor);

  if (!header) {
    cout << fileName << ": no proxy protocol header, " << payloadSize << " bytes of payload" << endl;
    return header;
  }

  cout << fileName << ": " << *header << ", " << payloadSize << " bytes of payload" << endl;
  if (g_vm.count("hex") != 0) {
    cout << "  " << makeHexDump(header->toWire()) << endl;
  }
  return header;
}

static int decode(const vector<string>& files)
{
  std::optional<ProxyHeader> previous;
  int ret = EXIT_SUCCESS;

  for (const auto& fileName : files) {
    try {
      auto header = decodeOne(fileName);
      if (previous && header && !proxyHeadersEqual(previous, header)) {
        g_log << Logger::Warning << "Proxy protocol header in '" << fileName << "' differs from the previous one: " << previous->toString() << " vs " << header->toString() << endl;
      }
      if (header) {
        previous = std::move(header);
      }
    }
    catch (const ProxyProtocolException& e) {
      g_log << Logger::Error << "Invalid proxy protocol header in '" << fileName << "': " << e.what() << endl;
      ret = EXIT_FAILURE;
    }
    catch (const std::runtime_error& e) {
      g_log << Logger::Error << "Error while reading '" << fileName << "': " << e.what() << endl;
      ret = EXIT_FAILURE;
    }
  }

  return ret;
}

static ProxyHeader buildHeader()
{
  const auto version = g_vm["header-version"].as<int>();
  if (version != 1 && version != 2) {
    throw ProxyProtocolException(ProxyProtocolError::UnknownVersion, std::to_string(version));
  }
  const auto headerVersion = static_cast<uint8_t>(version);

  const auto transportName = g_vm["transport"].as<string>();
  const auto transport = transportProtocolFromString(transportName);
  if (!transport) {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, "'" + transportName + "'");
  }

  const auto command = g_vm["command"].as<string>();
  if (command == "local") {
    return ProxyHeader::makeLocal(headerVersion, *transport);
  }
  if (command != "proxy") {
    throw ProxyProtocolException(ProxyProtocolError::UnsupportedVersionAndCommand, "'" + command + "'");
  }

  if (*transport == ProxyTransportProtocol::Unspec) {
    return ProxyHeader::makeUnspec(headerVersion);
  }

  if (g_vm.count("source") == 0 || g_vm.count("destination") == 0) {
    throw runtime_error("Both 'source' and 'destination' are required for a PROXY header over " + transportName);
  }
  const auto source = g_vm["source"].as<string>();
  const auto destination = g_vm["destination"].as<string>();

  if (*transport == ProxyTransportProtocol::UnixStream || *transport == ProxyTransportProtocol::UnixDatagram) {
    if (headerVersion != 2) {
      throw ProxyProtocolException(ProxyProtocolError::UnsupportedAddressFamilyAndProtocol, "Unix sockets require a version 2 header");
    }
    return ProxyHeader::makeUnix(*transport, source, destination);
  }

  auto sourceAddress = parseIPLiteral(source);
  if (!sourceAddress) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidAddress, "'" + source + "'");
  }
  auto destinationAddress = parseIPLiteral(destination);
  if (!destinationAddress) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidAddress, "'" + destination + "'");
  }

  uint16_t sourcePort = 0;
  uint16_t destinationPort = 0;
  if (!proxyhdr::parsePortNumber(g_vm["source-port"].as<string>(), sourcePort)) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidPortNumber, "'" + g_vm["source-port"].as<string>() + "'");
  }
  if (!proxyhdr::parsePortNumber(g_vm["destination-port"].as<string>(), destinationPort)) {
    throw ProxyProtocolException(ProxyProtocolError::InvalidPortNumber, "'" + g_vm["destination-port"].as<string>() + "'");
  }

  return ProxyHeader::makeProxy(headerVersion, *transport, *sourceAddress, *destinationAddress, sourcePort, destinationPort);
}

static int encode()
{
  try {
    const auto header = buildHeader();
    g_log << Logger::Info << "Encoding " << header.toString() << endl;
    if (g_vm.count("hex") != 0) {
      cout << makeHexDump(header.toWire(), "") << endl;
    }
    else {
      FDProxyProtocolOutput output(STDOUT_FILENO);
      header.writeTo(output);
    }
  }
  catch (const ProxyProtocolException& e) {
    g_log << Logger::Error << "Unable to encode the proxy protocol header: " << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char** argv)
try
{
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help,h", "produce help message")
    ("version", "print the version")
    ("config", po::value<string>(), "read options from this configuration file")
    ("decode", po::value<vector<string>>()->multitoken(), "decode the proxy protocol header at the start of these files")
    ("encode", "write a proxy protocol header built from the options below to stdout")
    ("header-version", po::value<int>()->default_value(2), "proxy protocol version to encode, 1 or 2")
    ("command", po::value<string>()->default_value("proxy"), "command to encode, 'proxy' or 'local'")
    ("transport", po::value<string>()->default_value("TCP4"), "TCP4, UDP4, TCP6, UDP6, UNIX_STREAM, UNIX_DGRAM or UNSPEC")
    ("source", po::value<string>(), "source IP address or Unix socket path")
    ("destination", po::value<string>(), "destination IP address or Unix socket path")
    ("source-port", po::value<string>()->default_value("0"), "source port")
    ("destination-port", po::value<string>()->default_value("0"), "destination port")
    ("hex", "print headers as hexadecimal")
    ("loglevel", po::value<int>()->default_value(Logger::Warning), "log messages of this urgency and higher to the console and syslog")
    ("disable-syslog", "do not log to syslog");

  po::positional_options_description positional;
  positional.add("decode", -1);

  po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), g_vm);
  if (g_vm.count("config") != 0) {
    std::ifstream configFile(g_vm["config"].as<string>());
    if (!configFile) {
      throw runtime_error("Unable to open configuration file '" + g_vm["config"].as<string>() + "'");
    }
    po::store(po::parse_config_file(configFile, desc), g_vm);
  }
  po::notify(g_vm);

  if (g_vm.count("help") != 0) {
    usage(desc);
    return EXIT_SUCCESS;
  }

  if (g_vm.count("version") != 0) {
    cerr << "proxyhdr-tool " << PROXYHDR_VERSION << endl;
    return EXIT_SUCCESS;
  }

  g_log.setName("proxyhdr-tool");
  const auto loglevel = static_cast<Logger::Urgency>(g_vm["loglevel"].as<int>());
  g_log.toConsole(loglevel);
  g_log.setLoglevel(loglevel);
  g_log.disableSyslog(g_vm.count("disable-syslog") != 0);
  g_log << Logger::Debug << "proxyhdr-tool " << PROXYHDR_VERSION << " starting, header version " << g_vm["header-version"].as<int>() << ", transport " << g_vm["transport"].as<string>() << endl;

  if (g_vm.count("encode") != 0) {
    return encode();
  }

  if (g_vm.count("decode") != 0) {
    return decode(g_vm["decode"].as<vector<string>>());
  }

  usage(desc);
  return EXIT_FAILURE;
}
catch (const po::error& e)
{
  cerr << "Error parsing command line options: " << e.what() << endl;
  return EXIT_FAILURE;
}
catch (const std::exception& e)
{
  cerr << "Fatal: " << e.what() << endl;
  return EXIT_FAILURE;
}
catch (const ProxyHdrException& e)
{
  cerr << "Fatal: " << e.reason << endl;
  return EXIT_FAILURE;
}
