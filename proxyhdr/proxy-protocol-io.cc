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
#include <cstring>

#include "proxy-protocol-io.hh"
#include "misc.hh"

void ProxyProtocolInput::skip(size_t count)
{
  std::array<char, 512> scratch{};
  while (count > 0) {
    const size_t chunk = std::min(count, scratch.size());
    read(scratch.data(), chunk);
    count -= chunk;
  }
}

FDProxyProtocolInput::FDProxyProtocolInput(int descriptor, size_t readSize) :
  d_readSize(readSize > 0 ? readSize : 1), d_fd(descriptor)
{
}

void FDProxyProtocolInput::fill(size_t count)
{
  if (d_pos > 0 && d_pos == d_buffer.size()) {
    d_buffer.clear();
    d_pos = 0;
  }

  while (!d_eof && (d_buffer.size() - d_pos) < count) {
    const size_t missing = count - (d_buffer.size() - d_pos);
    const size_t toRead = std::max(missing, d_readSize);
    const size_t previousSize = d_buffer.size();
    d_buffer.resize(previousSize + toRead);
    size_t got = 0;
    try {
      got = readAtMost(d_fd, &d_buffer.at(previousSize), toRead);
    }
    catch (...) {
      d_buffer.resize(previousSize);
      throw;
    }
    d_buffer.resize(previousSize + got);
    if (got == 0) {
      d_eof = true;
    }
  }
}

string FDProxyProtocolInput::peek(size_t count)
{
  fill(count);
  return d_buffer.substr(d_pos, count);
}

void FDProxyProtocolInput::read(void* buffer, size_t count)
{
  if (count == 0) {
    return;
  }
  fill(count);
  const size_t available = std::min(count, d_buffer.size() - d_pos);
  if (available > 0) {
    memcpy(buffer, &d_buffer.at(d_pos), available);
  }
  d_pos += available;
  if (available < count) {
    throw ProxyProtocolEOF("EOF after reading " + std::to_string(available) + " of " + std::to_string(count) + " bytes");
  }
}

string StringProxyProtocolInput::peek(size_t count)
{
  return d_data.substr(d_pos, count);
}

void StringProxyProtocolInput::read(void* buffer, size_t count)
{
  const size_t available = std::min(count, d_data.size() - d_pos);
  if (available > 0) {
    memcpy(buffer, &d_data.at(d_pos), available);
  }
  d_pos += available;
  if (available < count) {
    throw ProxyProtocolEOF("EOF after reading " + std::to_string(available) + " of " + std::to_string(count) + " bytes");
  }
}

void StringProxyProtocolInput::skip(size_t count)
{
  const size_t available = std::min(count, d_data.size() - d_pos);
  d_pos += available;
  if (available < count) {
    throw ProxyProtocolEOF("EOF after skipping " + std::to_string(available) + " of " + std::to_string(count) + " bytes");
  }
}

size_t FDProxyProtocolOutput::write(const void* data, size_t count)
{
  return writen2(d_fd, data, count);
}

size_t StringProxyProtocolOutput::write(const void* data, size_t count)
{
  d_data.append(static_cast<const char*>(data), count);
  return count;
}
