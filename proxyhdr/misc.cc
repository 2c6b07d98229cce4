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
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

#include "misc.hh"

auto proxyhdr::getMessageFromErrno(const int errnum) -> std::string
{
  const size_t errLen = 2048;
  std::string errMsgData{};
  errMsgData.resize(errLen);

  const char* errMsg = nullptr;
#ifdef STRERROR_R_CHAR_P
  errMsg = strerror_r(errnum, errMsgData.data(), errMsgData.length());
#else
  // This can fail, and when it does, it sets errno. We ignore that and
  // set our own error message instead.
  int res = strerror_r(errnum, errMsgData.data(), errMsgData.length());
  errMsg = errMsgData.c_str();
  if (res != 0) {
    errMsg = "Unknown (the exact error could not be retrieved)";
  }
#endif

  // We make a copy here because `strerror_r()` might return a static
  // immutable buffer for an error message.
  std::string message{errMsg};
  return message;
}

bool proxyhdr::parsePortNumber(const std::string& str, uint16_t& port)
{
  if (str.empty() || str.size() > 5) {
    return false;
  }

  uint32_t value = 0;
  for (const auto chr : str) {
    if (chr < '0' || chr > '9') {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(chr - '0');
  }

  if (value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }

  port = static_cast<uint16_t>(value);
  return true;
}

size_t writen2(int fileDesc, const void *buf, size_t count)
{
  const char *ptr = static_cast<const char*>(buf);
  const char *eptr = ptr + count;

  while (ptr != eptr) {
    auto res = ::write(fileDesc, ptr, eptr - ptr);
    if (res < 0) {
      if (errno == EAGAIN) {
        throw std::runtime_error("used writen2 on non-blocking socket, got EAGAIN");
      }
      if (errno == EINTR) {
        continue;
      }
      unixDie("failed in writen2");
    }
    else if (res == 0) {
      throw std::runtime_error("could not write all bytes, got eof in writen2");
    }

    ptr += res;
  }

  return count;
}

size_t readAtMost(int fileDesc, void* buffer, size_t len)
{
  for (;;) {
    auto res = read(fileDesc, buffer, len);
    if (res >= 0) {
      return static_cast<size_t>(res);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN) {
      throw std::runtime_error("used readAtMost on non-blocking socket, got EAGAIN");
    }
    unixDie("failed in readAtMost");
  }
}

string makeHexDump(const string& str, const string& sep)
{
  std::array<char, 5> tmp;
  string ret;
  ret.reserve(static_cast<size_t>(str.size() * (2 + sep.size())));

  for (char n : str) {
    snprintf(tmp.data(), tmp.size(), "%02x", static_cast<unsigned char>(n));
    ret += tmp.data();
    ret += sep;
  }
  return ret;
}
