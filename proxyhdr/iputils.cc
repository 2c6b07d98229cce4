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

#include "iputils.hh"

std::optional<ComboAddress> parseIPLiteral(const string& str)
{
  if (str.empty() || str.find('\0') != string::npos) {
    return std::nullopt;
  }

  ComboAddress address;
  address.reset();

  address.sin4.sin_family = AF_INET;
  if (inet_pton(AF_INET, str.c_str(), &address.sin4.sin_addr) == 1) {
    return address;
  }

  address.reset();
  address.sin6.sin6_family = AF_INET6;
  if (inet_pton(AF_INET6, str.c_str(), &address.sin6.sin6_addr) == 1) {
    return address;
  }

  return std::nullopt;
}
