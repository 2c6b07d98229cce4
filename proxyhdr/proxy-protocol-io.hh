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

#include <cstdint>
#include <stdexcept>
#include <string>

#include "namespaces.hh"

/* Raised by ProxyProtocolInput::read() when the stream ends before the
   requested number of bytes could be consumed. */
class ProxyProtocolEOF : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/* A peekable, buffered byte input. peek() never consumes, read() consumes
   exactly the requested number of bytes or throws ProxyProtocolEOF. */
class ProxyProtocolInput
{
public:
  virtual ~ProxyProtocolInput() = default;

  /* returns up to 'count' bytes without consuming them, fewer only when
     the stream ends before that */
  virtual string peek(size_t count) = 0;
  virtual void read(void* buffer, size_t count) = 0;
  /* consumes and discards 'count' bytes */
  virtual void skip(size_t count);
};

class ProxyProtocolOutput
{
public:
  virtual ~ProxyProtocolOutput() = default;

  /* returns the number of bytes written, throws on failure */
  virtual size_t write(const void* data, size_t count) = 0;
};

/* Input over a blocking file descriptor, typically a freshly accepted
   connection. Bytes read from the descriptor past the end of the PROXY
   header stay in the internal buffer and must be retrieved with
   getBufferedData() before reading from the descriptor directly. */
class FDProxyProtocolInput : public ProxyProtocolInput
{
public:
  explicit FDProxyProtocolInput(int descriptor, size_t readSize = 4096);

  string peek(size_t count) override;
  void read(void* buffer, size_t count) override;

  [[nodiscard]] string getBufferedData() const
  {
    return d_buffer.substr(d_pos);
  }

private:
  void fill(size_t count);

  string d_buffer;
  size_t d_pos{0};
  size_t d_readSize;
  int d_fd;
  bool d_eof{false};
};

class StringProxyProtocolInput : public ProxyProtocolInput
{
public:
  explicit StringProxyProtocolInput(string data) :
    d_data(std::move(data))
  {
  }

  string peek(size_t count) override;
  void read(void* buffer, size_t count) override;
  void skip(size_t count) override;

  [[nodiscard]] size_t getPosition() const
  {
    return d_pos;
  }
  [[nodiscard]] string getRemaining() const
  {
    return d_data.substr(d_pos);
  }

private:
  string d_data;
  size_t d_pos{0};
};

class FDProxyProtocolOutput : public ProxyProtocolOutput
{
public:
  explicit FDProxyProtocolOutput(int descriptor) :
    d_fd(descriptor)
  {
  }

  size_t write(const void* data, size_t count) override;

private:
  int d_fd;
};

class StringProxyProtocolOutput : public ProxyProtocolOutput
{
public:
  size_t write(const void* data, size_t count) override;

  [[nodiscard]] const string& getData() const
  {
    return d_data;
  }

private:
  string d_data;
};
