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

#include <string>
#include <iostream>
#include <sstream>
#include <syslog.h>
#include <time.h>
#include <stdio.h>

#include "namespaces.hh"

//! The Logger class can be used to log messages in various ways.
class Logger
{
public:
  Logger(string, int facility=LOG_DAEMON); //!< pass the identification you wish to appear in the log

  //! The urgency of a log message
  enum Urgency {All=32767,Alert=LOG_ALERT, Critical=LOG_CRIT, Error=LOG_ERR, Warning=LOG_WARNING,
                Notice=LOG_NOTICE,Info=LOG_INFO, Debug=LOG_DEBUG, None=-1};

  /** Log a message.
      \param msg Message you wish to log
      \param u Urgency of the message you wish to log
  */
  void log(const string &msg, Urgency u=Notice) noexcept;

  void setName(const string &);

  //! set lower limit of urgency needed for console display. Messages of this urgency, and higher, will be displayed
  void toConsole(Urgency u);
  void setLoglevel(Urgency u);

  void disableSyslog(bool d) {
    d_disableSyslog = d;
  }

  /** Use this to stream to your log, like this:
      \code
      g_log<<"This is an informational message"<<endl; // logged at default loglevel (Info)
      g_log<<Logger::Warning<<"Header changed for "<<remote<<endl; // Logged as a warning
      \endcode
  */
  Logger& operator<<(const char *s);
  Logger& operator<<(const string &s);   //!< log a string
  Logger& operator<<(Urgency u); //!< set the urgency, << style

  template<typename T> Logger & operator<<(const T & i) {
    ostringstream tmp;
    tmp << i;
    *this << tmp.str();
    return *this;
  }

  Logger& operator<<(std::ostream & (&)(std::ostream &)); //!< this is to recognise the endl, and to commit the log

private:
  struct PerThread
  {
    PerThread() : d_urgency(Info)
    {}
    string d_output;
    Urgency d_urgency;
  };
  PerThread& getPerThread();
  void open();

  static thread_local PerThread t_perThread;
  string name;
  int flags;
  int d_facility;
  Urgency d_loglevel{Logger::None};
  Urgency consoleUrgency{Error};
  bool opened{false};
  bool d_disableSyslog{false};
};

Logger& getLogger();

#define g_log getLogger()
