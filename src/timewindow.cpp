/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "timewindow.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace enertrade
{

bool
IsValidTimestamp (const int64_t t)
{
  return t >= MIN_TIMESTAMP && t <= MAX_TIMESTAMP;
}

bool
IsValidWindow (const proto::TimeWindow& w)
{
  return w.has_start () && w.has_end ()
            && IsValidTimestamp (w.start ()) && IsValidTimestamp (w.end ())
            && w.start () <= w.end ();
}

int64_t
OverlapDuration (const proto::TimeWindow& a, const proto::TimeWindow& b)
{
  const int64_t start = std::max (a.start (), b.start ());
  const int64_t end = std::min (a.end (), b.end ());

  return std::max<int64_t> (0, end - start);
}

bool
WindowsOverlap (const proto::TimeWindow& a, const proto::TimeWindow& b)
{
  return OverlapDuration (a, b) > 0;
}

double
TimeFit (const proto::TimeWindow& offer, const proto::TimeWindow& requested)
{
  const int64_t requestedDuration = requested.end () - requested.start ();
  if (requestedDuration <= 0)
    return 1.0;

  const double fit = static_cast<double> (OverlapDuration (offer, requested))
                        / requestedDuration;
  return std::max (0.0, std::min (1.0, fit));
}

bool
ParseIsoTime (const std::string& str, int64_t& out)
{
  std::istringstream in(str);

  std::tm tm = {};
  in >> std::get_time (&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail ())
    {
      VLOG (1) << "Invalid ISO timestamp: " << str;
      return false;
    }

  /* Skip fractional seconds, which we do not keep.  */
  if (in.peek () == '.')
    {
      in.get ();
      while (std::isdigit (in.peek ()))
        in.get ();
    }

  /* Without any zone designator, the time is taken as UTC.  */
  int64_t offset = 0;
  const int tz = in.get ();
  if (tz == '+' || tz == '-')
    {
      std::string rest;
      in >> rest;
      if (rest.size () != 5 || rest[2] != ':')
        return false;
      for (const size_t i : {0, 1, 3, 4})
        if (!std::isdigit (static_cast<unsigned char> (rest[i])))
          return false;

      const int hours = std::stoi (rest.substr (0, 2));
      const int minutes = std::stoi (rest.substr (3, 2));
      offset = (hours * 60 + minutes) * 60;
      if (tz == '-')
        offset = -offset;
    }
  else if (tz != 'Z' && tz != 'z' && tz != std::char_traits<char>::eof ())
    return false;

  in.peek ();
  if (!in.eof ())
    return false;

  const int64_t res = static_cast<int64_t> (timegm (&tm)) - offset;
  if (!IsValidTimestamp (res))
    {
      VLOG (1) << "Timestamp out of range: " << str;
      return false;
    }

  out = res;
  return true;
}

bool
FormatIsoTime (const int64_t t, std::string& out)
{
  if (!IsValidTimestamp (t))
    return false;

  const std::time_t tt = static_cast<std::time_t> (t);
  std::tm tm;
  if (gmtime_r (&tt, &tm) == nullptr)
    return false;

  std::ostringstream str;
  str << std::put_time (&tm, "%Y-%m-%dT%H:%M:%SZ");
  out = str.str ();
  return true;
}

} // namespace enertrade
