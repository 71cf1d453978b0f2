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

#ifndef ENERTRADE_TIMEWINDOW_HPP
#define ENERTRADE_TIMEWINDOW_HPP

#include "proto/catalog.pb.h"

#include <cstdint>
#include <string>

namespace enertrade
{

/** Earliest timestamp we accept (the UNIX epoch).  */
constexpr int64_t MIN_TIMESTAMP = 0;
/** Latest timestamp we accept (9999-12-31T23:59:59Z).  */
constexpr int64_t MAX_TIMESTAMP = 253'402'300'799;

/**
 * Returns true if the given UNIX timestamp is in the range that we can
 * represent as ISO 8601 string.
 */
bool IsValidTimestamp (int64_t t);

/**
 * Returns true if the window has both ends set within the valid timestamp
 * range, and is not inverted.
 */
bool IsValidWindow (const proto::TimeWindow& w);

/**
 * Returns true if the two windows share a non-empty interval.
 */
bool WindowsOverlap (const proto::TimeWindow& a, const proto::TimeWindow& b);

/**
 * Returns the length of the overlap of two windows in seconds.
 */
int64_t OverlapDuration (const proto::TimeWindow& a,
                         const proto::TimeWindow& b);

/**
 * Computes how well an offer window covers a requested window, as the
 * overlap divided by the requested duration and clipped to [0, 1].
 * An empty requested window is fully covered.
 */
double TimeFit (const proto::TimeWindow& offer,
                const proto::TimeWindow& requested);

/**
 * Parses an ISO 8601 timestamp like "2024-10-04T10:00:00Z" or with
 * fractional seconds.  Returns false if the string is invalid or the
 * time is out of range.
 */
bool ParseIsoTime (const std::string& str, int64_t& out);

/**
 * Formats a UNIX timestamp as ISO 8601 in UTC.  Returns false if the
 * timestamp is out of range.
 */
bool FormatIsoTime (int64_t t, std::string& out);

} // namespace enertrade

#endif // ENERTRADE_TIMEWINDOW_HPP
