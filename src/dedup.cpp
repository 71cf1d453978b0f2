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

#include "private/dedup.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_int64 (dedup_ttl_ms, 24 * 60 * 60 * 1'000,
              "lifetime of cached inbound message IDs");

namespace enertrade
{

Deduplicator::Deduplicator (Cache& c, EventLog& l,
                            const std::chrono::milliseconds t)
  : cache(c), log(l), ttl(t)
{}

Deduplicator::Deduplicator (Cache& c, EventLog& l)
  : Deduplicator(c, l, std::chrono::milliseconds (FLAGS_dedup_ttl_ms))
{}

std::string
Deduplicator::CacheKey (const std::string& messageId)
{
  return "dedup:" + messageId + ":INBOUND";
}

bool
Deduplicator::IsDuplicate (const std::string& messageId)
{
  const auto key = CacheKey (messageId);

  std::string value;
  if (cache.Get (key, value))
    {
      VLOG (1) << "Message " << messageId << " found in cache";
      return true;
    }

  if (log.HasInbound (messageId))
    {
      VLOG (1) << "Message " << messageId << " found in event log";
      cache.Set (key, "1", ttl);
      return true;
    }

  return false;
}

bool
Deduplicator::RecordInbound (proto::Event& ev)
{
  CHECK_EQ (ev.direction (), proto::Event::INBOUND);

  const bool fresh = log.Append (ev);
  cache.Set (CacheKey (ev.message_id ()), "1", ttl);

  LOG_IF (INFO, !fresh)
      << "Lost race for inbound message " << ev.message_id ();
  return fresh;
}

} // namespace enertrade
