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

#ifndef ENERTRADE_DEDUP_HPP
#define ENERTRADE_DEDUP_HPP

#include "private/cache.hpp"
#include "private/eventlog.hpp"
#include "proto/protocol.pb.h"

#include <chrono>
#include <string>

namespace enertrade
{

/**
 * Detects duplicate inbound messages by their message ID.  A TTL cache is
 * consulted first; on a miss the durable event log decides, and a hit there
 * re-populates the cache.  Recording a message goes through the event log's
 * unique index, so that of two concurrent deliveries of the same message
 * exactly one wins.
 */
class Deduplicator
{

private:

  Cache& cache;
  EventLog& log;

  /** Lifetime of cache entries.  */
  const std::chrono::milliseconds ttl;

public:

  explicit Deduplicator (Cache& c, EventLog& l, std::chrono::milliseconds t);

  /**
   * Constructs an instance with the TTL taken from --dedup_ttl_ms.
   */
  explicit Deduplicator (Cache& c, EventLog& l);

  Deduplicator () = delete;
  Deduplicator (const Deduplicator&) = delete;
  void operator= (const Deduplicator&) = delete;

  /**
   * Returns the cache key for an inbound message ID.
   */
  static std::string CacheKey (const std::string& messageId);

  /**
   * Returns true if the message has been seen before.
   */
  bool IsDuplicate (const std::string& messageId);

  /**
   * Records a fresh inbound message in the event log.  Returns false
   * if it turned out to be a duplicate after all.
   */
  bool RecordInbound (proto::Event& ev);

};

} // namespace enertrade

#endif // ENERTRADE_DEDUP_HPP
