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

#ifndef ENERTRADE_CACHE_HPP
#define ENERTRADE_CACHE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace enertrade
{

/**
 * Interface for a key/value cache with per-entry expiry.  It is used for
 * fast duplicate detection and for idempotency locks and responses.  All
 * operations must be safe to call from multiple threads.
 */
class Cache
{

public:

  Cache () = default;
  virtual ~Cache () = default;

  Cache (const Cache&) = delete;
  void operator= (const Cache&) = delete;

  /**
   * Looks up a key.  Returns false if it is not present or has expired.
   */
  virtual bool Get (const std::string& key, std::string& value) = 0;

  /**
   * Sets a key (overwriting any existing value) with the given lifetime.
   */
  virtual void Set (const std::string& key, const std::string& value,
                    std::chrono::milliseconds ttl) = 0;

  /**
   * Sets a key only if it is not present (or expired).  Returns true if
   * the value was stored.  This is atomic with respect to other calls.
   */
  virtual bool SetIfAbsent (const std::string& key, const std::string& value,
                            std::chrono::milliseconds ttl) = 0;

  virtual void Delete (const std::string& key) = 0;

};

/**
 * In-process Cache implementation.  Expired entries are dropped lazily
 * when accessed and pruned from time to time on inserts.
 */
class MemoryCache : public Cache
{

protected:

  using Clock = std::chrono::steady_clock;

private:

  struct Entry
  {
    std::string value;
    Clock::time_point expiry;
  };

  /** The stored entries.  */
  std::map<std::string, Entry> entries;

  /** Number of inserts since the last pruning.  */
  unsigned insertsSincePrune = 0;

  /** Lock for the map.  */
  std::mutex mut;

  /**
   * Removes all expired entries.  Must be called with the lock held.
   */
  void Prune (Clock::time_point now);

  /**
   * Inserts or updates an entry and prunes if enough inserts happened.
   * Must be called with the lock held.
   */
  void Store (const std::string& key, const std::string& value,
              std::chrono::milliseconds ttl);

protected:

  /**
   * Returns the current time.  Tests can override it to simulate expiry.
   */
  virtual Clock::time_point GetCurrentTime () const;

public:

  MemoryCache () = default;

  bool Get (const std::string& key, std::string& value) override;
  void Set (const std::string& key, const std::string& value,
            std::chrono::milliseconds ttl) override;
  bool SetIfAbsent (const std::string& key, const std::string& value,
                    std::chrono::milliseconds ttl) override;
  void Delete (const std::string& key) override;

  /**
   * Returns the number of entries currently stored (including ones that
   * have expired but were not yet dropped).
   */
  size_t Size ();

};

} // namespace enertrade

#endif // ENERTRADE_CACHE_HPP
