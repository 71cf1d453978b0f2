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

#include "private/cache.hpp"

#include <glog/logging.h>

namespace enertrade
{

namespace
{

/** Number of inserts after which expired entries are pruned.  */
constexpr unsigned PRUNE_INTERVAL = 1'000;

} // anonymous namespace

MemoryCache::Clock::time_point
MemoryCache::GetCurrentTime () const
{
  return Clock::now ();
}

void
MemoryCache::Prune (const Clock::time_point now)
{
  size_t removed = 0;
  for (auto it = entries.begin (); it != entries.end (); )
    if (it->second.expiry <= now)
      {
        it = entries.erase (it);
        ++removed;
      }
    else
      ++it;

  VLOG_IF (1, removed > 0) << "Pruned " << removed << " expired cache entries";
  insertsSincePrune = 0;
}

void
MemoryCache::Store (const std::string& key, const std::string& value,
                    const std::chrono::milliseconds ttl)
{
  const auto now = GetCurrentTime ();

  auto& entry = entries[key];
  entry.value = value;
  entry.expiry = now + ttl;

  if (++insertsSincePrune >= PRUNE_INTERVAL)
    Prune (now);
}

bool
MemoryCache::Get (const std::string& key, std::string& value)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = entries.find (key);
  if (mit == entries.end ())
    return false;

  if (mit->second.expiry <= GetCurrentTime ())
    {
      entries.erase (mit);
      return false;
    }

  value = mit->second.value;
  return true;
}

void
MemoryCache::Set (const std::string& key, const std::string& value,
                  const std::chrono::milliseconds ttl)
{
  std::lock_guard<std::mutex> lock(mut);
  Store (key, value, ttl);
}

bool
MemoryCache::SetIfAbsent (const std::string& key, const std::string& value,
                          const std::chrono::milliseconds ttl)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = entries.find (key);
  if (mit != entries.end () && mit->second.expiry > GetCurrentTime ())
    return false;

  Store (key, value, ttl);
  return true;
}

void
MemoryCache::Delete (const std::string& key)
{
  std::lock_guard<std::mutex> lock(mut);
  entries.erase (key);
}

size_t
MemoryCache::Size ()
{
  std::lock_guard<std::mutex> lock(mut);
  return entries.size ();
}

} // namespace enertrade
