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

#include "private/idempotency.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_int32 (idempotency_lock_ttl_s, 30,
              "maximum time an idempotency key stays locked");
DEFINE_int32 (idempotency_response_ttl_s, 24 * 60 * 60,
              "time for which responses are replayed for an idempotency key");

namespace enertrade
{

IdempotencyGuard::IdempotencyGuard (Cache& c,
                                    const std::chrono::milliseconds lock,
                                    const std::chrono::milliseconds response)
  : cache(c), lockTtl(lock), responseTtl(response)
{}

IdempotencyGuard::IdempotencyGuard (Cache& c)
  : IdempotencyGuard(c,
                     std::chrono::seconds (FLAGS_idempotency_lock_ttl_s),
                     std::chrono::seconds (FLAGS_idempotency_response_ttl_s))
{}

std::string
IdempotencyGuard::LockKey (const std::string& endpoint,
                           const std::string& key)
{
  return "idem:lock:" + endpoint + ":" + key;
}

std::string
IdempotencyGuard::ResponseKey (const std::string& endpoint,
                               const std::string& key)
{
  return "idem:" + endpoint + ":" + key;
}

IdempotencyGuard::Outcome
IdempotencyGuard::Begin (const std::string& endpoint, const std::string& key,
                         std::string& response)
{
  if (key.empty ())
    return Outcome::FRESH;

  if (cache.Get (ResponseKey (endpoint, key), response))
    {
      VLOG (1) << "Replaying response for " << endpoint << " key " << key;
      return Outcome::REPLAY;
    }

  if (!cache.SetIfAbsent (LockKey (endpoint, key), "1", lockTtl))
    {
      LOG (WARNING)
          << "Request for " << endpoint << " with key " << key
          << " is already in flight";
      return Outcome::IN_FLIGHT;
    }

  /* The previous holder of the lock may have completed in between.  */
  if (cache.Get (ResponseKey (endpoint, key), response))
    {
      cache.Delete (LockKey (endpoint, key));
      return Outcome::REPLAY;
    }

  return Outcome::FRESH;
}

void
IdempotencyGuard::Complete (const std::string& endpoint,
                            const std::string& key,
                            const std::string& response)
{
  if (key.empty ())
    return;

  cache.Set (ResponseKey (endpoint, key), response, responseTtl);
  cache.Delete (LockKey (endpoint, key));
}

void
IdempotencyGuard::Abort (const std::string& endpoint, const std::string& key)
{
  if (key.empty ())
    return;

  cache.Delete (LockKey (endpoint, key));
}

} // namespace enertrade
