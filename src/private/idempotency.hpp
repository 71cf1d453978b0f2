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

#ifndef ENERTRADE_IDEMPOTENCY_HPP
#define ENERTRADE_IDEMPOTENCY_HPP

#include "private/cache.hpp"

#include <chrono>
#include <string>

namespace enertrade
{

/**
 * Client-supplied idempotency keys for state-changing RPC methods.  The first
 * request with a key takes a lock, and its response is stored when it
 * completes.  Retries with the same key get the stored response replayed,
 * while a retry that arrives while the first request is still running
 * is rejected.
 *
 * Keys are scoped by endpoint (the RPC method name).  Empty keys disable
 * the mechanism for a request.
 */
class IdempotencyGuard
{

private:

  Cache& cache;

  /** How long a lock is held at most (if a request never completes).  */
  const std::chrono::milliseconds lockTtl;

  /** How long responses are kept for replay.  */
  const std::chrono::milliseconds responseTtl;

  static std::string LockKey (const std::string& endpoint,
                              const std::string& key);
  static std::string ResponseKey (const std::string& endpoint,
                                  const std::string& key);

public:

  /** Result of starting a request.  */
  enum class Outcome
  {
    /** The request should be processed.  */
    FRESH,
    /** A stored response is available and should be returned.  */
    REPLAY,
    /** Another request with the same key is being processed.  */
    IN_FLIGHT,
  };

  explicit IdempotencyGuard (Cache& c, std::chrono::milliseconds lock,
                             std::chrono::milliseconds response);

  /**
   * Constructs the guard with TTLs from --idempotency_lock_ttl_s and
   * --idempotency_response_ttl_s.
   */
  explicit IdempotencyGuard (Cache& c);

  IdempotencyGuard () = delete;
  IdempotencyGuard (const IdempotencyGuard&) = delete;
  void operator= (const IdempotencyGuard&) = delete;

  /**
   * Starts processing of a request.  On REPLAY, the stored response
   * is returned in the output argument.
   */
  Outcome Begin (const std::string& endpoint, const std::string& key,
                 std::string& response);

  /**
   * Stores the response of a FRESH request and releases its lock.
   */
  void Complete (const std::string& endpoint, const std::string& key,
                 const std::string& response);

  /**
   * Releases the lock of a FRESH request without storing a response,
   * so that it can be retried.
   */
  void Abort (const std::string& endpoint, const std::string& key);

};

} // namespace enertrade

#endif // ENERTRADE_IDEMPOTENCY_HPP
