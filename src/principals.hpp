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

#ifndef ENERTRADE_PRINCIPALS_HPP
#define ENERTRADE_PRINCIPALS_HPP

#include "proto/error.pb.h"
#include "proto/orders.pb.h"
#include "trust.hpp"

#include <functional>
#include <string>

namespace enertrade
{

class Database;

/**
 * Interface for looking up the authenticated parties of trades.  Identity
 * and wallet management live outside of the engine, which only needs to
 * read trust and capacity, check funds and write back trust changes.
 */
class PrincipalDirectory
{

public:

  /**
   * Function computing a new trust score from the current one.
   */
  using TrustAdjustment = std::function<double (double)>;

  PrincipalDirectory () = default;
  virtual ~PrincipalDirectory () = default;

  PrincipalDirectory (const PrincipalDirectory&) = delete;
  void operator= (const PrincipalDirectory&) = delete;

  /**
   * Looks up a principal by ID.  Returns false if it is unknown.
   */
  virtual bool Lookup (const std::string& id, proto::Principal& out) const = 0;

  /**
   * Atomically replaces the trust score of a principal by the result of
   * applying the given function to its current score.  Concurrent
   * adjustments of the same principal must all take effect.  Returns
   * false if the principal is unknown.
   */
  virtual bool AdjustTrust (const std::string& id,
                            const TrustAdjustment& fcn) = 0;

  /**
   * Returns true if the principal can pay the given amount.
   */
  virtual bool HasSufficientFunds (const std::string& id,
                                   double amount) const = 0;

};

/**
 * PrincipalDirectory backed by the engine's own database.  Principals are
 * registered explicitly, with their initial trust derived from how well a
 * verification confirmed their declared capacity.
 */
class SqlitePrincipals : public PrincipalDirectory
{

private:

  Database& db;

  const TrustConfig trustConfig;

public:

  explicit SqlitePrincipals (Database& d, const TrustConfig& cfg)
    : db(d), trustConfig(cfg)
  {}

  /**
   * Registers (or re-registers) a principal.  Its trust score is seeded
   * from the default score and the quality of the capacity verification.
   * An existing principal keeps its trust score.
   */
  bool Register (const proto::Principal& principal, double verifiedCapacity,
                 proto::Principal& out, proto::Error& err);

  bool Lookup (const std::string& id, proto::Principal& out) const override;
  bool AdjustTrust (const std::string& id,
                    const TrustAdjustment& fcn) override;
  bool HasSufficientFunds (const std::string& id,
                           double amount) const override;

};

} // namespace enertrade

#endif // ENERTRADE_PRINCIPALS_HPP
