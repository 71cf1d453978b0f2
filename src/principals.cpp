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

#include "principals.hpp"

#include "private/database.hpp"
#include "private/errors.hpp"

#include <glog/logging.h>

namespace enertrade
{

namespace
{

const char* const PRINCIPAL_QUERY = R"(
  SELECT `id`, `trust_score`, `declared_capacity`, `balance`, `provider_id`
    FROM `principals`
    WHERE `id` = ?1
)";

proto::Principal
ReadPrincipal (const Statement& stmt)
{
  proto::Principal res;
  res.set_id (stmt.Get<std::string> (0));
  res.set_trust_score (stmt.Get<double> (1));
  res.set_declared_capacity (stmt.Get<double> (2));
  res.set_balance (stmt.Get<double> (3));
  if (!stmt.IsNull (4))
    res.set_provider_id (stmt.Get<std::string> (4));
  return res;
}

} // anonymous namespace

bool
SqlitePrincipals::Register (const proto::Principal& principal,
                            const double verifiedCapacity,
                            proto::Principal& out, proto::Error& err)
{
  if (principal.id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION, "principal ID is missing");
      return false;
    }
  if (principal.declared_capacity () < 0 || principal.balance () < 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "capacity and balance must not be negative");
      return false;
    }

  const auto quality = DetermineQuality (principal.declared_capacity (),
                                         verifiedCapacity);
  const auto seeded = UpdateAfterVerificationQuality (
      trustConfig.defaultScore, quality, trustConfig);

  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        INSERT INTO `principals`
          (`id`, `trust_score`, `declared_capacity`, `balance`, `provider_id`)
          VALUES (?1, ?2, ?3, ?4, ?5)
          ON CONFLICT (`id`) DO UPDATE SET
            `declared_capacity` = excluded.`declared_capacity`,
            `balance` = excluded.`balance`,
            `provider_id` = excluded.`provider_id`
      )");
      stmt.Bind (1, principal.id ());
      stmt.Bind (2, seeded.newScore);
      stmt.Bind (3, principal.declared_capacity ());
      stmt.Bind (4, principal.balance ());
      if (principal.has_provider_id ())
        stmt.Bind (5, principal.provider_id ());
      else
        stmt.BindNull (5);
      stmt.Execute ();

      auto query = conn.Prepare (PRINCIPAL_QUERY);
      query.Bind (1, principal.id ());
      CHECK (query.Step ());
      out = ReadPrincipal (query);
    });

  LOG (INFO)
      << "Registered principal " << out.id () << " with trust "
      << out.trust_score ();
  return true;
}

bool
SqlitePrincipals::Lookup (const std::string& id, proto::Principal& out) const
{
  bool found = false;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (PRINCIPAL_QUERY);
      stmt.Bind (1, id);
      if (stmt.Step ())
        {
          out = ReadPrincipal (stmt);
          found = true;
        }
    });

  return found;
}

bool
SqlitePrincipals::AdjustTrust (const std::string& id,
                               const TrustAdjustment& fcn)
{
  double score;
  const bool found = db.Transaction ([&] (Connection& conn)
    {
      auto query = conn.Prepare (R"(
        SELECT `trust_score` FROM `principals` WHERE `id` = ?1
      )");
      query.Bind (1, id);
      if (!query.Step ())
        return false;

      score = ClampTrust (fcn (query.Get<double> (0)));

      auto stmt = conn.Prepare (R"(
        UPDATE `principals` SET `trust_score` = ?2 WHERE `id` = ?1
      )");
      stmt.Bind (1, id);
      stmt.Bind (2, score);
      stmt.Execute ();
      return true;
    });

  if (!found)
    {
      LOG (WARNING) << "Trust adjustment for unknown principal " << id;
      return false;
    }

  VLOG (1) << "Principal " << id << " now has trust " << score;
  return true;
}

bool
SqlitePrincipals::HasSufficientFunds (const std::string& id,
                                      const double amount) const
{
  proto::Principal p;
  if (!Lookup (id, p))
    return false;

  return p.balance () >= amount;
}

} // namespace enertrade
