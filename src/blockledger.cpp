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

#include "private/blockledger.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <ctime>
#include <sstream>

DEFINE_int32 (claim_max_retries, 3,
              "how often a block claim that hit a concurrent modification"
              " is retried before failing");

namespace enertrade
{

namespace
{

/** Columns selected for block rows, as parsed by ReadBlock.  */
constexpr const char* BLOCK_COLUMNS = R"(
  `id`, `offer_id`, `item_id`, `provider_id`, `status`,
  `order_id`, `transaction_id`, `version`,
  `price`, `currency`, `window_start`, `window_end`,
  `created_at`, `reserved_at`, `sold_at`
)";

proto::OfferBlock::Status
ParseStatus (const std::string& str)
{
  proto::OfferBlock::Status res;
  CHECK (proto::OfferBlock::Status_Parse (str, &res))
      << "Invalid block status in database: " << str;
  return res;
}

proto::OfferBlock
ReadBlock (const Statement& stmt)
{
  proto::OfferBlock res;
  res.set_id (stmt.Get<std::string> (0));
  res.set_offer_id (stmt.Get<std::string> (1));
  res.set_item_id (stmt.Get<std::string> (2));
  res.set_provider_id (stmt.Get<std::string> (3));
  res.set_status (ParseStatus (stmt.Get<std::string> (4)));
  if (!stmt.IsNull (5))
    res.set_order_id (stmt.Get<std::string> (5));
  if (!stmt.IsNull (6))
    res.set_transaction_id (stmt.Get<std::string> (6));
  res.set_version (stmt.Get<int64_t> (7));
  res.mutable_price ()->set_value (stmt.Get<double> (8));
  res.mutable_price ()->set_currency (stmt.Get<std::string> (9));
  res.mutable_window ()->set_start (stmt.Get<int64_t> (10));
  res.mutable_window ()->set_end (stmt.Get<int64_t> (11));
  res.set_created_at (stmt.Get<int64_t> (12));
  if (!stmt.IsNull (13))
    res.set_reserved_at (stmt.Get<int64_t> (13));
  if (!stmt.IsNull (14))
    res.set_sold_at (stmt.Get<int64_t> (14));
  return res;
}

/**
 * Returns the ID of the n-th block of an offer.
 */
std::string
BlockId (const std::string& offerId, const int64_t n)
{
  std::ostringstream out;
  out << offerId << ":" << n;
  return out.str ();
}

} // anonymous namespace

BlockLedger::BlockLedger (Database& d, const unsigned retries)
  : db(d), maxRetries(retries)
{}

int64_t
BlockLedger::GetCurrentTime () const
{
  return std::time (nullptr);
}

bool
BlockLedger::IsValidTransition (const proto::OfferBlock::Status from,
                                const proto::OfferBlock::Status to)
{
  switch (from)
    {
    case proto::OfferBlock::AVAILABLE:
      return to == proto::OfferBlock::RESERVED;
    case proto::OfferBlock::RESERVED:
      return to == proto::OfferBlock::SOLD
                || to == proto::OfferBlock::AVAILABLE;
    case proto::OfferBlock::SOLD:
      return false;
    default:
      LOG (FATAL) << "Invalid block status: " << static_cast<int> (from);
    }
}

int64_t
BlockLedger::Materialize (Connection& conn, const proto::Offer& offer)
{
  auto stmt = conn.Prepare (R"(
    INSERT INTO `offer_blocks`
      (`id`, `offer_id`, `item_id`, `provider_id`, `status`,
       `price`, `currency`, `window_start`, `window_end`, `created_at`)
      VALUES (?1, ?2, ?3, ?4, 'AVAILABLE', ?5, ?6, ?7, ?8, ?9)
  )");

  const int64_t now = GetCurrentTime ();
  for (int64_t i = 0; i < offer.max_qty (); ++i)
    {
      stmt.Reset ();
      stmt.Bind (1, BlockId (offer.id (), i));
      stmt.Bind (2, offer.id ());
      stmt.Bind (3, offer.item_id ());
      stmt.Bind (4, offer.provider_id ());
      stmt.Bind (5, offer.price ().value ());
      stmt.Bind (6, offer.price ().currency ());
      stmt.Bind (7, offer.window ().start ());
      stmt.Bind (8, offer.window ().end ());
      stmt.Bind (9, now);
      stmt.Execute ();
    }

  LOG (INFO)
      << "Created " << offer.max_qty () << " blocks for offer " << offer.id ();
  return offer.max_qty ();
}

void
BlockLedger::ResnapshotAvailable (Connection& conn, const proto::Offer& offer)
{
  auto stmt = conn.Prepare (R"(
    UPDATE `offer_blocks`
      SET `price` = ?2, `currency` = ?3,
          `window_start` = ?4, `window_end` = ?5
      WHERE `offer_id` = ?1 AND `status` = 'AVAILABLE'
  )");
  stmt.Bind (1, offer.id ());
  stmt.Bind (2, offer.price ().value ());
  stmt.Bind (3, offer.price ().currency ());
  stmt.Bind (4, offer.window ().start ());
  stmt.Bind (5, offer.window ().end ());
  stmt.Execute ();

  VLOG (1)
      << "Updated snapshot of " << conn.Changes ()
      << " available blocks of offer " << offer.id ();
}

bool
BlockLedger::TryReserve (const std::vector<ObservedBlock>& observed,
                         const std::string& orderId,
                         const std::string& transactionId)
{
  const int64_t now = GetCurrentTime ();

  try
    {
      return db.Transaction ([&] (Connection& conn)
        {
          auto stmt = conn.Prepare (R"(
            UPDATE `offer_blocks`
              SET `status` = 'RESERVED',
                  `order_id` = ?3, `transaction_id` = ?4,
                  `reserved_at` = ?5
              WHERE `id` = ?1 AND `version` = ?2
                  AND `status` = 'AVAILABLE'
          )");

          for (const auto& b : observed)
            {
              stmt.Reset ();
              stmt.Bind (1, b.id);
              stmt.Bind (2, b.version);
              stmt.Bind (3, orderId);
              stmt.Bind (4, transactionId);
              stmt.Bind (5, now);
              stmt.Execute ();

              if (conn.Changes () != 1)
                {
                  VLOG (1) << "Block " << b.id << " changed concurrently";
                  return false;
                }
            }

          return true;
        });
    }
  catch (const DatabaseError& exc)
    {
      if (!exc.IsConstraint ())
        throw;

      LOG (WARNING) << "Constraint violation while claiming: " << exc.what ();
      return false;
    }
}

bool
BlockLedger::Claim (const std::string& offerId, const int64_t quantity,
                    const std::string& orderId,
                    const std::string& transactionId,
                    std::vector<std::string>& claimed, proto::Error& err)
{
  claimed.clear ();

  if (quantity <= 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "claim quantity must be positive");
      return false;
    }

  for (unsigned attempt = 0; attempt <= maxRetries; ++attempt)
    {
      std::vector<ObservedBlock> observed;
      db.Access ([&] (Connection& conn)
        {
          auto stmt = conn.Prepare (R"(
            SELECT `id`, `version`
              FROM `offer_blocks`
              WHERE `offer_id` = ?1 AND `status` = 'AVAILABLE'
              ORDER BY `seq`
              LIMIT ?2
          )");
          stmt.Bind (1, offerId);
          stmt.Bind (2, quantity);

          while (stmt.Step ())
            {
              ObservedBlock b;
              b.id = stmt.Get<std::string> (0);
              b.version = stmt.Get<int64_t> (1);
              observed.push_back (std::move (b));
            }
        });

      if (static_cast<int64_t> (observed.size ()) < quantity)
        {
          std::ostringstream msg;
          msg << "requested " << quantity << " blocks of offer " << offerId
              << ", but only " << observed.size () << " are available";
          SetError (err, proto::Error::INSUFFICIENT_AVAILABLE, msg.str ());
          return false;
        }

      AfterClaimRead (offerId, observed);

      if (TryReserve (observed, orderId, transactionId))
        {
          for (const auto& b : observed)
            claimed.push_back (b.id);

          LOG (INFO)
              << "Reserved " << quantity << " blocks of offer " << offerId
              << " for order " << orderId;
          return true;
        }

      LOG (INFO)
          << "Claim for offer " << offerId << " conflicted (attempt "
          << (attempt + 1) << "), retrying";
    }

  std::ostringstream msg;
  msg << "could not reserve " << quantity << " blocks of offer " << offerId
      << " due to concurrent claims";
  SetError (err, proto::Error::INSUFFICIENT_AVAILABLE, msg.str ());
  return false;
}

bool
BlockLedger::Transition (Connection& conn, const std::vector<std::string>& ids,
                         const proto::OfferBlock::Status from,
                         const proto::OfferBlock::Status to,
                         proto::Error& err)
{
  CHECK (IsValidTransition (from, to));
  const std::string fromName = proto::OfferBlock::Status_Name (from);
  const std::string toName = proto::OfferBlock::Status_Name (to);

  auto lookup = conn.Prepare (R"(
    SELECT `status` FROM `offer_blocks` WHERE `id` = ?1
  )");

  std::string sql;
  switch (to)
    {
    case proto::OfferBlock::SOLD:
      sql = R"(
        UPDATE `offer_blocks`
          SET `status` = 'SOLD', `sold_at` = ?2
          WHERE `id` = ?1
      )";
      break;
    case proto::OfferBlock::AVAILABLE:
      sql = R"(
        UPDATE `offer_blocks`
          SET `status` = 'AVAILABLE', `order_id` = NULL,
              `transaction_id` = NULL, `reserved_at` = NULL,
              `sold_at` = NULL
          WHERE `id` = ?1
      )";
      break;
    default:
      LOG (FATAL) << "Unsupported block transition to " << toName;
    }
  auto update = conn.Prepare (sql);

  const int64_t now = GetCurrentTime ();
  for (const auto& id : ids)
    {
      lookup.Reset ();
      lookup.Bind (1, id);
      if (!lookup.Step ())
        {
          SetError (err, proto::Error::NOT_FOUND, "unknown block " + id);
          return false;
        }
      const std::string current = lookup.Get<std::string> (0);
      if (current != fromName)
        {
          SetTransitionError (err, current, toName);
          err.set_message ("block " + id + ": " + err.message ());
          return false;
        }

      update.Reset ();
      update.Bind (1, id);
      if (to == proto::OfferBlock::SOLD)
        update.Bind (2, now);
      update.Execute ();
    }

  return true;
}

bool
BlockLedger::Finalize (Connection& conn, const std::vector<std::string>& ids,
                       proto::Error& err)
{
  if (!Transition (conn, ids, proto::OfferBlock::RESERVED,
                   proto::OfferBlock::SOLD, err))
    return false;

  VLOG (1) << "Marked " << ids.size () << " blocks as sold";
  return true;
}

bool
BlockLedger::Finalize (const std::vector<std::string>& ids, proto::Error& err)
{
  return db.Transaction ([&] (Connection& conn)
    {
      return Finalize (conn, ids, err);
    });
}

bool
BlockLedger::Release (Connection& conn, const std::vector<std::string>& ids,
                      proto::Error& err)
{
  if (!Transition (conn, ids, proto::OfferBlock::RESERVED,
                   proto::OfferBlock::AVAILABLE, err))
    return false;

  VLOG (1) << "Released " << ids.size () << " blocks";
  return true;
}

bool
BlockLedger::Release (const std::vector<std::string>& ids, proto::Error& err)
{
  return db.Transaction ([&] (Connection& conn)
    {
      return Release (conn, ids, err);
    });
}

bool
BlockLedger::UpdateStatus (const proto::BlockUpdate& update, proto::Error& err)
{
  if (!update.has_status () || update.offer_id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "block update needs offer and status");
      return false;
    }

  const auto target = update.status ();
  if (target != proto::OfferBlock::AVAILABLE && update.order_id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "held blocks need an order ID");
      return false;
    }

  const bool ok = db.Transaction ([&] (Connection& conn)
    {
      auto lookup = conn.Prepare (R"(
        SELECT `offer_id`, `status`, `order_id`
          FROM `offer_blocks`
          WHERE `id` = ?1
      )");

      auto stmt = conn.Prepare (R"(
        UPDATE `offer_blocks`
          SET `status` = ?2,
              `order_id` = ?3, `transaction_id` = ?4,
              `reserved_at` = CASE ?2
                  WHEN 'AVAILABLE' THEN NULL
                  WHEN 'RESERVED' THEN ?5
                  ELSE `reserved_at` END,
              `sold_at` = CASE ?2 WHEN 'SOLD' THEN ?5 ELSE NULL END
          WHERE `id` = ?1
      )");

      const std::string targetName = proto::OfferBlock::Status_Name (target);
      const int64_t now = GetCurrentTime ();

      for (const auto& id : update.block_ids ())
        {
          lookup.Reset ();
          lookup.Bind (1, id);
          if (!lookup.Step ())
            {
              SetError (err, proto::Error::NOT_FOUND, "unknown block " + id);
              return false;
            }
          if (lookup.Get<std::string> (0) != update.offer_id ())
            {
              SetError (err, proto::Error::VALIDATION,
                        "block " + id + " does not belong to offer "
                          + update.offer_id ());
              return false;
            }

          const auto current = ParseStatus (lookup.Get<std::string> (1));
          if (current == target)
            {
              const bool sameOrder
                  = target == proto::OfferBlock::AVAILABLE
                      || lookup.Get<std::string> (2) == update.order_id ();
              if (sameOrder)
                continue;
            }
          if (current == proto::OfferBlock::RESERVED
                && target == proto::OfferBlock::SOLD
                && lookup.Get<std::string> (2) != update.order_id ())
            {
              SetError (err, proto::Error::VALIDATION,
                        "block " + id + " is reserved for another order");
              return false;
            }
          if (!IsValidTransition (current, target))
            {
              SetTransitionError (err,
                                  proto::OfferBlock::Status_Name (current),
                                  targetName);
              err.set_message ("block " + id + ": " + err.message ());
              return false;
            }

          stmt.Reset ();
          stmt.Bind (1, id);
          stmt.Bind (2, targetName);
          if (target == proto::OfferBlock::AVAILABLE)
            {
              stmt.BindNull (3);
              stmt.BindNull (4);
            }
          else
            {
              stmt.Bind (3, update.order_id ());
              if (update.transaction_id ().empty ())
                stmt.BindNull (4);
              else
                stmt.Bind (4, update.transaction_id ());
            }
          stmt.Bind (5, now);
          stmt.Execute ();
        }

      return true;
    });

  if (ok)
    LOG (INFO)
        << "Updated " << update.block_ids_size () << " blocks of offer "
        << update.offer_id () << " to "
        << proto::OfferBlock::Status_Name (target);

  return ok;
}

proto::BlockCounts
BlockLedger::CountByStatus (Connection& conn, const std::string& offerId)
{
  auto stmt = conn.Prepare (R"(
    SELECT `status`, COUNT(*)
      FROM `offer_blocks`
      WHERE `offer_id` = ?1
      GROUP BY `status`
  )");
  stmt.Bind (1, offerId);

  proto::BlockCounts res;
  res.set_available (0);
  res.set_reserved (0);
  res.set_sold (0);
  while (stmt.Step ())
    {
      const int64_t cnt = stmt.Get<int64_t> (1);
      switch (ParseStatus (stmt.Get<std::string> (0)))
        {
        case proto::OfferBlock::AVAILABLE:
          res.set_available (cnt);
          break;
        case proto::OfferBlock::RESERVED:
          res.set_reserved (cnt);
          break;
        case proto::OfferBlock::SOLD:
          res.set_sold (cnt);
          break;
        default:
          LOG (FATAL) << "Unexpected block status";
        }
    }

  return res;
}

proto::BlockCounts
BlockLedger::CountByStatus (const std::string& offerId)
{
  proto::BlockCounts res;
  db.Access ([&] (Connection& conn)
    {
      res = CountByStatus (conn, offerId);
    });
  return res;
}

std::vector<proto::OfferBlock>
BlockLedger::GetBlocksForOrder (Connection& conn, const std::string& orderId)
{
  auto stmt = conn.Prepare (std::string ("SELECT ") + BLOCK_COLUMNS + R"(
    FROM `offer_blocks`
    WHERE `order_id` = ?1
    ORDER BY `seq`
  )");
  stmt.Bind (1, orderId);

  std::vector<proto::OfferBlock> res;
  while (stmt.Step ())
    res.push_back (ReadBlock (stmt));

  return res;
}

std::vector<proto::OfferBlock>
BlockLedger::GetBlocksForOrder (const std::string& orderId)
{
  std::vector<proto::OfferBlock> res;
  db.Access ([&] (Connection& conn)
    {
      res = GetBlocksForOrder (conn, orderId);
    });
  return res;
}

std::vector<proto::OfferBlock>
BlockLedger::GetBlocks (const std::string& offerId)
{
  std::vector<proto::OfferBlock> res;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (std::string ("SELECT ") + BLOCK_COLUMNS + R"(
        FROM `offer_blocks`
        WHERE `offer_id` = ?1
        ORDER BY `seq`
      )");
      stmt.Bind (1, offerId);

      while (stmt.Step ())
        res.push_back (ReadBlock (stmt));
    });
  return res;
}

} // namespace enertrade
