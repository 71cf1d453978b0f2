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

#include "private/orders.hpp"

#include "private/errors.hpp"
#include "private/ids.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <ctime>
#include <sstream>

DEFINE_int32 (cancel_window_minutes, 60,
              "cancellations closer than this to delivery start are"
              " penalised");
DEFINE_double (buyer_cancel_penalty_rate, 0.10,
               "share of the cancelled value a buyer pays for a late"
               " cancellation");
DEFINE_double (seller_cancel_penalty_rate, 0.05,
               "share of the cancelled value a seller pays for cancelling");

namespace enertrade
{

OrderConfig
OrderConfig::FromFlags ()
{
  OrderConfig res;
  res.cancelWindowSeconds = static_cast<int64_t> (FLAGS_cancel_window_minutes)
                              * 60;
  res.buyerPenaltyRate = FLAGS_buyer_cancel_penalty_rate;
  res.sellerPenaltyRate = FLAGS_seller_cancel_penalty_rate;
  res.trust = TrustConfig::FromFlags ();
  return res;
}

namespace
{

constexpr const char* ORDER_QUERY = R"(
  SELECT `id`, `transaction_id`, `buyer_id`, `provider_id`,
         `offer_id`, `item_id`, `quantity`, `total_price`, `currency`,
         `window_start`, `window_end`, `status`, `version`,
         `created_at`, `updated_at`, `cancellation`, `delivery`
    FROM `orders`
)";

proto::Order
ReadOrder (const Statement& stmt)
{
  proto::Order res;
  res.set_id (stmt.Get<std::string> (0));
  res.set_transaction_id (stmt.Get<std::string> (1));
  res.set_buyer_id (stmt.Get<std::string> (2));
  res.set_provider_id (stmt.Get<std::string> (3));
  res.set_offer_id (stmt.Get<std::string> (4));
  res.set_item_id (stmt.Get<std::string> (5));
  res.set_quantity (stmt.Get<int64_t> (6));
  res.set_total_price (stmt.Get<double> (7));
  res.set_currency (stmt.Get<std::string> (8));
  res.mutable_window ()->set_start (stmt.Get<int64_t> (9));
  res.mutable_window ()->set_end (stmt.Get<int64_t> (10));

  proto::Order::Status status;
  CHECK (proto::Order::Status_Parse (stmt.Get<std::string> (11), &status))
      << "Invalid order status in database";
  res.set_status (status);

  res.set_version (stmt.Get<int64_t> (12));
  res.set_created_at (stmt.Get<int64_t> (13));
  res.set_updated_at (stmt.Get<int64_t> (14));

  if (!stmt.IsNull (15))
    CHECK (res.mutable_cancellation ()->ParseFromString (
              stmt.Get<std::string> (15)));
  if (!stmt.IsNull (16))
    CHECK (res.mutable_delivery ()->ParseFromString (
              stmt.Get<std::string> (16)));

  return res;
}

} // anonymous namespace

OrderManager::OrderManager (Database& d, BlockLedger& l, Catalog& c,
                            PrincipalDirectory& p, const OrderConfig& cfg)
  : db(d), ledger(l), catalog(c), principals(p), config(cfg)
{}

int64_t
OrderManager::GetCurrentTime () const
{
  return std::time (nullptr);
}

bool
OrderManager::IsValidTransition (const proto::Order::Status from,
                                 const proto::Order::Status to)
{
  switch (from)
    {
    case proto::Order::DRAFT:
      return to == proto::Order::PENDING;
    case proto::Order::PENDING:
      return to == proto::Order::ACTIVE;
    case proto::Order::ACTIVE:
      return to == proto::Order::DELIVERING || to == proto::Order::CANCELLED;
    case proto::Order::DELIVERING:
      return to == proto::Order::DELIVERED || to == proto::Order::CANCELLED;
    case proto::Order::DELIVERED:
      return to == proto::Order::COMPLETED;
    case proto::Order::COMPLETED:
    case proto::Order::CANCELLED:
      return false;
    default:
      LOG (FATAL) << "Invalid order status: " << static_cast<int> (from);
    }
}

bool
OrderManager::ApplyStatus (proto::Order& order, const proto::Order::Status to,
                           proto::Error& err)
{
  if (!IsValidTransition (order.status (), to))
    {
      SetTransitionError (err, proto::Order::Status_Name (order.status ()),
                          proto::Order::Status_Name (to));
      return false;
    }

  VLOG (1)
      << "Order " << order.id () << ": "
      << proto::Order::Status_Name (order.status ()) << " -> "
      << proto::Order::Status_Name (to);
  order.set_status (to);
  return true;
}

bool
OrderManager::LoadOrder (Connection& conn, const std::string& id,
                         proto::Order& out)
{
  auto stmt = conn.Prepare (std::string (ORDER_QUERY) + R"(
    WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return false;

  out = ReadOrder (stmt);
  return true;
}

bool
OrderManager::StoreOrder (Connection& conn, proto::Order& order,
                          proto::Error& err)
{
  auto stmt = conn.Prepare (R"(
    UPDATE `orders`
      SET `quantity` = ?3, `total_price` = ?4, `status` = ?5,
          `updated_at` = ?6, `cancellation` = ?7, `delivery` = ?8
      WHERE `id` = ?1 AND `version` = ?2
  )");
  stmt.Bind (1, order.id ());
  stmt.Bind (2, order.version ());
  stmt.Bind (3, order.quantity ());
  stmt.Bind (4, order.total_price ());
  stmt.Bind (5, proto::Order::Status_Name (order.status ()));
  stmt.Bind (6, order.updated_at ());
  if (order.has_cancellation ())
    stmt.Bind (7, order.cancellation ().SerializeAsString ());
  else
    stmt.BindNull (7);
  if (order.has_delivery ())
    stmt.Bind (8, order.delivery ().SerializeAsString ());
  else
    stmt.BindNull (8);
  stmt.Execute ();

  if (conn.Changes () != 1)
    {
      SetError (err, proto::Error::CONFLICT,
                "order " + order.id () + " was modified concurrently");
      return false;
    }

  order.set_version (order.version () + 1);
  return true;
}

bool
OrderManager::PlaceOrder (const std::string& transactionId,
                          const std::string& buyerId,
                          const std::string& offerId, const int64_t quantity,
                          proto::Order& out, proto::Error& err)
{
  if (transactionId.empty () || buyerId.empty () || offerId.empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "transaction, buyer and offer are required");
      return false;
    }
  if (quantity <= 0)
    {
      SetError (err, proto::Error::VALIDATION, "quantity must be positive");
      return false;
    }

  if (GetOrderByTransaction (transactionId, out))
    {
      LOG (INFO)
          << "Order " << out.id () << " exists already for transaction "
          << transactionId;
      return true;
    }

  proto::Offer offer;
  if (!catalog.GetOffer (offerId, offer))
    {
      SetError (err, proto::Error::NOT_FOUND, "unknown offer " + offerId);
      return false;
    }

  const int64_t now = GetCurrentTime ();

  proto::Order order;
  order.set_id (GenerateId ());
  order.set_transaction_id (transactionId);
  order.set_buyer_id (buyerId);
  order.set_provider_id (offer.provider_id ());
  order.set_offer_id (offer.id ());
  order.set_item_id (offer.item_id ());
  order.set_quantity (quantity);
  order.set_total_price (offer.price ().value () * quantity);
  order.set_currency (offer.price ().currency ());
  *order.mutable_window () = offer.window ();
  order.set_status (proto::Order::DRAFT);
  order.set_created_at (now);
  order.set_updated_at (now);
  CHECK (ApplyStatus (order, proto::Order::PENDING, err));

  std::vector<std::string> claimed;
  if (!ledger.Claim (offerId, quantity, order.id (), transactionId,
                     claimed, err))
    return false;

  bool ok;
  try
    {
      ok = db.Transaction ([&] (Connection& conn)
        {
          auto stmt = conn.Prepare (R"(
            INSERT INTO `orders`
              (`id`, `transaction_id`, `buyer_id`, `provider_id`,
               `offer_id`, `item_id`, `quantity`, `total_price`, `currency`,
               `window_start`, `window_end`, `status`,
               `created_at`, `updated_at`)
              VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12,
                      ?13, ?14)
          )");
          stmt.Bind (1, order.id ());
          stmt.Bind (2, order.transaction_id ());
          stmt.Bind (3, order.buyer_id ());
          stmt.Bind (4, order.provider_id ());
          stmt.Bind (5, order.offer_id ());
          stmt.Bind (6, order.item_id ());
          stmt.Bind (7, order.quantity ());
          stmt.Bind (8, order.total_price ());
          stmt.Bind (9, order.currency ());
          stmt.Bind (10, order.window ().start ());
          stmt.Bind (11, order.window ().end ());
          stmt.Bind (12, proto::Order::Status_Name (order.status ()));
          stmt.Bind (13, order.created_at ());
          stmt.Bind (14, order.updated_at ());
          stmt.Execute ();
          order.set_version (0);

          CHECK (ApplyStatus (order, proto::Order::ACTIVE, err));
          return StoreOrder (conn, order, err);
        });
    }
  catch (const DatabaseError& exc)
    {
      LOG (WARNING)
          << "Failed to write order for transaction " << transactionId
          << ": " << exc.what ();
      SetError (err, exc.IsConstraint () ? proto::Error::CONFLICT
                                         : proto::Error::INTERNAL,
                exc.what ());
      ok = false;
    }

  if (!ok)
    {
      proto::Error releaseErr;
      if (!ledger.Release (claimed, releaseErr))
        LOG (ERROR)
            << "Failed to release blocks of unplaced order " << order.id ()
            << ": " << releaseErr.message ();

      /* A concurrent confirm of the same transaction may have won.  */
      if (GetOrderByTransaction (transactionId, out))
        return true;

      return false;
    }

  LOG (INFO)
      << "Placed order " << order.id () << " for " << quantity
      << " blocks of offer " << offerId;
  out = order;
  return true;
}

bool
OrderManager::GetOrder (const std::string& id, proto::Order& out)
{
  bool found;
  db.Access ([&] (Connection& conn)
    {
      found = LoadOrder (conn, id, out);
    });
  return found;
}

bool
OrderManager::GetOrderByTransaction (const std::string& transactionId,
                                     proto::Order& out)
{
  bool found = false;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (std::string (ORDER_QUERY) + R"(
        WHERE `transaction_id` = ?1
      )");
      stmt.Bind (1, transactionId);

      if (stmt.Step ())
        {
          out = ReadOrder (stmt);
          found = true;
        }
    });
  return found;
}

bool
OrderManager::Advance (const std::string& id, const proto::Order::Status to,
                       proto::Order& out, proto::Error& err)
{
  if (to == proto::Order::CANCELLED)
    {
      SetError (err, proto::Error::VALIDATION,
                "orders are cancelled through a cancel request");
      return false;
    }

  const int64_t now = GetCurrentTime ();
  const bool ok = db.Transaction ([&] (Connection& conn)
    {
      proto::Order order;
      if (!LoadOrder (conn, id, order))
        {
          SetError (err, proto::Error::NOT_FOUND, "unknown order " + id);
          return false;
        }

      if (!ApplyStatus (order, to, err))
        return false;

      if (to == proto::Order::DELIVERING)
        {
          std::vector<std::string> reserved;
          for (const auto& b : ledger.GetBlocksForOrder (conn, id))
            if (b.status () == proto::OfferBlock::RESERVED)
              reserved.push_back (b.id ());

          if (!ledger.Finalize (conn, reserved, err))
            return false;
        }

      order.set_updated_at (now);
      if (!StoreOrder (conn, order, err))
        return false;

      out = order;
      return true;
    });

  if (ok)
    LOG (INFO)
        << "Order " << id << " is now " << proto::Order::Status_Name (to);

  return ok;
}

double
OrderManager::UpdateBuyerTrust (const std::string& buyer,
                                const int64_t cancelled, const int64_t total,
                                const bool withinWindow)
{
  double impact = 0;
  const bool found = principals.AdjustTrust (buyer, [&] (const double score)
    {
      const auto upd = UpdateAfterCancel (score, cancelled, total,
                                          withinWindow, proto::BUYER,
                                          config.trust);
      impact = upd.trustImpact;
      return upd.newScore;
    });

  if (!found)
    {
      LOG (WARNING) << "Cancelling buyer " << buyer << " is not known";
      return 0;
    }

  return impact;
}

bool
OrderManager::Cancel (const std::string& id, const proto::Party party,
                      const std::string& reason, const int64_t quantity,
                      proto::Order& out, proto::Error& err)
{
  const int64_t now = GetCurrentTime ();

  int64_t cancelled = 0;
  int64_t total = 0;
  bool within = false;
  std::string buyer;

  const bool ok = db.Transaction ([&] (Connection& conn)
    {
      proto::Order order;
      if (!LoadOrder (conn, id, order))
        {
          SetError (err, proto::Error::NOT_FOUND, "unknown order " + id);
          return false;
        }

      if (!IsValidTransition (order.status (), proto::Order::CANCELLED))
        {
          SetTransitionError (err,
                              proto::Order::Status_Name (order.status ()),
                              proto::Order::Status_Name (
                                  proto::Order::CANCELLED));
          return false;
        }

      total = order.quantity ();
      if (quantity < 0 || quantity > total)
        {
          std::ostringstream msg;
          msg << "cannot cancel " << quantity << " of " << total << " blocks";
          SetError (err, proto::Error::VALIDATION, msg.str ());
          return false;
        }

      const bool partial = quantity > 0 && quantity < total;
      if (partial && order.status () != proto::Order::ACTIVE)
        {
          SetError (err, proto::Error::VALIDATION,
                    "only active orders can be cancelled partially");
          return false;
        }

      cancelled = partial ? quantity : total;
      within = order.window ().start () - now <= config.cancelWindowSeconds;
      buyer = order.buyer_id ();

      double value = 0;
      if (total > 0)
        value = order.total_price () * cancelled / total;

      proto::Cancellation c;
      c.set_initiator (party);
      if (!reason.empty ())
        c.set_reason (reason);
      c.set_quantity (cancelled);
      c.set_within_window (within);
      c.set_cancelled_at (now);

      switch (party)
        {
        case proto::BUYER:
          {
            const double penalty = within ? value * config.buyerPenaltyRate
                                          : 0.0;
            c.set_buyer_penalty (penalty);
            c.set_seller_compensation (penalty);
            c.set_seller_penalty (0);
            c.set_buyer_refund (value - penalty);
            break;
          }

        case proto::SELLER:
          {
            c.set_buyer_penalty (0);
            c.set_seller_compensation (0);
            c.set_seller_penalty (value * config.sellerPenaltyRate);
            c.set_buyer_refund (value);

            proto::Provider provider;
            if (catalog.GetProvider (conn, order.provider_id (), provider))
              {
                const auto upd = UpdateAfterCancel (
                    provider.trust_score (), cancelled, total, true,
                    proto::SELLER, config.trust);
                provider.set_trust_score (upd.newScore);
                if (!partial)
                  provider.set_total_orders (provider.total_orders () + 1);
                catalog.UpdateProviderStats (conn, provider);
                c.set_trust_impact (upd.trustImpact);
              }
            else
              LOG (WARNING)
                  << "Provider " << order.provider_id () << " of order "
                  << id << " is not known";
            break;
          }

        default:
          SetError (err, proto::Error::VALIDATION, "invalid party");
          return false;
        }

      std::vector<std::string> release;
      for (const auto& b : ledger.GetBlocksForOrder (conn, id))
        if (b.status () == proto::OfferBlock::RESERVED)
          release.push_back (b.id ());
      if (partial && static_cast<int64_t> (release.size ()) > cancelled)
        release.erase (release.begin (), release.end () - cancelled);

      if (!ledger.Release (conn, release, err))
        return false;

      if (partial)
        {
          order.set_quantity (total - cancelled);
          order.set_total_price (order.total_price () - value);
        }
      else if (!ApplyStatus (order, proto::Order::CANCELLED, err))
        return false;

      *order.mutable_cancellation () = c;
      order.set_updated_at (now);
      if (!StoreOrder (conn, order, err))
        return false;

      out = order;
      return true;
    });

  if (!ok)
    return false;

  if (party == proto::BUYER)
    {
      const double impact = UpdateBuyerTrust (buyer, cancelled, total, within);
      out.mutable_cancellation ()->set_trust_impact (impact);
    }

  LOG (INFO)
      << proto::Party_Name (party) << " cancelled " << cancelled << " of "
      << total << " blocks of order " << id
      << (within ? " inside" : " outside") << " the penalty window";
  return true;
}

bool
OrderManager::RecordDelivery (const std::string& id, const int64_t delivered,
                              proto::Order& out, proto::Error& err)
{
  if (delivered < 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "delivered quantity must not be negative");
      return false;
    }

  const int64_t now = GetCurrentTime ();
  return db.Transaction ([&] (Connection& conn)
    {
      proto::Order order;
      if (!LoadOrder (conn, id, order))
        {
          SetError (err, proto::Error::NOT_FOUND, "unknown order " + id);
          return false;
        }

      if (order.status () != proto::Order::COMPLETED)
        {
          SetError (err, proto::Error::VALIDATION,
                    "order " + id + " is "
                      + proto::Order::Status_Name (order.status ())
                      + ", delivery can only be verified once completed");
          err.set_current_state (proto::Order::Status_Name (order.status ()));
          return false;
        }
      if (order.delivery ().verified ())
        {
          SetError (err, proto::Error::VALIDATION,
                    "delivery of order " + id + " was already verified");
          return false;
        }

      proto::Provider provider;
      if (!catalog.GetProvider (conn, order.provider_id (), provider))
        {
          SetError (err, proto::Error::NOT_FOUND,
                    "unknown provider " + order.provider_id ());
          return false;
        }

      const auto upd = UpdateAfterDelivery (provider.trust_score (),
                                            delivered, order.quantity (),
                                            config.trust);
      provider.set_trust_score (upd.newScore);
      provider.set_total_orders (provider.total_orders () + 1);
      if (delivered >= order.quantity ())
        provider.set_successful_orders (provider.successful_orders () + 1);
      catalog.UpdateProviderStats (conn, provider);

      auto* d = order.mutable_delivery ();
      d->set_delivered_quantity (delivered);
      d->set_verified (true);
      d->set_trust_impact (upd.trustImpact);
      d->set_verified_at (now);
      order.set_updated_at (now);
      if (!StoreOrder (conn, order, err))
        return false;

      LOG (INFO)
          << "Verified delivery of " << delivered << "/" << order.quantity ()
          << " for order " << id << ", provider trust impact "
          << upd.trustImpact;
      out = order;
      return true;
    });
}

int64_t
OrderManager::OpenQuantity (const std::string& buyerId)
{
  int64_t res = 0;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT COALESCE (SUM (`quantity`), 0)
          FROM `orders`
          WHERE `buyer_id` = ?1
              AND `status` IN ('PENDING', 'ACTIVE', 'DELIVERING')
      )");
      stmt.Bind (1, buyerId);
      CHECK (stmt.Step ());
      res = stmt.Get<int64_t> (0);
    });
  return res;
}

} // namespace enertrade
