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

#include "engine.hpp"

#include "matching.hpp"
#include "principals.hpp"
#include "private/blockledger.hpp"
#include "private/cache.hpp"
#include "private/callbacks.hpp"
#include "private/catalog.hpp"
#include "private/database.hpp"
#include "private/dedup.hpp"
#include "private/errors.hpp"
#include "private/eventlog.hpp"
#include "private/idempotency.hpp"
#include "private/orders.hpp"
#include "private/protocol.hpp"
#include "private/taskqueue.hpp"
#include "trust.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <functional>

DECLARE_int32 (claim_max_retries);

namespace enertrade
{

/**
 * Actual implementation of the engine.  This is the class that
 * collects and combines all the different pieces.
 */
class Engine::Impl
{

private:

  const TrustConfig trustConfig;

  Database db;
  MemoryCache cache;

  BlockLedger ledger;
  Catalog catalog;
  SqlitePrincipals principals;
  MatchingEngine matching;
  OrderManager orders;

  EventLog log;
  Deduplicator dedup;
  IdempotencyGuard idempotency;

  std::unique_ptr<TaskQueue> tasks;
  std::unique_ptr<ProtocolDriver> driver;

  /**
   * Runs an order operation under the idempotency key for the given
   * endpoint.  Results are stored for replay unless they failed with
   * a transient error.
   */
  proto::OrderResult RunIdempotent (
      const std::string& endpoint, const std::string& key,
      const std::function<bool (proto::Order&, proto::Error&)>& op);

  friend class Engine;

public:

  explicit Impl (const std::string& dbFile, CallbackSender& callbacks);
  ~Impl ();

  Impl () = delete;
  Impl (const Impl&) = delete;
  void operator= (const Impl&) = delete;

};

Engine::Impl::Impl (const std::string& dbFile, CallbackSender& callbacks)
  : trustConfig(TrustConfig::FromFlags ()),
    db(dbFile),
    ledger(db, FLAGS_claim_max_retries > 0
                 ? static_cast<unsigned> (FLAGS_claim_max_retries) : 0),
    catalog(db, ledger, trustConfig.defaultScore),
    principals(db, trustConfig),
    matching(MatchingConfig::FromFlags ()),
    orders(db, ledger, catalog, principals, OrderConfig::FromFlags ()),
    log(db),
    dedup(cache, log),
    idempotency(cache)
{
  tasks = std::make_unique<TaskQueue> ();

  const ProtocolComponents comp = {
    catalog, ledger, matching, orders, principals,
    dedup, log, *tasks, callbacks,
  };
  driver = std::make_unique<ProtocolDriver> (comp, trustConfig);

  LOG (INFO) << "Engine started with database " << dbFile;
}

Engine::Impl::~Impl ()
{
  /* Stop the workers before the components they use are destroyed.  */
  tasks.reset ();
}

proto::OrderResult
Engine::Impl::RunIdempotent (
    const std::string& endpoint, const std::string& key,
    const std::function<bool (proto::Order&, proto::Error&)>& op)
{
  proto::OrderResult res;

  std::string stored;
  switch (idempotency.Begin (endpoint, key, stored))
    {
    case IdempotencyGuard::Outcome::REPLAY:
      CHECK (res.ParseFromString (stored));
      return res;

    case IdempotencyGuard::Outcome::IN_FLIGHT:
      res.set_success (false);
      SetError (*res.mutable_error (), proto::Error::IDEMPOTENCY_CONFLICT,
                "a request with key " + key + " is already in progress");
      return res;

    case IdempotencyGuard::Outcome::FRESH:
      break;
    }

  proto::Order order;
  proto::Error err;
  bool ok;
  try
    {
      ok = op (order, err);
    }
  catch (...)
    {
      idempotency.Abort (endpoint, key);
      throw;
    }

  res.set_success (ok);
  if (ok)
    *res.mutable_order () = order;
  else
    *res.mutable_error () = err;

  if (!ok && (err.code () == proto::Error::CONFLICT
                || err.code () == proto::Error::INTERNAL))
    idempotency.Abort (endpoint, key);
  else
    idempotency.Complete (endpoint, key, res.SerializeAsString ());

  return res;
}

/* ************************************************************************** */

Engine::Engine (const std::string& dbFile, CallbackSender& callbacks)
  : impl(std::make_unique<Impl> (dbFile, callbacks))
{}

Engine::~Engine () = default;

proto::Ack
Engine::HandleMessage (const proto::InboundMessage& msg)
{
  return impl->driver->Handle (msg);
}

bool
Engine::SyncProvider (const proto::Provider& provider, proto::Error& err)
{
  return impl->catalog.SyncProvider (provider, err);
}

bool
Engine::SyncItem (const proto::CatalogItem& item, proto::Error& err)
{
  return impl->catalog.SyncItem (item, err);
}

bool
Engine::SyncOffer (const proto::Offer& offer, const bool resync,
                   proto::BlockCounts& counts, proto::Error& err)
{
  if (!impl->catalog.SyncOffer (offer, resync, err))
    return false;

  counts = impl->ledger.CountByStatus (offer.id ());
  return true;
}

bool
Engine::DeleteOffer (const std::string& id, proto::Error& err)
{
  return impl->catalog.DeleteOffer (id, err);
}

bool
Engine::UpdateBlocks (const proto::BlockUpdate& update,
                      proto::BlockCounts& counts, proto::Error& err)
{
  if (!impl->ledger.UpdateStatus (update, err))
    return false;

  counts = impl->ledger.CountByStatus (update.offer_id ());
  return true;
}

proto::Catalog
Engine::GetCatalog ()
{
  return impl->catalog.GetCatalog ();
}

proto::TransactionInfo
Engine::GetTransaction (const std::string& transactionId)
{
  proto::TransactionInfo res;
  res.set_transaction_id (transactionId);

  for (auto& e : impl->driver->GetEvents (transactionId))
    *res.add_events () = std::move (e);
  for (auto& s : impl->driver->GetStatus (transactionId))
    *res.add_states () = std::move (s);

  proto::Order order;
  if (impl->orders.GetOrderByTransaction (transactionId, order))
    *res.mutable_order () = std::move (order);

  return res;
}

bool
Engine::GetOrder (const std::string& id, proto::Order& out)
{
  return impl->orders.GetOrder (id, out);
}

bool
Engine::GetTrustInfo (const std::string& id, proto::TrustInfo& out,
                      proto::Error& err)
{
  out.Clear ();
  out.set_id (id);

  proto::Principal principal;
  proto::Provider provider;
  if (impl->principals.Lookup (id, principal))
    {
      out.set_trust_score (principal.trust_score ());
      if (principal.declared_capacity () > 0)
        out.set_allowed_quantity (AllowedTradeQuantity (
            principal.declared_capacity (), principal.trust_score (),
            impl->trustConfig));
    }
  else if (impl->catalog.GetProvider (id, provider))
    out.set_trust_score (provider.trust_score ());
  else
    {
      SetError (err, proto::Error::NOT_FOUND, "unknown principal " + id);
      return false;
    }

  out.set_tier (TierDescription (out.trust_score ()));
  out.set_allowed_limit (AllowedLimit (out.trust_score (),
                                       impl->trustConfig));

  const auto progress = NextTierProgress (out.trust_score ());
  if (!progress.nextTier.empty ())
    {
      out.set_next_tier (progress.nextTier);
      out.set_progress (progress.progress);
      out.set_score_needed (progress.scoreNeeded);
    }

  return true;
}

bool
Engine::RegisterPrincipal (const proto::Principal& principal,
                           const double verifiedCapacity,
                           proto::Principal& out, proto::Error& err)
{
  return impl->principals.Register (principal, verifiedCapacity, out, err);
}

proto::OrderResult
Engine::AdvanceOrder (const std::string& idempotencyKey,
                      const std::string& orderId,
                      const proto::Order::Status status)
{
  return impl->RunIdempotent ("advanceorder", idempotencyKey,
      [this, &orderId, status] (proto::Order& out, proto::Error& err)
        {
          return impl->orders.Advance (orderId, status, out, err);
        });
}

proto::OrderResult
Engine::CancelOrder (const std::string& idempotencyKey,
                     const proto::CancelRequest& req)
{
  return impl->RunIdempotent ("cancelorder", idempotencyKey,
      [this, &req] (proto::Order& out, proto::Error& err)
        {
          if (req.order_id ().empty ())
            {
              SetError (err, proto::Error::VALIDATION,
                        "order_id is missing");
              return false;
            }

          const auto party = req.has_party () ? req.party () : proto::BUYER;
          return impl->orders.Cancel (req.order_id (), party, req.reason (),
                                      req.quantity (), out, err);
        });
}

proto::OrderResult
Engine::VerifyDelivery (const std::string& idempotencyKey,
                        const std::string& orderId, const int64_t delivered)
{
  return impl->RunIdempotent ("verifydelivery", idempotencyKey,
      [this, &orderId, delivered] (proto::Order& out, proto::Error& err)
        {
          return impl->orders.RecordDelivery (orderId, delivered, out, err);
        });
}

size_t
Engine::GetPendingMessages ()
{
  return impl->tasks->PendingCount ();
}

void
Engine::WaitIdle ()
{
  impl->tasks->WaitIdle ();
}

} // namespace enertrade
