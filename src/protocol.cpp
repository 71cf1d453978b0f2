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

#include "private/protocol.hpp"

#include "filter.hpp"
#include "json.hpp"
#include "private/errors.hpp"
#include "private/ids.hpp"
#include "timewindow.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <ctime>
#include <exception>
#include <set>
#include <sstream>

DEFINE_int32 (callback_delay_ms, 100,
              "delay between acknowledging a message and processing it");

namespace enertrade
{

namespace
{

/**
 * Serialises JSON into a compact string for the event log.
 */
std::string
WriteCompact (const Json::Value& val)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString (builder, val);
}

/**
 * Removes all offers from a catalog that are not in the given set, as well
 * as items and providers left without offers.
 */
void
RestrictCatalog (proto::Catalog& catalog, const std::set<std::string>& offers)
{
  proto::Catalog res;
  for (const auto& p : catalog.providers ())
    {
      proto::Catalog::ProviderEntry provider;
      *provider.mutable_provider () = p.provider ();

      for (const auto& i : p.items ())
        {
          proto::Catalog::ItemEntry item;
          *item.mutable_item () = i.item ();
          for (const auto& o : i.offers ())
            if (offers.count (o.id ()) > 0)
              *item.add_offers () = o;

          if (item.offers_size () > 0)
            *provider.add_items () = std::move (item);
        }

      if (provider.items_size () > 0)
        *res.add_providers () = std::move (provider);
    }

  catalog = std::move (res);
}

} // anonymous namespace

ProtocolDriver::ProtocolDriver (const ProtocolComponents& c,
                                const TrustConfig& trust,
                                const std::chrono::milliseconds delay)
  : comp(c), trustConfig(trust), callbackDelay(delay)
{}

ProtocolDriver::ProtocolDriver (const ProtocolComponents& c,
                                const TrustConfig& trust)
  : ProtocolDriver(c, trust,
                   std::chrono::milliseconds (FLAGS_callback_delay_ms))
{}

int64_t
ProtocolDriver::GetCurrentTime () const
{
  return std::time (nullptr);
}

std::string
ProtocolDriver::PayloadAction (const proto::InboundMessage& msg)
{
  switch (msg.payload_case ())
    {
    case proto::InboundMessage::kDiscover:
      return "discover";
    case proto::InboundMessage::kSelect:
      return "select";
    case proto::InboundMessage::kInit:
      return "init";
    case proto::InboundMessage::kConfirm:
      return "confirm";
    case proto::InboundMessage::kCancel:
      return "cancel";
    case proto::InboundMessage::kStatus:
      return "status";
    default:
      return "";
    }
}

bool
ProtocolDriver::ValidateMessage (const proto::InboundMessage& msg,
                                 proto::Error& err)
{
  const auto& ctx = msg.context ();
  if (ctx.transaction_id ().empty () || ctx.message_id ().empty ()
        || ctx.action ().empty () || ctx.bap_id ().empty ()
        || ctx.bap_uri ().empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "context requires transaction_id, message_id, action,"
                " bap_id and bap_uri");
      return false;
    }

  const std::string action = PayloadAction (msg);
  if (action.empty ())
    {
      SetError (err, proto::Error::VALIDATION, "message payload is missing");
      return false;
    }
  if (action != ctx.action ())
    {
      SetError (err, proto::Error::VALIDATION,
                "context action " + ctx.action () + " does not match "
                  + action);
      return false;
    }

  switch (msg.payload_case ())
    {
    case proto::InboundMessage::kSelect:
    case proto::InboundMessage::kInit:
    case proto::InboundMessage::kConfirm:
      {
        const auto& req = msg.payload_case () == proto::InboundMessage::kSelect
            ? msg.select ()
            : msg.payload_case () == proto::InboundMessage::kInit
                ? msg.init () : msg.confirm ();
        if (req.offer_id ().empty ())
          {
            SetError (err, proto::Error::VALIDATION, "offer_id is missing");
            return false;
          }
        if (req.quantity () < 1)
          {
            SetError (err, proto::Error::VALIDATION,
                      "quantity must be at least one");
            return false;
          }
        if (action != "select" && req.buyer_id ().empty ())
          {
            SetError (err, proto::Error::VALIDATION, "buyer_id is missing");
            return false;
          }
        break;
      }

    case proto::InboundMessage::kCancel:
      if (msg.cancel ().quantity () < 0)
        {
          SetError (err, proto::Error::VALIDATION,
                    "quantity must not be negative");
          return false;
        }
      break;

    default:
      break;
    }

  return true;
}

bool
ProtocolDriver::ValidateSelect (const proto::OrderRequest& req,
                                proto::Error& err)
{
  proto::Offer offer;
  if (!comp.catalog.GetOffer (req.offer_id (), offer))
    {
      SetError (err, proto::Error::NOT_FOUND,
                "unknown offer " + req.offer_id ());
      return false;
    }

  if (offer.window ().end () <= GetCurrentTime ())
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " is no longer active");
      return false;
    }

  if (req.has_item_id () && req.item_id () != offer.item_id ())
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " is not for item " + req.item_id ());
      return false;
    }

  const auto counts = comp.ledger.CountByStatus (offer.id ());
  if (req.quantity () > counts.available ())
    {
      std::ostringstream msg;
      msg << "requested " << req.quantity () << " blocks, only "
          << counts.available () << " available";
      SetError (err, proto::Error::INSUFFICIENT_AVAILABLE, msg.str ());
      return false;
    }

  proto::CatalogItem item;
  if (comp.catalog.GetItem (offer.item_id (), item)
        && item.has_available_qty () && req.quantity () > item.available_qty ())
    {
      std::ostringstream msg;
      msg << "requested " << req.quantity () << " blocks, item has only "
          << item.available_qty ();
      SetError (err, proto::Error::INSUFFICIENT_AVAILABLE, msg.str ());
      return false;
    }

  return true;
}

proto::Ack&
ProtocolDriver::Reject (const proto::Context& ctx, const proto::Error& err,
                        proto::Ack& ack)
{
  LOG (WARNING)
      << "Rejecting " << ctx.action () << " message "
      << ctx.message_id () << ": " << err.message ();
  ack.set_status (proto::Ack::NACK);
  *ack.mutable_error () = err;
  return ack;
}

proto::Ack
ProtocolDriver::Handle (const proto::InboundMessage& msg)
{
  const int64_t now = GetCurrentTime ();
  const auto& ctx = msg.context ();

  proto::Ack ack;
  ack.set_timestamp (now);

  proto::Error err;
  if (!ValidateMessage (msg, err))
    return Reject (ctx, err, ack);

  /* A redelivered message gets the acknowledgement it got the first time,
     regardless of how the inventory changed since.  */
  if (comp.dedup.IsDuplicate (ctx.message_id ()))
    {
      LOG (INFO) << "Message " << ctx.message_id () << " is a duplicate";
      comp.log.MarkDuplicate (ctx, now);
      ack.set_status (proto::Ack::ACK);
      return ack;
    }

  if (msg.has_select () && !ValidateSelect (msg.select (), err))
    return Reject (ctx, err, ack);

  LOG (INFO)
      << "Received " << ctx.action () << " message " << ctx.message_id ()
      << " for transaction " << ctx.transaction_id ();

  proto::Event ev;
  ev.set_transaction_id (ctx.transaction_id ());
  ev.set_message_id (ctx.message_id ());
  ev.set_action (ctx.action ());
  ev.set_direction (proto::Event::INBOUND);
  if (msg.has_raw_json ())
    ev.set_payload (msg.raw_json ());
  else
    ev.set_payload (WriteCompact (ProtoToJson (ctx)));
  ev.set_created_at (now);

  if (!comp.dedup.RecordInbound (ev))
    {
      comp.log.MarkDuplicate (ctx, now);
      ack.set_status (proto::Ack::ACK);
      return ack;
    }

  comp.log.SetState (ctx, proto::TransactionStatus::RECEIVED, nullptr, now);
  comp.log.SetState (ctx, proto::TransactionStatus::ACKED, nullptr, now);

  comp.tasks.ScheduleAfter (callbackDelay, [this, msg] ()
    {
      Process (msg);
    });

  ack.set_status (proto::Ack::ACK);
  return ack;
}

void
ProtocolDriver::Process (const proto::InboundMessage& msg)
{
  const auto& ctx = msg.context ();
  comp.log.SetState (ctx, proto::TransactionStatus::PROCESSING, nullptr,
                     GetCurrentTime ());

  proto::CallbackPayload payload;
  proto::Error err;
  bool ok;

  try
    {
      switch (msg.payload_case ())
        {
        case proto::InboundMessage::kDiscover:
          ok = ProcessDiscover (msg.discover (), payload, err);
          break;
        case proto::InboundMessage::kSelect:
          ok = ProcessSelect (msg.select (), payload, err);
          break;
        case proto::InboundMessage::kInit:
          ok = ProcessInit (ctx, msg.init (), payload, err);
          break;
        case proto::InboundMessage::kConfirm:
          ok = ProcessConfirm (ctx, msg.confirm (), payload, err);
          break;
        case proto::InboundMessage::kCancel:
          ok = ProcessCancel (ctx, msg.cancel (), payload, err);
          break;
        case proto::InboundMessage::kStatus:
          ok = ProcessStatus (ctx, msg.status (), payload, err);
          break;
        default:
          LOG (FATAL) << "Unexpected payload in validated message";
        }
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR)
          << "Processing " << ctx.action () << " message "
          << ctx.message_id () << " failed: " << exc.what ();
      SetError (err, proto::Error::INTERNAL, exc.what ());
      ok = false;
    }

  if (!ok)
    {
      LOG (WARNING)
          << "Processing " << ctx.action () << " message "
          << ctx.message_id () << " failed: "
          << proto::Error::Code_Name (err.code ()) << " " << err.message ();
      payload.Clear ();
      *payload.mutable_error () = err;
    }

  SendCallback (ctx, payload, ok ? nullptr : &err);
}

void
ProtocolDriver::SendCallback (const proto::Context& inbound,
                              const proto::CallbackPayload& payload,
                              const proto::Error* processingError)
{
  const int64_t now = GetCurrentTime ();

  proto::Context ctx = inbound;
  ctx.set_message_id (GenerateId ());
  ctx.set_action ("on_" + inbound.action ());
  ctx.set_timestamp (now);

  const Json::Value ctxJson = ProtoToJson (ctx);
  const Json::Value message = ProtoToJson (payload);

  Json::Value full(Json::objectValue);
  full["context"] = ctxJson;
  full["message"] = message;

  proto::Event ev;
  ev.set_transaction_id (ctx.transaction_id ());
  ev.set_message_id (ctx.message_id ());
  ev.set_action (ctx.action ());
  ev.set_direction (proto::Event::OUTBOUND);
  ev.set_payload (WriteCompact (full));
  ev.set_created_at (now);
  CHECK (comp.log.Append (ev));

  std::string error;
  if (!comp.callbacks.Send (inbound.bap_uri (), inbound.action (), ctxJson,
                            message, error))
    {
      proto::Error deliveryErr;
      SetError (deliveryErr, proto::Error::UPSTREAM_DELIVERY, error);
      comp.log.SetState (inbound, proto::TransactionStatus::FAILED,
                         &deliveryErr, GetCurrentTime ());
      return;
    }

  LOG (INFO)
      << "Sent " << ctx.action () << " for message " << inbound.message_id ();

  if (processingError == nullptr)
    comp.log.SetState (inbound, proto::TransactionStatus::CALLBACK_SENT,
                       nullptr, GetCurrentTime ());
  else
    comp.log.SetState (inbound, proto::TransactionStatus::FAILED,
                       processingError, GetCurrentTime ());
}

bool
ProtocolDriver::ProcessDiscover (const proto::DiscoverRequest& req,
                                 proto::CallbackPayload& out,
                                 proto::Error& err)
{
  if (req.has_window () && !IsValidWindow (req.window ()))
    {
      SetError (err, proto::Error::VALIDATION, "invalid time window");
      return false;
    }
  if (req.quantity () < 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "quantity must not be negative");
      return false;
    }

  OfferFilter filter;
  if (req.has_filter_expression ())
    filter = OfferFilter::Parse (req.filter_expression ());
  if (req.has_source_type ())
    filter.RequireSourceType (req.source_type ());
  if (req.quantity () > filter.GetMinAvailable ())
    filter.RequireAvailable (req.quantity ());

  std::vector<proto::ScorableOffer> offers;
  std::set<std::string> offerIds;
  for (auto& o : comp.catalog.GetScorableOffers ())
    if (filter.Matches (o))
      {
        offerIds.insert (o.offer ().id ());
        offers.push_back (std::move (o));
      }

  proto::MatchCriteria criteria;
  criteria.set_requested_quantity (req.quantity () > 0 ? req.quantity () : 1);
  if (req.has_window ())
    *criteria.mutable_requested_window () = req.window ();
  if (req.has_max_price ())
    criteria.set_max_price (req.max_price ());

  auto* res = out.mutable_discover ();
  *res->mutable_match () = comp.matching.Match (
      offers, comp.catalog.GetProviders (), criteria);

  *res->mutable_catalog () = comp.catalog.GetCatalog ();
  RestrictCatalog (*res->mutable_catalog (), offerIds);

  VLOG (1)
      << "Discovery found " << offers.size () << " offers, "
      << res->match ().eligible_count () << " eligible";
  return true;
}

bool
ProtocolDriver::ProcessSelect (const proto::OrderRequest& req,
                               proto::CallbackPayload& out,
                               proto::Error& err)
{
  if (!ValidateSelect (req, err))
    return false;

  proto::Offer offer;
  if (!comp.catalog.GetOffer (req.offer_id (), offer))
    {
      SetError (err, proto::Error::NOT_FOUND,
                "unknown offer " + req.offer_id ());
      return false;
    }

  auto* quote = out.mutable_quote ();
  quote->set_offer_id (offer.id ());
  quote->set_item_id (offer.item_id ());
  quote->set_provider_id (offer.provider_id ());
  quote->set_quantity (req.quantity ());
  *quote->mutable_unit_price () = offer.price ();
  quote->set_total_price (offer.price ().value () * req.quantity ());
  quote->set_available_blocks (
      comp.ledger.CountByStatus (offer.id ()).available ());

  return true;
}

bool
ProtocolDriver::CheckBuyer (const std::string& buyerId, const double total,
                            const int64_t quantity, proto::Error& err)
{
  proto::Principal buyer;
  if (!comp.principals.Lookup (buyerId, buyer))
    {
      SetError (err, proto::Error::NOT_FOUND, "unknown buyer " + buyerId);
      return false;
    }

  if (!comp.principals.HasSufficientFunds (buyerId, total))
    {
      std::ostringstream msg;
      msg << "buyer " << buyerId << " cannot pay " << total;
      SetError (err, proto::Error::INSUFFICIENT_FUNDS, msg.str ());
      return false;
    }

  if (buyer.declared_capacity () > 0)
    {
      const double allowed = AllowedTradeQuantity (buyer.declared_capacity (),
                                                   buyer.trust_score (),
                                                   trustConfig);
      const int64_t open = comp.orders.OpenQuantity (buyerId);
      if (open + quantity > allowed)
        {
          std::ostringstream msg;
          msg << "buyer " << buyerId << " may trade " << allowed
              << " blocks, has " << open << " open and requested "
              << quantity;
          SetError (err, proto::Error::CAPACITY_EXCEEDED, msg.str ());
          return false;
        }
    }

  return true;
}

bool
ProtocolDriver::ProcessInit (const proto::Context& ctx,
                             const proto::OrderRequest& req,
                             proto::CallbackPayload& out, proto::Error& err)
{
  proto::Offer offer;
  if (!comp.catalog.GetOffer (req.offer_id (), offer))
    {
      SetError (err, proto::Error::NOT_FOUND,
                "unknown offer " + req.offer_id ());
      return false;
    }

  const int64_t available
      = comp.ledger.CountByStatus (offer.id ()).available ();
  if (req.quantity () > available)
    {
      std::ostringstream msg;
      msg << "requested " << req.quantity () << " blocks, only "
          << available << " available";
      SetError (err, proto::Error::INSUFFICIENT_AVAILABLE, msg.str ());
      return false;
    }

  const double total = offer.price ().value () * req.quantity ();
  if (!CheckBuyer (req.buyer_id (), total, req.quantity (), err))
    return false;

  const int64_t now = GetCurrentTime ();
  auto* order = out.mutable_order ();
  order->set_transaction_id (ctx.transaction_id ());
  order->set_buyer_id (req.buyer_id ());
  order->set_provider_id (offer.provider_id ());
  order->set_offer_id (offer.id ());
  order->set_item_id (offer.item_id ());
  order->set_quantity (req.quantity ());
  order->set_total_price (total);
  order->set_currency (offer.price ().currency ());
  *order->mutable_window () = offer.window ();
  order->set_status (proto::Order::DRAFT);
  order->set_created_at (now);
  order->set_updated_at (now);

  return true;
}

bool
ProtocolDriver::ProcessConfirm (const proto::Context& ctx,
                                const proto::OrderRequest& req,
                                proto::CallbackPayload& out,
                                proto::Error& err)
{
  proto::Order existing;
  if (comp.orders.GetOrderByTransaction (ctx.transaction_id (), existing))
    {
      LOG (INFO)
          << "Transaction " << ctx.transaction_id ()
          << " is confirmed already as order " << existing.id ();
      *out.mutable_order () = existing;
      return true;
    }

  proto::Offer offer;
  if (!comp.catalog.GetOffer (req.offer_id (), offer))
    {
      SetError (err, proto::Error::NOT_FOUND,
                "unknown offer " + req.offer_id ());
      return false;
    }

  if (!CheckBuyer (req.buyer_id (), offer.price ().value () * req.quantity (),
                   req.quantity (), err))
    return false;

  return comp.orders.PlaceOrder (ctx.transaction_id (), req.buyer_id (),
                                 req.offer_id (), req.quantity (),
                                 *out.mutable_order (), err);
}

bool
ProtocolDriver::FindOrder (const std::string& orderId,
                           const std::string& transactionId,
                           proto::Order& out, proto::Error& err)
{
  if (!orderId.empty ())
    {
      if (comp.orders.GetOrder (orderId, out))
        return true;

      SetError (err, proto::Error::NOT_FOUND, "unknown order " + orderId);
      return false;
    }

  if (comp.orders.GetOrderByTransaction (transactionId, out))
    return true;

  SetError (err, proto::Error::NOT_FOUND,
            "no order for transaction " + transactionId);
  return false;
}

bool
ProtocolDriver::ProcessCancel (const proto::Context& ctx,
                               const proto::CancelRequest& req,
                               proto::CallbackPayload& out, proto::Error& err)
{
  proto::Order order;
  if (!FindOrder (req.order_id (), ctx.transaction_id (), order, err))
    return false;

  const proto::Party party = req.has_party () ? req.party () : proto::BUYER;
  return comp.orders.Cancel (order.id (), party, req.reason (),
                             req.quantity (), *out.mutable_order (), err);
}

bool
ProtocolDriver::ProcessStatus (const proto::Context& ctx,
                               const proto::StatusRequest& req,
                               proto::CallbackPayload& out, proto::Error& err)
{
  return FindOrder (req.order_id (), ctx.transaction_id (),
                    *out.mutable_order (), err);
}

std::vector<proto::TransactionStatus>
ProtocolDriver::GetStatus (const std::string& transactionId)
{
  return comp.log.GetStates (transactionId);
}

std::vector<proto::Event>
ProtocolDriver::GetEvents (const std::string& transactionId)
{
  return comp.log.GetEvents (transactionId);
}

} // namespace enertrade
