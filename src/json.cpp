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

#include "json.hpp"

#include "proto/catalog.pb.h"
#include "proto/error.pb.h"
#include "proto/matching.pb.h"
#include "proto/orders.pb.h"
#include "proto/protocol.pb.h"
#include "timewindow.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace enertrade
{

namespace
{

/**
 * Converts an integer to JSON, making sure to do it with the proper
 * signed JSON int64 type.
 */
Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

/**
 * Converts a timestamp to an ISO 8601 string.  Values that cannot be
 * formatted are returned as plain integers.
 */
Json::Value
TimeToJson (const int64_t t)
{
  std::string res;
  if (FormatIsoTime (t, res))
    return res;

  LOG (WARNING) << "Timestamp " << t << " is out of range";
  return IntToJson (t);
}

/**
 * Reads a timestamp, either an ISO 8601 string or a Unix time.
 */
bool
TimeFromJson (const Json::Value& val, int64_t& out)
{
  if (val.isString ())
    return ParseIsoTime (val.asString (), out);
  if (val.isInt64 () && IsValidTimestamp (val.asInt64 ()))
    {
      out = val.asInt64 ();
      return true;
    }
  return false;
}

/**
 * Parses an enum value given by its name (case-insensitive) using the
 * generated parse function.
 */
template <typename E, typename Parser>
  bool
  EnumFromJson (const Json::Value& val, const Parser& parse, E& out)
{
  if (!val.isString ())
    return false;

  std::string name = val.asString ();
  std::transform (name.begin (), name.end (), name.begin (),
                  [] (const unsigned char c)
                    {
                      return static_cast<char> (std::toupper (c));
                    });

  return parse (name, &out);
}

/* Helpers for optional members of a JSON object.  Each of them returns true
   if the member is missing or valid, and calls the setter in the latter
   case.  */

template <typename Setter>
  bool
  OptionalString (const Json::Value& obj, const char* key, const Setter& set)
{
  if (!obj.isMember (key))
    return true;
  if (!obj[key].isString ())
    return false;
  set (obj[key].asString ());
  return true;
}

template <typename Setter>
  bool
  OptionalInt (const Json::Value& obj, const char* key, const Setter& set)
{
  if (!obj.isMember (key))
    return true;
  if (!obj[key].isInt64 ())
    return false;
  set (obj[key].asInt64 ());
  return true;
}

template <typename Setter>
  bool
  OptionalDouble (const Json::Value& obj, const char* key, const Setter& set)
{
  if (!obj.isMember (key))
    return true;
  if (!obj[key].isNumeric ())
    return false;
  set (obj[key].asDouble ());
  return true;
}

template <typename Setter>
  bool
  OptionalTime (const Json::Value& obj, const char* key, const Setter& set)
{
  if (!obj.isMember (key))
    return true;
  int64_t t;
  if (!TimeFromJson (obj[key], t))
    return false;
  set (t);
  return true;
}

} // anonymous namespace

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::TimeWindow> (const proto::TimeWindow& pb)
{
  Json::Value res(Json::objectValue);
  res["start"] = TimeToJson (pb.start ());
  res["end"] = TimeToJson (pb.end ());
  return res;
}

template <>
  bool
  ProtoFromJson<proto::TimeWindow> (const Json::Value& val,
                                    proto::TimeWindow& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  int64_t t;
  if (!TimeFromJson (val["start"], t))
    return false;
  pb.set_start (t);
  if (!TimeFromJson (val["end"], t))
    return false;
  pb.set_end (t);

  return true;
}

template <>
  Json::Value
  ProtoToJson<proto::Price> (const proto::Price& pb)
{
  Json::Value res(Json::objectValue);
  res["value"] = pb.value ();
  res["currency"] = pb.currency ();
  return res;
}

template <>
  bool
  ProtoFromJson<proto::Price> (const Json::Value& val, proto::Price& pb)
{
  pb.Clear ();
  if (!val.isObject () || !val["value"].isNumeric ())
    return false;

  pb.set_value (val["value"].asDouble ());
  return OptionalString (val, "currency", [&pb] (const std::string& v)
    {
      pb.set_currency (v);
    });
}

template <>
  Json::Value
  ProtoToJson<proto::Context> (const proto::Context& pb)
{
  Json::Value res(Json::objectValue);
  res["transaction_id"] = pb.transaction_id ();
  res["message_id"] = pb.message_id ();
  res["action"] = pb.action ();

  if (pb.has_bap_id ())
    res["bap_id"] = pb.bap_id ();
  if (pb.has_bap_uri ())
    res["bap_uri"] = pb.bap_uri ();
  if (pb.has_bpp_id ())
    res["bpp_id"] = pb.bpp_id ();
  if (pb.has_bpp_uri ())
    res["bpp_uri"] = pb.bpp_uri ();

  if (pb.has_timestamp ())
    res["timestamp"] = TimeToJson (pb.timestamp ());

  return res;
}

template <>
  bool
  ProtoFromJson<proto::Context> (const Json::Value& val, proto::Context& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  return OptionalString (val, "transaction_id", [&pb] (const std::string& v)
           {
             pb.set_transaction_id (v);
           })
      && OptionalString (val, "message_id", [&pb] (const std::string& v)
           {
             pb.set_message_id (v);
           })
      && OptionalString (val, "action", [&pb] (const std::string& v)
           {
             pb.set_action (v);
           })
      && OptionalString (val, "bap_id", [&pb] (const std::string& v)
           {
             pb.set_bap_id (v);
           })
      && OptionalString (val, "bap_uri", [&pb] (const std::string& v)
           {
             pb.set_bap_uri (v);
           })
      && OptionalString (val, "bpp_id", [&pb] (const std::string& v)
           {
             pb.set_bpp_id (v);
           })
      && OptionalString (val, "bpp_uri", [&pb] (const std::string& v)
           {
             pb.set_bpp_uri (v);
           })
      && OptionalTime (val, "timestamp", [&pb] (const int64_t v)
           {
             pb.set_timestamp (v);
           });
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::Provider> (const proto::Provider& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  if (pb.has_name ())
    res["name"] = pb.name ();
  res["trust_score"] = pb.trust_score ();
  res["total_orders"] = IntToJson (pb.total_orders ());
  res["successful_orders"] = IntToJson (pb.successful_orders ());
  return res;
}

template <>
  bool
  ProtoFromJson<proto::Provider> (const Json::Value& val, proto::Provider& pb)
{
  pb.Clear ();
  if (!val.isObject () || !val["id"].isString ())
    return false;

  pb.set_id (val["id"].asString ());
  return OptionalString (val, "name", [&pb] (const std::string& v)
           {
             pb.set_name (v);
           })
      && OptionalDouble (val, "trust_score", [&pb] (const double v)
           {
             pb.set_trust_score (v);
           });
}

template <>
  Json::Value
  ProtoToJson<proto::CatalogItem> (const proto::CatalogItem& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["provider_id"] = pb.provider_id ();
  res["source_type"] = proto::CatalogItem::SourceType_Name (pb.source_type ());
  res["available_qty"] = IntToJson (pb.available_qty ());

  Json::Value windows(Json::arrayValue);
  for (const auto& w : pb.production_windows ())
    windows.append (ProtoToJson (w));
  res["production_windows"] = windows;

  if (pb.has_meter_id ())
    res["meter_id"] = pb.meter_id ();

  return res;
}

template <>
  bool
  ProtoFromJson<proto::CatalogItem> (const Json::Value& val,
                                     proto::CatalogItem& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  if (!val["id"].isString () || !val["provider_id"].isString ())
    return false;
  pb.set_id (val["id"].asString ());
  pb.set_provider_id (val["provider_id"].asString ());

  proto::CatalogItem::SourceType type;
  if (!EnumFromJson (val["source_type"], &proto::CatalogItem::SourceType_Parse,
                     type))
    return false;
  pb.set_source_type (type);

  if (val.isMember ("production_windows"))
    {
      const auto& windows = val["production_windows"];
      if (!windows.isArray ())
        return false;
      for (const auto& w : windows)
        if (!ProtoFromJson (w, *pb.add_production_windows ()))
          return false;
    }

  return OptionalInt (val, "available_qty", [&pb] (const int64_t v)
           {
             pb.set_available_qty (v);
           })
      && OptionalString (val, "meter_id", [&pb] (const std::string& v)
           {
             pb.set_meter_id (v);
           });
}

template <>
  Json::Value
  ProtoToJson<proto::Offer> (const proto::Offer& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["item_id"] = pb.item_id ();
  res["provider_id"] = pb.provider_id ();
  res["price"] = ProtoToJson (pb.price ());
  res["max_qty"] = IntToJson (pb.max_qty ());
  res["window"] = ProtoToJson (pb.window ());

  if (pb.has_pricing_model ())
    res["pricing_model"] = pb.pricing_model ();
  if (pb.has_settlement_type ())
    res["settlement_type"] = pb.settlement_type ();

  return res;
}

template <>
  bool
  ProtoFromJson<proto::Offer> (const Json::Value& val, proto::Offer& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  if (!val["id"].isString () || !val["item_id"].isString ()
        || !val["provider_id"].isString ())
    return false;
  pb.set_id (val["id"].asString ());
  pb.set_item_id (val["item_id"].asString ());
  pb.set_provider_id (val["provider_id"].asString ());

  if (!ProtoFromJson (val["price"], *pb.mutable_price ()))
    return false;
  if (!val["max_qty"].isInt64 ())
    return false;
  pb.set_max_qty (val["max_qty"].asInt64 ());
  if (!ProtoFromJson (val["window"], *pb.mutable_window ()))
    return false;

  return OptionalString (val, "pricing_model", [&pb] (const std::string& v)
           {
             pb.set_pricing_model (v);
           })
      && OptionalString (val, "settlement_type", [&pb] (const std::string& v)
           {
             pb.set_settlement_type (v);
           });
}

template <>
  Json::Value
  ProtoToJson<proto::OfferBlock> (const proto::OfferBlock& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["offer_id"] = pb.offer_id ();
  res["status"] = proto::OfferBlock::Status_Name (pb.status ());
  if (pb.has_order_id ())
    res["order_id"] = pb.order_id ();
  if (pb.has_transaction_id ())
    res["transaction_id"] = pb.transaction_id ();
  res["version"] = IntToJson (pb.version ());
  res["price"] = ProtoToJson (pb.price ());
  res["window"] = ProtoToJson (pb.window ());
  res["created_at"] = TimeToJson (pb.created_at ());
  if (pb.has_reserved_at ())
    res["reserved_at"] = TimeToJson (pb.reserved_at ());
  if (pb.has_sold_at ())
    res["sold_at"] = TimeToJson (pb.sold_at ());
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::BlockCounts> (const proto::BlockCounts& pb)
{
  Json::Value res(Json::objectValue);
  res["available"] = IntToJson (pb.available ());
  res["reserved"] = IntToJson (pb.reserved ());
  res["sold"] = IntToJson (pb.sold ());
  return res;
}

template <>
  bool
  ProtoFromJson<proto::BlockUpdate> (const Json::Value& val,
                                     proto::BlockUpdate& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  if (!val["offer_id"].isString ())
    return false;
  pb.set_offer_id (val["offer_id"].asString ());

  const auto& ids = val["block_ids"];
  if (!ids.isArray ())
    return false;
  for (const auto& id : ids)
    {
      if (!id.isString ())
        return false;
      pb.add_block_ids (id.asString ());
    }

  proto::OfferBlock::Status status;
  if (!EnumFromJson (val["status"], &proto::OfferBlock::Status_Parse, status))
    return false;
  pb.set_status (status);

  return OptionalString (val, "order_id", [&pb] (const std::string& v)
           {
             pb.set_order_id (v);
           })
      && OptionalString (val, "transaction_id", [&pb] (const std::string& v)
           {
             pb.set_transaction_id (v);
           });
}

template <>
  Json::Value
  ProtoToJson<proto::Catalog> (const proto::Catalog& pb)
{
  Json::Value providers(Json::arrayValue);
  for (const auto& p : pb.providers ())
    {
      Json::Value items(Json::arrayValue);
      for (const auto& i : p.items ())
        {
          Json::Value offers(Json::arrayValue);
          for (const auto& o : i.offers ())
            offers.append (ProtoToJson (o));

          Json::Value cur = ProtoToJson (i.item ());
          cur["offers"] = offers;
          items.append (cur);
        }

      Json::Value cur = ProtoToJson (p.provider ());
      cur["items"] = items;
      providers.append (cur);
    }

  Json::Value res(Json::objectValue);
  res["providers"] = providers;
  return res;
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::ScoredOffer> (const proto::ScoredOffer& pb)
{
  Json::Value res(Json::objectValue);
  res["offer"] = ProtoToJson (pb.offer ());
  res["source_type"] = proto::CatalogItem::SourceType_Name (pb.source_type ());
  res["available_blocks"] = IntToJson (pb.available_blocks ());
  res["provider_trust"] = pb.provider_trust ();
  res["matches_filters"] = pb.matches_filters ();

  Json::Value reasons(Json::arrayValue);
  for (const auto& r : pb.filter_reasons ())
    reasons.append (r);
  res["filter_reasons"] = reasons;

  res["score"] = pb.score ();

  Json::Value breakdown(Json::objectValue);
  breakdown["price"] = pb.breakdown ().price_score ();
  breakdown["trust"] = pb.breakdown ().trust_score ();
  breakdown["time_fit"] = pb.breakdown ().time_fit_score ();
  res["breakdown"] = breakdown;

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::MatchResult> (const proto::MatchResult& pb)
{
  Json::Value offers(Json::arrayValue);
  for (const auto& o : pb.offers ())
    offers.append (ProtoToJson (o));

  Json::Value res(Json::objectValue);
  res["offers"] = offers;
  res["eligible_count"] = IntToJson (pb.eligible_count ());
  if (pb.has_selected_offer_id ())
    res["selected_offer_id"] = pb.selected_offer_id ();

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Quote> (const proto::Quote& pb)
{
  Json::Value res(Json::objectValue);
  res["offer_id"] = pb.offer_id ();
  res["item_id"] = pb.item_id ();
  res["provider_id"] = pb.provider_id ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["unit_price"] = ProtoToJson (pb.unit_price ());
  res["total_price"] = pb.total_price ();
  res["available_blocks"] = IntToJson (pb.available_blocks ());
  return res;
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::Error> (const proto::Error& pb)
{
  Json::Value res(Json::objectValue);
  res["code"] = proto::Error::Code_Name (pb.code ());
  res["message"] = pb.message ();
  if (pb.has_current_state ())
    res["current_state"] = pb.current_state ();
  if (pb.has_attempted_state ())
    res["attempted_state"] = pb.attempted_state ();
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Ack> (const proto::Ack& pb)
{
  Json::Value res(Json::objectValue);
  res["ack_status"] = proto::Ack::Status_Name (pb.status ());
  res["timestamp"] = TimeToJson (pb.timestamp ());
  if (pb.has_error ())
    res["error"] = ProtoToJson (pb.error ());
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Cancellation> (const proto::Cancellation& pb)
{
  Json::Value res(Json::objectValue);
  res["initiator"] = proto::Party_Name (pb.initiator ());
  if (pb.has_reason ())
    res["reason"] = pb.reason ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["within_window"] = pb.within_window ();
  res["buyer_penalty"] = pb.buyer_penalty ();
  res["seller_compensation"] = pb.seller_compensation ();
  res["seller_penalty"] = pb.seller_penalty ();
  res["buyer_refund"] = pb.buyer_refund ();
  res["trust_impact"] = pb.trust_impact ();
  res["cancelled_at"] = TimeToJson (pb.cancelled_at ());
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Order> (const proto::Order& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["transaction_id"] = pb.transaction_id ();
  res["buyer_id"] = pb.buyer_id ();
  res["provider_id"] = pb.provider_id ();
  res["offer_id"] = pb.offer_id ();
  res["item_id"] = pb.item_id ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["total_price"] = pb.total_price ();
  res["currency"] = pb.currency ();
  res["window"] = ProtoToJson (pb.window ());
  res["status"] = proto::Order::Status_Name (pb.status ());
  res["version"] = IntToJson (pb.version ());
  res["created_at"] = TimeToJson (pb.created_at ());
  res["updated_at"] = TimeToJson (pb.updated_at ());

  if (pb.has_cancellation ())
    res["cancellation"] = ProtoToJson (pb.cancellation ());

  if (pb.has_delivery ())
    {
      const auto& d = pb.delivery ();
      Json::Value delivery(Json::objectValue);
      delivery["delivered_quantity"] = IntToJson (d.delivered_quantity ());
      delivery["verified"] = d.verified ();
      delivery["trust_impact"] = d.trust_impact ();
      if (d.has_verified_at ())
        delivery["verified_at"] = TimeToJson (d.verified_at ());
      res["delivery"] = delivery;
    }

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Principal> (const proto::Principal& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["trust_score"] = pb.trust_score ();
  res["declared_capacity"] = pb.declared_capacity ();
  res["balance"] = pb.balance ();
  if (pb.has_provider_id ())
    res["provider_id"] = pb.provider_id ();
  return res;
}

template <>
  bool
  ProtoFromJson<proto::Principal> (const Json::Value& val,
                                   proto::Principal& pb)
{
  pb.Clear ();
  if (!val.isObject () || !val["id"].isString ())
    return false;

  pb.set_id (val["id"].asString ());
  return OptionalDouble (val, "declared_capacity", [&pb] (const double v)
           {
             pb.set_declared_capacity (v);
           })
      && OptionalDouble (val, "balance", [&pb] (const double v)
           {
             pb.set_balance (v);
           })
      && OptionalString (val, "provider_id", [&pb] (const std::string& v)
           {
             pb.set_provider_id (v);
           });
}

/* ************************************************************************** */

template <>
  bool
  ProtoFromJson<proto::DiscoverRequest> (const Json::Value& val,
                                         proto::DiscoverRequest& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  if (val.isMember ("source_type"))
    {
      proto::CatalogItem::SourceType type;
      if (!EnumFromJson (val["source_type"],
                         &proto::CatalogItem::SourceType_Parse, type))
        return false;
      pb.set_source_type (type);
    }

  if (val.isMember ("window")
        && !ProtoFromJson (val["window"], *pb.mutable_window ()))
    return false;

  return OptionalString (val, "filter_expression",
                         [&pb] (const std::string& v)
           {
             pb.set_filter_expression (v);
           })
      && OptionalInt (val, "quantity", [&pb] (const int64_t v)
           {
             pb.set_quantity (v);
           })
      && OptionalDouble (val, "max_price", [&pb] (const double v)
           {
             pb.set_max_price (v);
           });
}

template <>
  bool
  ProtoFromJson<proto::OrderRequest> (const Json::Value& val,
                                      proto::OrderRequest& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  return OptionalString (val, "offer_id", [&pb] (const std::string& v)
           {
             pb.set_offer_id (v);
           })
      && OptionalString (val, "item_id", [&pb] (const std::string& v)
           {
             pb.set_item_id (v);
           })
      && OptionalInt (val, "quantity", [&pb] (const int64_t v)
           {
             pb.set_quantity (v);
           })
      && OptionalString (val, "buyer_id", [&pb] (const std::string& v)
           {
             pb.set_buyer_id (v);
           });
}

template <>
  bool
  ProtoFromJson<proto::CancelRequest> (const Json::Value& val,
                                       proto::CancelRequest& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  if (val.isMember ("party"))
    {
      proto::Party party;
      if (!EnumFromJson (val["party"], &proto::Party_Parse, party))
        return false;
      pb.set_party (party);
    }

  return OptionalString (val, "order_id", [&pb] (const std::string& v)
           {
             pb.set_order_id (v);
           })
      && OptionalString (val, "reason", [&pb] (const std::string& v)
           {
             pb.set_reason (v);
           })
      && OptionalInt (val, "quantity", [&pb] (const int64_t v)
           {
             pb.set_quantity (v);
           });
}

template <>
  bool
  ProtoFromJson<proto::StatusRequest> (const Json::Value& val,
                                       proto::StatusRequest& pb)
{
  pb.Clear ();
  if (!val.isObject ())
    return false;

  return OptionalString (val, "order_id", [&pb] (const std::string& v)
    {
      pb.set_order_id (v);
    });
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::CallbackPayload> (const proto::CallbackPayload& pb)
{
  Json::Value res(Json::objectValue);

  if (pb.has_discover ())
    {
      res["catalog"] = ProtoToJson (pb.discover ().catalog ());
      res["match"] = ProtoToJson (pb.discover ().match ());
    }
  if (pb.has_quote ())
    res["quote"] = ProtoToJson (pb.quote ());
  if (pb.has_order ())
    res["order"] = ProtoToJson (pb.order ());
  if (pb.has_error ())
    res["error"] = ProtoToJson (pb.error ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Event> (const proto::Event& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["transaction_id"] = pb.transaction_id ();
  res["message_id"] = pb.message_id ();
  res["action"] = pb.action ();
  res["direction"] = proto::Event::Direction_Name (pb.direction ());
  res["payload"] = pb.payload ();
  res["created_at"] = TimeToJson (pb.created_at ());
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::TransactionStatus> (const proto::TransactionStatus& pb)
{
  Json::Value res(Json::objectValue);
  res["message_id"] = pb.message_id ();
  res["action"] = pb.action ();
  res["state"] = proto::TransactionStatus::State_Name (pb.state ());
  if (pb.has_error ())
    res["error"] = ProtoToJson (pb.error ());
  res["updated_at"] = TimeToJson (pb.updated_at ());
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::TrustInfo> (const proto::TrustInfo& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = pb.id ();
  res["trust_score"] = pb.trust_score ();
  res["tier"] = pb.tier ();
  res["allowed_limit"] = pb.allowed_limit ();
  if (pb.has_allowed_quantity ())
    res["allowed_quantity"] = pb.allowed_quantity ();

  if (pb.has_next_tier ())
    {
      Json::Value next(Json::objectValue);
      next["tier"] = pb.next_tier ();
      next["progress"] = pb.progress ();
      next["score_needed"] = pb.score_needed ();
      res["next"] = next;
    }

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::TransactionInfo> (const proto::TransactionInfo& pb)
{
  Json::Value events(Json::arrayValue);
  for (const auto& e : pb.events ())
    events.append (ProtoToJson (e));

  Json::Value states(Json::arrayValue);
  for (const auto& s : pb.states ())
    states.append (ProtoToJson (s));

  Json::Value res(Json::objectValue);
  res["transaction_id"] = pb.transaction_id ();
  res["events"] = events;
  res["states"] = states;
  if (pb.has_order ())
    res["order"] = ProtoToJson (pb.order ());

  return res;
}

} // namespace enertrade
