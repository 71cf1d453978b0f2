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

#include "rpcserver.hpp"

#include "json.hpp"
#include "private/database.hpp"
#include "proto/catalog.pb.h"
#include "proto/orders.pb.h"
#include "proto/protocol.pb.h"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <ctime>

namespace enertrade
{

namespace
{

/** Base for the JSON-RPC error codes of engine errors.  */
constexpr int ENGINE_ERROR_BASE = -32'000;

/**
 * Throws the JSON-RPC exception corresponding to an engine error.
 */
[[noreturn]] void
ThrowError (const proto::Error& err)
{
  LOG (WARNING)
      << "RPC call failed: " << proto::Error::Code_Name (err.code ()) << " "
      << err.message ();
  throw jsonrpc::JsonRpcException (ENGINE_ERROR_BASE - err.code (),
                                   err.message (), ProtoToJson (err));
}

[[noreturn]] void
ThrowInvalidParams (const std::string& msg)
{
  throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                   msg);
}

/**
 * Runs an engine call and turns storage failures into JSON-RPC errors,
 * which the server reports to the caller.
 */
template <typename Fcn>
  auto
  Guarded (const Fcn& f) -> decltype (f ())
{
  try
    {
      return f ();
    }
  catch (const DatabaseError& exc)
    {
      LOG (ERROR) << "Database failure in RPC call: " << exc.what ();
      proto::Error err;
      err.set_code (proto::Error::INTERNAL);
      err.set_message (exc.what ());
      ThrowError (err);
    }
}

/**
 * Returns the JSON result for an order operation, or throws its error.
 */
Json::Value
OrderResultToJson (const proto::OrderResult& res)
{
  if (!res.success ())
    ThrowError (res.error ());
  return ProtoToJson (res.order ());
}

Json::Value
AckResponse (const Json::Value& context, const proto::Ack& ack)
{
  Json::Value res(Json::objectValue);
  res["context"] = context;
  res["ack"] = ProtoToJson (ack);
  return res;
}

} // anonymous namespace

void
RpcServer::Run ()
{
  std::unique_lock<std::mutex> lock(mutStop);
  shouldStop = false;

  StartListening ();

  while (!shouldStop)
    cvStop.wait (lock);

  StopListening ();
}

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";

  std::lock_guard<std::mutex> lock(mutStop);
  shouldStop = true;
  cvStop.notify_all ();
}

Json::Value
RpcServer::getstatus ()
{
  LOG (INFO) << "RPC method called: getstatus";

  Json::Value res(Json::objectValue);
  res["pending_messages"]
      = static_cast<Json::UInt64> (engine.GetPendingMessages ());

  return res;
}

/* ************************************************************************** */

Json::Value
RpcServer::HandleProtocol (const std::string& action,
                           const Json::Value& context,
                           const Json::Value& message)
{
  LOG (INFO) << "RPC method called: " << action;
  VLOG (1) << "Context:\n" << context << "\nMessage:\n" << message;

  proto::InboundMessage msg;

  Json::Value raw(Json::objectValue);
  raw["context"] = context;
  raw["message"] = message;
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  msg.set_raw_json (Json::writeString (builder, raw));

  bool valid = ProtoFromJson (context, *msg.mutable_context ());
  if (valid)
    {
      if (action == "discover")
        valid = ProtoFromJson (message, *msg.mutable_discover ());
      else if (action == "select")
        valid = ProtoFromJson (message, *msg.mutable_select ());
      else if (action == "init")
        valid = ProtoFromJson (message, *msg.mutable_init ());
      else if (action == "confirm")
        valid = ProtoFromJson (message, *msg.mutable_confirm ());
      else if (action == "cancel")
        valid = ProtoFromJson (message, *msg.mutable_cancel ());
      else if (action == "status")
        valid = ProtoFromJson (message, *msg.mutable_status ());
      else
        LOG (FATAL) << "Unexpected protocol action: " << action;
    }

  if (!valid)
    {
      LOG (WARNING) << "Malformed " << action << " message";
      proto::Ack ack;
      ack.set_status (proto::Ack::NACK);
      ack.set_timestamp (std::time (nullptr));
      ack.mutable_error ()->set_code (proto::Error::VALIDATION);
      ack.mutable_error ()->set_message ("malformed " + action + " message");
      return AckResponse (context, ack);
    }

  return Guarded ([&] ()
    {
      return AckResponse (context, engine.HandleMessage (msg));
    });
}

Json::Value
RpcServer::discover (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("discover", context, message);
}

Json::Value
RpcServer::select (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("select", context, message);
}

Json::Value
RpcServer::init (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("init", context, message);
}

Json::Value
RpcServer::confirm (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("confirm", context, message);
}

Json::Value
RpcServer::cancel (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("cancel", context, message);
}

Json::Value
RpcServer::status (const Json::Value& context, const Json::Value& message)
{
  return HandleProtocol ("status", context, message);
}

/* ************************************************************************** */

bool
RpcServer::syncprovider (const Json::Value& provider)
{
  LOG (INFO) << "RPC method called: syncprovider\n" << provider;

  proto::Provider p;
  if (!ProtoFromJson (provider, p))
    ThrowInvalidParams ("invalid provider");

  proto::Error err;
  if (!Guarded ([&] () { return engine.SyncProvider (p, err); }))
    ThrowError (err);

  return true;
}

bool
RpcServer::syncitem (const Json::Value& item)
{
  LOG (INFO) << "RPC method called: syncitem\n" << item;

  proto::CatalogItem i;
  if (!ProtoFromJson (item, i))
    ThrowInvalidParams ("invalid catalog item");

  proto::Error err;
  if (!Guarded ([&] () { return engine.SyncItem (i, err); }))
    ThrowError (err);

  return true;
}

Json::Value
RpcServer::syncoffer (const Json::Value& offer, const bool resync)
{
  LOG (INFO) << "RPC method called: syncoffer (resync: " << resync << ")\n"
             << offer;

  proto::Offer o;
  if (!ProtoFromJson (offer, o))
    ThrowInvalidParams ("invalid offer");

  proto::BlockCounts counts;
  proto::Error err;
  if (!Guarded ([&] () { return engine.SyncOffer (o, resync, counts, err); }))
    ThrowError (err);

  return ProtoToJson (counts);
}

bool
RpcServer::deleteoffer (const std::string& id)
{
  LOG (INFO) << "RPC method called: deleteoffer " << id;

  proto::Error err;
  if (!Guarded ([&] () { return engine.DeleteOffer (id, err); }))
    ThrowError (err);

  return true;
}

Json::Value
RpcServer::updateblocks (const Json::Value& update)
{
  LOG (INFO) << "RPC method called: updateblocks\n" << update;

  proto::BlockUpdate u;
  if (!ProtoFromJson (update, u))
    ThrowInvalidParams ("invalid block update");

  proto::BlockCounts counts;
  proto::Error err;
  if (!Guarded ([&] () { return engine.UpdateBlocks (u, counts, err); }))
    ThrowError (err);

  return ProtoToJson (counts);
}

/* ************************************************************************** */

Json::Value
RpcServer::getcatalog ()
{
  LOG (INFO) << "RPC method called: getcatalog";
  return ProtoToJson (Guarded ([&] () { return engine.GetCatalog (); }));
}

Json::Value
RpcServer::gettransaction (const std::string& id)
{
  LOG (INFO) << "RPC method called: gettransaction " << id;
  return ProtoToJson (Guarded ([&] () { return engine.GetTransaction (id); }));
}

Json::Value
RpcServer::getorder (const std::string& id)
{
  LOG (INFO) << "RPC method called: getorder " << id;

  proto::Order order;
  if (!Guarded ([&] () { return engine.GetOrder (id, order); }))
    {
      proto::Error err;
      err.set_code (proto::Error::NOT_FOUND);
      err.set_message ("unknown order " + id);
      ThrowError (err);
    }

  return ProtoToJson (order);
}

Json::Value
RpcServer::gettrustinfo (const std::string& principal)
{
  LOG (INFO) << "RPC method called: gettrustinfo " << principal;

  proto::TrustInfo info;
  proto::Error err;
  if (!Guarded ([&] () { return engine.GetTrustInfo (principal, info, err); }))
    ThrowError (err);

  return ProtoToJson (info);
}

/* ************************************************************************** */

Json::Value
RpcServer::registerprincipal (const Json::Value& principal,
                              const double verifiedCapacity)
{
  LOG (INFO)
      << "RPC method called: registerprincipal (verified capacity: "
      << verifiedCapacity << ")\n" << principal;

  proto::Principal p;
  if (!ProtoFromJson (principal, p))
    ThrowInvalidParams ("invalid principal");

  proto::Principal out;
  proto::Error err;
  if (!Guarded ([&] ()
        {
          return engine.RegisterPrincipal (p, verifiedCapacity, out, err);
        }))
    ThrowError (err);

  return ProtoToJson (out);
}

Json::Value
RpcServer::advanceorder (const std::string& idempotencyKey,
                         const std::string& orderId,
                         const std::string& status)
{
  LOG (INFO)
      << "RPC method called: advanceorder " << orderId << " to " << status;

  proto::Order::Status s;
  if (!proto::Order::Status_Parse (status, &s))
    ThrowInvalidParams ("invalid order status: " + status);

  return OrderResultToJson (Guarded ([&] ()
    {
      return engine.AdvanceOrder (idempotencyKey, orderId, s);
    }));
}

Json::Value
RpcServer::cancelorder (const std::string& idempotencyKey,
                        const Json::Value& request)
{
  LOG (INFO) << "RPC method called: cancelorder\n" << request;

  proto::CancelRequest req;
  if (!ProtoFromJson (request, req))
    ThrowInvalidParams ("invalid cancel request");

  return OrderResultToJson (Guarded ([&] ()
    {
      return engine.CancelOrder (idempotencyKey, req);
    }));
}

Json::Value
RpcServer::verifydelivery (const int delivered,
                           const std::string& idempotencyKey,
                           const std::string& orderId)
{
  LOG (INFO)
      << "RPC method called: verifydelivery " << orderId << " with "
      << delivered << " delivered";

  return OrderResultToJson (Guarded ([&] ()
    {
      return engine.VerifyDelivery (idempotencyKey, orderId, delivered);
    }));
}

} // namespace enertrade
