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

#include "testutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>
#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

DECLARE_int32 (callback_delay_ms);

namespace enertrade
{
namespace
{

/**
 * Test fixture with an RpcServer whose methods are called directly.  The
 * HTTP connector is never started.
 */
class RpcServerTests : public testing::Test
{

private:

  gflags::FlagSaver flagSaver;

protected:

  RecordingCallbacks callbacks;
  std::unique_ptr<Engine> engine;

  jsonrpc::HttpServer http;
  std::unique_ptr<RpcServer> server;

  RpcServerTests ()
    : http(GetPortForMockServer ())
  {
    FLAGS_callback_delay_ms = 0;
    engine = std::make_unique<Engine> (":memory:", callbacks);
    server = std::make_unique<RpcServer> (*engine, http);

    EXPECT_TRUE (server->syncprovider (ParseJson (R"({
      "id": "prov",
      "name": "Solar Farm",
      "trust_score": 0.8
    })")));
    EXPECT_TRUE (server->syncitem (ParseJson (R"({
      "id": "item",
      "provider_id": "prov",
      "source_type": "SOLAR"
    })")));

    auto offer = ParseJson (R"({
      "id": "offer",
      "item_id": "item",
      "provider_id": "prov",
      "price": {"value": 6, "currency": "INR"},
      "max_qty": 100
    })");
    Json::Value window(Json::objectValue);
    window["start"] = static_cast<Json::Int64> (TestNow () + 24 * 3'600);
    window["end"] = static_cast<Json::Int64> (TestNow () + 25 * 3'600);
    offer["window"] = window;
    server->syncoffer (offer, false);

    server->registerprincipal (ParseJson (R"({
      "id": "buyer",
      "declared_capacity": 100,
      "balance": 1000
    })"), 100);
  }

  static Json::Value
  Context (const std::string& action, const std::string& msgId)
  {
    Json::Value res(Json::objectValue);
    res["transaction_id"] = "tx";
    res["message_id"] = msgId;
    res["action"] = action;
    res["bap_id"] = "bap";
    res["bap_uri"] = "http://bap.example";
    return res;
  }

  /**
   * Confirms an order for the given quantity through the protocol method
   * and returns its ID.
   */
  std::string
  Confirm (const int64_t qty)
  {
    Json::Value msg(Json::objectValue);
    msg["offer_id"] = "offer";
    msg["quantity"] = static_cast<Json::Int64> (qty);
    msg["buyer_id"] = "buyer";

    const auto res = server->confirm (Context ("confirm", "conf"), msg);
    CHECK_EQ (res["ack"]["ack_status"].asString (), "ACK") << res;
    engine->WaitIdle ();

    const auto tx = server->gettransaction ("tx");
    CHECK (tx.isMember ("order")) << tx;
    return tx["order"]["id"].asString ();
  }

  /**
   * Expects that the given call throws a JSON-RPC error with the given
   * numeric code.  Returns the error's data.
   */
  template <typename Fcn>
    static Json::Value
    ExpectRpcError (const Fcn& call, const int code)
  {
    try
      {
        call ();
        ADD_FAILURE () << "Expected JSON-RPC error was not thrown";
      }
    catch (const jsonrpc::JsonRpcException& exc)
      {
        EXPECT_EQ (exc.GetCode (), code) << exc.GetMessage ();
        return exc.GetData ();
      }

    return Json::Value ();
  }

};

TEST_F (RpcServerTests, GetStatus)
{
  EXPECT_EQ (server->getstatus ()["pending_messages"].asInt (), 0);
}

TEST_F (RpcServerTests, CatalogMethods)
{
  const auto catalog = server->getcatalog ();
  ASSERT_EQ (catalog["providers"].size (), 1);
  EXPECT_EQ (catalog["providers"][0]["name"], "Solar Farm");

  const auto& items = catalog["providers"][0]["items"];
  ASSERT_EQ (items.size (), 1);
  ASSERT_EQ (items[0]["offers"].size (), 1);
  EXPECT_EQ (items[0]["offers"][0]["id"], "offer");

  Json::Value update(Json::objectValue);
  update["offer_id"] = "offer";
  update["block_ids"].append ("offer:1");
  update["status"] = "RESERVED";
  update["order_id"] = "external";
  const auto counts = server->updateblocks (update);
  EXPECT_EQ (counts["available"].asInt (), 99);
  EXPECT_EQ (counts["reserved"].asInt (), 1);

  const auto data = ExpectRpcError ([this] ()
    {
      server->deleteoffer ("offer");
    }, -32'011);
  EXPECT_EQ (data["code"], "OFFER_IN_USE");
}

TEST_F (RpcServerTests, InvalidParams)
{
  ExpectRpcError ([this] ()
    {
      server->syncprovider (ParseJson (R"({"name": "no id"})"));
    }, jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS);

  ExpectRpcError ([this] ()
    {
      server->updateblocks (ParseJson (R"({"offer_id": "offer"})"));
    }, jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS);

  ExpectRpcError ([this] ()
    {
      server->advanceorder ("", "order", "SHIPPED");
    }, jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS);

  ExpectRpcError ([this] ()
    {
      server->cancelorder ("", ParseJson (R"({"party": "nobody"})"));
    }, jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS);
}

TEST_F (RpcServerTests, EngineErrors)
{
  auto data = ExpectRpcError ([this] ()
    {
      server->deleteoffer ("unknown");
    }, -32'007);
  EXPECT_EQ (data["code"], "NOT_FOUND");
  EXPECT_EQ (data["message"], "unknown offer unknown");

  data = ExpectRpcError ([this] ()
    {
      server->getorder ("unknown");
    }, -32'007);
  EXPECT_EQ (data["code"], "NOT_FOUND");

  data = ExpectRpcError ([this] ()
    {
      server->syncitem (ParseJson (R"({
        "id": "other",
        "provider_id": "missing",
        "source_type": "WIND"
      })"));
    }, -32'007);
  EXPECT_EQ (data["code"], "NOT_FOUND");
}

TEST_F (RpcServerTests, ProtocolAck)
{
  const auto ctx = Context ("discover", "msg");
  const auto res = server->discover (ctx, Json::Value (Json::objectValue));
  EXPECT_EQ (res["context"], ctx);
  EXPECT_EQ (res["ack"]["ack_status"], "ACK");
  EXPECT_FALSE (res["ack"].isMember ("error"));

  engine->WaitIdle ();
  const auto calls = callbacks.GetCalls ("discover");
  ASSERT_EQ (calls.size (), 1);
  EXPECT_EQ (calls[0].message["match"]["offers"].size (), 1);

  /* The raw request is what ends up in the event log.  */
  const auto tx = server->gettransaction ("tx");
  ASSERT_EQ (tx["events"].size (), 2);
  const auto raw = ParseJson (tx["events"][0]["payload"].asString ());
  EXPECT_EQ (raw["context"], ctx);
  EXPECT_EQ (raw["message"], Json::Value (Json::objectValue));
}

TEST_F (RpcServerTests, ProtocolNack)
{
  auto res = server->select (Context ("select", "msg"),
                             ParseJson (R"({"quantity": "five"})"));
  EXPECT_EQ (res["ack"]["ack_status"], "NACK");
  EXPECT_EQ (res["ack"]["error"]["code"], "VALIDATION");

  res = server->select (Context ("select", "msg"),
                        ParseJson (R"({"offer_id": "offer", "quantity": 500})"));
  EXPECT_EQ (res["ack"]["ack_status"], "NACK");
  EXPECT_EQ (res["ack"]["error"]["code"], "INSUFFICIENT_AVAILABLE");

  res = server->status (Context ("cancel", "msg"),
                        Json::Value (Json::objectValue));
  EXPECT_EQ (res["ack"]["ack_status"], "NACK");

  auto ctx = Context ("status", "msg");
  ctx["timestamp"] = "not a time";
  res = server->status (ctx, Json::Value (Json::objectValue));
  EXPECT_EQ (res["ack"]["ack_status"], "NACK");
  EXPECT_EQ (res["context"], ctx);

  engine->WaitIdle ();
  EXPECT_THAT (callbacks.GetCalls (), testing::IsEmpty ());
}

TEST_F (RpcServerTests, OrderLifecycle)
{
  const auto id = Confirm (10);

  auto order = server->getorder (id);
  EXPECT_EQ (order["status"], "ACTIVE");
  EXPECT_EQ (order["quantity"].asInt (), 10);

  order = server->advanceorder ("a", id, "DELIVERING");
  EXPECT_EQ (order["status"], "DELIVERING");
  EXPECT_EQ (server->advanceorder ("a", id, "DELIVERING"), order);

  const auto data = ExpectRpcError ([this, &id] ()
    {
      server->advanceorder ("", id, "ACTIVE");
    }, -32'004);
  EXPECT_EQ (data["code"], "INVALID_TRANSITION");
  EXPECT_EQ (data["current_state"], "DELIVERING");
  EXPECT_EQ (data["attempted_state"], "ACTIVE");

  server->advanceorder ("", id, "DELIVERED");
  server->advanceorder ("", id, "COMPLETED");

  order = server->verifydelivery (8, "v", id);
  EXPECT_EQ (order["delivery"]["delivered_quantity"].asInt (), 8);
  EXPECT_EQ (server->verifydelivery (8, "v", id), order);

  const auto trust = server->gettrustinfo ("prov");
  EXPECT_LT (trust["trust_score"].asDouble (), 0.8);
}

TEST_F (RpcServerTests, CancelOrder)
{
  const auto id = Confirm (10);

  Json::Value req(Json::objectValue);
  req["order_id"] = id;
  req["reason"] = "not needed";
  const auto order = server->cancelorder ("c", req);
  EXPECT_EQ (order["status"], "CANCELLED");
  EXPECT_EQ (order["cancellation"]["initiator"], "BUYER");

  const auto data = ExpectRpcError ([this, &req] ()
    {
      server->cancelorder ("", req);
    }, -32'004);
  EXPECT_EQ (data["code"], "INVALID_TRANSITION");
}

TEST_F (RpcServerTests, TrustInfo)
{
  const auto info = server->gettrustinfo ("buyer");
  EXPECT_EQ (info["id"], "buyer");
  EXPECT_EQ (info["tier"], "Starter (20% Trading)");
  EXPECT_EQ (info["next"]["tier"], "Bronze");

  const auto data = ExpectRpcError ([this] ()
    {
      server->gettrustinfo ("nobody");
    }, -32'007);
  EXPECT_EQ (data["code"], "NOT_FOUND");
}

TEST_F (RpcServerTests, RegisterPrincipal)
{
  const auto res = server->registerprincipal (ParseJson (R"({
    "id": "seller",
    "declared_capacity": 50,
    "provider_id": "prov"
  })"), 50);
  EXPECT_EQ (res["id"], "seller");
  EXPECT_EQ (res["provider_id"], "prov");
  EXPECT_TRUE (res.isMember ("trust_score"));

  ExpectRpcError ([this] ()
    {
      server->registerprincipal (ParseJson (R"({"balance": 5})"), 0);
    }, jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS);
}

} // anonymous namespace
} // namespace enertrade
