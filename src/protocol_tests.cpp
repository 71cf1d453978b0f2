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

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace enertrade
{
namespace
{

using testing::IsEmpty;

class ProtocolTests : public testing::Test
{

protected:

  Database db;
  BlockLedger ledger;
  Catalog catalog;
  SqlitePrincipals principals;
  MatchingEngine matching;
  OrderManager orders;
  EventLog log;
  MemoryCache cache;
  Deduplicator dedup;
  TaskQueue tasks;
  RecordingCallbacks callbacks;

  ProtocolDriver driver;

  proto::Error err;

  ProtocolTests ()
    : db(":memory:"), ledger(db, 3), catalog(db, ledger, 0.3),
      principals(db, TrustConfig ()),
      matching(MatchingConfig ()),
      orders(db, ledger, catalog, principals, OrderConfig ()),
      log(db), dedup(cache, log), tasks(1),
      driver(ProtocolComponents {catalog, ledger, matching, orders,
                                 principals, dedup, log, tasks, callbacks},
             TrustConfig (), std::chrono::milliseconds (0))
  {
    CHECK (catalog.SyncProvider (TestProvider ("prov"), err));
    CHECK (catalog.SyncItem (TestItem ("item", "prov"), err));
    CHECK (catalog.SyncOffer (TestOffer ("offer", "item", "prov", 6, 100),
                              false, err));

    CHECK (catalog.SyncProvider (TestProvider ("wind"), err));
    CHECK (catalog.SyncItem (TestItem ("turbine", "wind",
                                       proto::CatalogItem::WIND),
                             err));
    CHECK (catalog.SyncOffer (TestOffer ("gust", "turbine", "wind", 5, 10),
                              false, err));

    /* With trust 0.32, the buyer is in the 20% tier and may trade
       20 of the 100 declared blocks.  */
    proto::Principal buyer;
    buyer.set_id ("buyer");
    buyer.set_declared_capacity (100);
    buyer.set_balance (1'000);
    proto::Principal out;
    CHECK (principals.Register (buyer, 100, out, err));
  }

  /**
   * Builds a message with a complete context for the given action.
   */
  static proto::InboundMessage
  Message (const std::string& action, const std::string& msgId,
           const std::string& tx = "tx")
  {
    proto::InboundMessage res;
    auto* ctx = res.mutable_context ();
    ctx->set_transaction_id (tx);
    ctx->set_message_id (msgId);
    ctx->set_action (action);
    ctx->set_bap_id ("bap");
    ctx->set_bap_uri ("http://bap.example");
    ctx->set_bpp_id ("bpp");
    return res;
  }

  static proto::InboundMessage
  OrderMessage (const std::string& action, const std::string& msgId,
                const int64_t qty, const std::string& tx = "tx")
  {
    auto res = Message (action, msgId, tx);

    proto::OrderRequest* req;
    if (action == "select")
      req = res.mutable_select ();
    else if (action == "init")
      req = res.mutable_init ();
    else
      {
        CHECK_EQ (action, "confirm");
        req = res.mutable_confirm ();
      }

    req->set_offer_id ("offer");
    req->set_quantity (qty);
    req->set_buyer_id ("buyer");

    return res;
  }

  /**
   * Handles a message, expects it to be acknowledged and waits for the
   * processing to finish.
   */
  void
  ExpectAck (const proto::InboundMessage& msg)
  {
    const auto ack = driver.Handle (msg);
    ASSERT_EQ (ack.status (), proto::Ack::ACK) << ack.DebugString ();
    EXPECT_FALSE (ack.has_error ());
    tasks.WaitIdle ();
  }

  /**
   * Handles a message and expects a NACK with the given code.
   */
  void
  ExpectNack (const proto::InboundMessage& msg,
              const proto::Error::Code code)
  {
    const auto ack = driver.Handle (msg);
    ASSERT_EQ (ack.status (), proto::Ack::NACK);
    EXPECT_EQ (ack.error ().code (), code) << ack.DebugString ();
    tasks.WaitIdle ();
  }

  /**
   * Returns the recorded state of a given message.
   */
  proto::TransactionStatus
  StateOf (const std::string& msgId, const std::string& tx = "tx")
  {
    for (const auto& s : driver.GetStatus (tx))
      if (s.message_id () == msgId)
        return s;

    LOG (FATAL) << "No state for message " << msgId;
    return proto::TransactionStatus ();
  }

  /**
   * Returns the single callback recorded for an action.
   */
  RecordingCallbacks::Call
  SingleCall (const std::string& action)
  {
    const auto calls = callbacks.GetCalls (action);
    CHECK_EQ (calls.size (), 1) << "callbacks for " << action;
    return calls[0];
  }

};

/* ************************************************************************** */

using ProtocolValidationTests = ProtocolTests;

TEST_F (ProtocolValidationTests, MissingContextFields)
{
  for (const std::string field : {"transaction_id", "message_id", "action",
                                  "bap_id", "bap_uri"})
    {
      auto msg = Message ("status", "msg");
      msg.mutable_status ();
      auto* ctx = msg.mutable_context ();
      const auto* desc = ctx->GetDescriptor ()->FindFieldByName (field);
      CHECK (desc != nullptr);
      ctx->GetReflection ()->ClearField (ctx, desc);

      ExpectNack (msg, proto::Error::VALIDATION);
    }

  EXPECT_THAT (driver.GetEvents ("tx"), IsEmpty ());
  EXPECT_THAT (callbacks.GetCalls (), IsEmpty ());
}

TEST_F (ProtocolValidationTests, PayloadAndAction)
{
  ExpectNack (Message ("status", "msg"), proto::Error::VALIDATION);

  auto msg = Message ("cancel", "msg");
  msg.mutable_status ();
  ExpectNack (msg, proto::Error::VALIDATION);

  EXPECT_THAT (driver.GetEvents ("tx"), IsEmpty ());
}

TEST_F (ProtocolValidationTests, OrderRequests)
{
  auto msg = OrderMessage ("select", "msg", 5);
  msg.mutable_select ()->clear_offer_id ();
  ExpectNack (msg, proto::Error::VALIDATION);

  ExpectNack (OrderMessage ("init", "msg", 0), proto::Error::VALIDATION);

  msg = OrderMessage ("confirm", "msg", 5);
  msg.mutable_confirm ()->clear_buyer_id ();
  ExpectNack (msg, proto::Error::VALIDATION);

  msg = Message ("cancel", "msg");
  msg.mutable_cancel ()->set_quantity (-1);
  ExpectNack (msg, proto::Error::VALIDATION);
}

TEST_F (ProtocolValidationTests, SelectChecksCatalog)
{
  auto msg = OrderMessage ("select", "msg", 5);
  msg.mutable_select ()->set_offer_id ("unknown");
  ExpectNack (msg, proto::Error::NOT_FOUND);

  ExpectNack (OrderMessage ("select", "msg", 101),
              proto::Error::INSUFFICIENT_AVAILABLE);

  msg = OrderMessage ("select", "msg", 5);
  msg.mutable_select ()->set_item_id ("turbine");
  ExpectNack (msg, proto::Error::VALIDATION);

  EXPECT_THAT (driver.GetEvents ("tx"), IsEmpty ());
}

TEST_F (ProtocolValidationTests, SelectWithinItemQuantity)
{
  auto item = TestItem ("item", "prov");
  item.set_available_qty (3);
  ASSERT_TRUE (catalog.SyncItem (item, err));

  ExpectNack (OrderMessage ("select", "msg", 5),
              proto::Error::INSUFFICIENT_AVAILABLE);
  ExpectAck (OrderMessage ("select", "msg", 3));
}

/* ************************************************************************** */

using ProtocolDedupTests = ProtocolTests;

TEST_F (ProtocolDedupTests, DuplicateMessage)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ();

  ExpectAck (msg);
  ExpectAck (msg);

  const auto events = driver.GetEvents ("tx");
  ASSERT_EQ (events.size (), 2);
  EXPECT_EQ (events[0].direction (), proto::Event::INBOUND);
  EXPECT_EQ (events[0].message_id (), "msg");
  EXPECT_EQ (events[0].action (), "discover");
  EXPECT_EQ (events[1].direction (), proto::Event::OUTBOUND);
  EXPECT_EQ (events[1].action (), "on_discover");
  EXPECT_NE (events[1].message_id (), "msg");

  EXPECT_EQ (callbacks.GetCalls ().size (), 1);
  EXPECT_EQ (StateOf ("msg").state (), proto::TransactionStatus::CALLBACK_SENT);
}

TEST_F (ProtocolDedupTests, RedeliveredSelectAfterSellOut)
{
  const auto msg = OrderMessage ("select", "msg", 5);
  ExpectAck (msg);

  std::vector<std::string> claimed;
  ASSERT_TRUE (ledger.Claim ("offer", 100, "external", "other tx", claimed,
                             err));
  ExpectNack (OrderMessage ("select", "fresh", 5),
              proto::Error::INSUFFICIENT_AVAILABLE);

  ExpectAck (msg);
  EXPECT_EQ (callbacks.GetCalls ("select").size (), 1);
  EXPECT_EQ (StateOf ("msg").state (), proto::TransactionStatus::CALLBACK_SENT);
}

TEST_F (ProtocolDedupTests, DuplicateStateIsRecorded)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ();
  ExpectAck (msg);

  msg.mutable_context ()->set_transaction_id ("redelivered");
  ExpectAck (msg);
  EXPECT_EQ (callbacks.GetCalls ().size (), 1);

  const auto dup = StateOf ("msg", "redelivered");
  EXPECT_EQ (dup.state (), proto::TransactionStatus::DUPLICATE);
  EXPECT_EQ (dup.error ().code (), proto::Error::DUPLICATE_MESSAGE);
  EXPECT_THAT (driver.GetEvents ("redelivered"), IsEmpty ());

  /* The original message keeps its state.  */
  EXPECT_EQ (StateOf ("msg").state (), proto::TransactionStatus::CALLBACK_SENT);
  EXPECT_FALSE (StateOf ("msg").has_error ());
}

TEST_F (ProtocolDedupTests, RawJsonIsLogged)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ();
  msg.set_raw_json ("{\"raw\": true}");

  ExpectAck (msg);

  const auto events = driver.GetEvents ("tx");
  ASSERT_GE (events.size (), 1);
  EXPECT_EQ (events[0].payload (), "{\"raw\": true}");
}

/* ************************************************************************** */

using ProtocolDiscoverTests = ProtocolTests;

TEST_F (ProtocolDiscoverTests, AllOffers)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ();
  ExpectAck (msg);

  const auto call = SingleCall ("discover");
  EXPECT_EQ (call.baseUri, "http://bap.example");
  EXPECT_EQ (call.context["action"], "on_discover");
  EXPECT_EQ (call.context["transaction_id"], "tx");
  EXPECT_EQ (call.context["bap_id"], "bap");
  EXPECT_TRUE (call.context.isMember ("timestamp"));

  const auto& match = call.message["match"];
  EXPECT_EQ (match["eligible_count"].asInt (), 2);
  ASSERT_EQ (match["offers"].size (), 2);
  EXPECT_EQ (match["selected_offer_id"], match["offers"][0]["offer"]["id"]);

  EXPECT_EQ (call.message["catalog"]["providers"].size (), 2);
}

TEST_F (ProtocolDiscoverTests, FilterExpression)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ()->set_filter_expression ("sourceType = 'WIND'");
  ExpectAck (msg);

  const auto call = SingleCall ("discover");
  const auto& offers = call.message["match"]["offers"];
  ASSERT_EQ (offers.size (), 1);
  EXPECT_EQ (offers[0]["offer"]["id"], "gust");
  EXPECT_EQ (offers[0]["source_type"], "WIND");

  const auto& providers = call.message["catalog"]["providers"];
  ASSERT_EQ (providers.size (), 1);
  EXPECT_EQ (providers[0]["id"], "wind");
  ASSERT_EQ (providers[0]["items"].size (), 1);
  EXPECT_EQ (providers[0]["items"][0]["offers"].size (), 1);
}

TEST_F (ProtocolDiscoverTests, QuantityRequiresAvailability)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ()->set_quantity (50);
  ExpectAck (msg);

  const auto call = SingleCall ("discover");
  const auto& offers = call.message["match"]["offers"];
  ASSERT_EQ (offers.size (), 1);
  EXPECT_EQ (offers[0]["offer"]["id"], "offer");
}

TEST_F (ProtocolDiscoverTests, NoMatch)
{
  auto msg = Message ("discover", "msg");
  msg.mutable_discover ()->set_filter_expression ("sourceType = 'HYDRO'");
  ExpectAck (msg);

  const auto call = SingleCall ("discover");
  EXPECT_EQ (call.message["match"]["eligible_count"].asInt (), 0);
  EXPECT_FALSE (call.message["match"].isMember ("selected_offer_id"));
  EXPECT_EQ (call.message["catalog"]["providers"].size (), 0);
  EXPECT_EQ (StateOf ("msg").state (), proto::TransactionStatus::CALLBACK_SENT);
}

TEST_F (ProtocolDiscoverTests, InvalidWindow)
{
  auto msg = Message ("discover", "msg");
  auto* w = msg.mutable_discover ()->mutable_window ();
  w->set_start (TestNow () + 100);
  w->set_end (TestNow ());
  ExpectAck (msg);

  const auto call = SingleCall ("discover");
  EXPECT_EQ (call.message["error"]["code"], "VALIDATION");

  const auto state = StateOf ("msg");
  EXPECT_EQ (state.state (), proto::TransactionStatus::FAILED);
  EXPECT_EQ (state.error ().code (), proto::Error::VALIDATION);
}

/* ************************************************************************** */

using ProtocolFlowTests = ProtocolTests;

TEST_F (ProtocolFlowTests, SelectInitConfirm)
{
  ExpectAck (OrderMessage ("select", "sel", 5));
  const auto quote = SingleCall ("select").message["quote"];
  EXPECT_EQ (quote["offer_id"], "offer");
  EXPECT_EQ (quote["item_id"], "item");
  EXPECT_EQ (quote["provider_id"], "prov");
  EXPECT_EQ (quote["quantity"].asInt (), 5);
  EXPECT_DOUBLE_EQ (quote["total_price"].asDouble (), 30);
  EXPECT_EQ (quote["available_blocks"].asInt (), 100);

  ExpectAck (OrderMessage ("init", "init", 5));
  const auto draft = SingleCall ("init").message["order"];
  EXPECT_EQ (draft["status"], "DRAFT");
  EXPECT_EQ (draft["buyer_id"], "buyer");
  EXPECT_DOUBLE_EQ (draft["total_price"].asDouble (), 30);
  EXPECT_EQ (ledger.CountByStatus ("offer").available (), 100);

  ExpectAck (OrderMessage ("confirm", "conf", 5));
  const auto order = SingleCall ("confirm").message["order"];
  EXPECT_EQ (order["status"], "ACTIVE");
  EXPECT_EQ (order["transaction_id"], "tx");
  EXPECT_EQ (order["quantity"].asInt (), 5);
  EXPECT_THAT (ledger.CountByStatus ("offer"),
               EqualsBlockCounts ("available: 95 reserved: 5 sold: 0"));

  for (const std::string id : {"sel", "init", "conf"})
    EXPECT_EQ (StateOf (id).state (),
               proto::TransactionStatus::CALLBACK_SENT);

  EXPECT_EQ (driver.GetEvents ("tx").size (), 6);
}

TEST_F (ProtocolFlowTests, ConfirmIsIdempotentPerTransaction)
{
  ExpectAck (OrderMessage ("confirm", "first", 5));
  ExpectAck (OrderMessage ("confirm", "second", 5));

  const auto calls = callbacks.GetCalls ("confirm");
  ASSERT_EQ (calls.size (), 2);
  EXPECT_EQ (calls[0].message["order"]["id"],
             calls[1].message["order"]["id"]);

  EXPECT_THAT (ledger.CountByStatus ("offer"),
               EqualsBlockCounts ("available: 95 reserved: 5 sold: 0"));
}

TEST_F (ProtocolFlowTests, StatusAndCancel)
{
  ExpectAck (OrderMessage ("confirm", "conf", 5));
  const std::string orderId
      = SingleCall ("confirm").message["order"]["id"].asString ();

  auto msg = Message ("status", "stat");
  msg.mutable_status ();
  ExpectAck (msg);
  EXPECT_EQ (SingleCall ("status").message["order"]["id"], orderId);

  msg = Message ("status", "stat2", "other tx");
  msg.mutable_status ()->set_order_id (orderId);
  ExpectAck (msg);
  EXPECT_EQ (callbacks.GetCalls ("status").size (), 2);

  msg = Message ("cancel", "cancel");
  msg.mutable_cancel ()->set_reason ("changed plans");
  ExpectAck (msg);

  const auto order = SingleCall ("cancel").message["order"];
  EXPECT_EQ (order["status"], "CANCELLED");
  EXPECT_EQ (order["cancellation"]["initiator"], "BUYER");
  EXPECT_EQ (order["cancellation"]["reason"], "changed plans");
  EXPECT_FALSE (order["cancellation"]["within_window"].asBool ());
  EXPECT_DOUBLE_EQ (order["cancellation"]["buyer_refund"].asDouble (), 30);

  EXPECT_THAT (ledger.CountByStatus ("offer"),
               EqualsBlockCounts ("available: 100 reserved: 0 sold: 0"));
}

TEST_F (ProtocolFlowTests, PartialSellerCancel)
{
  ExpectAck (OrderMessage ("confirm", "conf", 10));

  auto msg = Message ("cancel", "cancel");
  msg.mutable_cancel ()->set_party (proto::SELLER);
  msg.mutable_cancel ()->set_quantity (4);
  ExpectAck (msg);

  const auto order = SingleCall ("cancel").message["order"];
  EXPECT_EQ (order["status"], "ACTIVE");
  EXPECT_EQ (order["quantity"].asInt (), 6);
  EXPECT_EQ (order["cancellation"]["initiator"], "SELLER");

  EXPECT_THAT (ledger.CountByStatus ("offer"),
               EqualsBlockCounts ("available: 94 reserved: 6 sold: 0"));
}

TEST_F (ProtocolFlowTests, StatusWithoutOrder)
{
  auto msg = Message ("status", "stat");
  msg.mutable_status ();
  ExpectAck (msg);

  EXPECT_EQ (SingleCall ("status").message["error"]["code"], "NOT_FOUND");
  EXPECT_EQ (StateOf ("stat").state (), proto::TransactionStatus::FAILED);

  msg = Message ("cancel", "cancel");
  msg.mutable_cancel ()->set_order_id ("unknown");
  ExpectAck (msg);
  EXPECT_EQ (SingleCall ("cancel").message["error"]["code"], "NOT_FOUND");
}

/* ************************************************************************** */

using ProtocolBuyerTests = ProtocolTests;

TEST_F (ProtocolBuyerTests, UnknownBuyer)
{
  auto msg = OrderMessage ("confirm", "conf", 5);
  msg.mutable_confirm ()->set_buyer_id ("nobody");
  ExpectAck (msg);

  const auto call = SingleCall ("confirm");
  EXPECT_EQ (call.message["error"]["code"], "NOT_FOUND");
  EXPECT_FALSE (call.message.isMember ("order"));

  const auto state = StateOf ("conf");
  EXPECT_EQ (state.state (), proto::TransactionStatus::FAILED);
  EXPECT_EQ (state.error ().code (), proto::Error::NOT_FOUND);

  EXPECT_EQ (ledger.CountByStatus ("offer").available (), 100);
}

TEST_F (ProtocolBuyerTests, InsufficientFunds)
{
  proto::Principal poor;
  poor.set_id ("poor");
  poor.set_declared_capacity (1'000);
  poor.set_balance (10);
  proto::Principal out;
  ASSERT_TRUE (principals.Register (poor, 1'000, out, err));

  auto msg = OrderMessage ("init", "init", 2);
  msg.mutable_init ()->set_buyer_id ("poor");
  ExpectAck (msg);

  EXPECT_EQ (SingleCall ("init").message["error"]["code"],
             "INSUFFICIENT_FUNDS");
}

TEST_F (ProtocolBuyerTests, CapacityExceeded)
{
  ExpectAck (OrderMessage ("confirm", "first", 15, "tx1"));
  EXPECT_EQ (SingleCall ("confirm").message["order"]["status"], "ACTIVE");

  ExpectAck (OrderMessage ("confirm", "second", 6, "tx2"));
  const auto calls = callbacks.GetCalls ("confirm");
  ASSERT_EQ (calls.size (), 2);
  EXPECT_EQ (calls[1].message["error"]["code"], "CAPACITY_EXCEEDED");

  ExpectAck (OrderMessage ("confirm", "third", 5, "tx3"));
  EXPECT_EQ (callbacks.GetCalls ("confirm")[2].message["order"]["status"],
             "ACTIVE");

  EXPECT_EQ (orders.OpenQuantity ("buyer"), 20);
}

TEST_F (ProtocolBuyerTests, InitQuantityAboveAvailable)
{
  ExpectAck (OrderMessage ("init", "init", 150));
  EXPECT_EQ (SingleCall ("init").message["error"]["code"],
             "INSUFFICIENT_AVAILABLE");
}

/* ************************************************************************** */

using ProtocolCallbackTests = ProtocolTests;

TEST_F (ProtocolCallbackTests, DeliveryFailure)
{
  callbacks.SetFailure ("connection refused");

  auto msg = Message ("discover", "msg");
  msg.mutable_discover ();
  ExpectAck (msg);

  const auto state = StateOf ("msg");
  EXPECT_EQ (state.state (), proto::TransactionStatus::FAILED);
  EXPECT_EQ (state.error ().code (), proto::Error::UPSTREAM_DELIVERY);
  EXPECT_EQ (state.error ().message (), "connection refused");

  /* The attempted callback is still logged.  */
  const auto events = driver.GetEvents ("tx");
  ASSERT_EQ (events.size (), 2);
  EXPECT_EQ (events[1].direction (), proto::Event::OUTBOUND);

  const auto payload = ParseJson (events[1].payload ());
  EXPECT_EQ (payload["context"]["action"], "on_discover");
  EXPECT_TRUE (payload["message"].isMember ("match"));
}

TEST_F (ProtocolCallbackTests, TransactionsAreSeparate)
{
  auto msg = Message ("discover", "a", "tx1");
  msg.mutable_discover ();
  ExpectAck (msg);

  msg = Message ("discover", "b", "tx2");
  msg.mutable_discover ();
  ExpectAck (msg);

  EXPECT_EQ (driver.GetEvents ("tx1").size (), 2);
  EXPECT_EQ (driver.GetEvents ("tx2").size (), 2);

  const auto states = driver.GetStatus ("tx1");
  ASSERT_EQ (states.size (), 1);
  EXPECT_EQ (states[0].message_id (), "a");
}

} // anonymous namespace
} // namespace enertrade
