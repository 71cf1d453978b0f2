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

#ifndef ENERTRADE_ORDERS_HPP
#define ENERTRADE_ORDERS_HPP

#include "principals.hpp"
#include "private/blockledger.hpp"
#include "private/catalog.hpp"
#include "private/database.hpp"
#include "proto/error.pb.h"
#include "proto/orders.pb.h"
#include "trust.hpp"

#include <cstdint>
#include <string>

namespace enertrade
{

/**
 * Parameters for order handling.
 */
struct OrderConfig
{

  /**
   * Cancellations at most this long before delivery start (or later)
   * are inside the penalty window.
   */
  int64_t cancelWindowSeconds = 60 * 60;

  /** Share of the cancelled value a buyer pays inside the window.  */
  double buyerPenaltyRate = 0.10;

  /** Share of the cancelled value a seller pays on cancellation.  */
  double sellerPenaltyRate = 0.05;

  TrustConfig trust;

  static OrderConfig FromFlags ();

};

/**
 * The order state machine.  It creates orders by claiming blocks from the
 * ledger, moves them through their lifecycle along a fixed table of legal
 * transitions, and applies the trust and monetary consequences of
 * cancellations and delivery verification.
 *
 * All updates of an order are guarded by its version, so that concurrent
 * modifications fail with CONFLICT instead of overwriting each other.
 */
class OrderManager
{

private:

  Database& db;
  BlockLedger& ledger;
  Catalog& catalog;
  PrincipalDirectory& principals;

  const OrderConfig config;

  /**
   * Looks up an order inside an ongoing transaction.
   */
  static bool LoadOrder (Connection& conn, const std::string& id,
                         proto::Order& out);

  /**
   * Writes back a modified order, if its version still matches.
   * On success, the version in the proto is updated.
   */
  static bool StoreOrder (Connection& conn, proto::Order& order,
                          proto::Error& err);

  /**
   * Changes the status of an order in memory if the transition
   * is legal.
   */
  static bool ApplyStatus (proto::Order& order, proto::Order::Status to,
                           proto::Error& err);

  /**
   * Updates the trust of a buyer through the principal directory.
   * Returns the applied impact.
   */
  double UpdateBuyerTrust (const std::string& buyer, int64_t cancelled,
                           int64_t total, bool withinWindow);

protected:

  /**
   * Returns the current time.  Tests override this to control the
   * cancellation window.
   */
  virtual int64_t GetCurrentTime () const;

public:

  explicit OrderManager (Database& d, BlockLedger& l, Catalog& c,
                         PrincipalDirectory& p, const OrderConfig& cfg);

  virtual ~OrderManager () = default;

  OrderManager () = delete;
  OrderManager (const OrderManager&) = delete;
  void operator= (const OrderManager&) = delete;

  /**
   * Returns true if the order status may change from one to the other.
   */
  static bool IsValidTransition (proto::Order::Status from,
                                 proto::Order::Status to);

  /**
   * Creates an order for the given request (transaction, buyer, offer
   * and quantity), reserving its blocks.  The order ends up ACTIVE.
   * If an order for the transaction exists already, it is returned instead.
   */
  bool PlaceOrder (const std::string& transactionId,
                   const std::string& buyerId, const std::string& offerId,
                   int64_t quantity, proto::Order& out, proto::Error& err);

  bool GetOrder (const std::string& id, proto::Order& out);
  bool GetOrderByTransaction (const std::string& transactionId,
                              proto::Order& out);

  /**
   * Moves an order forward in its lifecycle.  Starting delivery marks the
   * reserved blocks as sold.  Cancellation goes through Cancel instead.
   */
  bool Advance (const std::string& id, proto::Order::Status to,
                proto::Order& out, proto::Error& err);

  /**
   * Cancels an order, either completely or (while ACTIVE) partially
   * if the quantity is less than that of the order.
   */
  bool Cancel (const std::string& id, proto::Party party,
               const std::string& reason, int64_t quantity,
               proto::Order& out, proto::Error& err);

  /**
   * Records the verified delivery of a completed order and updates the
   * provider's trust accordingly.  This can be done only once per order.
   */
  bool RecordDelivery (const std::string& id, int64_t delivered,
                       proto::Order& out, proto::Error& err);

  /**
   * Returns the total quantity of a buyer's orders that are not yet
   * finished or cancelled.
   */
  int64_t OpenQuantity (const std::string& buyerId);

};

} // namespace enertrade

#endif // ENERTRADE_ORDERS_HPP
