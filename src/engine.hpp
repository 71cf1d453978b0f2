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

#ifndef ENERTRADE_ENGINE_HPP
#define ENERTRADE_ENGINE_HPP

#include "proto/catalog.pb.h"
#include "proto/error.pb.h"
#include "proto/orders.pb.h"
#include "proto/protocol.pb.h"

#include <cstdint>
#include <memory>
#include <string>

namespace enertrade
{

class CallbackSender;

/**
 * The transaction engine as a whole.  It owns the durable store and all
 * components (catalog, block ledger, matching, orders, protocol driver)
 * and exposes the operations that the RPC server offers.
 *
 * All methods are thread-safe.
 */
class Engine
{

private:

  class Impl;

  /**
   * The actual implementation, whose definition is hidden in the .cpp
   * file to decouple the public interface from internal stuff.
   */
  std::unique_ptr<Impl> impl;

public:

  /**
   * Constructs the engine with the database at the given file (which may be
   * ":memory:") and the given callback sender.  Configuration is taken from
   * the command-line flags.
   */
  explicit Engine (const std::string& dbFile, CallbackSender& callbacks);

  ~Engine ();

  Engine () = delete;
  Engine (const Engine&) = delete;
  void operator= (const Engine&) = delete;

  /**
   * Handles an inbound protocol message.
   */
  proto::Ack HandleMessage (const proto::InboundMessage& msg);

  bool SyncProvider (const proto::Provider& provider, proto::Error& err);
  bool SyncItem (const proto::CatalogItem& item, proto::Error& err);

  /**
   * Creates or updates an offer.  On success, the block counts of the
   * offer are returned.
   */
  bool SyncOffer (const proto::Offer& offer, bool resync,
                  proto::BlockCounts& counts, proto::Error& err);

  bool DeleteOffer (const std::string& id, proto::Error& err);

  /**
   * Applies a block status update pushed by the provider side.
   */
  bool UpdateBlocks (const proto::BlockUpdate& update,
                     proto::BlockCounts& counts, proto::Error& err);

  proto::Catalog GetCatalog ();

  proto::TransactionInfo GetTransaction (const std::string& transactionId);

  bool GetOrder (const std::string& id, proto::Order& out);

  /**
   * Returns the trust standing of a principal or, if there is no principal
   * with that ID, of a provider.
   */
  bool GetTrustInfo (const std::string& id, proto::TrustInfo& out,
                     proto::Error& err);

  bool RegisterPrincipal (const proto::Principal& principal,
                          double verifiedCapacity, proto::Principal& out,
                          proto::Error& err);

  /**
   * Moves an order to the given status.  Requests with the same non-empty
   * idempotency key are processed only once.
   */
  proto::OrderResult AdvanceOrder (const std::string& idempotencyKey,
                                   const std::string& orderId,
                                   proto::Order::Status status);

  /**
   * Cancels an order on behalf of the party named in the request.
   */
  proto::OrderResult CancelOrder (const std::string& idempotencyKey,
                                  const proto::CancelRequest& req);

  /**
   * Records the verified delivered quantity of a completed order.
   */
  proto::OrderResult VerifyDelivery (const std::string& idempotencyKey,
                                     const std::string& orderId,
                                     int64_t delivered);

  /**
   * Returns the number of protocol messages waiting to be processed.
   */
  size_t GetPendingMessages ();

  /**
   * Blocks until all acknowledged messages have been processed.
   */
  void WaitIdle ();

};

} // namespace enertrade

#endif // ENERTRADE_ENGINE_HPP
