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

#ifndef ENERTRADE_PROTOCOL_HPP
#define ENERTRADE_PROTOCOL_HPP

#include "matching.hpp"
#include "principals.hpp"
#include "private/blockledger.hpp"
#include "private/callbacks.hpp"
#include "private/catalog.hpp"
#include "private/dedup.hpp"
#include "private/eventlog.hpp"
#include "private/orders.hpp"
#include "private/taskqueue.hpp"
#include "proto/error.pb.h"
#include "proto/protocol.pb.h"
#include "trust.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace enertrade
{

/**
 * The collaborators the protocol driver works with.
 */
struct ProtocolComponents
{
  Catalog& catalog;
  BlockLedger& ledger;
  const MatchingEngine& matching;
  OrderManager& orders;
  PrincipalDirectory& principals;
  Deduplicator& dedup;
  EventLog& log;
  TaskQueue& tasks;
  CallbackSender& callbacks;
};

/**
 * Drives the asynchronous request / acknowledge / callback protocol.  Inbound
 * messages are validated and deduplicated synchronously, and answered with
 * an ACK or NACK.  Accepted messages are then processed on the task queue,
 * and the result is delivered as on_<action> callback to the sender.
 */
class ProtocolDriver
{

private:

  ProtocolComponents comp;

  /** Trust parameters for the buyer capacity check.  */
  const TrustConfig trustConfig;

  /** Delay between acknowledgement and processing.  */
  const std::chrono::milliseconds callbackDelay;

  /**
   * Returns the protocol action name matching the payload of a message,
   * or the empty string if there is none.
   */
  static std::string PayloadAction (const proto::InboundMessage& msg);

  /**
   * Checks the context and the payload shape of a message.
   */
  static bool ValidateMessage (const proto::InboundMessage& msg,
                               proto::Error& err);

  /**
   * Checks a select request against the current catalog state.  This
   * is done before acknowledging it.
   */
  bool ValidateSelect (const proto::OrderRequest& req, proto::Error& err);

  /**
   * Turns the acknowledgement into a NACK with the given error and
   * returns it.
   */
  static proto::Ack& Reject (const proto::Context& ctx,
                             const proto::Error& err, proto::Ack& ack);

  /**
   * Checks that a buyer can afford an order and has enough trading
   * headroom for it.
   */
  bool CheckBuyer (const std::string& buyerId, double total, int64_t quantity,
                   proto::Error& err);

  /**
   * Looks up the order a cancel or status request refers to, either by
   * explicit ID or through the message's transaction.
   */
  bool FindOrder (const std::string& orderId,
                  const std::string& transactionId, proto::Order& out,
                  proto::Error& err);

  bool ProcessDiscover (const proto::DiscoverRequest& req,
                        proto::CallbackPayload& out, proto::Error& err);
  bool ProcessSelect (const proto::OrderRequest& req,
                      proto::CallbackPayload& out, proto::Error& err);
  bool ProcessInit (const proto::Context& ctx, const proto::OrderRequest& req,
                    proto::CallbackPayload& out, proto::Error& err);
  bool ProcessConfirm (const proto::Context& ctx,
                       const proto::OrderRequest& req,
                       proto::CallbackPayload& out, proto::Error& err);
  bool ProcessCancel (const proto::Context& ctx,
                      const proto::CancelRequest& req,
                      proto::CallbackPayload& out, proto::Error& err);
  bool ProcessStatus (const proto::Context& ctx,
                      const proto::StatusRequest& req,
                      proto::CallbackPayload& out, proto::Error& err);

  /**
   * Processes an acknowledged message and sends its callback.  This runs
   * on the task queue.
   */
  void Process (const proto::InboundMessage& msg);

  /**
   * Logs and delivers the callback for a processed message, and records
   * the final state of the inbound message.
   */
  void SendCallback (const proto::Context& inbound,
                     const proto::CallbackPayload& payload,
                     const proto::Error* processingError);

protected:

  /**
   * Returns the current time.  Tests override this.
   */
  virtual int64_t GetCurrentTime () const;

public:

  explicit ProtocolDriver (const ProtocolComponents& c,
                           const TrustConfig& trust,
                           std::chrono::milliseconds delay);

  /**
   * Constructs the driver with the callback delay from --callback_delay_ms.
   */
  explicit ProtocolDriver (const ProtocolComponents& c,
                           const TrustConfig& trust);

  virtual ~ProtocolDriver () = default;

  ProtocolDriver () = delete;
  ProtocolDriver (const ProtocolDriver&) = delete;
  void operator= (const ProtocolDriver&) = delete;

  /**
   * Handles an inbound message and returns the synchronous acknowledgement.
   * Duplicates of earlier messages are acknowledged without further work.
   */
  proto::Ack Handle (const proto::InboundMessage& msg);

  /**
   * Returns the processing states of all messages of a transaction.
   */
  std::vector<proto::TransactionStatus> GetStatus (
      const std::string& transactionId);

  /**
   * Returns the logged events of a transaction.
   */
  std::vector<proto::Event> GetEvents (const std::string& transactionId);

};

} // namespace enertrade

#endif // ENERTRADE_PROTOCOL_HPP
