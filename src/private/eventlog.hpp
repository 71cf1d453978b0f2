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

#ifndef ENERTRADE_EVENTLOG_HPP
#define ENERTRADE_EVENTLOG_HPP

#include "private/database.hpp"
#include "proto/error.pb.h"
#include "proto/protocol.pb.h"

#include <string>
#include <vector>

namespace enertrade
{

/**
 * The append-only log of protocol messages (inbound and outbound) together
 * with the processing state of each inbound message.  The log is the
 * durable record used for duplicate detection; states are kept for
 * status polling.
 */
class EventLog
{

private:

  Database& db;

public:

  explicit EventLog (Database& d)
    : db(d)
  {}

  EventLog () = delete;
  EventLog (const EventLog&) = delete;
  void operator= (const EventLog&) = delete;

  /**
   * Appends an event.  On success, its ID is filled in.  Returns false
   * (without changing anything) if the event is inbound and a message
   * with the same ID has been logged already.
   */
  bool Append (proto::Event& ev);

  /**
   * Returns true if an inbound event with the given message ID exists.
   */
  bool HasInbound (const std::string& messageId);

  /**
   * Returns all events of a transaction in the order they were logged.
   */
  std::vector<proto::Event> GetEvents (const std::string& transactionId);

  /**
   * Records the processing state of an inbound message.  The error is
   * stored if not null and cleared otherwise.
   */
  void SetState (const proto::Context& ctx, proto::TransactionStatus::State s,
                 const proto::Error* err, int64_t now);

  /**
   * Records a redelivered message as DUPLICATE with a DUPLICATE_MESSAGE
   * error.  A state already recorded for the same transaction and message
   * is kept.
   */
  void MarkDuplicate (const proto::Context& ctx, int64_t now);

  /**
   * Returns the states of all messages of a transaction.
   */
  std::vector<proto::TransactionStatus> GetStates (
      const std::string& transactionId);

};

} // namespace enertrade

#endif // ENERTRADE_EVENTLOG_HPP
