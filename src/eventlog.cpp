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

#include "private/eventlog.hpp"

#include <glog/logging.h>

namespace enertrade
{

bool
EventLog::Append (proto::Event& ev)
{
  CHECK (ev.has_direction ());

  try
    {
      db.Access ([&] (Connection& conn)
        {
          auto stmt = conn.Prepare (R"(
            INSERT INTO `events`
              (`transaction_id`, `message_id`, `action`, `direction`,
               `payload`, `created_at`)
              VALUES (?1, ?2, ?3, ?4, ?5, ?6)
          )");
          stmt.Bind (1, ev.transaction_id ());
          stmt.Bind (2, ev.message_id ());
          stmt.Bind (3, ev.action ());
          stmt.Bind (4, proto::Event::Direction_Name (ev.direction ()));
          stmt.Bind (5, ev.payload ());
          stmt.Bind (6, ev.created_at ());
          stmt.Execute ();

          auto id = conn.Prepare ("SELECT last_insert_rowid ()");
          CHECK (id.Step ());
          ev.set_id (id.Get<int64_t> (0));
        });
    }
  catch (const DatabaseError& exc)
    {
      if (!exc.IsConstraint () || ev.direction () != proto::Event::INBOUND)
        throw;

      VLOG (1)
          << "Inbound message " << ev.message_id () << " is logged already";
      return false;
    }

  VLOG (2)
      << "Logged " << proto::Event::Direction_Name (ev.direction ())
      << " event " << ev.id () << ": " << ev.action ()
      << " of transaction " << ev.transaction_id ();
  return true;
}

bool
EventLog::HasInbound (const std::string& messageId)
{
  bool found;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT COUNT (*)
          FROM `events`
          WHERE `message_id` = ?1 AND `direction` = 'INBOUND'
      )");
      stmt.Bind (1, messageId);
      CHECK (stmt.Step ());
      found = stmt.Get<int64_t> (0) > 0;
    });
  return found;
}

std::vector<proto::Event>
EventLog::GetEvents (const std::string& transactionId)
{
  std::vector<proto::Event> res;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT `id`, `message_id`, `action`, `direction`, `payload`,
               `created_at`
          FROM `events`
          WHERE `transaction_id` = ?1
          ORDER BY `id`
      )");
      stmt.Bind (1, transactionId);

      while (stmt.Step ())
        {
          proto::Event ev;
          ev.set_id (stmt.Get<int64_t> (0));
          ev.set_transaction_id (transactionId);
          ev.set_message_id (stmt.Get<std::string> (1));
          ev.set_action (stmt.Get<std::string> (2));

          proto::Event::Direction dir;
          CHECK (proto::Event::Direction_Parse (stmt.Get<std::string> (3),
                                                &dir));
          ev.set_direction (dir);

          ev.set_payload (stmt.Get<std::string> (4));
          ev.set_created_at (stmt.Get<int64_t> (5));
          res.push_back (std::move (ev));
        }
    });
  return res;
}

void
EventLog::SetState (const proto::Context& ctx,
                    const proto::TransactionStatus::State s,
                    const proto::Error* err, const int64_t now)
{
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        INSERT OR REPLACE INTO `transaction_states`
          (`transaction_id`, `message_id`, `action`, `state`, `error`,
           `updated_at`)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6)
      )");
      stmt.Bind (1, ctx.transaction_id ());
      stmt.Bind (2, ctx.message_id ());
      stmt.Bind (3, ctx.action ());
      stmt.Bind (4, proto::TransactionStatus::State_Name (s));
      if (err == nullptr)
        stmt.BindNull (5);
      else
        stmt.Bind (5, err->SerializeAsString ());
      stmt.Bind (6, now);
      stmt.Execute ();
    });

  VLOG (1)
      << "Message " << ctx.message_id () << " (" << ctx.action () << ") is "
      << proto::TransactionStatus::State_Name (s);
}

void
EventLog::MarkDuplicate (const proto::Context& ctx, const int64_t now)
{
  proto::Error err;
  err.set_code (proto::Error::DUPLICATE_MESSAGE);
  err.set_message ("message " + ctx.message_id () + " was already received");

  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        INSERT OR IGNORE INTO `transaction_states`
          (`transaction_id`, `message_id`, `action`, `state`, `error`,
           `updated_at`)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6)
      )");
      stmt.Bind (1, ctx.transaction_id ());
      stmt.Bind (2, ctx.message_id ());
      stmt.Bind (3, ctx.action ());
      stmt.Bind (4, proto::TransactionStatus::State_Name (
                        proto::TransactionStatus::DUPLICATE));
      stmt.Bind (5, err.SerializeAsString ());
      stmt.Bind (6, now);
      stmt.Execute ();
    });
}

std::vector<proto::TransactionStatus>
EventLog::GetStates (const std::string& transactionId)
{
  std::vector<proto::TransactionStatus> res;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT `message_id`, `action`, `state`, `error`, `updated_at`
          FROM `transaction_states`
          WHERE `transaction_id` = ?1
          ORDER BY `updated_at`, `message_id`
      )");
      stmt.Bind (1, transactionId);

      while (stmt.Step ())
        {
          proto::TransactionStatus st;
          st.set_transaction_id (transactionId);
          st.set_message_id (stmt.Get<std::string> (0));
          st.set_action (stmt.Get<std::string> (1));

          proto::TransactionStatus::State s;
          CHECK (proto::TransactionStatus::State_Parse (
                    stmt.Get<std::string> (2), &s));
          st.set_state (s);

          if (!stmt.IsNull (3))
            CHECK (st.mutable_error ()->ParseFromString (
                      stmt.Get<std::string> (3)));
          st.set_updated_at (stmt.Get<int64_t> (4));
          res.push_back (std::move (st));
        }
    });
  return res;
}

} // namespace enertrade
