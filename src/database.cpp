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

#include "private/database.hpp"

#include <glog/logging.h>

#include <sstream>

namespace enertrade
{

namespace
{

/**
 * Throws a DatabaseError describing the last failure on a handle.
 */
[[noreturn]] void
ThrowError (sqlite3* db, const int rc, const std::string& what)
{
  std::ostringstream msg;
  msg << what << ": " << sqlite3_errmsg (db) << " (code " << rc << ")";
  VLOG (1) << "SQLite error: " << msg.str ();
  throw DatabaseError (msg.str (), rc);
}

} // anonymous namespace

/* ************************************************************************** */

Statement::Statement (sqlite3* d, const std::string& sql)
  : stmt(nullptr), db(d)
{
  const int rc = sqlite3_prepare_v2 (db, sql.c_str (), -1, &stmt, nullptr);
  if (rc != SQLITE_OK)
    ThrowError (db, rc, "Failed to prepare statement:\n" + sql);
  CHECK (stmt != nullptr);
}

Statement::Statement (Statement&& other)
  : stmt(other.stmt), db(other.db), done(other.done)
{
  other.stmt = nullptr;
}

Statement::~Statement ()
{
  if (stmt != nullptr)
    sqlite3_finalize (stmt);
}

void
Statement::CheckBind (const int rc) const
{
  if (rc != SQLITE_OK)
    ThrowError (db, rc, "Failed to bind parameter");
}

template <>
  void
  Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  CheckBind (sqlite3_bind_int64 (stmt, ind, val));
}

template <>
  void
  Statement::Bind<int> (const int ind, const int& val)
{
  CheckBind (sqlite3_bind_int64 (stmt, ind, val));
}

template <>
  void
  Statement::Bind<unsigned> (const int ind, const unsigned& val)
{
  CheckBind (sqlite3_bind_int64 (stmt, ind, val));
}

template <>
  void
  Statement::Bind<bool> (const int ind, const bool& val)
{
  CheckBind (sqlite3_bind_int (stmt, ind, val ? 1 : 0));
}

template <>
  void
  Statement::Bind<double> (const int ind, const double& val)
{
  CheckBind (sqlite3_bind_double (stmt, ind, val));
}

template <>
  void
  Statement::Bind<std::string> (const int ind, const std::string& val)
{
  CheckBind (sqlite3_bind_text (stmt, ind, val.data (), val.size (),
                                SQLITE_TRANSIENT));
}

void
Statement::Bind (const int ind, const char* val)
{
  Bind<std::string> (ind, val);
}

void
Statement::BindNull (const int ind)
{
  CheckBind (sqlite3_bind_null (stmt, ind));
}

bool
Statement::Step ()
{
  CHECK (!done) << "Stepping statement that is already done";

  const int rc = sqlite3_step (stmt);
  switch (rc)
    {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      done = true;
      return false;
    default:
      ThrowError (db, rc, "Failed to step statement");
    }
}

void
Statement::Execute ()
{
  CHECK (!Step ()) << "Execute on a statement that returns rows";
}

void
Statement::Reset ()
{
  /* sqlite3_reset returns the error of the last step, if any, which
     has already been reported by Step.  */
  sqlite3_reset (stmt);
  done = false;
}

bool
Statement::IsNull (const int col) const
{
  return sqlite3_column_type (stmt, col) == SQLITE_NULL;
}

template <>
  int64_t
  Statement::Get<int64_t> (const int col) const
{
  return sqlite3_column_int64 (stmt, col);
}

template <>
  int
  Statement::Get<int> (const int col) const
{
  return sqlite3_column_int (stmt, col);
}

template <>
  unsigned
  Statement::Get<unsigned> (const int col) const
{
  const int64_t val = sqlite3_column_int64 (stmt, col);
  CHECK_GE (val, 0);
  return static_cast<unsigned> (val);
}

template <>
  bool
  Statement::Get<bool> (const int col) const
{
  return sqlite3_column_int (stmt, col) != 0;
}

template <>
  double
  Statement::Get<double> (const int col) const
{
  return sqlite3_column_double (stmt, col);
}

template <>
  std::string
  Statement::Get<std::string> (const int col) const
{
  const auto* data
      = reinterpret_cast<const char*> (sqlite3_column_text (stmt, col));
  if (data == nullptr)
    return "";

  const int len = sqlite3_column_bytes (stmt, col);
  return std::string (data, len);
}

/* ************************************************************************** */

Connection::Connection (const std::string& file)
  : handle(nullptr)
{
  const int rc = sqlite3_open_v2 (file.c_str (), &handle,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                  nullptr);
  if (rc != SQLITE_OK)
    {
      const std::string msg = handle != nullptr
          ? sqlite3_errmsg (handle) : "out of memory";
      sqlite3_close (handle);
      throw DatabaseError ("Failed to open database " + file + ": " + msg,
                           rc);
    }

  sqlite3_extended_result_codes (handle, 1);
  sqlite3_busy_timeout (handle, 5'000);

  LOG (INFO) << "Opened SQLite database " << file;
}

Connection::~Connection ()
{
  const int rc = sqlite3_close (handle);
  LOG_IF (ERROR, rc != SQLITE_OK)
      << "Failed to close database: " << sqlite3_errmsg (handle);
}

void
Connection::Execute (const std::string& sql)
{
  char* err = nullptr;
  const int rc = sqlite3_exec (handle, sql.c_str (), nullptr, nullptr, &err);
  if (rc != SQLITE_OK)
    {
      const std::string msg = err != nullptr ? err : "unknown error";
      sqlite3_free (err);
      throw DatabaseError ("Failed to execute SQL: " + msg, rc);
    }
}

Statement
Connection::Prepare (const std::string& sql)
{
  return Statement (handle, sql);
}

int
Connection::Changes () const
{
  return sqlite3_changes (handle);
}

/* ************************************************************************** */

Database::Database (const std::string& file)
  : conn(file)
{
  std::lock_guard<std::mutex> lock(mut);
  conn.Execute ("PRAGMA foreign_keys = ON");
  SetupSchema (conn);
}

} // namespace enertrade
