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

#ifndef ENERTRADE_DATABASE_HPP
#define ENERTRADE_DATABASE_HPP

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace enertrade
{

/**
 * Exception thrown for failures reported by SQLite.
 */
class DatabaseError : public std::runtime_error
{

private:

  /** The (extended) SQLite result code.  */
  const int code;

public:

  explicit DatabaseError (const std::string& msg, const int c)
    : std::runtime_error(msg), code(c)
  {}

  int
  GetCode () const
  {
    return code;
  }

  /**
   * Returns true if the failure was a violated constraint (including
   * RAISE from one of our triggers).
   */
  bool
  IsConstraint () const
  {
    return (code & 0xFF) == SQLITE_CONSTRAINT;
  }

};

/**
 * A prepared statement.  It is tied to the connection that created it and
 * must not outlive it.
 */
class Statement
{

private:

  /** The underlying handle, owned by this instance.  */
  sqlite3_stmt* stmt;

  /** The database handle, for error messages.  */
  sqlite3* db;

  /** Set once Step returned "done".  */
  bool done = false;

  void CheckBind (int rc) const;

public:

  explicit Statement (sqlite3* d, const std::string& sql);
  Statement (Statement&& other);
  ~Statement ();

  Statement () = delete;
  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  /**
   * Binds a parameter (one-based index).
   */
  template <typename T>
    void Bind (int ind, const T& val);

  void Bind (int ind, const char* val);

  void BindNull (int ind);

  /**
   * Steps the statement.  Returns true if a row is available and false
   * if the statement is done.  Throws on errors.
   */
  bool Step ();

  /**
   * Runs a statement that returns no rows.
   */
  void Execute ();

  /**
   * Resets the statement so it can be executed again.  Bindings are
   * kept unless they are rebound.
   */
  void Reset ();

  bool IsNull (int col) const;

  /**
   * Extracts a column value (zero-based) of the current row.
   */
  template <typename T>
    T Get (int col) const;

};

template <> void Statement::Bind<int64_t> (int, const int64_t&);
template <> void Statement::Bind<int> (int, const int&);
template <> void Statement::Bind<unsigned> (int, const unsigned&);
template <> void Statement::Bind<bool> (int, const bool&);
template <> void Statement::Bind<double> (int, const double&);
template <> void Statement::Bind<std::string> (int, const std::string&);

template <> int64_t Statement::Get<int64_t> (int) const;
template <> int Statement::Get<int> (int) const;
template <> unsigned Statement::Get<unsigned> (int) const;
template <> bool Statement::Get<bool> (int) const;
template <> double Statement::Get<double> (int) const;
template <> std::string Statement::Get<std::string> (int) const;

/**
 * An open SQLite database connection.  Access is not synchronised;
 * this is done by Database.
 */
class Connection
{

private:

  sqlite3* handle;

public:

  explicit Connection (const std::string& file);
  ~Connection ();

  Connection () = delete;
  Connection (const Connection&) = delete;
  void operator= (const Connection&) = delete;

  /**
   * Executes one or more SQL statements without result.
   */
  void Execute (const std::string& sql);

  Statement Prepare (const std::string& sql);

  /**
   * Returns the number of rows changed by the last statement.
   */
  int Changes () const;

};

/**
 * The engine's durable store.  It holds the connection and serialises all
 * access to it.  Operations run either as plain reads or inside an explicit
 * transaction that is rolled back unless the callback asks for a commit.
 */
class Database
{

private:

  Connection conn;

  /** Lock for all access to the connection.  */
  mutable std::mutex mut;

public:

  /**
   * Opens (or creates) the database at the given file, which can also be
   * ":memory:", and sets up the schema.
   */
  explicit Database (const std::string& file);

  Database () = delete;
  Database (const Database&) = delete;
  void operator= (const Database&) = delete;

  /**
   * Runs the callback with exclusive access to the connection, outside
   * of an explicit transaction.
   */
  template <typename Fcn>
    void
    Access (const Fcn& f)
  {
    std::lock_guard<std::mutex> lock(mut);
    f (conn);
  }

  /**
   * Runs the callback inside a transaction.  The callback returns true
   * to commit; on false or an exception, the transaction is rolled back.
   * Returns whether the changes were committed.
   */
  template <typename Fcn>
    bool Transaction (const Fcn& f);

};

template <typename Fcn>
  bool
  Database::Transaction (const Fcn& f)
{
  std::lock_guard<std::mutex> lock(mut);
  conn.Execute ("BEGIN IMMEDIATE");

  bool commit;
  try
    {
      commit = f (conn);
    }
  catch (...)
    {
      conn.Execute ("ROLLBACK");
      throw;
    }

  conn.Execute (commit ? "COMMIT" : "ROLLBACK");
  return commit;
}

/**
 * Sets up all tables, indices and triggers if they do not exist yet.
 */
void SetupSchema (Connection& conn);

} // namespace enertrade

#endif // ENERTRADE_DATABASE_HPP
