/*
    GSP for the Bond Sale Engine
    Copyright (C) 2019-2020  Autonomous Worlds Ltd

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

#ifndef DATABASE_DBTEST_HPP
#define DATABASE_DBTEST_HPP

#include "database.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <gtest/gtest.h>

#include <benchmark/benchmark.h>

#include <sqlite3.h>

#include <memory>
#include <string>

namespace bonds
{

/**
 * Database instance that uses an in-memory SQLite and does its own
 * statement caching and ID handling.  That way, we can run tests and
 * benchmarks independently from SQLiteGame.
 */
class TestDatabase : public Database
{

private:

  /** The SQLiteDatabase instance.  */
  xaya::SQLiteDatabase db;

  /** The next ID to give out.  */
  IdT nextId = 1;

  /** The next log ID to give out.  */
  IdT nextLogId = 1;

public:

  TestDatabase ();

  TestDatabase (const TestDatabase&) = delete;
  void operator= (const TestDatabase&) = delete;

  IdT GetNextId () override;
  IdT GetLogId () override;

  /**
   * Sets the next ID to be given out, so that tests can predict the
   * IDs of newly created locks.
   */
  void
  SetNextId (const IdT id)
  {
    nextId = id;
  }

  /**
   * Returns the underlying database handle for SQLite.
   */
  sqlite3*
  GetHandle ()
  {
    return *db;
  }

};

/**
 * Test fixture that has a TestDatabase inside.
 */
class DBTestFixture : public testing::Test
{

protected:

  /** The database instance to use.  */
  TestDatabase db;

  DBTestFixture () = default;

};

/**
 * Test fixture that opens an in-memory database and also installs the
 * game-state schema in it.  The asset registry is left empty, so that
 * tests can define exactly the assets they need.
 */
class DBTestWithSchema : public DBTestFixture
{

protected:

  DBTestWithSchema ();

};

/**
 * Scope guard for benchmark loops:  It opens a savepoint on construction
 * and rolls it back when destructed, with the benchmark timers paused
 * during both steps.  Each iteration thus starts from the same state
 * (e.g. the same teller capacity and price).
 */
class TemporaryDatabaseChanges
{

private:

  /** Benchmark state for pausing the timers.  */
  benchmark::State& benchmarkState;

  /** The savepoint, which is never committed.  */
  std::unique_ptr<Savepoint> sp;

public:

  explicit TemporaryDatabaseChanges (Database& db, benchmark::State& s);
  ~TemporaryDatabaseChanges ();

  TemporaryDatabaseChanges () = delete;
  TemporaryDatabaseChanges (const TemporaryDatabaseChanges&) = delete;
  void operator= (const TemporaryDatabaseChanges&) = delete;

};

} // namespace bonds

#endif // DATABASE_DBTEST_HPP
