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

#include "dbtest.hpp"

#include "schema.hpp"

#include <glog/logging.h>

namespace bonds
{

TestDatabase::TestDatabase ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
{
  SetDatabase (db);
}

Database::IdT
TestDatabase::GetNextId ()
{
  return nextId++;
}

Database::IdT
TestDatabase::GetLogId ()
{
  return nextLogId++;
}

DBTestWithSchema::DBTestWithSchema ()
{
  LOG (INFO) << "Setting up game-state schema in test database...";
  SetupDatabaseSchema (db.GetHandle ());
}

TemporaryDatabaseChanges::TemporaryDatabaseChanges (Database& db,
                                                    benchmark::State& s)
  : benchmarkState(s)
{
  benchmarkState.PauseTiming ();
  sp = std::make_unique<Savepoint> (db, "benchmark");
  benchmarkState.ResumeTiming ();
}

TemporaryDatabaseChanges::~TemporaryDatabaseChanges ()
{
  benchmarkState.PauseTiming ();
  sp.reset ();
  benchmarkState.ResumeTiming ();
}

} // namespace bonds
