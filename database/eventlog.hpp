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

#ifndef DATABASE_EVENTLOG_HPP
#define DATABASE_EVENTLOG_HPP

#include "database.hpp"

#include <json/json.h>

#include <string>

namespace bonds
{

/**
 * Database result type for rows from the events table.
 */
struct EventResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, id, 1);
  RESULT_COLUMN (int64_t, height, 2);
  RESULT_COLUMN (std::string, emitter, 3);
  RESULT_COLUMN (std::string, type, 4);
  RESULT_COLUMN (std::string, args, 5);
};

/**
 * Access to the log of events emitted by successful calls (bond
 * creation, redemption, configuration changes and so on).  Events are
 * written during the state transition and read only by the RPC
 * interface.
 */
class EventLog
{

private:

  /** The underlying database handle.  */
  Database& db;

  /** The block height for newly emitted events.  */
  const unsigned height;

public:

  explicit EventLog (Database& d, const unsigned h)
    : db(d), height(h)
  {}

  EventLog () = delete;
  EventLog (const EventLog&) = delete;
  void operator= (const EventLog&) = delete;

  /**
   * Records a new event.  The arguments must be a JSON object.
   */
  void Emit (const std::string& emitter, const std::string& type,
             const Json::Value& args);

  /**
   * Deletes all events that are n or more blocks older than the current
   * height, so that the log only keeps a recent window.
   */
  void RemoveOld (unsigned n);

  /**
   * Queries for the most recent events (at most limit many), ordered
   * from oldest to newest.
   */
  Database::Result<EventResult> QueryRecent (unsigned limit);

  /**
   * Queries for the most recent events of one emitter.
   */
  Database::Result<EventResult> QueryForEmitter (const std::string& emitter,
                                                 unsigned limit);

  /**
   * Parses the stored arguments of an event row back to JSON.
   */
  static Json::Value GetArgs (const Database::Result<EventResult>& res);

};

} // namespace bonds

#endif // DATABASE_EVENTLOG_HPP
