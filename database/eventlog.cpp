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

#include "eventlog.hpp"

#include <glog/logging.h>

#include <memory>
#include <sstream>

namespace bonds
{

void
EventLog::Emit (const std::string& emitter, const std::string& type,
                const Json::Value& args)
{
  CHECK (args.isObject ()) << "Event arguments must be an object";

  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  const std::string serialised = Json::writeString (wbuilder, args);

  const auto id = db.GetLogId ();
  VLOG (1)
      << "Event " << id << " at height " << height
      << ": " << emitter << " " << type << " " << serialised;

  auto stmt = db.Prepare (R"(
    INSERT INTO `events`
      (`id`, `height`, `emitter`, `type`, `args`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  stmt.Bind (1, id);
  stmt.Bind (2, height);
  stmt.Bind (3, emitter);
  stmt.Bind (4, type);
  stmt.Bind (5, serialised);
  stmt.Execute ();
}

void
EventLog::RemoveOld (const unsigned n)
{
  VLOG (1)
      << "Removing events from " << n << " or more blocks before "
      << height;

  if (n > height)
    return;

  auto stmt = db.Prepare (R"(
    DELETE FROM `events`
      WHERE `height` <= ?1
  )");
  stmt.Bind (1, height - n);
  stmt.Execute ();
}

Database::Result<EventResult>
EventLog::QueryRecent (const unsigned limit)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM (SELECT *
              FROM `events`
              ORDER BY `id` DESC
              LIMIT ?1)
      ORDER BY `id`
  )");
  stmt.Bind (1, limit);
  return stmt.Query<EventResult> ();
}

Database::Result<EventResult>
EventLog::QueryForEmitter (const std::string& emitter, const unsigned limit)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM (SELECT *
              FROM `events`
              WHERE `emitter` = ?1
              ORDER BY `id` DESC
              LIMIT ?2)
      ORDER BY `id`
  )");
  stmt.Bind (1, emitter);
  stmt.Bind (2, limit);
  return stmt.Query<EventResult> ();
}

Json::Value
EventLog::GetArgs (const Database::Result<EventResult>& res)
{
  const std::string str = res.Get<EventResult::args> ();

  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = true;
  std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());

  Json::Value val;
  std::string parseErrs;
  CHECK (reader->parse (str.data (), str.data () + str.size (),
                        &val, &parseErrs))
      << "Invalid event arguments stored: " << str << "\n" << parseErrs;

  return val;
}

} // namespace bonds
