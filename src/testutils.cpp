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

#include "testutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace bonds
{

void
ContextForTesting::SetChain (const xaya::Chain c)
{
  LOG (INFO) << "Setting context chain to " << xaya::ChainToString (c);
  chain = c;
  cfg.reset (new bonds::RoConfig (chain));
}

void
ContextForTesting::SetHeight (const unsigned h)
{
  LOG (INFO) << "Setting context height to " << h;
  height = h;
}

void
ContextForTesting::SetTimestamp (const int64_t ts)
{
  LOG (INFO) << "Setting context timestamp to " << ts;
  timestamp = ts;
}

Json::Value
ParseJson (const std::string& str)
{
  Json::Value val;
  std::istringstream in(str);
  in >> val;
  return val;
}

namespace
{

/**
 * Compares two non-container values.  The string "null" as expected
 * value matches an actual JSON null, so that golden data can require
 * an explicit null (since a real null means "field is missing").
 */
bool
ScalarMatches (const Json::Value& actual, const Json::Value& expected)
{
  if (expected.isString () && expected.asString () == "null")
    return actual.isNull ();

  /* Amounts and IDs may be stored as unsigned in the actual JSON but are
     parsed as signed from the golden strings.  */
  if (actual.isInt64 () && expected.isInt64 ())
    return actual.asInt64 () == expected.asInt64 ();

  return actual == expected;
}

} // anonymous namespace

bool
PartialJsonEqual (const Json::Value& actual, const Json::Value& expected)
{
  if (expected.isArray ())
    {
      if (!actual.isArray () || actual.size () != expected.size ())
        {
          LOG (ERROR)
              << "Expected array of size " << expected.size ()
              << ", got:\n" << actual;
          return false;
        }

      for (unsigned i = 0; i < expected.size (); ++i)
        if (!PartialJsonEqual (actual[i], expected[i]))
          {
            LOG (ERROR) << "Mismatch in array element " << i;
            return false;
          }

      return true;
    }

  if (expected.isObject ())
    {
      if (!actual.isObject ())
        {
          LOG (ERROR) << "Expected object, got:\n" << actual;
          return false;
        }

      for (const auto& key : expected.getMemberNames ())
        {
          const auto& want = expected[key];
          const bool present = actual.isMember (key);

          if (want.isNull ())
            {
              if (present)
                {
                  LOG (ERROR) << "Unexpected member present: " << key;
                  return false;
                }
              continue;
            }

          if (!present)
            {
              LOG (ERROR) << "Missing member: " << key;
              return false;
            }

          if (!PartialJsonEqual (actual[key], want))
            {
              LOG (ERROR) << "Mismatch in member " << key;
              return false;
            }
        }

      return true;
    }

  if (ScalarMatches (actual, expected))
    return true;

  LOG (ERROR) << "Got value:\n" << actual << "\nbut expected:\n" << expected;
  return false;
}

} // namespace bonds
