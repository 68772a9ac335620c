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

#include "governance.hpp"

#include <glog/logging.h>

namespace bonds
{

bool
GovernanceRecord::IsGovernance (const std::string& caller) const
{
  return !caller.empty () && caller == data.current ();
}

ErrorCode
GovernanceRecord::RequireGovernance (const std::string& caller) const
{
  if (!IsGovernance (caller))
    return ErrorCode::NOT_GOVERNANCE;
  return ErrorCode::OK;
}

ErrorCode
GovernanceRecord::SetPending (const std::string& caller,
                              const std::string& pending)
{
  const ErrorCode err = RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  VLOG (1)
      << "Proposing " << pending << " as governance of " << emitter;
  data.set_pending (pending);

  Json::Value args(Json::objectValue);
  args["pending"] = pending;
  events.Emit (emitter, "GovernancePending", args);

  return ErrorCode::OK;
}

ErrorCode
GovernanceRecord::Accept (const std::string& caller)
{
  if (caller.empty () || caller != data.pending ())
    return ErrorCode::NOT_PENDING_GOVERNANCE;

  VLOG (1) << caller << " accepted governance of " << emitter;
  data.set_current (caller);
  data.clear_pending ();

  Json::Value args(Json::objectValue);
  args["governance"] = caller;
  events.Emit (emitter, "GovernanceTransferred", args);

  return ErrorCode::OK;
}

void
GovernanceRecord::Initialise (proto::Governance& gov,
                              const std::string& governor)
{
  CHECK_NE (governor, "");
  gov.set_current (governor);
  gov.clear_pending ();
}

} // namespace bonds
