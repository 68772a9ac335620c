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

#ifndef BONDS_GOVERNANCE_HPP
#define BONDS_GOVERNANCE_HPP

#include "errors.hpp"

#include "database/eventlog.hpp"
#include "proto/governance.pb.h"

#include <string>

namespace bonds
{

/**
 * Helper around the two-phase governance record embedded into tellers,
 * depositories and assets.  It performs the guard checks and the
 * propose / accept transitions, and emits the corresponding events
 * on behalf of the owning component.
 */
class GovernanceRecord
{

private:

  /** The proto data this operates on.  */
  proto::Governance& data;

  /** Event log to use.  */
  EventLog& events;

  /** Address of the owning component (for events).  */
  const std::string emitter;

public:

  explicit GovernanceRecord (proto::Governance& d, EventLog& e,
                             const std::string& em)
    : data(d), events(e), emitter(em)
  {}

  GovernanceRecord () = delete;
  GovernanceRecord (const GovernanceRecord&) = delete;
  void operator= (const GovernanceRecord&) = delete;

  /**
   * Returns true if the caller is the current governor.  The empty
   * address is never the governor.
   */
  bool IsGovernance (const std::string& caller) const;

  /**
   * Returns NOT_GOVERNANCE unless the caller is the governor.
   */
  ErrorCode RequireGovernance (const std::string& caller) const;

  /**
   * Proposes a new governor.  Only the current governor can do this.
   * Proposing the empty address clears the pending governor.
   */
  ErrorCode SetPending (const std::string& caller, const std::string& pending);

  /**
   * Accepts the governance role, which must be done by the pending
   * governor.
   */
  ErrorCode Accept (const std::string& caller);

  /**
   * Initialises the record for a fresh component.
   */
  static void Initialise (proto::Governance& gov, const std::string& governor);

};

} // namespace bonds

#endif // BONDS_GOVERNANCE_HPP
