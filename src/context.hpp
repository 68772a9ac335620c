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

#ifndef BONDS_CONTEXT_HPP
#define BONDS_CONTEXT_HPP

#include "proto/roconfig.hpp"

#include <xayagame/gamelogic.hpp>

#include <memory>

namespace bonds
{

/**
 * Basic, read-only contextual data about the current block and the chain state
 * in general.  The data is immutable, except if using the ContextForTesting
 * subclass in unit tests.
 */
class Context
{

private:

  /** The chain we are on.  */
  xaya::Chain chain;

  /** RoConfig instance dependant on the chain.  */
  std::unique_ptr<bonds::RoConfig> cfg;

  /** The current block's height.  */
  unsigned height;

  /**
   * The timestamp of the current block.  This is the "now" used for price
   * decay, sale windows, vesting and lock ends.
   */
  int64_t timestamp;

  /**
   * Constructs an empty instance without setting any stuff yet.  This is
   * used with ContextForTesting.
   */
  explicit Context (xaya::Chain c);

  friend class ContextForTesting;

public:

  /** Value for timestamp if there is none set.  */
  static constexpr int64_t NO_TIMESTAMP = -1;

  /** Value for height if there is no height set (and shouldn't be used).  */
  static constexpr unsigned NO_HEIGHT = static_cast<unsigned> (-1);

  /**
   * Constructs an instance based on the given data.
   */
  explicit Context (xaya::Chain c, unsigned h, int64_t ts);

  xaya::Chain
  Chain () const
  {
    return chain;
  }

  const bonds::RoConfig&
  RoConfig () const
  {
    return *cfg;
  }

  /**
   * Returns the context's block height.  Must not be used if NO_HEIGHT was
   * passed to the constructor.
   */
  unsigned Height () const;

  /**
   * Returns the context's block timestamp.
   */
  int64_t Timestamp () const;

};

} // namespace bonds

#endif // BONDS_CONTEXT_HPP
