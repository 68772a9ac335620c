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

#ifndef DATABASE_AMOUNT_HPP
#define DATABASE_AMOUNT_HPP

#include <cstdint>

namespace bonds
{

/**
 * An amount of some asset in the ledger, in units of 10^-8 (the same as
 * Satoshi for CHI).
 */
using Amount = int64_t;

/** One full unit of an asset.  */
constexpr Amount COIN = 100000000;

/**
 * Highest valid value for an amount.  This is used to validate amounts
 * in moves, so that all arithmetic on them (with 128-bit intermediates
 * for products) is safe from overflows.
 */
constexpr Amount MAX_AMOUNT = 10000000000 * COIN;

} // namespace bonds

#endif // DATABASE_AMOUNT_HPP
