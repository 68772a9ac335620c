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

#ifndef BONDS_JSONUTILS_HPP
#define BONDS_JSONUTILS_HPP

#include "database/amount.hpp"
#include "database/database.hpp"

#include <json/json.h>

#include <string>

namespace bonds
{

/**
 * Parses an asset amount (in units of 1e-8) from JSON, and verifies that
 * it is in range, i.e. within [0, MAX_AMOUNT].
 */
bool AssetAmountFromJson (const Json::Value& val, Amount& amount);

/**
 * Parses an ID value (bond or lock) encoded in JSON.  Returns true if
 * one was found.
 */
bool IdFromJson (const Json::Value& val, Database::IdT& id);

/**
 * Parses a timestamp or duration in seconds, which must be a non-negative
 * integer.
 */
bool TimeFromJson (const Json::Value& val, int64_t& t);

/**
 * Parses an address (account name) from JSON.  Any string is accepted,
 * including the empty "zero address"; whether it is valid in a particular
 * place is up to the caller.
 */
bool AddressFromJson (const Json::Value& val, std::string& addr);

/**
 * Converts an integer value to the proper JSON representation.
 */
template <typename T>
  Json::Value IntToJson (T val);

} // namespace bonds

#endif // BONDS_JSONUTILS_HPP
