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

#ifndef BONDS_PRICING_HPP
#define BONDS_PRICING_HPP

#include "errors.hpp"

#include "database/amount.hpp"
#include "proto/teller.pb.h"

#include <cstdint>

namespace bonds
{

/**
 * Prices are given as amount of principal per full coin of reward,
 * i.e. with 8 decimal digits of precision.
 */
constexpr Amount PRICE_PRECISION = COIN;

/** Upper bound for all prices.  Bumped prices saturate here.  */
constexpr Amount MAX_PRICE = MAX_AMOUNT;

/**
 * Computes the current price of a teller at the given time, based on
 * its terms and the decay anchor (next_price and last_price_update).
 * The excess of the anchor over the minimum price halves with every
 * full half-life elapsed, and decreases linearly within a half-life.
 *
 * The teller must have terms set.
 */
Amount CurrentPrice (const proto::Teller& pb, int64_t now);

/**
 * Returns the new anchor price after a deposit with the given payout,
 * when the price has decayed to "decayed" at the time of the deposit.
 */
Amount AdjustedNextPrice (Amount decayed, Amount payout,
                          const proto::TellerTerms& terms);

/**
 * Computes the payout for depositing the given amount of principal.
 * On success, the payout is returned through the "payout" argument.
 */
ErrorCode CalculateAmountOut (const proto::Teller& pb, int64_t now,
                              Amount amountIn, Amount& payout);

/**
 * Computes the amount of principal needed for the given payout.
 */
ErrorCode CalculateAmountIn (const proto::Teller& pb, int64_t now,
                             Amount amountOut, Amount& amountIn);

} // namespace bonds

#endif // BONDS_PRICING_HPP
