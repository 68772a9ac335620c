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

#include "pricing.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace bonds
{

namespace
{

/** 128-bit integer type for intermediate products.  */
using Wide = __int128;

/**
 * Checks the capacity and maximum payout for a quote.  It is assumed that
 * the price is non-zero.
 */
ErrorCode
CheckQuoteLimits (const proto::TellerTerms& terms,
                  const Amount amountIn, const Amount payout)
{
  if (payout > terms.max_payout ())
    return ErrorCode::TOO_LARGE;

  const Amount used = terms.capacity_is_payout () ? payout : amountIn;
  if (used > terms.capacity ())
    return ErrorCode::AT_CAPACITY;

  return ErrorCode::OK;
}

} // anonymous namespace

Amount
CurrentPrice (const proto::Teller& pb, const int64_t now)
{
  CHECK (pb.has_terms ());
  const auto& terms = pb.terms ();
  const Amount minPrice = terms.minimum_price ();

  if (pb.next_price () <= minPrice)
    return minPrice;

  const int64_t halfLife = terms.half_life ();
  CHECK_GT (halfLife, 0);

  const int64_t elapsed = std::max<int64_t> (0, now - pb.last_price_update ());
  const int64_t halvings = elapsed / halfLife;
  if (halvings >= 63)
    return minPrice;

  Amount excess = (pb.next_price () - minPrice) >> halvings;
  const Wide partial = static_cast<Wide> (excess) * (elapsed % halfLife);
  excess -= static_cast<Amount> (partial / halfLife / 2);
  CHECK_GE (excess, 0);

  return minPrice + excess;
}

Amount
AdjustedNextPrice (const Amount decayed, const Amount payout,
                   const proto::TellerTerms& terms)
{
  CHECK_GE (decayed, 0);
  CHECK_GE (payout, 0);

  const Wide num = terms.price_adj_num ();
  const Wide denom = terms.price_adj_denom ();
  CHECK_NE (denom, 0);

  /* The bump is decayed * payout * num / denom, with payout in fixed-point
     units.  We split the division by the denominator so that the product
     stays well within 128 bits for all valid amounts.  */
  const Wide delta = static_cast<Wide> (decayed) * payout / PRICE_PRECISION;
  const Wide quot = delta / denom;
  const Wide rem = delta % denom;
  if (num != 0 && quot > MAX_PRICE / num)
    return MAX_PRICE;
  Wide bump = quot * num + rem * num / denom;

  bump += decayed;
  if (bump > MAX_PRICE)
    return MAX_PRICE;

  return static_cast<Amount> (bump);
}

ErrorCode
CalculateAmountOut (const proto::Teller& pb, const int64_t now,
                    const Amount amountIn, Amount& payout)
{
  CHECK_GE (amountIn, 0);
  if (!pb.has_terms ())
    return ErrorCode::NOT_INITIALISED;

  const Amount price = CurrentPrice (pb, now);
  if (price == 0)
    return ErrorCode::ZERO_PRICE;

  const Wide out = static_cast<Wide> (amountIn) * PRICE_PRECISION / price;
  if (out > MAX_AMOUNT)
    return ErrorCode::TOO_LARGE;

  const ErrorCode err
      = CheckQuoteLimits (pb.terms (), amountIn, static_cast<Amount> (out));
  if (err != ErrorCode::OK)
    return err;

  payout = static_cast<Amount> (out);
  return ErrorCode::OK;
}

ErrorCode
CalculateAmountIn (const proto::Teller& pb, const int64_t now,
                   const Amount amountOut, Amount& amountIn)
{
  CHECK_GE (amountOut, 0);
  if (!pb.has_terms ())
    return ErrorCode::NOT_INITIALISED;

  const Amount price = CurrentPrice (pb, now);
  if (price == 0)
    return ErrorCode::ZERO_PRICE;

  const Wide in = static_cast<Wide> (amountOut) * price / PRICE_PRECISION;
  if (in > MAX_AMOUNT)
    return ErrorCode::TOO_LARGE;

  const ErrorCode err
      = CheckQuoteLimits (pb.terms (), static_cast<Amount> (in), amountOut);
  if (err != ErrorCode::OK)
    return err;

  amountIn = static_cast<Amount> (in);
  return ErrorCode::OK;
}

} // namespace bonds
