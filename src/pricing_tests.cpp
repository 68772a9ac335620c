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

#include <google/protobuf/text_format.h>

#include <gtest/gtest.h>

#include <glog/logging.h>

namespace bonds
{
namespace
{

using google::protobuf::TextFormat;

class PricingTests : public testing::Test
{

protected:

  proto::Teller pb;

  PricingTests ()
  {
    CHECK (TextFormat::ParseFromString (R"(
      terms:
        {
          start_price: 200000000
          minimum_price: 0
          max_payout: 1000000000000
          price_adj_num: 1
          price_adj_denom: 10
          capacity: 1000000000
          capacity_is_payout: false
          start_time: 0
          end_time: 1000000
          global_vesting_term: 10000
          half_life: 1000
        }
      next_price: 200000000
      last_price_update: 0
    )", &pb));
  }

};

TEST_F (PricingTests, NoDecayAtAnchor)
{
  EXPECT_EQ (CurrentPrice (pb, 0), 2 * COIN);
}

TEST_F (PricingTests, HalvingPerHalfLife)
{
  EXPECT_EQ (CurrentPrice (pb, 1'000), COIN);
  EXPECT_EQ (CurrentPrice (pb, 2'000), COIN / 2);
  EXPECT_EQ (CurrentPrice (pb, 3'000), COIN / 4);
}

TEST_F (PricingTests, LinearWithinHalfLife)
{
  EXPECT_EQ (CurrentPrice (pb, 500), 150'000'000);
  EXPECT_EQ (CurrentPrice (pb, 1'500), 75'000'000);
}

TEST_F (PricingTests, TimeBeforeAnchor)
{
  pb.set_last_price_update (100);
  EXPECT_EQ (CurrentPrice (pb, 50), 2 * COIN);
}

TEST_F (PricingTests, MinimumPriceFloor)
{
  pb.mutable_terms ()->set_minimum_price (COIN);
  EXPECT_EQ (CurrentPrice (pb, 0), 2 * COIN);
  EXPECT_EQ (CurrentPrice (pb, 1'000), COIN + COIN / 2);
  EXPECT_EQ (CurrentPrice (pb, 100'000), COIN);
  EXPECT_EQ (CurrentPrice (pb, 1'000'000'000), COIN);

  pb.set_next_price (COIN / 2);
  EXPECT_EQ (CurrentPrice (pb, 0), COIN);
}

TEST_F (PricingTests, DecayIsMonotone)
{
  pb.mutable_terms ()->set_minimum_price (12'345);
  pb.set_next_price (987'654'321);
  pb.mutable_terms ()->set_half_life (777);

  Amount last = CurrentPrice (pb, 0);
  for (int64_t t = 1; t < 30'000; t += 13)
    {
      const Amount cur = CurrentPrice (pb, t);
      ASSERT_LE (cur, last) << "Price increased at time " << t;
      ASSERT_GE (cur, 12'345);
      last = cur;
    }
  EXPECT_EQ (last, 12'345);
}

TEST_F (PricingTests, AdjustedNextPrice)
{
  EXPECT_EQ (AdjustedNextPrice (2 * COIN, 0, pb.terms ()), 2 * COIN);
  EXPECT_EQ (AdjustedNextPrice (2 * COIN, COIN, pb.terms ()),
             2 * COIN + 20'000'000);
  EXPECT_EQ (AdjustedNextPrice (2 * COIN, 3 * COIN / 2, pb.terms ()),
             2 * COIN + 30'000'000);

  pb.mutable_terms ()->set_price_adj_num (0);
  EXPECT_EQ (AdjustedNextPrice (2 * COIN, COIN, pb.terms ()), 2 * COIN);
}

TEST_F (PricingTests, AdjustedNextPriceSaturates)
{
  pb.mutable_terms ()->set_price_adj_num (1'000'000);
  pb.mutable_terms ()->set_price_adj_denom (1);
  EXPECT_EQ (AdjustedNextPrice (MAX_PRICE, MAX_AMOUNT, pb.terms ()),
             MAX_PRICE);
  EXPECT_EQ (AdjustedNextPrice (COIN, MAX_AMOUNT, pb.terms ()), MAX_PRICE);
}

TEST_F (PricingTests, AmountOut)
{
  Amount payout;
  ASSERT_EQ (CalculateAmountOut (pb, 0, 3 * COIN, payout), ErrorCode::OK);
  EXPECT_EQ (payout, 150'000'000);

  ASSERT_EQ (CalculateAmountOut (pb, 1'000, 3 * COIN, payout), ErrorCode::OK);
  EXPECT_EQ (payout, 3 * COIN);
}

TEST_F (PricingTests, AmountIn)
{
  Amount amountIn;
  ASSERT_EQ (CalculateAmountIn (pb, 0, 150'000'000, amountIn), ErrorCode::OK);
  EXPECT_EQ (amountIn, 3 * COIN);
}

TEST_F (PricingTests, QuoteErrors)
{
  Amount res = 42;

  proto::Teller noTerms;
  EXPECT_EQ (CalculateAmountOut (noTerms, 0, COIN, res),
             ErrorCode::NOT_INITIALISED);
  EXPECT_EQ (CalculateAmountIn (noTerms, 0, COIN, res),
             ErrorCode::NOT_INITIALISED);

  pb.mutable_terms ()->set_max_payout (COIN);
  EXPECT_EQ (CalculateAmountOut (pb, 0, 3 * COIN, res), ErrorCode::TOO_LARGE);
  EXPECT_EQ (CalculateAmountIn (pb, 0, COIN + 1, res), ErrorCode::TOO_LARGE);

  pb.mutable_terms ()->set_max_payout (100 * COIN);
  pb.mutable_terms ()->set_capacity (2 * COIN);
  EXPECT_EQ (CalculateAmountOut (pb, 0, 3 * COIN, res),
             ErrorCode::AT_CAPACITY);
  EXPECT_EQ (CalculateAmountIn (pb, 0, 3 * COIN / 2, res),
             ErrorCode::AT_CAPACITY);

  pb.mutable_terms ()->set_capacity_is_payout (true);
  pb.mutable_terms ()->set_capacity (COIN);
  EXPECT_EQ (CalculateAmountOut (pb, 0, 3 * COIN, res),
             ErrorCode::AT_CAPACITY);
  EXPECT_EQ (CalculateAmountOut (pb, 0, 2 * COIN, res), ErrorCode::OK);

  EXPECT_EQ (CalculateAmountIn (pb, 0, MAX_AMOUNT, res),
             ErrorCode::TOO_LARGE);
}

TEST_F (PricingTests, ZeroPrice)
{
  pb.set_next_price (0);
  Amount res;
  EXPECT_EQ (CalculateAmountOut (pb, 0, COIN, res), ErrorCode::ZERO_PRICE);
  EXPECT_EQ (CalculateAmountIn (pb, 0, COIN, res), ErrorCode::ZERO_PRICE);

  pb.set_next_price (1);
  EXPECT_EQ (CalculateAmountOut (pb, 1'000, COIN, res),
             ErrorCode::ZERO_PRICE);
}

TEST_F (PricingTests, RoundTripOnlyLoses)
{
  pb.set_next_price (312'345'677);
  pb.mutable_terms ()->set_capacity (MAX_AMOUNT);
  pb.mutable_terms ()->set_max_payout (MAX_AMOUNT);

  for (const Amount x : {Amount (1), Amount (99), Amount (123'456'789),
                         Amount (7 * COIN + 3), Amount (1'000'000 * COIN)})
    {
      Amount out, in;
      ASSERT_EQ (CalculateAmountOut (pb, 17, x, out), ErrorCode::OK);
      ASSERT_EQ (CalculateAmountIn (pb, 17, out, in), ErrorCode::OK);
      EXPECT_LE (in, x);

      ASSERT_EQ (CalculateAmountIn (pb, 17, x, in), ErrorCode::OK);
      ASSERT_EQ (CalculateAmountOut (pb, 17, in, out), ErrorCode::OK);
      EXPECT_LE (out, x);
    }
}

} // anonymous namespace
} // namespace bonds
