/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

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

#include "trust.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace enertrade
{
namespace
{

constexpr double EPS = 1e-9;

class TrustTests : public testing::Test
{

protected:

  TrustConfig cfg;

};

TEST_F (TrustTests, Clamping)
{
  EXPECT_EQ (ClampTrust (-0.1), 0.0);
  EXPECT_EQ (ClampTrust (1.5), 1.0);
  EXPECT_EQ (ClampTrust (0.42), 0.42);
  EXPECT_EQ (ClampTrust (std::numeric_limits<double>::quiet_NaN ()), 0.0);
}

TEST_F (TrustTests, TierBoundaries)
{
  EXPECT_EQ (AllowedLimit (0.0, cfg), 10);
  EXPECT_EQ (AllowedLimit (0.29, cfg), 10);
  EXPECT_EQ (AllowedLimit (0.3, cfg), 20);
  EXPECT_EQ (AllowedLimit (0.49, cfg), 20);
  EXPECT_EQ (AllowedLimit (0.5, cfg), 40);
  EXPECT_EQ (AllowedLimit (0.69, cfg), 40);
  EXPECT_EQ (AllowedLimit (0.7, cfg), 60);
  EXPECT_EQ (AllowedLimit (0.85, cfg), 80);
  EXPECT_EQ (AllowedLimit (0.95, cfg), 100);
  EXPECT_EQ (AllowedLimit (1.0, cfg), 100);
}

TEST_F (TrustTests, DefaultLimitForLowestTier)
{
  cfg.defaultLimit = 5;
  EXPECT_EQ (AllowedLimit (0.1, cfg), 5);
  EXPECT_EQ (AllowedLimit (0.3, cfg), 20);
}

TEST_F (TrustTests, AllowedTradeQuantity)
{
  EXPECT_DOUBLE_EQ (AllowedTradeQuantity (100, 0.5, cfg), 40);
  EXPECT_DOUBLE_EQ (AllowedTradeQuantity (250, 0.96, cfg), 250);
  EXPECT_EQ (AllowedTradeQuantity (0, 0.96, cfg), 0);
  EXPECT_EQ (AllowedTradeQuantity (-10, 0.96, cfg), 0);
}

TEST_F (TrustTests, DeliveryPenalty)
{
  EXPECT_EQ (DeliveryPenalty (10, 10, 0.1), 0);
  EXPECT_NEAR (DeliveryPenalty (10, 5, 0.1), 0.05, EPS);
  EXPECT_NEAR (DeliveryPenalty (10, 0, 0.1), 0.1, EPS);
  EXPECT_EQ (DeliveryPenalty (10, 15, 0.1), 0);
  EXPECT_EQ (DeliveryPenalty (0, 5, 0.1), 0);
}

TEST_F (TrustTests, DeliveryPenaltyMonotonic)
{
  double last = DeliveryPenalty (20, 0, 0.1);
  for (int delivered = 1; delivered <= 20; ++delivered)
    {
      const double cur = DeliveryPenalty (20, delivered, 0.1);
      EXPECT_LE (cur, last);
      last = cur;
    }
}

TEST_F (TrustTests, UpdateAfterDelivery)
{
  auto upd = UpdateAfterDelivery (0.5, 10, 10, cfg);
  EXPECT_NEAR (upd.newScore, 0.52, EPS);
  EXPECT_NEAR (upd.trustImpact, 0.02, EPS);
  EXPECT_EQ (upd.newLimit, 40);

  upd = UpdateAfterDelivery (0.5, 5, 10, cfg);
  EXPECT_NEAR (upd.newScore, 0.45, EPS);
  EXPECT_NEAR (upd.trustImpact, -0.05, EPS);

  upd = UpdateAfterDelivery (0.5, 3, 0, cfg);
  EXPECT_EQ (upd.trustImpact, 0);
  EXPECT_EQ (upd.newScore, 0.5);

  upd = UpdateAfterDelivery (0.99, 10, 10, cfg);
  EXPECT_EQ (upd.newScore, 1.0);

  upd = UpdateAfterDelivery (0.05, 0, 10, cfg);
  EXPECT_EQ (upd.newScore, 0.0);
}

TEST_F (TrustTests, UpdateAfterCancel)
{
  auto upd = UpdateAfterCancel (0.5, 10, 10, false, proto::BUYER, cfg);
  EXPECT_EQ (upd.trustImpact, 0);
  EXPECT_EQ (upd.newScore, 0.5);

  upd = UpdateAfterCancel (0.5, 10, 10, true, proto::BUYER, cfg);
  EXPECT_NEAR (upd.trustImpact, -0.03, EPS);
  EXPECT_NEAR (upd.newScore, 0.47, EPS);

  upd = UpdateAfterCancel (0.5, 5, 10, true, proto::BUYER, cfg);
  EXPECT_NEAR (upd.trustImpact, -0.015, EPS);

  upd = UpdateAfterCancel (0.5, 10, 10, true, proto::SELLER, cfg);
  EXPECT_NEAR (upd.trustImpact, -0.05, EPS);
  EXPECT_NEAR (upd.newScore, 0.45, EPS);
  EXPECT_EQ (upd.newLimit, 20);
}

TEST_F (TrustTests, DetermineQuality)
{
  EXPECT_EQ (DetermineQuality (100, 100), VerificationQuality::HIGH);
  EXPECT_EQ (DetermineQuality (100, 95), VerificationQuality::HIGH);
  EXPECT_EQ (DetermineQuality (100, 110), VerificationQuality::HIGH);
  EXPECT_EQ (DetermineQuality (100, 85), VerificationQuality::MEDIUM);
  EXPECT_EQ (DetermineQuality (100, 70), VerificationQuality::LOW);
  EXPECT_EQ (DetermineQuality (0, 50), VerificationQuality::LOW);
  EXPECT_EQ (DetermineQuality (50, 0), VerificationQuality::LOW);
}

TEST_F (TrustTests, UpdateAfterVerificationQuality)
{
  EXPECT_NEAR (UpdateAfterVerificationQuality (
                   0.3, VerificationQuality::HIGH, cfg).newScore,
               0.32, EPS);
  EXPECT_NEAR (UpdateAfterVerificationQuality (
                   0.3, VerificationQuality::MEDIUM, cfg).newScore,
               0.312, EPS);
  EXPECT_NEAR (UpdateAfterVerificationQuality (
                   0.3, VerificationQuality::LOW, cfg).newScore,
               0.306, EPS);
}

TEST_F (TrustTests, TierDescription)
{
  EXPECT_EQ (TierDescription (0.1), "New (10% Trading)");
  EXPECT_EQ (TierDescription (0.3), "Starter (20% Trading)");
  EXPECT_EQ (TierDescription (0.5), "Bronze (40% Trading)");
  EXPECT_EQ (TierDescription (0.8), "Silver (60% Trading)");
  EXPECT_EQ (TierDescription (0.9), "Gold (80% Trading)");
  EXPECT_EQ (TierDescription (0.96), "Platinum (Full Trading)");
}

TEST_F (TrustTests, NextTierProgress)
{
  auto p = NextTierProgress (0.4);
  EXPECT_EQ (p.currentTier, "Starter");
  EXPECT_EQ (p.nextTier, "Bronze");
  EXPECT_NEAR (p.progress, 50, 1e-6);
  EXPECT_NEAR (p.scoreNeeded, 0.1, EPS);

  p = NextTierProgress (0.97);
  EXPECT_EQ (p.currentTier, "Platinum");
  EXPECT_EQ (p.nextTier, "");
  EXPECT_EQ (p.progress, 100);
  EXPECT_EQ (p.scoreNeeded, 0);
}

} // anonymous namespace
} // namespace enertrade
