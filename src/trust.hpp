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

#ifndef ENERTRADE_TRUST_HPP
#define ENERTRADE_TRUST_HPP

#include "proto/orders.pb.h"

#include <string>

namespace enertrade
{

/**
 * Tunable parameters of the trust engine.
 */
struct TrustConfig
{

  /** Trust score of a newly onboarded party.  */
  double defaultScore = 0.3;

  /** Trading limit (percent of capacity) of the lowest tier.  */
  double defaultLimit = 10;

  /** Bonus for a fully delivered order.  */
  double successBonus = 0.02;

  /** Maximum penalty for a failed delivery.  */
  double failurePenalty = 0.10;

  /** Penalty for a buyer cancelling a whole order late.  */
  double cancelPenalty = 0.03;

  /** Penalty for a seller cancelling a whole order.  */
  double sellerCancelPenalty = 0.05;

  /**
   * Returns the configuration as set by the command-line flags.
   */
  static TrustConfig FromFlags ();

};

/**
 * Result of applying some event to a trust score.
 */
struct TrustUpdate
{
  double newScore;
  double newLimit;
  double trustImpact;
};

/**
 * Confidence in a capacity verification performed at onboarding.
 */
enum class VerificationQuality
{
  HIGH,
  MEDIUM,
  LOW,
};

/**
 * Where a score stands relative to the tier table.
 */
struct TierProgress
{
  std::string currentTier;

  /** Name of the next tier, empty if already at the top.  */
  std::string nextTier;

  /** Progress towards the next tier in percent.  */
  double progress;

  /** Absolute score increase needed to reach the next tier.  */
  double scoreNeeded;
};

/**
 * Clamps a score into [0, 1].  NaN is mapped to zero.
 */
double ClampTrust (double score);

/**
 * Returns the percentage of declared capacity a party with the given
 * trust score may trade.
 */
double AllowedLimit (double score, const TrustConfig& cfg = TrustConfig ());

/**
 * Returns the quantity a party may trade based on its declared capacity
 * and trust score.  Non-positive capacity yields zero.
 */
double AllowedTradeQuantity (double capacity, double score,
                             const TrustConfig& cfg = TrustConfig ());

/**
 * Computes the penalty for a delivery shortfall, linear between zero
 * (full delivery) and the base penalty (nothing delivered).
 */
double DeliveryPenalty (double expected, double delivered, double basePenalty);

TrustUpdate UpdateAfterDelivery (double score, double delivered,
                                 double expected,
                                 const TrustConfig& cfg = TrustConfig ());

/**
 * Applies the penalty for cancelling the given quantity of an order.
 * Cancellations outside the penalty window leave the score unchanged.
 */
TrustUpdate UpdateAfterCancel (double score, double cancelled, double total,
                               bool withinWindow, proto::Party party,
                               const TrustConfig& cfg = TrustConfig ());

TrustUpdate UpdateAfterVerificationQuality (
    double score, VerificationQuality quality,
    const TrustConfig& cfg = TrustConfig ());

/**
 * Grades how well a verified capacity confirms the declared one.
 */
VerificationQuality DetermineQuality (double declaredCapacity,
                                      double verifiedCapacity);

std::string TierDescription (double score);
TierProgress NextTierProgress (double score);

} // namespace enertrade

#endif // ENERTRADE_TRUST_HPP
