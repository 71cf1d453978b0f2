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

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <sstream>

DEFINE_double (trust_default_score, 0.3,
               "trust score assigned to newly onboarded parties");
DEFINE_double (trust_success_bonus, 0.02,
               "trust bonus for a fully delivered order");
DEFINE_double (trust_failure_penalty, 0.10,
               "maximum trust penalty for a failed delivery");
DEFINE_double (trust_cancel_penalty, 0.03,
               "trust penalty for a late buyer cancellation of a full order");
DEFINE_double (trust_seller_cancel_penalty, 0.05,
               "trust penalty for a seller cancellation of a full order");

namespace enertrade
{

namespace
{

/**
 * One entry of the static tier table.
 */
struct Tier
{
  double minScore;
  double limit;
  const char* name;
};

constexpr Tier TIERS[] =
  {
    {0.0, 10, "New"},
    {0.3, 20, "Starter"},
    {0.5, 40, "Bronze"},
    {0.7, 60, "Silver"},
    {0.85, 80, "Gold"},
    {0.95, 100, "Platinum"},
  };

constexpr size_t NUM_TIERS = sizeof (TIERS) / sizeof (TIERS[0]);

/**
 * Returns the index into TIERS of the tier a score belongs to.
 */
size_t
TierIndex (const double score)
{
  const double s = ClampTrust (score);

  size_t res = 0;
  for (size_t i = 0; i < NUM_TIERS; ++i)
    if (s >= TIERS[i].minScore)
      res = i;

  return res;
}

TrustUpdate
ApplyImpact (const double score, const double impact, const TrustConfig& cfg)
{
  TrustUpdate res;
  res.trustImpact = impact;
  res.newScore = ClampTrust (ClampTrust (score) + impact);
  res.newLimit = AllowedLimit (res.newScore, cfg);
  return res;
}

} // anonymous namespace

TrustConfig
TrustConfig::FromFlags ()
{
  TrustConfig res;
  res.defaultScore = ClampTrust (FLAGS_trust_default_score);
  res.successBonus = FLAGS_trust_success_bonus;
  res.failurePenalty = FLAGS_trust_failure_penalty;
  res.cancelPenalty = FLAGS_trust_cancel_penalty;
  res.sellerCancelPenalty = FLAGS_trust_seller_cancel_penalty;
  return res;
}

double
ClampTrust (const double score)
{
  if (std::isnan (score))
    return 0.0;

  return std::max (0.0, std::min (1.0, score));
}

double
AllowedLimit (const double score, const TrustConfig& cfg)
{
  const size_t ind = TierIndex (score);
  if (ind == 0)
    return cfg.defaultLimit;

  return TIERS[ind].limit;
}

double
AllowedTradeQuantity (const double capacity, const double score,
                      const TrustConfig& cfg)
{
  if (std::isnan (capacity) || capacity <= 0)
    return 0;

  return capacity * AllowedLimit (score, cfg) / 100;
}

double
DeliveryPenalty (const double expected, const double delivered,
                 const double basePenalty)
{
  if (!(expected > 0))
    return 0;

  const double got = std::max (0.0, std::min (delivered, expected));
  const double shortfall = 1.0 - got / expected;

  return basePenalty * std::max (0.0, std::min (1.0, shortfall));
}

TrustUpdate
UpdateAfterDelivery (const double score, const double delivered,
                     const double expected, const TrustConfig& cfg)
{
  if (!(expected > 0))
    {
      VLOG (1) << "Delivery verification without expected quantity";
      return ApplyImpact (score, 0, cfg);
    }

  if (delivered < expected)
    return ApplyImpact (
        score, -DeliveryPenalty (expected, delivered, cfg.failurePenalty), cfg);

  const double ratio = std::min (1.0, delivered / expected);
  return ApplyImpact (score, cfg.successBonus * ratio, cfg);
}

TrustUpdate
UpdateAfterCancel (const double score, const double cancelled,
                   const double total, const bool withinWindow,
                   const proto::Party party, const TrustConfig& cfg)
{
  if (!withinWindow)
    return ApplyImpact (score, 0, cfg);

  double ratio = 1.0;
  if (total > 0)
    ratio = std::max (0.0, std::min (1.0, cancelled / total));

  double base;
  switch (party)
    {
    case proto::BUYER:
      base = cfg.cancelPenalty;
      break;
    case proto::SELLER:
      base = cfg.sellerCancelPenalty;
      break;
    default:
      LOG (FATAL) << "Invalid party: " << static_cast<int> (party);
    }

  return ApplyImpact (score, -base * ratio, cfg);
}

TrustUpdate
UpdateAfterVerificationQuality (const double score,
                                const VerificationQuality quality,
                                const TrustConfig& cfg)
{
  double factor;
  switch (quality)
    {
    case VerificationQuality::HIGH:
      factor = 1.0;
      break;
    case VerificationQuality::MEDIUM:
      factor = 0.6;
      break;
    case VerificationQuality::LOW:
      factor = 0.3;
      break;
    default:
      LOG (FATAL) << "Invalid verification quality";
    }

  return ApplyImpact (score, cfg.successBonus * factor, cfg);
}

VerificationQuality
DetermineQuality (const double declaredCapacity, const double verifiedCapacity)
{
  if (!(declaredCapacity > 0) || !(verifiedCapacity > 0))
    return VerificationQuality::LOW;

  const double deviation
      = std::abs (verifiedCapacity - declaredCapacity) / declaredCapacity;

  if (deviation <= 0.10)
    return VerificationQuality::HIGH;
  if (deviation <= 0.20)
    return VerificationQuality::MEDIUM;
  return VerificationQuality::LOW;
}

std::string
TierDescription (const double score)
{
  const auto& tier = TIERS[TierIndex (score)];

  std::ostringstream out;
  out << tier.name << " (";
  if (tier.limit >= 100)
    out << "Full";
  else
    out << tier.limit << "%";
  out << " Trading)";

  return out.str ();
}

TierProgress
NextTierProgress (const double score)
{
  const double s = ClampTrust (score);
  const size_t ind = TierIndex (s);

  TierProgress res;
  res.currentTier = TIERS[ind].name;

  if (ind + 1 >= NUM_TIERS)
    {
      res.progress = 100;
      res.scoreNeeded = 0;
      return res;
    }

  const auto& cur = TIERS[ind];
  const auto& next = TIERS[ind + 1];
  res.nextTier = next.name;

  const double progress
      = (s - cur.minScore) / (next.minScore - cur.minScore) * 100;
  res.progress = std::max (0.0, std::min (100.0, progress));
  res.scoreNeeded = next.minScore - s;

  return res;
}

} // namespace enertrade
