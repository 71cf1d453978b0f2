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

#include "matching.hpp"

#include "timewindow.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <sstream>

DEFINE_double (match_weight_price, 0.40,
               "weight of the price score in offer matching");
DEFINE_double (match_weight_trust, 0.35,
               "weight of the provider trust in offer matching");
DEFINE_double (match_weight_time, 0.25,
               "weight of the time-window fit in offer matching");
DEFINE_double (match_min_trust, 0.2,
               "minimum provider trust score for offers to be matched");
DEFINE_double (match_default_trust, 0.5,
               "trust assumed for providers without a record");

namespace enertrade
{

MatchingConfig
MatchingConfig::FromFlags ()
{
  MatchingConfig res;
  res.priceWeight = FLAGS_match_weight_price;
  res.trustWeight = FLAGS_match_weight_trust;
  res.timeWeight = FLAGS_match_weight_time;
  res.minTrust = FLAGS_match_min_trust;
  res.defaultTrust = FLAGS_match_default_trust;
  return res;
}

MatchingEngine::MatchingEngine (const MatchingConfig& cfg)
  : config(cfg)
{
  const double sum = config.priceWeight + config.trustWeight
                        + config.timeWeight;
  LOG_IF (WARNING, std::abs (sum - 1.0) > 1e-6)
      << "Matching weights sum to " << sum << " instead of 1";
}

namespace
{

/**
 * Ordering of the final result list.  Eligible offers come first in
 * descending score, then by trust and offer ID.  Excluded offers follow,
 * ordered just by ID.
 */
bool
RankBefore (const proto::ScoredOffer& a, const proto::ScoredOffer& b)
{
  if (a.matches_filters () != b.matches_filters ())
    return a.matches_filters ();

  if (a.matches_filters ())
    {
      if (a.score () != b.score ())
        return a.score () > b.score ();
      if (a.provider_trust () != b.provider_trust ())
        return a.provider_trust () > b.provider_trust ();
    }

  return a.offer ().id () < b.offer ().id ();
}

std::string
FormatNumber (const double val)
{
  std::ostringstream out;
  out << val;
  return out.str ();
}

} // anonymous namespace

proto::MatchResult
MatchingEngine::Match (
    const std::vector<proto::ScorableOffer>& offers,
    const std::map<std::string, proto::Provider>& providers,
    const proto::MatchCriteria& criteria) const
{
  const bool hasWindow = IsValidWindow (criteria.requested_window ());

  std::vector<proto::ScoredOffer> scored;
  scored.reserve (offers.size ());

  for (const auto& o : offers)
    {
      proto::ScoredOffer entry;
      *entry.mutable_offer () = o.offer ();
      if (o.has_source_type ())
        entry.set_source_type (o.source_type ());
      entry.set_available_blocks (o.available_blocks ());

      double trust = config.defaultTrust;
      const auto mit = providers.find (o.offer ().provider_id ());
      if (mit != providers.end ())
        trust = mit->second.trust_score ();
      entry.set_provider_trust (trust);

      if (hasWindow
            && !WindowsOverlap (o.offer ().window (),
                                criteria.requested_window ()))
        entry.add_filter_reasons ("time window does not overlap request");

      if (o.available_blocks () < 1)
        entry.add_filter_reasons ("no blocks available");

      if (criteria.has_max_price ()
            && o.offer ().price ().value () > criteria.max_price ())
        entry.add_filter_reasons (
            "price " + FormatNumber (o.offer ().price ().value ())
              + " exceeds maximum " + FormatNumber (criteria.max_price ()));

      if (trust < config.minTrust)
        entry.add_filter_reasons (
            "provider trust " + FormatNumber (trust)
              + " below minimum " + FormatNumber (config.minTrust));

      entry.set_matches_filters (entry.filter_reasons_size () == 0);
      scored.push_back (std::move (entry));
    }

  /* Price normalisation is relative to the offers that survived the
     filters of this very request.  */
  bool any = false;
  double minPrice = 0;
  double maxPrice = 0;
  for (const auto& entry : scored)
    {
      if (!entry.matches_filters ())
        continue;

      const double p = entry.offer ().price ().value ();
      if (!any || p < minPrice)
        minPrice = p;
      if (!any || p > maxPrice)
        maxPrice = p;
      any = true;
    }

  proto::MatchResult res;
  int64_t eligible = 0;
  for (auto& entry : scored)
    {
      if (!entry.matches_filters ())
        continue;
      ++eligible;

      double priceScore = 1.0;
      if (maxPrice > minPrice)
        priceScore = (maxPrice - entry.offer ().price ().value ())
                        / (maxPrice - minPrice);
      priceScore = std::max (0.0, std::min (1.0, priceScore));

      const double trustScore = entry.provider_trust ();

      double timeScore = 1.0;
      if (hasWindow)
        timeScore = TimeFit (entry.offer ().window (),
                             criteria.requested_window ());

      auto* breakdown = entry.mutable_breakdown ();
      breakdown->set_price_score (priceScore);
      breakdown->set_trust_score (trustScore);
      breakdown->set_time_fit_score (timeScore);

      entry.set_score (config.priceWeight * priceScore
                        + config.trustWeight * trustScore
                        + config.timeWeight * timeScore);
    }

  std::stable_sort (scored.begin (), scored.end (), &RankBefore);

  for (auto& entry : scored)
    *res.add_offers () = std::move (entry);
  res.set_eligible_count (eligible);
  if (eligible > 0)
    res.set_selected_offer_id (res.offers (0).offer ().id ());

  VLOG (1)
      << "Matched " << offers.size () << " offers, " << eligible
      << " eligible";

  return res;
}

} // namespace enertrade
