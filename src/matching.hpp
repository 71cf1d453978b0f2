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

#ifndef ENERTRADE_MATCHING_HPP
#define ENERTRADE_MATCHING_HPP

#include "proto/catalog.pb.h"
#include "proto/matching.pb.h"

#include <map>
#include <string>
#include <vector>

namespace enertrade
{

/**
 * Parameters of the matching engine.
 */
struct MatchingConfig
{

  double priceWeight = 0.40;
  double trustWeight = 0.35;
  double timeWeight = 0.25;

  /** Providers with lower trust are filtered out.  */
  double minTrust = 0.2;

  /** Trust assumed for providers we have no record of.  */
  double defaultTrust = 0.5;

  /**
   * Returns the configuration from command-line flags.
   */
  static MatchingConfig FromFlags ();

};

/**
 * Ranks offers against a buyer's criteria.  Offers are first checked
 * against hard filters, and those passing are scored with a weighted sum
 * of price, provider trust and time-window fit.  The engine has no state
 * besides its configuration.
 */
class MatchingEngine
{

private:

  const MatchingConfig config;

public:

  explicit MatchingEngine (const MatchingConfig& cfg);

  MatchingEngine () = delete;
  MatchingEngine (const MatchingEngine&) = delete;
  void operator= (const MatchingEngine&) = delete;

  /**
   * Matches the given offers against the criteria.  Every offer is part
   * of the result; offers excluded by a hard filter are annotated with
   * the reasons and sorted after all eligible ones.
   */
  proto::MatchResult Match (
      const std::vector<proto::ScorableOffer>& offers,
      const std::map<std::string, proto::Provider>& providers,
      const proto::MatchCriteria& criteria) const;

};

} // namespace enertrade

#endif // ENERTRADE_MATCHING_HPP
