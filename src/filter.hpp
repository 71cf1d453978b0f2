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

#ifndef ENERTRADE_FILTER_HPP
#define ENERTRADE_FILTER_HPP

#include "proto/catalog.pb.h"
#include "proto/matching.pb.h"

#include <cstdint>
#include <string>

namespace enertrade
{

/**
 * Catalog-level restrictions applied before matching, either parsed
 * from a textual filter expression or taken from structured intent.
 */
class OfferFilter
{

private:

  /** Whether a source type is required.  */
  bool hasSourceType = false;

  proto::CatalogItem::SourceType sourceType = proto::CatalogItem::OTHER;

  /** Minimum number of available blocks.  */
  int64_t minAvailable = 0;

public:

  OfferFilter () = default;
  OfferFilter (const OfferFilter&) = default;
  OfferFilter& operator= (const OfferFilter&) = default;

  /**
   * Parses a filter expression.  The supported conditions are
   * "sourceType = 'SOLAR'" (also with "==", optional quotes and any case)
   * and "availableQuantity >= N" (or "> N"), joined in any way.  Parts of
   * the expression that are not understood are ignored.
   */
  static OfferFilter Parse (const std::string& expr);

  void
  RequireSourceType (const proto::CatalogItem::SourceType t)
  {
    hasSourceType = true;
    sourceType = t;
  }

  void
  RequireAvailable (const int64_t n)
  {
    minAvailable = n;
  }

  bool
  HasSourceType () const
  {
    return hasSourceType;
  }

  proto::CatalogItem::SourceType
  GetSourceType () const
  {
    return sourceType;
  }

  int64_t
  GetMinAvailable () const
  {
    return minAvailable;
  }

  /**
   * Returns true if the offer passes all conditions.
   */
  bool Matches (const proto::ScorableOffer& offer) const;

};

} // namespace enertrade

#endif // ENERTRADE_FILTER_HPP
