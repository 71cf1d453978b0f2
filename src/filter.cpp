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

#include "filter.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace enertrade
{

OfferFilter
OfferFilter::Parse (const std::string& expr)
{
  OfferFilter res;

  static const std::regex sourceRe(
      R"(sourceType\s*={1,2}\s*['"]?([A-Za-z]+)['"]?)",
      std::regex::icase);
  static const std::regex availableRe(
      R"(availableQuantity\s*(>=|>)\s*(\d{1,15}))",
      std::regex::icase);

  std::smatch m;
  if (std::regex_search (expr, m, sourceRe))
    {
      std::string name = m[1].str ();
      std::transform (name.begin (), name.end (), name.begin (),
                      [] (const unsigned char c)
                        {
                          return std::toupper (c);
                        });

      proto::CatalogItem::SourceType t;
      if (proto::CatalogItem::SourceType_Parse (name, &t))
        res.RequireSourceType (t);
      else
        LOG (WARNING) << "Unknown source type in filter: " << m[1].str ();
    }

  if (std::regex_search (expr, m, availableRe))
    {
      int64_t n = std::stoll (m[2].str ());
      if (m[1].str () == ">")
        ++n;
      res.RequireAvailable (n);
    }

  VLOG (1)
      << "Parsed filter '" << expr << "': source type "
      << (res.hasSourceType
            ? proto::CatalogItem::SourceType_Name (res.sourceType)
            : std::string ("any"))
      << ", min available " << res.minAvailable;

  return res;
}

bool
OfferFilter::Matches (const proto::ScorableOffer& offer) const
{
  if (hasSourceType && offer.source_type () != sourceType)
    return false;

  return offer.available_blocks () >= minAvailable;
}

} // namespace enertrade
