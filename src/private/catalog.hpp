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

#ifndef ENERTRADE_CATALOG_HPP
#define ENERTRADE_CATALOG_HPP

#include "private/blockledger.hpp"
#include "private/database.hpp"
#include "proto/catalog.pb.h"
#include "proto/error.pb.h"
#include "proto/matching.pb.h"

#include <map>
#include <string>
#include <vector>

namespace enertrade
{

/**
 * The catalog of providers, their items and offers.  Entries are synced
 * (upserted) by providers; the transaction engine only reads them, except
 * for provider statistics that the order state machine updates.
 */
class Catalog
{

private:

  Database& db;

  /** The ledger, used to create blocks for new offers.  */
  BlockLedger& ledger;

  /** Trust score given to providers synced without one.  */
  const double defaultTrust;

  /**
   * Checks the fields of an offer for validity.
   */
  static bool ValidateOffer (const proto::Offer& offer, proto::Error& err);

public:

  explicit Catalog (Database& d, BlockLedger& l, double trust);

  Catalog () = delete;
  Catalog (const Catalog&) = delete;
  void operator= (const Catalog&) = delete;

  /**
   * Inserts or updates a provider.  For existing providers, only the
   * descriptive data is updated; trust and order statistics are kept.
   */
  bool SyncProvider (const proto::Provider& provider, proto::Error& err);

  bool SyncItem (const proto::CatalogItem& item, proto::Error& err);

  /**
   * Inserts or updates an offer.  Blocks are created when the offer is new.
   * For existing offers, blocks keep their price and window snapshot unless
   * resync is set, in which case all available blocks are updated.
   */
  bool SyncOffer (const proto::Offer& offer, bool resync, proto::Error& err);

  /**
   * Deletes an offer and its blocks.  This fails with OFFER_IN_USE while
   * any block is reserved or sold.
   */
  bool DeleteOffer (const std::string& id, proto::Error& err);

  /**
   * Returns the full catalog.  The max_qty of each offer is the number of
   * blocks that are currently available.
   */
  proto::Catalog GetCatalog ();

  /**
   * Returns all offers with their source type and live availability,
   * as input to matching.
   */
  std::vector<proto::ScorableOffer> GetScorableOffers ();

  std::map<std::string, proto::Provider> GetProviders ();

  bool GetOffer (const std::string& id, proto::Offer& offer);
  bool GetItem (const std::string& id, proto::CatalogItem& item);

  bool GetProvider (Connection& conn, const std::string& id,
                    proto::Provider& provider);
  bool GetProvider (const std::string& id, proto::Provider& provider);

  /**
   * Writes the trust score and order statistics of a provider.
   */
  void UpdateProviderStats (Connection& conn, const proto::Provider& provider);

};

} // namespace enertrade

#endif // ENERTRADE_CATALOG_HPP
