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

#include "private/catalog.hpp"

#include "timewindow.hpp"
#include "trust.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <string>

DEFINE_int64 (max_offer_blocks, 100'000,
              "maximum number of blocks a single offer may have");

namespace enertrade
{

namespace
{

constexpr const char* OFFER_COLUMNS = R"(
  `id`, `item_id`, `provider_id`, `price`, `currency`, `max_qty`,
  `window_start`, `window_end`, `pricing_model`, `settlement_type`
)";

proto::Offer
ReadOffer (const Statement& stmt)
{
  proto::Offer res;
  res.set_id (stmt.Get<std::string> (0));
  res.set_item_id (stmt.Get<std::string> (1));
  res.set_provider_id (stmt.Get<std::string> (2));
  res.mutable_price ()->set_value (stmt.Get<double> (3));
  res.mutable_price ()->set_currency (stmt.Get<std::string> (4));
  res.set_max_qty (stmt.Get<int64_t> (5));
  res.mutable_window ()->set_start (stmt.Get<int64_t> (6));
  res.mutable_window ()->set_end (stmt.Get<int64_t> (7));

  const auto model = stmt.Get<std::string> (8);
  if (!model.empty ())
    res.set_pricing_model (model);
  const auto settlement = stmt.Get<std::string> (9);
  if (!settlement.empty ())
    res.set_settlement_type (settlement);

  return res;
}

proto::Provider
ReadProvider (const Statement& stmt)
{
  proto::Provider res;
  res.set_id (stmt.Get<std::string> (0));
  res.set_name (stmt.Get<std::string> (1));
  res.set_trust_score (stmt.Get<double> (2));
  res.set_total_orders (stmt.Get<unsigned> (3));
  res.set_successful_orders (stmt.Get<unsigned> (4));
  return res;
}

proto::CatalogItem
ReadItemBlob (const Statement& stmt, const int col)
{
  proto::CatalogItem res;
  CHECK (res.ParseFromString (stmt.Get<std::string> (col)))
      << "Invalid catalog item data in database";
  return res;
}

} // anonymous namespace

Catalog::Catalog (Database& d, BlockLedger& l, const double trust)
  : db(d), ledger(l), defaultTrust(ClampTrust (trust))
{}

bool
Catalog::SyncProvider (const proto::Provider& provider, proto::Error& err)
{
  if (provider.id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION, "provider ID is missing");
      return false;
    }

  double trust = defaultTrust;
  if (provider.has_trust_score ())
    trust = ClampTrust (provider.trust_score ());

  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        INSERT INTO `providers` (`id`, `name`, `trust_score`)
          VALUES (?1, ?2, ?3)
          ON CONFLICT (`id`) DO UPDATE SET `name` = excluded.`name`
      )");
      stmt.Bind (1, provider.id ());
      stmt.Bind (2, provider.name ());
      stmt.Bind (3, trust);
      stmt.Execute ();
    });

  LOG (INFO) << "Synced provider " << provider.id ();
  return true;
}

bool
Catalog::SyncItem (const proto::CatalogItem& item, proto::Error& err)
{
  if (item.id ().empty () || item.provider_id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "item ID and provider ID are required");
      return false;
    }
  if (!item.has_source_type ())
    {
      SetError (err, proto::Error::VALIDATION, "item has no source type");
      return false;
    }
  for (const auto& w : item.production_windows ())
    if (!IsValidWindow (w))
      {
        SetError (err, proto::Error::VALIDATION,
                  "invalid production window for item " + item.id ());
        return false;
      }

  return db.Transaction ([&] (Connection& conn)
    {
      proto::Provider provider;
      if (!GetProvider (conn, item.provider_id (), provider))
        {
          SetError (err, proto::Error::NOT_FOUND,
                    "unknown provider " + item.provider_id ());
          return false;
        }

      auto check = conn.Prepare (R"(
        SELECT `provider_id` FROM `catalog_items` WHERE `id` = ?1
      )");
      check.Bind (1, item.id ());
      if (check.Step () && check.Get<std::string> (0) != item.provider_id ())
        {
          SetError (err, proto::Error::VALIDATION,
                    "item " + item.id () + " belongs to another provider");
          return false;
        }

      auto stmt = conn.Prepare (R"(
        INSERT INTO `catalog_items`
          (`id`, `provider_id`, `source_type`, `proto`)
          VALUES (?1, ?2, ?3, ?4)
          ON CONFLICT (`id`) DO UPDATE SET
            `source_type` = excluded.`source_type`,
            `proto` = excluded.`proto`
      )");
      stmt.Bind (1, item.id ());
      stmt.Bind (2, item.provider_id ());
      stmt.Bind (3, proto::CatalogItem::SourceType_Name (item.source_type ()));
      stmt.Bind (4, item.SerializeAsString ());
      stmt.Execute ();

      LOG (INFO) << "Synced catalog item " << item.id ();
      return true;
    });
}

bool
Catalog::ValidateOffer (const proto::Offer& offer, proto::Error& err)
{
  if (offer.id ().empty () || offer.item_id ().empty ()
        || offer.provider_id ().empty ())
    {
      SetError (err, proto::Error::VALIDATION,
                "offer ID, item ID and provider ID are required");
      return false;
    }

  if (!offer.price ().has_value () || offer.price ().value () < 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " has an invalid price");
      return false;
    }

  if (offer.max_qty () < 0)
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " has a negative quantity");
      return false;
    }
  if (offer.max_qty () > FLAGS_max_offer_blocks)
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " has more than "
                  + std::to_string (FLAGS_max_offer_blocks) + " blocks");
      return false;
    }

  if (!IsValidWindow (offer.window ()))
    {
      SetError (err, proto::Error::VALIDATION,
                "offer " + offer.id () + " has an invalid time window");
      return false;
    }

  return true;
}

bool
Catalog::SyncOffer (const proto::Offer& offer, const bool resync,
                    proto::Error& err)
{
  if (!ValidateOffer (offer, err))
    return false;

  return db.Transaction ([&] (Connection& conn)
    {
      auto item = conn.Prepare (R"(
        SELECT `provider_id` FROM `catalog_items` WHERE `id` = ?1
      )");
      item.Bind (1, offer.item_id ());
      if (!item.Step ())
        {
          SetError (err, proto::Error::NOT_FOUND,
                    "unknown catalog item " + offer.item_id ());
          return false;
        }
      if (item.Get<std::string> (0) != offer.provider_id ())
        {
          SetError (err, proto::Error::VALIDATION,
                    "item " + offer.item_id () + " is not from provider "
                      + offer.provider_id ());
          return false;
        }

      auto existing = conn.Prepare (R"(
        SELECT `item_id` FROM `offers` WHERE `id` = ?1
      )");
      existing.Bind (1, offer.id ());
      const bool isNew = !existing.Step ();
      if (!isNew && existing.Get<std::string> (0) != offer.item_id ())
        {
          SetError (err, proto::Error::VALIDATION,
                    "offer " + offer.id () + " cannot change its item");
          return false;
        }

      auto stmt = conn.Prepare (R"(
        INSERT INTO `offers`
          (`id`, `item_id`, `provider_id`, `price`, `currency`, `max_qty`,
           `window_start`, `window_end`, `pricing_model`, `settlement_type`)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
          ON CONFLICT (`id`) DO UPDATE SET
            `price` = excluded.`price`,
            `currency` = excluded.`currency`,
            `max_qty` = excluded.`max_qty`,
            `window_start` = excluded.`window_start`,
            `window_end` = excluded.`window_end`,
            `pricing_model` = excluded.`pricing_model`,
            `settlement_type` = excluded.`settlement_type`
      )");
      stmt.Bind (1, offer.id ());
      stmt.Bind (2, offer.item_id ());
      stmt.Bind (3, offer.provider_id ());
      stmt.Bind (4, offer.price ().value ());
      stmt.Bind (5, offer.price ().currency ());
      stmt.Bind (6, offer.max_qty ());
      stmt.Bind (7, offer.window ().start ());
      stmt.Bind (8, offer.window ().end ());
      stmt.Bind (9, offer.pricing_model ());
      stmt.Bind (10, offer.settlement_type ());
      stmt.Execute ();

      if (isNew)
        ledger.Materialize (conn, offer);
      else if (resync)
        ledger.ResnapshotAvailable (conn, offer);

      LOG (INFO)
          << (isNew ? "Created" : "Updated") << " offer " << offer.id ();
      return true;
    });
}

bool
Catalog::DeleteOffer (const std::string& id, proto::Error& err)
{
  return db.Transaction ([&] (Connection& conn)
    {
      auto existing = conn.Prepare (R"(
        SELECT COUNT(*) FROM `offers` WHERE `id` = ?1
      )");
      existing.Bind (1, id);
      CHECK (existing.Step ());
      if (existing.Get<int64_t> (0) == 0)
        {
          SetError (err, proto::Error::NOT_FOUND, "unknown offer " + id);
          return false;
        }

      const auto counts = ledger.CountByStatus (conn, id);
      if (counts.reserved () > 0 || counts.sold () > 0)
        {
          SetError (err, proto::Error::OFFER_IN_USE,
                    "offer " + id + " has reserved or sold blocks");
          return false;
        }

      auto blocks = conn.Prepare (R"(
        DELETE FROM `offer_blocks` WHERE `offer_id` = ?1
      )");
      blocks.Bind (1, id);
      blocks.Execute ();

      auto stmt = conn.Prepare (R"(
        DELETE FROM `offers` WHERE `id` = ?1
      )");
      stmt.Bind (1, id);
      stmt.Execute ();

      LOG (INFO)
          << "Deleted offer " << id << " with " << counts.available ()
          << " available blocks";
      return true;
    });
}

proto::Catalog
Catalog::GetCatalog ()
{
  proto::Catalog res;
  db.Access ([&] (Connection& conn)
    {
      auto providers = conn.Prepare (R"(
        SELECT `id`, `name`, `trust_score`,
               `total_orders`, `successful_orders`
          FROM `providers`
          ORDER BY `id`
      )");
      auto items = conn.Prepare (R"(
        SELECT `proto`
          FROM `catalog_items`
          WHERE `provider_id` = ?1
          ORDER BY `id`
      )");
      auto offers = conn.Prepare (std::string ("SELECT ") + OFFER_COLUMNS + R"(
          , (SELECT COUNT(*)
               FROM `offer_blocks` AS `b`
               WHERE `b`.`offer_id` = `offers`.`id`
                   AND `b`.`status` = 'AVAILABLE')
        FROM `offers`
        WHERE `item_id` = ?1
        ORDER BY `id`
      )");

      while (providers.Step ())
        {
          auto* p = res.add_providers ();
          *p->mutable_provider () = ReadProvider (providers);

          items.Reset ();
          items.Bind (1, p->provider ().id ());
          while (items.Step ())
            {
              auto* i = p->add_items ();
              *i->mutable_item () = ReadItemBlob (items, 0);

              offers.Reset ();
              offers.Bind (1, i->item ().id ());
              while (offers.Step ())
                {
                  auto* o = i->add_offers ();
                  *o = ReadOffer (offers);
                  o->set_max_qty (offers.Get<int64_t> (10));
                }
            }
        }
    });

  return res;
}

std::vector<proto::ScorableOffer>
Catalog::GetScorableOffers ()
{
  std::vector<proto::ScorableOffer> res;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT `o`.`id`, `o`.`item_id`, `o`.`provider_id`,
               `o`.`price`, `o`.`currency`, `o`.`max_qty`,
               `o`.`window_start`, `o`.`window_end`,
               `o`.`pricing_model`, `o`.`settlement_type`,
               `i`.`source_type`,
               (SELECT COUNT(*)
                  FROM `offer_blocks` AS `b`
                  WHERE `b`.`offer_id` = `o`.`id`
                      AND `b`.`status` = 'AVAILABLE')
          FROM `offers` AS `o`
          INNER JOIN `catalog_items` AS `i` ON `i`.`id` = `o`.`item_id`
          ORDER BY `o`.`id`
      )");

      while (stmt.Step ())
        {
          proto::ScorableOffer entry;
          *entry.mutable_offer () = ReadOffer (stmt);

          proto::CatalogItem::SourceType type;
          if (proto::CatalogItem::SourceType_Parse (
                  stmt.Get<std::string> (10), &type))
            entry.set_source_type (type);

          entry.set_available_blocks (stmt.Get<int64_t> (11));
          res.push_back (std::move (entry));
        }
    });

  return res;
}

std::map<std::string, proto::Provider>
Catalog::GetProviders ()
{
  std::map<std::string, proto::Provider> res;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT `id`, `name`, `trust_score`,
               `total_orders`, `successful_orders`
          FROM `providers`
      )");

      while (stmt.Step ())
        {
          auto p = ReadProvider (stmt);
          const std::string id = p.id ();
          res.emplace (id, std::move (p));
        }
    });

  return res;
}

bool
Catalog::GetOffer (const std::string& id, proto::Offer& offer)
{
  bool found = false;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (std::string ("SELECT ") + OFFER_COLUMNS + R"(
        FROM `offers`
        WHERE `id` = ?1
      )");
      stmt.Bind (1, id);

      if (stmt.Step ())
        {
          offer = ReadOffer (stmt);
          found = true;
        }
    });

  return found;
}

bool
Catalog::GetItem (const std::string& id, proto::CatalogItem& item)
{
  bool found = false;
  db.Access ([&] (Connection& conn)
    {
      auto stmt = conn.Prepare (R"(
        SELECT `proto` FROM `catalog_items` WHERE `id` = ?1
      )");
      stmt.Bind (1, id);

      if (stmt.Step ())
        {
          item = ReadItemBlob (stmt, 0);
          found = true;
        }
    });

  return found;
}

bool
Catalog::GetProvider (Connection& conn, const std::string& id,
                      proto::Provider& provider)
{
  auto stmt = conn.Prepare (R"(
    SELECT `id`, `name`, `trust_score`, `total_orders`, `successful_orders`
      FROM `providers`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return false;

  provider = ReadProvider (stmt);
  return true;
}

bool
Catalog::GetProvider (const std::string& id, proto::Provider& provider)
{
  bool found;
  db.Access ([&] (Connection& conn)
    {
      found = GetProvider (conn, id, provider);
    });
  return found;
}

void
Catalog::UpdateProviderStats (Connection& conn,
                              const proto::Provider& provider)
{
  auto stmt = conn.Prepare (R"(
    UPDATE `providers`
      SET `trust_score` = ?2,
          `total_orders` = ?3, `successful_orders` = ?4
      WHERE `id` = ?1
  )");
  stmt.Bind (1, provider.id ());
  stmt.Bind (2, ClampTrust (provider.trust_score ()));
  stmt.Bind (3, provider.total_orders ());
  stmt.Bind (4, provider.successful_orders ());
  stmt.Execute ();

  CHECK_EQ (conn.Changes (), 1) << "Unknown provider " << provider.id ();
  VLOG (1)
      << "Provider " << provider.id () << " now has trust "
      << provider.trust_score ();
}

} // namespace enertrade
