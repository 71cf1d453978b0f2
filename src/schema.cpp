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

#include "private/database.hpp"

namespace enertrade
{

void
SetupSchema (Connection& conn)
{
  conn.Execute (R"(
    CREATE TABLE IF NOT EXISTS `providers` (
      `id` TEXT PRIMARY KEY,
      `name` TEXT NOT NULL,
      `trust_score` REAL NOT NULL
          CHECK (`trust_score` >= 0.0 AND `trust_score` <= 1.0),
      `total_orders` INTEGER NOT NULL DEFAULT 0,
      `successful_orders` INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS `catalog_items` (
      `id` TEXT PRIMARY KEY,
      `provider_id` TEXT NOT NULL REFERENCES `providers` (`id`),
      `source_type` TEXT NOT NULL,
      `proto` BLOB NOT NULL
    );

    CREATE TABLE IF NOT EXISTS `offers` (
      `id` TEXT PRIMARY KEY,
      `item_id` TEXT NOT NULL REFERENCES `catalog_items` (`id`),
      `provider_id` TEXT NOT NULL REFERENCES `providers` (`id`),
      `price` REAL NOT NULL,
      `currency` TEXT NOT NULL,
      `max_qty` INTEGER NOT NULL CHECK (`max_qty` >= 0),
      `window_start` INTEGER NOT NULL,
      `window_end` INTEGER NOT NULL,
      `pricing_model` TEXT NOT NULL,
      `settlement_type` TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS `offer_blocks` (
      `seq` INTEGER PRIMARY KEY AUTOINCREMENT,
      `id` TEXT NOT NULL UNIQUE,
      `offer_id` TEXT NOT NULL REFERENCES `offers` (`id`),
      `item_id` TEXT NOT NULL,
      `provider_id` TEXT NOT NULL,
      `status` TEXT NOT NULL
          CHECK (`status` IN ('AVAILABLE', 'RESERVED', 'SOLD')),
      `order_id` TEXT NULL,
      `transaction_id` TEXT NULL,
      `version` INTEGER NOT NULL DEFAULT 0,
      `price` REAL NOT NULL,
      `currency` TEXT NOT NULL,
      `window_start` INTEGER NOT NULL,
      `window_end` INTEGER NOT NULL,
      `created_at` INTEGER NOT NULL,
      `reserved_at` INTEGER NULL,
      `sold_at` INTEGER NULL,
      CHECK ((`order_id` IS NULL) = (`status` = 'AVAILABLE'))
    );
    CREATE INDEX IF NOT EXISTS `offer_blocks_by_offer_status`
        ON `offer_blocks` (`offer_id`, `status`, `seq`);
    CREATE INDEX IF NOT EXISTS `offer_blocks_by_order`
        ON `offer_blocks` (`order_id`);
    CREATE UNIQUE INDEX IF NOT EXISTS `offer_blocks_held_once`
        ON `offer_blocks` (`id`)
        WHERE `status` IN ('RESERVED', 'SOLD') AND `order_id` IS NOT NULL;

    CREATE TRIGGER IF NOT EXISTS `offer_blocks_version`
        AFTER UPDATE ON `offer_blocks`
        FOR EACH ROW
        BEGIN
          UPDATE `offer_blocks`
            SET `version` = OLD.`version` + 1
            WHERE `seq` = NEW.`seq`;
        END;

    CREATE TRIGGER IF NOT EXISTS `offer_blocks_transition`
        BEFORE UPDATE OF `status` ON `offer_blocks`
        FOR EACH ROW
        WHEN (OLD.`status` = 'SOLD' AND NEW.`status` <> 'SOLD')
            OR (OLD.`status` = 'AVAILABLE' AND NEW.`status` = 'SOLD')
        BEGIN
          SELECT RAISE (ABORT, 'invalid block status transition');
        END;

    CREATE TABLE IF NOT EXISTS `orders` (
      `id` TEXT PRIMARY KEY,
      `transaction_id` TEXT NOT NULL UNIQUE,
      `buyer_id` TEXT NOT NULL,
      `provider_id` TEXT NOT NULL,
      `offer_id` TEXT NOT NULL,
      `item_id` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL CHECK (`quantity` >= 0),
      `total_price` REAL NOT NULL,
      `currency` TEXT NOT NULL,
      `window_start` INTEGER NOT NULL,
      `window_end` INTEGER NOT NULL,
      `status` TEXT NOT NULL
          CHECK (`status` IN ('DRAFT', 'PENDING', 'ACTIVE', 'DELIVERING',
                              'DELIVERED', 'COMPLETED', 'CANCELLED')),
      `version` INTEGER NOT NULL DEFAULT 0,
      `created_at` INTEGER NOT NULL,
      `updated_at` INTEGER NOT NULL,
      `cancellation` BLOB NULL,
      `delivery` BLOB NULL
    );
    CREATE INDEX IF NOT EXISTS `orders_by_buyer_status`
        ON `orders` (`buyer_id`, `status`);

    CREATE TRIGGER IF NOT EXISTS `orders_version`
        AFTER UPDATE ON `orders`
        FOR EACH ROW
        BEGIN
          UPDATE `orders`
            SET `version` = OLD.`version` + 1
            WHERE `id` = NEW.`id`;
        END;

    CREATE TABLE IF NOT EXISTS `events` (
      `id` INTEGER PRIMARY KEY AUTOINCREMENT,
      `transaction_id` TEXT NOT NULL,
      `message_id` TEXT NOT NULL,
      `action` TEXT NOT NULL,
      `direction` TEXT NOT NULL
          CHECK (`direction` IN ('INBOUND', 'OUTBOUND')),
      `payload` TEXT NOT NULL,
      `created_at` INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS `events_by_transaction`
        ON `events` (`transaction_id`, `id`);
    CREATE UNIQUE INDEX IF NOT EXISTS `events_inbound_message`
        ON `events` (`message_id`)
        WHERE `direction` = 'INBOUND';

    CREATE TRIGGER IF NOT EXISTS `events_no_update`
        BEFORE UPDATE ON `events`
        BEGIN
          SELECT RAISE (ABORT, 'events are append-only');
        END;
    CREATE TRIGGER IF NOT EXISTS `events_no_delete`
        BEFORE DELETE ON `events`
        BEGIN
          SELECT RAISE (ABORT, 'events are append-only');
        END;

    CREATE TABLE IF NOT EXISTS `transaction_states` (
      `transaction_id` TEXT NOT NULL,
      `message_id` TEXT NOT NULL,
      `action` TEXT NOT NULL,
      `state` TEXT NOT NULL,
      `error` BLOB NULL,
      `updated_at` INTEGER NOT NULL,
      PRIMARY KEY (`transaction_id`, `message_id`)
    );

    CREATE TABLE IF NOT EXISTS `principals` (
      `id` TEXT PRIMARY KEY,
      `trust_score` REAL NOT NULL
          CHECK (`trust_score` >= 0.0 AND `trust_score` <= 1.0),
      `declared_capacity` REAL NOT NULL DEFAULT 0,
      `balance` REAL NOT NULL DEFAULT 0,
      `provider_id` TEXT NULL
    );
  )");
}

} // namespace enertrade
