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

#ifndef ENERTRADE_BLOCKLEDGER_HPP
#define ENERTRADE_BLOCKLEDGER_HPP

#include "private/database.hpp"
#include "private/errors.hpp"
#include "proto/catalog.pb.h"
#include "proto/error.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace enertrade
{

/**
 * The ledger of offer blocks.  This is the only place where the status of
 * blocks is changed.  Blocks are created in bulk for a new offer, reserved
 * for orders with optimistic concurrency, and then either sold or released
 * back to the pool.
 *
 * Methods taking a Connection run as part of the caller's transaction;
 * the others open their own.
 */
class BlockLedger
{

protected:

  /**
   * A block as seen by the read phase of a claim.
   */
  struct ObservedBlock
  {
    std::string id;
    int64_t version;
  };

private:

  /** The underlying database.  */
  Database& db;

  /** How often a conflicting claim is retried with a fresh read.  */
  const unsigned maxRetries;

  /**
   * Reserves the observed blocks in a single transaction.  Returns false
   * if any of them changed in the meantime, in which case nothing is
   * modified.
   */
  bool TryReserve (const std::vector<ObservedBlock>& observed,
                   const std::string& orderId,
                   const std::string& transactionId);

  /**
   * Applies a status change to the given blocks, checking the transition
   * for each of them.  Blocks not in the expected state make the whole
   * operation fail.
   */
  bool Transition (Connection& conn, const std::vector<std::string>& ids,
                   proto::OfferBlock::Status from,
                   proto::OfferBlock::Status to, proto::Error& err);

protected:

  /**
   * Returns the current time used for timestamps.
   */
  virtual int64_t GetCurrentTime () const;

  /**
   * Called by Claim between reading the available blocks and trying to
   * reserve them.  Does nothing by default; tests use it to interleave
   * concurrent modifications.
   */
  virtual void
  AfterClaimRead (const std::string& offerId,
                  const std::vector<ObservedBlock>& observed)
  {}

public:

  explicit BlockLedger (Database& d, unsigned retries);

  virtual ~BlockLedger () = default;

  BlockLedger () = delete;
  BlockLedger (const BlockLedger&) = delete;
  void operator= (const BlockLedger&) = delete;

  /**
   * Returns true if a block may change from one status to the other.
   */
  static bool IsValidTransition (proto::OfferBlock::Status from,
                                 proto::OfferBlock::Status to);

  /**
   * Creates max_qty AVAILABLE blocks for a newly synced offer, with a
   * snapshot of its price and window.  Returns the number created.
   */
  int64_t Materialize (Connection& conn, const proto::Offer& offer);

  /**
   * Updates the price and window snapshot of all still AVAILABLE blocks
   * of an offer.  Held blocks keep their snapshot.
   */
  void ResnapshotAvailable (Connection& conn, const proto::Offer& offer);

  /**
   * Reserves the given number of blocks (oldest first) of an offer for
   * an order.  Either all are reserved or none.  Concurrent modifications
   * are retried a bounded number of times before giving up with
   * INSUFFICIENT_AVAILABLE.
   */
  bool Claim (const std::string& offerId, int64_t quantity,
              const std::string& orderId, const std::string& transactionId,
              std::vector<std::string>& claimed, proto::Error& err);

  /**
   * Marks reserved blocks as sold.
   */
  bool Finalize (Connection& conn, const std::vector<std::string>& ids,
                 proto::Error& err);
  bool Finalize (const std::vector<std::string>& ids, proto::Error& err);

  /**
   * Returns reserved blocks to the pool of available ones.
   */
  bool Release (Connection& conn, const std::vector<std::string>& ids,
                proto::Error& err);
  bool Release (const std::vector<std::string>& ids, proto::Error& err);

  /**
   * Applies a bulk status update pushed by a provider.  All blocks must
   * belong to the offer and the transitions must be valid, otherwise
   * nothing is changed.
   */
  bool UpdateStatus (const proto::BlockUpdate& update, proto::Error& err);

  proto::BlockCounts CountByStatus (Connection& conn,
                                    const std::string& offerId);
  proto::BlockCounts CountByStatus (const std::string& offerId);

  /**
   * Returns the blocks held by an order in creation order.
   */
  std::vector<proto::OfferBlock> GetBlocksForOrder (
      Connection& conn, const std::string& orderId);
  std::vector<proto::OfferBlock> GetBlocksForOrder (const std::string& orderId);

  /**
   * Returns all blocks of an offer.
   */
  std::vector<proto::OfferBlock> GetBlocks (const std::string& offerId);

};

} // namespace enertrade

#endif // ENERTRADE_BLOCKLEDGER_HPP
