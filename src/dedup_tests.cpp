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

#include "private/dedup.hpp"

#include <gtest/gtest.h>

namespace enertrade
{
namespace
{

using std::chrono::milliseconds;

class DedupTests : public testing::Test
{

protected:

  Database db;
  EventLog log;
  MemoryCache cache;
  Deduplicator dedup;

  DedupTests ()
    : db(":memory:"), log(db), dedup(cache, log, milliseconds (60'000))
  {}

  static proto::Event
  Inbound (const std::string& msg)
  {
    proto::Event res;
    res.set_transaction_id ("tx");
    res.set_message_id (msg);
    res.set_action ("discover");
    res.set_direction (proto::Event::INBOUND);
    res.set_payload ("{}");
    res.set_created_at (1);
    return res;
  }

};

TEST_F (DedupTests, CacheKey)
{
  EXPECT_EQ (Deduplicator::CacheKey ("abc"), "dedup:abc:INBOUND");
}

TEST_F (DedupTests, FreshMessage)
{
  EXPECT_FALSE (dedup.IsDuplicate ("msg"));

  auto ev = Inbound ("msg");
  ASSERT_TRUE (dedup.RecordInbound (ev));
  EXPECT_TRUE (dedup.IsDuplicate ("msg"));
  EXPECT_FALSE (dedup.IsDuplicate ("other"));

  std::string value;
  EXPECT_TRUE (cache.Get (Deduplicator::CacheKey ("msg"), value));
}

TEST_F (DedupTests, CacheMissFallsBackToLog)
{
  auto ev = Inbound ("msg");
  ASSERT_TRUE (dedup.RecordInbound (ev));

  /* Simulate a restart or expired cache.  */
  cache.Delete (Deduplicator::CacheKey ("msg"));

  EXPECT_TRUE (dedup.IsDuplicate ("msg"));

  std::string value;
  EXPECT_TRUE (cache.Get (Deduplicator::CacheKey ("msg"), value));
}

TEST_F (DedupTests, CacheHitWithoutLog)
{
  cache.Set (Deduplicator::CacheKey ("msg"), "1", milliseconds (60'000));
  EXPECT_TRUE (dedup.IsDuplicate ("msg"));
  EXPECT_FALSE (log.HasInbound ("msg"));
}

TEST_F (DedupTests, LostRace)
{
  auto first = Inbound ("msg");
  auto second = Inbound ("msg");

  ASSERT_TRUE (dedup.RecordInbound (first));
  EXPECT_FALSE (dedup.RecordInbound (second));
  EXPECT_EQ (log.GetEvents ("tx").size (), 1);
}

} // anonymous namespace
} // namespace enertrade
