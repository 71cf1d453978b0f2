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

#include "private/idempotency.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace enertrade
{
namespace
{

using std::chrono::milliseconds;
using Outcome = IdempotencyGuard::Outcome;

class IdempotencyTests : public testing::Test
{

protected:

  MemoryCache cache;
  IdempotencyGuard guard;

  std::string response;

  IdempotencyTests ()
    : guard(cache, milliseconds (60'000), milliseconds (60'000))
  {}

};

TEST_F (IdempotencyTests, EmptyKeyIsAlwaysFresh)
{
  EXPECT_EQ (guard.Begin ("cancel", "", response), Outcome::FRESH);
  guard.Complete ("cancel", "", "result");
  EXPECT_EQ (guard.Begin ("cancel", "", response), Outcome::FRESH);
  EXPECT_EQ (cache.Size (), 0);
}

TEST_F (IdempotencyTests, Replay)
{
  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::FRESH);
  guard.Complete ("cancel", "key", "result");

  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::REPLAY);
  EXPECT_EQ (response, "result");
}

TEST_F (IdempotencyTests, InFlight)
{
  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::FRESH);
  EXPECT_EQ (guard.Begin ("cancel", "key", response), Outcome::IN_FLIGHT);

  guard.Complete ("cancel", "key", "result");
  EXPECT_EQ (guard.Begin ("cancel", "key", response), Outcome::REPLAY);
}

TEST_F (IdempotencyTests, AbortAllowsRetry)
{
  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::FRESH);
  guard.Abort ("cancel", "key");

  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::FRESH);
  guard.Complete ("cancel", "key", "second");

  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::REPLAY);
  EXPECT_EQ (response, "second");
}

TEST_F (IdempotencyTests, ScopedByEndpoint)
{
  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::FRESH);
  guard.Complete ("cancel", "key", "cancelled");

  ASSERT_EQ (guard.Begin ("advance", "key", response), Outcome::FRESH);
  guard.Complete ("advance", "key", "advanced");

  ASSERT_EQ (guard.Begin ("cancel", "key", response), Outcome::REPLAY);
  EXPECT_EQ (response, "cancelled");
  ASSERT_EQ (guard.Begin ("advance", "key", response), Outcome::REPLAY);
  EXPECT_EQ (response, "advanced");
}

TEST_F (IdempotencyTests, ResponseExpires)
{
  IdempotencyGuard shortLived(cache, milliseconds (60'000), milliseconds (1));

  ASSERT_EQ (shortLived.Begin ("cancel", "key", response), Outcome::FRESH);
  shortLived.Complete ("cancel", "key", "result");

  std::this_thread::sleep_for (milliseconds (10));
  EXPECT_EQ (shortLived.Begin ("cancel", "key", response), Outcome::FRESH);
}

} // anonymous namespace
} // namespace enertrade
