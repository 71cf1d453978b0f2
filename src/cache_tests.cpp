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

#include "private/cache.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace enertrade
{
namespace
{

using std::chrono::milliseconds;

/**
 * MemoryCache with a manually advanced clock.
 */
class TestCache : public MemoryCache
{

private:

  Clock::time_point now;

protected:

  Clock::time_point
  GetCurrentTime () const override
  {
    return now;
  }

public:

  TestCache ()
    : now(Clock::now ())
  {}

  void
  Advance (const milliseconds ms)
  {
    now += ms;
  }

};

class CacheTests : public testing::Test
{

protected:

  TestCache cache;

  /**
   * Returns the value for a key or "missing" if there is none.
   */
  std::string
  Lookup (const std::string& key)
  {
    std::string res;
    if (!cache.Get (key, res))
      return "missing";
    return res;
  }

};

TEST_F (CacheTests, SetAndGet)
{
  EXPECT_EQ (Lookup ("foo"), "missing");

  cache.Set ("foo", "bar", milliseconds (100));
  EXPECT_EQ (Lookup ("foo"), "bar");

  cache.Set ("foo", "baz", milliseconds (100));
  EXPECT_EQ (Lookup ("foo"), "baz");

  cache.Delete ("foo");
  EXPECT_EQ (Lookup ("foo"), "missing");

  cache.Delete ("not there");
}

TEST_F (CacheTests, Expiry)
{
  cache.Set ("short", "a", milliseconds (10));
  cache.Set ("long", "b", milliseconds (1'000));

  cache.Advance (milliseconds (9));
  EXPECT_EQ (Lookup ("short"), "a");

  cache.Advance (milliseconds (1));
  EXPECT_EQ (Lookup ("short"), "missing");
  EXPECT_EQ (Lookup ("long"), "b");

  cache.Advance (milliseconds (1'000));
  EXPECT_EQ (Lookup ("long"), "missing");
  EXPECT_EQ (cache.Size (), 0);
}

TEST_F (CacheTests, SetIfAbsent)
{
  EXPECT_TRUE (cache.SetIfAbsent ("lock", "first", milliseconds (100)));
  EXPECT_FALSE (cache.SetIfAbsent ("lock", "second", milliseconds (100)));
  EXPECT_EQ (Lookup ("lock"), "first");

  cache.Advance (milliseconds (100));
  EXPECT_TRUE (cache.SetIfAbsent ("lock", "third", milliseconds (100)));
  EXPECT_EQ (Lookup ("lock"), "third");

  cache.Delete ("lock");
  EXPECT_TRUE (cache.SetIfAbsent ("lock", "fourth", milliseconds (100)));
}

TEST_F (CacheTests, Pruning)
{
  for (int i = 0; i < 500; ++i)
    cache.Set ("old " + std::to_string (i), "x", milliseconds (10));
  EXPECT_EQ (cache.Size (), 500);

  cache.Advance (milliseconds (20));
  for (int i = 0; i < 500; ++i)
    cache.Set ("new " + std::to_string (i), "x", milliseconds (10));

  /* The thousandth insert pruned all old entries.  */
  EXPECT_EQ (cache.Size (), 500);
  EXPECT_EQ (Lookup ("new 0"), "x");
}

TEST_F (CacheTests, ConcurrentSetIfAbsent)
{
  MemoryCache real;

  constexpr int THREADS = 10;
  std::vector<char> won(THREADS, false);
  std::vector<std::thread> threads;
  for (int i = 0; i < THREADS; ++i)
    threads.emplace_back ([&real, &won, i] ()
      {
        won[i] = real.SetIfAbsent ("key", std::to_string (i),
                                   milliseconds (10'000));
      });
  for (auto& t : threads)
    t.join ();

  int winners = 0;
  for (const bool w : won)
    if (w)
      ++winners;
  EXPECT_EQ (winners, 1);
}

} // anonymous namespace
} // namespace enertrade
