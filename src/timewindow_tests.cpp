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

#include "timewindow.hpp"

#include <gtest/gtest.h>

#include <string>

namespace enertrade
{
namespace
{

proto::TimeWindow
Window (const int64_t start, const int64_t end)
{
  proto::TimeWindow res;
  res.set_start (start);
  res.set_end (end);
  return res;
}

class TimeWindowTests : public testing::Test
{};

TEST_F (TimeWindowTests, Validity)
{
  EXPECT_TRUE (IsValidWindow (Window (10, 20)));
  EXPECT_TRUE (IsValidWindow (Window (10, 10)));
  EXPECT_FALSE (IsValidWindow (Window (20, 10)));

  proto::TimeWindow partial;
  partial.set_start (10);
  EXPECT_FALSE (IsValidWindow (partial));

  EXPECT_TRUE (IsValidWindow (Window (0, MAX_TIMESTAMP)));
  EXPECT_FALSE (IsValidWindow (Window (-1, 20)));
  EXPECT_FALSE (IsValidWindow (Window (10, MAX_TIMESTAMP + 1)));
  EXPECT_FALSE (IsValidWindow (Window (10, 9'000'000'000'000'000'000)));
}

TEST_F (TimeWindowTests, Overlap)
{
  EXPECT_EQ (OverlapDuration (Window (0, 100), Window (50, 150)), 50);
  EXPECT_EQ (OverlapDuration (Window (0, 100), Window (20, 30)), 10);
  EXPECT_EQ (OverlapDuration (Window (0, 100), Window (100, 200)), 0);
  EXPECT_EQ (OverlapDuration (Window (0, 100), Window (200, 300)), 0);

  EXPECT_TRUE (WindowsOverlap (Window (0, 100), Window (99, 200)));
  EXPECT_FALSE (WindowsOverlap (Window (0, 100), Window (100, 200)));
}

TEST_F (TimeWindowTests, TimeFit)
{
  EXPECT_DOUBLE_EQ (TimeFit (Window (0, 100), Window (0, 100)), 1.0);
  EXPECT_DOUBLE_EQ (TimeFit (Window (0, 100), Window (20, 40)), 1.0);
  EXPECT_DOUBLE_EQ (TimeFit (Window (0, 100), Window (50, 150)), 0.5);
  EXPECT_DOUBLE_EQ (TimeFit (Window (0, 100), Window (200, 300)), 0.0);
  EXPECT_DOUBLE_EQ (TimeFit (Window (0, 100), Window (200, 200)), 1.0);
}

TEST_F (TimeWindowTests, ParseIsoTime)
{
  int64_t t;

  ASSERT_TRUE (ParseIsoTime ("2024-10-04T10:00:00Z", t));
  EXPECT_EQ (t, 1'728'036'000);

  ASSERT_TRUE (ParseIsoTime ("2024-10-04T10:00:00.123Z", t));
  EXPECT_EQ (t, 1'728'036'000);

  ASSERT_TRUE (ParseIsoTime ("2024-10-04T10:00:00", t));
  EXPECT_EQ (t, 1'728'036'000);

  ASSERT_TRUE (ParseIsoTime ("2024-10-04T10:00:00+05:30", t));
  EXPECT_EQ (t, 1'728'016'200);

  ASSERT_TRUE (ParseIsoTime ("2024-10-04T04:30:00-05:30", t));
  EXPECT_EQ (t, 1'728'036'000);
}

TEST_F (TimeWindowTests, ParseInvalid)
{
  int64_t t;
  EXPECT_FALSE (ParseIsoTime ("", t));
  EXPECT_FALSE (ParseIsoTime ("yesterday", t));
  EXPECT_FALSE (ParseIsoTime ("2024-10-04", t));
  EXPECT_FALSE (ParseIsoTime ("2024-10-04T10:00:00X", t));
  EXPECT_FALSE (ParseIsoTime ("2024-10-04T10:00:00Z junk", t));
  EXPECT_FALSE (ParseIsoTime ("2024-10-04T10:00:00+0530", t));
  EXPECT_FALSE (ParseIsoTime ("2024-10-04T10:00:00+\xe9\xe9:00", t));

  EXPECT_FALSE (ParseIsoTime ("1969-12-31T23:59:59Z", t));
  EXPECT_FALSE (ParseIsoTime ("1970-01-01T00:30:00+01:00", t));
  EXPECT_FALSE (ParseIsoTime ("9999-12-31T23:59:59-01:00", t));
  ASSERT_TRUE (ParseIsoTime ("9999-12-31T23:59:59Z", t));
  EXPECT_EQ (t, MAX_TIMESTAMP);
}

TEST_F (TimeWindowTests, Format)
{
  std::string str;
  ASSERT_TRUE (FormatIsoTime (1'728'036'000, str));
  EXPECT_EQ (str, "2024-10-04T10:00:00Z");
  ASSERT_TRUE (FormatIsoTime (0, str));
  EXPECT_EQ (str, "1970-01-01T00:00:00Z");
  ASSERT_TRUE (FormatIsoTime (MAX_TIMESTAMP, str));
  EXPECT_EQ (str, "9999-12-31T23:59:59Z");

  int64_t t;
  ASSERT_TRUE (FormatIsoTime (1'700'000'123, str));
  ASSERT_TRUE (ParseIsoTime (str, t));
  EXPECT_EQ (t, 1'700'000'123);
}

TEST_F (TimeWindowTests, FormatOutOfRange)
{
  std::string str = "unchanged";
  EXPECT_FALSE (FormatIsoTime (-1, str));
  EXPECT_FALSE (FormatIsoTime (MAX_TIMESTAMP + 1, str));
  EXPECT_FALSE (FormatIsoTime (9'000'000'000'000'000'000, str));
  EXPECT_EQ (str, "unchanged");
}

} // anonymous namespace
} // namespace enertrade
