/*
    vestsale - accounting core for vested reward sales
    Copyright (C) 2021  Autonomous Worlds Ltd

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
#include "lazyproto.hpp"

#include "proto/config.pb.h"

#include <gtest/gtest.h>

namespace vestsale
{
namespace
{

/**
 * Returns the serialised form of a schedule with the given values.
 */
std::string
SerialisedSchedule (const int64_t unlock, const unsigned intervals)
{
  proto::VestingParams pb;
  pb.set_unlock_date (unlock);
  pb.set_num_intervals (intervals);

  std::string bytes;
  CHECK (pb.SerializeToString (&bytes));

  return bytes;
}

TEST (LazyProtoTests, DefaultIsEmpty)
{
  const LazyProto<proto::VestingParams> lazy;
  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_EQ (lazy.GetSerialised (), "");
  EXPECT_FALSE (lazy.Get ().has_unlock_date ());
}

TEST (LazyProtoTests, FromMessage)
{
  proto::VestingParams pb;
  pb.set_interval_duration (50);

  const LazyProto<proto::VestingParams> lazy(pb);
  EXPECT_TRUE (lazy.IsDirty ());
  EXPECT_EQ (lazy.Get ().interval_duration (), 50);

  proto::VestingParams parsed;
  ASSERT_TRUE (parsed.ParseFromString (lazy.GetSerialised ()));
  EXPECT_EQ (parsed.interval_duration (), 50);
}

TEST (LazyProtoTests, BytesKeptUntilAccessed)
{
  /* The bytes are not a valid message.  As long as they are only passed
     through, they are never parsed.  */
  const std::string garbage = "\xff\xff\xff";
  LazyProto<proto::VestingParams> lazy{std::string (garbage)};

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_EQ (lazy.GetSerialised (), garbage);
}

TEST (LazyProtoTests, InvalidBytesFailOnAccess)
{
  LazyProto<proto::VestingParams> lazy{std::string ("\xff\xff\xff")};
  EXPECT_DEATH (lazy.Get (), "Invalid proto data");
}

TEST (LazyProtoTests, ReadOnlyAccess)
{
  const std::string bytes = SerialisedSchedule (1'000, 4);
  LazyProto<proto::VestingParams> lazy{std::string (bytes)};

  EXPECT_EQ (lazy.Get ().unlock_date (), 1'000);
  EXPECT_EQ (lazy.Get ().num_intervals (), 4);

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_EQ (lazy.GetSerialised (), bytes);
}

TEST (LazyProtoTests, Modification)
{
  LazyProto<proto::VestingParams> lazy{SerialisedSchedule (1'000, 4)};
  lazy.Mutable ().set_num_intervals (10);

  EXPECT_TRUE (lazy.IsDirty ());
  EXPECT_EQ (lazy.Get ().unlock_date (), 1'000);
  EXPECT_EQ (lazy.GetSerialised (), SerialisedSchedule (1'000, 10));

  /* Further changes are picked up by the next serialisation.  */
  lazy.Mutable ().set_unlock_date (500);
  EXPECT_EQ (lazy.GetSerialised (), SerialisedSchedule (500, 10));
}

TEST (LazyProtoTests, MoveAssignment)
{
  LazyProto<proto::VestingParams> lazy;
  lazy = LazyProto<proto::VestingParams> (SerialisedSchedule (20, 2));

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_EQ (lazy.Get ().num_intervals (), 2);
}

} // anonymous namespace
} // namespace vestsale
