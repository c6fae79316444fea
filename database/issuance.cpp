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
#include "issuance.hpp"

#include <glog/logging.h>

namespace vestsale
{

namespace
{

struct IssuanceResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, amount, 1);
};

} // anonymous namespace

std::string
IssuanceChannelToString (const IssuanceChannel c)
{
  switch (c)
    {
    case IssuanceChannel::CONTRIBUTION:
      return "contributions";
    case IssuanceChannel::ADMINISTRATOR:
      return "administrator";
    case IssuanceChannel::DIRECT:
      return "direct";
    case IssuanceChannel::BONUS:
      return "bonus";
    case IssuanceChannel::VESTING:
      return "vesting";
    }

  LOG (FATAL) << "Invalid issuance channel: " << static_cast<int> (c);
}

void
IssuanceTable::Record (const IssuanceChannel c, const Amount amount)
{
  VLOG (1)
      << "Recording issuance of " << amount
      << " through " << IssuanceChannelToString (c);
  CHECK_GT (amount, 0);

  auto stmt = db.Prepare (R"(
    INSERT INTO `issuance`
      (`channel`, `amount`) VALUES (?1, ?2)
      ON CONFLICT (`channel`) DO UPDATE
        SET `amount` = `amount` + `excluded`.`amount`
  )");
  stmt.Bind (1, static_cast<int64_t> (c));
  stmt.Bind (2, amount);
  stmt.Execute ();
}

Amount
IssuanceTable::Get (const IssuanceChannel c)
{
  auto stmt = db.Prepare (R"(
    SELECT `amount`
      FROM `issuance`
      WHERE `channel` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (c));

  auto res = stmt.Query<IssuanceResult> ();
  if (!res.Step ())
    return 0;

  const Amount amount = res.Get<IssuanceResult::amount> ();
  CHECK (!res.Step ());

  return amount;
}

Amount
IssuanceTable::GetTotal ()
{
  auto stmt = db.Prepare (R"(
    SELECT COALESCE (SUM (`amount`), 0) AS `amount`
      FROM `issuance`
  )");

  auto res = stmt.Query<IssuanceResult> ();
  CHECK (res.Step ());
  const Amount total = res.Get<IssuanceResult::amount> ();
  CHECK (!res.Step ());

  return total;
}

const std::vector<IssuanceChannel>&
IssuanceTable::GetChannels ()
{
  static const std::vector<IssuanceChannel> channels =
    {
      IssuanceChannel::CONTRIBUTION,
      IssuanceChannel::ADMINISTRATOR,
      IssuanceChannel::DIRECT,
      IssuanceChannel::BONUS,
      IssuanceChannel::VESTING,
    };
  return channels;
}

} // namespace vestsale
