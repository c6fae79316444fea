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

#include "statejson.hpp"

#include "jsonutils.hpp"

#include "database/account.hpp"
#include "database/allocation.hpp"
#include "database/auditlog.hpp"
#include "database/issuance.hpp"
#include "database/schedule.hpp"
#include "database/whitelist.hpp"

namespace vestsale
{

namespace
{

Json::Value
ParamsToJson (const proto::SaleParams& params)
{
  Json::Value res(Json::objectValue);
  res["start"] = IntToJson<int64_t> (params.start_time ());
  res["end"] = IntToJson<int64_t> (params.end_time ());
  res["capacity"] = IntToJson<int64_t> (params.capacity ());
  res["mincontribution"]
      = IntToJson<int64_t> (params.min_contribution ());
  res["maxcontribution"]
      = IntToJson<int64_t> (params.max_contribution ());
  res["rate"] = IntToJson<int64_t> (params.rate ());
  res["administratorrate"]
      = IntToJson<int64_t> (params.administrator_rate ());
  res["bonuspercent"] = IntToJson<int64_t> (params.bonus_percent ());
  res["shareaccount"] = params.share_account ();
  res["controller"] = params.controller ();

  return res;
}

} // anonymous namespace

template <>
  Json::Value
  StateJson::Convert<Account> (const Account& a) const
{
  Json::Value res(Json::objectValue);
  res["name"] = a.GetName ();
  res["balance"] = IntToJson (a.GetBalance ());

  return res;
}

template <>
  Json::Value
  StateJson::Convert<Allocation> (const Allocation& a) const
{
  Json::Value res(Json::objectValue);
  res["index"] = IntToJson (a.GetIndex ());
  res["beneficiary"] = a.GetBeneficiary ();
  res["total"] = IntToJson (a.GetTotal ());
  res["remaining"] = IntToJson (a.GetRemaining ());
  res["lastclaimed"] = IntToJson<uint32_t> (a.GetLastClaimedInterval ());
  res["currentreward"] = IntToJson (a.GetCurrentReward ());

  return res;
}

template <>
  Json::Value
  StateJson::Convert<AuditEntry> (const AuditEntry& e) const
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (e.GetId ());
  res["time"] = IntToJson (e.GetTime ());
  res["type"] = AuditTypeToString (e.GetType ());
  res["account"] = e.GetAccount ();
  res["amount"] = IntToJson (e.GetAmount ());
  if (e.HasAllocation ())
    res["allocation"] = IntToJson (e.GetAllocation ());

  return res;
}

template <typename T, typename R>
  Json::Value
  StateJson::ResultsAsArray (T& tbl, Database::Result<R> res) const
{
  Json::Value arr(Json::arrayValue);

  while (res.Step ())
    {
      const auto h = tbl.GetFromResult (res);
      arr.append (Convert (*h));
    }

  return arr;
}

Json::Value
StateJson::SaleData ()
{
  auto lock = db.LockOperations ();

  auto& controller = sale.GetController ();
  auto& rewards = sale.GetRewardLedger ();

  Json::Value res(Json::objectValue);
  res["administrator"] = controller.GetAdministrator ();
  const std::string pending = controller.GetPendingAdministrator ();
  if (!pending.empty ())
    res["pendingadministrator"] = pending;

  res["stage"] = SaleStageToString (controller.GetStage ());
  res["raised"] = IntToJson (controller.GetTotalRaised ());
  res["finalised"] = controller.IsFinalised ();
  res["params"] = ParamsToJson (controller.GetParams ());

  Json::Value ledger(Json::objectValue);
  ledger["issuer"] = rewards.GetIssuer ();
  ledger["frozen"] = rewards.IsFrozen ();
  res["rewards"] = ledger;

  return res;
}

Json::Value
StateJson::Vesting ()
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  const auto schedule = schedules.Get ();

  Json::Value res(Json::objectValue);
  res["administrator"] = schedule->GetAdministrator ();
  res["unlockdate"] = IntToJson (schedule->GetUnlockDate ());
  res["intervalduration"] = IntToJson (schedule->GetIntervalDuration ());
  res["intervals"] = IntToJson<uint32_t> (schedule->GetNumIntervals ());
  res["current"] = IntToJson<uint32_t> (schedule->GetCurrentInterval ());

  AllocationsTable tbl(db);
  res["allocations"] = ResultsAsArray (tbl, tbl.QueryAll ());

  return res;
}

Json::Value
StateJson::Accounts ()
{
  auto lock = db.LockOperations ();

  AccountsTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
StateJson::Issuance ()
{
  auto lock = db.LockOperations ();

  IssuanceTable tbl(db);

  Json::Value channels(Json::objectValue);
  for (const auto c : IssuanceTable::GetChannels ())
    channels[IssuanceChannelToString (c)] = IntToJson (tbl.Get (c));

  AccountsTable accounts(db);

  Json::Value res(Json::objectValue);
  res["channels"] = channels;
  res["total"] = IntToJson (tbl.GetTotal ());
  res["balances"] = IntToJson (accounts.GetTotalBalance ());

  return res;
}

Json::Value
StateJson::Whitelist ()
{
  auto lock = db.LockOperations ();

  vestsale::Whitelist wl(db);
  auto res = wl.QueryAll ();

  Json::Value arr(Json::arrayValue);
  while (res.Step ())
    arr.append (res.Get<WhitelistResult::name> ());

  return arr;
}

Json::Value
StateJson::AuditLog ()
{
  auto lock = db.LockOperations ();

  AuditLogTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
StateJson::FullState ()
{
  auto lock = db.LockOperations ();

  Json::Value res(Json::objectValue);

  res["sale"] = SaleData ();
  res["vesting"] = Vesting ();
  res["accounts"] = Accounts ();
  res["issuance"] = Issuance ();
  res["whitelist"] = Whitelist ();
  res["auditlog"] = AuditLog ();

  return res;
}

} // namespace vestsale
