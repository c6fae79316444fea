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

#include "salestate.hpp"

#include <glog/logging.h>

namespace vestsale
{

SaleState::SaleState (Database& d,
                      const Database::Result<SaleStateResult>& res)
  : db(d)
{
  administrator = res.Get<SaleStateResult::administrator> ();
  if (!res.IsNull<SaleStateResult::pending_administrator> ())
    pendingAdministrator = res.Get<SaleStateResult::pending_administrator> ();
  params = res.GetProto<SaleStateResult::params> ();
  totalRaised = res.Get<SaleStateResult::total_raised> ();
  finalised = (res.Get<SaleStateResult::finalised> () != 0);
}

SaleState::~SaleState ()
{
  if (!dirtyFields && !params.IsDirty ())
    return;

  VLOG (1) << "Updating sale state in the database";
  CHECK_GE (totalRaised, 0);

  auto stmt = db.Prepare (R"(
    UPDATE `sale_state`
      SET `administrator` = ?1,
          `pending_administrator` = ?2,
          `params` = ?3,
          `total_raised` = ?4,
          `finalised` = ?5
      WHERE `id` = 1
  )");

  stmt.Bind (1, administrator);
  if (pendingAdministrator.empty ())
    stmt.BindNull (2);
  else
    stmt.Bind (2, pendingAdministrator);
  stmt.BindProto (3, params);
  stmt.Bind (4, totalRaised);
  stmt.Bind (5, finalised);

  stmt.Execute ();
}

void
SaleState::SetAdministrator (const std::string& name)
{
  CHECK_NE (name, "");
  administrator = name;
  pendingAdministrator.clear ();
  dirtyFields = true;
}

void
SaleState::SetPendingAdministrator (const std::string& name)
{
  pendingAdministrator = name;
  dirtyFields = true;
}

void
SaleState::SetTotalRaised (const Amount val)
{
  CHECK_GE (val, totalRaised) << "Total raised amount decreased";
  totalRaised = val;
  dirtyFields = true;
}

void
SaleState::SetFinalised ()
{
  CHECK (!finalised) << "Sale has already been finalised";
  finalised = true;
  dirtyFields = true;
}

void
SaleStateTable::Initialise (const std::string& administrator,
                            const proto::SaleParams& params)
{
  LOG (INFO) << "Initialising sale state with administrator " << administrator;
  CHECK (!IsInitialised ()) << "Sale state is already initialised";
  CHECK_NE (administrator, "");

  const LazyProto<proto::SaleParams> pb(params);

  auto stmt = db.Prepare (R"(
    INSERT INTO `sale_state`
      (`id`, `administrator`, `pending_administrator`,
       `params`, `total_raised`, `finalised`)
      VALUES (1, ?1, NULL, ?2, 0, 0)
  )");
  stmt.Bind (1, administrator);
  stmt.BindProto (2, pb);
  stmt.Execute ();
}

bool
SaleStateTable::IsInitialised ()
{
  auto stmt = db.Prepare ("SELECT * FROM `sale_state`");
  auto res = stmt.Query<SaleStateResult> ();
  return res.Step ();
}

SaleStateTable::Handle
SaleStateTable::Get ()
{
  auto stmt = db.Prepare ("SELECT * FROM `sale_state` WHERE `id` = 1");
  auto res = stmt.Query<SaleStateResult> ();
  CHECK (res.Step ()) << "Sale state has not been initialised";

  Handle h(new SaleState (db, res));
  CHECK (!res.Step ());

  return h;
}

} // namespace vestsale
