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

#ifndef DATABASE_SALESTATE_HPP
#define DATABASE_SALESTATE_HPP

#include "amount.hpp"
#include "database.hpp"
#include "lazyproto.hpp"

#include "proto/config.pb.h"

#include <memory>
#include <string>

namespace vestsale
{

/**
 * Database result type for the sale_state table.
 */
struct SaleStateResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, administrator, 1);
  RESULT_COLUMN (std::string, pending_administrator, 2);
  RESULT_COLUMN (vestsale::proto::SaleParams, params, 3);
  RESULT_COLUMN (int64_t, total_raised, 4);
  RESULT_COLUMN (int64_t, finalised, 5);
};

/**
 * Handle for the (single) row with the sale controller's state.  Changes
 * are written back when it is destructed.
 */
class SaleState
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The current administrator.  */
  std::string administrator;

  /** The pending administrator, or empty if there is none.  */
  std::string pendingAdministrator;

  /** The sale parameters.  */
  LazyProto<proto::SaleParams> params;

  /** Total contributions raised so far.  */
  Amount totalRaised;

  /** Whether the sale has been finalised.  */
  bool finalised;

  /** Whether any of the plain fields has been modified.  */
  bool dirtyFields = false;

  /**
   * Constructs the instance from the database row.
   */
  explicit SaleState (Database& d,
                      const Database::Result<SaleStateResult>& res);

  friend class SaleStateTable;

public:

  /**
   * Updates the database if anything has been modified.
   */
  ~SaleState ();

  SaleState () = delete;
  SaleState (const SaleState&) = delete;
  void operator= (const SaleState&) = delete;

  const std::string&
  GetAdministrator () const
  {
    return administrator;
  }

  /**
   * Sets a new administrator, clearing any pending one.
   */
  void SetAdministrator (const std::string& name);

  const std::string&
  GetPendingAdministrator () const
  {
    return pendingAdministrator;
  }

  /**
   * Sets the pending administrator.  An empty string clears it.
   */
  void SetPendingAdministrator (const std::string& name);

  const proto::SaleParams&
  GetParams () const
  {
    return params.Get ();
  }

  proto::SaleParams&
  MutableParams ()
  {
    return params.Mutable ();
  }

  Amount
  GetTotalRaised () const
  {
    return totalRaised;
  }

  /**
   * Sets the total raised amount.  It must not decrease.
   */
  void SetTotalRaised (Amount val);

  bool
  IsFinalised () const
  {
    return finalised;
  }

  /**
   * Marks the sale as finalised.  This is possible only once.
   */
  void SetFinalised ();

};

/**
 * Access to the sale_state table.
 */
class SaleStateTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to the state.  */
  using Handle = std::unique_ptr<SaleState>;

  explicit SaleStateTable (Database& d)
    : db(d)
  {}

  SaleStateTable () = delete;
  SaleStateTable (const SaleStateTable&) = delete;
  void operator= (const SaleStateTable&) = delete;

  /**
   * Inserts the initial state with the given administrator and parameters.
   * Must only be called once on a fresh database.
   */
  void Initialise (const std::string& administrator,
                   const proto::SaleParams& params);

  /**
   * Returns true if the state has been initialised.
   */
  bool IsInitialised ();

  /**
   * Returns the state.  CHECK-fails if it has not been initialised.
   */
  Handle Get ();

};

} // namespace vestsale

#endif // DATABASE_SALESTATE_HPP
