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

#ifndef DATABASE_AUDITLOG_HPP
#define DATABASE_AUDITLOG_HPP

#include "allocation.hpp"
#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace vestsale
{

/**
 * Database result type for rows of the audit log.
 */
struct AuditEntryResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, id, 1);
  RESULT_COLUMN (int64_t, time, 2);
  RESULT_COLUMN (std::string, type, 3);
  RESULT_COLUMN (std::string, account, 4);
  RESULT_COLUMN (int64_t, amount, 5);
  RESULT_COLUMN (int64_t, allocation, 6);
};

/**
 * Wrapper class around an entry in the audit log of the sale.  Entries are
 * created through AuditLogTable and inserted when the handle is destructed.
 * Entries read back from the database are immutable.
 */
class AuditEntry
{

public:

  /**
   * The kinds of events recorded in the audit log.
   */
  enum class Type
  {
    INVALID,
    ALLOCATION,
    CLAIM,
    CONTRIBUTION,
    DIRECT,
    BONUS,
    RELEASE,
    FINALISE,
  };

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The row ID (only set for entries read from the database).  */
  int64_t id;

  /** The timestamp of the event.  */
  int64_t time;

  /** The type of event.  */
  Type type;

  /** The account this event is about.  */
  std::string account;

  /** The amount involved.  */
  Amount amount;

  /** Whether this event refers to a vesting allocation.  */
  bool hasAllocation;

  /** The allocation index if there is one.  */
  AllocationIndex allocation;

  /** Whether or not this is a new instance.  */
  bool isNew;

  /**
   * Constructs a new instance meant to be inserted into the database.
   */
  explicit AuditEntry (Database& d);

  /**
   * Constructs an immutable instance based on the given DB result.
   */
  explicit AuditEntry (Database& d,
                       const Database::Result<AuditEntryResult>& res);

  friend class AuditLogTable;

public:

  /**
   * In the destructor, the entry is inserted if it is new.
   */
  ~AuditEntry ();

  AuditEntry () = delete;
  AuditEntry (const AuditEntry&) = delete;
  void operator= (const AuditEntry&) = delete;

  int64_t
  GetId () const
  {
    return id;
  }

  int64_t
  GetTime () const
  {
    return time;
  }

  Type
  GetType () const
  {
    return type;
  }

  const std::string&
  GetAccount () const
  {
    return account;
  }

  Amount
  GetAmount () const
  {
    return amount;
  }

  bool
  HasAllocation () const
  {
    return hasAllocation;
  }

  AllocationIndex GetAllocation () const;

  /**
   * Associates the entry with a vesting allocation.  Only possible
   * for new entries.
   */
  void SetAllocation (AllocationIndex idx);

};

/**
 * Converts an audit entry type to the string stored in the database.
 */
std::string AuditTypeToString (AuditEntry::Type t);

/**
 * Parses the database string for an audit entry type.  Returns INVALID
 * for unknown strings.
 */
AuditEntry::Type AuditTypeFromString (const std::string& str);

/**
 * Utility class that handles querying the audit log and creating
 * new entries.
 */
class AuditLogTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to an instance.  */
  using Handle = std::unique_ptr<AuditEntry>;

  explicit AuditLogTable (Database& d)
    : db(d)
  {}

  AuditLogTable () = delete;
  AuditLogTable (const AuditLogTable&) = delete;
  void operator= (const AuditLogTable&) = delete;

  /**
   * Creates a new entry.  It is inserted when the handle is destructed.
   */
  Handle Record (int64_t time, AuditEntry::Type type,
                 const std::string& account, Amount amount);

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<AuditEntryResult>& res) const;

  /**
   * Queries all entries from old to new.
   */
  Database::Result<AuditEntryResult> QueryAll () const;

  /**
   * Queries the entries for a given account, from old to new.
   */
  Database::Result<AuditEntryResult> QueryForAccount (
      const std::string& account) const;

};

} // namespace vestsale

#endif // DATABASE_AUDITLOG_HPP
