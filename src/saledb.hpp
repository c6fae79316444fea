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

#ifndef VESTSALE_SALEDB_HPP
#define VESTSALE_SALEDB_HPP

#include "database/database.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <sqlite3.h>

#include <string>

namespace vestsale
{

/**
 * Database instance backed by an SQLite file on disk.  The schema is
 * set up (if not yet present) when the file is opened.
 */
class FileDatabase : public Database
{

private:

  /** The SQLiteDatabase instance.  */
  xaya::SQLiteDatabase db;

public:

  explicit FileDatabase (const std::string& file);

  FileDatabase () = delete;
  FileDatabase (const FileDatabase&) = delete;
  void operator= (const FileDatabase&) = delete;

  /**
   * Returns the underlying database handle for SQLite.
   */
  sqlite3*
  GetHandle ()
  {
    return *db;
  }

};

} // namespace vestsale

#endif // VESTSALE_SALEDB_HPP
