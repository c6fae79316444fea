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

#include "errors.hpp"
#include "operations.hpp"
#include "sale.hpp"
#include "saledb.hpp"
#include "statejson.hpp"

#include "proto/saleconfig.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

namespace
{

DEFINE_string (datadir, "",
               "directory in which the sale database is stored");
DEFINE_string (config, "",
               "sale configuration in protobuf text format, used to"
               " initialise a fresh database");
DEFINE_string (operations, "",
               "if set, a file with a JSON array of operations to process");
DEFINE_int64 (now, -1,
              "if non-negative, the timestamp used instead of the system"
              " clock");
DEFINE_bool (dump_state, false,
             "whether to print the full sale state as JSON at the end");

/**
 * Writes a JSON value to stdout.
 */
void
PrintJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "  ";
  std::cout << Json::writeString (wbuilder, val) << std::endl;
}

/**
 * Reads the operations file into a JSON value.  Returns false if it can
 * not be read or parsed.
 */
bool
ReadOperations (const std::string& file, Json::Value& ops)
{
  std::ifstream in(file);
  if (!in)
    {
      LOG (ERROR) << "Could not open operations file " << file;
      return false;
    }

  Json::CharReaderBuilder rbuilder;
  std::string errs;
  if (!Json::parseFromStream (rbuilder, in, &ops, &errs))
    {
      LOG (ERROR) << "Failed to parse operations from " << file << ":\n"
                  << errs;
      return false;
    }

  if (!ops.isArray ())
    {
      LOG (ERROR) << "Operations in " << file << " are not a JSON array";
      return false;
    }

  return true;
}

/**
 * Initialises a fresh database from the configuration file.
 */
bool
InitialiseSale (vestsale::Sale& sale)
{
  if (FLAGS_config.empty ())
    {
      std::cerr << "Error: --config is required for a new database"
                << std::endl;
      return false;
    }

  vestsale::proto::SaleConfig cfg;
  if (!vestsale::LoadSaleConfig (FLAGS_config, cfg))
    return false;

  sale.Initialise (cfg);

  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Run operations on a vested reward sale");
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_datadir.empty ())
    {
      std::cerr << "Error: --datadir must be specified" << std::endl;
      return EXIT_FAILURE;
    }

  std::unique_ptr<vestsale::Clock> clock;
  if (FLAGS_now >= 0)
    {
      LOG (INFO) << "Using fixed time " << FLAGS_now;
      clock = std::make_unique<vestsale::FixedClock> (FLAGS_now);
    }
  else
    clock = std::make_unique<vestsale::SystemClock> ();

  vestsale::FileDatabase db(FLAGS_datadir + "/vestsale.sqlite");
  vestsale::Sale sale(db, *clock);

  if (!sale.IsInitialised ())
    {
      LOG (INFO) << "Initialising new sale from " << FLAGS_config;
      try
        {
          if (!InitialiseSale (sale))
            return EXIT_FAILURE;
        }
      catch (const vestsale::SaleError& exc)
        {
          std::cerr << "Error: " << exc.what () << std::endl;
          return EXIT_FAILURE;
        }
    }

  if (!FLAGS_operations.empty ())
    {
      Json::Value ops;
      if (!ReadOperations (FLAGS_operations, ops))
        return EXIT_FAILURE;

      vestsale::OperationProcessor proc(sale);
      PrintJson (proc.ProcessAll (ops));
    }

  if (FLAGS_dump_state)
    {
      vestsale::StateJson converter(sale);
      PrintJson (converter.FullState ());
    }

  google::protobuf::ShutdownProtobufLibrary ();
  return EXIT_SUCCESS;
}
