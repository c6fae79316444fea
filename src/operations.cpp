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

#include "operations.hpp"

#include "errors.hpp"
#include "jsonutils.hpp"

#include <glog/logging.h>

#include <vector>

namespace vestsale
{

namespace
{

/**
 * Parses a JSON array of account names.
 */
bool
ParseNameList (const Json::Value& val, std::vector<std::string>& names)
{
  if (!val.isArray ())
    return false;

  names.clear ();
  for (const auto& entry : val)
    {
      std::string name;
      if (!AccountFromJson (entry, name))
        return false;
      names.push_back (name);
    }

  return true;
}

/**
 * Checks that the value is an object with exactly one member, and returns
 * its key.
 */
bool
SingleKey (const Json::Value& val, std::string& key)
{
  if (!val.isObject () || val.size () != 1)
    return false;

  key = val.getMemberNames ().front ();
  return true;
}

} // anonymous namespace

bool
OperationProcessor::ExecuteDirectOrBonus (const std::string& name,
                                          const bool bonus,
                                          const Json::Value& val,
                                          Json::Value& result)
{
  if (!val.isObject () || val.size () != 2)
    return false;

  std::string to;
  Amount amount;
  if (!AccountFromJson (val["to"], to)
        || !AmountFromJson (val["amount"], amount))
    return false;

  auto& controller = sale.GetController ();
  if (bonus)
    {
      const auto idx = controller.CreateBonusAllocation (name, to, amount);
      result["allocation"] = IntToJson (idx);
    }
  else
    controller.DirectIssue (name, to, amount);

  return true;
}

bool
OperationProcessor::ExecuteWhitelist (const std::string& name,
                                      const Json::Value& val,
                                      Json::Value& result)
{
  std::string key;
  if (!SingleKey (val, key))
    return false;

  std::vector<std::string> names;
  if (!ParseNameList (val[key], names))
    return false;

  auto& whitelist = sale.GetWhitelist ();
  if (key == "add")
    result["changed"] = IntToJson (whitelist.Add (name, names));
  else if (key == "remove")
    result["changed"] = IntToJson (whitelist.Remove (name, names));
  else
    return false;

  return true;
}

bool
OperationProcessor::ExecuteConfig (const std::string& name,
                                   const Json::Value& val)
{
  std::string key;
  if (!SingleKey (val, key))
    return false;

  auto& controller = sale.GetController ();
  if (key == "capacity" || key == "max")
    {
      Amount amount;
      if (!AmountFromJson (val[key], amount))
        return false;

      if (key == "capacity")
        controller.SetCapacity (name, amount);
      else
        controller.SetMaxContribution (name, amount);
      return true;
    }

  if (key == "end")
    {
      int64_t ts;
      if (!TimestampFromJson (val[key], ts))
        return false;

      controller.SetEndTime (name, ts);
      return true;
    }

  return false;
}

bool
OperationProcessor::ExecuteAdmin (const std::string& name,
                                  const Json::Value& val)
{
  std::string key;
  if (!SingleKey (val, key))
    return false;

  auto& controller = sale.GetController ();
  if (key == "transfer")
    {
      std::string newAdmin;
      if (!AccountFromJson (val[key], newAdmin))
        return false;

      controller.TransferAdministrator (name, newAdmin);
      return true;
    }

  if (key == "accept")
    {
      if (!val[key].isBool () || !val[key].asBool ())
        return false;

      controller.AcceptAdministrator (name);
      return true;
    }

  return false;
}

bool
OperationProcessor::Execute (const std::string& name, const Json::Value& op,
                             Json::Value& result)
{
  std::string type;
  if (!SingleKey (op, type))
    return false;
  result["type"] = type;

  const auto& val = op[type];
  auto& controller = sale.GetController ();

  if (type == "contribute")
    {
      Amount amount;
      if (!AmountFromJson (val, amount))
        return false;

      controller.AcceptContribution (name, amount);
      return true;
    }

  if (type == "direct" || type == "bonus")
    return ExecuteDirectOrBonus (name, type == "bonus", val, result);

  if (type == "release" || type == "finalise")
    {
      if (!val.isBool () || !val.asBool ())
        return false;

      if (type == "release")
        result["released"] = controller.ReleaseVestedRewards (name);
      else
        controller.Finalise (name);
      return true;
    }

  if (type == "whitelist")
    return ExecuteWhitelist (name, val, result);
  if (type == "config")
    return ExecuteConfig (name, val);
  if (type == "admin")
    return ExecuteAdmin (name, val);

  return false;
}

Json::Value
OperationProcessor::ProcessOne (const Json::Value& opObj)
{
  VLOG (1) << "Processing operation:\n" << opObj;

  Json::Value result(Json::objectValue);
  result["success"] = false;

  std::string name;
  if (!opObj.isObject () || !AccountFromJson (opObj["name"], name)
        || !opObj["op"].isObject ())
    {
      LOG (WARNING) << "Malformed operation: " << opObj;
      result["malformed"] = true;
      return result;
    }
  result["name"] = name;

  try
    {
      if (!Execute (name, opObj["op"], result))
        {
          LOG (WARNING) << "Malformed operation by " << name << ": " << opObj;
          result["malformed"] = true;
          return result;
        }
    }
  catch (const SaleError& exc)
    {
      LOG (WARNING) << "Operation by " << name << " failed: " << exc.what ();
      result["error"] = ErrorCodeToString (exc.GetCode ());
      result["code"] = static_cast<int> (exc.GetCode ());
      return result;
    }

  result["success"] = true;
  return result;
}

Json::Value
OperationProcessor::ProcessAll (const Json::Value& ops)
{
  CHECK (ops.isArray ());
  LOG (INFO) << "Processing " << ops.size () << " operations...";

  Json::Value results(Json::arrayValue);
  for (const auto& op : ops)
    results.append (ProcessOne (op));

  return results;
}

} // namespace vestsale
