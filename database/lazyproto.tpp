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
/* Template implementation code for lazyproto.hpp.  */

#include <glog/logging.h>

namespace vestsale
{

template <typename Proto>
  LazyProto<Proto>::LazyProto (std::string&& d)
    : data(std::move (d)), state(State::UNPARSED)
{}

template <typename Proto>
  LazyProto<Proto>::LazyProto (const Proto& m)
    : msg(m), state(State::MODIFIED)
{}

template <typename Proto>
  void
  LazyProto<Proto>::EnsureParsed () const
{
  if (state != State::UNPARSED)
    return;

  CHECK (msg.ParseFromString (data)) << "Invalid proto data in the database";
  state = State::PARSED;
}

template <typename Proto>
  const Proto&
  LazyProto<Proto>::Get () const
{
  EnsureParsed ();
  return msg;
}

template <typename Proto>
  Proto&
  LazyProto<Proto>::Mutable ()
{
  EnsureParsed ();
  state = State::MODIFIED;
  return msg;
}

template <typename Proto>
  const std::string&
  LazyProto<Proto>::GetSerialised () const
{
  if (state == State::MODIFIED)
    CHECK (msg.SerializeToString (&data));

  return data;
}

} // namespace vestsale
