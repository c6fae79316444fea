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
#ifndef DATABASE_LAZYPROTO_HPP
#define DATABASE_LAZYPROTO_HPP

#include <cstdint>
#include <string>

namespace vestsale
{

/**
 * A protocol buffer column value that is only parsed when its content is
 * accessed, and only serialised again if it has been modified.
 *
 * A default-constructed instance holds an empty message.
 */
template <typename Proto>
  class LazyProto
{

private:

  enum class State : uint8_t
  {

    /** Only the bytes are known.  */
    UNPARSED,

    /** The message has been parsed and still matches the bytes.  */
    PARSED,

    /** The message has been changed, and the bytes are outdated.  */
    MODIFIED,

  };

  /** Serialised form of the message (outdated if MODIFIED).  */
  mutable std::string data;

  /** The message (only valid unless UNPARSED).  */
  mutable Proto msg;

  mutable State state = State::PARSED;

  /**
   * Parses the bytes if that has not been done yet.
   */
  void EnsureParsed () const;

public:

  LazyProto () = default;

  /**
   * Constructs an instance from the serialised bytes read from
   * the database.
   */
  explicit LazyProto (std::string&& d);

  /**
   * Constructs an instance holding a new message, which is considered
   * modified (i.e. it needs to be written).
   */
  explicit LazyProto (const Proto& m);

  LazyProto (LazyProto&&) = default;
  LazyProto& operator= (LazyProto&&) = default;

  LazyProto (const LazyProto&) = delete;
  void operator= (const LazyProto&) = delete;

  const Proto& Get () const;
  Proto& Mutable ();

  /**
   * Returns true if the message has been changed through Mutable (or was
   * constructed from a message), so that it needs to be written back.
   */
  bool
  IsDirty () const
  {
    return state == State::MODIFIED;
  }

  /**
   * Returns the bytes to store in the database.
   */
  const std::string& GetSerialised () const;

};

} // namespace vestsale

#include "lazyproto.tpp"

#endif // DATABASE_LAZYPROTO_HPP
