/*
    GSP for the Bond Sale Engine
    Copyright (C) 2019-2020  Autonomous Worlds Ltd

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

namespace bonds
{

/**
 * Protocol buffer stored as BLOB in the database, which is only parsed
 * when the message is actually accessed.  Many operations touch e.g. a
 * teller row without needing its full configuration, so this saves the
 * parsing cost for them.
 *
 * It also tracks whether the message has been modified, which tells the
 * database handles whether the BLOB needs to be written back.
 */
template <typename Proto>
  class LazyProto
{

private:

  /**
   * Relation between the raw data and the parsed message.
   */
  enum class State : uint8_t
  {

    /** There is no data yet (this instance is uninitialised).  */
    UNINITIALISED,

    /** We have not yet accessed/parsed the byte data.  */
    UNPARSED,

    /**
     * We have parsed the byte data but not modified the proto object.
     * In other words, the serialised data is still in sync with the
     * proto message.
     */
    UNMODIFIED,

    /** The proto message has been modified.  */
    MODIFIED,

  };

  /** The raw bytes of the protocol buffer.  */
  mutable std::string data;

  /** The parsed protocol buffer.  */
  mutable Proto msg;

  /** Current state of this lazy proto.  */
  mutable State state = State::UNINITIALISED;

  /**
   * Ensures that the protocol buffer is parsed.
   */
  void EnsureParsed () const;

  friend class LazyProtoTests;

public:

  LazyProto () = default;

  /**
   * Constructs a lazy proto instance based on the given byte data.
   */
  explicit LazyProto (std::string&& d);

  /* A LazyProto can be moved but not copied.  */

  LazyProto (LazyProto&&) = default;
  LazyProto& operator= (LazyProto&&) = default;

  LazyProto (const LazyProto&) = delete;
  void operator= (const LazyProto&) = delete;

  /**
   * Sets the value to an empty message.  This is used when a new row
   * (e.g. a freshly registered asset) is created.
   */
  void SetToDefault ();

  /**
   * Accesses the message read-only.
   */
  const Proto& Get () const;

  /**
   * Accesses and modifies the proto message.
   */
  Proto& Mutable ();

  /**
   * Returns true if the message was modified through Mutable, and thus
   * needs to be written back to the database.
   */
  bool IsDirty () const;

  /**
   * Returns the serialised message, including all modifications.
   */
  const std::string& GetSerialised () const;

};

} // namespace bonds

#include "lazyproto.tpp"

#endif // DATABASE_LAZYPROTO_HPP
