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

/* Template implementation code for lazyproto.hpp.  */

#include <glog/logging.h>

namespace bonds
{

template <typename Proto>
  LazyProto<Proto>::LazyProto (std::string&& d)
    : data(std::move (d)), state(State::UNPARSED)
{}

template <typename Proto>
  inline void
  LazyProto<Proto>::EnsureParsed () const
{
  switch (state)
    {
    case State::UNPARSED:
      CHECK (msg.ParseFromString (data))
          << "Invalid " << msg.GetTypeName () << " data in the database";
      state = State::UNMODIFIED;
      return;

    case State::UNMODIFIED:
    case State::MODIFIED:
      return;

    case State::UNINITIALISED:
      LOG (FATAL) << "Accessing uninitialised " << msg.GetTypeName ();
    }
}

template <typename Proto>
  void
  LazyProto<Proto>::SetToDefault ()
{
  data.clear ();
  msg.Clear ();
  state = State::UNMODIFIED;
}

template <typename Proto>
  inline const Proto&
  LazyProto<Proto>::Get () const
{
  EnsureParsed ();
  return msg;
}

template <typename Proto>
  inline Proto&
  LazyProto<Proto>::Mutable ()
{
  EnsureParsed ();
  state = State::MODIFIED;
  return msg;
}

template <typename Proto>
  inline bool
  LazyProto<Proto>::IsDirty () const
{
  CHECK (state != State::UNINITIALISED)
      << "Dirty check on uninitialised " << msg.GetTypeName ();
  return state == State::MODIFIED;
}

template <typename Proto>
  const std::string&
  LazyProto<Proto>::GetSerialised () const
{
  switch (state)
    {
    case State::UNPARSED:
    case State::UNMODIFIED:
      return data;

    case State::MODIFIED:
      CHECK (msg.SerializeToString (&data))
          << "Failed to serialise " << msg.GetTypeName ();
      return data;

    case State::UNINITIALISED:
      break;
    }

  LOG (FATAL) << "Serialising uninitialised " << msg.GetTypeName ();
}

} // namespace bonds
