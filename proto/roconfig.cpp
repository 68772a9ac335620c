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

#include "roconfig.hpp"

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

#include <mutex>

namespace bonds
{

/* The text protos, which are embedded from roconfig.pb.text and
   roconfig_regtest.pb.text by the build system.  */
extern const char ROCONFIG_PROTO_TEXT[];
extern const char ROCONFIG_PROTO_TEXT_REGTEST[];

namespace
{

/** Lock for constructing and accessing the global singletons.  */
std::mutex mutInstances;

} // anonymous namespace

proto::ConfigData* RoConfig::mainnet = nullptr;
proto::ConfigData* RoConfig::testnet = nullptr;
proto::ConfigData* RoConfig::regtest = nullptr;

RoConfig::RoConfig (const xaya::Chain chain)
{
  std::lock_guard<std::mutex> lock(mutInstances);

  proto::ConfigData** instancePtr = nullptr;
  bool mergeTestnet, mergeRegtest;
  switch (chain)
    {
    case xaya::Chain::MAIN:
      instancePtr = &mainnet;
      mergeTestnet = false;
      mergeRegtest = false;
      break;
    case xaya::Chain::TEST:
      instancePtr = &testnet;
      mergeTestnet = true;
      mergeRegtest = false;
      break;
    case xaya::Chain::REGTEST:
      instancePtr = &regtest;
      mergeTestnet = true;
      mergeRegtest = true;
      break;
    default:
      LOG (FATAL) << "Unexpected chain: " << static_cast<int> (chain);
    }
  CHECK (instancePtr != nullptr);

  if (*instancePtr == nullptr)
    {
      LOG (INFO)
          << "Initialising hard-coded ConfigData proto instance for "
          << xaya::ChainToString (chain) << "...";

      *instancePtr = new proto::ConfigData ();
      auto& pb = **instancePtr;

      using google::protobuf::TextFormat;
      CHECK (TextFormat::ParseFromString (ROCONFIG_PROTO_TEXT, &pb));
      CHECK (TextFormat::ParseFromString (ROCONFIG_PROTO_TEXT_REGTEST,
                                          pb.mutable_regtest_merge ()));

      CHECK (!pb.testnet_merge ().has_testnet_merge ());
      CHECK (!pb.testnet_merge ().has_regtest_merge ());

      CHECK (!pb.regtest_merge ().has_testnet_merge ());
      CHECK (!pb.regtest_merge ().has_regtest_merge ());

      if (mergeTestnet)
        pb.MergeFrom (pb.testnet_merge ());
      if (mergeRegtest)
        pb.MergeFrom (pb.regtest_merge ());
      pb.clear_testnet_merge ();
      pb.clear_regtest_merge ();
    }

  data = *instancePtr;
  CHECK (data != nullptr);
}

const proto::ConfigData&
RoConfig::operator* () const
{
  return *data;
}

const proto::ConfigData*
RoConfig::operator-> () const
{
  return data;
}

const proto::AssetConfig*
RoConfig::AssetOrNull (const std::string& name) const
{
  for (const auto& a : data->assets ())
    if (a.name () == name)
      return &a;

  return nullptr;
}

const proto::DepositoryConfig*
RoConfig::DepositoryOrNull (const std::string& address) const
{
  for (const auto& d : data->depositories ())
    if (d.address () == address)
      return &d;

  return nullptr;
}

} // namespace bonds
