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

#include "config.h"

#include "bondsrpcserver.hpp"
#include "logic.hpp"

#include <xayagame/defaultmain.hpp>
#include <xayagame/game.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <iostream>
#include <memory>

namespace
{

DEFINE_string (xaya_rpc_url, "",
               "URL at which Xaya Core's JSON-RPC interface is available");
DEFINE_int32 (game_rpc_port, 0,
              "the port at which the GSP's JSON-RPC server will be started"
              " (if non-zero)");
DEFINE_bool (game_rpc_listen_locally, true,
             "whether the GSP's JSON-RPC server should listen locally");

DEFINE_int32 (enable_pruning, -1,
              "if non-negative (including zero), old undo data will be pruned"
              " and only as many blocks as specified will be kept");

DEFINE_string (datadir, "",
               "base data directory for game data (will be extended by game ID"
               " and the chain)");

class BondsInstanceFactory : public xaya::CustomisedInstanceFactory
{

private:

  /** The game logic, which the RPC server uses for quotes.  */
  bonds::BondsLogic& rules;

public:

  explicit BondsInstanceFactory (bonds::BondsLogic& r)
    : rules(r)
  {}

  std::unique_ptr<xaya::RpcServerInterface>
  BuildRpcServer (xaya::Game& game,
                  jsonrpc::AbstractServerConnector& conn) override
  {
    using Server = xaya::WrappedRpcServer<bonds::BondsRpcServer>;
    return std::make_unique<Server> (game, rules, conn);
  }

};

/**
 * Checks that all required flags are set.  Prints an error and returns
 * false if not.
 */
bool
RequiredFlagsSet ()
{
  if (FLAGS_xaya_rpc_url.empty ())
    {
      std::cerr << "Error: --xaya_rpc_url must be set" << std::endl;
      return false;
    }

  if (FLAGS_datadir.empty ())
    {
      std::cerr << "Error: --datadir must be specified" << std::endl;
      return false;
    }

  return true;
}

/**
 * Fills in the libxayagame daemon configuration from the flags.
 */
xaya::GameDaemonConfiguration
ConfigFromFlags ()
{
  xaya::GameDaemonConfiguration res;
  res.XayaRpcUrl = FLAGS_xaya_rpc_url;
  res.EnablePruning = FLAGS_enable_pruning;
  res.DataDirectory = FLAGS_datadir;

  if (FLAGS_game_rpc_port == 0)
    LOG (INFO) << "Not starting a JSON-RPC server";
  else
    {
      LOG (INFO)
          << "Starting JSON-RPC server on port " << FLAGS_game_rpc_port
          << (FLAGS_game_rpc_listen_locally ? " (local only)" : "");
      res.GameRpcServer = xaya::RpcServerType::HTTP;
      res.GameRpcPort = FLAGS_game_rpc_port;
      res.GameRpcListenLocally = FLAGS_game_rpc_listen_locally;
    }

  return res;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  LOG (INFO) << "Running bond sale engine version " << PACKAGE_VERSION;

  gflags::SetUsageMessage ("Run the bond sale engine GSP");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

#ifdef ENABLE_SLOW_ASSERTS
  LOG (WARNING)
      << "Slow assertions are enabled.  This is fine for testing, but will"
         " slow down syncing";
#endif // ENABLE_SLOW_ASSERTS

  if (!RequiredFlagsSet ())
    return EXIT_FAILURE;

  auto config = ConfigFromFlags ();

  bonds::BondsLogic rules;
  BondsInstanceFactory instanceFact(rules);
  config.InstanceFactory = &instanceFact;

  const int rc = xaya::SQLiteMain (config, "bonds", rules);

  google::protobuf::ShutdownProtobufLibrary ();
  return rc;
}
