/*
    Enertrade - peer-to-peer trading of energy blocks
    Copyright (C) 2020  Autonomous Worlds Ltd

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

#include "engine.hpp"
#include "private/callbacks.hpp"
#include "rpcserver.hpp"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

DEFINE_string (db_file, "",
               "SQLite database file holding the engine's state");

DEFINE_int32 (rpc_port, 0,
              "the port at which the engine's JSON-RPC server will be started");
DEFINE_bool (rpc_listen_locally, true,
             "whether the JSON-RPC server should only listen on localhost");

/**
 * Exception thrown for usage errors (won't be logged).
 */
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run the Enertrade transaction engine");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_db_file.empty ())
        throw UsageError ("--db_file must be set");
      if (FLAGS_rpc_port == 0)
        throw UsageError ("--rpc_port must be set");

      enertrade::HttpCallbackSender callbacks;
      enertrade::Engine engine(FLAGS_db_file, callbacks);

      jsonrpc::HttpServer httpServer(FLAGS_rpc_port);
      if (FLAGS_rpc_listen_locally)
        httpServer.BindLocalhost ();
      enertrade::RpcServer server(engine, httpServer);

      LOG (INFO) << "Starting JSON-RPC interface on port " << FLAGS_rpc_port;
      server.Run ();

      return EXIT_SUCCESS;
    }
  catch (const UsageError& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << exc.what ();
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
}
