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

#ifndef ENERTRADE_RPCSERVER_HPP
#define ENERTRADE_RPCSERVER_HPP

#include "engine.hpp"
#include "rpc-stubs/enginerpcserverstub.h"

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <condition_variable>
#include <mutex>
#include <string>

namespace enertrade
{

/**
 * JSON-RPC server exposing an Engine.  Failed operations are reported as
 * JSON-RPC errors whose data is the error object (with code name and
 * message); the numeric error code is -32000 minus the error code value.
 */
class RpcServer : public EngineRpcServerStub
{

private:

  /** The Engine this is for.  */
  Engine& engine;

  /** Flag set to indicate the server should shut down.  */
  bool shouldStop;

  /** Mutex for the stop flag.  */
  std::mutex mutStop;

  /** Condition variable for signalling "should stop".  */
  std::condition_variable cvStop;

  /**
   * Parses and hands a protocol message to the engine, and returns the
   * response with the acknowledgement.
   */
  Json::Value HandleProtocol (const std::string& action,
                              const Json::Value& context,
                              const Json::Value& message);

public:

  explicit RpcServer (Engine& e, jsonrpc::AbstractServerConnector& conn)
    : EngineRpcServerStub(conn), engine(e)
  {}

  RpcServer () = delete;
  RpcServer (const RpcServer&) = delete;
  void operator= (const RpcServer&) = delete;

  /**
   * Starts the server and blocks until it gets shut down again.
   */
  void Run ();

  void stop () override;
  Json::Value getstatus () override;

  Json::Value discover (const Json::Value& context,
                        const Json::Value& message) override;
  Json::Value select (const Json::Value& context,
                      const Json::Value& message) override;
  Json::Value init (const Json::Value& context,
                    const Json::Value& message) override;
  Json::Value confirm (const Json::Value& context,
                       const Json::Value& message) override;
  Json::Value cancel (const Json::Value& context,
                      const Json::Value& message) override;
  Json::Value status (const Json::Value& context,
                      const Json::Value& message) override;

  bool syncprovider (const Json::Value& provider) override;
  bool syncitem (const Json::Value& item) override;
  Json::Value syncoffer (const Json::Value& offer, bool resync) override;
  bool deleteoffer (const std::string& id) override;
  Json::Value updateblocks (const Json::Value& update) override;

  Json::Value getcatalog () override;
  Json::Value gettransaction (const std::string& id) override;
  Json::Value getorder (const std::string& id) override;
  Json::Value gettrustinfo (const std::string& principal) override;

  Json::Value registerprincipal (const Json::Value& principal,
                                 double verifiedCapacity) override;
  Json::Value advanceorder (const std::string& idempotencyKey,
                            const std::string& orderId,
                            const std::string& status) override;
  Json::Value cancelorder (const std::string& idempotencyKey,
                           const Json::Value& request) override;
  Json::Value verifydelivery (int delivered,
                              const std::string& idempotencyKey,
                              const std::string& orderId) override;

};

} // namespace enertrade

#endif // ENERTRADE_RPCSERVER_HPP
