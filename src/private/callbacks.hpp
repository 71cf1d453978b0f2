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

#ifndef ENERTRADE_CALLBACKS_HPP
#define ENERTRADE_CALLBACKS_HPP

#include "private/rpcclient.hpp"
#include "rpc-stubs/callbackrpcclient.h"

#include <json/json.h>

#include <cstddef>
#include <string>

namespace enertrade
{

/**
 * Interface for delivering asynchronous protocol responses (on_<action>
 * callbacks) to the buyer platform that sent a request.
 */
class CallbackSender
{

public:

  CallbackSender () = default;
  virtual ~CallbackSender () = default;

  CallbackSender (const CallbackSender&) = delete;
  void operator= (const CallbackSender&) = delete;

  /**
   * Delivers the callback for the given action (e.g. "discover" for
   * on_discover) to the platform at baseUri.  Returns false and fills in
   * the error message if delivery failed.
   */
  virtual bool Send (const std::string& baseUri, const std::string& action,
                     const Json::Value& context, const Json::Value& message,
                     std::string& error) = 0;

};

/**
 * CallbackSender that calls the on_<action> JSON-RPC methods over HTTP,
 * at {baseUri}/callbacks/on_<action>.
 */
class HttpCallbackSender : public CallbackSender
{

private:

  RpcClientPool<CallbackRpcClient> clients;

public:

  /**
   * Constructs the sender with the given HTTP timeout in milliseconds,
   * keeping at most the given number of clients per worker thread.
   */
  explicit HttpCallbackSender (long timeoutMs, size_t clientsPerThread);

  /**
   * Constructs the sender with the timeout from --callback_timeout_ms
   * and the pool size from --callback_clients_per_thread.
   */
  HttpCallbackSender ();

  /**
   * Returns the number of pooled RPC clients.
   */
  size_t
  GetNumClients () const
  {
    return clients.GetNumClients ();
  }

  /**
   * Returns the URL to which callbacks for an action are sent.
   */
  static std::string CallbackUrl (const std::string& baseUri,
                                  const std::string& action);

  bool Send (const std::string& baseUri, const std::string& action,
             const Json::Value& context, const Json::Value& message,
             std::string& error) override;

};

} // namespace enertrade

#endif // ENERTRADE_CALLBACKS_HPP
