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

#include "private/callbacks.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <jsonrpccpp/common/exception.h>

DEFINE_int32 (callback_timeout_ms, 5'000,
              "timeout for delivering callbacks to buyer platforms");
DEFINE_int32 (callback_clients_per_thread, 16,
              "number of callback endpoints for which each worker thread"
              " keeps an RPC client");

namespace enertrade
{

HttpCallbackSender::HttpCallbackSender (const long timeoutMs,
                                        const size_t clientsPerThread)
  : clients(timeoutMs, clientsPerThread)
{}

HttpCallbackSender::HttpCallbackSender ()
  : HttpCallbackSender(FLAGS_callback_timeout_ms,
                       FLAGS_callback_clients_per_thread)
{}

std::string
HttpCallbackSender::CallbackUrl (const std::string& baseUri,
                                 const std::string& action)
{
  std::string base = baseUri;
  while (!base.empty () && base.back () == '/')
    base.pop_back ();

  return base + "/callbacks/on_" + action;
}

bool
HttpCallbackSender::Send (const std::string& baseUri,
                          const std::string& action,
                          const Json::Value& context,
                          const Json::Value& message, std::string& error)
{
  if (baseUri.empty ())
    {
      error = "no callback URI";
      return false;
    }

  const std::string url = CallbackUrl (baseUri, action);
  VLOG (1) << "Sending on_" << action << " to " << url;

  auto& rpc = clients.Get (url);
  try
    {
      Json::Value res;
      if (action == "discover")
        res = rpc.on_discover (context, message);
      else if (action == "select")
        res = rpc.on_select (context, message);
      else if (action == "init")
        res = rpc.on_init (context, message);
      else if (action == "confirm")
        res = rpc.on_confirm (context, message);
      else if (action == "cancel")
        res = rpc.on_cancel (context, message);
      else if (action == "status")
        res = rpc.on_status (context, message);
      else
        {
          error = "no callback for action " + action;
          return false;
        }

      VLOG (2) << "Callback response:\n" << res;
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      error = exc.what ();
      LOG (ERROR) << "Delivering on_" << action << " to " << url
                  << " failed: " << error;
      return false;
    }

  return true;
}

} // namespace enertrade
