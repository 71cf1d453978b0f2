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

#ifndef ENERTRADE_RPCCLIENT_HPP
#define ENERTRADE_RPCCLIENT_HPP

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>

#include <glog/logging.h>

#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace enertrade
{

/**
 * Set of libjson-rpc-cpp clients for arbitrary HTTP endpoints.  Clients are
 * created on demand and kept per thread and endpoint, so that they can be
 * used from several worker threads in parallel.
 *
 * Each thread keeps at most a fixed number of clients.  When it needs one
 * for another endpoint, its least recently used client is dropped.
 */
template <typename T>
  class RpcClientPool
{

private:

  /** A client together with its HTTP connector.  */
  struct Entry
  {

    /** The endpoint URL.  */
    std::string endpoint;

    /** The HTTP connector, which must outlive the RPC client.  */
    std::unique_ptr<jsonrpc::HttpClient> http;

    /** The RPC client using the connector.  */
    std::unique_ptr<T> rpc;

  };

  /** Timeout for HTTP requests in milliseconds.  */
  const long timeoutMs;

  /** Maximum number of clients kept per thread.  */
  const size_t maxPerThread;

  /**
   * The clients of each thread, most recently used first.
   */
  std::map<std::thread::id, std::list<Entry>> clients;

  /** Mutex protecting the map.  */
  mutable std::mutex mut;

public:

  explicit RpcClientPool (long t, size_t m);

  RpcClientPool () = delete;
  RpcClientPool (const RpcClientPool<T>&) = delete;
  void operator= (const RpcClientPool<T>&) = delete;

  /**
   * Returns the client for the given endpoint and the calling thread.
   * The reference stays valid until the same thread calls Get again.
   */
  T& Get (const std::string& endpoint);

  /**
   * Returns the number of clients currently kept, for all threads.
   */
  size_t GetNumClients () const;

};

} // namespace enertrade

#include "rpcclient.tpp"

#endif // ENERTRADE_RPCCLIENT_HPP
