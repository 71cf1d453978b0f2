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

/* Template implementation code for rpcclient.hpp.  */

namespace enertrade
{

template <typename T>
  RpcClientPool<T>::RpcClientPool (const long t, const size_t m)
  : timeoutMs(t), maxPerThread(m)
{
  CHECK_GT (maxPerThread, 0);
}

template <typename T>
  T&
  RpcClientPool<T>::Get (const std::string& endpoint)
{
  std::lock_guard<std::mutex> lock(mut);
  auto& entries = clients[std::this_thread::get_id ()];

  for (auto it = entries.begin (); it != entries.end (); ++it)
    if (it->endpoint == endpoint)
      {
        entries.splice (entries.begin (), entries, it);
        return *entries.front ().rpc;
      }

  Entry e;
  e.endpoint = endpoint;
  e.http = std::make_unique<jsonrpc::HttpClient> (endpoint);
  e.http->SetTimeout (timeoutMs);
  e.rpc = std::make_unique<T> (*e.http, jsonrpc::JSONRPC_CLIENT_V2);
  entries.push_front (std::move (e));

  while (entries.size () > maxPerThread)
    {
      VLOG (1) << "Dropping RPC client for " << entries.back ().endpoint;
      entries.pop_back ();
    }

  return *entries.front ().rpc;
}

template <typename T>
  size_t
  RpcClientPool<T>::GetNumClients () const
{
  std::lock_guard<std::mutex> lock(mut);

  size_t res = 0;
  for (const auto& entry : clients)
    res += entry.second.size ();

  return res;
}

} // namespace enertrade
