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

#include "testutils.hpp"

#include <chrono>
#include <ctime>
#include <sstream>
#include <thread>

namespace enertrade
{

void
SleepSome ()
{
  std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

int
GetPortForMockServer ()
{
  static unsigned cnt = 0;
  ++cnt;

  return 2'000 + (cnt % 1'000);
}

int64_t
TestNow ()
{
  return std::time (nullptr);
}

proto::Provider
TestProvider (const std::string& id, const double trust)
{
  proto::Provider res;
  res.set_id (id);
  res.set_name ("Provider " + id);
  res.set_trust_score (trust);
  return res;
}

proto::CatalogItem
TestItem (const std::string& id, const std::string& provider,
          const proto::CatalogItem::SourceType type)
{
  proto::CatalogItem res;
  res.set_id (id);
  res.set_provider_id (provider);
  res.set_source_type (type);
  res.set_meter_id ("meter " + id);

  auto* w = res.add_production_windows ();
  w->set_start (TestNow ());
  w->set_end (TestNow () + 7 * 24 * 3'600);

  return res;
}

proto::Offer
TestOffer (const std::string& id, const std::string& item,
           const std::string& provider, const double price, const int64_t qty,
           const int64_t startOffset)
{
  proto::Offer res;
  res.set_id (id);
  res.set_item_id (item);
  res.set_provider_id (provider);
  res.mutable_price ()->set_value (price);
  res.mutable_price ()->set_currency ("INR");
  res.set_max_qty (qty);
  res.mutable_window ()->set_start (TestNow () + startOffset);
  res.mutable_window ()->set_end (TestNow () + startOffset + 3'600);
  res.set_pricing_model ("PER_KWH");
  res.set_settlement_type ("DELIVERY");
  return res;
}

bool
RecordingCallbacks::Send (const std::string& baseUri,
                          const std::string& action,
                          const Json::Value& context,
                          const Json::Value& message, std::string& error)
{
  std::lock_guard<std::mutex> lock(mut);

  Call c;
  c.baseUri = baseUri;
  c.action = action;
  c.context = context;
  c.message = message;
  calls.push_back (c);

  if (!failure.empty ())
    {
      error = failure;
      return false;
    }

  return true;
}

std::vector<RecordingCallbacks::Call>
RecordingCallbacks::GetCalls ()
{
  std::lock_guard<std::mutex> lock(mut);
  return calls;
}

std::vector<RecordingCallbacks::Call>
RecordingCallbacks::GetCalls (const std::string& action)
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<Call> res;
  for (const auto& c : calls)
    if (c.action == action)
      res.push_back (c);

  return res;
}

} // namespace enertrade
