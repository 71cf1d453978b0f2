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

#ifndef ENERTRADE_TESTUTILS_HPP
#define ENERTRADE_TESTUTILS_HPP

#include "private/callbacks.hpp"
#include "proto/catalog.pb.h"
#include "proto/error.pb.h"
#include "proto/orders.pb.h"
#include "proto/protocol.pb.h"

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace enertrade
{

/**
 * Sleeps some short amount of time, which we use to let worker threads
 * process things in tests.
 */
void SleepSome ();

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Utility method for generating server ports to be used.  It uses an
 * internal call counter to cycle through some range, which should be good
 * enough to find free ports even if more than one mock server are running
 * at the same time.
 */
int GetPortForMockServer ();

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsBlockCounts, BlockCounts)
DEFINE_PROTO_MATCHER (EqualsError, Error)

/**
 * Matcher for a bool-returning operation that failed with the given
 * error code.
 */
MATCHER_P (HasErrorCode, code, "")
{
  if (arg.code () == code)
    return true;
  *result_listener << "actual: " << arg.DebugString ();
  return false;
}

/** Current time in tests, used for time windows.  */
int64_t TestNow ();

/**
 * Builds a provider with the given trust.
 */
proto::Provider TestProvider (const std::string& id, double trust = 0.8);

/**
 * Builds a catalog item for the provider with one production window.
 */
proto::CatalogItem TestItem (const std::string& id,
                             const std::string& provider,
                             proto::CatalogItem::SourceType type
                                 = proto::CatalogItem::SOLAR);

/**
 * Builds an offer with a delivery window starting at the given offset (in
 * seconds) from now and lasting one hour.
 */
proto::Offer TestOffer (const std::string& id, const std::string& item,
                        const std::string& provider, double price,
                        int64_t qty, int64_t startOffset = 24 * 3'600);

/**
 * CallbackSender that just records all callbacks.  It can be set to fail
 * deliveries.
 */
class RecordingCallbacks : public CallbackSender
{

public:

  /** Data of one recorded callback.  */
  struct Call
  {
    std::string baseUri;
    std::string action;
    Json::Value context;
    Json::Value message;
  };

private:

  std::vector<Call> calls;

  /** If set, deliveries fail with this error.  */
  std::string failure;

  std::mutex mut;

public:

  RecordingCallbacks () = default;

  void
  SetFailure (const std::string& msg)
  {
    std::lock_guard<std::mutex> lock(mut);
    failure = msg;
  }

  bool Send (const std::string& baseUri, const std::string& action,
             const Json::Value& context, const Json::Value& message,
             std::string& error) override;

  /**
   * Returns all callbacks recorded so far.
   */
  std::vector<Call> GetCalls ();

  /**
   * Returns the calls with the given action.
   */
  std::vector<Call> GetCalls (const std::string& action);

};

} // namespace enertrade

#endif // ENERTRADE_TESTUTILS_HPP
