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

#ifndef ENERTRADE_JSON_HPP
#define ENERTRADE_JSON_HPP

#include <json/json.h>

namespace enertrade
{

/**
 * Converts one of the engine's protocol buffers into its JSON wire form.
 * Keys are the proto field names, enums are written by their names and
 * timestamps as ISO 8601 strings in UTC.
 *
 * This is implemented for the protos that are returned from the RPC
 * interface or sent in callbacks.
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

/**
 * Tries to convert a JSON representation into the corresponding protocol
 * buffer message.  This is implemented for protos that are inputs to the
 * engine (protocol messages and provider sync data).
 *
 * Returns true on success (the JSON format was valid) and fills in the
 * output proto.  Timestamps are accepted as ISO 8601 strings or as
 * integer Unix times.
 */
template <typename Proto>
  bool ProtoFromJson (const Json::Value& val, Proto& pb);

} // namespace enertrade

#endif // ENERTRADE_JSON_HPP
